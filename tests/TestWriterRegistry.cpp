#include "TestUtil.hpp"
#include "core/Error.hpp"
#include "writers/WriterRegistry.hpp"
#include "writers/Hdf5Writer.hpp"
#include "writers/FrameCacheWriter.hpp"
#include "writers/Save.hpp"

#include <thread>

using namespace imseries;
using namespace imseries::test;

namespace {

// Writer that records how often it ran, under a caller-chosen name
class StubWriter : public Writer {
public:
    StubWriter(const ImageSeries& series, const std::filesystem::path& filepath,
               const Config& options, String name, int* writes)
        : Writer(series, filepath, options), m_name(std::move(name)), m_writes(writes) {}

    StringView Format() const override { return m_name; }
    void Write() override { ++*m_writes; }

private:
    String m_name;
    int* m_writes;
};

WriterFactory StubFactory(const String& name, int* writes) {
    return [name, writes](const ImageSeries& series, const std::filesystem::path& filepath,
                          const Config& options) -> UniquePtr<Writer> {
        return std::make_unique<StubWriter>(series, filepath, options, name, writes);
    };
}

} // namespace

TEST(WriterRegistry, GlobalHasBuiltinWriters) {
    WriterRegistry& registry = WriterRegistry::Global();

    EXPECT_TRUE(registry.Has("hdf5"));
    EXPECT_TRUE(registry.Has("frame-cache"));
    EXPECT_FALSE(registry.Has("tiff"));
    EXPECT_EQ(&registry, &WriterRegistry::Global());
}

TEST(WriterRegistry, LastRegistrationWins) {
    WriterRegistry registry;
    int firstWrites = 0;
    int secondWrites = 0;
    registry.Register("stub", StubFactory("first", &firstWrites));
    registry.Register("stub", StubFactory("second", &secondWrites));

    InMemorySeries series = MakeSmallSeries();
    UniquePtr<Writer> writer = registry.Resolve("stub")(series, "unused", Config{});
    EXPECT_EQ(writer->Format(), "second");

    writer->Write();
    EXPECT_EQ(firstWrites, 0);
    EXPECT_EQ(secondWrites, 1);
    EXPECT_EQ(registry.Formats(), (Vector<String>{"stub"}));
}

TEST(WriterRegistry, ResolveUnknownFormat) {
    WriterRegistry registry;
    registry.Register<Hdf5Writer>();

    try {
        registry.Resolve("frame-cache");
        FAIL() << "expected WriteError";
    } catch (const WriteError& e) {
        EXPECT_EQ(e.Code(), ErrorCode::UnknownFormat);
        EXPECT_NE(String(e.what()).find("frame-cache"), String::npos);
    }
}

TEST(WriterRegistry, IgnoresEmptyFormatName) {
    WriterRegistry registry;
    int writes = 0;
    registry.Register("", StubFactory("nameless", &writes));

    EXPECT_TRUE(registry.Formats().empty());
    EXPECT_FALSE(registry.Has(""));
}

TEST(WriterRegistry, RegistersWriterTypesUnderTheirFormat) {
    WriterRegistry registry;
    RegisterBuiltinWriters(registry);

    EXPECT_EQ(registry.Formats(), (Vector<String>{"frame-cache", "hdf5"}));

    InMemorySeries series = MakeSmallSeries();
    Config options = Config::FromTable(toml::table{{"path", "/images"}});
    UniquePtr<Writer> writer = registry.Resolve("hdf5")(series, "out.h5", options);
    EXPECT_EQ(writer->Format(), Hdf5Writer::kFormat);
    EXPECT_EQ(writer->GetPath(), std::filesystem::path("out.h5"));
}

TEST(WriterRegistry, ConcurrentRegisterAndResolve) {
    WriterRegistry registry;
    int writes = 0;
    registry.Register("base", StubFactory("base", &writes));

    Vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry, &writes, t] {
            for (int i = 0; i < 50; ++i) {
                registry.Register("stub-" + std::to_string(t) + "-" + std::to_string(i),
                                  StubFactory("stub", &writes));
                EXPECT_TRUE(registry.Has("base"));
                EXPECT_NO_THROW(registry.Resolve("base"));
            }
        });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(registry.Formats().size(), 1u + 4u * 50u);
}

// ============================================================================
// Dispatch
// ============================================================================

TEST(Write, UnknownFormatTouchesNoFile) {
    TempDir dir;
    const auto target = dir / "out.tif";
    InMemorySeries series = MakeSmallSeries();

    try {
        Write(series, target, "tiff");
        FAIL() << "expected WriteError";
    } catch (const WriteError& e) {
        EXPECT_EQ(e.Code(), ErrorCode::UnknownFormat);
    }

    EXPECT_FALSE(std::filesystem::exists(target));
    EXPECT_TRUE(std::filesystem::is_empty(dir.Path()));
}

TEST(Write, OptionErrorsPropagateUnchanged) {
    TempDir dir;
    InMemorySeries series = MakeSmallSeries();

    try {
        Write(series, dir / "out.h5", "hdf5");
        FAIL() << "expected WriteError";
    } catch (const WriteError& e) {
        EXPECT_EQ(e.Code(), ErrorCode::MissingOption);
    }

    EXPECT_FALSE(std::filesystem::exists(dir / "out.h5"));
}

TEST(Write, RejectsFramesWithZeroDimension) {
    InMemorySeries series({0, 4}, DType::UInt8);

    try {
        Write(series, "unused.h5", "hdf5", Config::FromTable(toml::table{{"path", "/images"}}));
        FAIL() << "expected WriteError";
    } catch (const WriteError& e) {
        EXPECT_EQ(e.Code(), ErrorCode::InvalidSeries);
    }
}
