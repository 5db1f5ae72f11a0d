#include "TestUtil.hpp"
#include "core/Config.hpp"

#include <fstream>

using namespace imseries;
using imseries::test::TempDir;

namespace {

Config LoadText(const TempDir& dir, const String& text) {
    const auto path = dir / "config.toml";
    std::ofstream(path) << text;
    auto config = Config::Load(path);
    EXPECT_TRUE(config.has_value()) << (config ? "" : config.error());
    return config ? std::move(config).value() : Config{};
}

} // namespace

TEST(Config, LoadsNestedValues) {
    TempDir dir;
    Config config = LoadText(dir, R"(
[input]
file = "stack.raw"
shape = [512, 256]
header_bytes = 128

[output.options]
path = "/images"
threshold = 5
)");

    EXPECT_EQ(config.Get<String>("input.file"), "stack.raw");
    EXPECT_EQ(config.Get<u64>("input.header_bytes"), 128u);
    EXPECT_EQ(config.GetArray<u64>("input.shape"), (Vector<u64>{512, 256}));
    EXPECT_TRUE(config.Has("output.options.path"));
    EXPECT_FALSE(config.Has("output.options.cache_file"));

    // Integers are accepted where a float is expected
    EXPECT_DOUBLE_EQ(config.Get<f64>("output.options.threshold"), 5.0);
}

TEST(Config, GetFallsBackToDefault) {
    Config config = Config::FromTable(toml::table{{"name", "frames"}});

    EXPECT_EQ(config.Get<i64>("missing", 7), 7);
    EXPECT_EQ(config.Get<i64>("name", 3), 3);   // wrong type
    EXPECT_EQ(config.Get<String>("name"), "frames");
}

TEST(Config, GetRequiredReportsMissingAndMismatch) {
    Config config = Config::FromTable(toml::table{{"path", "/images"}, {"level", -1}});

    auto missing = config.GetRequired<String>("cache_file");
    ASSERT_FALSE(missing.has_value());
    EXPECT_NE(missing.error().find("Missing required key"), String::npos);

    auto mismatch = config.GetRequired<String>("level");
    ASSERT_FALSE(mismatch.has_value());
    EXPECT_NE(mismatch.error().find("Type mismatch"), String::npos);

    // Negative values do not convert to unsigned types
    EXPECT_FALSE(config.GetRequired<u32>("level").has_value());
    EXPECT_EQ(config.GetRequired<String>("path").value(), "/images");
}

TEST(Config, GetRequiredArrayRejectsForeignElements) {
    Config config = Config::FromTable(toml::table{
        {"shape", toml::array{2048, 2048}},
        {"mixed", toml::array{2048, "x", 2048}},
        {"negative", toml::array{4, -1}},
        {"scalar", 2048},
    });

    EXPECT_EQ(config.GetRequiredArray<u64>("shape").value(), (Vector<u64>{2048, 2048}));

    auto mixed = config.GetRequiredArray<u64>("mixed");
    ASSERT_FALSE(mixed.has_value());
    EXPECT_NE(mixed.error().find("Type mismatch in array"), String::npos);
    EXPECT_FALSE(config.GetRequiredArray<u64>("negative").has_value());

    auto scalar = config.GetRequiredArray<u64>("scalar");
    ASSERT_FALSE(scalar.has_value());
    EXPECT_NE(scalar.error().find("not an array"), String::npos);

    auto missing = config.GetRequiredArray<u64>("rows");
    ASSERT_FALSE(missing.has_value());
    EXPECT_NE(missing.error().find("Missing required key"), String::npos);

    // The lenient accessor still drops what it cannot convert
    EXPECT_EQ(config.GetArray<u64>("mixed"), (Vector<u64>{2048, 2048}));
}

TEST(Config, GetTable) {
    Config config = Config::FromTable(toml::table{
        {"output", toml::table{{"options", toml::table{{"path", "/a/b"}}}}},
    });

    auto options = config.GetTable("output.options");
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options.value().Get<String>("path"), "/a/b");

    EXPECT_FALSE(config.GetTable("output.options.path").has_value());
    EXPECT_FALSE(config.GetTable("nothing").has_value());
}

TEST(Config, LoadFailures) {
    TempDir dir;
    EXPECT_FALSE(Config::Load(dir / "absent.toml").has_value());

    const auto path = dir / "broken.toml";
    std::ofstream(path) << "[input\nfile = ";
    auto broken = Config::Load(path);
    ASSERT_FALSE(broken.has_value());
    EXPECT_NE(broken.error().find("TOML parse error"), String::npos);
}
