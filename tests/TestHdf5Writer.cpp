#include "TestUtil.hpp"
#include "core/Error.hpp"
#include "writers/Hdf5Writer.hpp"
#include "writers/Save.hpp"

#include <H5Cpp.h>

#include <functional>

using namespace imseries;
using namespace imseries::test;

namespace {

Config PathOption(const String& path) {
    return Config::FromTable(toml::table{{"path", path}});
}

ErrorCode CodeOf(const std::function<void()>& action) {
    try {
        action();
    } catch (const WriteError& e) {
        return e.Code();
    }
    return ErrorCode::Success;
}

Vector<hsize_t> DatasetDims(const H5::DataSet& dataset) {
    H5::DataSpace space = dataset.getSpace();
    Vector<hsize_t> dims(static_cast<usize>(space.getSimpleExtentNdims()));
    space.getSimpleExtentDims(dims.data());
    return dims;
}

} // namespace

// ============================================================================
// Chunk geometry
// ============================================================================

TEST(ChunkGeometry, NarrowRowsAreBatched) {
    EXPECT_EQ(ComputeChunkGeometry(2, 2, 2), (ChunkGeometry{1, 2, 2}));
    EXPECT_EQ(ComputeChunkGeometry(2048, 2048, 2), (ChunkGeometry{1, 12, 2048}));
    EXPECT_EQ(ComputeChunkGeometry(100, 1000, 8), (ChunkGeometry{1, 6, 1000}));
}

TEST(ChunkGeometry, WideRowsAreSlicedByColumn) {
    // 120000 bytes per row: 50000 / 120000 * 100 = 41.67
    EXPECT_EQ(ComputeChunkGeometry(100, 30000, 4), (ChunkGeometry{1, 1, 41}));
    EXPECT_EQ(ComputeChunkGeometry(1000, 50000, 1), (ChunkGeometry{1, 1, 1000}));
}

TEST(ChunkGeometry, AlwaysWithinDatasetBounds) {
    for (usize rows : {1u, 2u, 7u, 100u, 4096u}) {
        for (usize cols : {1u, 3u, 6250u, 25000u, 50000u, 200000u}) {
            for (usize bpp : {1u, 2u, 4u, 8u}) {
                const ChunkGeometry chunk = ComputeChunkGeometry(rows, cols, bpp);
                EXPECT_EQ(chunk.frames, 1u);
                EXPECT_GE(chunk.rows, 1u);
                EXPECT_LE(chunk.rows, rows);
                EXPECT_GE(chunk.cols, 1u);
                EXPECT_LE(chunk.cols, cols) << rows << "x" << cols << "x" << bpp;
            }
        }
    }
}

// ============================================================================
// Round trip
// ============================================================================

TEST(Hdf5Writer, WritesImagesDataset) {
    TempDir dir;
    const auto path = dir / "series.h5";
    InMemorySeries series = MakeSmallSeries();

    Write(series, path, "hdf5", PathOption("/images"));

    H5::H5File file(path.string(), H5F_ACC_RDONLY);
    H5::DataSet dataset = file.openDataSet("/images/images");
    EXPECT_EQ(DatasetDims(dataset), (Vector<hsize_t>{3, 2, 2}));
    EXPECT_EQ(dataset.getTypeClass(), H5T_INTEGER);
    EXPECT_EQ(dataset.getDataType().getSize(), 2u);

    Vector<u16> values(12);
    dataset.read(values.data(), H5::PredType::NATIVE_UINT16);
    EXPECT_EQ(values, (Vector<u16>{0, 1, 2, 3, 10, 2, 7, 5, 6, 6, 6, 6}));

    H5::DSetCreatPropList plist = dataset.getCreatePlist();
    ASSERT_EQ(plist.getLayout(), H5D_CHUNKED);
    hsize_t chunk[3] = {};
    plist.getChunk(3, chunk);
    EXPECT_EQ(chunk[0], 1u);
    EXPECT_EQ(chunk[1], 2u);
    EXPECT_EQ(chunk[2], 2u);
    EXPECT_GE(plist.getNfilters(), 1);
}

TEST(Hdf5Writer, RoundTripsEveryDType) {
    TempDir dir;
    const auto path = dir / "dtypes.h5";

    for (DType dtype : {DType::Bool, DType::Int8, DType::UInt8, DType::Int16, DType::UInt16,
                        DType::Int32, DType::UInt32, DType::Int64, DType::UInt64,
                        DType::Float32, DType::Float64}) {
        InMemorySeries series({3, 5}, dtype);
        for (usize i = 0; i < 2; ++i) {
            Frame frame(3, 5, dtype);
            DispatchDType(dtype, [&](auto tag) {
                using T = decltype(tag);
                for (usize p = 0; p < frame.PixelCount(); ++p) {
                    frame.Set<T>(p / 5, p % 5, static_cast<T>((p + i) % 2 == 0 ? p + i : 0));
                }
            });
            series.AddFrame(std::move(frame));
        }

        const String group = String("/") + DTypeName(dtype);
        Write(series, path, "hdf5", PathOption(group));

        H5::H5File file(path.string(), H5F_ACC_RDONLY);
        H5::DataSet dataset = file.openDataSet(group + "/images");
        EXPECT_EQ(DatasetDims(dataset), (Vector<hsize_t>{2, 3, 5})) << DTypeName(dtype);

        Vector<u8> stored(2 * 3 * 5 * DTypeSize(dtype));
        dataset.read(stored.data(), dataset.getDataType());

        Vector<u8> expected;
        for (usize i = 0; i < 2; ++i) {
            const Frame frame = series.GetFrame(i);
            expected.insert(expected.end(), frame.data.begin(), frame.data.end());
        }
        EXPECT_EQ(stored, expected) << DTypeName(dtype);
    }
}

TEST(Hdf5Writer, ZeroFramesCreateEmptyDataset) {
    TempDir dir;
    const auto path = dir / "empty.h5";
    InMemorySeries series({4, 3}, DType::Float64);

    Write(series, path, "hdf5", PathOption("/images"));

    H5::H5File file(path.string(), H5F_ACC_RDONLY);
    H5::DataSet dataset = file.openDataSet("/images/images");
    EXPECT_EQ(DatasetDims(dataset), (Vector<hsize_t>{0, 4, 3}));
}

TEST(Hdf5Writer, LargeFramesSpanSeveralChunks) {
    TempDir dir;
    const auto path = dir / "large.h5";
    InMemorySeries series = MakeRampSeries(2, 300, 200);

    Write(series, path, "hdf5", Config::FromTable(toml::table{{"path", "/scan/0"},
                                                              {"compression_level", 9}}));

    H5::H5File file(path.string(), H5F_ACC_RDONLY);
    H5::DataSet dataset = file.openDataSet("/scan/0/images");

    Vector<f32> values(2 * 300 * 200);
    dataset.read(values.data(), H5::PredType::NATIVE_FLOAT);
    EXPECT_EQ(values[0], 0.0f);
    EXPECT_EQ(values[300 * 200 - 1], static_cast<f32>(300 * 200 - 1) * 0.5f);
    EXPECT_EQ(values[300 * 200], 1000.0f);

    hsize_t chunk[3] = {};
    dataset.getCreatePlist().getChunk(3, chunk);
    EXPECT_EQ(chunk[1], 62u);    // 50000 / (200 * 4)
    EXPECT_EQ(chunk[2], 200u);
}

// ============================================================================
// Groups
// ============================================================================

TEST(Hdf5Writer, AppendsGroupsAndRejectsDuplicates) {
    TempDir dir;
    const auto path = dir / "series.h5";
    InMemorySeries series = MakeSmallSeries();

    Write(series, path, "hdf5", PathOption("/run/a"));
    Write(series, path, "hdf5", PathOption("/run/b"));

    EXPECT_EQ(CodeOf([&] { Write(series, path, "hdf5", PathOption("/run/a")); }),
              ErrorCode::DuplicateGroup);
    EXPECT_EQ(CodeOf([&] { Write(series, path, "hdf5", PathOption("run")); }),
              ErrorCode::DuplicateGroup);
    EXPECT_EQ(CodeOf([&] { Write(series, path, "hdf5", PathOption("/")); }),
              ErrorCode::DuplicateGroup);

    H5::H5File file(path.string(), H5F_ACC_RDONLY);
    EXPECT_TRUE(file.nameExists("/run/a/images"));
    EXPECT_TRUE(file.nameExists("/run/b/images"));
}

TEST(Hdf5Writer, NonHdf5TargetIsIOFailure) {
    TempDir dir;
    const auto path = dir / "notes.h5";
    std::ofstream(path) << "not an hdf5 file";

    InMemorySeries series = MakeSmallSeries();
    EXPECT_EQ(CodeOf([&] { Write(series, path, "hdf5", PathOption("/images")); }),
              ErrorCode::IOFailure);
}

TEST(Hdf5Writer, UnwritableDirectoryIsIOFailure) {
    TempDir dir;
    InMemorySeries series = MakeSmallSeries();
    EXPECT_EQ(CodeOf([&] { Write(series, dir / "missing" / "x.h5", "hdf5", PathOption("/images")); }),
              ErrorCode::IOFailure);
}

// ============================================================================
// Attributes
// ============================================================================

TEST(Hdf5Writer, MetadataBecomesGroupAttributes) {
    TempDir dir;
    const auto path = dir / "meta.h5";

    NumericArray matrix;
    matrix.shape = {2, 2};
    matrix.values = Vector<f64>{1.0, 0.0, 0.0, 1.0};

    InMemorySeries series = MakeSmallSeries(Metadata{
        {"count", i64{7}},
        {"exposure", 0.25},
        {"dark", true},
        {"detector", String("GE1")},
        {"omega", NumericArray::FromInts({10, 20, 30})},
        {"matrix", matrix},
    });

    Write(series, path, "hdf5", PathOption("/images"));

    H5::H5File file(path.string(), H5F_ACC_RDONLY);
    H5::Group group = file.openGroup("/images");
    EXPECT_EQ(group.getNumAttrs(), 6);

    i64 count = 0;
    group.openAttribute("count").read(H5::PredType::NATIVE_INT64, &count);
    EXPECT_EQ(count, 7);

    f64 exposure = 0.0;
    group.openAttribute("exposure").read(H5::PredType::NATIVE_DOUBLE, &exposure);
    EXPECT_EQ(exposure, 0.25);

    H5::Attribute dark = group.openAttribute("dark");
    EXPECT_EQ(dark.getTypeClass(), H5T_ENUM);
    i8 flag = 0;
    dark.read(dark.getDataType(), &flag);
    EXPECT_EQ(flag, 1);

    H5std_string detector;
    H5::StrType strType(H5::PredType::C_S1, H5T_VARIABLE);
    group.openAttribute("detector").read(strType, detector);
    EXPECT_EQ(detector, "GE1");

    H5::Attribute omega = group.openAttribute("omega");
    EXPECT_EQ(omega.getSpace().getSimpleExtentNpoints(), 3);
    Vector<i64> omegaValues(3);
    omega.read(H5::PredType::NATIVE_INT64, omegaValues.data());
    EXPECT_EQ(omegaValues, (Vector<i64>{10, 20, 30}));

    H5::Attribute matrixAttr = group.openAttribute("matrix");
    hsize_t dims[2] = {};
    ASSERT_EQ(matrixAttr.getSpace().getSimpleExtentNdims(), 2);
    matrixAttr.getSpace().getSimpleExtentDims(dims);
    EXPECT_EQ(dims[0], 2u);
    EXPECT_EQ(dims[1], 2u);
}

TEST(Hdf5Writer, ArrayShorterThanShapeIsInvalidSeries) {
    TempDir dir;
    const auto path = dir / "short.h5";

    NumericArray truncated;
    truncated.shape = {4};
    truncated.values = Vector<i64>{1, 2};

    InMemorySeries series = MakeSmallSeries(Metadata{{"omega", truncated}});

    EXPECT_EQ(CodeOf([&] { Write(series, path, "hdf5", PathOption("/images")); }), ErrorCode::InvalidSeries);
    EXPECT_FALSE(std::filesystem::exists(path));
}

// ============================================================================
// Options
// ============================================================================

TEST(Hdf5Writer, OptionValidation) {
    InMemorySeries series = MakeSmallSeries();

    EXPECT_EQ(CodeOf([&] { Hdf5Writer writer(series, "x.h5", Config{}); }), ErrorCode::MissingOption);
    EXPECT_EQ(CodeOf([&] { Hdf5Writer writer(series, "x.h5", Config::FromTable(toml::table{{"path", 3}})); }),
              ErrorCode::InvalidOption);
    EXPECT_EQ(CodeOf([&] { Hdf5Writer writer(series, "x.h5", PathOption("")); }), ErrorCode::InvalidOption);
    EXPECT_EQ(CodeOf([&] {
                  Hdf5Writer writer(series, "x.h5",
                                    Config::FromTable(toml::table{{"path", "/images"}, {"compression_level", 12}}));
              }),
              ErrorCode::InvalidOption);

    Hdf5Writer writer(series, "x.h5", PathOption("/images"));
    EXPECT_EQ(writer.GetOptions().path, "/images");
    EXPECT_EQ(writer.GetOptions().compressionLevel, 4);
    EXPECT_FALSE(std::filesystem::exists("x.h5"));
}
