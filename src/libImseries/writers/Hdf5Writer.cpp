#include "Hdf5Writer.hpp"
#include "core/Log.hpp"

#include <H5Cpp.h>

#include <algorithm>

namespace imseries {

// ============================================================================
// Chunk geometry
// ============================================================================

ChunkGeometry ComputeChunkGeometry(usize rows, usize cols, usize bytesPerPixel) {
    ChunkGeometry chunk;
    chunk.rows = std::max<u64>(rows, 1);
    chunk.cols = std::max<u64>(cols, 1);

    const usize bytesPerRow = cols * bytesPerPixel;
    if (bytesPerRow == 0) {
        return chunk;
    }

    if (bytesPerRow < kTargetChunkBytes) {
        chunk.rows = std::min<u64>(rows, kTargetChunkBytes / bytesPerRow);
    } else {
        chunk.rows = 1;
        chunk.cols = static_cast<u64>(static_cast<f64>(kTargetChunkBytes) / static_cast<f64>(bytesPerRow) *
                                      static_cast<f64>(rows));
    }

    chunk.rows = std::clamp<u64>(chunk.rows, 1, std::max<u64>(rows, 1));
    chunk.cols = std::clamp<u64>(chunk.cols, 1, std::max<u64>(cols, 1));
    return chunk;
}

// ============================================================================
// Options
// ============================================================================

Result<Hdf5Options, WriteError> Hdf5Options::FromConfig(const Config& options) {
    using R = Result<Hdf5Options, WriteError>;
    Hdf5Options parsed;

    auto path = RequireOption<String>(options, Hdf5Writer::kFormat, "path");
    if (!path) {
        return R::Err(std::move(path).error());
    }
    parsed.path = std::move(path).value();
    if (parsed.path.empty()) {
        return R::Err(WriteError(ErrorCode::InvalidOption, "format 'hdf5': option 'path' is empty"));
    }

    auto level = OptionOr<i64>(options, Hdf5Writer::kFormat, "compression_level", 4);
    if (!level) {
        return R::Err(std::move(level).error());
    }
    if (*level < 0 || *level > 9) {
        return R::Err(WriteError(ErrorCode::InvalidOption,
            "format 'hdf5': compression_level must be within 0-9, got " + std::to_string(*level)));
    }
    parsed.compressionLevel = static_cast<int>(*level);

    return parsed;
}

// ============================================================================
// HDF5 helpers
// ============================================================================

// numpy bool as h5py stores it: enum over int8 {FALSE = 0, TRUE = 1}
static H5::EnumType BoolType() {
    H5::EnumType type{H5::IntType(H5::PredType::NATIVE_INT8)};
    i8 value = 0;
    type.insert("FALSE", &value);
    value = 1;
    type.insert("TRUE", &value);
    return type;
}

static H5::DataType ElementType(DType dtype) {
    switch (dtype) {
        case DType::Bool:    return BoolType();
        case DType::Int8:    return H5::DataType(H5::PredType::NATIVE_INT8);
        case DType::UInt8:   return H5::DataType(H5::PredType::NATIVE_UINT8);
        case DType::Int16:   return H5::DataType(H5::PredType::NATIVE_INT16);
        case DType::UInt16:  return H5::DataType(H5::PredType::NATIVE_UINT16);
        case DType::Int32:   return H5::DataType(H5::PredType::NATIVE_INT32);
        case DType::UInt32:  return H5::DataType(H5::PredType::NATIVE_UINT32);
        case DType::Int64:   return H5::DataType(H5::PredType::NATIVE_INT64);
        case DType::UInt64:  return H5::DataType(H5::PredType::NATIVE_UINT64);
        case DType::Float32: return H5::DataType(H5::PredType::NATIVE_FLOAT);
        case DType::Float64: return H5::DataType(H5::PredType::NATIVE_DOUBLE);
    }
    throw WriteError(ErrorCode::InvalidSeries, "unsupported dtype");
}

static H5::H5File OpenForAppend(const std::filesystem::path& filepath) {
    const String name = filepath.string();

    if (std::filesystem::exists(filepath)) {
        if (!H5::H5File::isHdf5(name)) {
            throw WriteError(ErrorCode::IOFailure, "'" + name + "' exists and is not an HDF5 file");
        }
        return H5::H5File(name, H5F_ACC_RDWR);
    }
    return H5::H5File(name, H5F_ACC_EXCL);
}

// True if every component of the absolute path already exists
static bool LinkExists(const H5::H5File& file, const String& path) {
    String prefix;
    usize pos = 0;
    while (pos <= path.size()) {
        usize next = path.find('/', pos);
        if (next == String::npos) {
            next = path.size();
        }
        if (next > pos) {
            prefix += "/" + path.substr(pos, next - pos);
            if (!file.nameExists(prefix)) {
                return false;
            }
        }
        pos = next + 1;
    }
    return true;
}

static void WriteAttribute(H5::Group& group, const String& key, const MetadataValue& value) {
    std::visit([&](const auto& v) {
        using V = std::decay_t<decltype(v)>;
        H5::DataSpace scalar(H5S_SCALAR);

        if constexpr (std::is_same_v<V, i64>) {
            H5::Attribute attr = group.createAttribute(key, H5::PredType::NATIVE_INT64, scalar);
            attr.write(H5::PredType::NATIVE_INT64, &v);
        } else if constexpr (std::is_same_v<V, f64>) {
            H5::Attribute attr = group.createAttribute(key, H5::PredType::NATIVE_DOUBLE, scalar);
            attr.write(H5::PredType::NATIVE_DOUBLE, &v);
        } else if constexpr (std::is_same_v<V, bool>) {
            const H5::EnumType type = BoolType();
            const i8 flag = v ? 1 : 0;
            H5::Attribute attr = group.createAttribute(key, type, scalar);
            attr.write(type, &flag);
        } else if constexpr (std::is_same_v<V, String>) {
            H5::StrType strType(H5::PredType::C_S1, H5T_VARIABLE);
            H5::Attribute attr = group.createAttribute(key, strType, scalar);
            attr.write(strType, v);
        } else {
            const H5::PredType& type = v.IsInteger() ? H5::PredType::NATIVE_INT64
                                                     : H5::PredType::NATIVE_DOUBLE;
            if (v.Size() == 0) {
                group.createAttribute(key, type, H5::DataSpace(H5S_NULL));
                return;
            }

            Vector<hsize_t> dims(v.shape.begin(), v.shape.end());
            H5::DataSpace space = dims.empty() ? H5::DataSpace(H5S_SCALAR)
                                               : H5::DataSpace(static_cast<int>(dims.size()), dims.data());
            H5::Attribute attr = group.createAttribute(key, type, space);
            std::visit([&](const auto& values) { attr.write(type, values.data()); }, v.values);
        }
    }, value);
}

// ============================================================================
// Hdf5Writer
// ============================================================================

Hdf5Writer::Hdf5Writer(const ImageSeries& series, const std::filesystem::path& filepath, const Config& options)
    : Writer(series, filepath, options)
{
    auto parsed = Hdf5Options::FromConfig(m_options);
    if (!parsed) {
        throw std::move(parsed).error();
    }
    m_hdf5Options = std::move(parsed).value();
}

void Hdf5Writer::Write() {
    H5::Exception::dontPrint();

    const String& groupPath = m_hdf5Options.path;

    // Arrays are sized from their shape; reject any whose data disagrees
    // before the file is touched
    for (const auto& [key, value] : m_meta) {
        const auto* array = std::get_if<NumericArray>(&value);
        if (array && !array->IsConsistent()) {
            throw WriteError(ErrorCode::InvalidSeries,
                "metadata '" + key + "' holds " + std::to_string(array->Count()) +
                " elements, its shape implies " + std::to_string(array->Size()));
        }
    }

    try {
        H5::H5File file = OpenForAppend(m_filepath);

        if (LinkExists(file, groupPath)) {
            throw WriteError(ErrorCode::DuplicateGroup,
                "group '" + groupPath + "' already exists in '" + m_filepath.string() + "'");
        }

        H5::LinkCreatPropList lcpl;
        lcpl.setCreateIntermediateGroup(true);
        H5::Group group = file.createGroup(groupPath, lcpl);

        // Leading axis is extensible so that a zero-frame series is still chunkable
        const hsize_t dims[3] = {m_nframes, m_shape.rows, m_shape.cols};
        const hsize_t maxDims[3] = {H5S_UNLIMITED, m_shape.rows, m_shape.cols};
        H5::DataSpace fileSpace(3, dims, maxDims);

        const ChunkGeometry chunk = ComputeChunkGeometry(m_shape.rows, m_shape.cols, DTypeSize(m_dtype));
        const hsize_t chunkDims[3] = {chunk.frames, chunk.rows, chunk.cols};
        IMS_LOG_DEBUG("Hdf5Writer: chunk geometry ({}, {}, {})", chunk.frames, chunk.rows, chunk.cols);

        H5::DSetCreatPropList dcpl;
        dcpl.setChunk(3, chunkDims);
        dcpl.setDeflate(static_cast<unsigned>(m_hdf5Options.compressionLevel));

        const H5::DataType type = ElementType(m_dtype);
        H5::DataSet dataset = group.createDataSet("images", type, fileSpace, dcpl);

        const hsize_t planeDims[2] = {m_shape.rows, m_shape.cols};
        H5::DataSpace memSpace(2, planeDims);

        for (usize i = 0; i < m_nframes; ++i) {
            const Frame frame = FetchFrame(i);

            const hsize_t start[3] = {i, 0, 0};
            const hsize_t count[3] = {1, m_shape.rows, m_shape.cols};
            H5::DataSpace plane = dataset.getSpace();
            plane.selectHyperslab(H5S_SELECT_SET, count, start);

            dataset.write(frame.data.data(), type, memSpace, plane);
        }

        for (const auto& [key, value] : m_meta) {
            WriteAttribute(group, key, value);
        }
    } catch (const H5::Exception& e) {
        throw WriteError(ErrorCode::IOFailure,
            "HDF5 write of '" + m_filepath.string() + "' failed: " + e.getDetailMsg());
    }

    IMS_LOG_INFO("Wrote {} frames ({}x{}, {}) to {}:{}",
                 m_nframes, m_shape.rows, m_shape.cols, DTypeName(m_dtype),
                 m_filepath.string(), groupPath);
}

} // namespace imseries
