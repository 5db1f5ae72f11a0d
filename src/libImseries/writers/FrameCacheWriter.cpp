#include "FrameCacheWriter.hpp"
#include "core/Log.hpp"
#include "io/NpzArchive.hpp"
#include "io/Descriptor.hpp"

IMS_DISABLE_WARNINGS_PUSH
#include <spdlog/fmt/fmt.h>
IMS_DISABLE_WARNINGS_POP

#include <cstddef>
#include <type_traits>
#include <utility>

namespace imseries {

// ============================================================================
// Sparse extraction
// ============================================================================

namespace {

template<typename Above>
SparseFrame CollectPixels(const Frame& frame, Above&& above) {
    SparseFrame sparse;
    sparse.dtype = frame.dtype;

    const usize elementSize = DTypeSize(frame.dtype);
    for (usize r = 0; r < frame.rows; ++r) {
        for (usize c = 0; c < frame.cols; ++c) {
            if (!above(r, c)) {
                continue;
            }
            sparse.rows.push_back(static_cast<i64>(r));
            sparse.cols.push_back(static_cast<i64>(c));

            // Kept bool pixels are stored as canonical true
            if (frame.dtype == DType::Bool) {
                sparse.values.push_back(1);
                continue;
            }
            const usize offset = (r * frame.cols + c) * elementSize;
            sparse.values.insert(sparse.values.end(),
                                 frame.data.begin() + static_cast<std::ptrdiff_t>(offset),
                                 frame.data.begin() + static_cast<std::ptrdiff_t>(offset + elementSize));
        }
    }
    return sparse;
}

} // namespace

SparseFrame ExtractAboveThreshold(const Frame& frame, f64 threshold) {
    return CollectPixels(frame, [&](usize r, usize c) { return frame.ValueAt(r, c) > threshold; });
}

SparseFrame ExtractAboveIntegerThreshold(const Frame& frame, i64 threshold) {
    return DispatchDType(frame.dtype, [&](auto tag) {
        using T = decltype(tag);
        return CollectPixels(frame, [&](usize r, usize c) {
            const T value = frame.At<T>(r, c);
            if constexpr (std::is_floating_point_v<T>) {
                return static_cast<f64>(value) > static_cast<f64>(threshold);
            } else if constexpr (std::is_same_v<T, bool>) {
                return static_cast<i64>(value) > threshold;
            } else {
                return std::cmp_greater(value, threshold);
            }
        });
    });
}

// ============================================================================
// Metadata processing
// ============================================================================

Metadata ProcessMetadata(const Metadata& meta) {
    Metadata processed;

    for (const auto& [key, value] : meta) {
        if (IsArray(value)) {
            processed.insert_or_assign(key, MetadataValue(String(kArraySentinel)));
        } else {
            processed.insert_or_assign(key, value);
        }
    }

    // Array entries go in last so they take precedence over a colliding scalar
    for (const auto& [key, value] : meta) {
        if (!IsArray(value)) {
            continue;
        }
        const String arrayKey = key + kArrayKeySuffix;
        if (meta.find(arrayKey) != meta.end()) {
            IMS_LOG_WARN("Metadata key '{}' is replaced by the contents of array '{}'", arrayKey, key);
        }
        processed.insert_or_assign(arrayKey, value);
    }

    return processed;
}

// ============================================================================
// Options
// ============================================================================

Result<FrameCacheOptions, WriteError> FrameCacheOptions::FromConfig(const Config& options) {
    using R = Result<FrameCacheOptions, WriteError>;
    FrameCacheOptions parsed;

    auto threshold = RequireOption<f64>(options, FrameCacheWriter::kFormat, "threshold");
    if (!threshold) {
        return R::Err(std::move(threshold).error());
    }
    parsed.threshold = *threshold;
    if (auto exact = options.GetRequired<i64>("threshold")) {
        parsed.integerThreshold = *exact;
    }

    auto cacheFile = RequireOption<String>(options, FrameCacheWriter::kFormat, "cache_file");
    if (!cacheFile) {
        return R::Err(std::move(cacheFile).error());
    }
    if (cacheFile.value().empty()) {
        return R::Err(WriteError(ErrorCode::InvalidOption, "format 'frame-cache': option 'cache_file' is empty"));
    }
    parsed.cacheFile = std::move(cacheFile).value();

    auto integrity = OptionOr<bool>(options, FrameCacheWriter::kFormat, "integrity", false);
    if (!integrity) {
        return R::Err(std::move(integrity).error());
    }
    parsed.integrity = *integrity;

    return parsed;
}

// ============================================================================
// FrameCacheWriter
// ============================================================================

FrameCacheWriter::FrameCacheWriter(const ImageSeries& series, const std::filesystem::path& filepath,
                                   const Config& options)
    : Writer(series, filepath, options)
{
    auto parsed = FrameCacheOptions::FromConfig(m_options);
    if (!parsed) {
        throw std::move(parsed).error();
    }
    m_cacheOptions = std::move(parsed).value();
}

void FrameCacheWriter::Write() {
    WriteArchive();
    WriteDescriptor();

    IMS_LOG_INFO("Wrote {} frames ({}x{}, {}) above {} to {} + {}",
                 m_nframes, m_shape.rows, m_shape.cols, DTypeName(m_dtype),
                 m_cacheOptions.threshold, m_filepath.string(), m_cacheOptions.cacheFile.string());
}

void FrameCacheWriter::WriteArchive() const {
    NpzArchive archive;
    usize total = 0;

    for (usize i = 0; i < m_nframes; ++i) {
        const Frame frame = FetchFrame(i);
        SparseFrame sparse = m_cacheOptions.integerThreshold
            ? ExtractAboveIntegerThreshold(frame, *m_cacheOptions.integerThreshold)
            : ExtractAboveThreshold(frame, m_cacheOptions.threshold);
        const usize count = sparse.Count();
        total += count;
        IMS_LOG_DEBUG("FrameCacheWriter: frame {} keeps {} pixels", i, count);

        const String prefix = std::to_string(i);
        archive.Add(prefix + "_data", sparse.dtype, {count}, std::move(sparse.values));
        archive.Add(prefix + "_row", sparse.rows);
        archive.Add(prefix + "_col", sparse.cols);

        if (!archive.Contains("shape")) {
            archive.Add("shape", Vector<i64>{static_cast<i64>(m_shape.rows), static_cast<i64>(m_shape.cols)});
        }
    }

    // A zero-frame series still records its frame shape
    if (!archive.Contains("shape")) {
        archive.Add("shape", Vector<i64>{static_cast<i64>(m_shape.rows), static_cast<i64>(m_shape.cols)});
    }

    archive.Save(m_cacheOptions.cacheFile);
    IMS_LOG_DEBUG("FrameCacheWriter: archive {} holds {} arrays, {} pixels",
                  m_cacheOptions.cacheFile.string(), archive.Size(), total);
}

void FrameCacheWriter::WriteDescriptor() const {
    toml::table data{
        {"file", m_cacheOptions.cacheFile.string()},
        {"dtype", DTypeName(m_dtype)},
        {"nframes", static_cast<i64>(m_nframes)},
        {"shape", toml::array{static_cast<i64>(m_shape.rows), static_cast<i64>(m_shape.cols)}},
    };

    if (m_cacheOptions.integrity) {
        data.insert_or_assign("checksum", fmt::format("crc32:{:08x}", FileCrc32(m_cacheOptions.cacheFile)));
    }

    toml::table document{
        {"data", std::move(data)},
        {"meta", MetadataToToml(ProcessMetadata(m_meta))},
    };

    WriteYamlDescriptor(m_filepath, document);
}

} // namespace imseries
