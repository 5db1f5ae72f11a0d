#pragma once

#include "Writer.hpp"

namespace imseries {

// ============================================================================
// FrameCacheWriter - sparse thresholded layout ("frame-cache")
// ============================================================================
// Output is a pair of files:
//   cache_file  .npz archive: "shape" (int64 [rows, cols]) and, per frame i,
//               "{i}_row", "{i}_col" (int64) and "{i}_data" (series dtype)
//               holding the pixels strictly above threshold, row-major
//   filepath    YAML descriptor:
//                 data: { file, dtype, nframes, shape [, checksum] }
//                 meta: processed metadata (see ProcessMetadata)
// The archive is saved before the descriptor. Nothing is rolled back if the
// descriptor cannot be written.
//
// Options:
//   threshold   number, required (integers compare exactly with integer pixels)
//   cache_file  string, required   path of the archive, recorded as given
//   integrity   bool (default false) record the archive CRC-32 as data.checksum
// ============================================================================

/// Value written in place of an array-valued metadata entry
inline constexpr const char* kArraySentinel = "++np.array";

/// Suffix of the key holding the array itself
inline constexpr const char* kArrayKeySuffix = "-array";

/// Above-threshold pixels of one frame, in row-major order
struct SparseFrame {
    Vector<i64> rows;
    Vector<i64> cols;
    DType dtype = DType::Float64;
    Vector<u8> values;      // Count() elements of dtype

    usize Count() const { return rows.size(); }
};

/// Every pixel with frame(r, c) > threshold, exactly once.
/// Pixels are compared as doubles, so 64-bit integers beyond 2^53 may round.
IMS_API SparseFrame ExtractAboveThreshold(const Frame& frame, f64 threshold);

/// As ExtractAboveThreshold, comparing integer pixels to threshold exactly
IMS_API SparseFrame ExtractAboveIntegerThreshold(const Frame& frame, i64 threshold);

/// Scalars pass through; each array entry k becomes k -> kArraySentinel and
/// k + kArrayKeySuffix -> the array
IMS_API Metadata ProcessMetadata(const Metadata& meta);

struct FrameCacheOptions {
    f64 threshold = 0.0;
    Optional<i64> integerThreshold;   // set when threshold was given as an integer
    std::filesystem::path cacheFile;
    bool integrity = false;

    static Result<FrameCacheOptions, WriteError> FromConfig(const Config& options);
};

class IMS_API FrameCacheWriter : public Writer {
public:
    static constexpr StringView kFormat = "frame-cache";

    /// Throws WriteError(MissingOption / InvalidOption / InvalidSeries)
    FrameCacheWriter(const ImageSeries& series, const std::filesystem::path& filepath, const Config& options);

    StringView Format() const override { return kFormat; }

    /// Throws WriteError(IOFailure / InvalidSeries)
    void Write() override;

    const FrameCacheOptions& GetOptions() const { return m_cacheOptions; }

private:
    void WriteArchive() const;
    void WriteDescriptor() const;

    FrameCacheOptions m_cacheOptions;
};

} // namespace imseries
