#pragma once

#include "Writer.hpp"

namespace imseries {

// ============================================================================
// Hdf5Writer - dense chunked layout ("hdf5")
// ============================================================================
// Output: group <path> inside the HDF5 file, holding dataset "images" of
// shape (frames, rows, cols) in the series dtype, chunked and gzip-compressed.
// Every metadata entry becomes an attribute on the group.
//
// Options:
//   path               string, required   group path inside the file
//   compression_level  integer, 0-9       gzip level (default 4)
// ============================================================================

/// Decompressed size a single chunk is sized to stay near
inline constexpr usize kTargetChunkBytes = 50000;

struct ChunkGeometry {
    u64 frames = 1;
    u64 rows = 1;
    u64 cols = 1;

    bool operator==(const ChunkGeometry&) const = default;
};

/// Chunk shape for frames of rows x cols elements of bytesPerPixel bytes.
/// Narrow rows are batched into row bands; wide rows are sliced by column.
/// Row and column counts always lie in [1, rows] and [1, cols].
IMS_API ChunkGeometry ComputeChunkGeometry(usize rows, usize cols, usize bytesPerPixel);

struct Hdf5Options {
    String path;
    int compressionLevel = 4;

    static Result<Hdf5Options, WriteError> FromConfig(const Config& options);
};

class IMS_API Hdf5Writer : public Writer {
public:
    static constexpr StringView kFormat = "hdf5";

    /// Throws WriteError(MissingOption / InvalidOption / InvalidSeries)
    Hdf5Writer(const ImageSeries& series, const std::filesystem::path& filepath, const Config& options);

    StringView Format() const override { return kFormat; }

    /// Opens the file for append (creating it if absent) and writes the group.
    /// Throws WriteError(DuplicateGroup) if the group already exists and
    /// WriteError(IOFailure) for any HDF5 failure.
    void Write() override;

    const Hdf5Options& GetOptions() const { return m_hdf5Options; }

private:
    Hdf5Options m_hdf5Options;
};

} // namespace imseries
