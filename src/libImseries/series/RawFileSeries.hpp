#pragma once

#include "ImageSeries.hpp"

#include <filesystem>

namespace imseries {

// ============================================================================
// RawFileSeries - frames stored back to back in a raw binary file
// ============================================================================
// File layout:
//   [headerBytes bytes, skipped] [frame 0] [frame 1] ... [frame n-1]
// Each frame is rows * cols elements of dtype, row-major, host byte order.
// Frames are read on demand; the file is opened per GetFrame() call.
// ============================================================================

class IMS_API RawFileSeries : public ImageSeries {
public:
    /// Throws WriteError(FileNotFound) if the file does not exist and
    /// WriteError(InvalidSeries) if its payload is not a whole number of frames
    RawFileSeries(const std::filesystem::path& filepath, FrameShape shape, DType dtype,
                  u64 headerBytes = 0, Metadata metadata = {});

    usize Length() const override { return m_nframes; }
    FrameShape Shape() const override { return m_shape; }
    DType GetDType() const override { return m_dtype; }
    Frame GetFrame(usize index) const override;
    const Metadata& GetMetadata() const override { return m_metadata; }

    const std::filesystem::path& GetPath() const { return m_path; }

private:
    std::filesystem::path m_path;
    FrameShape m_shape;
    DType m_dtype;
    u64 m_headerBytes;
    usize m_nframes = 0;
    Metadata m_metadata;
};

} // namespace imseries
