#include "RawFileSeries.hpp"
#include "core/Error.hpp"
#include "core/Log.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace imseries {

RawFileSeries::RawFileSeries(const std::filesystem::path& filepath, FrameShape shape,
                             DType dtype, u64 headerBytes, Metadata metadata)
    : m_path(filepath), m_shape(shape), m_dtype(dtype),
      m_headerBytes(headerBytes), m_metadata(std::move(metadata)) {

    std::error_code ec;
    const u64 fileSize = std::filesystem::file_size(m_path, ec);
    if (ec) {
        throw WriteError(ErrorCode::FileNotFound, m_path.string() + ": " + ec.message());
    }

    const u64 frameBytes = shape.PixelCount() * DTypeSize(dtype);
    if (frameBytes == 0) {
        throw WriteError(ErrorCode::InvalidSeries, "frame shape has a zero dimension");
    }
    if (fileSize < headerBytes || (fileSize - headerBytes) % frameBytes != 0) {
        throw WriteError(ErrorCode::InvalidSeries,
            fmt::format("{}: {} bytes after a {}-byte header is not a whole number of "
                        "{}-byte frames", m_path.string(), fileSize - std::min(fileSize, headerBytes),
                        headerBytes, frameBytes));
    }

    m_nframes = static_cast<usize>((fileSize - headerBytes) / frameBytes);

    IMS_LOG_INFO("RawFileSeries: {} frames of {}x{} {} in {}",
                 m_nframes, shape.rows, shape.cols, DTypeName(dtype), m_path.string());
}

Frame RawFileSeries::GetFrame(usize index) const {
    if (index >= m_nframes) {
        throw std::out_of_range("RawFileSeries: frame index " + std::to_string(index) +
                                " out of range (" + std::to_string(m_nframes) + " frames)");
    }

    Frame frame(m_shape.rows, m_shape.cols, m_dtype);
    const u64 offset = m_headerBytes + static_cast<u64>(index) * frame.ByteSize();

    std::ifstream file(m_path, std::ios::binary);
    if (!file) {
        throw WriteError(ErrorCode::IOFailure, "cannot open " + m_path.string());
    }

    file.seekg(static_cast<std::streamoff>(offset));
    file.read(reinterpret_cast<char*>(frame.data.data()),
              static_cast<std::streamsize>(frame.data.size()));
    if (!file) {
        throw WriteError(ErrorCode::IOFailure,
                         "short read of frame " + std::to_string(index) + " from " + m_path.string());
    }

    return frame;
}

} // namespace imseries
