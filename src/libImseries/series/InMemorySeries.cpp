#include "InMemorySeries.hpp"
#include "core/Error.hpp"

IMS_DISABLE_WARNINGS_PUSH
#include <spdlog/fmt/fmt.h>
IMS_DISABLE_WARNINGS_POP

namespace imseries {

InMemorySeries::InMemorySeries(FrameShape shape, DType dtype, Metadata metadata)
    : m_shape(shape), m_dtype(dtype), m_metadata(std::move(metadata)) {}

void InMemorySeries::AddFrame(Frame frame) {
    if (frame.Shape() != m_shape) {
        throw WriteError(ErrorCode::InvalidSeries,
            fmt::format("frame {} has shape ({}, {}), series shape is ({}, {})",
                        m_frames.size(), frame.rows, frame.cols, m_shape.rows, m_shape.cols));
    }
    if (frame.dtype != m_dtype) {
        throw WriteError(ErrorCode::InvalidSeries,
            fmt::format("frame {} has dtype {}, series dtype is {}",
                        m_frames.size(), DTypeName(frame.dtype), DTypeName(m_dtype)));
    }
    if (!frame.IsValid()) {
        throw WriteError(ErrorCode::InvalidSeries,
            fmt::format("frame {} holds {} bytes, expected {}",
                        m_frames.size(), frame.data.size(), frame.ByteSize()));
    }
    m_frames.push_back(std::move(frame));
}

Frame InMemorySeries::GetFrame(usize index) const {
    return m_frames.at(index);
}

} // namespace imseries
