#include "Writer.hpp"

namespace imseries {

Writer::Writer(const ImageSeries& series, std::filesystem::path filepath, Config options)
    : m_series(series)
    , m_shape(series.Shape())
    , m_dtype(series.GetDType())
    , m_nframes(series.Length())
    , m_meta(series.GetMetadata())
    , m_filepath(std::move(filepath))
    , m_options(std::move(options))
{
    if (m_shape.IsEmpty()) {
        throw WriteError(ErrorCode::InvalidSeries,
            "frame shape (" + std::to_string(m_shape.rows) + ", " +
            std::to_string(m_shape.cols) + ") has a zero dimension");
    }
}

Frame Writer::FetchFrame(usize index) const {
    Frame frame = m_series.GetFrame(index);

    if (frame.Shape() != m_shape || frame.dtype != m_dtype || !frame.IsValid()) {
        throw WriteError(ErrorCode::InvalidSeries,
            "frame " + std::to_string(index) + " does not match the series shape (" +
            std::to_string(m_shape.rows) + ", " + std::to_string(m_shape.cols) +
            ") and dtype " + DTypeName(m_dtype));
    }
    return frame;
}

} // namespace imseries
