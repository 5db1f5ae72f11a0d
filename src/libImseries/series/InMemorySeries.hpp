#pragma once

#include "ImageSeries.hpp"

namespace imseries {

// Series whose frames are held in memory
class IMS_API InMemorySeries : public ImageSeries {
public:
    InMemorySeries(FrameShape shape, DType dtype, Metadata metadata = {});

    /// Append a frame; throws WriteError(InvalidSeries) if its shape, dtype
    /// or buffer size does not match the series
    void AddFrame(Frame frame);

    Metadata& GetMutableMetadata() { return m_metadata; }

    usize Length() const override { return m_frames.size(); }
    FrameShape Shape() const override { return m_shape; }
    DType GetDType() const override { return m_dtype; }
    Frame GetFrame(usize index) const override;
    const Metadata& GetMetadata() const override { return m_metadata; }

private:
    FrameShape m_shape;
    DType m_dtype;
    Metadata m_metadata;
    Vector<Frame> m_frames;
};

} // namespace imseries
