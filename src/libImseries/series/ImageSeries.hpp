#pragma once

#include "core/Platform.hpp"
#include "core/Types.hpp"
#include "core/DType.hpp"
#include "Frame.hpp"
#include "Metadata.hpp"

namespace imseries {

// ============================================================================
// ImageSeries - ordered sequence of same-shaped frames plus metadata
// ============================================================================
// Writers only read from a series; the caller keeps ownership and must keep
// it alive for the duration of the write.
// ============================================================================

class IMS_API ImageSeries {
public:
    virtual ~ImageSeries() = default;

    /// Number of frames
    virtual usize Length() const = 0;

    /// Shape (rows, cols) shared by every frame
    virtual FrameShape Shape() const = 0;

    /// Element type shared by every frame
    virtual DType GetDType() const = 0;

    /// Frame at index (0 <= index < Length())
    virtual Frame GetFrame(usize index) const = 0;

    virtual const Metadata& GetMetadata() const = 0;
};

} // namespace imseries
