#pragma once

#include "core/Platform.hpp"
#include "core/Types.hpp"
#include "core/Config.hpp"
#include "core/Error.hpp"
#include "series/ImageSeries.hpp"

#include <filesystem>

namespace imseries {

// ============================================================================
// Writer - base of all image-series writers
// ============================================================================
// A writer is constructed for one write request, used once through Write()
// and discarded. Construction captures the series' shape, dtype, frame count
// and metadata plus the destination and the raw option table; it performs
// no I/O. Concrete writers parse their options eagerly in their constructor
// and declare their format identifier as `static constexpr StringView kFormat`.
// ============================================================================

class IMS_API Writer {
public:
    /// Throws WriteError(InvalidSeries) if the frame shape has a zero dimension
    Writer(const ImageSeries& series, std::filesystem::path filepath, Config options);
    virtual ~Writer() = default;

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Format identifier this writer is registered under
    virtual StringView Format() const = 0;

    /// Persist the whole series; throws WriteError
    virtual void Write() = 0;

    const std::filesystem::path& GetPath() const { return m_filepath; }
    const Config& GetRawOptions() const { return m_options; }

protected:
    /// Frame i of the series, checked against the shape and dtype captured
    /// at construction; throws WriteError(InvalidSeries)
    Frame FetchFrame(usize index) const;

    const ImageSeries& m_series;
    FrameShape m_shape;
    DType m_dtype;
    usize m_nframes;
    const Metadata& m_meta;
    std::filesystem::path m_filepath;
    Config m_options;
};

// ============================================================================
// Option helpers
// ============================================================================
// Missing required key -> MissingOption; key of the wrong type -> InvalidOption.
// ============================================================================

template<typename T>
Result<T, WriteError> RequireOption(const Config& options, StringView format, StringView key) {
    if (!options.Has(key)) {
        return typename Result<T, WriteError>::Err(WriteError(ErrorCode::MissingOption,
            "format '" + String(format) + "' requires option '" + String(key) + "'"));
    }

    auto value = options.GetRequired<T>(key);
    if (!value) {
        return typename Result<T, WriteError>::Err(WriteError(ErrorCode::InvalidOption,
            "format '" + String(format) + "': " + value.error()));
    }
    return std::move(value).value();
}

template<typename T>
Result<T, WriteError> OptionOr(const Config& options, StringView format, StringView key, T defaultValue) {
    if (!options.Has(key)) {
        return defaultValue;
    }
    return RequireOption<T>(options, format, key);
}

} // namespace imseries
