#pragma once

#include "core/Platform.hpp"
#include "core/Types.hpp"
#include "core/Config.hpp"
#include "series/ImageSeries.hpp"

#include <filesystem>

namespace imseries {

class WriterRegistry;

/// Write series to filepath in the given format.
/// options carries the format's keyword options, e.g.
///   Write(series, "out.h5", "hdf5", Config::FromTable(toml::table{{"path", "/images"}}));
/// An unknown format throws WriteError(UnknownFormat) before any file is
/// touched; writer errors propagate unchanged.
IMS_API void Write(const ImageSeries& series, const std::filesystem::path& filepath,
                   StringView format, const Config& options = {});

/// Register the "hdf5" and "frame-cache" writers
IMS_API void RegisterBuiltinWriters(WriterRegistry& registry);

} // namespace imseries
