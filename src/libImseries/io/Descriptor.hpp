#pragma once

#include "core/Platform.hpp"
#include "core/Types.hpp"
#include "series/Metadata.hpp"

IMS_DISABLE_WARNINGS_PUSH
#include <toml++/toml.h>
IMS_DISABLE_WARNINGS_POP

#include <filesystem>

namespace imseries {

// ============================================================================
// Descriptor - structured-text (YAML) sidecar files
// ============================================================================
// Documents are assembled as toml::table and emitted with toml++'s YAML
// formatter; keys come out sorted. Numeric arrays become nested lists in
// row-major order (a 0-d array becomes a bare scalar).
// ============================================================================

/// Convert metadata to a TOML table
IMS_API toml::table MetadataToToml(const Metadata& meta);

/// Write a YAML document; throws WriteError(IOFailure)
IMS_API void WriteYamlDescriptor(const std::filesystem::path& filepath, const toml::table& document);

} // namespace imseries
