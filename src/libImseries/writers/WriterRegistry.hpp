#pragma once

#include "Writer.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace imseries {

using WriterFactory = std::function<UniquePtr<Writer>(
    const ImageSeries& series, const std::filesystem::path& filepath, const Config& options)>;

// ============================================================================
// WriterRegistry - format identifier -> writer factory
// ============================================================================
// Registration is explicit: Global() is populated once, on first use, by
// RegisterBuiltinWriters(). Re-registering a format replaces the previous
// factory (last registration wins). Register and Resolve are serialized by
// a mutex so formats may also be added while other threads resolve.
// ============================================================================

class IMS_API WriterRegistry {
public:
    /// Process-wide registry with the built-in writers registered
    static WriterRegistry& Global();

    /// Register a factory; an empty format identifier is ignored
    void Register(const String& format, WriterFactory factory);

    /// Register writer type W under W::kFormat
    template<typename W>
    void Register() {
        Register(String(W::kFormat),
            [](const ImageSeries& series, const std::filesystem::path& filepath,
               const Config& options) -> UniquePtr<Writer> {
                return std::make_unique<W>(series, filepath, options);
            });
    }

    /// Factory registered under format; throws WriteError(UnknownFormat)
    WriterFactory Resolve(StringView format) const;

    bool Has(StringView format) const;

    /// Registered format identifiers, sorted
    Vector<String> Formats() const;

private:
    mutable std::mutex m_mutex;
    std::map<String, WriterFactory, std::less<>> m_factories;
};

} // namespace imseries
