#include "WriterRegistry.hpp"
#include "Save.hpp"
#include "core/Log.hpp"

namespace imseries {

WriterRegistry& WriterRegistry::Global() {
    static WriterRegistry registry;
    static std::once_flag initialized;
    std::call_once(initialized, [] { RegisterBuiltinWriters(registry); });
    return registry;
}

void WriterRegistry::Register(const String& format, WriterFactory factory) {
    if (format.empty()) {
        IMS_LOG_DEBUG("WriterRegistry: ignoring writer without a format identifier");
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto [it, inserted] = m_factories.insert_or_assign(format, std::move(factory));
    if (!inserted) {
        IMS_LOG_WARN("WriterRegistry: format '{}' re-registered, previous writer replaced", format);
    }
}

WriterFactory WriterRegistry::Resolve(StringView format) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_factories.find(format);
    if (it == m_factories.end()) {
        String known;
        for (const auto& [name, factory] : m_factories) {
            known += (known.empty() ? "" : ", ") + name;
        }
        throw WriteError(ErrorCode::UnknownFormat,
                         "no writer registered for '" + String(format) + "' (known: " + known + ")");
    }
    return it->second;
}

bool WriterRegistry::Has(StringView format) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_factories.find(format) != m_factories.end();
}

Vector<String> WriterRegistry::Formats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    Vector<String> formats;
    formats.reserve(m_factories.size());
    for (const auto& [name, factory] : m_factories) {
        formats.push_back(name);
    }
    return formats;
}

} // namespace imseries
