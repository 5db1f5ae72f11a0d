#include "Config.hpp"
#include "Log.hpp"

#include <sstream>

namespace imseries {

Config::Config(toml::table&& root) : m_Root(std::move(root)) {}

Config Config::FromTable(toml::table table) {
    return Config(std::move(table));
}

Result<Config, String> Config::Load(const std::filesystem::path& filePath) {
    if (!std::filesystem::exists(filePath)) {
        return Result<Config, String>::Err("Config file not found: " + filePath.string());
    }

    try {
        toml::table table = toml::parse_file(filePath.string());
        Log::Info("Loaded configuration from: {}", filePath.string());
        return Config(std::move(table));
    }
    catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "TOML parse error: " << err.description()
            << " at line " << err.source().begin.line
            << ", column " << err.source().begin.column;
        return Result<Config, String>::Err(oss.str());
    }
}

bool Config::Has(StringView key) const {
    return Navigate(key) != nullptr;
}

Result<Config, String> Config::GetTable(StringView key) const {
    const toml::node* node = Navigate(key);
    const toml::table* table = node ? node->as_table() : nullptr;
    if (!table) {
        return Result<Config, String>::Err(
            String(node ? "Key is not a table: " : "Table not found: ") + String(key));
    }
    return Config(toml::table(*table));
}

const toml::node* Config::Navigate(StringView key) const {
    if (key.empty()) {
        return nullptr;
    }
    // Dotted keys ("output.options.path") resolve through nested tables
    return m_Root.at_path(key).node();
}

} // namespace imseries
