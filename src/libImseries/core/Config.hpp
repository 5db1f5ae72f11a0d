#pragma once

#include "Platform.hpp"
#include "Types.hpp"

IMS_DISABLE_WARNINGS_PUSH
#include <toml++/toml.h>
IMS_DISABLE_WARNINGS_POP

#include <filesystem>
#include <type_traits>

// ============================================================================
// Configuration (TOML)
// ============================================================================
// Backs both the command-line tool's configuration file and the per-format
// writer options passed to Write().
// ============================================================================

namespace imseries {

class IMS_API Config {
public:
    /// Load a TOML configuration file
    /// @param filePath Path to the .toml file
    /// @return Result containing parsed config or error
    static Result<Config, String> Load(const std::filesystem::path& filePath);

    /// Wrap an in-memory table, e.g. toml::table{{"path", "/images"}}
    static Config FromTable(toml::table table);

    /// Create an empty configuration
    Config() = default;

    /// Check if a key exists in the configuration
    /// @param key Dot-separated key path (e.g., "output.format")
    bool Has(StringView key) const;

    /// Get a value from the configuration (with optional default)
    /// @tparam T Expected value type (i64, u32, f64, String, bool, etc.)
    /// @param key Dot-separated key path
    /// @param defaultValue Fallback value if key is missing or has another type
    template<typename T>
    T Get(StringView key, const T& defaultValue = T{}) const;

    /// Get a value, reporting a missing key or a type mismatch as an error
    template<typename T>
    Result<T, String> GetRequired(StringView key) const;

    /// Get a nested table as a Config object
    Result<Config, String> GetTable(StringView key) const;

    /// Get an array of values (elements of another type are skipped)
    template<typename T>
    Vector<T> GetArray(StringView key) const;

    /// Get an array whose every element converts to T
    template<typename T>
    Result<Vector<T>, String> GetRequiredArray(StringView key) const;

    /// Access the underlying toml::table
    const toml::table& GetRoot() const { return m_Root; }

private:
    explicit Config(toml::table&& root);

    toml::table m_Root;

    /// Navigate to a nested node by dot-separated path
    const toml::node* Navigate(StringView key) const;

    template<typename T>
    static Optional<T> Convert(const toml::node& node);
};

// ============================================================================
// Template Implementation
// ============================================================================

template<typename T>
Optional<T> Config::Convert(const toml::node& node) {
    if constexpr (std::is_same_v<T, String>) {
        if (auto val = node.value<std::string>()) {
            return *val;
        }
    } else if constexpr (std::is_same_v<T, bool>) {
        if (auto val = node.value_exact<bool>()) {
            return *val;
        }
    } else if constexpr (std::is_floating_point_v<T>) {
        // Integers are accepted wherever a float is expected
        if (auto val = node.value<double>()) {
            return static_cast<T>(*val);
        }
    } else if constexpr (std::is_integral_v<T>) {
        if (auto val = node.value_exact<int64_t>()) {
            if constexpr (std::is_unsigned_v<T>) {
                if (*val < 0) {
                    return std::nullopt;
                }
            }
            return static_cast<T>(*val);
        }
    } else {
        static_assert(std::is_same_v<T, String>, "Unsupported config value type");
    }

    return std::nullopt;
}

template<typename T>
T Config::Get(StringView key, const T& defaultValue) const {
    const toml::node* node = Navigate(key);
    if (!node) {
        return defaultValue;
    }

    if (auto val = Convert<T>(*node)) {
        return *val;
    }

    return defaultValue;
}

template<typename T>
Result<T, String> Config::GetRequired(StringView key) const {
    const toml::node* node = Navigate(key);
    if (!node) {
        return typename Result<T, String>::Err("Missing required key: " + String(key));
    }

    if (auto val = Convert<T>(*node)) {
        return std::move(*val);
    }

    return typename Result<T, String>::Err("Type mismatch for key: " + String(key));
}

template<typename T>
Vector<T> Config::GetArray(StringView key) const {
    const toml::node* node = Navigate(key);
    Vector<T> result;

    if (!node || !node->is_array()) {
        return result;
    }

    const toml::array* arr = node->as_array();
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        if (auto val = Convert<T>(elem)) {
            result.push_back(*val);
        }
    }

    return result;
}

template<typename T>
Result<Vector<T>, String> Config::GetRequiredArray(StringView key) const {
    using R = Result<Vector<T>, String>;
    const toml::node* node = Navigate(key);
    if (!node) {
        return typename R::Err("Missing required key: " + String(key));
    }
    if (!node->is_array()) {
        return typename R::Err("Key is not an array: " + String(key));
    }

    const toml::array* arr = node->as_array();
    Vector<T> result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        auto val = Convert<T>(elem);
        if (!val) {
            return typename R::Err("Type mismatch in array: " + String(key));
        }
        result.push_back(*val);
    }

    return result;
}

} // namespace imseries
