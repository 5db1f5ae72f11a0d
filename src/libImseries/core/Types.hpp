#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <span>
#include <array>
#include <vector>
#include <memory>
#include <optional>
#include <variant>
#include <concepts>

// ============================================================================
// Fundamental Type Aliases & C++20 Utilities
// ============================================================================

namespace imseries {

// ============================================================================
// Integer Types (explicit width)
// ============================================================================
using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using usize = std::size_t;
using isize = std::ptrdiff_t;

// ============================================================================
// Floating-Point Types
// ============================================================================
using f32 = float;
using f64 = double;

// ============================================================================
// String Types
// ============================================================================
using String = std::string;
using StringView = std::string_view;

// ============================================================================
// Container Type Aliases
// ============================================================================
template<typename T>
using Span = std::span<T>;

template<typename T, usize N>
using Array = std::array<T, N>;

template<typename T>
using Vector = std::vector<T>;

template<typename T>
using UniquePtr = std::unique_ptr<T>;

template<typename T>
using SharedPtr = std::shared_ptr<T>;

template<typename T>
using Optional = std::optional<T>;

// ============================================================================
// Error Handling (C++20-compatible Result type)
// ============================================================================

/// Simple Result type using std::variant
/// Usage: Result<T, E> func() { return T{...}; } or { return Result<T, E>::Err(msg); }
template<typename T, typename E = String>
class Result {
public:
    // Construct from success value
    Result(T&& value) : m_data(std::in_place_index<0>, std::move(value)) {}
    Result(const T& value) : m_data(std::in_place_index<0>, value) {}

    // Construct from error
    struct Err {
        E error;
        explicit Err(E&& e) : error(std::move(e)) {}
        explicit Err(const E& e) : error(e) {}
    };

    Result(Err&& err) : m_data(std::in_place_index<1>, std::move(err.error)) {}

    // Check if result holds a value
    bool has_value() const { return m_data.index() == 0; }
    explicit operator bool() const { return has_value(); }

    // Access value (throws if error)
    // Alternatives are addressed by index so that T and E may be the same type
    T& value() & { return std::get<0>(m_data); }
    const T& value() const & { return std::get<0>(m_data); }
    T&& value() && { return std::get<0>(std::move(m_data)); }

    T& operator*() & { return value(); }
    const T& operator*() const & { return value(); }
    T&& operator*() && { return std::move(value()); }

    // Access error (throws if value)
    const E& error() const & { return std::get<1>(m_data); }
    E& error() & { return std::get<1>(m_data); }
    E&& error() && { return std::get<1>(std::move(m_data)); }

private:
    std::variant<T, E> m_data;
};

/// Error codes for Imseries operations
enum class ErrorCode : u32 {
    Success = 0,

    // File I/O errors (1-99)
    FileNotFound = 1,
    IOFailure = 2,

    // Configuration errors (100-199)
    ConfigParseError = 100,
    ConfigMissingKey = 101,
    ConfigInvalidValue = 102,

    // Writer errors (200-299)
    UnknownFormat = 200,
    MissingOption = 201,
    InvalidOption = 202,
    DuplicateGroup = 203,

    // Series errors (300-399)
    InvalidSeries = 300,

    Unknown = 9999
};

// ============================================================================
// C++20 Concepts for Generic Constraints
// ============================================================================

/// Concept: Arithmetic type (integral or floating-point)
template<typename T>
concept Arithmetic = std::integral<T> || std::floating_point<T>;

// ============================================================================
// Utility Functions
// ============================================================================

/// Convert ErrorCode to human-readable string
constexpr const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:            return "Success";
        case ErrorCode::FileNotFound:       return "File not found";
        case ErrorCode::IOFailure:          return "I/O failure";
        case ErrorCode::ConfigParseError:   return "Config parse error";
        case ErrorCode::ConfigMissingKey:   return "Config missing key";
        case ErrorCode::ConfigInvalidValue: return "Config invalid value";
        case ErrorCode::UnknownFormat:      return "Unknown format";
        case ErrorCode::MissingOption:      return "Missing option";
        case ErrorCode::InvalidOption:      return "Invalid option";
        case ErrorCode::DuplicateGroup:     return "Duplicate group";
        case ErrorCode::InvalidSeries:      return "Invalid image series";
        default:                            return "Unknown error";
    }
}

} // namespace imseries
