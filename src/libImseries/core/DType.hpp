#pragma once

#include "Platform.hpp"
#include "Types.hpp"

#include <type_traits>
#include <utility>

// ============================================================================
// DType - element type of an image series
// ============================================================================
// Names follow NumPy (str(np.dtype)) so that descriptors and archives written
// here are read back by NumPy-based tooling without translation.
// ============================================================================

namespace imseries {

enum class DType : u8 {
    Bool,
    Int8,
    UInt8,
    Int16,
    UInt16,
    Int32,
    UInt32,
    Int64,
    UInt64,
    Float32,
    Float64
};

/// Element width in bytes
IMS_API usize DTypeSize(DType dtype);

/// NumPy dtype name, e.g. "uint16"
IMS_API const char* DTypeName(DType dtype);

/// Inverse of DTypeName
IMS_API Optional<DType> ParseDType(StringView name);

/// NPY array-protocol type string in host byte order, e.g. "<u2" or "|u1"
IMS_API String NpyDescr(DType dtype);

/// Invoke f with a value-initialized element of the C++ type matching dtype.
/// Usage: DispatchDType(dtype, [&](auto tag) { using T = decltype(tag); ... });
template<typename F>
decltype(auto) DispatchDType(DType dtype, F&& f) {
    switch (dtype) {
        case DType::Bool:    return std::forward<F>(f)(bool{});
        case DType::Int8:    return std::forward<F>(f)(i8{});
        case DType::UInt8:   return std::forward<F>(f)(u8{});
        case DType::Int16:   return std::forward<F>(f)(i16{});
        case DType::UInt16:  return std::forward<F>(f)(u16{});
        case DType::Int32:   return std::forward<F>(f)(i32{});
        case DType::UInt32:  return std::forward<F>(f)(u32{});
        case DType::Int64:   return std::forward<F>(f)(i64{});
        case DType::UInt64:  return std::forward<F>(f)(u64{});
        case DType::Float32: return std::forward<F>(f)(f32{});
        case DType::Float64: break;
    }
    return std::forward<F>(f)(f64{});
}

/// DType for a C++ element type
template<typename T>
constexpr DType DTypeOf() {
    if constexpr (std::is_same_v<T, bool>)     return DType::Bool;
    else if constexpr (std::is_same_v<T, i8>)  return DType::Int8;
    else if constexpr (std::is_same_v<T, u8>)  return DType::UInt8;
    else if constexpr (std::is_same_v<T, i16>) return DType::Int16;
    else if constexpr (std::is_same_v<T, u16>) return DType::UInt16;
    else if constexpr (std::is_same_v<T, i32>) return DType::Int32;
    else if constexpr (std::is_same_v<T, u32>) return DType::UInt32;
    else if constexpr (std::is_same_v<T, i64>) return DType::Int64;
    else if constexpr (std::is_same_v<T, u64>) return DType::UInt64;
    else if constexpr (std::is_same_v<T, f32>) return DType::Float32;
    else {
        static_assert(std::is_same_v<T, f64>, "Unsupported element type");
        return DType::Float64;
    }
}

} // namespace imseries
