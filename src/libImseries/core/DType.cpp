#include "DType.hpp"

#include <bit>

namespace imseries {

usize DTypeSize(DType dtype) {
    return DispatchDType(dtype, [](auto tag) { return sizeof(tag); });
}

const char* DTypeName(DType dtype) {
    switch (dtype) {
        case DType::Bool:    return "bool";
        case DType::Int8:    return "int8";
        case DType::UInt8:   return "uint8";
        case DType::Int16:   return "int16";
        case DType::UInt16:  return "uint16";
        case DType::Int32:   return "int32";
        case DType::UInt32:  return "uint32";
        case DType::Int64:   return "int64";
        case DType::UInt64:  return "uint64";
        case DType::Float32: return "float32";
        case DType::Float64: return "float64";
    }
    return "float64";
}

Optional<DType> ParseDType(StringView name) {
    static constexpr Array<DType, 11> kAll = {
        DType::Bool, DType::Int8, DType::UInt8, DType::Int16, DType::UInt16,
        DType::Int32, DType::UInt32, DType::Int64, DType::UInt64,
        DType::Float32, DType::Float64
    };

    for (DType dtype : kAll) {
        if (name == DTypeName(dtype)) {
            return dtype;
        }
    }
    return std::nullopt;
}

String NpyDescr(DType dtype) {
    const usize size = DTypeSize(dtype);

    char kind = 'f';
    switch (dtype) {
        case DType::Bool:
            kind = 'b';
            break;
        case DType::Int8:
        case DType::Int16:
        case DType::Int32:
        case DType::Int64:
            kind = 'i';
            break;
        case DType::UInt8:
        case DType::UInt16:
        case DType::UInt32:
        case DType::UInt64:
            kind = 'u';
            break;
        case DType::Float32:
        case DType::Float64:
            kind = 'f';
            break;
    }

    // Byte order is irrelevant for single-byte elements
    char order = '|';
    if (size > 1) {
        order = (std::endian::native == std::endian::little) ? '<' : '>';
    }

    return String{order, kind} + std::to_string(size);
}

} // namespace imseries
