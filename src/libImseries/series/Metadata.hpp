#pragma once

#include "core/Platform.hpp"
#include "core/Types.hpp"

IMS_DISABLE_WARNINGS_PUSH
#include <toml++/toml.h>
IMS_DISABLE_WARNINGS_POP

#include <functional>
#include <map>

namespace imseries {

// ============================================================================
// Series metadata
// ============================================================================
// A string-keyed mapping whose values are scalars, strings or numeric
// N-d arrays. Keys iterate in sorted order.
// ============================================================================

/// Numeric N-d array, row-major
struct NumericArray {
    Vector<usize> shape;
    std::variant<Vector<i64>, Vector<f64>> values;

    static NumericArray FromInts(Vector<i64> ints);
    static NumericArray FromFloats(Vector<f64> floats);

    // Element count implied by shape (1 for a 0-d array)
    usize Size() const;

    bool IsInteger() const { return values.index() == 0; }

    // Number of stored elements
    usize Count() const {
        return std::visit([](const auto& v) { return v.size(); }, values);
    }

    // Stored element count matches shape
    bool IsConsistent() const { return Count() == Size(); }

    bool operator==(const NumericArray&) const = default;
};

using MetadataValue = std::variant<i64, f64, bool, String, NumericArray>;

using Metadata = std::map<String, MetadataValue, std::less<>>;

inline bool IsArray(const MetadataValue& value) {
    return std::holds_alternative<NumericArray>(value);
}

/// Convert a TOML table into metadata.
/// Integers, floats, booleans and strings map to scalars; arrays of numbers
/// (rectangular nesting allowed) map to NumericArray. Anything else is an error.
IMS_API Result<Metadata, String> MetadataFromToml(const toml::table& table);

} // namespace imseries
