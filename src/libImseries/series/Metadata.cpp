#include "Metadata.hpp"

namespace imseries {

NumericArray NumericArray::FromInts(Vector<i64> ints) {
    NumericArray array;
    array.shape = {ints.size()};
    array.values = std::move(ints);
    return array;
}

NumericArray NumericArray::FromFloats(Vector<f64> floats) {
    NumericArray array;
    array.shape = {floats.size()};
    array.values = std::move(floats);
    return array;
}

usize NumericArray::Size() const {
    usize size = 1;
    for (usize extent : shape) {
        size *= extent;
    }
    return size;
}

// ============================================================================
// Helper: flatten a (possibly nested) TOML array of numbers
// ============================================================================

namespace {

struct FlatArray {
    Vector<usize> shape;
    Vector<f64> floats;
    Vector<i64> ints;
    Optional<usize> leafDepth;  // nesting depth at which numbers live
    bool anyFloat = false;
};

bool Flatten(const toml::array& arr, usize depth, FlatArray& out, String& error) {
    if (out.shape.size() == depth) {
        out.shape.push_back(arr.size());
    } else if (out.shape[depth] != arr.size()) {
        error = "array is not rectangular";
        return false;
    }

    for (const toml::node& elem : arr) {
        if (const toml::array* sub = elem.as_array()) {
            if (out.leafDepth && *out.leafDepth <= depth) {
                error = "array mixes numbers and nested arrays";
                return false;
            }
            if (!Flatten(*sub, depth + 1, out, error)) {
                return false;
            }
            continue;
        }

        if (out.leafDepth && *out.leafDepth != depth) {
            error = "array mixes numbers and nested arrays";
            return false;
        }
        out.leafDepth = depth;

        if (auto i = elem.value_exact<int64_t>()) {
            out.ints.push_back(*i);
            out.floats.push_back(static_cast<f64>(*i));
        } else if (auto f = elem.value_exact<double>()) {
            out.anyFloat = true;
            out.ints.push_back(0);
            out.floats.push_back(*f);
        } else {
            error = "array elements must be numbers";
            return false;
        }
    }
    return true;
}

} // namespace

Result<Metadata, String> MetadataFromToml(const toml::table& table) {
    Metadata meta;

    for (const auto& [key, node] : table) {
        const String name(key.str());

        if (auto i = node.value_exact<int64_t>()) {
            meta[name] = *i;
        } else if (auto f = node.value_exact<double>()) {
            meta[name] = *f;
        } else if (auto b = node.value_exact<bool>()) {
            meta[name] = *b;
        } else if (auto s = node.value_exact<std::string>()) {
            meta[name] = *s;
        } else if (const toml::array* arr = node.as_array()) {
            FlatArray flat;
            String error;
            if (!Flatten(*arr, 0, flat, error)) {
                return Result<Metadata, String>::Err("Metadata '" + name + "': " + error);
            }

            NumericArray array;
            array.shape = std::move(flat.shape);
            if (flat.anyFloat) {
                array.values = std::move(flat.floats);
            } else {
                array.values = std::move(flat.ints);
            }
            meta[name] = std::move(array);
        } else {
            return Result<Metadata, String>::Err(
                "Metadata '" + name + "': unsupported value type");
        }
    }

    return meta;
}

} // namespace imseries
