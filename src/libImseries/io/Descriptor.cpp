#include "Descriptor.hpp"
#include "core/Error.hpp"

#include <fstream>

namespace imseries {

namespace {

// Builds the nested list for dimension `dim` starting at flat index `offset`
template<typename T>
toml::array NestedList(const Vector<T>& values, const Vector<usize>& shape,
                       usize dim, usize& offset) {
    toml::array list;
    const usize extent = shape[dim];

    for (usize i = 0; i < extent; ++i) {
        if (dim + 1 == shape.size()) {
            list.push_back(values[offset++]);
        } else {
            list.push_back(NestedList(values, shape, dim + 1, offset));
        }
    }
    return list;
}

void InsertValue(toml::table& table, const String& key, const MetadataValue& value) {
    std::visit([&](const auto& v) {
        using V = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<V, NumericArray>) {
            if (!v.IsConsistent()) {
                throw WriteError(ErrorCode::InvalidSeries,
                                 "metadata '" + key + "' holds " + std::to_string(v.Count()) +
                                 " elements, its shape implies " + std::to_string(v.Size()));
            }
            std::visit([&](const auto& values) {
                if (v.shape.empty()) {
                    if (!values.empty()) {
                        table.insert_or_assign(key, values.front());
                    }
                    return;
                }
                usize offset = 0;
                table.insert_or_assign(key, NestedList(values, v.shape, 0, offset));
            }, v.values);
        } else {
            table.insert_or_assign(key, v);
        }
    }, value);
}

} // namespace

toml::table MetadataToToml(const Metadata& meta) {
    toml::table table;
    for (const auto& [key, value] : meta) {
        InsertValue(table, key, value);
    }
    return table;
}

void WriteYamlDescriptor(const std::filesystem::path& filepath, const toml::table& document) {
    std::ofstream file(filepath, std::ios::trunc);
    if (!file) {
        throw WriteError(ErrorCode::IOFailure, "cannot open " + filepath.string() + " for writing");
    }

    file << toml::yaml_formatter{document} << '\n';

    file.close();
    if (!file) {
        throw WriteError(ErrorCode::IOFailure, "write failed: " + filepath.string());
    }
}

} // namespace imseries
