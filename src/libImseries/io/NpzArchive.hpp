#pragma once

#include "core/Platform.hpp"
#include "core/Types.hpp"
#include "core/DType.hpp"

#include <cstring>
#include <filesystem>

namespace imseries {

// ============================================================================
// NpzArchive - NumPy-compatible compressed array archive
// ============================================================================
// Arrays are accumulated in memory in insertion order and written in one go
// by Save(). On disk the archive is a ZIP file (format version 2.0, no ZIP64)
// with one member "<key>.npy" per array:
//   - member payload: NPY format 1.0 (magic, header dict, raw C-order data)
//   - compression:    raw deflate (method 8), as numpy.savez_compressed
// Limits: fewer than 65536 members; every size and offset below 4 GiB.
// ============================================================================

class IMS_API NpzArchive {
public:
    /// @param compressionLevel zlib level 0-9, or -1 for zlib's default
    explicit NpzArchive(int compressionLevel = -1);

    /// Add (or replace) an array from raw element bytes
    /// bytes.size() must equal product(shape) * DTypeSize(dtype)
    void Add(const String& key, DType dtype, Vector<usize> shape, Vector<u8> bytes);

    /// Add (or replace) an array of values; shape defaults to {values.size()}
    template<Arithmetic T>
    void Add(const String& key, const Vector<T>& values, Vector<usize> shape = {}) {
        if (shape.empty()) {
            shape = {values.size()};
        }
        Vector<u8> bytes(values.size() * sizeof(T));
        if (!bytes.empty()) {
            std::memcpy(bytes.data(), values.data(), bytes.size());
        }
        Add(key, DTypeOf<T>(), std::move(shape), std::move(bytes));
    }

    bool Contains(StringView key) const;

    /// Number of arrays
    usize Size() const { return m_entries.size(); }

    /// Keys in insertion order
    Vector<String> Keys() const;

    /// Write the archive, replacing any existing file.
    /// Throws WriteError(IOFailure) on any failure; the file handle is
    /// released on every exit path.
    void Save(const std::filesystem::path& filepath) const;

    /// Encode one array as an NPY 1.0 payload
    static Vector<u8> EncodeNpy(DType dtype, const Vector<usize>& shape, Span<const u8> bytes);

private:
    struct Entry {
        String key;
        DType dtype;
        Vector<usize> shape;
        Vector<u8> bytes;
    };

    int m_compressionLevel;
    Vector<Entry> m_entries;
};

/// CRC-32 (zlib polynomial) of a whole file; throws WriteError(IOFailure)
IMS_API u32 FileCrc32(const std::filesystem::path& filepath);

} // namespace imseries
