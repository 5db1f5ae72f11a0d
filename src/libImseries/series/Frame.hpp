#pragma once

#include "core/Types.hpp"
#include "core/DType.hpp"

#include <algorithm>
#include <cstring>
#include <type_traits>

namespace imseries {

// ============================================================================
// Frame - one 2-D image of a series
// ============================================================================
// Memory layout: row-major, element type given by dtype
//   element (r, c) starts at byte (r * cols + c) * DTypeSize(dtype)
// The raw byte buffer is handed unchanged to HDF5 and to the NPY encoder.
// ============================================================================

struct FrameShape {
    usize rows = 0;
    usize cols = 0;

    usize PixelCount() const { return rows * cols; }
    bool IsEmpty() const { return rows == 0 || cols == 0; }

    bool operator==(const FrameShape&) const = default;
};

struct Frame {
    usize rows = 0;
    usize cols = 0;
    DType dtype = DType::Float64;

    // Pixel data (row-major), rows * cols * DTypeSize(dtype) bytes
    Vector<u8> data;

    // ========================================================================
    // Constructors
    // ========================================================================

    Frame() = default;

    // Zero-filled frame
    Frame(usize r, usize c, DType d)
        : rows(r), cols(c), dtype(d), data(r * c * DTypeSize(d), 0) {}

    // Frame from row-major values; values.size() must equal r * c
    template<Arithmetic T>
    static Frame FromValues(usize r, usize c, const Vector<T>& values) {
        Frame frame(r, c, DTypeOf<T>());
        const usize n = std::min(values.size(), r * c);
        for (usize i = 0; i < n; ++i) {
            std::memcpy(frame.data.data() + i * sizeof(T), &values[i], sizeof(T));
        }
        return frame;
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    // No bounds checking; T must match dtype.
    // Bool pixels are raw bytes: any nonzero byte reads as true.
    template<typename T>
    T At(usize r, usize c) const {
        if constexpr (std::is_same_v<T, bool>) {
            return data[r * cols + c] != 0;
        } else {
            T value;
            std::memcpy(&value, data.data() + (r * cols + c) * sizeof(T), sizeof(T));
            return value;
        }
    }

    template<typename T>
    void Set(usize r, usize c, T value) {
        std::memcpy(data.data() + (r * cols + c) * sizeof(T), &value, sizeof(T));
    }

    // Element (r, c) converted to double, whatever the dtype
    f64 ValueAt(usize r, usize c) const {
        return DispatchDType(dtype, [&](auto tag) {
            using T = decltype(tag);
            return static_cast<f64>(At<T>(r, c));
        });
    }

    // ========================================================================
    // Utilities
    // ========================================================================

    FrameShape Shape() const { return {rows, cols}; }

    usize PixelCount() const { return rows * cols; }

    usize ByteSize() const { return PixelCount() * DTypeSize(dtype); }

    bool IsValid() const { return data.size() == ByteSize(); }
};

} // namespace imseries
