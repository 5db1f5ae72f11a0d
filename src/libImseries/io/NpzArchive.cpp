#include "NpzArchive.hpp"
#include "core/Error.hpp"
#include "core/Log.hpp"

#include <zlib.h>

#include <ctime>
#include <fstream>
#include <limits>

namespace imseries {

namespace {

constexpr u32 kLocalHeaderSignature   = 0x04034b50;
constexpr u32 kCentralHeaderSignature = 0x02014b50;
constexpr u32 kEndOfCentralDirSignature = 0x06054b50;
constexpr u16 kZipVersion = 20;  // 2.0: deflate
constexpr u16 kMethodDeflate = 8;
constexpr u64 kZip32Limit = std::numeric_limits<u32>::max();

// NPY 1.0: header (magic + version + length + dict) padded to this multiple
constexpr usize kNpyAlignment = 64;

// ============================================================================
// Helper: little-endian byte writer for ZIP records
// ============================================================================

class ByteWriter {
public:
    void U16(u16 v) {
        m_bytes.push_back(static_cast<u8>(v & 0xff));
        m_bytes.push_back(static_cast<u8>((v >> 8) & 0xff));
    }

    void U32(u32 v) {
        for (int shift = 0; shift < 32; shift += 8) {
            m_bytes.push_back(static_cast<u8>((v >> shift) & 0xff));
        }
    }

    void Str(const String& s) {
        m_bytes.insert(m_bytes.end(), s.begin(), s.end());
    }

    const Vector<u8>& Bytes() const { return m_bytes; }

private:
    Vector<u8> m_bytes;
};

// ============================================================================
// Helper: MS-DOS date/time of "now" for ZIP headers
// ============================================================================

std::pair<u16, u16> DosDateTime() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
#if defined(IMS_WINDOWS)
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    if (local.tm_year < 80) {
        return {0, (1 << 5) | 1};  // 1980-01-01 00:00:00
    }

    const u16 time = static_cast<u16>((local.tm_hour << 11) | (local.tm_min << 5) | (local.tm_sec / 2));
    const u16 date = static_cast<u16>(((local.tm_year - 80) << 9) | ((local.tm_mon + 1) << 5) | local.tm_mday);
    return {time, date};
}

// ============================================================================
// Helper: raw deflate (no zlib/gzip wrapper), as stored in ZIP members
// ============================================================================

Vector<u8> Deflate(const Vector<u8>& input, int level) {
    z_stream strm{};
    int ret = deflateInit2(&strm, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        throw WriteError(ErrorCode::IOFailure, "deflateInit2 failed with code " + std::to_string(ret));
    }

    strm.next_in = const_cast<Bytef*>(input.data());
    strm.avail_in = static_cast<uInt>(input.size());

    Vector<u8> out(deflateBound(&strm, static_cast<uLong>(input.size())));
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    ret = deflate(&strm, Z_FINISH);
    if (ret != Z_STREAM_END) {
        deflateEnd(&strm);
        throw WriteError(ErrorCode::IOFailure, "deflate failed with code " + std::to_string(ret));
    }

    out.resize(strm.total_out);
    deflateEnd(&strm);
    return out;
}

u32 Crc32(const Vector<u8>& bytes) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, bytes.data(), static_cast<uInt>(bytes.size()));
    return static_cast<u32>(crc);
}

void WriteBytes(std::ofstream& file, const Vector<u8>& bytes, const std::filesystem::path& filepath) {
    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        throw WriteError(ErrorCode::IOFailure, "write failed: " + filepath.string());
    }
}

} // namespace

// ============================================================================
// NpzArchive
// ============================================================================

NpzArchive::NpzArchive(int compressionLevel)
    : m_compressionLevel(compressionLevel) {}

void NpzArchive::Add(const String& key, DType dtype, Vector<usize> shape, Vector<u8> bytes) {
    usize count = 1;
    for (usize extent : shape) {
        count *= extent;
    }
    if (bytes.size() != count * DTypeSize(dtype)) {
        throw std::invalid_argument("NpzArchive::Add: '" + key + "' holds " +
                                    std::to_string(bytes.size()) + " bytes, shape implies " +
                                    std::to_string(count * DTypeSize(dtype)));
    }

    Entry entry{key, dtype, std::move(shape), std::move(bytes)};
    for (Entry& existing : m_entries) {
        if (existing.key == key) {
            existing = std::move(entry);
            return;
        }
    }
    m_entries.push_back(std::move(entry));
}

bool NpzArchive::Contains(StringView key) const {
    for (const Entry& entry : m_entries) {
        if (entry.key == key) {
            return true;
        }
    }
    return false;
}

Vector<String> NpzArchive::Keys() const {
    Vector<String> keys;
    keys.reserve(m_entries.size());
    for (const Entry& entry : m_entries) {
        keys.push_back(entry.key);
    }
    return keys;
}

Vector<u8> NpzArchive::EncodeNpy(DType dtype, const Vector<usize>& shape, Span<const u8> bytes) {
    // Header dict, e.g. {'descr': '<u2', 'fortran_order': False, 'shape': (3, 2), }
    String dict = "{'descr': '" + NpyDescr(dtype) + "', 'fortran_order': False, 'shape': (";
    for (usize i = 0; i < shape.size(); ++i) {
        dict += std::to_string(shape[i]);
        if (shape.size() == 1 || i + 1 < shape.size()) {
            dict += ",";
        }
        if (i + 1 < shape.size()) {
            dict += " ";
        }
    }
    dict += "), }";

    // magic(6) + version(2) + header_len(2) + dict + padding + '\n'
    const usize prefix = 10;
    usize total = prefix + dict.size() + 1;
    const usize padding = (kNpyAlignment - total % kNpyAlignment) % kNpyAlignment;
    dict.append(padding, ' ');
    dict += '\n';

    const usize headerLen = dict.size();
    if (headerLen > std::numeric_limits<u16>::max()) {
        throw WriteError(ErrorCode::IOFailure, "NPY header too long");
    }

    Vector<u8> out;
    out.reserve(prefix + headerLen + bytes.size());
    const char magic[] = "\x93NUMPY";
    out.insert(out.end(), magic, magic + 6);
    out.push_back(1);  // major version
    out.push_back(0);  // minor version
    out.push_back(static_cast<u8>(headerLen & 0xff));
    out.push_back(static_cast<u8>((headerLen >> 8) & 0xff));
    out.insert(out.end(), dict.begin(), dict.end());
    out.insert(out.end(), bytes.begin(), bytes.end());
    return out;
}

void NpzArchive::Save(const std::filesystem::path& filepath) const {
    if (m_entries.size() > std::numeric_limits<u16>::max()) {
        throw WriteError(ErrorCode::IOFailure,
                         std::to_string(m_entries.size()) + " arrays exceed the ZIP member limit");
    }

    std::ofstream file(filepath, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw WriteError(ErrorCode::IOFailure, "cannot open " + filepath.string() + " for writing");
    }

    const auto [dosTime, dosDate] = DosDateTime();
    ByteWriter central;
    u64 offset = 0;

    for (const Entry& entry : m_entries) {
        const Vector<u8> npy = EncodeNpy(entry.dtype, entry.shape, entry.bytes);
        if (npy.size() > kZip32Limit) {
            throw WriteError(ErrorCode::IOFailure,
                             "array '" + entry.key + "' exceeds the 4 GiB ZIP member limit");
        }

        const u32 crc = Crc32(npy);
        const Vector<u8> compressed = Deflate(npy, m_compressionLevel);
        const String name = entry.key + ".npy";

        if (offset > kZip32Limit) {
            throw WriteError(ErrorCode::IOFailure, "archive exceeds the 4 GiB ZIP limit");
        }

        ByteWriter local;
        local.U32(kLocalHeaderSignature);
        local.U16(kZipVersion);
        local.U16(0);                                   // flags
        local.U16(kMethodDeflate);
        local.U16(dosTime);
        local.U16(dosDate);
        local.U32(crc);
        local.U32(static_cast<u32>(compressed.size()));
        local.U32(static_cast<u32>(npy.size()));
        local.U16(static_cast<u16>(name.size()));
        local.U16(0);                                   // extra field length
        local.Str(name);

        central.U32(kCentralHeaderSignature);
        central.U16(kZipVersion);                       // version made by
        central.U16(kZipVersion);                       // version needed
        central.U16(0);                                 // flags
        central.U16(kMethodDeflate);
        central.U16(dosTime);
        central.U16(dosDate);
        central.U32(crc);
        central.U32(static_cast<u32>(compressed.size()));
        central.U32(static_cast<u32>(npy.size()));
        central.U16(static_cast<u16>(name.size()));
        central.U16(0);                                 // extra field length
        central.U16(0);                                 // comment length
        central.U16(0);                                 // disk number start
        central.U16(0);                                 // internal attributes
        central.U32(0600u << 16);                       // external attributes (rw-------)
        central.U32(static_cast<u32>(offset));
        central.Str(name);

        WriteBytes(file, local.Bytes(), filepath);
        WriteBytes(file, compressed, filepath);
        offset += local.Bytes().size() + compressed.size();

        IMS_LOG_TRACE("NpzArchive: {} {} -> {} bytes", name, npy.size(), compressed.size());
    }

    if (offset > kZip32Limit) {
        throw WriteError(ErrorCode::IOFailure, "archive exceeds the 4 GiB ZIP limit");
    }

    ByteWriter end;
    end.U32(kEndOfCentralDirSignature);
    end.U16(0);                                         // this disk
    end.U16(0);                                         // disk with central directory
    end.U16(static_cast<u16>(m_entries.size()));
    end.U16(static_cast<u16>(m_entries.size()));
    end.U32(static_cast<u32>(central.Bytes().size()));
    end.U32(static_cast<u32>(offset));
    end.U16(0);                                         // comment length

    WriteBytes(file, central.Bytes(), filepath);
    WriteBytes(file, end.Bytes(), filepath);

    file.close();
    if (!file) {
        throw WriteError(ErrorCode::IOFailure, "failed to close " + filepath.string());
    }
}

// ============================================================================
// FileCrc32
// ============================================================================

u32 FileCrc32(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        throw WriteError(ErrorCode::IOFailure, "cannot open " + filepath.string());
    }

    uLong crc = crc32(0L, Z_NULL, 0);
    Vector<char> buffer(1 << 16);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize got = file.gcount();
        if (got > 0) {
            crc = crc32(crc, reinterpret_cast<const Bytef*>(buffer.data()), static_cast<uInt>(got));
        }
    }
    if (file.bad()) {
        throw WriteError(ErrorCode::IOFailure, "read failed: " + filepath.string());
    }
    return static_cast<u32>(crc);
}

} // namespace imseries
