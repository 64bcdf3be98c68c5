/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "fig/fig_archive.h"
#include "utils/log.h"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <limits>
#include <memory>
#include <stdexcept>

namespace fig2json::fig {
namespace {
constexpr std::size_t kMagicSize = 8;
constexpr std::size_t kHeaderSize = 12;
constexpr std::size_t kChunkHeaderSize = 4;
constexpr std::string_view kFigmaMagic = "fig-kiwi";
constexpr std::string_view kFigJamMagic = "fig-jam.";
constexpr std::string_view kCanvasEntry = "canvas.fig";

constexpr std::uint32_t kZipLocalSig = 0x04034b50u;
constexpr std::uint32_t kZipCentralSig = 0x02014b50u;
constexpr std::uint32_t kZipEndSig = 0x06054b50u;
constexpr std::size_t kZipEndSize = 22;
constexpr std::size_t kZipCentralSize = 46;
constexpr std::size_t kZipLocalSize = 30;
constexpr std::uint16_t kZipStored = 0;
constexpr std::uint16_t kZipDeflate = 8;

std::uint16_t read_u16_le(std::span<const std::uint8_t> s, std::size_t off) {
    return static_cast<std::uint16_t>(s[off] | (s[off + 1] << 8));
}

std::uint32_t read_u32_le(std::span<const std::uint8_t> s, std::size_t off) {
    return static_cast<std::uint32_t>(s[off]) | (static_cast<std::uint32_t>(s[off + 1]) << 8)
           | (static_cast<std::uint32_t>(s[off + 2]) << 16)
           | (static_cast<std::uint32_t>(s[off + 3]) << 24);
}

bool starts_with(std::span<const std::uint8_t> bytes, std::string_view magic) {
    return bytes.size() >= magic.size()
           && std::equal(magic.begin(), magic.end(), bytes.begin(), [](char a, std::uint8_t b) {
                  return static_cast<std::uint8_t>(a) == b;
              });
}

bool is_image(std::span<const std::uint8_t> bytes) {
    if (bytes.size() < 2) {
        return false;
    }
    return (bytes[0] == 0x89 && bytes[1] == 0x50) || (bytes[0] == 0xFF && bytes[1] == 0xD8);
}

std::size_t find_end_record(std::span<const std::uint8_t> bytes) {
    if (bytes.size() < kZipEndSize) {
        throw std::runtime_error(std::string("ZIP archive too small"));
    }
    // The end record sits in the last 22 + 65535 (max comment) bytes.
    const std::size_t lowest =
        bytes.size() > kZipEndSize + 0xFFFF ? bytes.size() - kZipEndSize - 0xFFFF : 0;
    for (std::size_t off = bytes.size() - kZipEndSize + 1; off-- > lowest;) {
        if (read_u32_le(bytes, off) == kZipEndSig) {
            return off;
        }
    }
    throw std::runtime_error(std::string("ZIP end of central directory not found"));
}

std::unique_ptr<zstd::ZstdApi> load_zstd(const ArchiveOptions& opt) {
    if (opt.zstd_path) {
        return zstd::ZstdApi::load(*opt.zstd_path);
    }
    return zstd::ZstdApi::try_load_default();
}
}  // namespace

std::string_view file_kind_name(FileKind kind) {
    return kind == FileKind::FigJam ? "figjam" : "figma";
}

bool is_zip_container(std::span<const std::uint8_t> bytes) {
    return bytes.size() >= 2 && bytes[0] == 'P' && bytes[1] == 'K';
}

FileKind detect_file_kind(std::span<const std::uint8_t> bytes) {
    if (bytes.size() < kMagicSize) {
        throw std::runtime_error(
            "File too small: expected at least " + std::to_string(kMagicSize) + " bytes, got "
            + std::to_string(bytes.size())
        );
    }
    if (starts_with(bytes, kFigmaMagic)) {
        return FileKind::Figma;
    }
    if (starts_with(bytes, kFigJamMagic)) {
        return FileKind::FigJam;
    }
    throw std::runtime_error(std::string("Not a fig file (bad magic)"));
}

std::vector<ZipEntry> list_zip_entries(std::span<const std::uint8_t> bytes) {
    const std::size_t end = find_end_record(bytes);
    const std::uint16_t count = read_u16_le(bytes, end + 10);
    const std::uint32_t dir_offset = read_u32_le(bytes, end + 16);
    if (dir_offset == 0xFFFFFFFFu) {
        throw std::runtime_error(std::string("ZIP64 archives are not supported"));
    }

    std::vector<ZipEntry> entries;
    entries.reserve(count);
    std::size_t off = dir_offset;
    for (std::uint16_t i = 0; i < count; i++) {
        if (off + kZipCentralSize > bytes.size() || read_u32_le(bytes, off) != kZipCentralSig) {
            throw std::runtime_error(
                "ZIP central directory entry " + std::to_string(i) + " is corrupt"
            );
        }
        ZipEntry e;
        e.method = read_u16_le(bytes, off + 10);
        e.compressed_size = read_u32_le(bytes, off + 20);
        e.uncompressed_size = read_u32_le(bytes, off + 24);
        const std::uint16_t name_len = read_u16_le(bytes, off + 28);
        const std::uint16_t extra_len = read_u16_le(bytes, off + 30);
        const std::uint16_t comment_len = read_u16_le(bytes, off + 32);
        e.local_header_offset = read_u32_le(bytes, off + 42);
        if (off + kZipCentralSize + name_len > bytes.size()) {
            throw std::runtime_error(std::string("ZIP entry name out of bounds"));
        }
        e.name.assign(
            reinterpret_cast<const char*>(bytes.data() + off + kZipCentralSize), name_len
        );
        entries.push_back(std::move(e));
        off += kZipCentralSize + name_len + extra_len + comment_len;
    }
    return entries;
}

std::vector<std::uint8_t> read_zip_entry(std::span<const std::uint8_t> bytes, const ZipEntry& entry) {
    const std::size_t off = entry.local_header_offset;
    if (off + kZipLocalSize > bytes.size() || read_u32_le(bytes, off) != kZipLocalSig) {
        throw std::runtime_error("ZIP local header for " + entry.name + " is corrupt");
    }
    const std::size_t data_off =
        off + kZipLocalSize + read_u16_le(bytes, off + 26) + read_u16_le(bytes, off + 28);
    if (data_off + entry.compressed_size > bytes.size()) {
        throw std::runtime_error("ZIP entry " + entry.name + " is truncated");
    }
    const auto payload = bytes.subspan(data_off, entry.compressed_size);

    if (entry.method == kZipStored) {
        return std::vector<std::uint8_t>(payload.begin(), payload.end());
    }
    if (entry.method == kZipDeflate) {
        auto out = inflate_raw(payload);
        if (out.size() != entry.uncompressed_size) {
            throw std::runtime_error("ZIP entry " + entry.name + " inflated to an unexpected size");
        }
        return out;
    }
    throw std::runtime_error(
        "ZIP entry " + entry.name + " uses unsupported method " + std::to_string(entry.method)
    );
}

std::vector<std::vector<std::uint8_t>>
split_chunks(std::span<const std::uint8_t> bytes, std::uint32_t* version) {
    if (bytes.size() < kHeaderSize) {
        throw std::runtime_error(
            "File too small: expected at least " + std::to_string(kHeaderSize) + " bytes, got "
            + std::to_string(bytes.size())
        );
    }
    if (version) {
        *version = read_u32_le(bytes, kMagicSize);
    }

    std::vector<std::vector<std::uint8_t>> chunks;
    std::size_t off = kHeaderSize;
    while (off + kChunkHeaderSize <= bytes.size()) {
        const std::size_t len = read_u32_le(bytes, off);
        off += kChunkHeaderSize;
        if (len > bytes.size() - off) {
            throw std::runtime_error(
                "Incomplete chunk at offset " + std::to_string(off - kChunkHeaderSize)
                + ": expected " + std::to_string(len) + " bytes, got "
                + std::to_string(bytes.size() - off)
            );
        }
        chunks.emplace_back(bytes.begin() + static_cast<std::ptrdiff_t>(off),
                            bytes.begin() + static_cast<std::ptrdiff_t>(off + len));
        off += len;
    }
    if (chunks.size() < 2) {
        throw std::runtime_error(
            "Not enough chunks: expected schema and data, got " + std::to_string(chunks.size())
        );
    }
    return chunks;
}

std::vector<std::uint8_t> inflate_raw(std::span<const std::uint8_t> compressed) {
    if (compressed.size() > std::numeric_limits<uInt>::max()) {
        throw std::runtime_error(std::string("DEFLATE input too large"));
    }
    z_stream zs{};
    if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
        throw std::runtime_error(std::string("inflateInit2 failed"));
    }
    zs.next_in = const_cast<Bytef*>(compressed.data());
    zs.avail_in = static_cast<uInt>(compressed.size());

    std::vector<std::uint8_t> out;
    std::array<std::uint8_t, 1 << 16> buf{};
    int rc = Z_OK;
    while (rc == Z_OK) {
        zs.next_out = buf.data();
        zs.avail_out = static_cast<uInt>(buf.size());
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            const std::string msg = zs.msg ? zs.msg : "code " + std::to_string(rc);
            inflateEnd(&zs);
            throw std::runtime_error("DEFLATE decompression failed: " + msg);
        }
        out.insert(out.end(), buf.data(), buf.data() + (buf.size() - zs.avail_out));
        if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            inflateEnd(&zs);
            throw std::runtime_error(std::string("DEFLATE stream is truncated"));
        }
    }
    inflateEnd(&zs);
    return out;
}

std::vector<std::uint8_t>
decompress_chunk(std::span<const std::uint8_t> chunk, zstd::ZstdApi* zstd_api) {
    if (is_image(chunk)) {
        return std::vector<std::uint8_t>(chunk.begin(), chunk.end());
    }
    std::string deflate_error;
    try {
        return inflate_raw(chunk);
    } catch (const std::runtime_error& ex) {
        deflate_error = ex.what();
    }
    if (!zstd::ZstdApi::has_frame_magic(chunk)) {
        throw std::runtime_error("Failed to decompress chunk: " + deflate_error);
    }
    if (!zstd_api) {
        throw std::runtime_error(
            std::string("Chunk is Zstandard compressed, but no zstd library is available")
        );
    }
    return zstd_api->decompress(chunk);
}

FigArchive parse_fig_archive(std::span<const std::uint8_t> bytes, const ArchiveOptions& opt) {
    FigArchive out;
    std::vector<std::uint8_t> canvas_storage;
    std::span<const std::uint8_t> canvas = bytes;

    if (is_zip_container(bytes)) {
        bool found = false;
        for (auto& entry : list_zip_entries(bytes)) {
            if (!found && entry.name == kCanvasEntry) {
                canvas_storage = read_zip_entry(bytes, entry);
                found = true;
            } else {
                out.assets.push_back(std::move(entry));
            }
        }
        if (!found) {
            throw std::runtime_error(std::string("canvas.fig not found in ZIP archive"));
        }
        canvas = canvas_storage;
        if (opt.debug) {
            FIG2JSON_LOG_DEBUG(
                "ZIP: canvas.fig %zu bytes, %zu assets", canvas.size(), out.assets.size()
            );
        }
    }

    out.kind = detect_file_kind(canvas);
    auto chunks = split_chunks(canvas, &out.version);

    std::unique_ptr<zstd::ZstdApi> zstd_api;
    const auto needs_zstd = [](const std::vector<std::uint8_t>& c) {
        return zstd::ZstdApi::has_frame_magic(c);
    };
    if (opt.zstd_path || std::any_of(chunks.begin(), chunks.begin() + 2, needs_zstd)) {
        zstd_api = load_zstd(opt);
    }

    out.schema = decompress_chunk(chunks[0], zstd_api.get());
    out.data = decompress_chunk(chunks[1], zstd_api.get());
    for (std::size_t i = 2; i < chunks.size(); i++) {
        out.extra_chunks.push_back(std::move(chunks[i]));
    }

    if (opt.debug) {
        FIG2JSON_LOG_DEBUG(
            "%s v%u: schema %zu bytes, data %zu bytes, %zu extra chunks",
            std::string(file_kind_name(out.kind)).c_str(), out.version, out.schema.size(),
            out.data.size(), out.extra_chunks.size()
        );
    }
    return out;
}

}  // namespace fig2json::fig
