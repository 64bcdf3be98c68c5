/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include "zstd/zstd_api.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fig2json::fig {

enum class FileKind {
    Figma,
    FigJam,
};

std::string_view file_kind_name(FileKind kind);

struct ZipEntry {
    std::string name;
    std::uint16_t method = 0;
    std::uint32_t compressed_size = 0;
    std::uint32_t uncompressed_size = 0;
    std::uint32_t local_header_offset = 0;
};

struct FigArchive {
    FileKind kind = FileKind::Figma;
    std::uint32_t version = 0;
    std::vector<std::uint8_t> schema;
    std::vector<std::uint8_t> data;
    // Chunks after schema and data, left as stored.
    std::vector<std::vector<std::uint8_t>> extra_chunks;
    // Other ZIP entries (images, meta.json, thumbnail).
    std::vector<ZipEntry> assets;
};

struct ArchiveOptions {
    std::optional<std::filesystem::path> zstd_path;
    bool debug = false;
};

bool is_zip_container(std::span<const std::uint8_t> bytes);
FileKind detect_file_kind(std::span<const std::uint8_t> bytes);

std::vector<ZipEntry> list_zip_entries(std::span<const std::uint8_t> bytes);
std::vector<std::uint8_t> read_zip_entry(std::span<const std::uint8_t> bytes, const ZipEntry& entry);

// Splits a fig-kiwi payload into its length-prefixed chunks (stored form).
std::vector<std::vector<std::uint8_t>>
split_chunks(std::span<const std::uint8_t> bytes, std::uint32_t* version = nullptr);

std::vector<std::uint8_t> inflate_raw(std::span<const std::uint8_t> compressed);

// PNG/JPEG pass through; otherwise raw DEFLATE, then Zstandard.
std::vector<std::uint8_t>
decompress_chunk(std::span<const std::uint8_t> chunk, zstd::ZstdApi* zstd_api);

// Whole container: optional ZIP envelope, header, schema and data chunks decompressed.
FigArchive parse_fig_archive(std::span<const std::uint8_t> bytes, const ArchiveOptions& opt = {});

}  // namespace fig2json::fig
