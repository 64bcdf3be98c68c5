/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fig2json::fs_utils {
std::filesystem::path executable_dir();
bool is_fig_file(const std::filesystem::path& path);
// Every .fig file below root, sorted.
std::vector<std::filesystem::path> collect_inputs(const std::filesystem::path& root);

// <out_dir>/<dirs of input below input_root>/<input stem><suffix>. An empty input_root puts
// the file directly into out_dir.
std::filesystem::path output_path(
    const std::filesystem::path& out_dir,
    const std::filesystem::path& input,
    const std::filesystem::path& input_root,
    std::string_view suffix
);

std::vector<std::uint8_t> read_file(const std::filesystem::path& path);
void write_file(const std::filesystem::path& path, std::span<const std::uint8_t> bytes);
void write_text_file(const std::filesystem::path& path, std::string_view text);
void ensure_dir(const std::filesystem::path& dir);
std::string display_path(const std::filesystem::path& path, const std::filesystem::path& base_dir);
}  // namespace fig2json::fs_utils
