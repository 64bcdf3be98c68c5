/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "fs_utils.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <system_error>

#if defined(_WIN32)
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace fig2json::fs_utils {
namespace {
bool extension_is(const fs::path& path, std::string_view ext) {
    const std::string actual = path.extension().string();
    return actual.size() == ext.size()
           && std::equal(actual.begin(), actual.end(), ext.begin(), [](char a, char b) {
                  return std::tolower(static_cast<unsigned char>(a)) == b;
              });
}

bool escapes(const fs::path& rel) {
    return rel.empty() || *rel.begin() == "..";
}
}  // namespace

bool is_fig_file(const fs::path& path) {
    return extension_is(path, ".fig");
}

fs::path executable_dir() {
#if defined(_WIN32)
    std::wstring buf(32768, L'\0');
    const DWORD n = ::GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
    if (n == 0 || n >= buf.size()) {
        return fs::current_path();
    }
    buf.resize(n);
    return fs::path(buf).parent_path();
#else
    std::array<char, 4096> buf{};
    const ssize_t n = ::readlink("/proc/self/exe", buf.data(), buf.size() - 1);
    if (n <= 0) {
        return fs::current_path();
    }
    return fs::path(std::string(buf.data(), static_cast<std::size_t>(n))).parent_path();
#endif
}

std::vector<fs::path> collect_inputs(const fs::path& root) {
    std::vector<fs::path> out;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw std::runtime_error("Cannot scan " + root.string() + ": " + ec.message());
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw std::runtime_error("Cannot scan " + root.string() + ": " + ec.message());
        }
        if (it->is_regular_file(ec) && is_fig_file(it->path())) {
            out.push_back(it->path());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

fs::path output_path(
    const fs::path& out_dir,
    const fs::path& input,
    const fs::path& input_root,
    std::string_view suffix
) {
    fs::path dir = out_dir;
    if (!input_root.empty()) {
        const fs::path rel = input.parent_path().lexically_relative(input_root);
        if (!escapes(rel) && rel != ".") {
            dir /= rel;
        }
    }
    return dir / (input.stem().string() + std::string(suffix));
}

std::vector<std::uint8_t> read_file(const fs::path& path) {
    std::error_code ec;
    const std::uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Cannot read " + path.string() + ": " + ec.message());
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error("Cannot open " + path.string());
    }
    std::vector<std::uint8_t> buf(static_cast<std::size_t>(size));
    if (!buf.empty()
        && !f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()))) {
        throw std::runtime_error("Short read from " + path.string());
    }
    return buf;
}

void write_file(const fs::path& path, std::span<const std::uint8_t> bytes) {
    ensure_dir(path.parent_path());
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) {
        throw std::runtime_error("Cannot open " + path.string() + " for writing");
    }
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!f) {
        throw std::runtime_error("Write to " + path.string() + " failed");
    }
}

void write_text_file(const fs::path& path, std::string_view text) {
    write_file(path, {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()});
}

void ensure_dir(const fs::path& dir) {
    if (dir.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create directory " + dir.string() + ": " + ec.message());
    }
}

std::string display_path(const fs::path& path, const fs::path& base_dir) {
    if (base_dir.empty()) {
        return path.string();
    }
    std::error_code ec;
    const fs::path abs_base = fs::weakly_canonical(base_dir, ec);
    const fs::path abs_path = ec ? path : fs::weakly_canonical(path, ec);
    if (ec) {
        return path.string();
    }
    const fs::path rel = abs_path.lexically_relative(abs_base);
    return escapes(rel) ? abs_path.string() : rel.string();
}
}  // namespace fig2json::fs_utils
