/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>

namespace fig2json::zstd {
// Zstandard decompressor resolved from the shared library at run time.
class ZstdApi {
   public:
    static std::filesystem::path default_library_path();
    static std::unique_ptr<ZstdApi> try_load_default();
    static std::unique_ptr<ZstdApi> load(const std::filesystem::path& lib_path);

    ~ZstdApi();
    ZstdApi(const ZstdApi&) = delete;
    ZstdApi& operator=(const ZstdApi&) = delete;

    // Decompresses every frame in `compressed`.
    std::vector<std::uint8_t> decompress(std::span<const std::uint8_t> compressed);

    static bool has_frame_magic(std::span<const std::uint8_t> bytes);

   private:
    ZstdApi(
        void* handle,
        void* decompress_fn,
        void* frame_content_size_fn,
        void* is_error_fn,
        void* error_name_fn,
        void* create_dctx_fn,
        void* free_dctx_fn,
        void* decompress_stream_fn
    );

    std::vector<std::uint8_t> decompress_streaming(std::span<const std::uint8_t> compressed);
    [[noreturn]] void fail(const char* what, std::size_t code) const;

    void* handle_ = nullptr;
    void* decompress_fn_ = nullptr;
    void* frame_content_size_fn_ = nullptr;
    void* is_error_fn_ = nullptr;
    void* error_name_fn_ = nullptr;
    void* create_dctx_fn_ = nullptr;
    void* free_dctx_fn_ = nullptr;
    void* decompress_stream_fn_ = nullptr;
};
}  // namespace fig2json::zstd
