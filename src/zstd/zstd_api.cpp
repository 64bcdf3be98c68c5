/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "zstd/zstd_api.h"
#include "utils/log.h"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

#include <zstd.h>

#if defined(_WIN32)
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace fs = std::filesystem;

namespace fig2json::zstd {
namespace {
#if defined(_WIN32)
void* load_library_handle(const fs::path& p) {
    const std::wstring w = p.wstring();
    HMODULE m = ::LoadLibraryW(w.c_str());
    return reinterpret_cast<void*>(m);
}

void unload_library_handle(void* h) {
    if (!h) {
        return;
    }
    ::FreeLibrary(reinterpret_cast<HMODULE>(h));
}

void* get_export(void* h, const char* name) {
    if (!h) {
        return nullptr;
    }
    FARPROC p = ::GetProcAddress(reinterpret_cast<HMODULE>(h), name);
    return reinterpret_cast<void*>(p);
}
#else
void* load_library_handle(const fs::path& p) {
    return ::dlopen(p.string().c_str(), RTLD_NOW);
}

void unload_library_handle(void* h) {
    if (!h) {
        return;
    }
    ::dlclose(h);
}

void* get_export(void* h, const char* name) {
    if (!h) {
        return nullptr;
    }
    return ::dlsym(h, name);
}
#endif

template <typename Fn>
Fn require_export(void* h, const char* name) {
    void* p = get_export(h, name);
    if (!p) {
        throw std::runtime_error(std::string("Missing zstd export: ") + name);
    }
    return reinterpret_cast<Fn>(p);
}

template <typename Fn>
Fn optional_export(void* h, const char* name) {
    void* p = get_export(h, name);
    return reinterpret_cast<Fn>(p);
}

// Signatures come from the SDK header; the symbols themselves are resolved from the loaded library.
using ZSTD_decompressFn = decltype(&ZSTD_decompress);
using ZSTD_getFrameContentSizeFn = decltype(&ZSTD_getFrameContentSize);
using ZSTD_isErrorFn = decltype(&ZSTD_isError);
using ZSTD_getErrorNameFn = decltype(&ZSTD_getErrorName);
using ZSTD_createDCtxFn = decltype(&ZSTD_createDCtx);
using ZSTD_freeDCtxFn = decltype(&ZSTD_freeDCtx);
using ZSTD_decompressStreamFn = decltype(&ZSTD_decompressStream);

constexpr std::size_t kStreamChunk = 1u << 17;
// Upper bound for a single declared frame size; larger claims go through the streaming path.
constexpr unsigned long long kMaxDeclaredSize = 1ULL << 31;
constexpr std::array<std::uint8_t, 4> kFrameMagic{0x28, 0xB5, 0x2F, 0xFD};
}  // namespace

fs::path ZstdApi::default_library_path() {
#if defined(_WIN32)
    return fs::path("zstd.dll");
#elif defined(__APPLE__)
    return fs::path("libzstd.1.dylib");
#else
    return fs::path("libzstd.so.1");
#endif
}

std::unique_ptr<ZstdApi> ZstdApi::try_load_default() {
    const fs::path cand = default_library_path();
    try {
        return ZstdApi::load(cand);
    } catch (const std::exception& ex) {
        FIG2JSON_LOG_DEBUG("zstd not available (%s): %s", cand.string().c_str(), ex.what());
        return nullptr;
    }
}

std::unique_ptr<ZstdApi> ZstdApi::load(const fs::path& lib_path) {
    void* h = load_library_handle(lib_path);
    if (!h) {
        throw std::runtime_error(std::string("Failed to load zstd library: ") + lib_path.string());
    }
    try {
        auto* decompress = require_export<void*>(h, "ZSTD_decompress");
        auto* content_size = require_export<void*>(h, "ZSTD_getFrameContentSize");
        auto* is_error = require_export<void*>(h, "ZSTD_isError");

        void* error_name = optional_export<void*>(h, "ZSTD_getErrorName");
        void* create_dctx = optional_export<void*>(h, "ZSTD_createDCtx");
        void* free_dctx = optional_export<void*>(h, "ZSTD_freeDCtx");
        void* decompress_stream = optional_export<void*>(h, "ZSTD_decompressStream");

        return std::unique_ptr<ZstdApi>(new ZstdApi(
            h, decompress, content_size, is_error, error_name, create_dctx, free_dctx,
            decompress_stream
        ));
    } catch (const std::exception&) {
        unload_library_handle(h);
        throw;
    }
}

ZstdApi::ZstdApi(
    void* handle,
    void* decompress_fn,
    void* frame_content_size_fn,
    void* is_error_fn,
    void* error_name_fn,
    void* create_dctx_fn,
    void* free_dctx_fn,
    void* decompress_stream_fn
)
    : handle_(handle),
      decompress_fn_(decompress_fn),
      frame_content_size_fn_(frame_content_size_fn),
      is_error_fn_(is_error_fn),
      error_name_fn_(error_name_fn),
      create_dctx_fn_(create_dctx_fn),
      free_dctx_fn_(free_dctx_fn),
      decompress_stream_fn_(decompress_stream_fn) {}

ZstdApi::~ZstdApi() {
    unload_library_handle(handle_);
    handle_ = nullptr;
}

bool ZstdApi::has_frame_magic(std::span<const std::uint8_t> bytes) {
    return bytes.size() >= kFrameMagic.size()
           && std::equal(kFrameMagic.begin(), kFrameMagic.end(), bytes.begin());
}

void ZstdApi::fail(const char* what, std::size_t code) const {
    std::string reason = "error " + std::to_string(code);
    if (error_name_fn_) {
        reason = reinterpret_cast<ZSTD_getErrorNameFn>(error_name_fn_)(code);
    }
    throw std::runtime_error(std::string(what) + ": " + reason);
}

std::vector<std::uint8_t> ZstdApi::decompress(std::span<const std::uint8_t> compressed) {
    if (compressed.empty()) {
        throw std::runtime_error(std::string("zstd decompress: compressed buffer is empty"));
    }

    auto content_size = reinterpret_cast<ZSTD_getFrameContentSizeFn>(frame_content_size_fn_);
    const unsigned long long declared = content_size(compressed.data(), compressed.size());
    if (declared == ZSTD_CONTENTSIZE_ERROR) {
        throw std::runtime_error(std::string("zstd decompress: not a zstd frame"));
    }
    if (declared == ZSTD_CONTENTSIZE_UNKNOWN || declared > kMaxDeclaredSize) {
        return decompress_streaming(compressed);
    }

    std::vector<std::uint8_t> out(static_cast<std::size_t>(declared));
    auto fn = reinterpret_cast<ZSTD_decompressFn>(decompress_fn_);
    auto is_error = reinterpret_cast<ZSTD_isErrorFn>(is_error_fn_);
    const std::size_t res = fn(out.data(), out.size(), compressed.data(), compressed.size());
    if (is_error(res)) {
        // Concatenated frames report only the first frame's size.
        if (create_dctx_fn_ && decompress_stream_fn_) {
            return decompress_streaming(compressed);
        }
        fail("ZSTD_decompress failed", res);
    }
    out.resize(res);
    return out;
}

std::vector<std::uint8_t> ZstdApi::decompress_streaming(std::span<const std::uint8_t> compressed) {
    if (!create_dctx_fn_ || !free_dctx_fn_ || !decompress_stream_fn_) {
        throw std::runtime_error(
            std::string("zstd frame has no content size and the library lacks the streaming API")
        );
    }
    auto create = reinterpret_cast<ZSTD_createDCtxFn>(create_dctx_fn_);
    auto release = reinterpret_cast<ZSTD_freeDCtxFn>(free_dctx_fn_);
    auto step = reinterpret_cast<ZSTD_decompressStreamFn>(decompress_stream_fn_);
    auto is_error = reinterpret_cast<ZSTD_isErrorFn>(is_error_fn_);

    std::unique_ptr<ZSTD_DCtx, ZSTD_freeDCtxFn> dctx(create(), release);
    if (!dctx) {
        throw std::runtime_error(std::string("ZSTD_createDCtx failed"));
    }

    std::vector<std::uint8_t> out;
    ZSTD_inBuffer in{compressed.data(), compressed.size(), 0};
    // Non-zero while the decoder still holds data or expects more input.
    std::size_t pending = 1;
    while (in.pos < in.size || pending != 0) {
        const std::size_t in_before = in.pos;
        const std::size_t start = out.size();
        out.resize(start + kStreamChunk);
        ZSTD_outBuffer ob{out.data() + start, kStreamChunk, 0};
        pending = step(dctx.get(), &ob, &in);
        out.resize(start + ob.pos);
        if (is_error(pending)) {
            fail("ZSTD_decompressStream failed", pending);
        }
        if (ob.pos == 0 && in.pos == in_before) {
            throw std::runtime_error(std::string("zstd stream is truncated"));
        }
    }
    return out;
}
}  // namespace fig2json::zstd
