/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "log.h"
#include <atomic>
#include <cstdio>

static std::atomic<bool> g_debug{false};

static void vprint(FILE* f, const char* prefix, const char* fmt, va_list args) {
    std::fputs(prefix, f);
    std::vfprintf(f, fmt, args);
    std::fputc('\n', f);
    std::fflush(f);
}

namespace fig2json::log {
void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stdout, "", fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stderr, "[ERROR] ", fmt, args);
    va_end(args);
}

void set_debug(bool enabled) {
    g_debug.store(enabled);
}

bool debug_enabled() {
    return g_debug.load();
}

void debug(const char* fmt, ...) {
    if (!g_debug.load()) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    vprint(stdout, "[DEBUG] ", fmt, args);
    va_end(args);
}
}  // namespace fig2json::log
