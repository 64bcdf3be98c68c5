/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include <cstdarg>

namespace fig2json::log {
void info(const char* fmt, ...);
void error(const char* fmt, ...);
void set_debug(bool enabled);
bool debug_enabled();
void debug(const char* fmt, ...);
}  // namespace fig2json::log

#define FIG2JSON_LOG_INFO(fmt, ...) ::fig2json::log::info(fmt, ##__VA_ARGS__)
#define FIG2JSON_LOG_ERROR(fmt, ...) ::fig2json::log::error(fmt, ##__VA_ARGS__)
#define FIG2JSON_LOG_DEBUG(fmt, ...) ::fig2json::log::debug(fmt, ##__VA_ARGS__)
