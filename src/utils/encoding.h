/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace fig2json::encoding {
std::string to_hex_lower(std::span<const std::uint8_t> bytes);
std::string to_base64(std::span<const std::uint8_t> bytes);
}  // namespace fig2json::encoding
