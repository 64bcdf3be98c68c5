/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include "kiwi/kiwi_value.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace fig2json::tree {

// Path command blob -> ["M", x, y, "L", x, y, "Q", cx, cy, x, y, "C", ..., "Z"].
std::optional<kiwi::Value> parse_commands(std::span<const std::uint8_t> bytes);

// Vector network blob -> {vertices, segments, regions}.
std::optional<kiwi::Value> parse_vector_network(std::span<const std::uint8_t> bytes);

// Dispatches on the blob field name without its "Blob" suffix. nullopt for unknown kinds and
// for data that does not parse.
std::optional<kiwi::Value> parse_blob(std::string_view kind, std::span<const std::uint8_t> bytes);

// "images/<hex>" for an image hash held as bytes or as an array of byte-sized integers.
std::optional<std::string> image_filename(const kiwi::Value& hash);

}  // namespace fig2json::tree
