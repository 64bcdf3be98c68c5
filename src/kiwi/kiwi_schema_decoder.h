/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include "kiwi/kiwi_error.h"
#include "kiwi/kiwi_schema.h"

#include <cstdint>
#include <span>
#include <vector>

namespace fig2json::kiwi {

// Decodes and validates a schema blob against the bootstrap schema. Every failure, including
// truncation, is reported as DecodeError{MalformedSchema}.
Schema decode_schema(std::span<const std::uint8_t> data, bool debug = false);

// Inverse of decode_schema.
std::vector<std::uint8_t> encode_schema(const Schema& schema);

}  // namespace fig2json::kiwi
