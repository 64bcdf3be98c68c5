/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include "kiwi/kiwi_error.h"
#include "kiwi/kiwi_schema.h"
#include "kiwi/kiwi_value.h"

#include <cstdint>
#include <span>
#include <string_view>

namespace fig2json::kiwi {

struct DecodeOptions {
    // Retain fields whose tag the schema does not declare, as raw Bytes named "__unknown_<tag>".
    // Off by default: the decoded tree then only holds schema-known fields.
    bool keep_unknown_fields = false;
    // Fail with UnknownTag instead of skipping unknown fields.
    bool strict_unknown_tags = false;
    int max_depth = 1024;
    bool debug = false;
};

struct DecodeStats {
    std::size_t skipped_unknown_fields = 0;
    std::size_t preserved_enum_values = 0;
    std::size_t records = 0;
    std::size_t bytes_consumed = 0;
};

inline constexpr std::string_view kUnknownFieldPrefix = "__unknown_";

// Decodes `data` as one value of the root definition. Throws DecodeError.
Value decode_value(
    const Schema& schema,
    std::span<const std::uint8_t> data,
    TypeId root,
    const DecodeOptions& opt = {},
    DecodeStats* out_stats = nullptr
);

// Id of the struct or message definition named `name`; throws UnknownRootType otherwise.
TypeId find_root_type(const Schema& schema, std::string_view name = "Message");

}  // namespace fig2json::kiwi
