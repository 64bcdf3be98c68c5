/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include "kiwi/kiwi_value_decoder.h"
#include "tree/node_builder.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fig2json {

struct ConvertOptions {
    std::string root_type = "Message";
    bool want_transformed = true;
    bool want_raw = false;
    bool want_schema = false;
    bool keep_raw_extras = false;
    bool keep_ids = false;
    bool keep_unknown_fields = false;
    std::optional<std::filesystem::path> zstd_path;
    bool debug = false;
};

struct ConvertResult {
    // Null when the variant was not requested.
    nlohmann::ordered_json transformed;
    nlohmann::ordered_json raw;
    nlohmann::ordered_json schema;

    std::string file_kind;
    std::uint32_t version = 0;
    std::vector<std::string> assets;
    kiwi::DecodeStats decode_stats{};
    tree::BuildStats build_stats{};
};

class FigConverter {
   public:
    static ConvertResult
    ConvertFigFile(const std::filesystem::path& path, const ConvertOptions& opt = {});
    static ConvertResult ConvertFigBytes(
        std::span<const std::uint8_t> bytes,
        const ConvertOptions& opt = {},
        std::string_view label = {}
    );
    // Decodes once and emits every requested output variant from the same tree.
    static ConvertResult ConvertKiwiBlobs(
        std::span<const std::uint8_t> schema_bytes,
        std::span<const std::uint8_t> data_bytes,
        const ConvertOptions& opt = {},
        std::string_view label = {}
    );
};

}  // namespace fig2json
