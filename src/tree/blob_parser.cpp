/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "tree/blob_parser.h"

#include "kiwi/kiwi_byte_reader.h"
#include "utils/encoding.h"

#include <vector>

namespace fig2json::tree {
namespace {

using kiwi::ByteReader;
using kiwi::Value;

std::uint32_t read_u32(ByteReader& r) {
    const auto b = r.read_bytes(4);
    return static_cast<std::uint32_t>(b[0]) | (static_cast<std::uint32_t>(b[1]) << 8)
           | (static_cast<std::uint32_t>(b[2]) << 16) | (static_cast<std::uint32_t>(b[3]) << 24);
}

Value read_coord(ByteReader& r) {
    return Value::floating(static_cast<double>(r.read_f32()));
}

Value vertex_ref(std::uint32_t vertex, Value dx, Value dy) {
    kiwi::Fields f;
    f.push_back({"vertex", Value::integer(vertex)});
    f.push_back({"dx", std::move(dx)});
    f.push_back({"dy", std::move(dy)});
    return Value::record(kiwi::kNoTypeId, std::move(f));
}

}  // namespace

std::optional<Value> parse_commands(std::span<const std::uint8_t> bytes) {
    ByteReader r(bytes);
    kiwi::Array out;
    while (!r.at_end()) {
        const std::uint8_t cmd = r.read_byte();
        std::size_t coords = 0;
        const char* letter = nullptr;
        switch (cmd) {
            case 0:
                letter = "Z";
                break;
            case 1:
                letter = "M";
                coords = 2;
                break;
            case 2:
                letter = "L";
                coords = 2;
                break;
            case 3:
                letter = "Q";
                coords = 4;
                break;
            case 4:
                letter = "C";
                coords = 6;
                break;
            default:
                return std::nullopt;
        }
        if (r.remaining() < coords * 4) {
            return std::nullopt;
        }
        out.push_back(Value::string(letter));
        for (std::size_t i = 0; i < coords; i++) {
            out.push_back(read_coord(r));
        }
    }
    return Value::array(std::move(out));
}

std::optional<Value> parse_vector_network(std::span<const std::uint8_t> bytes) {
    if (bytes.size() < 12) {
        return std::nullopt;
    }
    ByteReader r(bytes);
    const std::uint32_t vertex_count = read_u32(r);
    const std::uint32_t segment_count = read_u32(r);
    const std::uint32_t region_count = read_u32(r);

    if (r.remaining() / 12 < vertex_count) {
        return std::nullopt;
    }
    kiwi::Array vertices;
    vertices.reserve(vertex_count);
    for (std::uint32_t i = 0; i < vertex_count; i++) {
        kiwi::Fields f;
        f.push_back({"styleID", Value::integer(read_u32(r))});
        f.push_back({"x", read_coord(r)});
        f.push_back({"y", read_coord(r)});
        vertices.push_back(Value::record(kiwi::kNoTypeId, std::move(f)));
    }

    if (r.remaining() / 28 < segment_count) {
        return std::nullopt;
    }
    kiwi::Array segments;
    segments.reserve(segment_count);
    for (std::uint32_t i = 0; i < segment_count; i++) {
        const std::uint32_t style = read_u32(r);
        const std::uint32_t start = read_u32(r);
        Value start_dx = read_coord(r);
        Value start_dy = read_coord(r);
        const std::uint32_t end = read_u32(r);
        Value end_dx = read_coord(r);
        Value end_dy = read_coord(r);
        if (start >= vertex_count || end >= vertex_count) {
            return std::nullopt;
        }
        kiwi::Fields f;
        f.push_back({"styleID", Value::integer(style)});
        f.push_back({"start", vertex_ref(start, std::move(start_dx), std::move(start_dy))});
        f.push_back({"end", vertex_ref(end, std::move(end_dx), std::move(end_dy))});
        segments.push_back(Value::record(kiwi::kNoTypeId, std::move(f)));
    }

    kiwi::Array regions;
    for (std::uint32_t i = 0; i < region_count; i++) {
        if (r.remaining() < 8) {
            return std::nullopt;
        }
        // Low bit is the winding rule, the rest the style id.
        const std::uint32_t style_and_rule = read_u32(r);
        const std::uint32_t loop_count = read_u32(r);
        kiwi::Array loops;
        for (std::uint32_t l = 0; l < loop_count; l++) {
            if (r.remaining() < 4) {
                return std::nullopt;
            }
            const std::uint32_t index_count = read_u32(r);
            if (r.remaining() / 4 < index_count) {
                return std::nullopt;
            }
            kiwi::Array indices;
            indices.reserve(index_count);
            for (std::uint32_t k = 0; k < index_count; k++) {
                const std::uint32_t seg = read_u32(r);
                if (seg >= segment_count) {
                    return std::nullopt;
                }
                indices.push_back(Value::integer(seg));
            }
            kiwi::Fields lf;
            lf.push_back({"segments", Value::array(std::move(indices))});
            loops.push_back(Value::record(kiwi::kNoTypeId, std::move(lf)));
        }
        kiwi::Fields f;
        f.push_back({"styleID", Value::integer(style_and_rule >> 1)});
        f.push_back({"windingRule", Value::string((style_and_rule & 1u) ? "NONZERO" : "ODD")});
        f.push_back({"loops", Value::array(std::move(loops))});
        regions.push_back(Value::record(kiwi::kNoTypeId, std::move(f)));
    }

    kiwi::Fields out;
    out.push_back({"vertices", Value::array(std::move(vertices))});
    out.push_back({"segments", Value::array(std::move(segments))});
    out.push_back({"regions", Value::array(std::move(regions))});
    return Value::record(kiwi::kNoTypeId, std::move(out));
}

std::optional<Value> parse_blob(std::string_view kind, std::span<const std::uint8_t> bytes) {
    if (kind == "commands") {
        return parse_commands(bytes);
    }
    if (kind == "vectorNetwork") {
        return parse_vector_network(bytes);
    }
    return std::nullopt;
}

std::optional<std::string> image_filename(const Value& hash) {
    std::vector<std::uint8_t> raw;
    if (hash.kind() == kiwi::ValueKind::Bytes) {
        raw = hash.as_bytes();
    } else if (hash.is_array()) {
        for (const auto& item : hash.as_array()) {
            if (item.kind() != kiwi::ValueKind::Int || item.as_int() < 0 || item.as_int() > 255) {
                return std::nullopt;
            }
            raw.push_back(static_cast<std::uint8_t>(item.as_int()));
        }
    } else {
        return std::nullopt;
    }
    if (raw.empty()) {
        return std::nullopt;
    }
    return "images/" + encoding::to_hex_lower(raw);
}

}  // namespace fig2json::tree
