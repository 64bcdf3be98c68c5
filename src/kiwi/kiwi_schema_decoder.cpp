/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "kiwi/kiwi_schema_decoder.h"

#include "kiwi/kiwi_byte_writer.h"
#include "kiwi/kiwi_error.h"
#include "kiwi/kiwi_value_decoder.h"
#include "utils/log.h"

#include <unordered_set>

namespace fig2json::kiwi {
namespace {

[[noreturn]] void malformed(const std::string& msg, const std::string& type_name = {}) {
    throw DecodeError(DecodeErrorKind::MalformedSchema, msg, 0, std::nullopt, type_name);
}

const Value& member(const Value& rec, std::string_view name) {
    const Value* v = rec.find(name);
    if (!v) {
        malformed("Bootstrap record is missing '" + std::string(name) + "'");
    }
    return *v;
}

FieldDef read_field(const Value& rec, const Definition& owner, std::size_t def_count) {
    FieldDef f;
    f.name = member(rec, "name").as_string();
    if (f.name.empty()) {
        malformed("Field with empty name", owner.name);
    }

    const std::int64_t flags = member(rec, "flags").as_int();
    if ((flags & ~static_cast<std::int64_t>(kFieldFlagArray | kFieldFlagDeprecated)) != 0) {
        malformed(
            "Field '" + f.name + "' has unknown flag bits " + std::to_string(flags), owner.name
        );
    }
    f.deprecated = (flags & kFieldFlagDeprecated) != 0;
    f.value = static_cast<std::uint32_t>(member(rec, "value").as_int());

    const auto code = static_cast<std::int32_t>(member(rec, "type").as_int());
    if (owner.kind != DefinitionKind::Enum) {
        if (code < 0 && !is_known_builtin(code)) {
            malformed(
                "Field '" + f.name + "' uses unknown builtin type code " + std::to_string(code),
                owner.name
            );
        }
        if (code >= 0 && static_cast<std::size_t>(code) >= def_count) {
            malformed(
                "Field '" + f.name + "' references missing definition #" + std::to_string(code),
                owner.name
            );
        }
    }
    f.type = TypeRef{code, (flags & kFieldFlagArray) != 0};
    return f;
}

void validate_fields(const Definition& def) {
    std::unordered_set<std::string> names;
    std::unordered_set<std::uint32_t> values;
    for (const auto& f : def.fields) {
        if (!names.insert(f.name).second) {
            malformed("Duplicate field name '" + f.name + "'", def.name);
        }
        if (def.kind == DefinitionKind::Struct) {
            continue;
        }
        if (!values.insert(f.value).second) {
            malformed(
                std::string(def.kind == DefinitionKind::Enum ? "Enum value " : "Field tag ")
                    + std::to_string(f.value) + " declared twice (at '" + f.name + "')",
                def.name
            );
        }
    }
}

}  // namespace

Schema decode_schema(std::span<const std::uint8_t> data, bool debug) {
    Value root;
    DecodeStats stats{};
    try {
        root = decode_value(bootstrap_schema(), data, kBootstrapRootType, DecodeOptions{}, &stats);
    } catch (const DecodeError& e) {
        throw DecodeError(
            DecodeErrorKind::MalformedSchema, e.message(), e.offset(), e.tag(), e.type_name()
        );
    }
    if (stats.bytes_consumed != data.size()) {
        throw DecodeError(
            DecodeErrorKind::MalformedSchema,
            std::to_string(data.size() - stats.bytes_consumed) + " trailing bytes after schema",
            stats.bytes_consumed
        );
    }

    const auto& items = member(root, "definitions").as_array();
    std::vector<Definition> defs;
    defs.reserve(items.size());
    std::unordered_set<std::string> def_names;

    for (const auto& item : items) {
        Definition def;
        def.name = member(item, "name").as_string();
        if (def.name.empty()) {
            malformed("Definition #" + std::to_string(defs.size()) + " has an empty name");
        }
        if (!def_names.insert(def.name).second) {
            malformed("Duplicate definition name '" + def.name + "'");
        }
        const std::int64_t kind = member(item, "kind").as_int();
        if (kind > static_cast<std::int64_t>(DefinitionKind::Message)) {
            malformed("Invalid definition kind " + std::to_string(kind), def.name);
        }
        def.kind = static_cast<DefinitionKind>(kind);

        const auto& fields = member(item, "fields").as_array();
        def.fields.reserve(fields.size());
        for (const auto& f : fields) {
            def.fields.push_back(read_field(f, def, items.size()));
        }
        validate_fields(def);
        defs.push_back(std::move(def));
    }

    if (debug) {
        FIG2JSON_LOG_DEBUG("Schema: %zu definitions, %zu bytes", defs.size(), data.size());
    }
    return Schema(std::move(defs));
}

std::vector<std::uint8_t> encode_schema(const Schema& schema) {
    ByteWriter w;
    w.write_varuint(schema.size());
    for (const auto& def : schema.definitions()) {
        w.write_string(def.name);
        w.write_byte(static_cast<std::uint8_t>(def.kind));
        w.write_varuint(def.fields.size());
        for (const auto& f : def.fields) {
            std::uint8_t flags = 0;
            if (f.type.is_array) {
                flags |= kFieldFlagArray;
            }
            if (f.deprecated) {
                flags |= kFieldFlagDeprecated;
            }
            w.write_string(f.name);
            w.write_varint(f.type.code);
            w.write_byte(flags);
            w.write_varuint(f.value);
        }
    }
    return w.to_bytes();
}

}  // namespace fig2json::kiwi
