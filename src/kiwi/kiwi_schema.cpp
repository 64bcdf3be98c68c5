/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "kiwi/kiwi_schema.h"

#include <array>

namespace fig2json::kiwi {

const FieldDef* Definition::field_by_tag(std::uint32_t tag) const {
    if (!by_value_.empty() || fields.empty()) {
        auto it = by_value_.find(tag);
        return it == by_value_.end() ? nullptr : &fields[it->second];
    }
    for (const auto& f : fields) {
        if (f.value == tag) {
            return &f;
        }
    }
    return nullptr;
}

const FieldDef* Definition::field_by_name(std::string_view field_name) const {
    for (const auto& f : fields) {
        if (f.name == field_name) {
            return &f;
        }
    }
    return nullptr;
}

const std::string* Definition::enum_name(std::uint32_t value) const {
    if (kind != DefinitionKind::Enum) {
        return nullptr;
    }
    const FieldDef* f = field_by_tag(value);
    return f ? &f->name : nullptr;
}

void Definition::build_index() {
    by_value_.clear();
    if (kind == DefinitionKind::Struct) {
        return;
    }
    by_value_.reserve(fields.size());
    for (std::size_t i = 0; i < fields.size(); i++) {
        by_value_.emplace(fields[i].value, i);
    }
}

Schema::Schema(std::vector<Definition> defs) : defs_(std::move(defs)) {
    by_name_.reserve(defs_.size());
    for (std::size_t i = 0; i < defs_.size(); i++) {
        defs_[i].build_index();
        by_name_.emplace(defs_[i].name, static_cast<TypeId>(i));
    }
}

const Definition* Schema::find(TypeId id) const {
    if (!contains(id)) {
        return nullptr;
    }
    return &defs_[static_cast<std::size_t>(id)];
}

std::optional<TypeId> Schema::find_by_name(std::string_view name) const {
    auto it = by_name_.find(std::string(name));
    if (it == by_name_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Schema::type_name(const TypeRef& ref) const {
    std::string out;
    if (ref.is_builtin()) {
        out = std::string(builtin_type_name(ref.builtin()));
    } else if (const Definition* def = find(ref.type_id())) {
        out = def->name;
    } else {
        out = "#" + std::to_string(ref.type_id());
    }
    if (ref.is_array) {
        out += "[]";
    }
    return out;
}

std::string_view builtin_type_name(BuiltinType type) {
    switch (type) {
        case BuiltinType::Bool:
            return "bool";
        case BuiltinType::Byte:
            return "byte";
        case BuiltinType::Int:
            return "int";
        case BuiltinType::UInt:
            return "uint";
        case BuiltinType::Float:
            return "float";
        case BuiltinType::String:
            return "string";
        case BuiltinType::Int64:
            return "int64";
        case BuiltinType::UInt64:
            return "uint64";
        case BuiltinType::Double:
            return "double";
        case BuiltinType::Bytes:
            return "bytes";
    }
    return "?";
}

bool is_known_builtin(std::int32_t code) {
    return code < 0 && code >= kLowestBuiltinCode;
}

std::string_view definition_kind_name(DefinitionKind kind) {
    switch (kind) {
        case DefinitionKind::Enum:
            return "enum";
        case DefinitionKind::Struct:
            return "struct";
        case DefinitionKind::Message:
            return "message";
    }
    return "?";
}

std::string_view wire_kind_name(WireKind kind) {
    switch (kind) {
        case WireKind::Varint:
            return "varint";
        case WireKind::Fixed8:
            return "fixed8";
        case WireKind::Fixed32:
            return "fixed32";
        case WireKind::Fixed64:
            return "fixed64";
        case WireKind::Length:
            return "length";
    }
    return "?";
}

WireKind wire_kind_of(const Schema& schema, const TypeRef& ref) {
    if (ref.is_array) {
        return WireKind::Length;
    }
    if (!ref.is_builtin()) {
        const Definition* def = schema.find(ref.type_id());
        if (def && def->kind == DefinitionKind::Enum) {
            return WireKind::Varint;
        }
        return WireKind::Length;
    }
    switch (ref.builtin()) {
        case BuiltinType::Bool:
        case BuiltinType::Byte:
            return WireKind::Fixed8;
        case BuiltinType::Int:
        case BuiltinType::UInt:
        case BuiltinType::Int64:
        case BuiltinType::UInt64:
            return WireKind::Varint;
        case BuiltinType::Float:
            return WireKind::Fixed32;
        case BuiltinType::Double:
            return WireKind::Fixed64;
        case BuiltinType::String:
        case BuiltinType::Bytes:
            return WireKind::Length;
    }
    return WireKind::Length;
}

namespace {
struct BootstrapField {
    const char* name;
    std::int32_t type;
    bool is_array;
};

struct BootstrapDef {
    const char* name;
    const BootstrapField* fields;
    std::size_t field_count;
};

// struct Schema     { Definition[] definitions; }
// struct Definition { string name; byte kind; Field[] fields; }
// struct Field      { string name; int type; byte flags; uint value; }
constexpr std::array<BootstrapField, 1> kSchemaFields{{
    {"definitions", 1, true},
}};
constexpr std::array<BootstrapField, 3> kDefinitionFields{{
    {"name", static_cast<std::int32_t>(BuiltinType::String), false},
    {"kind", static_cast<std::int32_t>(BuiltinType::Byte), false},
    {"fields", 2, true},
}};
constexpr std::array<BootstrapField, 4> kFieldFields{{
    {"name", static_cast<std::int32_t>(BuiltinType::String), false},
    {"type", static_cast<std::int32_t>(BuiltinType::Int), false},
    {"flags", static_cast<std::int32_t>(BuiltinType::Byte), false},
    {"value", static_cast<std::int32_t>(BuiltinType::UInt), false},
}};
constexpr std::array<BootstrapDef, 3> kBootstrapDefs{{
    {"Schema", kSchemaFields.data(), kSchemaFields.size()},
    {"Definition", kDefinitionFields.data(), kDefinitionFields.size()},
    {"Field", kFieldFields.data(), kFieldFields.size()},
}};

Schema materialize_bootstrap() {
    std::vector<Definition> defs;
    defs.reserve(kBootstrapDefs.size());
    for (const auto& bd : kBootstrapDefs) {
        Definition def;
        def.name = bd.name;
        def.kind = DefinitionKind::Struct;
        for (std::size_t i = 0; i < bd.field_count; i++) {
            FieldDef f;
            f.name = bd.fields[i].name;
            f.type = TypeRef{bd.fields[i].type, bd.fields[i].is_array};
            f.value = static_cast<std::uint32_t>(i);
            def.fields.push_back(std::move(f));
        }
        defs.push_back(std::move(def));
    }
    return Schema(std::move(defs));
}
}  // namespace

const Schema& bootstrap_schema() {
    static const Schema schema = materialize_bootstrap();
    return schema;
}

nlohmann::ordered_json schema_to_json(const Schema& schema) {
    nlohmann::ordered_json defs = nlohmann::ordered_json::array();
    for (std::size_t i = 0; i < schema.size(); i++) {
        const auto& def = schema.definitions()[i];
        nlohmann::ordered_json d = nlohmann::ordered_json::object();
        d["id"] = i;
        d["name"] = def.name;
        d["kind"] = std::string(definition_kind_name(def.kind));
        nlohmann::ordered_json fields = nlohmann::ordered_json::array();
        for (const auto& f : def.fields) {
            nlohmann::ordered_json fj = nlohmann::ordered_json::object();
            fj["name"] = f.name;
            if (def.kind != DefinitionKind::Enum) {
                fj["type"] = schema.type_name(f.type);
            }
            if (def.kind != DefinitionKind::Struct) {
                fj["value"] = f.value;
            }
            if (f.deprecated) {
                fj["deprecated"] = true;
            }
            fields.push_back(std::move(fj));
        }
        d["fields"] = std::move(fields);
        defs.push_back(std::move(d));
    }
    return defs;
}

}  // namespace fig2json::kiwi
