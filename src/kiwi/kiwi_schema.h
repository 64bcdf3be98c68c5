/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fig2json::kiwi {

using TypeId = std::int32_t;
inline constexpr TypeId kNoTypeId = -1;

enum class BuiltinType : std::int32_t {
    Bool = -1,
    Byte = -2,
    Int = -3,
    UInt = -4,
    Float = -5,
    String = -6,
    Int64 = -7,
    UInt64 = -8,
    Double = -9,
    Bytes = -10,
};

inline constexpr std::int32_t kLowestBuiltinCode = -10;

enum class DefinitionKind : std::uint8_t {
    Enum = 0,
    Struct = 1,
    Message = 2,
};

// How a message field value is framed on the wire. Lets a reader skip tags it does not know.
enum class WireKind : std::uint8_t {
    Varint = 0,
    Fixed8 = 1,
    Fixed32 = 2,
    Fixed64 = 3,
    Length = 4,
};

inline constexpr std::uint8_t kFieldFlagArray = 0x01;
inline constexpr std::uint8_t kFieldFlagDeprecated = 0x02;

struct TypeRef {
    std::int32_t code = 0;
    bool is_array = false;

    bool is_builtin() const { return code < 0; }
    BuiltinType builtin() const { return static_cast<BuiltinType>(code); }
    TypeId type_id() const { return code; }

    static TypeRef of(BuiltinType t, bool array = false) {
        return TypeRef{static_cast<std::int32_t>(t), array};
    }
    static TypeRef of(TypeId id, bool array = false) { return TypeRef{id, array}; }

    bool operator==(const TypeRef& other) const {
        return code == other.code && is_array == other.is_array;
    }
};

struct FieldDef {
    std::string name;
    TypeRef type{};
    // Wire tag for message fields, numeric value for enum values, unused for struct fields.
    std::uint32_t value = 0;
    bool deprecated = false;
};

struct Definition {
    std::string name;
    DefinitionKind kind = DefinitionKind::Struct;
    std::vector<FieldDef> fields;

    const FieldDef* field_by_tag(std::uint32_t tag) const;
    const FieldDef* field_by_name(std::string_view field_name) const;
    const std::string* enum_name(std::uint32_t value) const;

   private:
    friend class Schema;
    void build_index();
    std::unordered_map<std::uint32_t, std::size_t> by_value_;
};

// Flat, index-addressed table of definitions. TypeId is the position in the table, so
// self-referencing and mutually recursive definitions need no pointers between them.
class Schema {
   public:
    Schema() = default;
    explicit Schema(std::vector<Definition> defs);

    std::size_t size() const { return defs_.size(); }
    bool empty() const { return defs_.empty(); }
    const std::vector<Definition>& definitions() const { return defs_; }

    bool contains(TypeId id) const {
        return id >= 0 && static_cast<std::size_t>(id) < defs_.size();
    }
    const Definition* find(TypeId id) const;
    std::optional<TypeId> find_by_name(std::string_view name) const;

    std::string type_name(const TypeRef& ref) const;

   private:
    std::vector<Definition> defs_;
    std::unordered_map<std::string, TypeId> by_name_;
};

std::string_view builtin_type_name(BuiltinType type);
bool is_known_builtin(std::int32_t code);
std::string_view definition_kind_name(DefinitionKind kind);
std::string_view wire_kind_name(WireKind kind);

// Wire kind a message field of this type must be framed with.
WireKind wire_kind_of(const Schema& schema, const TypeRef& ref);

// The fixed schema that describes schema blobs themselves.
const Schema& bootstrap_schema();
inline constexpr TypeId kBootstrapRootType = 0;

nlohmann::ordered_json schema_to_json(const Schema& schema);

}  // namespace fig2json::kiwi
