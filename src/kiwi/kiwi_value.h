/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include "kiwi/kiwi_schema.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fig2json::kiwi {

enum class ValueKind : std::uint8_t {
    Null = 0,
    Bool,
    Int,
    Float,
    String,
    Bytes,
    Array,
    Record,
};

std::string_view value_kind_name(ValueKind kind);

class Value;
struct Field;

using Bytes = std::vector<std::uint8_t>;
using Array = std::vector<Value>;
using Fields = std::vector<Field>;

struct Record {
    TypeId type_id = kNoTypeId;
    Fields fields;
};

// Decoded kiwi value. Owns its children; the variant index is the ValueKind.
class Value {
   public:
    Value() = default;

    static Value boolean(bool v);
    static Value integer(std::int64_t v);
    static Value floating(double v);
    static Value string(std::string v);
    static Value bytes(Bytes v);
    static Value array(Array v = {});
    static Value record(TypeId type_id = kNoTypeId, Fields fields = {});

    ValueKind kind() const { return static_cast<ValueKind>(storage_.index()); }
    bool is_null() const { return kind() == ValueKind::Null; }
    bool is_record() const { return kind() == ValueKind::Record; }
    bool is_array() const { return kind() == ValueKind::Array; }
    bool is_string() const { return kind() == ValueKind::String; }

    bool as_bool() const { return std::get<bool>(storage_); }
    std::int64_t as_int() const { return std::get<std::int64_t>(storage_); }
    double as_float() const { return std::get<double>(storage_); }
    const std::string& as_string() const { return std::get<std::string>(storage_); }
    const Bytes& as_bytes() const { return std::get<Bytes>(storage_); }
    const Array& as_array() const { return std::get<Array>(storage_); }
    Array& as_array() { return std::get<Array>(storage_); }
    const Record& as_record() const { return std::get<Record>(storage_); }
    Record& as_record() { return std::get<Record>(storage_); }

    // Numeric view of Int or Float values; false for every other kind.
    bool get_number(double& out) const;

    // Record helpers. find() on a non-record returns nullptr.
    const Value* find(std::string_view name) const;
    Value* find(std::string_view name);
    bool erase(std::string_view name);
    void set(std::string name, Value v);

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

   private:
    using Storage =
        std::variant<std::monostate, bool, std::int64_t, double, std::string, Bytes, Array, Record>;
    explicit Value(Storage s);

    Storage storage_;
};

struct Field {
    std::string name;
    Value value;

    bool operator==(const Field& other) const {
        return name == other.name && value == other.value;
    }
};

const Value* find_field(const Fields& fields, std::string_view name);
Value* find_field(Fields& fields, std::string_view name);
bool erase_field(Fields& fields, std::string_view name);
void set_field(Fields& fields, std::string name, Value v);

// Equality that ignores record type ids and record field order. Floats compare exactly,
// sign of zero included.
bool same_content(const Value& a, const Value& b);

}  // namespace fig2json::kiwi
