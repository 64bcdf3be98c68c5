/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "kiwi/kiwi_value.h"

#include <algorithm>
#include <cmath>

namespace fig2json::kiwi {

std::string_view value_kind_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null:
            return "null";
        case ValueKind::Bool:
            return "bool";
        case ValueKind::Int:
            return "int";
        case ValueKind::Float:
            return "float";
        case ValueKind::String:
            return "string";
        case ValueKind::Bytes:
            return "bytes";
        case ValueKind::Array:
            return "array";
        case ValueKind::Record:
            return "record";
    }
    return "?";
}

Value::Value(Storage s) : storage_(std::move(s)) {}

Value Value::boolean(bool v) {
    return Value(Storage(std::in_place_type<bool>, v));
}

Value Value::integer(std::int64_t v) {
    return Value(Storage(std::in_place_type<std::int64_t>, v));
}

Value Value::floating(double v) {
    return Value(Storage(std::in_place_type<double>, v));
}

Value Value::string(std::string v) {
    return Value(Storage(std::in_place_type<std::string>, std::move(v)));
}

Value Value::bytes(Bytes v) {
    return Value(Storage(std::in_place_type<Bytes>, std::move(v)));
}

Value Value::array(Array v) {
    return Value(Storage(std::in_place_type<Array>, std::move(v)));
}

Value Value::record(TypeId type_id, Fields fields) {
    return Value(Storage(std::in_place_type<Record>, Record{type_id, std::move(fields)}));
}

bool Value::get_number(double& out) const {
    switch (kind()) {
        case ValueKind::Int:
            out = static_cast<double>(as_int());
            return true;
        case ValueKind::Float:
            out = as_float();
            return true;
        default:
            return false;
    }
}

const Value* Value::find(std::string_view name) const {
    if (!is_record()) {
        return nullptr;
    }
    return find_field(as_record().fields, name);
}

Value* Value::find(std::string_view name) {
    if (!is_record()) {
        return nullptr;
    }
    return find_field(as_record().fields, name);
}

bool Value::erase(std::string_view name) {
    if (!is_record()) {
        return false;
    }
    return erase_field(as_record().fields, name);
}

void Value::set(std::string name, Value v) {
    if (!is_record()) {
        *this = Value::record();
    }
    set_field(as_record().fields, std::move(name), std::move(v));
}

bool Value::operator==(const Value& other) const {
    if (kind() != other.kind()) {
        return false;
    }
    switch (kind()) {
        case ValueKind::Null:
            return true;
        case ValueKind::Bool:
            return as_bool() == other.as_bool();
        case ValueKind::Int:
            return as_int() == other.as_int();
        case ValueKind::Float:
            return as_float() == other.as_float();
        case ValueKind::String:
            return as_string() == other.as_string();
        case ValueKind::Bytes:
            return as_bytes() == other.as_bytes();
        case ValueKind::Array:
            return as_array() == other.as_array();
        case ValueKind::Record:
            return as_record().type_id == other.as_record().type_id
                   && as_record().fields == other.as_record().fields;
    }
    return false;
}

const Value* find_field(const Fields& fields, std::string_view name) {
    for (const auto& f : fields) {
        if (f.name == name) {
            return &f.value;
        }
    }
    return nullptr;
}

Value* find_field(Fields& fields, std::string_view name) {
    for (auto& f : fields) {
        if (f.name == name) {
            return &f.value;
        }
    }
    return nullptr;
}

bool erase_field(Fields& fields, std::string_view name) {
    auto it = std::find_if(fields.begin(), fields.end(), [&](const Field& f) {
        return f.name == name;
    });
    if (it == fields.end()) {
        return false;
    }
    fields.erase(it);
    return true;
}

void set_field(Fields& fields, std::string name, Value v) {
    if (Value* existing = find_field(fields, name)) {
        *existing = std::move(v);
        return;
    }
    fields.push_back(Field{std::move(name), std::move(v)});
}

bool same_content(const Value& a, const Value& b) {
    if (a.kind() != b.kind()) {
        return false;
    }
    switch (a.kind()) {
        case ValueKind::Array: {
            const auto& xa = a.as_array();
            const auto& xb = b.as_array();
            if (xa.size() != xb.size()) {
                return false;
            }
            for (std::size_t i = 0; i < xa.size(); i++) {
                if (!same_content(xa[i], xb[i])) {
                    return false;
                }
            }
            return true;
        }
        case ValueKind::Record: {
            const auto& fa = a.as_record().fields;
            const auto& fb = b.as_record().fields;
            if (fa.size() != fb.size()) {
                return false;
            }
            for (const auto& f : fa) {
                const Value* other = find_field(fb, f.name);
                if (!other || !same_content(f.value, *other)) {
                    return false;
                }
            }
            return true;
        }
        case ValueKind::Float:
            return a.as_float() == b.as_float()
                   && std::signbit(a.as_float()) == std::signbit(b.as_float());
        default:
            return a == b;
    }
}

}  // namespace fig2json::kiwi
