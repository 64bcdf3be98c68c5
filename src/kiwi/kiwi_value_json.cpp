/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "kiwi/kiwi_value_json.h"

#include "utils/encoding.h"

#include <cmath>

namespace fig2json::kiwi {

nlohmann::ordered_json fields_to_json(const Fields& fields) {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    for (const auto& f : fields) {
        out[f.name] = value_to_json(f.value);
    }
    return out;
}

nlohmann::ordered_json value_to_json(const Value& v) {
    switch (v.kind()) {
        case ValueKind::Null:
            return nullptr;
        case ValueKind::Bool:
            return v.as_bool();
        case ValueKind::Int:
            return v.as_int();
        case ValueKind::Float: {
            const double d = v.as_float();
            if (!std::isfinite(d)) {
                return nullptr;
            }
            return d;
        }
        case ValueKind::String:
            return v.as_string();
        case ValueKind::Bytes:
            return encoding::to_base64(v.as_bytes());
        case ValueKind::Array: {
            nlohmann::ordered_json arr = nlohmann::ordered_json::array();
            for (const auto& item : v.as_array()) {
                arr.push_back(value_to_json(item));
            }
            return arr;
        }
        case ValueKind::Record:
            return fields_to_json(v.as_record().fields);
    }
    return nullptr;
}

}  // namespace fig2json::kiwi
