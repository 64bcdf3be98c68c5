/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include "kiwi/kiwi_value.h"

#include <nlohmann/json.hpp>

namespace fig2json::kiwi {
// Untransformed materialization: records become objects in decode order, bytes become base64
// strings, NaN and infinities become null.
nlohmann::ordered_json value_to_json(const Value& v);
nlohmann::ordered_json fields_to_json(const Fields& fields);
}  // namespace fig2json::kiwi
