/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include "tree/node.h"

#include <nlohmann/json.hpp>

namespace fig2json::tree {
// {"id", "type", "internalOnly", <fields in group order>, "__extras", "children"}; empty parts
// are omitted. A field whose name is one of the keys written here becomes "__field_<name>".
nlohmann::ordered_json node_to_json(const Node& node);

// Root node plus the document-level extras under "__document".
nlohmann::ordered_json document_to_json(const Node& root, const kiwi::Fields& document_extras);
}  // namespace fig2json::tree
