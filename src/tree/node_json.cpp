/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "tree/node_json.h"

#include "kiwi/kiwi_value_json.h"

#include <string>
#include <string_view>

namespace fig2json::tree {
namespace {

constexpr std::string_view kClashPrefix = "__field_";

// Keys this node writes itself; a field of the same name must not overwrite them.
bool owned_key(const Node& node, std::string_view name) {
    if (name == "id") {
        return !node.id.empty() || node.id_value.has_value();
    }
    if (name == "type") {
        return !node.type.empty();
    }
    if (name == "internalOnly") {
        return node.internal_only;
    }
    if (name == "__extras") {
        return !node.raw_extras.empty();
    }
    if (name == "children") {
        return !node.children.empty();
    }
    return false;
}

}  // namespace

nlohmann::ordered_json node_to_json(const Node& node) {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    if (node.id_value) {
        out["id"] = kiwi::value_to_json(*node.id_value);
    } else if (!node.id.empty()) {
        out["id"] = node.id;
    }
    if (!node.type.empty()) {
        out["type"] = node.type;
    }
    if (node.internal_only) {
        out["internalOnly"] = true;
    }
    for (const auto& g : node.groups) {
        for (const auto& f : g) {
            nlohmann::ordered_json value = kiwi::value_to_json(f.value);
            if (!owned_key(node, f.name)) {
                out[f.name] = std::move(value);
                continue;
            }
            // Opaque nodes keep their type field verbatim; an identical copy is not a clash.
            if (out.contains(f.name) && out[f.name] == value) {
                continue;
            }
            out[std::string(kClashPrefix) + f.name] = std::move(value);
        }
    }
    if (!node.raw_extras.empty()) {
        out["__extras"] = kiwi::fields_to_json(node.raw_extras);
    }
    if (!node.children.empty()) {
        nlohmann::ordered_json kids = nlohmann::ordered_json::array();
        for (const auto& child : node.children) {
            kids.push_back(node_to_json(child));
        }
        out["children"] = std::move(kids);
    }
    return out;
}

nlohmann::ordered_json document_to_json(const Node& root, const kiwi::Fields& document_extras) {
    nlohmann::ordered_json out = node_to_json(root);
    if (!document_extras.empty()) {
        out["__document"] = kiwi::fields_to_json(document_extras);
    }
    return out;
}

}  // namespace fig2json::tree
