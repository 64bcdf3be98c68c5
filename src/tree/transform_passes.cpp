/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "tree/transform_passes.h"

#include <algorithm>
#include <array>
#include <string_view>
#include <unordered_map>

namespace fig2json::tree {
namespace {

using kiwi::Value;

template <typename Pred>
void erase_fields_if(kiwi::Fields& fields, Pred pred) {
    fields.erase(std::remove_if(fields.begin(), fields.end(), pred), fields.end());
}

template <typename Fn>
void for_each_node(Node& node, Fn&& fn) {
    fn(node);
    for (auto& child : node.children) {
        for_each_node(child, fn);
    }
}

void strip_nested_defaults(Value& v, const TransformConfig& cfg, std::string_view node_type);

void strip_default_fields(kiwi::Fields& fields, const TransformConfig& cfg, std::string_view node_type) {
    erase_fields_if(fields, [&](const kiwi::Field& f) {
        return !cfg.is_preserved(f.name) && cfg.defaults.is_default(f.name, f.value, node_type);
    });
    for (auto& f : fields) {
        if (!cfg.is_preserved(f.name)) {
            strip_nested_defaults(f.value, cfg, node_type);
        }
    }
}

void strip_nested_defaults(Value& v, const TransformConfig& cfg, std::string_view node_type) {
    if (v.is_record()) {
        strip_default_fields(v.as_record().fields, cfg, node_type);
    } else if (v.is_array()) {
        for (auto& item : v.as_array()) {
            strip_nested_defaults(item, cfg, node_type);
        }
    }
}

void strip_metadata(Value& v, const TransformConfig& cfg);

void strip_metadata_fields(kiwi::Fields& fields, const TransformConfig& cfg) {
    erase_fields_if(fields, [&](const kiwi::Field& f) {
        return !cfg.is_preserved(f.name) && cfg.is_metadata(f.name);
    });
    for (auto& f : fields) {
        if (!cfg.is_preserved(f.name)) {
            strip_metadata(f.value, cfg);
        }
    }
}

void strip_metadata(Value& v, const TransformConfig& cfg) {
    if (v.is_record()) {
        strip_metadata_fields(v.as_record().fields, cfg);
    } else if (v.is_array()) {
        for (auto& item : v.as_array()) {
            strip_metadata(item, cfg);
        }
    }
}

bool is_true(const Value* v) {
    return v && v->kind() == kiwi::ValueKind::Bool && v->as_bool();
}

void erase_if_same(Node& node, std::string_view field, const Value* reference, const TransformConfig& cfg) {
    if (!reference || cfg.is_preserved(field)) {
        return;
    }
    const Value* v = node.find(field);
    if (v && kiwi::same_content(*v, *reference)) {
        node.erase(field);
    }
}

// Removes the group only when every present member equals the reference.
template <std::size_t N>
void erase_group_if_same(
    Node& node,
    const std::array<std::string_view, N>& fields,
    std::string_view reference_name,
    const TransformConfig& cfg
) {
    const Value* reference = node.find(reference_name);
    if (!reference) {
        return;
    }
    for (auto name : fields) {
        const Value* v = node.find(name);
        if (cfg.is_preserved(name) || (v && !kiwi::same_content(*v, *reference))) {
            return;
        }
    }
    for (auto name : fields) {
        node.erase(name);
    }
}

constexpr std::array<std::string_view, 4> kCornerRadii{{
    "rectangleTopLeftCornerRadius",
    "rectangleTopRightCornerRadius",
    "rectangleBottomLeftCornerRadius",
    "rectangleBottomRightCornerRadius",
}};

constexpr std::array<std::string_view, 4> kBorderWeights{{
    "borderTopWeight",
    "borderBottomWeight",
    "borderLeftWeight",
    "borderRightWeight",
}};

void remove_redundant_fields(Node& node, const TransformConfig& cfg) {
    if (Value* text = node.find("derivedTextData"); text && !cfg.is_preserved("derivedTextData")) {
        const Value* layout = text->find("layoutSize");
        const Value* size = node.find("size");
        if (layout && size && kiwi::same_content(*layout, *size)) {
            text->erase("layoutSize");
        }
    }
    if (!is_true(node.find("rectangleCornerRadiiIndependent"))) {
        erase_group_if_same(node, kCornerRadii, "cornerRadius", cfg);
    }
    if (!is_true(node.find("borderStrokeWeightsIndependent"))) {
        erase_group_if_same(node, kBorderWeights, "strokeWeight", cfg);
    }
    erase_if_same(node, "stackPaddingRight", node.find("stackHorizontalPadding"), cfg);
    erase_if_same(node, "stackPaddingBottom", node.find("stackVerticalPadding"), cfg);
}

void prune_empty(Value& v, const TransformConfig& cfg);

void prune_empty_fields(kiwi::Fields& fields, const TransformConfig& cfg) {
    for (auto& f : fields) {
        if (!cfg.is_preserved(f.name)) {
            prune_empty(f.value, cfg);
        }
    }
    erase_fields_if(fields, [&](const kiwi::Field& f) {
        return !cfg.is_preserved(f.name) && f.value.is_record() && f.value.as_record().fields.empty();
    });
}

void prune_empty(Value& v, const TransformConfig& cfg) {
    if (v.is_record()) {
        prune_empty_fields(v.as_record().fields, cfg);
    } else if (v.is_array()) {
        for (auto& item : v.as_array()) {
            prune_empty(item, cfg);
        }
    }
}

void drop_internal_children(Node& node) {
    node.children.erase(
        std::remove_if(node.children.begin(), node.children.end(), [](const Node& child) {
            return child.internal_only;
        }),
        node.children.end()
    );
    for (auto& child : node.children) {
        drop_internal_children(child);
    }
}

void index_by_serial(const Node& node, std::unordered_map<std::uint32_t, const Node*>& out) {
    out.emplace(node.serial, &node);
    for (const auto& child : node.children) {
        index_by_serial(child, out);
    }
}

}  // namespace

Node strip_defaults(Node node, const TransformConfig& cfg) {
    for_each_node(node, [&](Node& n) {
        if (n.is_opaque()) {
            return;
        }
        for (auto& g : n.groups) {
            strip_default_fields(g, cfg, n.type);
        }
    });
    return node;
}

Node remove_metadata(Node node, const TransformConfig& cfg) {
    for_each_node(node, [&](Node& n) {
        if (!cfg.keep_ids) {
            n.id.clear();
            n.id_value.reset();
        }
        if (n.is_opaque()) {
            return;
        }
        for (auto& g : n.groups) {
            strip_metadata_fields(g, cfg);
        }
    });
    return node;
}

Node remove_redundant(Node node, const TransformConfig& cfg) {
    for_each_node(node, [&](Node& n) {
        if (!n.is_opaque()) {
            remove_redundant_fields(n, cfg);
        }
    });
    return node;
}

Node filter_internal(Node node, const TransformConfig& cfg) {
    if (node.internal_only) {
        Node empty;
        empty.serial = kDetachedSerial;
        return empty;
    }
    drop_internal_children(node);
    for_each_node(node, [&](Node& n) {
        if (n.is_opaque()) {
            return;
        }
        for (auto& g : n.groups) {
            prune_empty_fields(g, cfg);
        }
    });
    return node;
}

Node preserve_geometry(Node transformed, const Node& source, const TransformConfig& cfg) {
    std::unordered_map<std::uint32_t, const Node*> by_serial;
    index_by_serial(source, by_serial);

    for_each_node(transformed, [&](Node& n) {
        if (n.is_opaque()) {
            return;
        }
        auto it = by_serial.find(n.serial);
        if (it == by_serial.end()) {
            return;
        }
        const Node& src = *it->second;
        for (std::size_t g = 0; g < kFieldGroupCount; g++) {
            for (const auto& f : src.groups[g]) {
                if (cfg.is_preserved(f.name) && !n.find(f.name)) {
                    n.groups[g].push_back(f);
                }
            }
        }
    });
    return transformed;
}

}  // namespace fig2json::tree
