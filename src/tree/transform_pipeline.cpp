/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "tree/transform_pipeline.h"

#include "tree/transform_passes.h"

namespace fig2json::tree {
namespace {

std::size_t value_weight(const kiwi::Value& v) {
    std::size_t n = 1;
    if (v.is_record()) {
        for (const auto& f : v.as_record().fields) {
            n += value_weight(f.value);
        }
    } else if (v.is_array()) {
        for (const auto& item : v.as_array()) {
            n += value_weight(item);
        }
    }
    return n;
}

// Passes 1-4 only ever remove, so an unchanged weight means an unchanged tree.
std::size_t node_weight(const Node& node) {
    std::size_t n = 1 + (node.id.empty() ? 0 : 1) + (node.id_value ? 1 : 0) + (node.internal_only ? 1 : 0);
    for (const auto& g : node.groups) {
        for (const auto& f : g) {
            n += value_weight(f.value);
        }
    }
    for (const auto& child : node.children) {
        n += node_weight(child);
    }
    return n;
}

}  // namespace

Node TransformPipeline::run(const Node& input) const {
    Node source = input;
    assign_serials(source);

    // Pruning an emptied record can expose a new default, so passes 1-4 repeat until stable.
    Node out = source;
    std::size_t weight = node_weight(out);
    for (;;) {
        if (config_.strip_defaults) {
            out = strip_defaults(std::move(out), config_);
        }
        if (config_.remove_metadata) {
            out = remove_metadata(std::move(out), config_);
        }
        if (config_.remove_redundant) {
            out = remove_redundant(std::move(out), config_);
        }
        if (config_.filter_internal) {
            out = filter_internal(std::move(out), config_);
        }
        const std::size_t next = node_weight(out);
        if (next == weight) {
            break;
        }
        weight = next;
    }
    if (config_.preserve_geometry) {
        out = preserve_geometry(std::move(out), source, config_);
    }
    return out;
}

}  // namespace fig2json::tree
