/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include "tree/node.h"
#include "tree/transform_config.h"

namespace fig2json::tree {

// Fixed pass order: defaults, metadata, redundant fields, internal nodes, geometry restore.
// Running it on its own output changes nothing.
class TransformPipeline {
   public:
    explicit TransformPipeline(TransformConfig config = {}) : config_(std::move(config)) {}

    Node run(const Node& input) const;

    const TransformConfig& config() const { return config_; }

   private:
    TransformConfig config_;
};

}  // namespace fig2json::tree
