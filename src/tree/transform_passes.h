/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include "tree/node.h"
#include "tree/transform_config.h"

namespace fig2json::tree {

// Each pass takes a tree and returns the rewritten tree. Opaque node fields are never touched,
// allow-listed fields are never removed or descended into, and unexpected structure is left as is.

// Drops node-level and nested record fields equal to a default for the owning node's type.
Node strip_defaults(Node node, const TransformConfig& cfg);

// Drops ids, bookkeeping, cached text layout and thumbnails at any depth.
Node remove_metadata(Node node, const TransformConfig& cfg);

// Drops node fields that repeat the value of another retained field.
Node remove_redundant(Node node, const TransformConfig& cfg);

// Removes internal-only subtrees, then prunes fields left holding an empty record.
// An internal-only root leaves an empty Generic node.
Node filter_internal(Node node, const TransformConfig& cfg);

// Restores allow-listed node fields present in `source` but missing from `transformed`.
// Nodes are matched by serial.
Node preserve_geometry(Node transformed, const Node& source, const TransformConfig& cfg);

}  // namespace fig2json::tree
