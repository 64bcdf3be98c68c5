/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include "kiwi/kiwi_value.h"
#include "tree/node.h"

#include <string>
#include <vector>

namespace fig2json::tree {

struct BuildOptions {
    // Record-array fields walked as child lists when the document is nested.
    std::vector<std::string> child_fields = {"children"};
    // Fields without node semantics. Kept in raw_extras only when keep_raw_extras is set.
    std::vector<std::string> extra_fields = {
        "thumbnail",
        "thumbnailInfo",
        "thumbnailSize",
        "editScopeInfo",
    };
    bool keep_raw_extras = false;
    // Replace <name>Blob references and image hashes with their content.
    bool resolve_content = true;
    bool debug = false;
};

struct BuildStats {
    std::size_t nodes = 0;
    std::size_t opaque_nodes = 0;
    std::size_t dropped_nodes = 0;
    std::size_t resolved_blobs = 0;
    std::size_t resolved_images = 0;
};

struct BuildResult {
    Node root;
    // Root-record fields that are not part of the node hierarchy (only with keep_raw_extras).
    kiwi::Fields document_extras;
    BuildStats stats;
};

// Builds the node hierarchy from the decoded root record. A root with a `nodeChanges` array is
// treated as a flat, guid-linked node list; anything else as a nested tree. Throws
// std::runtime_error when the root is not a record or a flat list cannot be linked.
BuildResult build_node_tree(const kiwi::Value& root, const BuildOptions& opt = {});

// "<sessionID>:<localID>" for a guid record, empty when the record is not a usable guid.
std::string guid_to_id(const kiwi::Value& guid);

}  // namespace fig2json::tree
