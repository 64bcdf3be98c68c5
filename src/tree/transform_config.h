/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include "kiwi/kiwi_value.h"

#include <string>
#include <string_view>
#include <vector>

namespace fig2json::tree {

struct DefaultRule {
    std::string field;
    kiwi::Value value;
    // Node types the rule applies to; empty means every node type.
    std::vector<std::string> node_types;
};

// Field values that carry no information because the renderer assumes them anyway.
class DefaultTable {
   public:
    void add(std::string field, kiwi::Value value, std::vector<std::string> node_types = {});

    // Exact match only: a float must equal the default in value and sign, so -0.0 is kept.
    bool is_default(std::string_view field, const kiwi::Value& v, std::string_view node_type) const;

    std::size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }
    const std::vector<DefaultRule>& rules() const { return rules_; }

    static DefaultTable standard();

   private:
    std::vector<DefaultRule> rules_;
};

struct TransformConfig {
    DefaultTable defaults = DefaultTable::standard();
    std::vector<std::string> metadata_fields = standard_metadata_fields();
    std::vector<std::string> metadata_prefixes = {"styleIdFor"};
    // Geometry and content that no pass may remove or descend into.
    std::vector<std::string> preserve_fields = standard_preserve_fields();
    std::vector<std::string> preserve_suffixes = {"Blob"};

    bool strip_defaults = true;
    bool remove_metadata = true;
    bool remove_redundant = true;
    bool filter_internal = true;
    bool preserve_geometry = true;
    // Keep node ids and guids through metadata removal.
    bool keep_ids = false;

    bool is_metadata(std::string_view name) const;
    bool is_preserved(std::string_view name) const;

    static std::vector<std::string> standard_metadata_fields();
    static std::vector<std::string> standard_preserve_fields();
};

}  // namespace fig2json::tree
