/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "tree/node_builder.h"

#include "tree/blob_parser.h"
#include "utils/log.h"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace fig2json::tree {
namespace {

using kiwi::Value;
using kiwi::ValueKind;

constexpr std::string_view kBlobSuffix = "Blob";

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() > suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

bool listed(const std::vector<std::string>& names, std::string_view name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

std::string scalar_id(const Value& v) {
    switch (v.kind()) {
        case ValueKind::Int:
            return std::to_string(v.as_int());
        case ValueKind::String:
            return v.as_string();
        default:
            return {};
    }
}

bool is_record_array(const Value& v) {
    if (!v.is_array()) {
        return false;
    }
    const auto& items = v.as_array();
    return std::all_of(items.begin(), items.end(), [](const Value& item) {
        return item.is_record();
    });
}

struct FlatEntry {
    const kiwi::Fields* fields = nullptr;
    std::string id;
    std::string parent_id;
    std::string position;
    bool has_parent = false;
};

class NodeBuilder {
   public:
    NodeBuilder(const BuildOptions& opt, const kiwi::Array* blobs, BuildStats& stats)
        : opt_(opt), blobs_(blobs), stats_(stats) {}

    // Converts one node record. Nested mode walks the child-list fields; flat mode leaves
    // children to the caller.
    Node make_node(const kiwi::Fields& fields, bool nested, bool is_root = false) {
        Node node;
        stats_.nodes++;

        const Value* type = kiwi::find_field(fields, "type");
        if (!type) {
            node.kind = NodeKind::Generic;
        } else if (type->is_string()) {
            node.type = type->as_string();
            node.kind = node_kind_from_type(node.type).value_or(NodeKind::Opaque);
        } else {
            node.type = scalar_id(*type);
            node.kind = NodeKind::Opaque;
        }

        const Value* guid = kiwi::find_field(fields, "guid");
        const std::string guid_id = guid ? guid_to_id(*guid) : std::string();
        const Value* scalar = kiwi::find_field(fields, "id");
        node.id = !guid_id.empty() ? guid_id : (scalar ? scalar_id(*scalar) : std::string());
        if (guid_id.empty() && !node.id.empty()) {
            node.id_value = *scalar;
        }

        if (node.is_opaque()) {
            stats_.opaque_nodes++;
            for (const auto& f : fields) {
                if (!nested && f.name == "parentIndex") {
                    continue;
                }
                node.group(FieldGroup::General).push_back(f);
            }
            return node;
        }

        kiwi::Fields kept;
        for (const auto& f : fields) {
            if (f.name == "type" || f.name == "parentIndex") {
                continue;
            }
            if (f.name == "guid" && !guid_id.empty()) {
                continue;
            }
            if (f.name == "id" && guid_id.empty() && !node.id.empty()) {
                continue;
            }
            if (f.name == "internalOnly" && f.value.kind() == ValueKind::Bool) {
                node.internal_only = f.value.as_bool();
                continue;
            }
            if (is_root && f.name == "blobs") {
                continue;
            }
            if (nested && listed(opt_.child_fields, f.name) && is_record_array(f.value)) {
                for (const auto& child : f.value.as_array()) {
                    node.children.push_back(make_node(child.as_record().fields, true));
                }
                continue;
            }
            if (listed(opt_.extra_fields, f.name)) {
                if (opt_.keep_raw_extras) {
                    node.raw_extras.push_back(f);
                }
                continue;
            }
            kept.push_back(f);
        }

        if (opt_.resolve_content) {
            resolve_fields(kept);
        }
        for (auto& f : kept) {
            node.set(std::move(f.name), std::move(f.value));
        }
        return node;
    }

    void resolve_fields(kiwi::Fields& fields) {
        for (std::size_t i = 0; i < fields.size(); i++) {
            auto& f = fields[i];
            if (ends_with(f.name, kBlobSuffix)) {
                resolve_blob(f);
            } else if ((f.name == "image" || f.name == "imageThumbnail") && f.value.is_record()) {
                resolve_image(f.value);
            }
            resolve_value(f.value);
        }
    }

   private:
    void resolve_value(Value& v) {
        if (v.is_record()) {
            resolve_fields(v.as_record().fields);
        } else if (v.is_array()) {
            for (auto& item : v.as_array()) {
                resolve_value(item);
            }
        }
    }

    void resolve_blob(kiwi::Field& f) {
        if (!blobs_ || f.value.kind() != ValueKind::Int || f.value.as_int() < 0) {
            return;
        }
        const auto index = static_cast<std::uint64_t>(f.value.as_int());
        if (index >= blobs_->size()) {
            return;
        }
        const Value* bytes = (*blobs_)[static_cast<std::size_t>(index)].find("bytes");
        if (!bytes || bytes->kind() != ValueKind::Bytes) {
            return;
        }
        const std::string kind = f.name.substr(0, f.name.size() - kBlobSuffix.size());
        auto parsed = parse_blob(kind, bytes->as_bytes());
        if (!parsed) {
            if (opt_.debug) {
                FIG2JSON_LOG_DEBUG("Blob %s #%llu left as reference", f.name.c_str(),
                                   static_cast<unsigned long long>(index));
            }
            return;
        }
        f.name = kind;
        f.value = std::move(*parsed);
        stats_.resolved_blobs++;
    }

    void resolve_image(Value& image) {
        const Value* hash = image.find("hash");
        if (!hash) {
            return;
        }
        auto filename = image_filename(*hash);
        if (!filename) {
            return;
        }
        image.erase("hash");
        image.set("filename", Value::string(std::move(*filename)));
        stats_.resolved_images++;
    }

    const BuildOptions& opt_;
    const kiwi::Array* blobs_;
    BuildStats& stats_;
};

Node build_flat(const kiwi::Array& changes, NodeBuilder& builder, BuildStats& stats) {
    std::vector<FlatEntry> entries;
    entries.reserve(changes.size());
    std::unordered_set<std::string> seen;

    for (std::size_t i = 0; i < changes.size(); i++) {
        const Value& change = changes[i];
        if (!change.is_record()) {
            throw std::runtime_error("nodeChanges[" + std::to_string(i) + "] is not a record");
        }
        FlatEntry e;
        e.fields = &change.as_record().fields;
        const Value* guid = change.find("guid");
        e.id = guid ? guid_to_id(*guid) : std::string();
        if (e.id.empty()) {
            throw std::runtime_error("nodeChanges[" + std::to_string(i) + "] has no usable guid");
        }
        if (!seen.insert(e.id).second) {
            stats.dropped_nodes++;
            continue;
        }
        if (const Value* parent = change.find("parentIndex")) {
            if (const Value* pg = parent->find("guid")) {
                e.parent_id = guid_to_id(*pg);
                e.has_parent = !e.parent_id.empty();
            }
            if (const Value* pos = parent->find("position"); pos && pos->is_string()) {
                e.position = pos->as_string();
            }
        }
        entries.push_back(std::move(e));
    }

    std::size_t root_index = entries.size();
    for (std::size_t i = 0; i < entries.size(); i++) {
        if (entries[i].id == "0:0") {
            root_index = i;
            break;
        }
    }
    if (root_index == entries.size()) {
        for (std::size_t i = 0; i < entries.size(); i++) {
            if (!entries[i].has_parent) {
                root_index = i;
                break;
            }
        }
    }
    if (root_index == entries.size()) {
        throw std::runtime_error("nodeChanges has no root node");
    }

    std::unordered_map<std::string, std::vector<std::size_t>> by_parent;
    for (std::size_t i = 0; i < entries.size(); i++) {
        if (i != root_index && entries[i].has_parent) {
            by_parent[entries[i].parent_id].push_back(i);
        }
    }
    for (auto& entry : by_parent) {
        auto& kids = entry.second;
        std::stable_sort(kids.begin(), kids.end(), [&](std::size_t a, std::size_t b) {
            return entries[a].position < entries[b].position;
        });
    }

    std::vector<bool> attached(entries.size(), false);
    std::size_t attached_count = 0;

    struct Pending {
        std::size_t entry;
        Node* slot;
    };
    Node root = builder.make_node(*entries[root_index].fields, false);
    attached[root_index] = true;
    attached_count++;
    std::vector<Pending> stack{{root_index, &root}};
    while (!stack.empty()) {
        const Pending p = stack.back();
        stack.pop_back();
        auto it = by_parent.find(entries[p.entry].id);
        if (it == by_parent.end()) {
            continue;
        }
        std::vector<std::size_t> added;
        for (std::size_t k : it->second) {
            if (attached[k]) {
                continue;
            }
            attached[k] = true;
            attached_count++;
            added.push_back(k);
            p.slot->children.push_back(builder.make_node(*entries[k].fields, false));
        }
        // Each slot is filled exactly once, so pointers into a finished children vector stay valid.
        for (std::size_t c = 0; c < added.size(); c++) {
            stack.push_back({added[c], &p.slot->children[c]});
        }
    }

    stats.dropped_nodes += entries.size() - attached_count;
    return root;
}

}  // namespace

std::string guid_to_id(const kiwi::Value& guid) {
    if (!guid.is_record()) {
        return {};
    }
    const Value* session = guid.find("sessionID");
    const Value* local = guid.find("localID");
    if (!session || !local || session->kind() != ValueKind::Int
        || local->kind() != ValueKind::Int) {
        return {};
    }
    return std::to_string(session->as_int()) + ":" + std::to_string(local->as_int());
}

BuildResult build_node_tree(const kiwi::Value& root, const BuildOptions& opt) {
    if (!root.is_record()) {
        throw std::runtime_error(
            "Document root is a " + std::string(kiwi::value_kind_name(root.kind()))
            + ", expected a record"
        );
    }

    BuildResult result;
    const Value* blobs = root.find("blobs");
    const kiwi::Array* blob_list = blobs && blobs->is_array() ? &blobs->as_array() : nullptr;
    NodeBuilder builder(opt, blob_list, result.stats);

    const Value* changes = root.find("nodeChanges");
    if (changes && changes->is_array()) {
        result.root = build_flat(changes->as_array(), builder, result.stats);
        if (opt.keep_raw_extras) {
            for (const auto& f : root.as_record().fields) {
                if (f.name != "nodeChanges" && f.name != "blobs") {
                    result.document_extras.push_back(f);
                }
            }
        }
    } else {
        result.root = builder.make_node(root.as_record().fields, true, true);
        if (opt.keep_raw_extras && blobs) {
            result.document_extras.push_back(kiwi::Field{"blobs", *blobs});
        }
    }

    if (opt.debug) {
        FIG2JSON_LOG_DEBUG(
            "Built %zu nodes (%zu opaque, %zu dropped, %zu blobs, %zu images)",
            result.stats.nodes, result.stats.opaque_nodes, result.stats.dropped_nodes,
            result.stats.resolved_blobs, result.stats.resolved_images
        );
    }
    return result;
}

}  // namespace fig2json::tree
