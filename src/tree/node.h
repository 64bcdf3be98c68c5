/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include "kiwi/kiwi_value.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fig2json::tree {

enum class NodeKind : std::uint8_t {
    Document,
    Canvas,
    Frame,
    Group,
    Vector,
    BooleanOperation,
    Star,
    Line,
    Ellipse,
    Rectangle,
    RegularPolygon,
    RoundedRectangle,
    Text,
    Slice,
    Symbol,
    Instance,
    Sticky,
    ShapeWithText,
    Connector,
    CodeBlock,
    Widget,
    Stamp,
    Section,
    Table,
    // Record without a type field.
    Generic,
    // Type present but not one we know; fields are kept verbatim.
    Opaque,
};

enum class FieldGroup : std::uint8_t {
    General = 0,
    Geometry,
    Style,
    Text,
    Layout,
};

inline constexpr std::size_t kFieldGroupCount = 5;
// Serial of a node that matches nothing in the source tree.
inline constexpr std::uint32_t kDetachedSerial = 0xFFFFFFFFu;

std::string_view node_kind_name(NodeKind kind);
std::optional<NodeKind> node_kind_from_type(std::string_view type);
std::string_view field_group_name(FieldGroup group);
FieldGroup classify_field(std::string_view name);

struct Node {
    std::string id;
    // Scalar `id` field as decoded; guid-derived ids have none.
    std::optional<kiwi::Value> id_value;
    std::string type;
    NodeKind kind = NodeKind::Generic;
    bool internal_only = false;
    // Pre-order index, assigned by the pipeline to match nodes across passes.
    std::uint32_t serial = 0;
    std::array<kiwi::Fields, kFieldGroupCount> groups;
    kiwi::Fields raw_extras;
    std::vector<Node> children;

    kiwi::Fields& group(FieldGroup g) { return groups[static_cast<std::size_t>(g)]; }
    const kiwi::Fields& group(FieldGroup g) const { return groups[static_cast<std::size_t>(g)]; }

    // Field lookup across all groups.
    const kiwi::Value* find(std::string_view name) const;
    kiwi::Value* find(std::string_view name);
    bool erase(std::string_view name);
    // Opaque nodes keep everything in General; other nodes use classify_field.
    void set(std::string name, kiwi::Value v);

    std::size_t field_count() const;
    bool is_opaque() const { return kind == NodeKind::Opaque; }

    bool operator==(const Node& other) const;
    bool operator!=(const Node& other) const { return !(*this == other); }
};

void assign_serials(Node& root);
std::size_t count_nodes(const Node& root);

}  // namespace fig2json::tree
