/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "tree/node.h"

#include <algorithm>

namespace fig2json::tree {
namespace {

struct KindName {
    std::string_view type;
    NodeKind kind;
};

constexpr std::array<KindName, 24> kKindNames{{
    {"DOCUMENT", NodeKind::Document},
    {"CANVAS", NodeKind::Canvas},
    {"FRAME", NodeKind::Frame},
    {"GROUP", NodeKind::Group},
    {"VECTOR", NodeKind::Vector},
    {"BOOLEAN_OPERATION", NodeKind::BooleanOperation},
    {"STAR", NodeKind::Star},
    {"LINE", NodeKind::Line},
    {"ELLIPSE", NodeKind::Ellipse},
    {"RECTANGLE", NodeKind::Rectangle},
    {"REGULAR_POLYGON", NodeKind::RegularPolygon},
    {"ROUNDED_RECTANGLE", NodeKind::RoundedRectangle},
    {"TEXT", NodeKind::Text},
    {"SLICE", NodeKind::Slice},
    {"SYMBOL", NodeKind::Symbol},
    {"INSTANCE", NodeKind::Instance},
    {"STICKY", NodeKind::Sticky},
    {"SHAPE_WITH_TEXT", NodeKind::ShapeWithText},
    {"CONNECTOR", NodeKind::Connector},
    {"CODE_BLOCK", NodeKind::CodeBlock},
    {"WIDGET", NodeKind::Widget},
    {"STAMP", NodeKind::Stamp},
    {"SECTION", NodeKind::Section},
    {"TABLE", NodeKind::Table},
}};

constexpr std::array<std::string_view, 21> kGeometryFields{{
    "size",
    "transform",
    "rotation",
    "boundingBox",
    "fillGeometry",
    "strokeGeometry",
    "vectorData",
    "vectorNetwork",
    "commands",
    "cornerRadius",
    "cornerSmoothing",
    "rectangleTopLeftCornerRadius",
    "rectangleTopRightCornerRadius",
    "rectangleBottomLeftCornerRadius",
    "rectangleBottomRightCornerRadius",
    "rectangleCornerRadiiIndependent",
    "count",
    "starInnerScale",
    "arcData",
    "handleMirroring",
    "uniformScaleFactor",
}};

constexpr std::array<std::string_view, 24> kStyleFields{{
    "fillPaints",
    "strokePaints",
    "backgroundPaints",
    "backgroundColor",
    "backgroundOpacity",
    "backgroundEnabled",
    "strokeWeight",
    "strokeAlign",
    "strokeJoin",
    "strokeCap",
    "dashPattern",
    "borderTopWeight",
    "borderBottomWeight",
    "borderLeftWeight",
    "borderRightWeight",
    "borderStrokeWeightsIndependent",
    "effects",
    "blendMode",
    "opacity",
    "visible",
    "mask",
    "maskType",
    "miterLimit",
    "image",
}};

constexpr std::array<std::string_view, 12> kTextFields{{
    "characters",
    "letterSpacing",
    "lineHeight",
    "paragraphSpacing",
    "paragraphIndent",
    "derivedTextData",
    "autoRename",
    "leadingTrim",
    "hyperlink",
    "maxLines",
    "listSpacing",
    "hangingPunctuation",
}};

constexpr std::array<std::string_view, 8> kLayoutFields{{
    "horizontalConstraint",
    "verticalConstraint",
    "layoutGrids",
    "constrainProportions",
    "frameMaskDisabled",
    "resizeToFit",
    "bordersTakeSpace",
    "itemReverseZIndex",
}};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& names, std::string_view name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

void assign_serials_from(Node& node, std::uint32_t& next) {
    node.serial = next++;
    for (auto& child : node.children) {
        assign_serials_from(child, next);
    }
}

}  // namespace

std::string_view node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Generic:
            return "GENERIC";
        case NodeKind::Opaque:
            return "OPAQUE";
        default:
            break;
    }
    for (const auto& kn : kKindNames) {
        if (kn.kind == kind) {
            return kn.type;
        }
    }
    return "?";
}

std::optional<NodeKind> node_kind_from_type(std::string_view type) {
    for (const auto& kn : kKindNames) {
        if (kn.type == type) {
            return kn.kind;
        }
    }
    return std::nullopt;
}

std::string_view field_group_name(FieldGroup group) {
    switch (group) {
        case FieldGroup::General:
            return "general";
        case FieldGroup::Geometry:
            return "geometry";
        case FieldGroup::Style:
            return "style";
        case FieldGroup::Text:
            return "text";
        case FieldGroup::Layout:
            return "layout";
    }
    return "?";
}

FieldGroup classify_field(std::string_view name) {
    if (contains(kGeometryFields, name)) {
        return FieldGroup::Geometry;
    }
    if (contains(kStyleFields, name) || starts_with(name, "styleIdFor")) {
        return FieldGroup::Style;
    }
    if (contains(kTextFields, name) || starts_with(name, "text") || starts_with(name, "font")) {
        return FieldGroup::Text;
    }
    if (contains(kLayoutFields, name) || starts_with(name, "stack")) {
        return FieldGroup::Layout;
    }
    return FieldGroup::General;
}

const kiwi::Value* Node::find(std::string_view name) const {
    for (const auto& g : groups) {
        if (const kiwi::Value* v = kiwi::find_field(g, name)) {
            return v;
        }
    }
    return nullptr;
}

kiwi::Value* Node::find(std::string_view name) {
    for (auto& g : groups) {
        if (kiwi::Value* v = kiwi::find_field(g, name)) {
            return v;
        }
    }
    return nullptr;
}

bool Node::erase(std::string_view name) {
    for (auto& g : groups) {
        if (kiwi::erase_field(g, name)) {
            return true;
        }
    }
    return false;
}

void Node::set(std::string name, kiwi::Value v) {
    if (kiwi::Value* existing = find(name)) {
        *existing = std::move(v);
        return;
    }
    const FieldGroup g = is_opaque() ? FieldGroup::General : classify_field(name);
    group(g).push_back(kiwi::Field{std::move(name), std::move(v)});
}

std::size_t Node::field_count() const {
    std::size_t n = 0;
    for (const auto& g : groups) {
        n += g.size();
    }
    return n;
}

bool Node::operator==(const Node& other) const {
    return id == other.id && id_value == other.id_value && type == other.type && kind == other.kind
           && internal_only == other.internal_only && groups == other.groups
           && raw_extras == other.raw_extras && children == other.children;
}

void assign_serials(Node& root) {
    std::uint32_t next = 0;
    assign_serials_from(root, next);
}

std::size_t count_nodes(const Node& root) {
    std::size_t n = 1;
    for (const auto& child : root.children) {
        n += count_nodes(child);
    }
    return n;
}

}  // namespace fig2json::tree
