/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "tree/transform_config.h"

#include <algorithm>

namespace fig2json::tree {
namespace {

using kiwi::Value;

Value measure(double value, const char* units) {
    kiwi::Fields f;
    f.push_back({"value", Value::floating(value)});
    f.push_back({"units", Value::string(units)});
    return Value::record(kiwi::kNoTypeId, std::move(f));
}

}  // namespace

void DefaultTable::add(std::string field, kiwi::Value value, std::vector<std::string> node_types) {
    rules_.push_back(DefaultRule{std::move(field), std::move(value), std::move(node_types)});
}

bool DefaultTable::is_default(
    std::string_view field,
    const kiwi::Value& v,
    std::string_view node_type
) const {
    for (const auto& rule : rules_) {
        if (rule.field != field) {
            continue;
        }
        if (!rule.node_types.empty()
            && std::find(rule.node_types.begin(), rule.node_types.end(), node_type)
                   == rule.node_types.end()) {
            continue;
        }
        if (kiwi::same_content(rule.value, v)) {
            return true;
        }
    }
    return false;
}

DefaultTable DefaultTable::standard() {
    const std::vector<std::string> text_nodes = {"TEXT", "STICKY", "SHAPE_WITH_TEXT"};

    DefaultTable t;
    t.add("blendMode", Value::string("NORMAL"));
    t.add("opacity", Value::floating(1.0));
    t.add("visible", Value::boolean(true));
    t.add("rotation", Value::floating(0.0));
    t.add("uniformScaleFactor", Value::floating(1.0));
    t.add("letterSpacing", measure(0.0, "PERCENT"), text_nodes);
    t.add("letterSpacing", measure(0.0, "PIXELS"), text_nodes);
    t.add("lineHeight", measure(100.0, "PERCENT"), text_nodes);
    t.add("paragraphSpacing", Value::floating(0.0), text_nodes);
    t.add("paragraphIndent", Value::floating(0.0), text_nodes);
    t.add("textDecoration", Value::string("NONE"), text_nodes);
    t.add("textCase", Value::string("ORIGINAL"), text_nodes);
    return t;
}

bool TransformConfig::is_metadata(std::string_view name) const {
    if (std::find(metadata_fields.begin(), metadata_fields.end(), name) != metadata_fields.end()) {
        return !(keep_ids && name == "guid");
    }
    for (const auto& prefix : metadata_prefixes) {
        if (name.substr(0, prefix.size()) == prefix) {
            return true;
        }
    }
    return false;
}

bool TransformConfig::is_preserved(std::string_view name) const {
    if (std::find(preserve_fields.begin(), preserve_fields.end(), name) != preserve_fields.end()) {
        return true;
    }
    for (const auto& suffix : preserve_suffixes) {
        if (name.size() > suffix.size() && name.substr(name.size() - suffix.size()) == suffix) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> TransformConfig::standard_metadata_fields() {
    return {
        "guid",
        "guidPath",
        "editInfo",
        "pluginData",
        "pluginRelaunchData",
        "exportSettings",
        "phase",
        "userFacingVersion",
        "derivedSymbolData",
        "derivedSymbolDataLayoutVersion",
        "glyphs",
        "baselines",
        "derivedLines",
        "fontMetaData",
        "truncationStartIndex",
        "logicalIndexToCharacterOffsetMap",
        "imageThumbnail",
        "thumbnail",
    };
}

std::vector<std::string> TransformConfig::standard_preserve_fields() {
    return {
        "fillGeometry",
        "strokeGeometry",
        "vectorData",
        "vectorNetwork",
        "commands",
        "image",
        "hash",
        "filename",
        "animatedImage",
        "video",
    };
}

}  // namespace fig2json::tree
