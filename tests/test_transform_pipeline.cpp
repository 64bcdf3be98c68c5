#include <gtest/gtest.h>
#include "tree/node_json.h"
#include "tree/transform_pipeline.h"

using namespace fig2json::tree;
using fig2json::kiwi::Fields;
using fig2json::kiwi::Value;
using fig2json::kiwi::kNoTypeId;

namespace {

Value rec(Fields fields) {
    return Value::record(kNoTypeId, std::move(fields));
}

Node make_node(const char* type, const char* id) {
    Node n;
    n.type = type;
    n.kind = node_kind_from_type(type).value_or(NodeKind::Opaque);
    n.id = id;
    return n;
}

Node sample_document() {
    Node doc = make_node("DOCUMENT", "0:0");
    doc.set("name", Value::string("Doc"));

    Node page = make_node("CANVAS", "0:1");
    page.set("name", Value::string("Page"));
    page.set("opacity", Value::floating(1.0));
    page.set("pluginData", Value::array());

    Node rect = make_node("RECTANGLE", "1:2");
    rect.set("cornerRadius", Value::floating(4));
    rect.set("rectangleTopLeftCornerRadius", Value::floating(4));
    rect.set("fillGeometry", Value::array({rec({{"commandsBlob", Value::integer(0)}})}));
    rect.set("exportInfo", rec({{"editInfo", Value::integer(1)}}));

    Node internal = make_node("FRAME", "1:3");
    internal.internal_only = true;

    Node future = make_node("FUTURE_NODE", "1:4");
    future.set("opacity", Value::floating(1.0));

    page.children.push_back(rect);
    page.children.push_back(internal);
    page.children.push_back(future);
    doc.children.push_back(page);
    return doc;
}

}  // namespace

TEST(TransformPipelineTest, AppliesAllPasses) {
    const Node out = TransformPipeline().run(sample_document());

    EXPECT_TRUE(out.id.empty());
    ASSERT_EQ(out.children.size(), 1u);
    const Node& page = out.children[0];
    EXPECT_EQ(page.find("opacity"), nullptr);
    EXPECT_EQ(page.find("pluginData"), nullptr);
    ASSERT_EQ(page.children.size(), 2u);

    const Node& rect = page.children[0];
    EXPECT_EQ(rect.find("rectangleTopLeftCornerRadius"), nullptr);
    EXPECT_EQ(rect.find("exportInfo"), nullptr);
    EXPECT_NE(rect.find("fillGeometry"), nullptr);
    EXPECT_NE(rect.find("cornerRadius"), nullptr);

    const Node& future = page.children[1];
    EXPECT_TRUE(future.is_opaque());
    EXPECT_NE(future.find("opacity"), nullptr);
}

TEST(TransformPipelineTest, InputIsNotModified) {
    const Node input = sample_document();
    const Node copy = input;
    TransformPipeline().run(input);
    EXPECT_EQ(input, copy);
}

TEST(TransformPipelineTest, RunningTwiceChangesNothing) {
    const TransformPipeline pipeline;
    const Node once = pipeline.run(sample_document());
    const Node twice = pipeline.run(once);
    EXPECT_EQ(once, twice);
    EXPECT_EQ(node_to_json(once).dump(), node_to_json(twice).dump());
}

TEST(TransformPipelineTest, DefaultExposedByPruningIsStrippedInOneRun) {
    Node text = make_node("TEXT", "1:5");
    text.set("name", Value::string("Label"));
    text.set(
        "lineHeight",
        rec({{"value", Value::floating(100.0)}, {"units", Value::string("PERCENT")}, {"extra", rec({})}})
    );

    const TransformPipeline pipeline;
    const Node once = pipeline.run(text);
    EXPECT_EQ(once.find("lineHeight"), nullptr);
    EXPECT_NE(once.find("name"), nullptr);
    EXPECT_EQ(pipeline.run(once), once);
}

TEST(TransformPipelineTest, RunningTwiceChangesNothingOnNestedEmptyRecords) {
    Node frame = make_node("FRAME", "2:1");
    frame.set("opacity", Value::floating(0.5));
    frame.set(
        "exportInfo",
        rec({{"editInfo", Value::integer(1)}, {"inner", rec({{"pluginData", Value::array()}})}})
    );
    Node text = make_node("TEXT", "2:2");
    text.set(
        "letterSpacing",
        rec({
            {"value", Value::floating(0.0)},
            {"units", Value::string("PIXELS")},
            {"meta", rec({{"guid", Value::integer(1)}})},
        })
    );
    frame.children.push_back(text);

    const TransformPipeline pipeline;
    const Node once = pipeline.run(frame);
    EXPECT_EQ(once.find("exportInfo"), nullptr);
    ASSERT_EQ(once.children.size(), 1u);
    EXPECT_EQ(once.children[0].find("letterSpacing"), nullptr);
    EXPECT_EQ(pipeline.run(once), once);
}

TEST(TransformPipelineTest, InternalRootLeavesEmptyTree) {
    Node root = make_node("FRAME", "0:1");
    root.internal_only = true;
    root.set("name", Value::string("Hidden"));
    root.set("size", rec({{"x", Value::floating(1)}, {"y", Value::floating(2)}}));
    root.children.push_back(make_node("RECTANGLE", "0:2"));

    const TransformPipeline pipeline;
    const Node out = pipeline.run(root);
    EXPECT_FALSE(out.internal_only);
    EXPECT_EQ(out.field_count(), 0u);
    EXPECT_TRUE(out.children.empty());
    EXPECT_EQ(node_to_json(out), nlohmann::ordered_json::object());
    EXPECT_EQ(pipeline.run(out), out);
}

TEST(TransformPipelineTest, DisabledPassesAreSkipped) {
    TransformConfig cfg;
    cfg.strip_defaults = false;
    cfg.filter_internal = false;
    cfg.keep_ids = true;
    const Node out = TransformPipeline(cfg).run(sample_document());

    EXPECT_EQ(out.id, "0:0");
    const Node& page = out.children[0];
    EXPECT_NE(page.find("opacity"), nullptr);
    EXPECT_EQ(page.find("pluginData"), nullptr);
    EXPECT_EQ(page.children.size(), 3u);
}

TEST(TransformPipelineTest, DefaultTablesAreIsolatedPerPipeline) {
    TransformConfig custom;
    custom.defaults.add("name", Value::string("Page"));
    const TransformPipeline a(custom);
    const TransformPipeline b;

    EXPECT_EQ(a.run(sample_document()).children[0].find("name"), nullptr);
    EXPECT_NE(b.run(sample_document()).children[0].find("name"), nullptr);
    EXPECT_EQ(b.config().defaults.size(), DefaultTable::standard().size());
}

TEST(TransformPipelineTest, JsonLayout) {
    Node doc = make_node("DOCUMENT", "0:0");
    Node hidden = make_node("FRAME", "0:1");
    hidden.internal_only = true;
    hidden.set("size", rec({{"x", Value::floating(1)}, {"y", Value::floating(2)}}));
    hidden.set("name", Value::string("H"));
    hidden.raw_extras.push_back({"thumbnail", Value::integer(3)});
    doc.children.push_back(hidden);

    Fields extras;
    extras.push_back({"pasteID", Value::integer(5)});
    const auto j = document_to_json(doc, extras);

    EXPECT_EQ(j["id"], "0:0");
    EXPECT_EQ(j["type"], "DOCUMENT");
    EXPECT_FALSE(j.contains("internalOnly"));
    EXPECT_EQ(j["__document"]["pasteID"], 5);

    const auto& child = j["children"][0];
    EXPECT_EQ(child["internalOnly"], true);
    EXPECT_EQ(child["__extras"]["thumbnail"], 3);
    std::vector<std::string> keys;
    for (auto it = child.begin(); it != child.end(); ++it) {
        keys.push_back(it.key());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"id", "type", "internalOnly", "name", "size", "__extras"}));
}

TEST(TransformPipelineTest, FieldsNamedLikeOutputKeysAreRenamed) {
    Node frame = make_node("FRAME", "0:1");
    frame.set("id", Value::integer(5));
    frame.set("children", Value::array({Value::integer(1)}));
    frame.children.push_back(make_node("RECTANGLE", "0:2"));

    const auto j = node_to_json(frame);
    EXPECT_EQ(j["id"], "0:1");
    EXPECT_EQ(j["__field_id"], 5);
    EXPECT_EQ(j["__field_children"], nlohmann::ordered_json::parse("[1]"));
    ASSERT_EQ(j["children"].size(), 1u);
    EXPECT_EQ(j["children"][0]["type"], "RECTANGLE");
}

TEST(TransformPipelineTest, OutputKeyFieldWithoutNodeValueKeepsItsName) {
    Node frame = make_node("FRAME", "");
    frame.set("children", Value::array({Value::integer(1)}));

    const auto j = node_to_json(frame);
    EXPECT_EQ(j["children"], nlohmann::ordered_json::parse("[1]"));
    EXPECT_FALSE(j.contains("__field_children"));
}

TEST(TransformPipelineTest, OpaqueTypeFieldIsWrittenOnce) {
    Node future = make_node("FUTURE_NODE", "1:4");
    future.set("type", Value::string("FUTURE_NODE"));
    future.set("weight", Value::integer(2));

    const auto j = node_to_json(future);
    EXPECT_EQ(j["type"], "FUTURE_NODE");
    EXPECT_FALSE(j.contains("__field_type"));
    EXPECT_EQ(j["weight"], 2);
}

TEST(TransformPipelineTest, ScalarIdKeepsDecodedType) {
    Node n = make_node("FRAME", "7");
    n.id_value = Value::integer(7);
    EXPECT_EQ(node_to_json(n)["id"], 7);

    n.id_value = Value::string("seven");
    EXPECT_EQ(node_to_json(n)["id"], "seven");
}
