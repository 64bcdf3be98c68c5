#include <gtest/gtest.h>
#include "kiwi/kiwi_schema_decoder.h"
#include "kiwi_test_util.h"

using namespace fig2json::kiwi;
using namespace fig2json::test_util;

namespace {

Schema sample_schema() {
    // Node references Paint, declared after it, and itself.
    return Schema({
        definition("BlendMode", DefinitionKind::Enum, {enum_value("NORMAL", 1), enum_value("MULTIPLY", 2)}),
        definition(
            "Node", DefinitionKind::Message,
            {
                builtin("name", BuiltinType::String, 1),
                ref("fills", 2, 2, true),
                ref("children", 1, 3, true),
                ref("blendMode", 0, 4),
            }
        ),
        definition(
            "Paint", DefinitionKind::Struct,
            {builtin("opacity", BuiltinType::Float), builtin("visible", BuiltinType::Bool)}
        ),
    });
}

void expect_malformed(const Blob& bytes) {
    try {
        decode_schema(bytes);
        FAIL() << "expected MalformedSchema";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.kind(), DecodeErrorKind::MalformedSchema) << e.what();
    }
}

}  // namespace

// ============================================================================
// Valid schemas
// ============================================================================

TEST(SchemaDecoderTest, DecodesForwardAndSelfReferences) {
    const Schema schema = decode_schema(encode_schema(sample_schema()));

    ASSERT_EQ(schema.size(), 3u);
    const Definition* node = schema.find(1);
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->name, "Node");
    EXPECT_EQ(node->kind, DefinitionKind::Message);

    const FieldDef* fills = node->field_by_tag(2);
    ASSERT_NE(fills, nullptr);
    EXPECT_EQ(fills->name, "fills");
    EXPECT_TRUE(fills->type.is_array);
    EXPECT_EQ(schema.type_name(fills->type), "Paint[]");
    EXPECT_EQ(schema.type_name(node->field_by_name("children")->type), "Node[]");

    const Definition* blend = schema.find(0);
    ASSERT_NE(blend->enum_name(2), nullptr);
    EXPECT_EQ(*blend->enum_name(2), "MULTIPLY");
    EXPECT_EQ(blend->enum_name(3), nullptr);
    EXPECT_EQ(schema.find_by_name("Paint"), std::optional<TypeId>(2));
}

TEST(SchemaDecoderTest, EmptyDefinitionListIsValid) {
    const Blob bytes{0x00};
    EXPECT_TRUE(decode_schema(bytes).empty());
}

TEST(SchemaDecoderTest, DeprecatedFlagSurvives) {
    auto f = builtin("old", BuiltinType::Int, 1);
    f.deprecated = true;
    const Schema schema = decode_schema(encode_schema(Schema({definition("M", DefinitionKind::Message, {f})})));
    EXPECT_TRUE(schema.find(0)->fields[0].deprecated);
}

TEST(SchemaDecoderTest, BootstrapSchemaDescribesItself) {
    const Schema schema = decode_schema(encode_schema(bootstrap_schema()));
    ASSERT_EQ(schema.size(), 3u);
    EXPECT_EQ(schema.find(0)->name, "Schema");
    EXPECT_EQ(schema.find(2)->fields.size(), 4u);
}

TEST(SchemaDecoderTest, SchemaJsonListsDefinitions) {
    const auto j = schema_to_json(sample_schema());
    ASSERT_EQ(j.size(), 3u);
    EXPECT_EQ(j[1]["name"], "Node");
    EXPECT_EQ(j[1]["kind"], "message");
    EXPECT_EQ(j[1]["fields"][1]["type"], "Paint[]");
    EXPECT_EQ(j[0]["fields"][0]["value"], 1);
}

// ============================================================================
// Structural violations
// ============================================================================

TEST(SchemaDecoderTest, EmptyBlobIsMalformed) {
    expect_malformed({});
}

TEST(SchemaDecoderTest, EveryTruncationIsMalformed) {
    const Blob full = encode_schema(sample_schema());
    for (std::size_t len = 0; len < full.size(); len++) {
        const Blob prefix(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(len));
        expect_malformed(prefix);
    }
}

TEST(SchemaDecoderTest, TrailingBytesAreMalformed) {
    Blob bytes = encode_schema(sample_schema());
    bytes.push_back(0x00);
    expect_malformed(bytes);
}

TEST(SchemaDecoderTest, InvalidDefinitionKind) {
    expect_malformed(encode_schema(Schema({definition("X", static_cast<DefinitionKind>(3), {})})));
}

TEST(SchemaDecoderTest, UnknownFlagBits) {
    fig2json::kiwi::ByteWriter w;
    w.write_varuint(1);
    w.write_string("M");
    w.write_byte(static_cast<std::uint8_t>(DefinitionKind::Message));
    w.write_varuint(1);
    w.write_string("f");
    w.write_varint(static_cast<std::int32_t>(BuiltinType::Int));
    w.write_byte(0x04);
    w.write_varuint(1);
    expect_malformed(w.to_bytes());
}

TEST(SchemaDecoderTest, UnknownBuiltinTypeCode) {
    expect_malformed(encode_schema(Schema({
        definition("M", DefinitionKind::Message, {field("f", TypeRef{-11, false}, 1)}),
    })));
}

TEST(SchemaDecoderTest, DanglingTypeReference) {
    expect_malformed(encode_schema(Schema({
        definition("M", DefinitionKind::Message, {ref("f", 5, 1)}),
    })));
}

TEST(SchemaDecoderTest, FieldTagCollision) {
    expect_malformed(encode_schema(Schema({
        definition(
            "M", DefinitionKind::Message,
            {builtin("a", BuiltinType::Int, 1), builtin("b", BuiltinType::String, 1)}
        ),
    })));
}

TEST(SchemaDecoderTest, EnumValueCollision) {
    expect_malformed(encode_schema(Schema({
        definition("E", DefinitionKind::Enum, {enum_value("A", 0), enum_value("B", 0)}),
    })));
}

TEST(SchemaDecoderTest, StructFieldsMayShareTheUnusedValue) {
    const Schema schema = decode_schema(encode_schema(Schema({
        definition(
            "S", DefinitionKind::Struct,
            {builtin("x", BuiltinType::Float), builtin("y", BuiltinType::Float)}
        ),
    })));
    EXPECT_EQ(schema.find(0)->fields.size(), 2u);
}

TEST(SchemaDecoderTest, DuplicateDefinitionName) {
    expect_malformed(encode_schema(Schema({
        definition("M", DefinitionKind::Message, {}),
        definition("M", DefinitionKind::Struct, {}),
    })));
}

TEST(SchemaDecoderTest, EmptyNames) {
    expect_malformed(encode_schema(Schema({definition("", DefinitionKind::Message, {})})));
    expect_malformed(encode_schema(Schema({
        definition("M", DefinitionKind::Message, {builtin("", BuiltinType::Int, 1)}),
    })));
}

TEST(SchemaDecoderTest, OutOfRangeIntIsMalformed) {
    fig2json::kiwi::ByteWriter w;
    w.write_varuint(1);
    w.write_string("M");
    w.write_byte(static_cast<std::uint8_t>(DefinitionKind::Message));
    w.write_varuint(1);
    w.write_string("f");
    w.write_varint(std::int64_t{1} << 40);
    w.write_byte(0);
    w.write_varuint(1);
    expect_malformed(w.to_bytes());
}
