#include <gtest/gtest.h>
#include "kiwi/kiwi_error.h"
#include "kiwi/kiwi_value_decoder.h"
#include "kiwi/kiwi_value_json.h"
#include "kiwi_test_util.h"

#include <cmath>
#include <limits>

using namespace fig2json::kiwi;
using namespace fig2json::test_util;

namespace {

constexpr TypeId kColor = 0;
constexpr TypeId kBlendMode = 1;
constexpr TypeId kNode = 2;

Schema node_schema() {
    return Schema({
        definition(
            "Color", DefinitionKind::Struct,
            {
                builtin("r", BuiltinType::Float),
                builtin("g", BuiltinType::Float),
                builtin("b", BuiltinType::Float),
                builtin("a", BuiltinType::Float),
            }
        ),
        definition("BlendMode", DefinitionKind::Enum, {enum_value("NORMAL", 1), enum_value("MULTIPLY", 2)}),
        definition(
            "Node", DefinitionKind::Message,
            {
                builtin("name", BuiltinType::String, 1),
                builtin("visible", BuiltinType::Bool, 2),
                builtin("opacity", BuiltinType::Float, 3),
                ref("color", kColor, 4),
                ref("blendMode", kBlendMode, 5),
                ref("children", kNode, 6, true),
                builtin("count", BuiltinType::Int, 7),
                builtin("size", BuiltinType::UInt, 8),
                builtin("big", BuiltinType::Int64, 9),
                builtin("data", BuiltinType::Bytes, 10),
                builtin("weight", BuiltinType::Double, 11),
                builtin("tags", BuiltinType::String, 12, true),
            }
        ),
    });
}

Blob color(float r, float g, float b, float a) {
    ByteWriter w;
    w.write_f32(r);
    w.write_f32(g);
    w.write_f32(b);
    w.write_f32(a);
    return w.to_bytes();
}

Blob string_array(const std::vector<std::string>& items) {
    ByteWriter w;
    w.write_varuint(items.size());
    for (const auto& s : items) {
        w.write_string(s);
    }
    return w.to_bytes();
}

Blob full_node() {
    const Blob child_a = MessageWriter().string_field(1, "a").finish();
    const Blob child_b = MessageWriter().string_field(1, "b").bool_field(2, false).finish();
    return MessageWriter()
        .string_field(1, "root")
        .bool_field(2, true)
        .float_field(3, 0.5f)
        .nested_field(4, color(1.0f, 0.0f, 0.25f, 1.0f))
        .uint_field(5, 2)
        .nested_field(6, encode_array({child_a, child_b}))
        .int_field(7, -42)
        .uint_field(8, 4000000000u)
        .int_field(9, std::int64_t{1} << 40)
        .bytes_field(10, Blob{0xDE, 0xAD})
        .double_field(11, 2.5)
        .nested_field(12, string_array({"x", "y"}))
        .finish();
}

DecodeError expect_error(const Blob& data, const DecodeOptions& opt = {}) {
    try {
        decode_value(node_schema(), data, kNode, opt);
    } catch (const DecodeError& e) {
        return e;
    }
    ADD_FAILURE() << "expected DecodeError";
    return DecodeError(DecodeErrorKind::MalformedSchema, "none", 0);
}

}  // namespace

// ============================================================================
// Successful decoding
// ============================================================================

TEST(ValueDecoderTest, DecodesEveryFieldKind) {
    DecodeStats stats{};
    const Blob data = full_node();
    const Value v = decode_value(node_schema(), data, kNode, {}, &stats);

    ASSERT_TRUE(v.is_record());
    EXPECT_EQ(v.as_record().type_id, kNode);
    EXPECT_EQ(v.find("name")->as_string(), "root");
    EXPECT_TRUE(v.find("visible")->as_bool());
    EXPECT_DOUBLE_EQ(v.find("opacity")->as_float(), 0.5);
    EXPECT_EQ(v.find("blendMode")->as_string(), "MULTIPLY");
    EXPECT_EQ(v.find("count")->as_int(), -42);
    EXPECT_EQ(v.find("size")->as_int(), 4000000000LL);
    EXPECT_EQ(v.find("big")->as_int(), std::int64_t{1} << 40);
    EXPECT_EQ(v.find("data")->as_bytes(), (Bytes{0xDE, 0xAD}));
    EXPECT_DOUBLE_EQ(v.find("weight")->as_float(), 2.5);

    const Value* c = v.find("color");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->as_record().type_id, kColor);
    EXPECT_DOUBLE_EQ(c->find("b")->as_float(), 0.25);

    const auto& children = v.find("children")->as_array();
    ASSERT_EQ(children.size(), 2u);
    EXPECT_EQ(children[0].find("name")->as_string(), "a");
    EXPECT_EQ(children[0].find("children"), nullptr);
    EXPECT_FALSE(children[1].find("visible")->as_bool());

    const auto& tags = v.find("tags")->as_array();
    ASSERT_EQ(tags.size(), 2u);
    EXPECT_EQ(tags[1].as_string(), "y");

    EXPECT_EQ(stats.bytes_consumed, data.size());
    EXPECT_EQ(stats.records, 4u);
    EXPECT_EQ(stats.skipped_unknown_fields, 0u);
}

TEST(ValueDecoderTest, FieldsKeepWireOrder) {
    const Blob data = MessageWriter().int_field(7, 1).string_field(1, "n").finish();
    const Value v = decode_value(node_schema(), data, kNode);
    const auto& fields = v.as_record().fields;
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_EQ(fields[0].name, "count");
    EXPECT_EQ(fields[1].name, "name");
}

TEST(ValueDecoderTest, EmptyMessageHasNoFields) {
    const Blob data{0x00};
    const Value v = decode_value(node_schema(), data, kNode);
    EXPECT_TRUE(v.as_record().fields.empty());
}

TEST(ValueDecoderTest, StructRoot) {
    const Blob data = color(0.0f, 0.5f, 1.0f, 1.0f);
    const Value v = decode_value(node_schema(), data, kColor);
    ASSERT_EQ(v.as_record().fields.size(), 4u);
    EXPECT_EQ(v.as_record().fields[1].name, "g");
}

TEST(ValueDecoderTest, DecodingIsDeterministic) {
    const Blob data = full_node();
    const Value a = decode_value(node_schema(), data, kNode);
    const Value b = decode_value(node_schema(), data, kNode);
    EXPECT_EQ(a, b);
    EXPECT_EQ(value_to_json(a).dump(), value_to_json(b).dump());
}

TEST(ValueDecoderTest, JsonRendering) {
    const Blob data = MessageWriter()
                          .bytes_field(10, Blob{'M', 'a', 'n'})
                          .double_field(11, std::numeric_limits<double>::quiet_NaN())
                          .uint_field(5, 1)
                          .finish();
    const auto j = value_to_json(decode_value(node_schema(), data, kNode));
    EXPECT_EQ(j["data"], "TWFu");
    EXPECT_TRUE(j["weight"].is_null());
    EXPECT_EQ(j["blendMode"], "NORMAL");
}

// ============================================================================
// Schema evolution
// ============================================================================

TEST(ValueDecoderTest, UnknownTagsAreSkippedByDefault) {
    DecodeStats stats{};
    const Blob data = MessageWriter()
                          .string_field(1, "n")
                          .raw_field(40, static_cast<std::uint8_t>(WireKind::Varint), Blob{0xAC, 0x02})
                          .raw_field(41, static_cast<std::uint8_t>(WireKind::Length), Blob{0x02, 0x01, 0x02})
                          .raw_field(42, static_cast<std::uint8_t>(WireKind::Fixed32), Blob{1, 2, 3, 4})
                          .int_field(7, 3)
                          .finish();
    const Value v = decode_value(node_schema(), data, kNode, {}, &stats);

    ASSERT_EQ(v.as_record().fields.size(), 2u);
    EXPECT_EQ(v.find("count")->as_int(), 3);
    EXPECT_EQ(stats.skipped_unknown_fields, 3u);
    EXPECT_EQ(stats.bytes_consumed, data.size());
}

TEST(ValueDecoderTest, UnknownTagsCanBeKept) {
    DecodeOptions opt;
    opt.keep_unknown_fields = true;
    const Blob data = MessageWriter()
                          .raw_field(40, static_cast<std::uint8_t>(WireKind::Length), Blob{0x02, 0x01, 0x02})
                          .raw_field(41, static_cast<std::uint8_t>(WireKind::Fixed8), Blob{0x07})
                          .finish();
    const Value v = decode_value(node_schema(), data, kNode, opt);

    const Value* kept = v.find("__unknown_40");
    ASSERT_NE(kept, nullptr);
    EXPECT_EQ(kept->as_bytes(), (Bytes{0x02, 0x01, 0x02}));
    EXPECT_EQ(v.find("__unknown_41")->as_bytes(), (Bytes{0x07}));
}

TEST(ValueDecoderTest, StrictModeRejectsUnknownTags) {
    DecodeOptions opt;
    opt.strict_unknown_tags = true;
    const Blob data = MessageWriter()
                          .raw_field(40, static_cast<std::uint8_t>(WireKind::Varint), Blob{0x01})
                          .finish();
    const DecodeError e = expect_error(data, opt);
    EXPECT_EQ(e.kind(), DecodeErrorKind::UnknownTag);
    EXPECT_EQ(e.tag(), std::optional<std::uint32_t>(40));
    EXPECT_EQ(e.type_name(), "Node");
}

TEST(ValueDecoderTest, UnknownTagWithInvalidWireKindCannotBeSkipped) {
    const Blob data = MessageWriter().raw_field(40, 6, Blob{0x01}).finish();
    const DecodeError e = expect_error(data);
    EXPECT_EQ(e.kind(), DecodeErrorKind::UnknownTag);
    EXPECT_EQ(e.tag(), std::optional<std::uint32_t>(40));
}

TEST(ValueDecoderTest, UndeclaredEnumValueIsKeptAsInteger) {
    DecodeStats stats{};
    const Blob data = MessageWriter().uint_field(5, 9).finish();
    const Value v = decode_value(node_schema(), data, kNode, {}, &stats);
    EXPECT_EQ(v.find("blendMode")->kind(), ValueKind::Int);
    EXPECT_EQ(v.find("blendMode")->as_int(), 9);
    EXPECT_EQ(stats.preserved_enum_values, 1u);
}

// ============================================================================
// Failures
// ============================================================================

TEST(ValueDecoderTest, EveryPrefixIsTruncated) {
    const Blob full = full_node();
    for (std::size_t len = 0; len < full.size(); len++) {
        const Blob prefix(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(len));
        const DecodeError e = expect_error(prefix);
        EXPECT_EQ(e.kind(), DecodeErrorKind::TruncatedStream) << "prefix length " << len;
    }
}

TEST(ValueDecoderTest, WireKindMismatchNamesFieldAndRecord) {
    const Blob data = MessageWriter().string_field(1, "ok").int_field(3, 1).finish();
    const DecodeError e = expect_error(data);
    EXPECT_EQ(e.kind(), DecodeErrorKind::TypeMismatch);
    EXPECT_EQ(e.tag(), std::optional<std::uint32_t>(3));
    EXPECT_EQ(e.type_name(), "Node");
    EXPECT_NE(std::string(e.what()).find("opacity"), std::string::npos);
}

TEST(ValueDecoderTest, DuplicateTagIsRejected) {
    const Blob data = MessageWriter().string_field(1, "a").string_field(1, "b").finish();
    const DecodeError e = expect_error(data);
    EXPECT_EQ(e.kind(), DecodeErrorKind::TypeMismatch);
    EXPECT_EQ(e.tag(), std::optional<std::uint32_t>(1));
}

TEST(ValueDecoderTest, InvalidBoolByte) {
    const Blob data = MessageWriter()
                          .raw_field(2, static_cast<std::uint8_t>(WireKind::Fixed8), Blob{0x02})
                          .finish();
    EXPECT_EQ(expect_error(data).kind(), DecodeErrorKind::TypeMismatch);
}

TEST(ValueDecoderTest, IntOutOfRange) {
    EXPECT_EQ(
        expect_error(MessageWriter().int_field(7, std::int64_t{1} << 33).finish()).kind(),
        DecodeErrorKind::TypeMismatch
    );
    EXPECT_EQ(
        expect_error(MessageWriter().uint_field(8, std::uint64_t{1} << 32).finish()).kind(),
        DecodeErrorKind::TypeMismatch
    );
}

TEST(ValueDecoderTest, StructWindowMustBeConsumedExactly) {
    Blob padded = color(1.0f, 1.0f, 1.0f, 1.0f);
    padded.push_back(0x00);
    const DecodeError e = expect_error(MessageWriter().nested_field(4, padded).finish());
    EXPECT_EQ(e.kind(), DecodeErrorKind::TypeMismatch);
    EXPECT_EQ(e.tag(), std::optional<std::uint32_t>(4));
}

TEST(ValueDecoderTest, ShortStructWindowNamesTheStruct) {
    Blob shortened = color(1.0f, 1.0f, 1.0f, 1.0f);
    shortened.resize(12);
    const DecodeError e = expect_error(MessageWriter().nested_field(4, shortened).finish());
    EXPECT_EQ(e.kind(), DecodeErrorKind::TruncatedStream);
    EXPECT_EQ(e.type_name(), "Color");
}

TEST(ValueDecoderTest, OversizedArrayCountIsTruncated) {
    ByteWriter arr;
    arr.write_varuint(1000);
    arr.write_byte(0x00);
    const DecodeError e = expect_error(MessageWriter().nested_field(6, arr.to_bytes()).finish());
    EXPECT_EQ(e.kind(), DecodeErrorKind::TruncatedStream);
}

TEST(ValueDecoderTest, NestingDepthIsLimited) {
    const Blob leaf = MessageWriter().string_field(1, "leaf").nested_field(6, encode_array({})).finish();
    const Blob mid = MessageWriter().nested_field(6, encode_array({leaf})).finish();
    const Blob root = MessageWriter().nested_field(6, encode_array({mid})).finish();

    EXPECT_NO_THROW(decode_value(node_schema(), root, kNode));

    DecodeOptions opt;
    opt.max_depth = 3;
    EXPECT_EQ(expect_error(root, opt).kind(), DecodeErrorKind::TypeMismatch);
}

TEST(ValueDecoderTest, RootMustBeStructOrMessage) {
    const Blob data{0x00};
    try {
        decode_value(node_schema(), data, kBlendMode);
        FAIL() << "enum root accepted";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.kind(), DecodeErrorKind::UnknownRootType);
    }
    try {
        decode_value(node_schema(), data, 42);
        FAIL() << "missing root accepted";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.kind(), DecodeErrorKind::UnknownRootType);
    }
}

TEST(ValueDecoderTest, FindRootType) {
    const Schema schema = node_schema();
    EXPECT_EQ(find_root_type(schema, "Node"), kNode);
    EXPECT_THROW(find_root_type(schema, "Message"), DecodeError);
    EXPECT_THROW(find_root_type(schema, "BlendMode"), DecodeError);
}
