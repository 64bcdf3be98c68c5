/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "kiwi/kiwi_value_decoder.h"

#include "kiwi/kiwi_byte_reader.h"
#include "utils/log.h"

#include <limits>
#include <unordered_set>

namespace fig2json::kiwi {
namespace {

constexpr std::uint64_t kMaxZeroSizeElements = 1u << 20;

class ValueDecoder {
   public:
    ValueDecoder(const Schema& schema, const DecodeOptions& opt, DecodeStats& stats)
        : schema_(schema), opt_(opt), stats_(stats) {}

    Value decode(ByteReader& reader, const TypeRef& ref) {
        if (ref.is_array) {
            return decode_array(reader, ref);
        }
        return decode_single(reader, ref);
    }

   private:
    struct DepthGuard {
        DepthGuard(ValueDecoder& d, const ByteReader& reader) : dec(d) {
            if (++dec.depth_ > dec.opt_.max_depth) {
                --dec.depth_;
                throw DecodeError(
                    DecodeErrorKind::TypeMismatch,
                    "Nesting depth limit " + std::to_string(dec.opt_.max_depth) + " exceeded",
                    reader.offset()
                );
            }
        }
        ~DepthGuard() { --dec.depth_; }
        ValueDecoder& dec;
    };

    const Definition& definition(TypeId id, std::size_t offset) const {
        const Definition* def = schema_.find(id);
        if (!def) {
            throw DecodeError(
                DecodeErrorKind::TypeMismatch,
                "Reference to undeclared type #" + std::to_string(id), offset
            );
        }
        return *def;
    }

    Value decode_array(ByteReader& reader, const TypeRef& ref) {
        DepthGuard guard(*this, reader);
        const std::size_t start = reader.offset();
        const std::uint64_t count = reader.read_varuint();
        TypeRef elem = ref;
        elem.is_array = false;

        std::unordered_set<TypeId> visiting;
        const std::size_t min_size = min_encoded_size(elem, visiting);
        if (min_size > 0) {
            if (count > reader.remaining() / min_size) {
                throw DecodeError(
                    DecodeErrorKind::TruncatedStream,
                    "Array of " + std::to_string(count) + " " + schema_.type_name(elem)
                        + " does not fit in the remaining " + std::to_string(reader.remaining())
                        + " bytes",
                    start
                );
            }
        } else if (count > kMaxZeroSizeElements) {
            throw DecodeError(
                DecodeErrorKind::TypeMismatch,
                "Unrealistic element count " + std::to_string(count), start
            );
        }

        Array items;
        items.reserve(static_cast<std::size_t>(count));
        for (std::uint64_t i = 0; i < count; i++) {
            items.push_back(decode_single(reader, elem));
        }
        return Value::array(std::move(items));
    }

    Value decode_single(ByteReader& reader, const TypeRef& ref) {
        if (ref.is_builtin()) {
            return decode_builtin(reader, ref.builtin());
        }
        const Definition& def = definition(ref.type_id(), reader.offset());
        switch (def.kind) {
            case DefinitionKind::Enum:
                return decode_enum(reader, def);
            case DefinitionKind::Struct:
                return decode_struct(reader, ref.type_id(), def);
            case DefinitionKind::Message:
                return decode_message(reader, ref.type_id(), def);
        }
        throw DecodeError(DecodeErrorKind::TypeMismatch, "Invalid definition kind", reader.offset());
    }

    Value decode_builtin(ByteReader& reader, BuiltinType type) {
        const std::size_t start = reader.offset();
        switch (type) {
            case BuiltinType::Bool: {
                const std::uint8_t b = reader.read_byte();
                if (b > 1) {
                    throw DecodeError(
                        DecodeErrorKind::TypeMismatch,
                        "Invalid bool byte " + std::to_string(static_cast<unsigned>(b)), start
                    );
                }
                return Value::boolean(b != 0);
            }
            case BuiltinType::Byte:
                return Value::integer(reader.read_byte());
            case BuiltinType::Int: {
                const std::int64_t v = reader.read_varint();
                if (v < std::numeric_limits<std::int32_t>::min()
                    || v > std::numeric_limits<std::int32_t>::max()) {
                    throw DecodeError(
                        DecodeErrorKind::TypeMismatch,
                        "int value " + std::to_string(v) + " out of 32-bit range", start
                    );
                }
                return Value::integer(v);
            }
            case BuiltinType::UInt: {
                const std::uint64_t v = reader.read_varuint();
                if (v > std::numeric_limits<std::uint32_t>::max()) {
                    throw DecodeError(
                        DecodeErrorKind::TypeMismatch,
                        "uint value " + std::to_string(v) + " out of 32-bit range", start
                    );
                }
                return Value::integer(static_cast<std::int64_t>(v));
            }
            case BuiltinType::Float:
                return Value::floating(static_cast<double>(reader.read_f32()));
            case BuiltinType::String:
                return Value::string(reader.read_string());
            case BuiltinType::Int64:
                return Value::integer(reader.read_varint());
            case BuiltinType::UInt64:
                return Value::integer(static_cast<std::int64_t>(reader.read_varuint()));
            case BuiltinType::Double:
                return Value::floating(reader.read_f64());
            case BuiltinType::Bytes: {
                const auto raw = reader.read_length_prefixed();
                return Value::bytes(Bytes(raw.begin(), raw.end()));
            }
        }
        throw DecodeError(
            DecodeErrorKind::TypeMismatch,
            "Unknown builtin type code " + std::to_string(static_cast<int>(type)), start
        );
    }

    Value decode_enum(ByteReader& reader, const Definition& def) {
        const std::uint64_t raw = reader.read_varuint();
        if (raw <= std::numeric_limits<std::uint32_t>::max()) {
            if (const std::string* name = def.enum_name(static_cast<std::uint32_t>(raw))) {
                return Value::string(*name);
            }
        }
        // Enum sets grow between writer versions; keep the number rather than failing.
        stats_.preserved_enum_values++;
        if (opt_.debug) {
            FIG2JSON_LOG_DEBUG(
                "Enum %s: value %llu not declared, kept as integer", def.name.c_str(),
                static_cast<unsigned long long>(raw)
            );
        }
        return Value::integer(static_cast<std::int64_t>(raw));
    }

    Value decode_struct(ByteReader& reader, TypeId id, const Definition& def) {
        DepthGuard guard(*this, reader);
        stats_.records++;
        Fields fields;
        fields.reserve(def.fields.size());
        try {
            for (const auto& f : def.fields) {
                fields.push_back(Field{f.name, decode(reader, f.type)});
            }
        } catch (const DecodeError& e) {
            if (!e.type_name().empty()) {
                throw;
            }
            throw DecodeError(e.kind(), e.message(), e.offset(), e.tag(), def.name);
        }
        return Value::record(id, std::move(fields));
    }

    Value decode_message(ByteReader& reader, TypeId id, const Definition& def) {
        DepthGuard guard(*this, reader);
        stats_.records++;
        Fields fields;
        std::optional<std::uint32_t> current_tag;
        try {
            const std::size_t count_offset = reader.offset();
            const std::uint64_t count = reader.read_varuint();
            if (count > reader.remaining()) {
                throw DecodeError(
                    DecodeErrorKind::TruncatedStream,
                    "Message declares " + std::to_string(count) + " fields but only "
                        + std::to_string(reader.remaining()) + " bytes remain",
                    count_offset
                );
            }
            fields.reserve(static_cast<std::size_t>(count));

            for (std::uint64_t i = 0; i < count; i++) {
                current_tag.reset();
                const std::size_t key_offset = reader.offset();
                const std::uint64_t key = reader.read_varuint();
                const std::uint64_t tag64 = key >> 3;
                const std::uint8_t wire = static_cast<std::uint8_t>(key & 0x7u);
                if (tag64 > std::numeric_limits<std::uint32_t>::max()) {
                    throw DecodeError(
                        DecodeErrorKind::UnknownTag, "Field tag out of range", key_offset
                    );
                }
                const auto tag = static_cast<std::uint32_t>(tag64);
                current_tag = tag;

                const FieldDef* field = def.field_by_tag(tag);
                if (!field) {
                    skip_unknown(reader, fields, tag, wire, key_offset);
                    continue;
                }

                const WireKind expected = wire_kind_of(schema_, field->type);
                if (wire != static_cast<std::uint8_t>(expected)) {
                    throw DecodeError(
                        DecodeErrorKind::TypeMismatch,
                        "Field '" + field->name + "' of type " + schema_.type_name(field->type)
                            + " expects wire kind " + std::string(wire_kind_name(expected))
                            + ", got " + std::to_string(static_cast<unsigned>(wire)),
                        key_offset, tag
                    );
                }
                if (find_field(fields, field->name)) {
                    throw DecodeError(
                        DecodeErrorKind::TypeMismatch,
                        "Field '" + field->name + "' appears twice", key_offset, tag
                    );
                }

                fields.push_back(Field{field->name, decode_field_value(reader, *field, expected)});
            }
        } catch (const DecodeError& e) {
            if (!e.type_name().empty()) {
                throw;
            }
            throw DecodeError(
                e.kind(), e.message(), e.offset(), e.tag().has_value() ? e.tag() : current_tag,
                def.name
            );
        }
        return Value::record(id, std::move(fields));
    }

    Value decode_field_value(ByteReader& reader, const FieldDef& field, WireKind wire) {
        const bool framed = wire == WireKind::Length
                            && (field.type.is_array || !field.type.is_builtin());
        if (!framed) {
            return decode(reader, field.type);
        }
        ByteReader window = reader.read_window();
        Value v = decode(window, field.type);
        if (!window.at_end()) {
            throw DecodeError(
                DecodeErrorKind::TypeMismatch,
                "Field '" + field.name + "' left " + std::to_string(window.remaining())
                    + " unread bytes in its length-delimited value",
                window.offset(), field.value
            );
        }
        return v;
    }

    void skip_unknown(
        ByteReader& reader,
        Fields& fields,
        std::uint32_t tag,
        std::uint8_t wire,
        std::size_t key_offset
    ) {
        if (opt_.strict_unknown_tags) {
            throw DecodeError(
                DecodeErrorKind::UnknownTag, "Field tag not declared by schema", key_offset, tag
            );
        }
        const std::size_t value_pos = reader.position();
        switch (static_cast<WireKind>(wire)) {
            case WireKind::Varint:
                reader.read_varuint();
                break;
            case WireKind::Fixed8:
                reader.skip(1);
                break;
            case WireKind::Fixed32:
                reader.skip(4);
                break;
            case WireKind::Fixed64:
                reader.skip(8);
                break;
            case WireKind::Length:
                reader.read_length_prefixed();
                break;
            default:
                throw DecodeError(
                    DecodeErrorKind::UnknownTag,
                    "Undeclared field has invalid wire kind " + std::to_string(wire)
                        + " and cannot be skipped",
                    key_offset, tag
                );
        }
        stats_.skipped_unknown_fields++;
        if (opt_.debug) {
            FIG2JSON_LOG_DEBUG(
                "Skipped undeclared field tag=%u wire=%u at offset %zu", tag,
                static_cast<unsigned>(wire), key_offset
            );
        }
        if (opt_.keep_unknown_fields) {
            const auto raw = reader.consumed_since(value_pos);
            set_field(
                fields, std::string(kUnknownFieldPrefix) + std::to_string(tag),
                Value::bytes(Bytes(raw.begin(), raw.end()))
            );
        }
    }

    std::size_t min_encoded_size(const TypeRef& ref, std::unordered_set<TypeId>& visiting) const {
        if (ref.is_array || ref.is_builtin()) {
            return 1;
        }
        const Definition* def = schema_.find(ref.type_id());
        if (!def || def->kind != DefinitionKind::Struct) {
            return 1;
        }
        if (!visiting.insert(ref.type_id()).second) {
            return 0;
        }
        std::size_t total = 0;
        for (const auto& f : def->fields) {
            total += min_encoded_size(f.type, visiting);
        }
        visiting.erase(ref.type_id());
        return total;
    }

    const Schema& schema_;
    const DecodeOptions& opt_;
    DecodeStats& stats_;
    int depth_ = 0;
};

}  // namespace

Value decode_value(
    const Schema& schema,
    std::span<const std::uint8_t> data,
    TypeId root,
    const DecodeOptions& opt,
    DecodeStats* out_stats
) {
    const Definition* def = schema.find(root);
    if (!def || def->kind == DefinitionKind::Enum) {
        throw DecodeError(
            DecodeErrorKind::UnknownRootType,
            "Root type #" + std::to_string(root) + " is not a struct or message in a schema of "
                + std::to_string(schema.size()) + " definitions",
            0
        );
    }

    DecodeStats stats{};
    ByteReader reader(data);
    ValueDecoder decoder(schema, opt, stats);
    Value out = decoder.decode(reader, TypeRef::of(root));
    stats.bytes_consumed = reader.position();

    if (!reader.at_end() && opt.debug) {
        FIG2JSON_LOG_DEBUG(
            "%zu trailing bytes after root %s", reader.remaining(), def->name.c_str()
        );
    }
    if (out_stats) {
        *out_stats = stats;
    }
    return out;
}

TypeId find_root_type(const Schema& schema, std::string_view name) {
    const auto id = schema.find_by_name(name);
    if (!id.has_value()) {
        throw DecodeError(
            DecodeErrorKind::UnknownRootType,
            "Schema has no definition named '" + std::string(name) + "'", 0
        );
    }
    const Definition* def = schema.find(*id);
    if (def->kind == DefinitionKind::Enum) {
        throw DecodeError(
            DecodeErrorKind::UnknownRootType,
            "Definition '" + std::string(name) + "' is an enum and cannot be a root", 0
        );
    }
    return *id;
}

}  // namespace fig2json::kiwi
