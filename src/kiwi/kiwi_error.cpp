/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#include "kiwi/kiwi_error.h"

namespace fig2json::kiwi {

std::string_view decode_error_kind_name(DecodeErrorKind kind) {
    switch (kind) {
        case DecodeErrorKind::MalformedSchema:
            return "MalformedSchema";
        case DecodeErrorKind::TruncatedStream:
            return "TruncatedStream";
        case DecodeErrorKind::UnknownRootType:
            return "UnknownRootType";
        case DecodeErrorKind::TypeMismatch:
            return "TypeMismatch";
        case DecodeErrorKind::UnknownTag:
            return "UnknownTag";
    }
    return "Unknown";
}

static std::string format_what(
    DecodeErrorKind kind,
    const std::string& message,
    std::size_t offset,
    const std::optional<std::uint32_t>& tag,
    const std::string& type_name
) {
    std::string out(decode_error_kind_name(kind));
    out += ": ";
    out += message;
    out += " (offset=";
    out += std::to_string(offset);
    if (tag.has_value()) {
        out += " tag=";
        out += std::to_string(*tag);
    }
    if (!type_name.empty()) {
        out += " type=";
        out += type_name;
    }
    out += ")";
    return out;
}

DecodeError::DecodeError(
    DecodeErrorKind kind,
    std::string message,
    std::size_t offset,
    std::optional<std::uint32_t> tag,
    std::string type_name
)
    : std::runtime_error(format_what(kind, message, offset, tag, type_name)),
      kind_(kind),
      message_(std::move(message)),
      offset_(offset),
      tag_(tag),
      type_name_(std::move(type_name)) {}

}  // namespace fig2json::kiwi
