/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fig2json::kiwi {

enum class DecodeErrorKind {
    MalformedSchema,
    TruncatedStream,
    UnknownRootType,
    TypeMismatch,
    UnknownTag,
};

std::string_view decode_error_kind_name(DecodeErrorKind kind);

// Fatal decode failure. Carries where in the blob it happened and which record was open.
class DecodeError : public std::runtime_error {
   public:
    DecodeError(
        DecodeErrorKind kind,
        std::string message,
        std::size_t offset,
        std::optional<std::uint32_t> tag = std::nullopt,
        std::string type_name = {}
    );

    DecodeErrorKind kind() const { return kind_; }
    std::size_t offset() const { return offset_; }
    std::optional<std::uint32_t> tag() const { return tag_; }
    const std::string& type_name() const { return type_name_; }
    const std::string& message() const { return message_; }

   private:
    DecodeErrorKind kind_;
    std::string message_;
    std::size_t offset_ = 0;
    std::optional<std::uint32_t> tag_;
    std::string type_name_;
};

}  // namespace fig2json::kiwi
