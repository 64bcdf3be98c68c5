/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include "kiwi/kiwi_error.h"

#include <cstdint>
#include <cstring>
#include <span>
#include <string>

namespace fig2json::kiwi {
// Forward-only cursor over a kiwi blob. Offsets are reported relative to the start of the
// outermost blob so that sub-windows still point at the right byte in errors.
class ByteReader {
   public:
    explicit ByteReader(std::span<const std::uint8_t> data, std::size_t base_offset = 0)
        : _data(data), _pos(0), _base(base_offset) {}

    std::size_t position() const { return _pos; }
    std::size_t offset() const { return _base + _pos; }
    std::size_t size() const { return _data.size(); }
    std::size_t remaining() const { return _data.size() - _pos; }
    bool at_end() const { return _pos >= _data.size(); }

    std::uint8_t read_byte() {
        require(1);
        return _data[_pos++];
    }

    std::uint64_t read_varuint() {
        const std::size_t start = offset();
        std::uint64_t value = 0;
        for (int i = 0; i < 10; i++) {
            if (at_end()) {
                throw DecodeError(
                    DecodeErrorKind::TruncatedStream, "Unexpected EOF inside varint", start
                );
            }
            const std::uint8_t b = _data[_pos++];
            if (i == 9 && (b & 0xFEu) != 0) {
                throw DecodeError(DecodeErrorKind::TypeMismatch, "varint overflows 64 bits", start);
            }
            value |= static_cast<std::uint64_t>(b & 0x7Fu) << (7 * i);
            if ((b & 0x80u) == 0) {
                return value;
            }
        }
        throw DecodeError(DecodeErrorKind::TypeMismatch, "varint longer than 10 bytes", start);
    }

    std::int64_t read_varint() {
        const std::uint64_t v = read_varuint();
        return static_cast<std::int64_t>(v >> 1) ^ -static_cast<std::int64_t>(v & 1u);
    }

    float read_f32() {
        require(4);
        std::uint32_t bits = 0;
        for (int i = 0; i < 4; i++) {
            bits |= static_cast<std::uint32_t>(_data[_pos + static_cast<std::size_t>(i)]) << (8 * i);
        }
        _pos += 4;
        float out = 0.0f;
        std::memcpy(&out, &bits, sizeof(out));
        return out;
    }

    double read_f64() {
        require(8);
        std::uint64_t bits = 0;
        for (int i = 0; i < 8; i++) {
            bits |= static_cast<std::uint64_t>(_data[_pos + static_cast<std::size_t>(i)]) << (8 * i);
        }
        _pos += 8;
        double out = 0.0;
        std::memcpy(&out, &bits, sizeof(out));
        return out;
    }

    std::span<const std::uint8_t> read_bytes(std::size_t count) {
        require(count);
        const auto out = _data.subspan(_pos, count);
        _pos += count;
        return out;
    }

    // varuint length followed by that many bytes.
    std::span<const std::uint8_t> read_length_prefixed() {
        const std::size_t start = offset();
        const std::uint64_t len = read_varuint();
        if (len > remaining()) {
            throw DecodeError(
                DecodeErrorKind::TruncatedStream,
                "Length prefix " + std::to_string(len) + " exceeds remaining "
                    + std::to_string(remaining()) + " bytes",
                start
            );
        }
        return read_bytes(static_cast<std::size_t>(len));
    }

    std::string read_string() {
        const auto bytes = read_length_prefixed();
        return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

    // Consumes a length-prefixed window and returns a reader confined to it.
    ByteReader read_window() {
        const auto bytes = read_length_prefixed();
        return ByteReader(bytes, offset() - bytes.size());
    }

    void skip(std::size_t count) { read_bytes(count); }

    // Bytes consumed between an earlier position() and now.
    std::span<const std::uint8_t> consumed_since(std::size_t start_pos) const {
        if (start_pos > _pos) {
            return {};
        }
        return _data.subspan(start_pos, _pos - start_pos);
    }

   private:
    void require(std::size_t count) const {
        if (count > remaining()) {
            throw DecodeError(
                DecodeErrorKind::TruncatedStream,
                "Unexpected EOF: need " + std::to_string(count) + " bytes, have "
                    + std::to_string(remaining()),
                offset()
            );
        }
    }

    std::span<const std::uint8_t> _data;
    std::size_t _pos;
    std::size_t _base;
};
}  // namespace fig2json::kiwi
