/**
 * Copyright (c) 2026 Cr4nkSt4r - fig2json
 */
#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>
#include <vector>

namespace fig2json::kiwi {
class ByteWriter {
   public:
    explicit ByteWriter(std::size_t initial_bytes = 256) { buf_.reserve(initial_bytes); }

    std::size_t size() const { return buf_.size(); }

    void write_byte(std::uint8_t b) { buf_.push_back(b); }

    void write_varuint(std::uint64_t value) {
        do {
            std::uint8_t b = static_cast<std::uint8_t>(value & 0x7Fu);
            value >>= 7;
            if (value != 0) {
                b |= 0x80u;
            }
            buf_.push_back(b);
        } while (value != 0);
    }

    void write_varint(std::int64_t value) {
        const std::uint64_t zz =
            (static_cast<std::uint64_t>(value) << 1) ^ static_cast<std::uint64_t>(value >> 63);
        write_varuint(zz);
    }

    void write_f32(float value) {
        std::uint32_t bits = 0;
        std::memcpy(&bits, &value, sizeof(bits));
        for (int i = 0; i < 4; i++) {
            buf_.push_back(static_cast<std::uint8_t>((bits >> (8 * i)) & 0xFFu));
        }
    }

    void write_f64(double value) {
        std::uint64_t bits = 0;
        std::memcpy(&bits, &value, sizeof(bits));
        for (int i = 0; i < 8; i++) {
            buf_.push_back(static_cast<std::uint8_t>((bits >> (8 * i)) & 0xFFu));
        }
    }

    void write_bytes(std::span<const std::uint8_t> bytes) {
        buf_.insert(buf_.end(), bytes.begin(), bytes.end());
    }

    void write_length_prefixed(std::span<const std::uint8_t> bytes) {
        write_varuint(bytes.size());
        write_bytes(bytes);
    }

    void write_string(std::string_view s) {
        write_varuint(s.size());
        buf_.insert(buf_.end(), s.begin(), s.end());
    }

    // Message field key: (tag << 3) | wire kind.
    void write_key(std::uint32_t tag, std::uint8_t wire_kind) {
        write_varuint((static_cast<std::uint64_t>(tag) << 3) | (wire_kind & 0x7u));
    }

    const std::vector<std::uint8_t>& bytes() const { return buf_; }
    std::vector<std::uint8_t> to_bytes() const { return buf_; }

   private:
    std::vector<std::uint8_t> buf_;
};
}  // namespace fig2json::kiwi
