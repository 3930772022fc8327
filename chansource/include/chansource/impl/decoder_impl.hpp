// This file contains the implementation of the UTF-8 and ISO-8859-1 decoders.
// Do not include this file directly - it is included by decoder.hpp

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include "../types/encoding.hpp"

#ifndef CHANSOURCE_DECODER_HEADER
#include "../decoder.hpp" // for linters
#endif

namespace chansource {

namespace detail {
    [[nodiscard]] inline constexpr uint32_t byte_value(std::byte b) noexcept {
        return static_cast<uint32_t>(std::to_integer<uint8_t>(b));
    }
}

inline constexpr std::size_t utf8_sequence_length(std::byte lead) noexcept {
    const uint32_t b = detail::byte_value(lead);
    if ((b & 0x80) == 0) {
        return 1;
    }
    if ((b & 0xE0) == 0xC0) {
        return 2;
    }
    if ((b & 0xF0) == 0xE0) {
        return 3;
    }
    if ((b & 0xF8) == 0xF0) {
        return 4;
    }
    if ((b & 0xFC) == 0xF8) {
        return 5;
    }
    if ((b & 0xFE) == 0xFC) {
        return 6;
    }
    // Continuation byte, 0xFE or 0xFF in lead position
    return 1;
}

inline constexpr DecodedChar decode_utf8(std::span<const std::byte> bytes) noexcept {
    if (bytes.empty()) [[unlikely]] {
        return {replacement_character, 0};
    }

    const uint32_t first = detail::byte_value(bytes[0]);
    if ((first & 0x80) == 0) {
        return {static_cast<char16_t>(first), 1};
    }

    const std::size_t length = utf8_sequence_length(bytes[0]);
    if (bytes.size() < length) [[unlikely]] {
        // Sequence cut short by the end of input
        return {replacement_character, bytes.size()};
    }

    if (length == 2) {
        const uint32_t second = detail::byte_value(bytes[1]);
        return {static_cast<char16_t>(((first & 0x1F) << 6) | (second & 0x3F)), 2};
    }

    if (length == 3) {
        const uint32_t second = detail::byte_value(bytes[1]);
        const uint32_t third = detail::byte_value(bytes[2]);
        return {static_cast<char16_t>(((first & 0x0F) << 12) | ((second & 0x3F) << 6) | (third & 0x3F)), 3};
    }

    // 4- to 6-byte sequences and unrecognized lead bytes
    return {replacement_character, length};
}

inline constexpr DecodedChar decode_iso8859_1(std::span<const std::byte> bytes) noexcept {
    if (bytes.empty()) [[unlikely]] {
        return {replacement_character, 0};
    }
    return {static_cast<char16_t>(detail::byte_value(bytes[0])), 1};
}

inline constexpr DecodedChar decode_one(std::span<const std::byte> bytes, Encoding encoding) noexcept {
    if (encoding == Encoding::ISO8859_1) {
        return decode_iso8859_1(bytes);
    }
    return decode_utf8(bytes);
}

inline std::u16string decode_all(std::span<const std::byte> bytes, Encoding encoding) {
    std::u16string out;
    if (encoding == Encoding::ISO8859_1) {
        out.resize(bytes.size());
        std::transform(bytes.begin(), bytes.end(), out.begin(), [](std::byte b) {
            return static_cast<char16_t>(detail::byte_value(b));
        });
        return out;
    }

    // Every UTF-8 character takes at least one byte
    out.reserve(bytes.size());
    std::size_t offset = 0;
    while (offset < bytes.size()) {
        const DecodedChar decoded = decode_utf8(bytes.subspan(offset));
        out.push_back(decoded.value);
        offset += decoded.consumed;
    }
    return out;
}

inline std::string to_utf8(std::u16string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char16_t c : text) {
        uint32_t v = static_cast<uint32_t>(c);
        if (v >= 0xD800 && v <= 0xDFFF) {
            v = replacement_character;
        }
        if (v < 0x80) {
            out.push_back(static_cast<char>(v));
        } else if (v < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (v >> 6)));
            out.push_back(static_cast<char>(0x80 | (v & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xE0 | (v >> 12)));
            out.push_back(static_cast<char>(0x80 | ((v >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (v & 0x3F)));
        }
    }
    return out;
}

} // namespace chansource
