#pragma once

/**
 * @file decoder.hpp
 * @brief Byte-to-character decoding for UTF-8 and ISO-8859-1
 *
 * All functions here are pure: they look at a byte run and report the
 * character found at its start together with the number of bytes it
 * occupies. Buffer management (making sure enough lookahead is present)
 * is the caller's job, see window.hpp.
 *
 * Characters are 16-bit (`char16_t`). UTF-8 sequences of four bytes or more
 * encode code points that do not fit, so they are not decoded: the whole
 * sequence is skipped and U+FFFD is produced instead. Stray continuation
 * bytes and the never-valid lead bytes 0xFE/0xFF are replaced the same way,
 * one byte at a time. Continuation bytes of 2- and 3-byte sequences are
 * taken as they come and are not validated.
 *
 * Lead byte patterns:
 * | Pattern    | Length | Result                           |
 * |------------|--------|----------------------------------|
 * | 0xxxxxxx   | 1      | byte value                       |
 * | 110xxxxx   | 2      | 5 + 6 payload bits               |
 * | 1110xxxx   | 3      | 4 + 6 + 6 payload bits           |
 * | 11110xxx   | 4      | U+FFFD, 3 extra bytes skipped    |
 * | 111110xx   | 5      | U+FFFD, 4 extra bytes skipped    |
 * | 1111110x   | 6      | U+FFFD, 5 extra bytes skipped    |
 * | other      | 1      | U+FFFD                           |
 */

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include "types/encoding.hpp"

namespace chansource {

/// @brief Substitute for characters that cannot be represented
inline constexpr char16_t replacement_character = u'\uFFFD';

/// @brief Bytes that must be buffered before a UTF-8 decode so that any
/// representable sequence is complete
inline constexpr std::size_t utf8_lookahead = 3;

/// @brief One decoded character and the number of bytes it used
struct DecodedChar {
    char16_t value;
    std::size_t consumed;
};

/// @brief Total length in bytes of the UTF-8 sequence introduced by `lead`
/// @return 1 to 6; 1 for bytes that cannot start a sequence
[[nodiscard]] constexpr std::size_t utf8_sequence_length(std::byte lead) noexcept;

/// @brief Decode the UTF-8 sequence at the start of `bytes`
/// @param bytes Undecoded input, starting at a character boundary
/// @return The character and the bytes consumed. If `bytes` ends before the
///         sequence does, the remaining bytes are consumed and U+FFFD returned.
/// @note An empty input yields U+FFFD with nothing consumed
[[nodiscard]] constexpr DecodedChar decode_utf8(std::span<const std::byte> bytes) noexcept;

/// @brief Decode one ISO-8859-1 byte (always consumes exactly one byte)
[[nodiscard]] constexpr DecodedChar decode_iso8859_1(std::span<const std::byte> bytes) noexcept;

/// @brief Decode one character with the given encoding
[[nodiscard]] constexpr DecodedChar decode_one(std::span<const std::byte> bytes, Encoding encoding) noexcept;

/// @brief Decode a complete byte run into a string in one pass
/// @note Uses the same rules as decode_one; a truncated trailing sequence
///       becomes a single U+FFFD
[[nodiscard]] std::u16string decode_all(std::span<const std::byte> bytes, Encoding encoding);

/// @brief Encode 16-bit characters as UTF-8 (each unit independently)
/// @note Surrogate units have no UTF-8 form and are written as U+FFFD
[[nodiscard]] std::string to_utf8(std::u16string_view text);

} // namespace chansource

#define CHANSOURCE_DECODER_HEADER
#include "impl/decoder_impl.hpp"
