#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include "result.hpp"

namespace chansource {

/// @brief Character encodings understood by the decoder
enum class Encoding : uint8_t {
    UTF8 = 0,
    ISO8859_1 = 1
};

/// @brief I/O mechanism used to bring file bytes into memory
enum class ReadStrategy : uint8_t {
    Buffered = 0,     ///< Sequential reads into a reused scratch buffer
    MemoryMapped = 1  ///< Bounded mmap windows over the file
};

/// @brief Check that an encoding value is one of the supported enumerators
[[nodiscard]] inline constexpr bool is_supported(Encoding encoding) noexcept {
    return encoding == Encoding::UTF8 || encoding == Encoding::ISO8859_1;
}

[[nodiscard]] inline constexpr bool is_supported(ReadStrategy strategy) noexcept {
    return strategy == ReadStrategy::Buffered || strategy == ReadStrategy::MemoryMapped;
}

[[nodiscard]] inline constexpr std::string_view to_string(Encoding encoding) noexcept {
    switch (encoding) {
        case Encoding::UTF8: return "UTF-8";
        case Encoding::ISO8859_1: return "ISO-8859-1";
    }
    return "unknown";
}

[[nodiscard]] inline constexpr std::string_view to_string(ReadStrategy strategy) noexcept {
    switch (strategy) {
        case ReadStrategy::Buffered: return "buffered";
        case ReadStrategy::MemoryMapped: return "memory-mapped";
    }
    return "unknown";
}

namespace detail {
    inline std::string normalize_name(std::string_view name) {
        std::string out(name);
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });
        return out;
    }
}

/// @brief Look up an encoding by its charset name (case-insensitive)
/// @param name Charset name such as "UTF-8" or "ISO-8859-1"
/// @return The encoding, or UnsupportedEncoding for any other name
[[nodiscard]] inline Result<Encoding> parse_encoding(std::string_view name) {
    const std::string key = detail::normalize_name(name);
    if (key == "UTF-8" || key == "UTF8") {
        return Ok(Encoding::UTF8);
    }
    if (key == "ISO-8859-1" || key == "ISO8859-1" || key == "ISO8859_1" ||
        key == "LATIN1" || key == "LATIN-1") {
        return Ok(Encoding::ISO8859_1);
    }
    return Err(Error::Code::UnsupportedEncoding,
               "Unsupported encoding: " + std::string(name));
}

/// @brief Look up a read strategy by name ("buffered", "mmap" or "memory-mapped")
[[nodiscard]] inline Result<ReadStrategy> parse_strategy(std::string_view name) {
    const std::string key = detail::normalize_name(name);
    if (key == "BUFFERED") {
        return Ok(ReadStrategy::Buffered);
    }
    if (key == "MMAP" || key == "MEMORY-MAPPED" || key == "MEMORYMAPPED") {
        return Ok(ReadStrategy::MemoryMapped);
    }
    return Err(Error::Code::InvalidConfiguration,
               "Unknown read strategy: " + std::string(name));
}

} // namespace chansource
