#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>


namespace chansource_bench {

/// Mix of character widths in generated text
enum class TextMix {
    Ascii,     ///< Only 1-byte characters
    Latin,     ///< Mostly ASCII with some 2-byte characters
    Symbols,   ///< ASCII with 2- and 3-byte characters
    Emoji      ///< ASCII with 4-byte sequences (decoded as U+FFFD)
};

/// Generated text configuration
struct TextConfig {
    std::size_t size_bytes;
    std::size_t mean_line_length = 80;
    TextMix mix = TextMix::Latin;

    std::string name() const;
};

/// Predefined text configurations
namespace configs {
    constexpr TextConfig small_ascii{64 * 1024, 80, TextMix::Ascii};
    constexpr TextConfig medium_latin{4 * 1024 * 1024, 80, TextMix::Latin};
    constexpr TextConfig medium_symbols{4 * 1024 * 1024, 80, TextMix::Symbols};
    constexpr TextConfig large_latin{64 * 1024 * 1024, 120, TextMix::Latin};
}

/// UTF-8 text generator
class TextGenerator {
public:
    explicit TextGenerator(uint64_t seed = 42) : rng_(seed) {}

    /// Generate at least config.size_bytes of newline-separated UTF-8 text.
    /// Characters are never split at the end.
    std::vector<std::byte> generate(const TextConfig& config);

    /// Byte offsets of `count` character starts, drawn uniformly
    std::vector<std::size_t> sample_boundaries(const std::vector<std::byte>& text, std::size_t count);

private:
    void append_char(std::vector<std::byte>& out, TextMix mix);

    std::mt19937_64 rng_;
};

/// Temporary file manager for benchmarks
class TempFileManager {
public:
    TempFileManager();
    ~TempFileManager();

    /// Get path for a temporary text file
    std::filesystem::path get_temp_path(const std::string& name);

    /// Write `content` to a new temporary file
    std::filesystem::path write_file(const std::string& name, const std::vector<std::byte>& content);

    /// Clean up all temporary files
    void cleanup_all();

private:
    std::filesystem::path temp_dir_;
    std::vector<std::filesystem::path> temp_files_;
};

} // namespace chansource_bench
