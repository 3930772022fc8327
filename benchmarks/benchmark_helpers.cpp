#include "benchmark_helpers.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

#include "../chansource/include/chansource/decoder.hpp"

namespace chansource_bench {

// ============================================================================
// TextConfig
// ============================================================================

std::string TextConfig::name() const {
    std::ostringstream oss;
    if (size_bytes >= 1024 * 1024) {
        oss << size_bytes / (1024 * 1024) << "MiB";
    } else {
        oss << size_bytes / 1024 << "KiB";
    }
    oss << "_line" << mean_line_length;

    switch (mix) {
        case TextMix::Ascii: oss << "_ascii"; break;
        case TextMix::Latin: oss << "_latin"; break;
        case TextMix::Symbols: oss << "_symbols"; break;
        case TextMix::Emoji: oss << "_emoji"; break;
    }

    return oss.str();
}

// ============================================================================
// TextGenerator
// ============================================================================

namespace {
    void push_utf8(std::vector<std::byte>& out, uint32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<std::byte>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<std::byte>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<std::byte>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<std::byte>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<std::byte>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<std::byte>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<std::byte>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<std::byte>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<std::byte>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<std::byte>(0x80 | (cp & 0x3F)));
        }
    }
}

void TextGenerator::append_char(std::vector<std::byte>& out, TextMix mix) {
    std::uniform_int_distribution<int> percent(0, 99);
    std::uniform_int_distribution<int> letter('a', 'z');
    const int roll = percent(rng_);

    switch (mix) {
        case TextMix::Ascii:
            break;
        case TextMix::Latin:
            if (roll < 10) {
                std::uniform_int_distribution<uint32_t> latin(0xC0, 0xFF);
                push_utf8(out, latin(rng_));
                return;
            }
            break;
        case TextMix::Symbols:
            if (roll < 10) {
                std::uniform_int_distribution<uint32_t> greek(0x391, 0x3C9);
                push_utf8(out, greek(rng_));
                return;
            }
            if (roll < 20) {
                std::uniform_int_distribution<uint32_t> cjk(0x4E00, 0x9FFF);
                push_utf8(out, cjk(rng_));
                return;
            }
            break;
        case TextMix::Emoji:
            if (roll < 5) {
                std::uniform_int_distribution<uint32_t> emoji(0x1F600, 0x1F64F);
                push_utf8(out, emoji(rng_));
                return;
            }
            break;
    }

    if (roll > 85) {
        out.push_back(std::byte{' '});
    } else {
        out.push_back(static_cast<std::byte>(letter(rng_)));
    }
}

std::vector<std::byte> TextGenerator::generate(const TextConfig& config) {
    std::vector<std::byte> out;
    out.reserve(config.size_bytes + 8);

    const std::size_t mean = std::max<std::size_t>(config.mean_line_length, 2);
    std::uniform_int_distribution<std::size_t> line_length(1, 2 * mean);

    while (out.size() < config.size_bytes) {
        const std::size_t length = line_length(rng_);
        for (std::size_t i = 0; i < length && out.size() < config.size_bytes; ++i) {
            append_char(out, config.mix);
        }
        out.push_back(std::byte{'\n'});
    }

    return out;
}

std::vector<std::size_t> TextGenerator::sample_boundaries(const std::vector<std::byte>& text, std::size_t count) {
    std::vector<std::size_t> boundaries;
    std::size_t offset = 0;
    while (offset < text.size()) {
        boundaries.push_back(offset);
        offset += chansource::utf8_sequence_length(text[offset]);
    }

    std::vector<std::size_t> out;
    if (boundaries.empty()) {
        return out;
    }
    out.reserve(count);
    std::uniform_int_distribution<std::size_t> pick(0, boundaries.size() - 1);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(boundaries[pick(rng_)]);
    }
    return out;
}

// ============================================================================
// TempFileManager
// ============================================================================

TempFileManager::TempFileManager() {
    temp_dir_ = std::filesystem::temp_directory_path() / "chansource_benchmarks";
    std::filesystem::create_directories(temp_dir_);
}

TempFileManager::~TempFileManager() {
    cleanup_all();
}

std::filesystem::path TempFileManager::get_temp_path(const std::string& name) {
    auto path = temp_dir_ / (name + ".txt");
    temp_files_.push_back(path);
    return path;
}

std::filesystem::path TempFileManager::write_file(const std::string& name, const std::vector<std::byte>& content) {
    auto path = get_temp_path(name);
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(content.data()),
               static_cast<std::streamsize>(content.size()));
    return path;
}

void TempFileManager::cleanup_all() {
    for (const auto& path : temp_files_) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
    temp_files_.clear();

    std::error_code ec;
    std::filesystem::remove(temp_dir_, ec);
}

} // namespace chansource_bench
