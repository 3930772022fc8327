#include <benchmark/benchmark.h>
#include <filesystem>
#include <string>
#include <vector>

#include "benchmark_helpers.hpp"

#include "../chansource/include/chansource/channels/channel_buffer.hpp"
#include "../chansource/include/chansource/channels/channel_unix_file.hpp"
#include "../chansource/include/chansource/channel_source.hpp"
#include "../chansource/include/chansource/decoder.hpp"
#include "../chansource/include/chansource/line_iterator.hpp"

namespace fs = std::filesystem;

using namespace chansource;
using namespace chansource_bench;

namespace {

/// Text configurations selectable by index from benchmark arguments
const TextConfig& text_config(int64_t index) {
    static const TextConfig table[] = {
        configs::small_ascii,
        configs::medium_latin,
        configs::medium_symbols,
        configs::large_latin,
        TextConfig{4 * 1024 * 1024, 80, TextMix::Emoji},
    };
    return table[static_cast<std::size_t>(index)];
}

SourceConfig source_config(ReadStrategy strategy, std::size_t buffer_size) {
    SourceConfig config;
    config.strategy = strategy;
    config.buffer_size = buffer_size;
    return config;
}

} // namespace

// ============================================================================
// Character reads
// ============================================================================

// Params: text config index, buffer size
template <ReadStrategy Strategy>
static void BM_ReadChars(benchmark::State& state) {
    const TextConfig& text = text_config(state.range(0));
    const auto buffer_size = static_cast<std::size_t>(state.range(1));

    TempFileManager temp_manager;
    TextGenerator generator;
    const auto content = generator.generate(text);
    const fs::path path = temp_manager.write_file("chars_" + text.name(), content);

    std::size_t chars = 0;
    for (auto _ : state) {
        FileChannel channel(path.string());
        auto source = ChannelSource<FileChannel>::create(channel, source_config(Strategy, buffer_size));
        if (!source) {
            state.SkipWithError("Failed to create source " + source.error().message);
            break;
        }
        auto& reader = source.value();

        std::size_t count = 0;
        while (reader.has_next()) {
            auto c = reader.next();
            if (!c) {
                state.SkipWithError("Failed to read character " + c.error().message);
                break;
            }
            benchmark::DoNotOptimize(c.value());
            ++count;
        }
        chars = count;
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(chars));
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(content.size()));
}

// ============================================================================
// Line reads
// ============================================================================

// Params: text config index, buffer size
template <ReadStrategy Strategy>
static void BM_ReadLines(benchmark::State& state) {
    const TextConfig& text = text_config(state.range(0));
    const auto buffer_size = static_cast<std::size_t>(state.range(1));

    TempFileManager temp_manager;
    TextGenerator generator;
    const auto content = generator.generate(text);
    const fs::path path = temp_manager.write_file("lines_" + text.name(), content);

    std::size_t lines_read = 0;
    for (auto _ : state) {
        FileChannel channel(path.string());
        auto source = ChannelSource<FileChannel>::create(channel, source_config(Strategy, buffer_size));
        if (!source) {
            state.SkipWithError("Failed to create source " + source.error().message);
            break;
        }

        auto lines = source.value().lines();
        std::size_t count = 0;
        while (lines.has_next()) {
            auto line = lines.next();
            if (!line) {
                state.SkipWithError("Failed to read line " + line.error().message);
                break;
            }
            benchmark::DoNotOptimize(line.value().data());
            ++count;
        }
        lines_read = count;
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(lines_read));
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(content.size()));
}

// ============================================================================
// Random access
// ============================================================================

// Params: text config index, number of seeks
template <ReadStrategy Strategy>
static void BM_RandomSeek(benchmark::State& state) {
    const TextConfig& text = text_config(state.range(0));
    const auto seeks = static_cast<std::size_t>(state.range(1));

    TempFileManager temp_manager;
    TextGenerator generator;
    const auto content = generator.generate(text);
    const auto targets = generator.sample_boundaries(content, seeks);
    const fs::path path = temp_manager.write_file("seek_" + text.name(), content);

    FileChannel channel(path.string());
    auto source = ChannelSource<FileChannel>::create(channel, source_config(Strategy, 1024));
    if (!source) {
        state.SkipWithError("Failed to create source " + source.error().message);
        return;
    }
    auto& reader = source.value();

    for (auto _ : state) {
        for (std::size_t target : targets) {
            auto seek = reader.set_position(target);
            if (!seek) {
                state.SkipWithError("Failed to seek " + seek.error().message);
                break;
            }
            auto c = reader.next();
            if (!c) {
                state.SkipWithError("Failed to read after seek " + c.error().message);
                break;
            }
            benchmark::DoNotOptimize(c.value());
        }
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(targets.size()));
    state.counters["remaps"] = static_cast<double>(reader.remap_count());
}

// ============================================================================
// Decoder only
// ============================================================================

// Params: text config index
static void BM_DecodeAll(benchmark::State& state) {
    const TextConfig& text = text_config(state.range(0));
    TextGenerator generator;
    const auto content = generator.generate(text);

    for (auto _ : state) {
        auto decoded = decode_all(content, Encoding::UTF8);
        benchmark::DoNotOptimize(decoded.data());
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(content.size()));
}

// In-memory channel, no file system in the loop
// Params: text config index, buffer size
static void BM_ReadChars_InMemory(benchmark::State& state) {
    const TextConfig& text = text_config(state.range(0));
    const auto buffer_size = static_cast<std::size_t>(state.range(1));
    TextGenerator generator;
    const auto content = generator.generate(text);

    for (auto _ : state) {
        BufferChannel channel{std::span<const std::byte>(content)};
        auto source = ChannelSource<BufferChannel>::create(channel, source_config(ReadStrategy::Buffered, buffer_size));
        if (!source) {
            state.SkipWithError("Failed to create source " + source.error().message);
            break;
        }
        auto text_result = source.value().read_remaining();
        if (!text_result) {
            state.SkipWithError("Failed to read " + text_result.error().message);
            break;
        }
        benchmark::DoNotOptimize(text_result.value().data());
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(content.size()));
}

// ============================================================================
// Registration
// ============================================================================

BENCHMARK(BM_ReadChars<ReadStrategy::Buffered>)
    ->Args({0, 1024})   // 64KiB ascii
    ->Args({1, 3})      // 4MiB latin, minimal buffer
    ->Args({1, 1024})   // 4MiB latin, default buffer
    ->Args({1, 65536})  // 4MiB latin, large buffer
    ->Args({2, 1024})   // 4MiB symbols
    ->Args({4, 1024})   // 4MiB emoji
    ->Name("ChanSource/ReadChars/Buffered")
    ->Unit(benchmark::kMillisecond);

BENCHMARK(BM_ReadChars<ReadStrategy::MemoryMapped>)
    ->Args({0, 0})
    ->Args({1, 0})
    ->Args({2, 0})
    ->Args({3, 0})      // 64MiB latin
    ->Args({4, 0})
    ->Name("ChanSource/ReadChars/MemoryMapped")
    ->Unit(benchmark::kMillisecond);

BENCHMARK(BM_ReadLines<ReadStrategy::Buffered>)
    ->Args({1, 1024})
    ->Args({1, 65536})
    ->Args({3, 65536})
    ->Name("ChanSource/ReadLines/Buffered")
    ->Unit(benchmark::kMillisecond);

BENCHMARK(BM_ReadLines<ReadStrategy::MemoryMapped>)
    ->Args({1, 0})
    ->Args({3, 0})
    ->Name("ChanSource/ReadLines/MemoryMapped")
    ->Unit(benchmark::kMillisecond);

BENCHMARK(BM_RandomSeek<ReadStrategy::Buffered>)
    ->Args({1, 1000})
    ->Args({3, 1000})
    ->Name("ChanSource/RandomSeek/Buffered")
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_RandomSeek<ReadStrategy::MemoryMapped>)
    ->Args({1, 1000})
    ->Args({3, 1000})
    ->Name("ChanSource/RandomSeek/MemoryMapped")
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_DecodeAll)
    ->Arg(1)
    ->Arg(2)
    ->Name("ChanSource/DecodeAll")
    ->Unit(benchmark::kMillisecond);

BENCHMARK(BM_ReadChars_InMemory)
    ->Args({1, 1024})
    ->Args({1, 65536})
    ->Name("ChanSource/ReadChars/InMemory")
    ->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
