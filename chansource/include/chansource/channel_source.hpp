#pragma once

/**
 * @file channel_source.hpp
 * @brief Seekable, position-tracked character reader over a byte channel
 *
 * A ChannelSource combines byte-exact positioning with character iteration:
 * - position() is always the byte offset of the next undecoded byte, and
 *   set_position() accepts any offset previously returned by position()
 * - characters are decoded from UTF-8 or ISO-8859-1 one at a time, with
 *   multi-byte sequences completed across buffer refills
 * - lines() gives a line view over the same cursor
 *
 * Two I/O strategies are available and produce identical characters and
 * positions:
 * - Buffered: sequential reads into a small reused buffer. Cheap in memory,
 *   suited to one-pass reading.
 * - MemoryMapped: the file is viewed through mmap windows of at most
 *   max_window_size bytes (one gigabyte by default). Suited to large files
 *   and scattered seeks.
 *
 * Example:
 * @code
 * FileChannel file("corpus.txt");
 * auto source = ChannelSource<FileChannel>::create(file, {.strategy = ReadStrategy::MemoryMapped});
 * if (!source) {
 *     // handle source.error()
 * }
 * auto& reader = source.value();
 * while (reader.has_next()) {
 *     auto c = reader.next();
 *     ...
 * }
 * @endcode
 *
 * The source borrows the channel and never closes it. It is not thread-safe.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include "channel_base.hpp"
#include "line_iterator.hpp"
#include "types/encoding.hpp"
#include "types/result.hpp"
#include "window.hpp"

namespace chansource {

/// @brief Construction parameters of a ChannelSource
struct SourceConfig {
    Encoding encoding = Encoding::UTF8;
    ReadStrategy strategy = ReadStrategy::Buffered;
    std::size_t buffer_size = 1024;                         ///< Buffered only, >= 3
    std::size_t max_window_size = default_max_window_size;  ///< MemoryMapped only, >= 3
};

/// @brief Smallest usable buffer: one complete 3-byte UTF-8 sequence
inline constexpr std::size_t min_buffer_size = 3;

template <MappableChannel Channel>
class ChannelSource {
public:
    using Config = SourceConfig;
    using WindowType = std::variant<BufferedWindow<Channel>, MappedWindow<Channel>>;

    /// @brief Create a source with the default configuration (UTF-8, buffered)
    [[nodiscard]] static Result<ChannelSource> create(Channel& channel) noexcept;

    /// @brief Create a source reading from the channel's current cursor
    /// @param channel Borrowed, already opened channel
    /// @param config Encoding, strategy and sizes
    /// @return The source or an error; no partially built source is returned
    /// @retval UnsupportedEncoding config.encoding is not UTF8 or ISO8859_1
    /// @retval InvalidConfiguration buffer_size or max_window_size below 3,
    ///         unknown strategy, or invalid channel
    /// @retval MapError The first window could not be mapped
    [[nodiscard]] static Result<ChannelSource> create(Channel& channel, Config config) noexcept;

    ChannelSource(ChannelSource&&) noexcept = default;
    ChannelSource& operator=(ChannelSource&&) noexcept = default;
    ChannelSource(const ChannelSource&) = delete;
    ChannelSource& operator=(const ChannelSource&) = delete;

    /// @brief True if another character can be read
    /// @note If refilling fails, returns true and leaves the error for next()
    [[nodiscard]] bool has_next() noexcept;

    /// @brief Decode the next character and advance past its bytes
    /// @retval EndOfInput Nothing remains
    /// @retval ReadError / MapError Propagated from the channel
    [[nodiscard]] Result<char16_t> next() noexcept;

    /// @brief Byte offset of the next undecoded byte
    [[nodiscard]] std::size_t position() const noexcept;

    /// @brief Continue decoding at byte offset `position`
    /// @note Offsets past the end are accepted; the source is then exhausted
    /// @note Only offsets at character boundaries give meaningful results
    [[nodiscard]] Result<void> set_position(std::size_t position) noexcept;

    /// @brief Decode everything from the current position to the end
    /// @note Consumes the input; call set_position(0) to read again
    [[nodiscard]] Result<std::u16string> read_remaining();

    /// @brief Line view over this source, starting at the current position
    [[nodiscard]] LineIterator<Channel> lines() noexcept;

    [[nodiscard]] Encoding encoding() const noexcept;
    [[nodiscard]] ReadStrategy strategy() const noexcept;
    [[nodiscard]] std::size_t buffer_size() const noexcept;

    /// @brief Number of windows mapped so far (0 for the buffered strategy)
    [[nodiscard]] std::size_t remap_count() const noexcept;

private:
    friend class LineIterator<Channel>;

    ChannelSource(Channel& channel, Config config, WindowType&& window) noexcept;

    [[nodiscard]] Result<bool> window_has_more() noexcept;
    [[nodiscard]] std::span<const std::byte> window_available() const noexcept;
    void window_consume(std::size_t count) noexcept;
    [[nodiscard]] Result<void> take_pending_error() noexcept;
    [[nodiscard]] Result<void> skip_sequence(std::size_t length) noexcept;

    Channel* channel_;
    Config config_;
    WindowType window_;
    std::optional<Error> pending_error_;
};

} // namespace chansource

#define CHANSOURCE_CHANNEL_SOURCE_HEADER
#include "impl/channel_source_impl.hpp"
