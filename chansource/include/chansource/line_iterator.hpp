#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include "channel_base.hpp"
#include "types/result.hpp"

namespace chansource {

template <MappableChannel Channel>
class ChannelSource;

/// @brief Growable byte accumulator for line assembly
/// @note Capacity doubles (copying into a larger owned buffer) whenever an
///       append does not fit. There is no upper bound besides memory.
class LineBuffer {
public:
    static constexpr std::size_t default_capacity = 128;

    LineBuffer();
    explicit LineBuffer(std::size_t initial_capacity);

    LineBuffer(LineBuffer&&) noexcept = default;
    LineBuffer& operator=(LineBuffer&&) noexcept = default;
    LineBuffer(const LineBuffer&) = delete;
    LineBuffer& operator=(const LineBuffer&) = delete;

    /// @brief Append bytes, growing the storage geometrically if needed
    void append(std::span<const std::byte> bytes);

    /// @brief Drop the contents, keeping the allocated capacity
    void clear() noexcept;

    [[nodiscard]] std::span<const std::byte> bytes() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::size_t capacity() const noexcept;

private:
    std::unique_ptr<std::byte[]> data_;
    std::size_t size_{0};
    std::size_t capacity_{0};
};

/// @brief Forward-only line session over a ChannelSource
///
/// Lines are split on '\n' (0x0A) only. The terminator is consumed and not
/// returned; '\r' is ordinary content, so "a\r\nb" gives "a\r" then "b".
/// A final line without terminator is returned as is.
///
/// The iterator reads straight from the source's window, so character and
/// line reads can be interleaved and always continue from the same byte
/// position. Bytes are accumulated raw and decoded once per line with the
/// source's encoding.
///
/// @note The source must outlive the iterator.
template <MappableChannel Channel>
class LineIterator {
public:
    enum class State {
        AwaitingLine,  ///< Between lines
        Accumulating,  ///< Collecting the bytes of a line
        Exhausted      ///< No input left
    };

    explicit LineIterator(ChannelSource<Channel>& source);

    /// @brief True if at least one more line (possibly empty) can be read
    [[nodiscard]] bool has_next() noexcept;

    /// @brief Read the next line
    /// @return The decoded line without its '\n'
    /// @retval EndOfInput No characters remain
    /// @retval ReadError / MapError Propagated from the channel; the source
    ///         is rewound to the start of the line
    [[nodiscard]] Result<std::u16string> next();

    [[nodiscard]] State state() const noexcept;

private:
    ChannelSource<Channel>* source_;
    LineBuffer buffer_;
    State state_{State::AwaitingLine};
};

} // namespace chansource

#define CHANSOURCE_LINE_ITERATOR_HEADER
#include "impl/line_iterator_impl.hpp"
#include "channel_source.hpp"
