#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include "channel_base.hpp"
#include "types/result.hpp"

namespace chansource {

/// @brief Default upper bound for one mapped window (one gigabyte)
inline constexpr std::size_t default_max_window_size = std::size_t{1} << 30;

/// @brief Fixed-capacity scratch window refilled by sequential channel reads
/// @tparam Channel Byte channel providing the input
/// @note The window borrows the channel; the channel must outlive it
/// @note On refill, unconsumed bytes are compacted to the front and the free
///       tail is filled from the channel's cursor. A sequence split across two
///       reads is therefore completed in place.
template <ByteChannel Channel>
class BufferedWindow {
public:
    /// @brief Construct a window of `capacity` bytes reading from the channel's current cursor
    /// @param channel Borrowed channel
    /// @param capacity Window size in bytes (validated by the caller, >= 3)
    BufferedWindow(Channel& channel, std::size_t capacity);

    BufferedWindow(BufferedWindow&&) noexcept = default;
    BufferedWindow& operator=(BufferedWindow&&) noexcept = default;
    BufferedWindow(const BufferedWindow&) = delete;
    BufferedWindow& operator=(const BufferedWindow&) = delete;

    /// @brief Unconsumed bytes currently in memory
    [[nodiscard]] std::span<const std::byte> available() const noexcept;

    /// @brief Number of unconsumed bytes currently in memory
    [[nodiscard]] std::size_t remaining() const noexcept;

    /// @brief Mark `count` bytes as consumed (count <= remaining())
    void consume(std::size_t count) noexcept;

    /// @brief True once the channel has reported end of input
    [[nodiscard]] bool exhausted() const noexcept;

    /// @brief Compact the window and read more bytes from the channel
    /// @return Whether any unconsumed bytes are available afterwards
    /// @retval ReadError The channel read failed; the window is unchanged
    [[nodiscard]] Result<bool> refill() noexcept;

    /// @brief Refill until at least `count` bytes are available, the window
    ///        is full, or input is exhausted
    /// @return Number of bytes available afterwards
    [[nodiscard]] Result<std::size_t> ensure(std::size_t count) noexcept;

    /// @brief Check whether bytes remain, refilling if the window is empty
    [[nodiscard]] Result<bool> has_more() noexcept;

    /// @brief Reposition the channel and drop the window contents
    /// @note Positions past the end of input are accepted and read nothing
    [[nodiscard]] Result<void> seek(std::size_t position) noexcept;

    /// @brief Byte offset of the next unconsumed byte
    [[nodiscard]] std::size_t position() const noexcept;

    [[nodiscard]] std::size_t capacity() const noexcept;

private:
    Channel* channel_;
    std::unique_ptr<std::byte[]> buffer_;
    std::size_t capacity_;
    std::size_t begin_{0};
    std::size_t end_{0};
    bool exhausted_{false};
};

/// @brief Window over a bounded memory-mapped range of the channel
/// @tparam Channel Byte channel able to map ranges
/// @note A window covers at most `max_window_size` bytes starting at
///       base_offset(). Moving outside of it maps a new window; the previous
///       mapping is released when the view is replaced.
template <MappableChannel Channel>
class MappedWindow {
public:
    using ViewType = typename Channel::MapViewType;

    /// @brief Create a window over the channel and map its first range
    /// @param channel Borrowed channel
    /// @param max_window_size Upper bound for one mapping (>= 3)
    /// @param start File offset of the first window (clamped to the file length)
    /// @return The window, or the channel's size/map error
    [[nodiscard]] static Result<MappedWindow> create(Channel& channel,
                                                     std::size_t max_window_size,
                                                     std::size_t start = 0) noexcept;

    MappedWindow(MappedWindow&&) noexcept = default;
    MappedWindow& operator=(MappedWindow&&) noexcept = default;
    MappedWindow(const MappedWindow&) = delete;
    MappedWindow& operator=(const MappedWindow&) = delete;

    [[nodiscard]] std::span<const std::byte> available() const noexcept;
    [[nodiscard]] std::size_t remaining() const noexcept;
    void consume(std::size_t count) noexcept;

    /// @brief True when the current window reaches the end of the file
    [[nodiscard]] bool exhausted() const noexcept;

    /// @brief Remap at the current position when fewer than a full UTF-8
    ///        lookahead remains and the file continues past the window
    /// @return Whether any unconsumed bytes are available afterwards
    [[nodiscard]] Result<bool> refill() noexcept;

    /// @brief Remap at the current position if fewer than `count` bytes remain
    ///        in the window and the file continues past it
    [[nodiscard]] Result<std::size_t> ensure(std::size_t count) noexcept;

    [[nodiscard]] Result<bool> has_more() noexcept;

    /// @brief Move to `position` (clamped to the file length)
    /// @note Stays in the current mapping if the position lies inside it
    [[nodiscard]] Result<void> seek(std::size_t position) noexcept;

    [[nodiscard]] std::size_t position() const noexcept;

    /// @brief File offset of the first byte of the current window
    [[nodiscard]] std::size_t base_offset() const noexcept;

    /// @brief Number of ranges mapped since creation (including the first)
    [[nodiscard]] std::size_t remap_count() const noexcept;

    [[nodiscard]] std::size_t file_length() const noexcept;

private:
    MappedWindow(Channel& channel, std::size_t file_length, std::size_t max_window_size) noexcept;

    [[nodiscard]] std::size_t window_end() const noexcept;
    [[nodiscard]] Result<void> remap(std::size_t offset) noexcept;

    Channel* channel_;
    ViewType view_;
    std::size_t file_length_;
    std::size_t max_window_size_;
    std::size_t base_offset_{0};
    std::size_t cursor_{0};
    std::size_t remap_count_{0};
};

} // namespace chansource

#define CHANSOURCE_WINDOW_HEADER
#include "impl/window_impl.hpp"
