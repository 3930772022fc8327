// This file contains the implementation of the buffered and mapped windows.
// Do not include this file directly - it is included by window.hpp

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <memory>
#include <span>
#include <spdlog/spdlog.h>
#include "../channel_base.hpp"
#include "../decoder.hpp"
#include "../types/result.hpp"

#ifndef CHANSOURCE_WINDOW_HEADER
#include "../window.hpp" // for linters
#endif

namespace chansource {

// ============================================================================
// BufferedWindow
// ============================================================================

template <ByteChannel Channel>
BufferedWindow<Channel>::BufferedWindow(Channel& channel, std::size_t capacity)
    : channel_(&channel)
    , buffer_(std::make_unique<std::byte[]>(capacity))
    , capacity_(capacity) {}

template <ByteChannel Channel>
inline std::span<const std::byte> BufferedWindow<Channel>::available() const noexcept {
    return std::span<const std::byte>(buffer_.get() + begin_, end_ - begin_);
}

template <ByteChannel Channel>
inline std::size_t BufferedWindow<Channel>::remaining() const noexcept {
    return end_ - begin_;
}

template <ByteChannel Channel>
inline void BufferedWindow<Channel>::consume(std::size_t count) noexcept {
    begin_ += std::min(count, remaining());
}

template <ByteChannel Channel>
inline bool BufferedWindow<Channel>::exhausted() const noexcept {
    return exhausted_;
}

template <ByteChannel Channel>
Result<bool> BufferedWindow<Channel>::refill() noexcept {
    // Compact: move the unconsumed tail to the front
    if (begin_ > 0) {
        const std::size_t count = remaining();
        if (count > 0) {
            std::memmove(buffer_.get(), buffer_.get() + begin_, count);
        }
        begin_ = 0;
        end_ = count;
    }

    if (end_ == capacity_) {
        return Ok(true);
    }

    auto read_result = channel_->read(std::span<std::byte>(buffer_.get() + end_, capacity_ - end_));
    if (!read_result) {
        return read_result.error();
    }

    const std::size_t bytes_read = read_result.value();
    if (bytes_read == 0) {
        exhausted_ = true;
        spdlog::trace("chansource: end of input at offset {}", channel_->position());
    } else {
        end_ += bytes_read;
        spdlog::trace("chansource: buffered {} bytes, {} available", bytes_read, remaining());
    }

    return Ok(remaining() > 0);
}

template <ByteChannel Channel>
Result<std::size_t> BufferedWindow<Channel>::ensure(std::size_t count) noexcept {
    // Never wait for more than the window can hold
    const std::size_t wanted = std::min(count, capacity_);
    while (remaining() < wanted && !exhausted_) {
        auto refill_result = refill();
        if (!refill_result) {
            return refill_result.error();
        }
    }
    return Ok(remaining());
}

template <ByteChannel Channel>
Result<bool> BufferedWindow<Channel>::has_more() noexcept {
    if (remaining() > 0) {
        return Ok(true);
    }
    if (exhausted_) {
        return Ok(false);
    }
    return refill();
}

template <ByteChannel Channel>
Result<void> BufferedWindow<Channel>::seek(std::size_t position) noexcept {
    channel_->set_position(position);
    begin_ = 0;
    end_ = 0;
    exhausted_ = false;
    return Ok();
}

template <ByteChannel Channel>
inline std::size_t BufferedWindow<Channel>::position() const noexcept {
    return channel_->position() - remaining();
}

template <ByteChannel Channel>
inline std::size_t BufferedWindow<Channel>::capacity() const noexcept {
    return capacity_;
}

// ============================================================================
// MappedWindow
// ============================================================================

template <MappableChannel Channel>
MappedWindow<Channel>::MappedWindow(Channel& channel, std::size_t file_length, std::size_t max_window_size) noexcept
    : channel_(&channel)
    , view_()
    , file_length_(file_length)
    , max_window_size_(max_window_size) {}

template <MappableChannel Channel>
Result<MappedWindow<Channel>> MappedWindow<Channel>::create(Channel& channel,
                                                             std::size_t max_window_size,
                                                             std::size_t start) noexcept {
    auto size_result = channel.size();
    if (!size_result) {
        return size_result.error();
    }

    const std::size_t file_length = size_result.value();
    MappedWindow window(channel, file_length, max_window_size);
    auto map_result = window.remap(std::min(start, file_length));
    if (!map_result) {
        return map_result.error();
    }
    return Ok(std::move(window));
}

template <MappableChannel Channel>
inline std::span<const std::byte> MappedWindow<Channel>::available() const noexcept {
    return view_.data().subspan(cursor_);
}

template <MappableChannel Channel>
inline std::size_t MappedWindow<Channel>::remaining() const noexcept {
    return view_.size() - cursor_;
}

template <MappableChannel Channel>
inline void MappedWindow<Channel>::consume(std::size_t count) noexcept {
    cursor_ += std::min(count, remaining());
}

template <MappableChannel Channel>
inline bool MappedWindow<Channel>::exhausted() const noexcept {
    return window_end() >= file_length_;
}

template <MappableChannel Channel>
Result<bool> MappedWindow<Channel>::refill() noexcept {
    if (remaining() >= utf8_lookahead || exhausted()) {
        return Ok(remaining() > 0);
    }

    auto remap_result = remap(position());
    if (!remap_result) {
        return remap_result.error();
    }
    return Ok(remaining() > 0);
}

template <MappableChannel Channel>
Result<std::size_t> MappedWindow<Channel>::ensure(std::size_t count) noexcept {
    if (remaining() < count && !exhausted()) {
        auto remap_result = remap(position());
        if (!remap_result) {
            return remap_result.error();
        }
    }
    return Ok(remaining());
}

template <MappableChannel Channel>
Result<bool> MappedWindow<Channel>::has_more() noexcept {
    if (remaining() > 0) {
        return Ok(true);
    }
    return refill();
}

template <MappableChannel Channel>
Result<void> MappedWindow<Channel>::seek(std::size_t position) noexcept {
    const std::size_t target = std::min(position, file_length_);
    if (target >= base_offset_ && target <= window_end()) {
        cursor_ = target - base_offset_;
        return Ok();
    }
    return remap(target);
}

template <MappableChannel Channel>
inline std::size_t MappedWindow<Channel>::position() const noexcept {
    return base_offset_ + cursor_;
}

template <MappableChannel Channel>
inline std::size_t MappedWindow<Channel>::base_offset() const noexcept {
    return base_offset_;
}

template <MappableChannel Channel>
inline std::size_t MappedWindow<Channel>::remap_count() const noexcept {
    return remap_count_;
}

template <MappableChannel Channel>
inline std::size_t MappedWindow<Channel>::file_length() const noexcept {
    return file_length_;
}

template <MappableChannel Channel>
inline std::size_t MappedWindow<Channel>::window_end() const noexcept {
    return base_offset_ + view_.size();
}

template <MappableChannel Channel>
Result<void> MappedWindow<Channel>::remap(std::size_t offset) noexcept {
    const std::size_t size = std::min(file_length_ - offset, max_window_size_);

    auto map_result = channel_->map(offset, size);
    if (!map_result) {
        return map_result.error();
    }

    view_ = std::move(map_result.value());
    base_offset_ = offset;
    cursor_ = 0;
    ++remap_count_;

    spdlog::debug("chansource: mapped window [{}, {}) of {} bytes",
                  base_offset_, window_end(), file_length_);
    return Ok();
}

} // namespace chansource
