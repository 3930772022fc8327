// This file contains the implementation of LineBuffer and LineIterator.
// Do not include this file directly - it is included by line_iterator.hpp

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include "../decoder.hpp"
#include "../types/result.hpp"

#ifndef CHANSOURCE_LINE_ITERATOR_HEADER
#include "../line_iterator.hpp" // for linters
#endif

namespace chansource {

// ============================================================================
// LineBuffer
// ============================================================================

inline LineBuffer::LineBuffer()
    : LineBuffer(default_capacity) {}

inline LineBuffer::LineBuffer(std::size_t initial_capacity)
    : data_(std::make_unique<std::byte[]>(std::max<std::size_t>(initial_capacity, 1)))
    , capacity_(std::max<std::size_t>(initial_capacity, 1)) {}

inline void LineBuffer::append(std::span<const std::byte> bytes) {
    if (bytes.empty()) {
        return;
    }

    if (size_ + bytes.size() > capacity_) {
        std::size_t new_capacity = capacity_;
        while (new_capacity < size_ + bytes.size()) {
            new_capacity *= 2;
        }
        auto grown = std::make_unique<std::byte[]>(new_capacity);
        std::memcpy(grown.get(), data_.get(), size_);
        data_ = std::move(grown);
        capacity_ = new_capacity;
    }

    std::memcpy(data_.get() + size_, bytes.data(), bytes.size());
    size_ += bytes.size();
}

inline void LineBuffer::clear() noexcept {
    size_ = 0;
}

inline std::span<const std::byte> LineBuffer::bytes() const noexcept {
    return std::span<const std::byte>(data_.get(), size_);
}

inline std::size_t LineBuffer::size() const noexcept {
    return size_;
}

inline std::size_t LineBuffer::capacity() const noexcept {
    return capacity_;
}

// ============================================================================
// LineIterator
// ============================================================================

template <MappableChannel Channel>
LineIterator<Channel>::LineIterator(ChannelSource<Channel>& source)
    : source_(&source) {}

template <MappableChannel Channel>
bool LineIterator<Channel>::has_next() noexcept {
    const bool more = source_->has_next();
    if (!more) {
        state_ = State::Exhausted;
    } else if (state_ == State::Exhausted) {
        state_ = State::AwaitingLine;
    }
    return more;
}

template <MappableChannel Channel>
Result<std::u16string> LineIterator<Channel>::next() {
    if (!has_next()) {
        return Err(Error::Code::EndOfInput, "next() called on exhausted line iterator");
    }

    // A failed refill inside has_next() is reported here
    auto pending = source_->take_pending_error();
    if (!pending) {
        return pending.error();
    }

    const std::size_t start = source_->position();
    state_ = State::Accumulating;
    buffer_.clear();

    constexpr std::byte newline{0x0A};
    while (true) {
        auto more = source_->window_has_more();
        if (!more) {
            // Rewind to the line start so a retry sees the whole line
            buffer_.clear();
            state_ = State::AwaitingLine;
            auto rewind = source_->set_position(start);
            if (!rewind) {
                return rewind.error();
            }
            return more.error();
        }
        if (!more.value()) {
            break;
        }

        const std::span<const std::byte> bytes = source_->window_available();
        const auto terminator = std::find(bytes.begin(), bytes.end(), newline);
        const auto count = static_cast<std::size_t>(terminator - bytes.begin());
        buffer_.append(bytes.first(count));

        if (terminator != bytes.end()) {
            source_->window_consume(count + 1);
            break;
        }
        source_->window_consume(count);
    }

    state_ = State::AwaitingLine;
    return Ok(decode_all(buffer_.bytes(), source_->encoding()));
}

template <MappableChannel Channel>
inline typename LineIterator<Channel>::State LineIterator<Channel>::state() const noexcept {
    return state_;
}

} // namespace chansource
