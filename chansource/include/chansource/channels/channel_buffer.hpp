#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <span>
#include "../channel_base.hpp"

namespace chansource {

/// Read-only view for borrowed buffer data (zero-copy)
class BorrowedBufferReadView {
private:
    std::span<const std::byte> data_;

public:
    BorrowedBufferReadView() noexcept = default;

    explicit BorrowedBufferReadView(std::span<const std::byte> data) noexcept
        : data_(data) {}

    [[nodiscard]] std::span<const std::byte> data() const noexcept { return data_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    BorrowedBufferReadView(BorrowedBufferReadView&&) noexcept = default;
    BorrowedBufferReadView& operator=(BorrowedBufferReadView&&) noexcept = default;
    BorrowedBufferReadView(const BorrowedBufferReadView&) = delete;
    BorrowedBufferReadView& operator=(const BorrowedBufferReadView&) = delete;
};

static_assert(DataReadOnlyView<BorrowedBufferReadView>, "BorrowedBufferReadView must satisfy DataReadOnlyView concept");

/// Byte channel over a borrowed in-memory buffer
///
/// The buffer must outlive the channel and every view returned by map().
/// map() is zero-copy; read() copies into the caller's buffer.
class BufferChannel {
private:
    std::span<const std::byte> buffer_;
    std::size_t position_{0};
    bool attached_{false};

public:
    using MapViewType = BorrowedBufferReadView;

    BufferChannel() noexcept = default;

    explicit BufferChannel(std::span<const std::byte> buffer) noexcept
        : buffer_(buffer), attached_(true) {}

    // Template constructor for any span type
    template <typename T>
    explicit BufferChannel(std::span<const T> data) noexcept
        : buffer_(std::as_bytes(data)), attached_(true) {}

    [[nodiscard]] std::size_t position() const noexcept {
        return position_;
    }

    void set_position(std::size_t offset) noexcept {
        position_ = offset;
    }

    [[nodiscard]] Result<std::size_t> read(std::span<std::byte> buffer) noexcept {
        if (!is_valid()) {
            return Err(Error::Code::ReadError, "Buffer not set");
        }
        if (position_ >= buffer_.size()) {
            return Ok(std::size_t{0});
        }
        const std::size_t count = std::min(buffer.size(), buffer_.size() - position_);
        std::memcpy(buffer.data(), buffer_.data() + position_, count);
        position_ += count;
        return Ok(count);
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept {
        if (!is_valid()) {
            return Err(Error::Code::ReadError, "Buffer not set");
        }
        return Ok(buffer_.size());
    }

    [[nodiscard]] Result<MapViewType> map(std::size_t offset, std::size_t size) const noexcept {
        if (!is_valid()) {
            return Err(Error::Code::MapError, "Buffer not set");
        }
        if (offset > buffer_.size()) {
            return Err(Error::Code::OutOfBounds, "Map offset beyond buffer size");
        }
        const std::size_t count = std::min(size, buffer_.size() - offset);
        return Ok(BorrowedBufferReadView(buffer_.subspan(offset, count)));
    }

    [[nodiscard]] bool is_valid() const noexcept {
        return attached_;
    }

    void set_buffer(std::span<const std::byte> buffer) noexcept {
        buffer_ = buffer;
        position_ = 0;
        attached_ = true;
    }

    [[nodiscard]] std::span<const std::byte> buffer() const noexcept {
        return buffer_;
    }
};

static_assert(MappableChannel<BufferChannel>, "BufferChannel must satisfy MappableChannel concept");

} // namespace chansource
