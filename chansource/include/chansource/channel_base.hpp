#pragma once

#include <concepts>
#include <cstddef>
#include <span>
#include <type_traits>
#include "types/result.hpp"

namespace chansource {

/// Concept for a read-only view into data with RAII lifetime management
/// The view keeps the underlying storage (mapping, buffer) alive while it exists
template <typename T>
concept DataReadOnlyView = requires(T view) {
    // Access to the underlying data
    { view.data() } -> std::same_as<std::span<const std::byte>>;

    // Size of the data
    { view.size() } -> std::same_as<std::size_t>;

    // Check if view is empty
    { view.empty() } -> std::same_as<bool>;

    // Must be movable for Result<T> and for swapping windows
    requires std::move_constructible<T>;
    requires std::is_nothrow_move_constructible_v<T>;
};

/// Concept for a sequential byte channel with a seekable cursor
///
/// This mirrors a file handle: reads happen at the cursor and advance it,
/// the cursor can be placed anywhere (including past the end), and the total
/// length is known. A channel is not thread-safe; one reader drives it.
template <typename T>
concept ByteChannel = requires(T channel, const T cchannel, std::span<std::byte> buffer, std::size_t offset) {
    // Current cursor, in bytes from the start of the input
    { cchannel.position() } -> std::same_as<std::size_t>;

    // Move the cursor. Positions past the end are legal and read nothing.
    { channel.set_position(offset) } -> std::same_as<void>;

    // Read up to buffer.size() bytes at the cursor and advance it.
    // A return of 0 for a non-empty buffer signals end of input.
    { channel.read(buffer) } -> std::same_as<Result<std::size_t>>;

    // Total length of the input
    { cchannel.size() } -> std::same_as<Result<std::size_t>>;

    // Check if channel is valid/open
    { cchannel.is_valid() } -> std::same_as<bool>;
};

/// Concept for a byte channel that can also expose arbitrary ranges as
/// read-only memory views. The cursor is not affected by map().
template <typename T>
concept MappableChannel = ByteChannel<T> && requires(const T channel, std::size_t offset, std::size_t size) {
    // Map [offset, offset + size), clamped to the input length.
    // Mapping at exactly the end of input yields an empty view.
    { channel.map(offset, size) } -> std::same_as<Result<typename T::MapViewType>>;
    requires DataReadOnlyView<typename T::MapViewType>;
};

} // namespace chansource
