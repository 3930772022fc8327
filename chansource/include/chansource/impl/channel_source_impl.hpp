// This file contains the implementation of ChannelSource.
// Do not include this file directly - it is included by channel_source.hpp

#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <spdlog/spdlog.h>
#include "../decoder.hpp"
#include "../types/encoding.hpp"
#include "../types/result.hpp"
#include "../window.hpp"

#ifndef CHANSOURCE_CHANNEL_SOURCE_HEADER
#include "../channel_source.hpp" // for linters
#endif

namespace chansource {

template <MappableChannel Channel>
ChannelSource<Channel>::ChannelSource(Channel& channel, Config config, WindowType&& window) noexcept
    : channel_(&channel)
    , config_(config)
    , window_(std::move(window)) {}

template <MappableChannel Channel>
Result<ChannelSource<Channel>> ChannelSource<Channel>::create(Channel& channel) noexcept {
    return create(channel, Config{});
}

template <MappableChannel Channel>
Result<ChannelSource<Channel>> ChannelSource<Channel>::create(Channel& channel, Config config) noexcept {
    if (!is_supported(config.encoding)) [[unlikely]] {
        spdlog::warn("chansource: refusing encoding value {}", static_cast<int>(config.encoding));
        return Err(Error::Code::UnsupportedEncoding,
                   "Unsupported encoding value " + std::to_string(static_cast<int>(config.encoding)));
    }
    if (!is_supported(config.strategy)) [[unlikely]] {
        spdlog::warn("chansource: refusing read strategy value {}", static_cast<int>(config.strategy));
        return Err(Error::Code::InvalidConfiguration,
                   "Unknown read strategy value " + std::to_string(static_cast<int>(config.strategy)));
    }
    if (!channel.is_valid()) [[unlikely]] {
        return Err(Error::Code::InvalidConfiguration, "Channel is not open");
    }

    if (config.strategy == ReadStrategy::Buffered) {
        if (config.buffer_size < min_buffer_size) {
            spdlog::warn("chansource: buffer size {} is below the minimum of {}",
                         config.buffer_size, min_buffer_size);
            return Err(Error::Code::InvalidConfiguration,
                       "Buffer must be at least 3 bytes to decode UTF-8, got " +
                       std::to_string(config.buffer_size));
        }
        WindowType window(std::in_place_type<BufferedWindow<Channel>>, channel, config.buffer_size);
        return Ok(ChannelSource(channel, config, std::move(window)));
    }

    if (config.max_window_size < min_buffer_size) {
        spdlog::warn("chansource: window size {} is below the minimum of {}",
                     config.max_window_size, min_buffer_size);
        return Err(Error::Code::InvalidConfiguration,
                   "Mapped window must be at least 3 bytes, got " +
                   std::to_string(config.max_window_size));
    }

    auto mapped = MappedWindow<Channel>::create(channel, config.max_window_size, channel.position());
    if (!mapped) {
        return mapped.error();
    }
    WindowType window(std::in_place_type<MappedWindow<Channel>>, std::move(mapped.value()));
    return Ok(ChannelSource(channel, config, std::move(window)));
}

template <MappableChannel Channel>
bool ChannelSource<Channel>::has_next() noexcept {
    if (pending_error_) {
        return true;
    }
    auto more = window_has_more();
    if (!more) {
        spdlog::debug("chansource: {} while refilling at offset {}, reported by next(): {}",
                      to_string(more.error().code), position(), more.error().message);
        pending_error_ = more.error();
        return true;
    }
    return more.value();
}

template <MappableChannel Channel>
Result<char16_t> ChannelSource<Channel>::next() noexcept {
    auto pending = take_pending_error();
    if (!pending) {
        return pending.error();
    }

    auto more = window_has_more();
    if (!more) {
        return more.error();
    }
    if (!more.value()) {
        return Err(Error::Code::EndOfInput, "next() called on exhausted ChannelSource");
    }

    if (config_.encoding == Encoding::ISO8859_1) {
        const DecodedChar decoded = decode_iso8859_1(window_available());
        window_consume(decoded.consumed);
        return Ok(decoded.value);
    }

    // Make sure the whole sequence is in memory unless input ends first
    const std::size_t length = utf8_sequence_length(window_available().front());
    auto ensured = std::visit([&](auto& window) {
        return window.ensure(std::max(length, utf8_lookahead));
    }, window_);
    if (!ensured) {
        return ensured.error();
    }

    if (ensured.value() < length) {
        // Wider than the window, or cut short by the end of input
        auto skipped = skip_sequence(length);
        if (!skipped) {
            return skipped.error();
        }
        return Ok(replacement_character);
    }

    const DecodedChar decoded = decode_utf8(window_available());
    window_consume(decoded.consumed);
    return Ok(decoded.value);
}

template <MappableChannel Channel>
std::size_t ChannelSource<Channel>::position() const noexcept {
    return std::visit([](const auto& window) { return window.position(); }, window_);
}

template <MappableChannel Channel>
Result<void> ChannelSource<Channel>::set_position(std::size_t position) noexcept {
    pending_error_.reset();

    auto size_result = channel_->size();
    if (size_result && position > size_result.value()) {
        spdlog::debug("chansource: seek to {} is past the end of input ({} bytes)",
                      position, size_result.value());
    }

    return std::visit([position](auto& window) { return window.seek(position); }, window_);
}

template <MappableChannel Channel>
Result<std::u16string> ChannelSource<Channel>::read_remaining() {
    std::u16string out;
    while (has_next()) {
        auto c = next();
        if (!c) {
            return c.error();
        }
        out.push_back(c.value());
    }
    return Ok(std::move(out));
}

template <MappableChannel Channel>
LineIterator<Channel> ChannelSource<Channel>::lines() noexcept {
    return LineIterator<Channel>(*this);
}

template <MappableChannel Channel>
inline Encoding ChannelSource<Channel>::encoding() const noexcept {
    return config_.encoding;
}

template <MappableChannel Channel>
inline ReadStrategy ChannelSource<Channel>::strategy() const noexcept {
    return config_.strategy;
}

template <MappableChannel Channel>
inline std::size_t ChannelSource<Channel>::buffer_size() const noexcept {
    return config_.buffer_size;
}

template <MappableChannel Channel>
std::size_t ChannelSource<Channel>::remap_count() const noexcept {
    if (const auto* mapped = std::get_if<MappedWindow<Channel>>(&window_)) {
        return mapped->remap_count();
    }
    return 0;
}

template <MappableChannel Channel>
Result<bool> ChannelSource<Channel>::window_has_more() noexcept {
    return std::visit([](auto& window) { return window.has_more(); }, window_);
}

template <MappableChannel Channel>
std::span<const std::byte> ChannelSource<Channel>::window_available() const noexcept {
    return std::visit([](const auto& window) { return window.available(); }, window_);
}

template <MappableChannel Channel>
void ChannelSource<Channel>::window_consume(std::size_t count) noexcept {
    std::visit([count](auto& window) { window.consume(count); }, window_);
}

template <MappableChannel Channel>
Result<void> ChannelSource<Channel>::take_pending_error() noexcept {
    if (!pending_error_) {
        return Ok();
    }
    Error error = std::move(*pending_error_);
    pending_error_.reset();
    return error;
}

/// Consume `length` bytes of an undecodable sequence, refilling as many
/// times as needed. Stops early at end of input.
template <MappableChannel Channel>
Result<void> ChannelSource<Channel>::skip_sequence(std::size_t length) noexcept {
    std::size_t left = length;
    while (left > 0) {
        const std::size_t step = std::min(left, window_available().size());
        window_consume(step);
        left -= step;
        if (left == 0) {
            break;
        }

        auto more = window_has_more();
        if (!more) {
            return more.error();
        }
        if (!more.value()) {
            break;
        }
    }
    return Ok();
}

} // namespace chansource
