#include <gtest/gtest.h>
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

#include "../chansource/include/chansource/chansource.hpp"
#include "test_helpers.hpp"

using namespace chansource;
using chansource_test::bytes_of;
using chansource_test::TempFiles;

// ============================================================================
// Test Helper Types
// ============================================================================

/// In-memory channel whose reads fail once the cursor reaches `fail_at`,
/// and whose mappings always fail. With `fail_once` only the first failing
/// read fails; later reads succeed.
class FailingChannel {
private:
    std::vector<std::byte> data_;
    std::size_t position_{0};
    std::size_t fail_at_;
    bool fail_once_;

public:
    using MapViewType = BorrowedBufferReadView;

    FailingChannel(std::vector<std::byte> data, std::size_t fail_at, bool fail_once = false)
        : data_(std::move(data)), fail_at_(fail_at), fail_once_(fail_once) {}

    [[nodiscard]] std::size_t position() const noexcept { return position_; }
    void set_position(std::size_t offset) noexcept { position_ = offset; }

    [[nodiscard]] Result<std::size_t> read(std::span<std::byte> buffer) noexcept {
        if (position_ >= fail_at_) {
            if (fail_once_) {
                fail_at_ = std::numeric_limits<std::size_t>::max();
            }
            return Err(Error::Code::ReadError, "simulated read failure");
        }
        const std::size_t limit = std::min(fail_at_, data_.size());
        if (position_ >= limit) {
            return Ok(std::size_t{0});
        }
        const std::size_t count = std::min(buffer.size(), limit - position_);
        std::memcpy(buffer.data(), data_.data() + position_, count);
        position_ += count;
        return Ok(count);
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept { return Ok(data_.size()); }

    [[nodiscard]] Result<MapViewType> map(std::size_t, std::size_t) const noexcept {
        return Err(Error::Code::MapError, "simulated map failure");
    }

    [[nodiscard]] bool is_valid() const noexcept { return true; }
};

static_assert(MappableChannel<FailingChannel>);

// ============================================================================
// Construction errors
// ============================================================================

TEST(ConstructionErrorTest, UnsupportedEncodingValue) {
    const auto data = bytes_of("abc");
    BufferChannel channel{std::span<const std::byte>(data)};
    SourceConfig config;
    config.encoding = static_cast<Encoding>(7);

    auto source = ChannelSource<BufferChannel>::create(channel, config);
    ASSERT_TRUE(source.is_error());
    EXPECT_EQ(source.error().code, Error::Code::UnsupportedEncoding);
}

TEST(ConstructionErrorTest, UnknownStrategyValue) {
    const auto data = bytes_of("abc");
    BufferChannel channel{std::span<const std::byte>(data)};
    SourceConfig config;
    config.strategy = static_cast<ReadStrategy>(9);

    auto source = ChannelSource<BufferChannel>::create(channel, config);
    ASSERT_TRUE(source.is_error());
    EXPECT_EQ(source.error().code, Error::Code::InvalidConfiguration);
}

TEST(ConstructionErrorTest, BufferTooSmallForUtf8) {
    const auto data = bytes_of("abc");
    BufferChannel channel{std::span<const std::byte>(data)};
    SourceConfig config;
    config.buffer_size = 2;

    auto source = ChannelSource<BufferChannel>::create(channel, config);
    ASSERT_TRUE(source.is_error());
    EXPECT_EQ(source.error().code, Error::Code::InvalidConfiguration);
    EXPECT_NE(source.error().message.find("at least 3 bytes"), std::string::npos);
}

TEST(ConstructionErrorTest, BufferSizeIgnoredWhenMapped) {
    const auto data = bytes_of("abc");
    BufferChannel channel{std::span<const std::byte>(data)};
    SourceConfig config;
    config.strategy = ReadStrategy::MemoryMapped;
    config.buffer_size = 2;

    auto source = ChannelSource<BufferChannel>::create(channel, config);
    ASSERT_TRUE(source.is_ok());
}

TEST(ConstructionErrorTest, WindowTooSmall) {
    const auto data = bytes_of("abc");
    BufferChannel channel{std::span<const std::byte>(data)};
    SourceConfig config;
    config.strategy = ReadStrategy::MemoryMapped;
    config.max_window_size = 2;

    auto source = ChannelSource<BufferChannel>::create(channel, config);
    ASSERT_TRUE(source.is_error());
    EXPECT_EQ(source.error().code, Error::Code::InvalidConfiguration);
}

TEST(ConstructionErrorTest, InvalidChannel) {
    BufferChannel detached;
    auto buffered = ChannelSource<BufferChannel>::create(detached);
    ASSERT_TRUE(buffered.is_error());
    EXPECT_EQ(buffered.error().code, Error::Code::InvalidConfiguration);

    FileChannel missing("/nonexistent/path/chansource_missing.txt");
    SourceConfig config;
    config.strategy = ReadStrategy::MemoryMapped;
    auto mapped = ChannelSource<FileChannel>::create(missing, config);
    ASSERT_TRUE(mapped.is_error());
    EXPECT_EQ(mapped.error().code, Error::Code::InvalidConfiguration);
}

TEST(ConstructionErrorTest, FirstMappingFailure) {
    FailingChannel channel(bytes_of("abc"), 3);
    SourceConfig config;
    config.strategy = ReadStrategy::MemoryMapped;

    auto source = ChannelSource<FailingChannel>::create(channel, config);
    ASSERT_TRUE(source.is_error());
    EXPECT_EQ(source.error().code, Error::Code::MapError);
}

// ============================================================================
// I/O errors while reading
// ============================================================================

TEST(ReadErrorTest, FailureOnFirstRefillIsDeferredToNext) {
    FailingChannel channel(bytes_of("abc"), 0);
    auto source = ChannelSource<FailingChannel>::create(channel);
    ASSERT_TRUE(source.is_ok());
    auto& reader = source.value();

    // Unknown yet, so has_next() answers true and next() reports why
    EXPECT_TRUE(reader.has_next());
    auto c = reader.next();
    ASSERT_TRUE(c.is_error());
    EXPECT_EQ(c.error().code, Error::Code::ReadError);
    EXPECT_EQ(reader.position(), 0u);
}

TEST(ReadErrorTest, FailureWhileFillingLookahead) {
    FailingChannel channel(bytes_of("abcdefgh"), 4);
    SourceConfig config;
    config.buffer_size = 4;
    auto source = ChannelSource<FailingChannel>::create(channel, config);
    ASSERT_TRUE(source.is_ok());
    auto& reader = source.value();

    auto a = reader.next();
    ASSERT_TRUE(a.is_ok());
    EXPECT_EQ(a.value(), u'a');
    auto b = reader.next();
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(b.value(), u'b');

    // Two bytes left in the buffer, the lookahead refill fails
    auto c = reader.next();
    ASSERT_TRUE(c.is_error());
    EXPECT_EQ(c.error().code, Error::Code::ReadError);
    EXPECT_EQ(reader.position(), 2u);
}

TEST(ReadErrorTest, ReadRemainingPropagates) {
    FailingChannel channel(bytes_of("abcdefgh"), 4);
    SourceConfig config;
    config.buffer_size = 4;
    auto source = ChannelSource<FailingChannel>::create(channel, config);
    ASSERT_TRUE(source.is_ok());

    auto text = source.value().read_remaining();
    ASSERT_TRUE(text.is_error());
    EXPECT_EQ(text.error().code, Error::Code::ReadError);
}

TEST(ReadErrorTest, LineIteratorPropagates) {
    FailingChannel channel(bytes_of("abcdefgh"), 0);
    auto source = ChannelSource<FailingChannel>::create(channel);
    ASSERT_TRUE(source.is_ok());
    auto lines = source.value().lines();

    EXPECT_TRUE(lines.has_next());
    auto line = lines.next();
    ASSERT_TRUE(line.is_error());
    EXPECT_EQ(line.error().code, Error::Code::ReadError);
}

TEST(ReadErrorTest, FailureInsideLine) {
    FailingChannel channel(bytes_of("abcdefgh\n"), 5);
    SourceConfig config;
    config.buffer_size = 4;
    auto source = ChannelSource<FailingChannel>::create(channel, config);
    ASSERT_TRUE(source.is_ok());
    auto lines = source.value().lines();

    auto line = lines.next();
    ASSERT_TRUE(line.is_error());
    EXPECT_EQ(line.error().code, Error::Code::ReadError);
    EXPECT_EQ(source.value().position(), 0u);
    EXPECT_EQ(lines.state(), LineIterator<FailingChannel>::State::AwaitingLine);
}

TEST(ReadErrorTest, RetryAfterTransientFailureReturnsWholeLine) {
    FailingChannel channel(bytes_of("abcdefgh\nz"), 5, true);
    SourceConfig config;
    config.buffer_size = 4;
    auto source = ChannelSource<FailingChannel>::create(channel, config);
    ASSERT_TRUE(source.is_ok());
    auto& reader = source.value();
    auto lines = reader.lines();

    ASSERT_TRUE(reader.next().is_ok());
    EXPECT_EQ(reader.position(), 1u);

    auto failed = lines.next();
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code, Error::Code::ReadError);
    EXPECT_EQ(reader.position(), 1u);

    auto line = lines.next();
    ASSERT_TRUE(line.is_ok());
    EXPECT_EQ(line.value(), u"bcdefgh");
    EXPECT_EQ(reader.position(), 9u);

    auto last = lines.next();
    ASSERT_TRUE(last.is_ok());
    EXPECT_EQ(last.value(), u"z");
    EXPECT_FALSE(lines.has_next());
}

TEST(ReadErrorTest, SeekClearsPendingError) {
    FailingChannel channel(bytes_of("abcdef"), 0);
    auto source = ChannelSource<FailingChannel>::create(channel);
    ASSERT_TRUE(source.is_ok());
    auto& reader = source.value();

    EXPECT_TRUE(reader.has_next());
    ASSERT_TRUE(reader.set_position(0).is_ok());

    // The stale failure is gone; the retry fails again on its own
    EXPECT_TRUE(reader.has_next());
    auto c = reader.next();
    ASSERT_TRUE(c.is_error());
    EXPECT_EQ(c.error().code, Error::Code::ReadError);
}

// ============================================================================
// End of input
// ============================================================================

TEST(EndOfInputTest, NotAnIoError) {
    TempFiles files;
    FileChannel channel(files.create(bytes_of("z")).string());
    auto source = ChannelSource<FileChannel>::create(channel);
    ASSERT_TRUE(source.is_ok());

    ASSERT_TRUE(source.value().next().is_ok());
    auto c = source.value().next();
    ASSERT_TRUE(c.is_error());
    EXPECT_EQ(c.error().code, Error::Code::EndOfInput);
    EXPECT_NE(c.error().code, Error::Code::ReadError);
}

// ============================================================================
// Name lookup
// ============================================================================

TEST(EncodingNameTest, ParsesKnownNames) {
    EXPECT_EQ(parse_encoding("UTF-8").value(), Encoding::UTF8);
    EXPECT_EQ(parse_encoding("utf8").value(), Encoding::UTF8);
    EXPECT_EQ(parse_encoding("ISO-8859-1").value(), Encoding::ISO8859_1);
    EXPECT_EQ(parse_encoding("latin1").value(), Encoding::ISO8859_1);
}

TEST(EncodingNameTest, RejectsUnknownNames) {
    auto result = parse_encoding("UTF-16");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::UnsupportedEncoding);
    EXPECT_NE(result.error().message.find("UTF-16"), std::string::npos);
}

TEST(EncodingNameTest, NamesRoundTrip) {
    EXPECT_EQ(parse_encoding(to_string(Encoding::UTF8)).value(), Encoding::UTF8);
    EXPECT_EQ(parse_encoding(to_string(Encoding::ISO8859_1)).value(), Encoding::ISO8859_1);
    EXPECT_EQ(parse_strategy(to_string(ReadStrategy::Buffered)).value(), ReadStrategy::Buffered);
    EXPECT_EQ(parse_strategy(to_string(ReadStrategy::MemoryMapped)).value(), ReadStrategy::MemoryMapped);
}

TEST(StrategyNameTest, ParsesAndRejects) {
    EXPECT_EQ(parse_strategy("mmap").value(), ReadStrategy::MemoryMapped);
    EXPECT_EQ(parse_strategy("Buffered").value(), ReadStrategy::Buffered);

    auto result = parse_strategy("async");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::InvalidConfiguration);
}

TEST(EncodingNameTest, UnsupportedValuesHaveNoName) {
    EXPECT_FALSE(is_supported(static_cast<Encoding>(7)));
    EXPECT_EQ(to_string(static_cast<Encoding>(7)), "unknown");
}

TEST(ErrorCodeNameTest, NamesEveryCode) {
    EXPECT_EQ(to_string(Error::Code::EndOfInput), "EndOfInput");
    EXPECT_EQ(to_string(Error::Code::ReadError), "ReadError");
    EXPECT_EQ(to_string(Error::Code::InvalidConfiguration), "InvalidConfiguration");
}
