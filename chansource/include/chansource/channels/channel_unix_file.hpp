#pragma once

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include "../channel_base.hpp"

namespace chansource {

namespace detail {
    struct MmapDeleter {
        std::size_t size;

        void operator()(void* ptr) const noexcept {
            if (ptr && ptr != MAP_FAILED) {
                munmap(ptr, size);
            }
        }
    };

    [[nodiscard]] inline std::size_t page_size() noexcept {
        const long page = ::sysconf(_SC_PAGESIZE);
        return page > 0 ? static_cast<std::size_t>(page) : std::size_t{4096};
    }
}

/// Read-only view for a mapped file range - shares mmap ownership
class MmapReadView {
private:
    std::span<const std::byte> data_;
    std::shared_ptr<void> mmap_handle_;

public:
    MmapReadView() noexcept = default;

    MmapReadView(std::span<const std::byte> data, std::shared_ptr<void> handle) noexcept
        : data_(data), mmap_handle_(std::move(handle)) {}

    [[nodiscard]] std::span<const std::byte> data() const noexcept { return data_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    MmapReadView(MmapReadView&&) noexcept = default;
    MmapReadView& operator=(MmapReadView&&) noexcept = default;
    MmapReadView(const MmapReadView&) = delete;
    MmapReadView& operator=(const MmapReadView&) = delete;
};

static_assert(DataReadOnlyView<MmapReadView>, "MmapReadView must satisfy DataReadOnlyView concept");

/// Read-only file channel (POSIX)
///
/// Sequential reads go through pread at the channel's own cursor, so the
/// descriptor offset is never touched. map() creates an independent mmap of
/// any range; the mapping lives as long as the returned view.
/// The file length is captured when the file is opened.
class FileChannel {
private:
    int fd_{-1};
    std::size_t size_{0};
    std::size_t position_{0};
    std::string path_;

public:
    using MapViewType = MmapReadView;

    FileChannel() noexcept = default;

    explicit FileChannel(std::string_view path) noexcept {
        (void)open(path);
    }

    ~FileChannel() noexcept {
        close();
    }

    FileChannel(const FileChannel&) = delete;
    FileChannel& operator=(const FileChannel&) = delete;

    FileChannel(FileChannel&& other) noexcept
        : fd_(other.fd_)
        , size_(other.size_)
        , position_(other.position_)
        , path_(std::move(other.path_)) {
        other.fd_ = -1;
        other.size_ = 0;
        other.position_ = 0;
    }

    FileChannel& operator=(FileChannel&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            size_ = other.size_;
            position_ = other.position_;
            path_ = std::move(other.path_);
            other.fd_ = -1;
            other.size_ = 0;
            other.position_ = 0;
        }
        return *this;
    }

    [[nodiscard]] Result<void> open(std::string_view path) noexcept {
        close();

        path_ = path;
        fd_ = ::open(path_.c_str(), O_RDONLY);

        if (fd_ < 0) {
            return Err(Error::Code::FileNotFound,
                       "Failed to open file: " + std::string(path));
        }

        struct stat st;
        if (fstat(fd_, &st) != 0) {
            close();
            return Err(Error::Code::ReadError,
                       "Failed to get file size: " + std::string(path));
        }

        size_ = static_cast<std::size_t>(st.st_size);
        position_ = 0;
        return Ok();
    }

    void close() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
            size_ = 0;
            position_ = 0;
        }
    }

    [[nodiscard]] std::size_t position() const noexcept {
        return position_;
    }

    void set_position(std::size_t offset) noexcept {
        position_ = offset;
    }

    [[nodiscard]] Result<std::size_t> read(std::span<std::byte> buffer) noexcept {
        if (!is_valid()) {
            return Err(Error::Code::ReadError, "File not open");
        }
        if (buffer.empty() || position_ >= size_) {
            return Ok(std::size_t{0});
        }

        const std::size_t to_read = std::min(buffer.size(), size_ - position_);
        ssize_t bytes_read = ::pread(fd_, buffer.data(), to_read, static_cast<off_t>(position_));

        if (bytes_read < 0) {
            return Err(Error::Code::ReadError,
                       "pread failed: " + std::string(std::strerror(errno)));
        }

        position_ += static_cast<std::size_t>(bytes_read);
        return Ok(static_cast<std::size_t>(bytes_read));
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept {
        if (!is_valid()) {
            return Err(Error::Code::ReadError, "File not open");
        }
        return Ok(size_);
    }

    /// Map [offset, offset + size) read-only.
    /// mmap needs a page-aligned offset, so the mapping starts at the page
    /// holding `offset` and the view skips the leading bytes.
    [[nodiscard]] Result<MapViewType> map(std::size_t offset, std::size_t size) const noexcept {
        if (!is_valid()) {
            return Err(Error::Code::MapError, "File not open");
        }

        if (offset > size_) {
            return Err(Error::Code::OutOfBounds, "Map offset beyond file size");
        }

        const std::size_t length = std::min(size, size_ - offset);
        if (length == 0) {
            return Ok(MmapReadView());
        }

        const std::size_t page = detail::page_size();
        const std::size_t aligned_offset = offset - (offset % page);
        const std::size_t lead = offset - aligned_offset;
        const std::size_t map_length = length + lead;

        void* addr = mmap(nullptr, map_length, PROT_READ, MAP_PRIVATE, fd_,
                          static_cast<off_t>(aligned_offset));
        if (addr == MAP_FAILED) {
            return Err(Error::Code::MapError,
                       "Failed to mmap file: " + path_ + ": " + std::strerror(errno));
        }

        // Advise kernel for sequential access (helps with read performance)
        madvise(addr, map_length, MADV_SEQUENTIAL);

        std::shared_ptr<void> handle(addr, detail::MmapDeleter{map_length});
        auto* base = static_cast<const std::byte*>(addr) + lead;
        return Ok(MmapReadView(std::span<const std::byte>(base, length), std::move(handle)));
    }

    [[nodiscard]] bool is_valid() const noexcept {
        return fd_ >= 0;
    }

    [[nodiscard]] std::string_view path() const noexcept {
        return path_;
    }
};

static_assert(MappableChannel<FileChannel>, "FileChannel must satisfy MappableChannel concept");

} // namespace chansource
