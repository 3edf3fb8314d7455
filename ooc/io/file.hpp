// =============================================================================
// FILE: ooc/io/file.hpp
// BRIEF: Move-only POSIX file handle with positional I/O
// =============================================================================
#pragma once

#include "ooc/core/macros.hpp"
#include "ooc/core/error.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <string>
#include <utility>

namespace ooc::io {

enum class OpenMode {
    Read,       // existing file, read only
    Create      // new file, write only; fails if it exists
};

class File {
public:
    File() noexcept = default;

    File(const std::filesystem::path& path, OpenMode mode)
        : path_(path)
    {
        int flags = (mode == OpenMode::Read)
            ? (O_RDONLY | O_CLOEXEC)
            : (O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC);
        fd_ = ::open(path.c_str(), flags, 0644);
        OOC_CHECK_IO(fd_ >= 0, "Failed to open file: " + path.string() + " (" + std::strerror(errno) + ")");
    }

    ~File() {
        close();
    }

    File(File&& other) noexcept
        : fd_(std::exchange(other.fd_, -1))
        , path_(std::move(other.path_))
    {}

    File& operator=(File&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = std::exchange(other.fd_, -1);
            path_ = std::move(other.path_);
        }
        return *this;
    }

    File(const File&) = delete;
    File& operator=(const File&) = delete;

    OOC_NODISCARD bool is_open() const noexcept { return fd_ >= 0; }
    OOC_NODISCARD const std::filesystem::path& path() const noexcept { return path_; }

    void close() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    OOC_NODISCARD std::size_t size() const {
        struct stat st;
        OOC_CHECK_IO(::fstat(fd_, &st) == 0, "Failed to stat file: " + path_.string());
        return static_cast<std::size_t>(st.st_size);
    }

    /// Read exactly `count` bytes at `offset`. A short read means the file
    /// is shorter than expected and raises IOError.
    void read_at(std::uint64_t offset, void* dest, std::size_t count) const {
        auto* buf = static_cast<std::byte*>(dest);
        std::size_t remaining = count;
        auto file_offset = static_cast<off_t>(offset);

        while (remaining > 0) {
            ssize_t n = ::pread(fd_, buf, remaining, file_offset);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            OOC_CHECK_IO(n > 0, "Short read from " + path_.string() +
                         " at offset " + std::to_string(file_offset));
            buf += n;
            remaining -= static_cast<std::size_t>(n);
            file_offset += n;
        }
    }

    /// Append `count` bytes at the current position.
    void write_all(const void* src, std::size_t count) {
        const auto* buf = static_cast<const std::byte*>(src);
        std::size_t remaining = count;

        while (remaining > 0) {
            ssize_t n = ::write(fd_, buf, remaining);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            OOC_CHECK_IO(n > 0, "Failed to write " + path_.string() +
                         " (" + std::strerror(errno) + ")");
            buf += n;
            remaining -= static_cast<std::size_t>(n);
        }
    }

    void sync() {
        OOC_CHECK_IO(::fsync(fd_) == 0, "Failed to sync " + path_.string());
    }

private:
    int fd_ = -1;
    std::filesystem::path path_;
};

} // namespace ooc::io
