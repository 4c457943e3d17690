#pragma once

#include <filesystem>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "streamgate/coro/task.hpp"
#include "streamgate/net/io_context.hpp"

namespace streamgate {

// ============================================================================
// FileHandleGuard - Owns a read-only file descriptor
// ============================================================================

class FileHandleGuard {
    int fd_ = -1;

public:
    FileHandleGuard() = default;

    explicit FileHandleGuard(const std::filesystem::path& path)
        : fd_(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {}

    ~FileHandleGuard() {
        close();
    }

    FileHandleGuard(const FileHandleGuard&) = delete;
    FileHandleGuard& operator=(const FileHandleGuard&) = delete;

    FileHandleGuard(FileHandleGuard&& other) noexcept
        : fd_(std::exchange(other.fd_, -1)) {}

    FileHandleGuard& operator=(FileHandleGuard&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    bool is_valid() const { return fd_ >= 0; }

    net::FileHandle get() const { return fd_; }

    size_t size() const {
        struct stat st;
        if (fstat(fd_, &st) == 0) {
            return static_cast<size_t>(st.st_size);
        }
        return 0;
    }
};

// ============================================================================
// Zero-Copy Send
// ============================================================================

// sendfile() a region of a file; length 0 means to the end of the file
inline Task<net::TransmitResult> send_file_zero_copy(
    net::Connection& conn,
    const std::filesystem::path& path,
    size_t offset = 0,
    size_t length = 0)
{
    FileHandleGuard file(path);
    if (!file.is_valid()) {
        co_return unexpected(Error::io(IoError::InvalidArgument,
            "Failed to open file: " + path.string()));
    }

    if (length == 0) {
        size_t size = file.size();
        length = size > offset ? size - offset : 0;
    }

    co_return co_await conn.async_transmit_file(file.get(), offset, length);
}

} // namespace streamgate
