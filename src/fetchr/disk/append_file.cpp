// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/disk/append_file.hpp>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fetchr::disk {

std::error_code errno_to_error_code(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:       return make_error_code(DiskErrc::invalid_path);
        case EEXIST:        return make_error_code(DiskErrc::file_exists);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(fallback);
    }
}

//=============================================================================
// AppendFile
//=============================================================================

std::expected<AppendFile, std::error_code>
AppendFile::open(const std::filesystem::path& path, OpenMode mode) noexcept {
    AppendFile file;
    try {
        file.path_ = path;
    } catch (...) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }

    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    flags |= (mode == OpenMode::append) ? O_APPEND : O_TRUNC;

    int fd = -1;
    do {
        fd = ::open(path.c_str(), flags, 0644);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        return std::unexpected(errno_to_error_code(errno, DiskErrc::invalid_path));
    }

    file.fd_ = fd;
    return file;
}

AppendFile::~AppendFile() {
    close();
}

AppendFile::AppendFile(AppendFile&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_))
    , bytes_written_(other.bytes_written_) {
    other.fd_ = -1;
    other.bytes_written_ = 0;
}

AppendFile& AppendFile::operator=(AppendFile&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        bytes_written_ = other.bytes_written_;
        other.fd_ = -1;
        other.bytes_written_ = 0;
    }
    return *this;
}

std::error_code AppendFile::write(const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* ptr = static_cast<const char*>(data);
    std::size_t remaining = size;
    while (remaining > 0) {
        ssize_t n = ::write(fd_, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno, DiskErrc::write_error);
        }
        ptr += n;
        remaining -= static_cast<std::size_t>(n);
        bytes_written_ += static_cast<std::uint64_t>(n);
    }
    return {};
}

std::expected<std::uint64_t, std::error_code>
AppendFile::append_from(const std::filesystem::path& source) noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    int in = -1;
    do {
        in = ::open(source.c_str(), O_RDONLY | O_CLOEXEC);
    } while (in < 0 && errno == EINTR);

    if (in < 0) {
        return std::unexpected(errno_to_error_code(errno, DiskErrc::read_error));
    }

    std::vector<char> buffer;
    try {
        buffer.resize(COPY_BUFFER_SIZE);
    } catch (...) {
        ::close(in);
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }

    std::uint64_t copied = 0;
    while (true) {
        ssize_t n = ::read(in, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            auto ec = errno_to_error_code(errno, DiskErrc::read_error);
            ::close(in);
            return std::unexpected(ec);
        }
        if (n == 0) break;

        if (auto ec = write(buffer.data(), static_cast<std::size_t>(n)); ec) {
            ::close(in);
            return std::unexpected(ec);
        }
        copied += static_cast<std::uint64_t>(n);
    }

    ::close(in);
    return copied;
}

std::error_code AppendFile::sync() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fsync(fd_) != 0) {
        return errno_to_error_code(errno, DiskErrc::write_error);
    }
    return {};
}

void AppendFile::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

//=============================================================================
// ChunkBuffer
//=============================================================================

ChunkBuffer::ChunkBuffer(std::size_t capacity) {
    buffer_.resize(std::max<std::size_t>(capacity, 1));
}

std::size_t ChunkBuffer::append(const void* data, std::size_t size) noexcept {
    std::size_t take = std::min(size, room());
    std::memcpy(buffer_.data() + size_, data, take);
    size_ += take;
    return take;
}

//=============================================================================
// Helpers
//=============================================================================

std::expected<std::uint64_t, std::error_code>
file_size(const std::filesystem::path& path) noexcept {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return std::unexpected(errno_to_error_code(errno, DiskErrc::read_error));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

std::error_code remove_file(const std::filesystem::path& path) noexcept {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        return errno_to_error_code(errno, DiskErrc::remove_error);
    }
    return {};
}

std::error_code rename_file(const std::filesystem::path& from, const std::filesystem::path& to) noexcept {
    if (::rename(from.c_str(), to.c_str()) != 0) {
        return errno_to_error_code(errno, DiskErrc::rename_error);
    }
    return {};
}

} // namespace fetchr::disk
