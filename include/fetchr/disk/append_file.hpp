// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fetchr/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace fetchr::disk {

// Size of the staging buffer between the network and the artifact
constexpr std::size_t WRITE_BUFFER_SIZE = 256 * 1024; // 256 KB
constexpr std::size_t COPY_BUFFER_SIZE = 1024 * 1024; // 1 MB

enum class OpenMode : std::uint8_t {
    append,    // Create if missing, every write lands at the end
    truncate   // Create or truncate to zero
};

// Write-only file handle. Segment artifacts are only ever grown through this,
// never rewritten in place.
class AppendFile {
public:
    static std::expected<AppendFile, std::error_code>
    open(const std::filesystem::path& path, OpenMode mode = OpenMode::append) noexcept;

    AppendFile() = default;
    ~AppendFile();

    // Non-copyable, movable
    AppendFile(const AppendFile&) = delete;
    AppendFile& operator=(const AppendFile&) = delete;
    AppendFile(AppendFile&& other) noexcept;
    AppendFile& operator=(AppendFile&& other) noexcept;

    // Write all bytes (loops over partial writes)
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Copy the whole content of another file to the end of this one
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    append_from(const std::filesystem::path& source) noexcept;

    // fsync
    [[nodiscard]] std::error_code sync() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return bytes_written_; }

private:
    int fd_{-1};
    std::filesystem::path path_;
    std::uint64_t bytes_written_{0};
};

// Fixed-capacity staging buffer for chunked appends
class ChunkBuffer {
public:
    explicit ChunkBuffer(std::size_t capacity = WRITE_BUFFER_SIZE);

    [[nodiscard]] const void* data() const noexcept { return buffer_.data(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return buffer_.size(); }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] std::size_t room() const noexcept { return buffer_.size() - size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] bool full() const noexcept { return size_ == buffer_.size(); }

    // Append up to room() bytes, returns how many were taken
    std::size_t append(const void* data, std::size_t size) noexcept;

    void reset() noexcept { size_ = 0; }

private:
    std::vector<std::byte> buffer_;
    std::size_t size_{0};
};

// Current size of a regular file, or nullopt-like error when it does not exist
[[nodiscard]] std::expected<std::uint64_t, std::error_code>
file_size(const std::filesystem::path& path) noexcept;

// Remove a file; a missing file is not an error
[[nodiscard]] std::error_code remove_file(const std::filesystem::path& path) noexcept;

// Atomically replace `to` with `from`; both must be on the same filesystem
[[nodiscard]] std::error_code rename_file(const std::filesystem::path& from,
                                          const std::filesystem::path& to) noexcept;

} // namespace fetchr::disk
