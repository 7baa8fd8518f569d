// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace volley::disk {

enum class OpenMode : std::uint8_t {
    create_truncate,  // Create or truncate, read/write
    read_only
};

// POSIX file descriptor with positioned I/O. Writes at distinct offsets may run concurrently.
class RandomAccessFile {
public:
    static std::expected<RandomAccessFile, std::error_code>
    open(std::string_view path, OpenMode mode = OpenMode::create_truncate) noexcept;

    ~RandomAccessFile();

    // Non-copyable, movable
    RandomAccessFile(const RandomAccessFile&) = delete;
    RandomAccessFile& operator=(const RandomAccessFile&) = delete;
    RandomAccessFile(RandomAccessFile&&) noexcept;
    RandomAccessFile& operator=(RandomAccessFile&&) noexcept;

    // Reserve space and set the file length to `size`
    [[nodiscard]] std::error_code pre_allocate(std::uint64_t size) noexcept;

    // Write all `size` bytes at `offset` (loops over short writes)
    [[nodiscard]] std::error_code write(std::uint64_t offset, const void* data, std::size_t size) noexcept;

    // Read up to `size` bytes at `offset`; 0 means end of file
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read(std::uint64_t offset, void* buffer, std::size_t size) noexcept;

    [[nodiscard]] std::expected<std::uint64_t, std::error_code> size() const noexcept;

    [[nodiscard]] std::error_code truncate(std::uint64_t size) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    RandomAccessFile() = default;

    int fd_{-1};
    std::string path_;
};

} // namespace volley::disk
