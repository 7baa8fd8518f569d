// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <volley/disk/random_access_file.hpp>
#include <volley/disk/error.hpp>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace volley::disk {

// Thread-safe positioned writer over one temp file shared by all chunks
class FileWriter {
public:
    FileWriter() = default;

    // Create (or truncate) the file and reserve `size` bytes. Size 0 leaves it empty.
    [[nodiscard]] std::error_code open(const std::filesystem::path& path, std::uint64_t size) noexcept;

    // Write data at offset (thread-safe)
    [[nodiscard]] std::error_code write(std::uint64_t offset, std::span<const std::byte> data) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::unique_ptr<RandomAccessFile> file_;
    std::filesystem::path path_;
    std::atomic<bool> closed_{true};
};

// Destination of one chunk's body. Writes append; reset() rewinds for a retry.
// A sink is only ever used by the worker that owns the chunk.
class ChunkSink {
public:
    virtual ~ChunkSink() = default;

    [[nodiscard]] virtual std::error_code write(std::span<const std::byte> data) noexcept = 0;

    // Drop everything written so far
    [[nodiscard]] virtual std::error_code reset() noexcept = 0;

    // Flush and release resources once the chunk is complete
    [[nodiscard]] virtual std::error_code finish() noexcept = 0;

    [[nodiscard]] virtual std::uint64_t written() const noexcept = 0;
};

// Window [base, base + capacity) of a shared FileWriter
class RegionSink final : public ChunkSink {
public:
    RegionSink(FileWriter& writer, std::uint64_t base, std::uint64_t capacity) noexcept
        : writer_(writer), base_(base), capacity_(capacity) {}

    std::error_code write(std::span<const std::byte> data) noexcept override;
    std::error_code reset() noexcept override;
    std::error_code finish() noexcept override { return {}; }
    std::uint64_t written() const noexcept override { return written_; }

private:
    FileWriter& writer_;
    std::uint64_t base_;
    std::uint64_t capacity_;
    std::uint64_t written_{0};
};

// One file per chunk, concatenated by the Reassembler
class PartFileSink final : public ChunkSink {
public:
    [[nodiscard]] static std::expected<std::unique_ptr<PartFileSink>, std::error_code>
    create(const std::filesystem::path& path, std::uint64_t capacity) noexcept;

    std::error_code write(std::span<const std::byte> data) noexcept override;
    std::error_code reset() noexcept override;
    std::error_code finish() noexcept override;
    std::uint64_t written() const noexcept override { return written_; }

private:
    PartFileSink(RandomAccessFile file, std::uint64_t capacity) noexcept
        : file_(std::move(file)), capacity_(capacity) {}

    RandomAccessFile file_;
    std::uint64_t capacity_;
    std::uint64_t written_{0};
};

} // namespace volley::disk
