// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/disk/file_writer.hpp>
#include <limits>

namespace volley::disk {

namespace {

// capacity == max means the region has no upper bound
bool fits(std::uint64_t written, std::size_t extra, std::uint64_t capacity) noexcept {
    if (capacity == std::numeric_limits<std::uint64_t>::max()) return true;
    return extra <= capacity && written <= capacity - extra;
}

} // namespace

//=============================================================================
// FileWriter
//=============================================================================

std::error_code FileWriter::open(const std::filesystem::path& path, std::uint64_t size) noexcept {
    if (!closed_.load(std::memory_order_acquire)) {
        return make_error_code(DiskErrc::file_exists);
    }

    auto file = RandomAccessFile::open(path.native(), OpenMode::create_truncate);
    if (!file) {
        return file.error();
    }

    if (auto ec = file->pre_allocate(size)) {
        return ec;
    }

    try {
        path_ = path;
        file_ = std::make_unique<RandomAccessFile>(std::move(*file));
    } catch (...) {
        return make_error_code(DiskErrc::allocation_failed);
    }
    closed_.store(false, std::memory_order_release);
    return {};
}

std::error_code FileWriter::write(std::uint64_t offset, std::span<const std::byte> data) noexcept {
    // No mutex: pwrite at disjoint offsets from several workers is safe
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    return file_->write(offset, data.data(), data.size());
}

std::error_code FileWriter::flush() noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    return file_->flush();
}

void FileWriter::close() noexcept {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (file_) {
        file_->close();
        file_.reset();
    }
}

//=============================================================================
// RegionSink
//=============================================================================

std::error_code RegionSink::write(std::span<const std::byte> data) noexcept {
    if (data.empty()) return {};
    if (!fits(written_, data.size(), capacity_)) {
        return make_error_code(DiskErrc::out_of_bounds);
    }

    if (auto ec = writer_.write(base_ + written_, data)) {
        return ec;
    }
    written_ += data.size();
    return {};
}

std::error_code RegionSink::reset() noexcept {
    // Stale bytes past the new cursor are overwritten by the next attempt
    written_ = 0;
    return {};
}

//=============================================================================
// PartFileSink
//=============================================================================

std::expected<std::unique_ptr<PartFileSink>, std::error_code>
PartFileSink::create(const std::filesystem::path& path, std::uint64_t capacity) noexcept {
    auto file = RandomAccessFile::open(path.native(), OpenMode::create_truncate);
    if (!file) {
        return std::unexpected(file.error());
    }

    try {
        return std::unique_ptr<PartFileSink>(new PartFileSink(std::move(*file), capacity));
    } catch (...) {
        return std::unexpected(make_error_code(DiskErrc::allocation_failed));
    }
}

std::error_code PartFileSink::write(std::span<const std::byte> data) noexcept {
    if (data.empty()) return {};
    if (!fits(written_, data.size(), capacity_)) {
        return make_error_code(DiskErrc::out_of_bounds);
    }

    if (auto ec = file_.write(written_, data.data(), data.size())) {
        return ec;
    }
    written_ += data.size();
    return {};
}

std::error_code PartFileSink::reset() noexcept {
    written_ = 0;
    return file_.truncate(0);
}

std::error_code PartFileSink::finish() noexcept {
    if (!file_.is_open()) return {};
    auto ec = file_.flush();
    file_.close();
    return ec;
}

} // namespace volley::disk
