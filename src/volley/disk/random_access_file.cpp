// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/disk/random_access_file.hpp>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace volley::disk {

std::error_code errno_to_error_code(int err) noexcept {
    switch (err) {
        case 0:             return {};
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
        case EFBIG:         return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:
        case ELOOP:         return make_error_code(DiskErrc::invalid_path);
        case EEXIST:        return make_error_code(DiskErrc::file_exists);
        case ESPIPE:
        case EOVERFLOW:     return make_error_code(DiskErrc::seek_error);
        case ENOMEM:        return make_error_code(DiskErrc::allocation_failed);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(DiskErrc::write_error);
    }
}

//=============================================================================
// RandomAccessFile
//=============================================================================

std::expected<RandomAccessFile, std::error_code>
RandomAccessFile::open(std::string_view path, OpenMode mode) noexcept {
    RandomAccessFile file;
    try {
        file.path_ = std::string(path);
    } catch (...) {
        return std::unexpected(make_error_code(DiskErrc::allocation_failed));
    }

    int flags = mode == OpenMode::read_only
        ? O_RDONLY | O_CLOEXEC
        : O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC;

    int fd = -1;
    do {
        fd = ::open(file.path_.c_str(), flags, 0644);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        return std::unexpected(errno_to_error_code(errno));
    }

    file.fd_ = fd;
    return file;
}

RandomAccessFile::~RandomAccessFile() {
    close();
}

RandomAccessFile::RandomAccessFile(RandomAccessFile&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_)) {
    other.fd_ = -1;
}

RandomAccessFile& RandomAccessFile::operator=(RandomAccessFile&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

std::error_code RandomAccessFile::pre_allocate(std::uint64_t size) noexcept {
    if (fd_ < 0) return make_error_code(DiskErrc::handle_invalid);
    if (size == 0) return {};

    // posix_fallocate reports through its return value, not errno
    int rc = ::posix_fallocate(fd_, 0, static_cast<off_t>(size));
    if (rc == 0) return {};
    if (rc != EINVAL && rc != EOPNOTSUPP) {
        return errno_to_error_code(rc);
    }

    // Filesystem cannot reserve blocks: fall back to a sparse file of the right length
    return truncate(size);
}

std::error_code RandomAccessFile::write(std::uint64_t offset, const void* data, std::size_t size) noexcept {
    if (fd_ < 0) return make_error_code(DiskErrc::handle_invalid);

    const auto* p = static_cast<const unsigned char*>(data);
    while (size > 0) {
        ssize_t n = ::pwrite(fd_, p, size, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno);
        }
        if (n == 0) {
            return make_error_code(DiskErrc::write_error);
        }
        p += n;
        offset += static_cast<std::uint64_t>(n);
        size -= static_cast<std::size_t>(n);
    }
    return {};
}

std::expected<std::size_t, std::error_code>
RandomAccessFile::read(std::uint64_t offset, void* buffer, std::size_t size) noexcept {
    if (fd_ < 0) return std::unexpected(make_error_code(DiskErrc::handle_invalid));

    ssize_t n = 0;
    do {
        n = ::pread(fd_, buffer, size, static_cast<off_t>(offset));
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }
    return static_cast<std::size_t>(n);
}

std::expected<std::uint64_t, std::error_code> RandomAccessFile::size() const noexcept {
    if (fd_ < 0) return std::unexpected(make_error_code(DiskErrc::handle_invalid));

    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
        return std::unexpected(errno_to_error_code(errno));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

std::error_code RandomAccessFile::truncate(std::uint64_t size) noexcept {
    if (fd_ < 0) return make_error_code(DiskErrc::handle_invalid);

    int rc = 0;
    do {
        rc = ::ftruncate(fd_, static_cast<off_t>(size));
    } while (rc != 0 && errno == EINTR);

    return rc == 0 ? std::error_code{} : errno_to_error_code(errno);
}

std::error_code RandomAccessFile::flush() noexcept {
    if (fd_ < 0) return make_error_code(DiskErrc::handle_invalid);
    return ::fsync(fd_) == 0 ? std::error_code{} : errno_to_error_code(errno);
}

void RandomAccessFile::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace volley::disk
