#include "source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fmt/core.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace cupload::adapters {

// =============== FileSource ===============

auto FileSource::open(const std::filesystem::path& path)
    -> infra::Result<std::unique_ptr<FileSource>>
{
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        const int err = errno;
        const auto code = err == ENOENT ? infra::ErrorCode::NotFound
                        : err == EACCES ? infra::ErrorCode::PermissionDenied
                        : infra::ErrorCode::ReadError;
        return std::unexpected(infra::make_error(code,
            fmt::format("Cannot open {}: {}", path.string(), std::strerror(err))));
    }
    return std::unique_ptr<FileSource>(new FileSource(fd, path));
}

FileSource::FileSource(int fd, std::filesystem::path path)
    : fd_(fd), path_(std::move(path)) {}

FileSource::~FileSource() {
    if (fd_ != -1) {
        ::close(fd_);
    }
}

auto FileSource::read(std::span<std::byte> buffer) -> infra::Result<std::size_t> {
    for (;;) {
        const ssize_t n = ::read(fd_, buffer.data(), buffer.size());
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadError,
            fmt::format("Read error on {}: {}", path_.string(), std::strerror(errno))));
    }
}

auto FileSource::seek(std::uint64_t offset) -> infra::VoidResult {
    if (::lseek(fd_, static_cast<off_t>(offset), SEEK_SET) == -1) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadError,
            fmt::format("Seek to {} failed on {}: {}", offset, path_.string(), std::strerror(errno))));
    }
    return {};
}

auto FileSource::size() const -> infra::Result<std::uint64_t> {
    struct stat sb;
    if (::fstat(fd_, &sb) == -1) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadError, "fstat failed"));
    }
    return static_cast<std::uint64_t>(sb.st_size);
}

auto FileSource::modified_time() const -> infra::Result<std::chrono::system_clock::time_point> {
    struct stat sb;
    if (::fstat(fd_, &sb) == -1) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadError, "fstat failed"));
    }
    return std::chrono::system_clock::time_point{std::chrono::seconds{sb.st_mtim.tv_sec}};
}

// =============== MemorySource ===============

auto MemorySource::read(std::span<std::byte> buffer) -> infra::Result<std::size_t> {
    const std::size_t n = std::min(buffer.size(), data_.size() - pos_);
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), n, buffer.begin());
    pos_ += n;
    return n;
}

// =============== LimitedSource ===============

auto LimitedSource::read(std::span<std::byte> buffer) -> infra::Result<std::size_t> {
    if (remaining_ == 0) {
        return std::size_t{0};
    }
    if (buffer.size() > remaining_) {
        buffer = buffer.first(static_cast<std::size_t>(remaining_));
    }
    auto n = inner_->read(buffer);
    if (n) {
        remaining_ -= *n;
    }
    return n;
}

auto read_full(ByteSource& source, std::span<std::byte> buffer)
    -> infra::Result<std::size_t>
{
    std::size_t filled = 0;
    while (filled < buffer.size()) {
        auto n = source.read(buffer.subspan(filled));
        if (!n) {
            if (n.error().code == infra::ErrorCode::Interrupted) {
                continue;
            }
            return std::unexpected(std::move(n.error()));
        }
        if (*n == 0) {
            break;
        }
        filled += *n;
    }
    return filled;
}

} // namespace cupload::adapters
