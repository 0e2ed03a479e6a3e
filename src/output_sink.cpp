#include "rangeget/output_sink.hpp"
#include "rangeget/error.hpp"

#include <cerrno>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>

namespace rangeget {

namespace {

std::string errnoMessage(int error) {
    return std::system_category().message(error);
}

} // namespace

OutputSink::OutputSink(std::string path, std::optional<std::uint64_t> total_size)
    : path_(std::move(path)) {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ == -1) {
        throw IoError(fmt::format("Cannot create destination file {}: {}", path_, errnoMessage(errno)));
    }

    if (total_size && *total_size > 0) {
        try {
            preallocate(*total_size);
        } catch (...) {
            ::close(fd_);
            fd_ = -1;
            throw;
        }
    }
}

OutputSink::~OutputSink() {
    if (fd_ != -1) {
        ::close(fd_);
    }
}

void OutputSink::preallocate(std::uint64_t total_size) {
    const int rc = ::posix_fallocate(fd_, 0, static_cast<off_t>(total_size));
    if (rc == 0) {
        return;
    }
    // Filesystems without fallocate support still get the final length.
    if (rc != EOPNOTSUPP && rc != EINVAL) {
        throw IoError(fmt::format("Cannot allocate {} bytes for {}: {}", total_size, path_, errnoMessage(rc)));
    }
    if (::ftruncate(fd_, static_cast<off_t>(total_size)) == -1) {
        throw IoError(fmt::format("Cannot resize {} to {} bytes: {}", path_, total_size, errnoMessage(errno)));
    }
}

void OutputSink::writeAt(std::uint64_t offset, const char* data, std::size_t size) {
    while (size > 0) {
        const ssize_t written = ::pwrite(fd_, data, size, static_cast<off_t>(offset));
        if (written == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw IoError(fmt::format("Failed to write {} bytes at offset {} of {}: {}",
                                      size, offset, path_, errnoMessage(errno)));
        }
        data += written;
        size -= static_cast<std::size_t>(written);
        offset += static_cast<std::uint64_t>(written);
    }
}

void OutputSink::sync() {
    if (::fsync(fd_) == -1) {
        throw IoError(fmt::format("Failed to flush {}: {}", path_, errnoMessage(errno)));
    }
}

std::uint64_t OutputSink::size() const {
    struct stat info {};
    if (::fstat(fd_, &info) == -1) {
        throw IoError(fmt::format("Cannot stat {}: {}", path_, errnoMessage(errno)));
    }
    return static_cast<std::uint64_t>(info.st_size);
}

} // namespace rangeget
