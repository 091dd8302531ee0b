#include "storage/log_file.hpp"
#include "storage/errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace caskdb::storage {

namespace {

IOFailure io_failure(const std::string& what, const std::filesystem::path& path, int error_code) {
    auto message = fmt::format("{} {}: {}", what, path.string(), std::strerror(error_code));
    spdlog::error("{}", message);
    return IOFailure(message, error_code);
}

} // namespace

LogFile::LogFile(const std::filesystem::path& path, bool create_if_missing, bool lock)
    : path_(path) {

    int flags = O_WRONLY | O_APPEND | O_CLOEXEC;
    if (create_if_missing) {
        flags |= O_CREAT;

        if (path_.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path_.parent_path(), ec);
            if (ec) {
                throw io_failure("Failed to create directory for", path_, ec.value());
            }
        }
    }

    write_fd_ = ::open(path_.c_str(), flags, 0644);
    if (write_fd_ == -1) {
        throw io_failure("Failed to open log for writing", path_, errno);
    }

    if (lock && ::flock(write_fd_, LOCK_EX | LOCK_NB) == -1) {
        int error_code = errno;
        close_handles();
        if (error_code == EWOULDBLOCK) {
            throw io_failure("Log is locked by another store", path_, error_code);
        }
        throw io_failure("Failed to lock log", path_, error_code);
    }

    read_fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (read_fd_ == -1) {
        int error_code = errno;
        close_handles();
        throw io_failure("Failed to open log for reading", path_, error_code);
    }

    struct stat st;
    if (::fstat(read_fd_, &st) == -1) {
        int error_code = errno;
        close_handles();
        throw io_failure("Failed to stat log", path_, error_code);
    }
    end_offset_ = static_cast<std::uint64_t>(st.st_size);

    spdlog::debug("LogFile opened: {} ({} bytes, locked={})", path_.string(), end_offset_, lock);
}

LogFile::~LogFile() {
    close_handles();
}

std::uint64_t LogFile::append(const std::uint8_t* data, std::size_t size) {
    if (!is_open()) {
        throw io_failure("Append to closed log", path_, EBADF);
    }

    std::uint64_t offset = end_offset_;
    std::size_t written = 0;

    while (written < size) {
        ssize_t n = ::write(write_fd_, data + written, size - written);
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            int error_code = errno;
            try {
                truncate(offset);
            } catch (const IOFailure& e) {
                spdlog::error("Rollback of partial append at offset {} failed: {}", offset, e.what());
            }
            // O_APPEND writes land at the real end of file, so track that rather than offset
            refresh_end_offset();
            throw io_failure("Failed to append to log", path_, error_code);
        }
        written += static_cast<std::size_t>(n);
    }

    end_offset_ = offset + size;
    return offset;
}

std::size_t LogFile::read_at(std::uint64_t offset, std::uint8_t* buffer, std::size_t size) const {
    if (read_fd_ == -1) {
        throw io_failure("Read from closed log", path_, EBADF);
    }

    std::size_t total = 0;
    while (total < size) {
        ssize_t n = ::pread(read_fd_, buffer + total, size - total,
                            static_cast<off_t>(offset + total));
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw io_failure("Failed to read log", path_, errno);
        }
        if (n == 0) {
            break;  // EOF
        }
        total += static_cast<std::size_t>(n);
    }

    return total;
}

void LogFile::sync() {
    if (!is_open()) {
        return;
    }
    if (::fsync(write_fd_) == -1) {
        throw io_failure("Failed to sync log", path_, errno);
    }
}

void LogFile::truncate(std::uint64_t size) {
    if (::ftruncate(write_fd_, static_cast<off_t>(size)) == -1) {
        throw io_failure("Failed to truncate log", path_, errno);
    }
    end_offset_ = size;
    spdlog::debug("Log truncated to {} bytes: {}", size, path_.string());
}

void LogFile::refresh_end_offset() {
    struct stat st;
    if (::fstat(write_fd_, &st) == -1) {
        int error_code = errno;
        close_handles();
        spdlog::error("Log {} closed, size unknown after failed append: {}",
                      path_.string(), std::strerror(error_code));
        return;
    }
    end_offset_ = static_cast<std::uint64_t>(st.st_size);
}

void LogFile::close() {
    if (!is_open()) {
        return;
    }
    close_handles();
    spdlog::debug("LogFile closed: {}", path_.string());
}

void LogFile::close_handles() noexcept {
    if (read_fd_ != -1) {
        ::close(read_fd_);
        read_fd_ = -1;
    }
    if (write_fd_ != -1) {
        // Closing the descriptor releases the flock
        ::close(write_fd_);
        write_fd_ = -1;
    }
}

} // namespace caskdb::storage
