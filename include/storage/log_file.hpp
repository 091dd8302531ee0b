#pragma once

#include <cstdint>
#include <cstddef>
#include <filesystem>

namespace caskdb::storage {

/**
 * LogFile owns the two POSIX handles over a single append-only log:
 * an O_APPEND write handle and an independent read handle used only with
 * positional reads, so reads and writes never share a file position.
 *
 * When locking is requested an exclusive flock() is held on the write
 * handle for the lifetime of the object; a second LogFile over the same
 * path fails to open.
 *
 * All failures are reported as IOFailure.
 */
class LogFile {
public:
    LogFile(const std::filesystem::path& path, bool create_if_missing, bool lock);
    ~LogFile();

    LogFile(const LogFile&) = delete;
    LogFile& operator=(const LogFile&) = delete;

    /**
     * Append bytes at the end of the log and return the offset they start at.
     * On a failed or short write the file is truncated back to that offset
     * before IOFailure is thrown. If the rollback itself fails, size() is
     * re-read from the file so later appends still report true offsets; if
     * even that fails the log is closed.
     */
    std::uint64_t append(const std::uint8_t* data, std::size_t size);

    // Reads up to size bytes; returns fewer only at end of file
    std::size_t read_at(std::uint64_t offset, std::uint8_t* buffer, std::size_t size) const;

    void sync();
    void truncate(std::uint64_t size);
    void close();

    bool is_open() const { return write_fd_ != -1; }
    std::uint64_t size() const { return end_offset_; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int write_fd_{-1};
    int read_fd_{-1};
    std::uint64_t end_offset_{0};

    void refresh_end_offset();
    void close_handles() noexcept;
};

} // namespace caskdb::storage
