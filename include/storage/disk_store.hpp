#pragma once

#include "storage/keydir.hpp"
#include "storage/log_file.hpp"
#include "storage/store_config.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace caskdb::storage {

/**
 * DiskStore is a log-structured hash table in the BitCask style.
 *
 * Every set appends a record to a single log file and points the in-memory
 * KeyDir at it; every get is one positional read of exactly one record.
 * The KeyDir holds locations only, never values, and is rebuilt by scanning
 * the whole log when the store is opened. Opening therefore blocks for a
 * time proportional to the log size.
 *
 * Stale records are never reclaimed and keys cannot be deleted.
 *
 * Thread-safe within one process: writes are serialized, reads run
 * concurrently. Only one DiskStore may have a given log open at a time.
 */
class DiskStore {
public:
    enum class State {
        Uninitialized,
        Loading,  // Scanning the log to rebuild the KeyDir
        Ready,
        Closed
    };

    struct Stats {
        std::uint64_t total_sets{0};
        std::uint64_t total_gets{0};
        std::uint64_t hits{0};
        std::uint64_t misses{0};
        std::uint64_t records_loaded{0};
        std::uint64_t live_keys{0};
        std::uint64_t log_bytes{0};
        std::uint64_t dead_bytes{0};  // Bytes of records no longer reachable from the KeyDir
        double load_seconds{0.0};

        nlohmann::json to_json() const;
    };

    // Throws CorruptLog if the log cannot be parsed, IOFailure if it cannot be opened
    explicit DiskStore(const std::filesystem::path& path);
    explicit DiskStore(StoreConfig config);
    ~DiskStore();

    DiskStore(const DiskStore&) = delete;
    DiskStore& operator=(const DiskStore&) = delete;

    /**
     * Append a record and make it durable before returning. The KeyDir is
     * only updated once the bytes are on disk, so a failed write leaves the
     * previous value visible.
     */
    void set(std::string_view key, std::string_view value);

    // std::nullopt for a key that was never set; IndexCorruption if the log disagrees with the KeyDir
    std::optional<std::string> get(std::string_view key) const;
    std::string get_or(std::string_view key, std::string fallback) const;

    bool contains(std::string_view key) const;
    std::size_t size() const;
    std::vector<std::string> keys() const;

    void sync();
    void close();

    Stats stats() const;
    State state() const;
    const StoreConfig& config() const { return config_; }
    const std::filesystem::path& path() const { return config_.path; }

private:
    StoreConfig config_;
    std::unique_ptr<LogFile> log_;
    KeyDir key_dir_;
    State state_{State::Uninitialized};
    std::uint64_t log_bytes_{0};

    // Guards log_, key_dir_, state_ and log_bytes_
    mutable std::shared_mutex mutex_;

    mutable Stats stats_;
    mutable std::mutex stats_mutex_;

    void load_key_dir();
    void handle_partial_tail(std::uint64_t offset, const char* reason);
    void ensure_ready() const;
    std::uint32_t current_timestamp() const;
};

} // namespace caskdb::storage
