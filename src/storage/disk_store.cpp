#include "storage/disk_store.hpp"
#include "storage/errors.hpp"
#include "storage/record.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <array>
#include <chrono>
#include <stdexcept>

namespace caskdb::storage {

nlohmann::json DiskStore::Stats::to_json() const {
    nlohmann::json j;
    j["operations"]["sets"] = total_sets;
    j["operations"]["gets"] = total_gets;
    j["operations"]["hits"] = hits;
    j["operations"]["misses"] = misses;
    j["keydir"]["live_keys"] = live_keys;
    j["keydir"]["records_loaded"] = records_loaded;
    j["keydir"]["load_seconds"] = load_seconds;
    j["log"]["bytes"] = log_bytes;
    j["log"]["dead_bytes"] = dead_bytes;
    return j;
}

DiskStore::DiskStore(const std::filesystem::path& path)
    : DiskStore([&path] {
          StoreConfig config;
          config.path = path;
          return config;
      }()) {}

DiskStore::DiskStore(StoreConfig config)
    : config_(std::move(config)) {

    log_ = std::make_unique<LogFile>(config_.path, config_.create_if_missing, config_.lock_file);
    spdlog::info("DiskStore opened: {}", config_.path.string());

    state_ = State::Loading;
    load_key_dir();
    state_ = State::Ready;
}

DiskStore::~DiskStore() {
    try {
        close();
    } catch (const StorageError& e) {
        spdlog::error("DiskStore close failed: {}", e.what());
    }
}

void DiskStore::load_key_dir() {
    auto start = std::chrono::steady_clock::now();

    key_dir_.clear();
    const std::uint64_t file_size = log_->size();
    std::uint64_t offset = 0;
    std::uint64_t n_records = 0;
    std::array<std::uint8_t, HEADER_SIZE> header_bytes{};

    while (offset < file_size) {
        auto n = log_->read_at(offset, header_bytes.data(), header_bytes.size());

        RecordHeader header;
        try {
            header = decode_header(header_bytes.data(), n);
        } catch (const MalformedHeader& e) {
            handle_partial_tail(offset, e.what());
            break;
        }

        if (offset + header.record_size() > file_size) {
            handle_partial_tail(offset, "record extends past end of log");
            break;
        }

        // Only the key is read; the value is skipped
        std::string key(header.key_size, '\0');
        auto key_read = log_->read_at(offset + HEADER_SIZE,
                                      reinterpret_cast<std::uint8_t*>(key.data()), key.size());
        if (key_read != key.size()) {
            throw CorruptLog(fmt::format("Short key read at offset {}", offset), offset);
        }
        if (config_.validate_utf8 && !is_valid_utf8(key)) {
            throw CorruptLog(fmt::format("Key at offset {} is not valid UTF-8", offset), offset);
        }

        key_dir_.insert(std::move(key), offset, header.record_size());
        offset += header.record_size();
        ++n_records;
    }

    log_bytes_ = log_->size();
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

    {
        std::lock_guard lock(stats_mutex_);
        stats_.records_loaded = n_records;
        stats_.load_seconds = elapsed.count();
    }

    spdlog::info("Loaded {} keydir records ({} live keys) in {:.2f}s",
                 n_records, key_dir_.size(), elapsed.count());
}

void DiskStore::handle_partial_tail(std::uint64_t offset, const char* reason) {
    if (!config_.truncate_partial_tail) {
        spdlog::error("Corrupt log {} at offset {}: {}", config_.path.string(), offset, reason);
        throw CorruptLog(fmt::format("Corrupt log {} at offset {}: {}",
                                     config_.path.string(), offset, reason), offset);
    }

    spdlog::warn("Truncating incomplete record at offset {} of {} ({} bytes dropped): {}",
                 offset, config_.path.string(), log_->size() - offset, reason);
    log_->truncate(offset);
}

void DiskStore::set(std::string_view key, std::string_view value) {
    std::unique_lock lock(mutex_);
    ensure_ready();

    if (config_.validate_utf8 && (!is_valid_utf8(key) || !is_valid_utf8(value))) {
        throw std::invalid_argument("Key and value must be valid UTF-8");
    }

    auto encoded = encode_record(current_timestamp(), key, value);
    std::uint64_t offset = 0;
    try {
        offset = log_->append(encoded.bytes.data(), encoded.bytes.size());
    } catch (const IOFailure&) {
        log_bytes_ = log_->size();
        throw;
    }

    if (config_.sync_on_write) {
        try {
            log_->sync();
        } catch (const IOFailure&) {
            // Not durable, so not indexed; drop the bytes so a restart cannot see them
            log_->truncate(offset);
            throw;
        }
    }

    key_dir_.insert(std::string(key), offset, encoded.size);
    log_bytes_ = log_->size();

    {
        std::lock_guard stats_lock(stats_mutex_);
        stats_.total_sets++;
    }

    spdlog::debug("Set key='{}' offset={} size={}", key, offset, encoded.size);
}

std::optional<std::string> DiskStore::get(std::string_view key) const {
    std::shared_lock lock(mutex_);
    ensure_ready();

    auto entry = key_dir_.find(key);
    {
        std::lock_guard stats_lock(stats_mutex_);
        stats_.total_gets++;
        if (entry) {
            stats_.hits++;
        } else {
            stats_.misses++;
        }
    }

    if (!entry) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> buffer(entry->size);
    auto n = log_->read_at(entry->offset, buffer.data(), buffer.size());
    if (n != buffer.size()) {
        throw IndexCorruption(fmt::format("Key '{}' points past end of log (offset {}, size {})",
                                          key, entry->offset, entry->size));
    }

    Record record;
    try {
        record = decode_record(buffer, config_.validate_utf8);
    } catch (const MalformedRecord& e) {
        throw IndexCorruption(fmt::format("Key '{}' at offset {} does not decode: {}",
                                          key, entry->offset, e.what()));
    }

    if (record.key != key) {
        throw IndexCorruption(fmt::format("Key '{}' at offset {} holds record for '{}'",
                                          key, entry->offset, record.key));
    }

    return std::move(record.value);
}

std::string DiskStore::get_or(std::string_view key, std::string fallback) const {
    auto value = get(key);
    return value ? std::move(*value) : std::move(fallback);
}

bool DiskStore::contains(std::string_view key) const {
    std::shared_lock lock(mutex_);
    ensure_ready();
    return key_dir_.contains(key);
}

std::size_t DiskStore::size() const {
    std::shared_lock lock(mutex_);
    ensure_ready();
    return key_dir_.size();
}

std::vector<std::string> DiskStore::keys() const {
    std::shared_lock lock(mutex_);
    ensure_ready();
    return key_dir_.keys();
}

void DiskStore::sync() {
    std::unique_lock lock(mutex_);
    ensure_ready();
    log_->sync();
    spdlog::debug("Log synced: {}", config_.path.string());
}

void DiskStore::close() {
    std::unique_lock lock(mutex_);
    if (state_ == State::Closed || !log_) {
        return;
    }

    // Without per-write fsync the tail may still be in the page cache.
    // Handles are released even when that final sync fails.
    try {
        if (!config_.sync_on_write) {
            log_->sync();
        }
    } catch (const IOFailure&) {
        log_->close();
        state_ = State::Closed;
        throw;
    }

    log_->close();
    state_ = State::Closed;
    spdlog::info("DiskStore closed: {}", config_.path.string());
}

DiskStore::Stats DiskStore::stats() const {
    std::shared_lock lock(mutex_);

    Stats snapshot;
    {
        std::lock_guard stats_lock(stats_mutex_);
        snapshot = stats_;
    }

    snapshot.live_keys = key_dir_.size();
    snapshot.log_bytes = log_bytes_;
    snapshot.dead_bytes = log_bytes_ - key_dir_.live_bytes();
    return snapshot;
}

DiskStore::State DiskStore::state() const {
    std::shared_lock lock(mutex_);
    return state_;
}

void DiskStore::ensure_ready() const {
    if (state_ == State::Closed) {
        throw ClosedEngine();
    }
    if (state_ != State::Ready) {
        throw StorageError("Store is not ready");
    }
}

std::uint32_t DiskStore::current_timestamp() const {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return static_cast<std::uint32_t>(seconds);
}

} // namespace caskdb::storage
