#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace caskdb::storage {

struct KeyDirEntry {
    std::uint64_t offset{0};  // Start of the record header in the log
    std::uint64_t size{0};    // HEADER_SIZE + key_length + value_length
};

/**
 * KeyDir maps every live key to the location of its most recent record.
 *
 * It never stores values and is never persisted; the log is the source of
 * truth and the KeyDir is rebuilt from it on every open.
 */
class KeyDir {
public:
    // Overwrites any previous entry. Returns the size of the replaced record, or 0.
    std::uint64_t insert(std::string key, std::uint64_t offset, std::uint64_t size);
    std::optional<KeyDirEntry> find(std::string_view key) const;
    bool contains(std::string_view key) const;

    std::vector<std::string> keys() const;
    void clear();

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Total bytes of the records the index currently points at
    std::uint64_t live_bytes() const { return live_bytes_; }

private:
    std::unordered_map<std::string, KeyDirEntry> entries_;
    std::uint64_t live_bytes_{0};
};

} // namespace caskdb::storage
