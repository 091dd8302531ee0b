#include "storage/keydir.hpp"
#include <algorithm>

namespace caskdb::storage {

std::uint64_t KeyDir::insert(std::string key, std::uint64_t offset, std::uint64_t size) {
    std::uint64_t replaced = 0;

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        replaced = it->second.size;
        live_bytes_ -= replaced;
        it->second = KeyDirEntry{offset, size};
    } else {
        entries_.emplace(std::move(key), KeyDirEntry{offset, size});
    }

    live_bytes_ += size;
    return replaced;
}

std::optional<KeyDirEntry> KeyDir::find(std::string_view key) const {
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool KeyDir::contains(std::string_view key) const {
    return entries_.find(std::string(key)) != entries_.end();
}

std::vector<std::string> KeyDir::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());

    for (const auto& [key, entry] : entries_) {
        result.push_back(key);
    }

    std::sort(result.begin(), result.end());
    return result;
}

void KeyDir::clear() {
    entries_.clear();
    live_bytes_ = 0;
}

} // namespace caskdb::storage
