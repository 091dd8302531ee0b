#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace caskdb::storage {

struct StoreConfig {
    std::filesystem::path path{"data.db"};
    bool create_if_missing{true};
    bool sync_on_write{true};          // fsync after every set
    bool validate_utf8{true};          // keys and values must be UTF-8 text
    bool lock_file{true};              // exclusive flock while open
    bool truncate_partial_tail{false}; // drop an incomplete trailing record instead of failing

    /**
     * Build a config from a JSON object. Missing fields keep their defaults.
     * Throws std::invalid_argument on a wrong field type or an empty path.
     */
    static StoreConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

// Parse a JSON config file; throws std::invalid_argument if unreadable or malformed
StoreConfig load_config_file(const std::filesystem::path& file);

} // namespace caskdb::storage
