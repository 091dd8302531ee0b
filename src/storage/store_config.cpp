#include "storage/store_config.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fstream>
#include <stdexcept>

namespace caskdb::storage {

StoreConfig StoreConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Store config must be a JSON object");
    }

    StoreConfig config;
    try {
        config.path = j.value("path", config.path.string());
        config.create_if_missing = j.value("create_if_missing", config.create_if_missing);
        config.sync_on_write = j.value("sync_on_write", config.sync_on_write);
        config.validate_utf8 = j.value("validate_utf8", config.validate_utf8);
        config.lock_file = j.value("lock_file", config.lock_file);
        config.truncate_partial_tail = j.value("truncate_partial_tail", config.truncate_partial_tail);
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(fmt::format("Invalid store config: {}", e.what()));
    }

    if (config.path.empty()) {
        throw std::invalid_argument("Store config path cannot be empty");
    }

    return config;
}

nlohmann::json StoreConfig::to_json() const {
    nlohmann::json j;
    j["path"] = path.string();
    j["create_if_missing"] = create_if_missing;
    j["sync_on_write"] = sync_on_write;
    j["validate_utf8"] = validate_utf8;
    j["lock_file"] = lock_file;
    j["truncate_partial_tail"] = truncate_partial_tail;
    return j;
}

StoreConfig load_config_file(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) {
        throw std::invalid_argument(fmt::format("Cannot open config file: {}", file.string()));
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(fmt::format("Malformed config file {}: {}", file.string(), e.what()));
    }

    auto config = StoreConfig::from_json(j);
    spdlog::debug("Loaded store config from {}", file.string());
    return config;
}

} // namespace caskdb::storage
