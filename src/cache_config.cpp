#include "cache_config.h"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::string to_string(CapacityMode mode) {
    return mode == CapacityMode::Bytes ? "bytes" : "entries";
}

std::string to_string(KeyStrategy strategy) {
    return strategy == KeyStrategy::Structured ? "structured" : "random";
}

CapacityMode capacity_mode_from_string(const std::string& text) {
    if (text == "entries") return CapacityMode::Entries;
    if (text == "bytes") return CapacityMode::Bytes;
    throw std::invalid_argument("unknown capacity mode '" + text + "' (expected entries|bytes)");
}

KeyStrategy key_strategy_from_string(const std::string& text) {
    if (text == "random") return KeyStrategy::Random;
    if (text == "structured") return KeyStrategy::Structured;
    throw std::invalid_argument("unknown key strategy '" + text + "' (expected random|structured)");
}

void CacheConfig::validate() const {
    if (root_directory.empty()) {
        throw std::invalid_argument("root_directory must be set");
    }
    if (capacity == 0) {
        throw std::invalid_argument("capacity must be a positive integer");
    }
}

CacheConfig CacheConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("cache config must be a JSON object");
    }
    if (!j.contains("root_directory")) {
        throw std::invalid_argument("cache config is missing 'root_directory'");
    }

    CacheConfig config;
    config.root_directory = j.at("root_directory").get<std::string>();
    if (j.contains("capacity")) {
        const auto& capacity = j.at("capacity");
        if (!capacity.is_number_unsigned()) {
            throw std::invalid_argument("capacity must be a positive integer");
        }
        config.capacity = capacity.get<uint64_t>();
    }
    if (j.contains("capacity_mode")) {
        config.capacity_mode = capacity_mode_from_string(j.at("capacity_mode").get<std::string>());
    }
    if (j.contains("key_strategy")) {
        config.key_strategy = key_strategy_from_string(j.at("key_strategy").get<std::string>());
    }
    config.sync_writes = j.value("sync_writes", config.sync_writes);
    config.log_events = j.value("log_events", config.log_events);

    config.validate();
    return config;
}

CacheConfig CacheConfig::from_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::invalid_argument("cannot open config file " + path.string());
    }
    json j = json::parse(in);
    return from_json(j);
}
