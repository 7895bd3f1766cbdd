#pragma once
#ifndef CACHE_CONFIG_H
#define CACHE_CONFIG_H

#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

/// How capacity is charged: one unit per entry, or one unit per value byte.
enum class CapacityMode { Entries, Bytes };

/// Where keys come from: generated UUIDs, or caller-supplied relative paths.
enum class KeyStrategy { Random, Structured };

std::string to_string(CapacityMode mode);
std::string to_string(KeyStrategy strategy);
CapacityMode capacity_mode_from_string(const std::string& text);
KeyStrategy key_strategy_from_string(const std::string& text);

/**
 * Construction-time settings of a FileCache.
 */
struct CacheConfig {
    std::filesystem::path root_directory;           ///< Existing, empty, exclusively owned directory
    uint64_t capacity = 1024;                       ///< Max entries or max bytes, see capacity_mode
    CapacityMode capacity_mode = CapacityMode::Entries;
    KeyStrategy key_strategy = KeyStrategy::Random;
    bool sync_writes = false;                       ///< fsync each value before publishing it
    bool log_events = true;                         ///< Log evictions, self-heals and I/O failures

    /**
     * Throws std::invalid_argument if a field is out of range.
     * Does not touch the filesystem.
     */
    void validate() const;

    /**
     * Build a config from a JSON object. Missing fields keep their defaults,
     * except root_directory which is required.
     * @throws std::invalid_argument on bad values, nlohmann::json::exception on bad types
     */
    static CacheConfig from_json(const nlohmann::json& j);

    /// Parse a JSON config file, see from_json().
    static CacheConfig from_file(const std::filesystem::path& path);
};

#endif // CACHE_CONFIG_H
