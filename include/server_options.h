#pragma once
#ifndef SERVER_OPTIONS_H
#define SERVER_OPTIONS_H

#include <string>
#include <vector>

#include "cache_config.h"

/**
 * Command line of diskcache_server.
 * Flags override the matching fields of the optional --config file.
 */
struct ServerOptions {
    std::string host = "0.0.0.0";
    int port = 5000;
    std::string config_file;
    std::string root;
    std::string capacity;
    std::string mode;
    std::string keys;
    bool sync = false;
    bool quiet = false;

    /**
     * Parse argv[1..argc). Throws std::invalid_argument on an unknown flag,
     * a missing value or a malformed number.
     */
    static ServerOptions parse(const std::vector<std::string>& args);

    /// Load config_file (if any), apply the flags and validate the result.
    CacheConfig to_config() const;
};

#endif // SERVER_OPTIONS_H
