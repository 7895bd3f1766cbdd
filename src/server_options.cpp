#include "server_options.h"

#include <limits>
#include <stdexcept>

static uint64_t parse_unsigned(const std::string& flag, const std::string& text, uint64_t max) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(flag + " expects a non-negative integer, got '" + text + "'");
    }
    uint64_t value;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(flag + " is out of range: " + text);
    }
    if (value > max) {
        throw std::invalid_argument(flag + " is out of range: " + text);
    }
    return value;
}

ServerOptions ServerOptions::parse(const std::vector<std::string>& args) {
    ServerOptions opts;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(arg + " needs a value");
            }
            return args[++i];
        };

        if (arg == "--config") opts.config_file = value();
        else if (arg == "--root") opts.root = value();
        else if (arg == "--capacity") opts.capacity = value();
        else if (arg == "--mode") opts.mode = value();
        else if (arg == "--keys") opts.keys = value();
        else if (arg == "--host") opts.host = value();
        else if (arg == "--port") opts.port = static_cast<int>(parse_unsigned(arg, value(), 65535));
        else if (arg == "--sync") opts.sync = true;
        else if (arg == "--quiet") opts.quiet = true;
        else throw std::invalid_argument("unknown argument: " + arg);
    }
    return opts;
}

CacheConfig ServerOptions::to_config() const {
    CacheConfig config;
    if (!config_file.empty()) config = CacheConfig::from_file(config_file);
    if (!root.empty()) config.root_directory = root;
    if (!capacity.empty()) {
        config.capacity = parse_unsigned("--capacity", capacity, std::numeric_limits<uint64_t>::max());
    }
    if (!mode.empty()) config.capacity_mode = capacity_mode_from_string(mode);
    if (!keys.empty()) config.key_strategy = key_strategy_from_string(keys);
    if (sync) config.sync_writes = true;
    if (quiet) config.log_events = false;
    config.validate();
    return config;
}
