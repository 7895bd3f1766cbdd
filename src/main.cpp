#include "api.h"
#include "file_cache.h"
#include "log_utils.h"
#include "server_options.h"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

static void usage(const char* prog) {
    std::cerr << "usage: " << prog
              << " [--config file.json] [--root dir] [--capacity n]"
                 " [--mode entries|bytes] [--keys random|structured]"
                 " [--sync] [--quiet] [--host h] [--port p]\n";
}

int main(int argc, char* argv[]) {
    ServerOptions opts;
    try {
        // --- Parse args ---
        opts = ServerOptions::parse(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << std::endl;
        usage(argv[0]);
        return 2;
    }

    try {
        // --- Config: file first, flags override ---
        CacheConfig config = opts.to_config();

        // --- Core components ---
        auto cache = std::make_shared<FileCache>(config);
        log_line("main", "cache at " + config.root_directory.string() + ", capacity " +
                         std::to_string(config.capacity) + " " + to_string(config.capacity_mode) +
                         ", " + to_string(config.key_strategy) + " keys");

        // --- Start REST API ---
        CacheAPI api(cache);
        api.start(opts.host, opts.port);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
