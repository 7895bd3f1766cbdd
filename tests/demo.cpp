#include "file_cache.h"
#include <filesystem>
#include <iostream>
#include <random>

namespace fs = std::filesystem;

static void print_state(const FileCache& cache) {
    std::cout << "[" << cache.len() << "/" << cache.capacity() << "]";
    for (const auto& key : cache.keys()) {
        std::cout << " " << key;
    }
    std::cout << "\n";
}

int main() {
    fs::path root = fs::temp_directory_path() /
                    ("diskcache-demo-" + std::to_string(std::random_device{}()));
    fs::create_directories(root);

    {
        CacheConfig config;
        config.root_directory = root;
        config.capacity = 3;
        config.key_strategy = KeyStrategy::Structured;
        FileCache cache(config); // capacity = 3 entries

        std::cout << "=== Basic put/get ===\n";
        cache.put("A", "Apple");
        cache.put("B", "Banana");
        cache.put("C", "Cherry");
        print_state(cache);

        std::cout << "Get A: " << cache.get("A") << "\n";
        std::cout << "Get A: " << cache.get("A") << "\n";
        std::cout << "Get C: " << cache.get("C") << "\n";

        std::cout << "\n=== LFU eviction ===\n";
        cache.put("D", "Dates"); // Evicts B (never read)
        print_state(cache);
        try {
            cache.get("B");
        } catch (const KeyNotFound& e) {
            std::cout << "Get B: MISS (" << e.what() << ")\n";
        }

        std::cout << "\n=== Collision ===\n";
        try {
            cache.put("A", "Apricot");
        } catch (const KeyCollision& e) {
            std::cout << e.what() << "\n";
        }

        std::cout << "\n=== Remove ===\n";
        cache.remove("A");
        print_state(cache);
        std::cout << "hits=" << cache.hits() << " misses=" << cache.misses()
                  << " evictions=" << cache.evictions() << "\n";
    }

    fs::remove_all(root);
    return 0;
}
