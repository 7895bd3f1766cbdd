#pragma once
#ifndef TEST_UTILS_H
#define TEST_UTILS_H

#include "cache_config.h"
#include "storage_backend.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <random>
#include <string>
#include <system_error>
#include <thread>

/**
 * Fresh empty directory under the system temp dir, removed on destruction.
 */
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("diskcache-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    /// Number of regular files below the directory, temporaries included.
    size_t file_count() const {
        size_t n = 0;
        for (const auto& e : std::filesystem::recursive_directory_iterator(path_)) {
            if (e.is_regular_file()) n++;
        }
        return n;
    }

private:
    std::filesystem::path path_;
};

inline CacheConfig make_config(const TempDir& dir, uint64_t capacity,
                               KeyStrategy keys = KeyStrategy::Random,
                               CapacityMode mode = CapacityMode::Entries) {
    CacheConfig config;
    config.root_directory = dir.path();
    config.capacity = capacity;
    config.capacity_mode = mode;
    config.key_strategy = keys;
    config.log_events = false;
    return config;
}

/**
 * FileStorage with switchable failures and an optional write delay,
 * for driving FileCache through its error paths.
 */
class FaultyStorage : public FileStorage {
public:
    std::atomic<bool> fail_writes{false};
    std::atomic<bool> fail_reads{false};
    std::atomic<bool> fail_removes{false};
    std::atomic<int> write_delay_ms{0};
    std::atomic<int> writes{0};

    std::error_code write(const std::filesystem::path& path, const std::string& bytes) override {
        writes++;
        if (write_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(write_delay_ms.load()));
        }
        if (fail_writes) return std::make_error_code(std::errc::no_space_on_device);
        return FileStorage::write(path, bytes);
    }

    std::error_code read(const std::filesystem::path& path, std::string& out) override {
        if (fail_reads) return std::make_error_code(std::errc::io_error);
        return FileStorage::read(path, out);
    }

    std::error_code remove(const std::filesystem::path& path) override {
        if (fail_removes) return std::make_error_code(std::errc::permission_denied);
        return FileStorage::remove(path);
    }
};

#endif // TEST_UTILS_H
