#pragma once
#ifndef FILE_CACHE_H
#define FILE_CACHE_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "cache_config.h"
#include "cache_error.h"
#include "eviction_policy.h"
#include "key_generator.h"
#include "storage_backend.h"

/**
 * Thread-safe, disk-backed cache with:
 * - One file per entry under an exclusively owned root directory
 * - LFU eviction through a pluggable EvictionPolicy
 * - Capacity counted in entries or in value bytes
 * - Index and files kept in step under concurrent callers and I/O failures
 *
 * Every public method may be called concurrently from any number of threads
 * sharing one instance. Value reads and writes run outside the lock, so
 * operations on unrelated keys overlap.
 */
class FileCache {
public:
    /**
     * Constructor
     * @param config  Validated settings; root_directory must exist and be empty
     * @param storage Backend doing the file I/O (default: FileStorage)
     * @param policy  Eviction ordering (default: LfuPolicy)
     * @throws std::invalid_argument on bad config, InitFailure on unusable root
     */
    explicit FileCache(CacheConfig config,
                       std::shared_ptr<StorageBackend> storage = nullptr,
                       std::unique_ptr<EvictionPolicy> policy = nullptr);

    FileCache(const FileCache&) = delete;
    FileCache& operator=(const FileCache&) = delete;

    // ---------------- Public API ----------------

    /**
     * Store `value` under a freshly generated key (random strategy only).
     * @return The generated key
     */
    std::string put(const std::string& value);

    /**
     * Store `value`, evicting least-frequently-used entries first if needed.
     * The entry becomes visible only once its file is fully written.
     * @param key   Caller-supplied key, or nullopt to generate one
     * @param value Bytes to store
     * @return The key used
     * @throws InvalidKey, KeyCollision, CapacityExceeded, StorageFailure
     */
    std::string put(const std::optional<std::string>& key, const std::string& value);

    /**
     * Read the value stored under `key` and count the access.
     * A key whose file cannot be read is dropped from the cache, unless
     * the file cannot be deleted either, in which case it stays live.
     * @throws KeyNotFound, StorageFailure
     */
    std::string get(const std::string& key);

    /**
     * Delete the entry and its file. If the file cannot be deleted the
     * entry stays live.
     * @throws KeyNotFound, StorageFailure
     */
    void remove(const std::string& key);

    /**
     * Remove every entry, carrying on past failures.
     * @throws PartialFailure listing the entries that could not be removed
     */
    void clear();

    /**
     * @return Current number of entries in the cache
     */
    size_t len() const;

    /**
     * @return capacity of the cache, in capacity_mode() units
     */
    uint64_t capacity() const;

    /**
     * @return Units charged by committed entries (entries or bytes)
     */
    uint64_t used() const;

    CapacityMode capacity_mode() const;
    KeyStrategy key_strategy() const;
    const std::filesystem::path& root_directory() const;

    /// Where the value of `key` lives (or would live) on disk.
    std::filesystem::path path_for(const std::string& key) const;

    /**
     * Raw check: true if `key` is live. Does not count as an access.
     */
    bool contains(const std::string& key) const;

    /**
     * Snapshot of all live keys, in no particular order.
     */
    std::vector<std::string> keys() const;

    /// Number of successful get() calls
    size_t hits() const;

    /// Number of get() calls that found no entry
    size_t misses() const;

    /// Number of entries evicted to make room
    size_t evictions() const;

private:
    // ---------------- Internal types ----------------

    struct Entry {
        std::filesystem::path path;   ///< File holding the value
        uint64_t size;                ///< Units charged against capacity
        uint64_t generation;          ///< Stamp assigned at commit
    };

    /// Undoes an uncommitted put when it unwinds.
    class PendingPut;

    // ---------------- Internal helpers ----------------

    /// Units `value` costs in the configured capacity mode.
    uint64_t cost_of(const std::string& value) const;

    /// Evict until `cost` more units fit beside committed and reserved ones.
    void make_room(std::unique_lock<std::mutex>& lock, uint64_t cost);

    /// Delete the file of `key`, then drop it from index and policy.
    void evict_locked(const std::string& key);

    /// Remove directories of a nested `key` left empty by deleting its file.
    void prune_parents_locked(const std::string& key);

    /// Drop `key` from index and policy, no I/O.
    void forget_locked(std::unordered_map<std::string, Entry>::iterator it);

    void log_event(const std::string& message) const;

    // ---------------- Data members ----------------
    const CacheConfig config_;
    std::shared_ptr<StorageBackend> storage_;
    std::unique_ptr<EvictionPolicy> policy_;        ///< Guarded by mutex_
    KeyGenerator keygen_;                           ///< Guarded by mutex_

    mutable std::mutex mutex_;                      ///< Protects everything below
    std::condition_variable settled_;               ///< Signalled when a pending put ends
    std::unordered_map<std::string, Entry> index_;  ///< key -> Entry
    std::unordered_set<std::string> pending_;       ///< Keys with a put in flight
    uint64_t used_ = 0;                             ///< Sum of committed Entry::size
    uint64_t reserved_ = 0;                         ///< Sum of in-flight put costs
    uint64_t next_generation_ = 0;

    // Metrics
    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
    std::atomic<size_t> evictions_{0};
};

#endif // FILE_CACHE_H
