#include "file_cache.h"
#include "log_utils.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

static bool is_missing(std::error_code ec) {
    return ec == std::errc::no_such_file_or_directory;
}

static bool is_not_empty(std::error_code ec) {
    return ec == std::errc::directory_not_empty || ec == std::errc::file_exists;
}

/**
 * Owns the reservation of a put between admission and commit.
 * If the put unwinds before commit(), the reservation is released, the key
 * is freed and any file already written is deleted again.
 */
class FileCache::PendingPut {
public:
    PendingPut(FileCache& cache, std::string key, uint64_t cost)
        : cache_(cache), key_(std::move(key)), cost_(cost) {}

    PendingPut(const PendingPut&) = delete;
    PendingPut& operator=(const PendingPut&) = delete;

    ~PendingPut() {
        if (!committed_) {
            abandon();
        }
    }

    // PRECONDITION: caller does not hold cache_.mutex_, the value is on disk at `path`
    void commit(const fs::path& path) {
        written_ = true;

        std::lock_guard<std::mutex> lock(cache_.mutex_);
        auto inserted = cache_.index_.emplace(key_, Entry{path, cost_, ++cache_.next_generation_});
        try {
            cache_.policy_->record_access(key_);
        } catch (...) {
            cache_.index_.erase(inserted.first);
            throw;
        }
        cache_.used_ += cost_;
        cache_.reserved_ -= cost_;
        cache_.pending_.erase(key_);
        committed_ = true;
        cache_.settled_.notify_all();
    }

private:
    void abandon() {
        std::lock_guard<std::mutex> lock(cache_.mutex_);
        bool file_gone = true;
        if (written_) {
            // The key is still pending here, so nobody else can be using this path
            std::error_code ec = cache_.storage_->remove(cache_.path_for(key_));
            if (ec && !is_missing(ec)) {
                cache_.log_event("could not clean up uncommitted " + key_ + ": " + ec.message());
                file_gone = false;
            }
        }
        if (file_gone) {
            // A failed write may still have created parent directories
            cache_.prune_parents_locked(key_);
        }
        cache_.reserved_ -= cost_;
        cache_.pending_.erase(key_);
        cache_.settled_.notify_all();
    }

    FileCache& cache_;
    std::string key_;
    uint64_t cost_;
    bool written_ = false;
    bool committed_ = false;
};

FileCache::FileCache(CacheConfig config,
                     std::shared_ptr<StorageBackend> storage,
                     std::unique_ptr<EvictionPolicy> policy)
    : config_(std::move(config)),
      storage_(storage ? std::move(storage)
                       : std::shared_ptr<StorageBackend>(std::make_shared<FileStorage>(config_.sync_writes))),
      policy_(policy ? std::move(policy) : std::unique_ptr<EvictionPolicy>(std::make_unique<LfuPolicy>())),
      keygen_(config_.key_strategy)
{
    config_.validate();

    std::error_code ec;
    if (!fs::is_directory(config_.root_directory, ec)) {
        throw InitFailure("cannot use " + config_.root_directory.string() +
                          " as a cache directory: not an existing directory");
    }
    bool empty = fs::is_empty(config_.root_directory, ec);
    if (ec) {
        throw InitFailure("cannot inspect " + config_.root_directory.string() + ": " + ec.message());
    }
    if (!empty) {
        throw InitFailure("cannot use " + config_.root_directory.string() +
                          " as a cache directory: it is not empty");
    }
    if (policy_->size() != 0) {
        throw std::invalid_argument("eviction policy must start empty");
    }
}

uint64_t FileCache::cost_of(const std::string& value) const {
    // An empty value still takes a slot, so len() stays within capacity
    return config_.capacity_mode == CapacityMode::Bytes
               ? std::max<uint64_t>(1, value.size())
               : 1;
}

fs::path FileCache::path_for(const std::string& key) const {
    return config_.root_directory / key;
}

void FileCache::log_event(const std::string& message) const {
    if (config_.log_events) {
        log_line("FileCache", message);
    }
}

// PRECONDITION: caller holds mutex_ through `lock`
void FileCache::make_room(std::unique_lock<std::mutex>& lock, uint64_t cost) {
    while (used_ + reserved_ + cost > config_.capacity) {
        auto victim = policy_->evict_candidate();
        if (!victim) {
            if (!index_.empty()) {
                throw InvariantViolation("index holds " + std::to_string(index_.size()) +
                                         " entries but the eviction policy is empty");
            }
            if (reserved_ == 0) {
                throw InvariantViolation(std::to_string(used_) + " units charged to an empty index");
            }
            // Only in-flight puts hold the space; wait until one of them settles
            settled_.wait(lock);
            continue;
        }
        evict_locked(*victim);
    }
}

// PRECONDITION: caller holds mutex_
void FileCache::evict_locked(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        throw InvariantViolation("eviction policy proposed " + key + " which is not in the index");
    }

    std::error_code ec = storage_->remove(it->second.path);
    if (ec && !is_missing(ec)) {
        log_event("could not evict " + key + ": " + ec.message());
        throw StorageFailure(key, ec);
    }
    forget_locked(it);
    prune_parents_locked(key);
    evictions_++;
    log_event("evicted " + key);
}

// PRECONDITION: caller holds mutex_, the file of `key` is gone
void FileCache::prune_parents_locked(const std::string& key) {
    fs::path dir = path_for(key).parent_path();
    for (auto depth = std::count(key.begin(), key.end(), '/'); depth > 0; --depth) {
        std::error_code ec = storage_->remove_directory(dir);
        if (is_not_empty(ec) || is_missing(ec)) return;
        if (ec) {
            log_event("could not remove directory " + dir.string() + ": " + ec.message());
            return;
        }
        dir = dir.parent_path();
    }
}

// PRECONDITION: caller holds mutex_
void FileCache::forget_locked(std::unordered_map<std::string, Entry>::iterator it) {
    used_ -= it->second.size;
    policy_->remove(it->first);
    index_.erase(it);
}

std::string FileCache::put(const std::string& value) {
    return put(std::nullopt, value);
}

std::string FileCache::put(const std::optional<std::string>& key, const std::string& value) {
    const uint64_t cost = cost_of(value);
    std::unique_lock<std::mutex> lock(mutex_);

    auto is_taken = [this](const std::string& candidate) {
        return index_.count(candidate) > 0 || pending_.count(candidate) > 0;
    };
    std::string k = keygen_.resolve(key, is_taken);
    if (key && is_taken(k)) {
        throw KeyCollision(k);
    }
    if (cost > config_.capacity) {
        throw CapacityExceeded(k, cost, config_.capacity);
    }

    // Claim the key, then evict strictly before admitting the new entry
    pending_.insert(k);
    try {
        make_room(lock, cost);
    } catch (...) {
        pending_.erase(k);
        settled_.notify_all();
        throw;
    }
    reserved_ += cost;

    const fs::path path = path_for(k);
    PendingPut pending(*this, k, cost);
    lock.unlock();

    std::error_code ec = storage_->write(path, value);
    if (ec) {
        log_event("write failed for " + k + ": " + ec.message());
        throw StorageFailure(k, ec);
    }
    pending.commit(path);
    return k;
}

std::string FileCache::get(const std::string& key) {
    Entry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            misses_++;
            throw KeyNotFound(key);
        }
        entry = it->second;
    }

    std::string value;
    std::error_code ec = storage_->read(entry.path, value);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end() || it->second.generation != entry.generation) {
        // Removed or replaced while the read was in flight
        misses_++;
        throw KeyNotFound(key);
    }

    if (ec) {
        // Self-heal: the entry no longer has a readable file behind it
        std::error_code cleanup = storage_->remove(entry.path);
        if (cleanup && !is_missing(cleanup)) {
            // Entry stays live, its file is still on disk
            log_event("read of " + key + " failed (" + ec.message() + ") and its file could not be deleted: " +
                      cleanup.message());
            throw StorageFailure(key, ec);
        }
        forget_locked(it);
        prune_parents_locked(key);
        log_event("dropped dangling entry " + key + " after read failure: " + ec.message());
        throw StorageFailure(key, ec);
    }

    policy_->record_access(key);
    hits_++;
    return value;
}

void FileCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        throw KeyNotFound(key);
    }

    std::error_code ec = storage_->remove(it->second.path);
    if (ec && !is_missing(ec)) {
        log_event("could not remove " + key + ": " + ec.message());
        throw StorageFailure(key, ec);
    }
    forget_locked(it);
    prune_parents_locked(key);
}

void FileCache::clear() {
    std::vector<PartialFailure::Failure> failures;
    for (const auto& key : keys()) {
        try {
            remove(key);
        } catch (const KeyNotFound&) {
            // Removed or evicted concurrently since the snapshot
            continue;
        } catch (const StorageFailure& e) {
            failures.emplace_back(key, e.cause());
        }
    }

    if (!failures.empty()) {
        log_event("clear left " + std::to_string(failures.size()) + " entries behind");
        throw PartialFailure(std::move(failures));
    }
}

size_t FileCache::len() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

uint64_t FileCache::capacity() const {
    return config_.capacity;
}

uint64_t FileCache::used() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_;
}

CapacityMode FileCache::capacity_mode() const {
    return config_.capacity_mode;
}

KeyStrategy FileCache::key_strategy() const {
    return config_.key_strategy;
}

const fs::path& FileCache::root_directory() const {
    return config_.root_directory;
}

bool FileCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.find(key) != index_.end();
}

std::vector<std::string> FileCache::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(index_.size());
    for (const auto& kv : index_) {
        result.push_back(kv.first);
    }
    return result;
}

size_t FileCache::hits() const {
    return hits_.load();
}

size_t FileCache::misses() const {
    return misses_.load();
}

size_t FileCache::evictions() const {
    return evictions_.load();
}
