#include "cache_error.h"

KeyNotFound::KeyNotFound(const std::string& key)
    : CacheError("key not found: " + key), key_(key) {}

KeyCollision::KeyCollision(const std::string& key)
    : CacheError("key already in use: " + key), key_(key) {}

InvalidKey::InvalidKey(const std::string& key, const std::string& reason)
    : CacheError("invalid key '" + key + "': " + reason), key_(key), reason_(reason) {}

CapacityExceeded::CapacityExceeded(const std::string& key, uint64_t cost, uint64_t capacity)
    : CacheError("value for " + key + " costs " + std::to_string(cost) +
                 " but capacity is " + std::to_string(capacity)),
      key_(key), cost_(cost) {}

StorageFailure::StorageFailure(const std::string& key, std::error_code cause)
    : CacheError("storage failure for " + key + ": " + cause.message()),
      key_(key), cause_(cause) {}

static std::string describe_failures(const std::vector<PartialFailure::Failure>& failures) {
    std::string msg = "clear left " + std::to_string(failures.size()) + " entries behind:";
    for (const auto& f : failures) {
        msg += " " + f.first + " (" + f.second.message() + ")";
    }
    return msg;
}

PartialFailure::PartialFailure(std::vector<Failure> failures)
    : CacheError(describe_failures(failures)), failures_(std::move(failures)) {}

std::vector<std::string> PartialFailure::survivors() const {
    std::vector<std::string> keys;
    keys.reserve(failures_.size());
    for (const auto& f : failures_) {
        keys.push_back(f.first);
    }
    return keys;
}
