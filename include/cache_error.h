#pragma once
#ifndef CACHE_ERROR_H
#define CACHE_ERROR_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

/**
 * Base class of every recoverable error raised by FileCache.
 */
class CacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// No live entry exists for the key.
class KeyNotFound : public CacheError {
public:
    explicit KeyNotFound(const std::string& key);
    const std::string& key() const { return key_; }

private:
    std::string key_;
};

/// A caller-supplied key is already live (or being written).
class KeyCollision : public CacheError {
public:
    explicit KeyCollision(const std::string& key);
    const std::string& key() const { return key_; }

private:
    std::string key_;
};

/// A caller-supplied key was rejected by the key generator.
class InvalidKey : public CacheError {
public:
    InvalidKey(const std::string& key, const std::string& reason);
    const std::string& key() const { return key_; }
    const std::string& reason() const { return reason_; }

private:
    std::string key_;
    std::string reason_;
};

/// The value alone costs more than the whole cache capacity.
class CapacityExceeded : public CacheError {
public:
    CapacityExceeded(const std::string& key, uint64_t cost, uint64_t capacity);
    const std::string& key() const { return key_; }
    uint64_t cost() const { return cost_; }

private:
    std::string key_;
    uint64_t cost_;
};

/**
 * The storage backend failed while working on `key`.
 * Carries the underlying I/O error code.
 */
class StorageFailure : public CacheError {
public:
    StorageFailure(const std::string& key, std::error_code cause);
    const std::string& key() const { return key_; }
    std::error_code cause() const { return cause_; }

private:
    std::string key_;
    std::error_code cause_;
};

/**
 * clear() could not remove every entry.
 * survivors() lists the keys that are still live.
 */
class PartialFailure : public CacheError {
public:
    using Failure = std::pair<std::string, std::error_code>;

    explicit PartialFailure(std::vector<Failure> failures);
    const std::vector<Failure>& failures() const { return failures_; }
    std::vector<std::string> survivors() const;

private:
    std::vector<Failure> failures_;
};

/// The root directory cannot back a cache.
class InitFailure : public CacheError {
public:
    using CacheError::CacheError;
};

/**
 * Internal bookkeeping is inconsistent (index and eviction policy disagree).
 * Fatal; not a CacheError.
 */
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

#endif // CACHE_ERROR_H
