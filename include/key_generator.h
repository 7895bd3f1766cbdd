#pragma once
#ifndef KEY_GENERATOR_H
#define KEY_GENERATOR_H

#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <variant>

#include "cache_config.h"

/**
 * Random-identifier strategy: every key is a fresh version-4 UUID
 * ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx", lowercase hex).
 */
class RandomKeyGenerator {
public:
    /// Seeded from std::random_device.
    RandomKeyGenerator();

    /// Fixed seed, for reproducible tests.
    explicit RandomKeyGenerator(uint64_t seed);

    std::string next();

    /// True if `key` is a canonical lowercase UUID.
    static bool is_uuid(const std::string& key);

private:
    std::mt19937_64 rng_;
};

/**
 * Structured-path strategy: the caller's data is the key.
 * Keys are relative paths made of '/'-separated segments; each segment is
 * 1..255 bytes, is not "." or "..", does not start with '.', and contains
 * no control characters and none of \ : * ? " < > |
 */
class StructuredKeyGenerator {
public:
    static constexpr size_t max_key_length = 1024;
    static constexpr size_t max_segment_length = 255;

    /**
     * @param reason receives why the key was rejected, may be null
     * @return true if `key` is safe to use as a path under the cache root
     */
    static bool is_valid(const std::string& key, std::string* reason = nullptr);
};

/**
 * Closed choice between the two key strategies, fixed at construction.
 * Not thread-safe; FileCache calls it under its lock.
 */
class KeyGenerator {
public:
    using TakenFn = std::function<bool(const std::string&)>;

    static constexpr int max_random_attempts = 8;

    explicit KeyGenerator(KeyStrategy strategy);

    /**
     * Decide the key a put will use.
     * - requested key: validated for the strategy, returned unchanged
     * - no key, random strategy: a fresh UUID, re-rolled while `is_taken`
     * - no key, structured strategy: rejected
     * Collisions of a requested key are left to the caller.
     * @throws InvalidKey, KeyCollision (random space exhausted)
     */
    std::string resolve(const std::optional<std::string>& requested, const TakenFn& is_taken);

    KeyStrategy strategy() const;

private:
    std::variant<RandomKeyGenerator, StructuredKeyGenerator> impl_;
};

#endif // KEY_GENERATOR_H
