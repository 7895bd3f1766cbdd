#pragma once
#ifndef EVICTION_POLICY_H
#define EVICTION_POLICY_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

/**
 * Pluggable frequency-ordering primitive used by FileCache.
 * Pure in-memory bookkeeping: never fails, never touches disk.
 * Implementations need not be thread-safe; FileCache calls them under its lock.
 */
class EvictionPolicy {
public:
    virtual ~EvictionPolicy() = default;

    /// Insert `key` with the initial frequency if new, else bump its frequency.
    virtual void record_access(const std::string& key) = 0;

    /// The key to evict next, or empty only if no key is tracked.
    virtual std::optional<std::string> evict_candidate() const = 0;

    /// Forget `key`. No-op if it is not tracked.
    virtual void remove(const std::string& key) = 0;

    virtual bool contains(const std::string& key) const = 0;
    virtual size_t size() const = 0;
    virtual void clear() = 0;
};

/**
 * Least-frequently-used policy.
 * - Keys are grouped into buckets by access count (ordered map, lowest first)
 * - Inside a bucket, keys are ordered by when they were first inserted, so
 *   ties go to the oldest key however it got to that count
 * - All operations are O(log n)
 */
class LfuPolicy final : public EvictionPolicy {
public:
    LfuPolicy() = default;

    void record_access(const std::string& key) override;
    std::optional<std::string> evict_candidate() const override;
    void remove(const std::string& key) override;
    bool contains(const std::string& key) const override;
    size_t size() const override;
    void clear() override;

    /// Current access count of `key`, 0 if untracked.
    uint64_t frequency(const std::string& key) const;

private:
    using Bucket = std::map<uint64_t, std::string>; ///< insertion seq -> key

    struct Node {
        uint64_t freq;  ///< Access count
        uint64_t seq;   ///< Insertion order, fixed while the key is tracked
    };

    /// Unlink a key from its bucket, dropping the bucket once empty.
    void detach(const Node& node);

    std::unordered_map<std::string, Node> nodes_;   ///< key -> Node
    std::map<uint64_t, Bucket> buckets_;            ///< freq -> keys, oldest insertion first
    uint64_t next_seq_ = 0;
};

#endif // EVICTION_POLICY_H
