#include "key_generator.h"
#include "cache_error.h"

#include <cstring>

RandomKeyGenerator::RandomKeyGenerator() : rng_(std::random_device{}()) {}

RandomKeyGenerator::RandomKeyGenerator(uint64_t seed) : rng_(seed) {}

std::string RandomKeyGenerator::next() {
    uint8_t bytes[16];
    uint64_t hi = rng_();
    uint64_t lo = rng_();
    std::memcpy(bytes, &hi, sizeof(hi));
    std::memcpy(bytes + 8, &lo, sizeof(lo));

    bytes[6] = (bytes[6] & 0x0F) | 0x40; // version 4
    bytes[8] = (bytes[8] & 0x3F) | 0x80; // RFC 4122 variant

    static constexpr char hex[] = "0123456789abcdef";
    char buf[36];
    int j = 0;
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) buf[j++] = '-';
        buf[j++] = hex[(bytes[i] >> 4) & 0xF];
        buf[j++] = hex[bytes[i] & 0xF];
    }
    return std::string(buf, 36);
}

bool RandomKeyGenerator::is_uuid(const std::string& key) {
    if (key.size() != 36) return false;
    for (size_t i = 0; i < key.size(); ++i) {
        char c = key[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

static bool reject(std::string* reason, const char* why) {
    if (reason) *reason = why;
    return false;
}

bool StructuredKeyGenerator::is_valid(const std::string& key, std::string* reason) {
    if (key.empty()) return reject(reason, "key is empty");
    if (key.size() > max_key_length) return reject(reason, "key is too long");

    size_t start = 0;
    while (start <= key.size()) {
        size_t end = key.find('/', start);
        if (end == std::string::npos) end = key.size();
        const size_t len = end - start;

        if (len == 0) return reject(reason, "empty path segment");
        if (len > max_segment_length) return reject(reason, "path segment is too long");
        if (key[start] == '.') return reject(reason, "path segment starts with '.'");

        for (size_t i = start; i < end; ++i) {
            unsigned char c = static_cast<unsigned char>(key[i]);
            if (c < 0x20 || c == 0x7F) return reject(reason, "control character");
            if (std::strchr("\\:*?\"<>|", c) != nullptr) return reject(reason, "reserved character");
        }
        start = end + 1;
    }
    return true;
}

static std::variant<RandomKeyGenerator, StructuredKeyGenerator> make_strategy(KeyStrategy strategy) {
    if (strategy == KeyStrategy::Structured) {
        return StructuredKeyGenerator{};
    }
    return RandomKeyGenerator{};
}

KeyGenerator::KeyGenerator(KeyStrategy strategy) : impl_(make_strategy(strategy)) {}

KeyStrategy KeyGenerator::strategy() const {
    return std::holds_alternative<StructuredKeyGenerator>(impl_) ? KeyStrategy::Structured
                                                                 : KeyStrategy::Random;
}

std::string KeyGenerator::resolve(const std::optional<std::string>& requested, const TakenFn& is_taken) {
    if (auto* random = std::get_if<RandomKeyGenerator>(&impl_)) {
        if (requested) {
            if (!RandomKeyGenerator::is_uuid(*requested)) {
                throw InvalidKey(*requested, "random-key caches only accept UUID keys");
            }
            return *requested;
        }
        for (int attempt = 0; attempt < max_random_attempts; ++attempt) {
            std::string key = random->next();
            if (!is_taken(key)) return key;
        }
        throw KeyCollision("<generated>");
    }

    if (!requested) {
        throw InvalidKey("", "structured-key caches require a caller-supplied key");
    }
    std::string reason;
    if (!StructuredKeyGenerator::is_valid(*requested, &reason)) {
        throw InvalidKey(*requested, reason);
    }
    return *requested;
}
