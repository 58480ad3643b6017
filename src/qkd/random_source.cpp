#include "random_source.hpp"
#include "../core/errors.hpp"
#include "../core/secure_memory.hpp"
#include <sodium.h>
#include <algorithm>
#include <atomic>
#include <cstring>

namespace sentinel {
namespace qkd {

uint64_t RandomSource::next_u64() {
    uint8_t raw[8];
    fill(raw, sizeof(raw));
    uint64_t v = 0;
    for (size_t i = 0; i < sizeof(raw); ++i) {
        v = (v << 8) | raw[i];
    }
    return v;
}

uint8_t RandomSource::bit() {
    if (bits_left_ == 0) {
        bit_cache_ = next_u64();
        bits_left_ = 64;
    }
    uint8_t b = static_cast<uint8_t>(bit_cache_ & 1u);
    bit_cache_ >>= 1;
    --bits_left_;
    return b;
}

double RandomSource::uniform() {
    return static_cast<double>(next_u64() >> 11) * (1.0 / 9007199254740992.0);  // 2^53
}

uint64_t RandomSource::below(uint64_t n) {
    if (n == 0) {
        throw core::ConfigurationError("below(0) has no valid result");
    }
    // Rejection sampling over the largest multiple of n
    const uint64_t limit = UINT64_MAX - (UINT64_MAX % n);
    uint64_t v;
    do {
        v = next_u64();
    } while (v >= limit);
    return v % n;
}

// ============================================================================
// SodiumRandomSource
// ============================================================================

SodiumRandomSource::SodiumRandomSource() {
    core::ensure_sodium();
}

SodiumRandomSource::~SodiumRandomSource() {
    core::secure_zero_memory(buffer_.data(), buffer_.size());
}

void SodiumRandomSource::refill() {
    randombytes_buf(buffer_.data(), buffer_.size());
    offset_ = 0;
}

void SodiumRandomSource::fill(uint8_t* out, size_t len) {
    while (len > 0) {
        if (offset_ == buffer_.size()) {
            refill();
        }
        size_t n = std::min(len, buffer_.size() - offset_);
        std::memcpy(out, buffer_.data() + offset_, n);
        // Consumed bytes are not left behind in the buffer
        sodium_memzero(buffer_.data() + offset_, n);
        offset_ += n;
        out += n;
        len -= n;
    }
}

// ============================================================================
// SeededRandomSource
// ============================================================================

void SeededRandomSource::fill(uint8_t* out, size_t len) {
    while (len > 0) {
        uint64_t v = engine_();
        size_t n = std::min<size_t>(len, sizeof(v));
        for (size_t i = 0; i < n; ++i) {
            out[i] = static_cast<uint8_t>(v >> (8 * i));
        }
        out += n;
        len -= n;
    }
}

RandomSourceFactory sodium_random_factory() {
    return []() -> std::unique_ptr<RandomSource> { return std::make_unique<SodiumRandomSource>(); };
}

RandomSourceFactory seeded_random_factory(uint64_t base_seed) {
    auto counter = std::make_shared<std::atomic<uint64_t>>(base_seed);
    return [counter]() -> std::unique_ptr<RandomSource> {
        return std::make_unique<SeededRandomSource>(counter->fetch_add(1));
    };
}

} // namespace qkd
} // namespace sentinel
