#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>

namespace sentinel {
namespace qkd {

/**
 * @brief Source of the random draws consumed by the BB84 simulator
 *
 * Instances are not shared between concurrent simulations; the key manager
 * creates one per run through a RandomSourceFactory.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * @brief Fill a buffer with uniformly random bytes
     * @throws core::RandomSourceError if the source is exhausted
     */
    virtual void fill(uint8_t* out, size_t len) = 0;

    /// Uniform bit in {0,1}
    virtual uint8_t bit();

    /// Uniform double in [0, 1) with 53 bits of resolution
    virtual double uniform();

    /**
     * @brief Uniform integer in [0, n) without modulo bias
     * @throws core::ConfigurationError if n == 0
     */
    virtual uint64_t below(uint64_t n);

    /// Bernoulli draw with probability p
    bool chance(double p) { return p > 0.0 && uniform() < p; }

protected:
    uint64_t next_u64();

private:
    // Bits handed out by bit() come from one cached word
    uint64_t bit_cache_ = 0;
    unsigned bits_left_ = 0;
};

/**
 * @brief Production source backed by libsodium's randombytes_buf
 *
 * Reads the OS CSPRNG in blocks to keep per-draw cost low.
 */
class SodiumRandomSource : public RandomSource {
public:
    SodiumRandomSource();
    ~SodiumRandomSource() override;

    void fill(uint8_t* out, size_t len) override;

private:
    static constexpr size_t BUFFER_BYTES = 512;

    void refill();

    std::array<uint8_t, BUFFER_BYTES> buffer_{};
    size_t offset_ = BUFFER_BYTES;
};

/**
 * @brief Deterministic source for tests and reproducible demo runs
 */
class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(uint64_t seed) : engine_(seed) {}

    void fill(uint8_t* out, size_t len) override;

private:
    std::mt19937_64 engine_;
};

using RandomSourceFactory = std::function<std::unique_ptr<RandomSource>()>;

/// Factory producing a fresh SodiumRandomSource per call
RandomSourceFactory sodium_random_factory();

/// Factory producing SeededRandomSource instances with seeds base, base+1, ...
RandomSourceFactory seeded_random_factory(uint64_t base_seed);

} // namespace qkd
} // namespace sentinel
