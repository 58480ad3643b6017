/**
 * @file bb84_simulator.hpp
 * @brief Classical statistical emulation of a BB84 exchange
 *
 * Reproduces BB84's detectability property: an intercept-resend attacker
 * measuring in a random basis corrupts ~25% of the sifted key, which the
 * disclosed-sample QBER exposes against the 11% security bound. Photons are
 * not modelled physically; each position is a (bit, basis) pair.
 *
 * Bit packing convention: most-significant bit first. Retained bit i lands
 * in byte i/8 at bit position 7 - (i % 8).
 */

#pragma once

#include "qkd_config.hpp"
#include "random_source.hpp"
#include "../core/secure_memory.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sentinel {
namespace qkd {

/**
 * @brief Parameters of a single run
 */
struct SimulationParams {
    size_t bit_count = SENTINEL_DEFAULT_BIT_COUNT;
    bool eavesdropper_present = false;
    double intercept_rate = SENTINEL_DEFAULT_INTERCEPT_RATE;
    double noise_level = SENTINEL_DEFAULT_NOISE_LEVEL;
    double disclosed_fraction = SENTINEL_DEFAULT_DISCLOSED_FRACTION;
    size_t raw_secret_bits = SENTINEL_DEFAULT_RAW_SECRET_BITS;
    double security_threshold = SENTINEL_QBER_SECURITY_THRESHOLD;

    static SimulationParams from_config(const ChannelConfig& cfg, bool eavesdropper_present);

    /**
     * @throws core::ConfigurationError for out-of-range values or a bit
     *         count whose expected retained length is below raw_secret_bits
     */
    void validate() const;
};

/**
 * @brief Outcome of a completed run
 */
struct SimulationResult {
    core::SecretBytes raw_secret;       ///< raw_secret_bits/8 bytes, never sample bits
    double qber = 0.0;
    bool eavesdropper_detected = false;

    // Diagnostics
    size_t sifted_bits = 0;
    size_t sample_size = 0;
    size_t sample_mismatches = 0;
    size_t retained_bits = 0;
    size_t intercepted_positions = 0;
};

/**
 * @brief Pack bits (values 0/1) MSB-first into bytes
 *
 * A trailing partial byte is zero-padded in its low bits.
 */
std::vector<uint8_t> pack_bits_msb_first(const std::vector<uint8_t>& bits);

/**
 * @brief Number of sifted positions disclosed for the QBER estimate
 *
 * ceil(fraction * sifted), so any non-empty sifted key discloses at least
 * one position.
 */
size_t disclosed_sample_size(size_t sifted_bits, double fraction);

/**
 * @brief Stateless BB84 simulator bound to a channel configuration
 *
 * run() is a pure function of its arguments and the draws taken from the
 * supplied RandomSource; concurrent runs need separate sources.
 */
class QuantumChannelSimulator {
public:
    explicit QuantumChannelSimulator(const ChannelConfig& config);

    /**
     * @brief Simulate one exchange
     *
     * @throws core::ConfigurationError on invalid parameters
     * @throws core::InsufficientKeyMaterialError if sifting leaves no
     *         disclosed sample or fewer retained bits than the raw secret needs
     * @throws core::RandomSourceError if the source fails
     */
    SimulationResult run(size_t bit_count,
                         bool eavesdropper_present,
                         double intercept_rate,
                         double noise_level,
                         RandomSource& rng) const;

    /// Run with every parameter taken from the bound configuration
    SimulationResult run(bool eavesdropper_present, RandomSource& rng) const;

    /// Run with fully explicit parameters
    static SimulationResult simulate(const SimulationParams& params, RandomSource& rng);

    const ChannelConfig& config() const { return config_; }

private:
    ChannelConfig config_;
};

} // namespace qkd
} // namespace sentinel
