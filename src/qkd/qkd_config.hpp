/**
 * @file qkd_config.hpp
 * @brief BB84 channel configuration and compile-time defaults
 *
 * The disclosed-sample fraction and raw secret length are demo-tunable
 * values, not protocol-mandated ones; every default below can be overridden
 * with -D at build time, through the environment at run time, or directly
 * on a ChannelConfig instance.
 *
 * @version 1.0.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#define SENTINEL_VERSION_MAJOR 1
#define SENTINEL_VERSION_MINOR 0
#define SENTINEL_VERSION_PATCH 0
#define SENTINEL_VERSION_STRING "1.0.0"

// ============================================================================
// CHANNEL DEFAULTS
// ============================================================================

/**
 * @brief Raw qubit positions simulated per run
 *
 * About half survive sifting; with the default disclosed fraction this
 * leaves ~410 retained bits for a 256-bit raw secret.
 */
#ifndef SENTINEL_DEFAULT_BIT_COUNT
#define SENTINEL_DEFAULT_BIT_COUNT 1024
#endif

/**
 * @brief Upper bound on bit_count accepted by validation
 */
#ifndef SENTINEL_MAX_BIT_COUNT
#define SENTINEL_MAX_BIT_COUNT (1u << 24)
#endif

/**
 * @brief Fraction of the sifted key disclosed for QBER estimation
 */
#ifndef SENTINEL_DEFAULT_DISCLOSED_FRACTION
#define SENTINEL_DEFAULT_DISCLOSED_FRACTION 0.2
#endif

/**
 * @brief Raw secret length in bits (before key derivation)
 */
#ifndef SENTINEL_DEFAULT_RAW_SECRET_BITS
#define SENTINEL_DEFAULT_RAW_SECRET_BITS 256
#endif

/**
 * @brief Intercept probability applied when an eavesdropper is forced
 */
#ifndef SENTINEL_DEFAULT_INTERCEPT_RATE
#define SENTINEL_DEFAULT_INTERCEPT_RATE 1.0
#endif

#ifndef SENTINEL_DEFAULT_NOISE_LEVEL
#define SENTINEL_DEFAULT_NOISE_LEVEL 0.0
#endif

// ============================================================================
// LINK HEALTH THRESHOLDS
// ============================================================================

/**
 * @brief QBER security threshold
 *
 * BB84's ~11% bound under intercept-resend. A full intercept-resend attack
 * produces ~25% QBER on the sifted key.
 */
#ifndef SENTINEL_QBER_SECURITY_THRESHOLD
#define SENTINEL_QBER_SECURITY_THRESHOLD 0.11
#endif

/**
 * @brief Below this QBER the link is GREEN; up to the security threshold YELLOW
 */
#ifndef SENTINEL_QBER_SAFE_THRESHOLD
#define SENTINEL_QBER_SAFE_THRESHOLD 0.05
#endif

// ============================================================================
// KEY DERIVATION LABELS
// ============================================================================

#define SENTINEL_LABEL_BB84 "sentinel-qkd/bb84/session-key/v1"
#define SENTINEL_LABEL_HYBRID "sentinel-qkd/bb84+ml-kem-1024/session-key/v1"

namespace sentinel {
namespace qkd {

/**
 * @brief Runtime channel configuration
 */
struct ChannelConfig {
    size_t bit_count = SENTINEL_DEFAULT_BIT_COUNT;
    double noise_level = SENTINEL_DEFAULT_NOISE_LEVEL;
    double intercept_rate = SENTINEL_DEFAULT_INTERCEPT_RATE;   ///< Used when an eavesdropper is present
    double disclosed_fraction = SENTINEL_DEFAULT_DISCLOSED_FRACTION;
    size_t raw_secret_bits = SENTINEL_DEFAULT_RAW_SECRET_BITS;
    double security_threshold = SENTINEL_QBER_SECURITY_THRESHOLD;
    double safe_threshold = SENTINEL_QBER_SAFE_THRESHOLD;

    size_t raw_secret_bytes() const { return raw_secret_bits / 8; }

    /**
     * @brief Expected retained bits: bit_count/2 * (1 - disclosed_fraction)
     */
    double expected_retained_bits() const {
        return static_cast<double>(bit_count) * 0.5 * (1.0 - disclosed_fraction);
    }

    /**
     * @brief Reject out-of-range or undersized configurations
     * @throws core::ConfigurationError naming the offending field
     */
    void validate() const;

    /**
     * @brief Defaults overlaid with SENTINEL_* environment variables
     *
     * Recognised: SENTINEL_BIT_COUNT, SENTINEL_NOISE_LEVEL,
     * SENTINEL_INTERCEPT_RATE, SENTINEL_DISCLOSED_FRACTION,
     * SENTINEL_RAW_SECRET_BITS, SENTINEL_QBER_THRESHOLD,
     * SENTINEL_SAFE_THRESHOLD.
     *
     * @throws core::ConfigurationError on unparsable or invalid values
     */
    static ChannelConfig from_environment();
};

/**
 * @brief Check a probability-like value lies in [0, 1]
 * @throws core::ConfigurationError
 */
void require_unit_interval(const std::string& name, double value);

} // namespace qkd
} // namespace sentinel
