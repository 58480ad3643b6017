#include "qkd_config.hpp"
#include "../core/errors.hpp"
#include <cmath>
#include <cstdlib>
#include <string>

namespace sentinel {
namespace qkd {

namespace {

const char* env_value(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

double parse_double(const char* name, const char* text) {
    std::string s(text);
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(s, &consumed);
    } catch (const std::exception&) {
        throw core::ConfigurationError(std::string(name) + "='" + s + "' is not a number");
    }
    if (consumed != s.size() || !std::isfinite(value)) {
        throw core::ConfigurationError(std::string(name) + "='" + s + "' is not a number");
    }
    return value;
}

size_t parse_size(const char* name, const char* text) {
    std::string s(text);
    if (s.empty() || s[0] == '-' || s[0] == '+') {
        throw core::ConfigurationError(std::string(name) + "='" + s + "' is not a positive integer");
    }
    size_t consumed = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(s, &consumed);
    } catch (const std::exception&) {
        throw core::ConfigurationError(std::string(name) + "='" + s + "' is not a positive integer");
    }
    if (consumed != s.size()) {
        throw core::ConfigurationError(std::string(name) + "='" + s + "' is not a positive integer");
    }
    return static_cast<size_t>(value);
}

} // namespace

void require_unit_interval(const std::string& name, double value) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw core::ConfigurationError(name + " must be within [0, 1], got " + std::to_string(value));
    }
}

void ChannelConfig::validate() const {
    if (bit_count == 0) {
        throw core::ConfigurationError("bit_count must be positive");
    }
    if (bit_count > SENTINEL_MAX_BIT_COUNT) {
        throw core::ConfigurationError("bit_count exceeds maximum of " +
                                       std::to_string(SENTINEL_MAX_BIT_COUNT));
    }

    require_unit_interval("noise_level", noise_level);
    require_unit_interval("intercept_rate", intercept_rate);
    require_unit_interval("security_threshold", security_threshold);
    require_unit_interval("safe_threshold", safe_threshold);

    if (!(disclosed_fraction > 0.0 && disclosed_fraction < 1.0)) {
        throw core::ConfigurationError("disclosed_fraction must be within (0, 1), got " +
                                       std::to_string(disclosed_fraction));
    }
    if (raw_secret_bits == 0 || raw_secret_bits % 8 != 0) {
        throw core::ConfigurationError("raw_secret_bits must be a positive multiple of 8, got " +
                                       std::to_string(raw_secret_bits));
    }
    if (!(safe_threshold < security_threshold)) {
        throw core::ConfigurationError("safe_threshold must be below security_threshold");
    }

    // Undersized channels are rejected rather than padded
    if (expected_retained_bits() < static_cast<double>(raw_secret_bits)) {
        throw core::ConfigurationError(
            "bit_count " + std::to_string(bit_count) + " is expected to retain only " +
            std::to_string(static_cast<size_t>(expected_retained_bits())) +
            " bits, below raw_secret_bits " + std::to_string(raw_secret_bits));
    }
}

ChannelConfig ChannelConfig::from_environment() {
    ChannelConfig cfg;

    if (const char* v = env_value("SENTINEL_BIT_COUNT")) {
        cfg.bit_count = parse_size("SENTINEL_BIT_COUNT", v);
    }
    if (const char* v = env_value("SENTINEL_NOISE_LEVEL")) {
        cfg.noise_level = parse_double("SENTINEL_NOISE_LEVEL", v);
    }
    if (const char* v = env_value("SENTINEL_INTERCEPT_RATE")) {
        cfg.intercept_rate = parse_double("SENTINEL_INTERCEPT_RATE", v);
    }
    if (const char* v = env_value("SENTINEL_DISCLOSED_FRACTION")) {
        cfg.disclosed_fraction = parse_double("SENTINEL_DISCLOSED_FRACTION", v);
    }
    if (const char* v = env_value("SENTINEL_RAW_SECRET_BITS")) {
        cfg.raw_secret_bits = parse_size("SENTINEL_RAW_SECRET_BITS", v);
    }
    if (const char* v = env_value("SENTINEL_QBER_THRESHOLD")) {
        cfg.security_threshold = parse_double("SENTINEL_QBER_THRESHOLD", v);
    }
    if (const char* v = env_value("SENTINEL_SAFE_THRESHOLD")) {
        cfg.safe_threshold = parse_double("SENTINEL_SAFE_THRESHOLD", v);
    }

    cfg.validate();
    return cfg;
}

} // namespace qkd
} // namespace sentinel
