#pragma once

#include <stdexcept>
#include <string>

namespace sentinel {
namespace core {

/**
 * @brief Base exception for sentinel-qkd errors
 */
class SentinelError : public std::runtime_error {
public:
    explicit SentinelError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid parameter or configuration value
 *
 * Fatal to the call that raised it. Values are never silently defaulted.
 */
class ConfigurationError : public SentinelError {
public:
    explicit ConfigurationError(const std::string& message)
        : SentinelError("Configuration error: " + message) {}
};

/**
 * @brief Simulation produced too few sifted bits
 *
 * Retryable. Reflects channel sizing, not a security event.
 */
class InsufficientKeyMaterialError : public SentinelError {
public:
    InsufficientKeyMaterialError(size_t available_bits, size_t required_bits)
        : SentinelError("Insufficient key material: " +
                        std::to_string(available_bits) + " bits available, " +
                        std::to_string(required_bits) + " required"),
          available_bits_(available_bits),
          required_bits_(required_bits) {}

    size_t available_bits() const { return available_bits_; }
    size_t required_bits() const { return required_bits_; }

private:
    size_t available_bits_;
    size_t required_bits_;
};

/**
 * @brief Random source could not be initialised or is exhausted
 */
class RandomSourceError : public ConfigurationError {
public:
    explicit RandomSourceError(const std::string& message)
        : ConfigurationError("random source: " + message) {}
};

/**
 * @brief libsodium / liboqs primitive failure
 */
class CryptoError : public SentinelError {
public:
    CryptoError(const std::string& function_name, const std::string& detail = "")
        : SentinelError(function_name + " failed" +
                        (detail.empty() ? std::string() : ": " + detail)) {}
};

} // namespace core
} // namespace sentinel
