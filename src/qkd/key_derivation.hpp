#pragma once

#include "../core/secure_memory.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sentinel {
namespace qkd {

/// Session key length (256 bits)
constexpr size_t SESSION_KEY_BYTES = 32;

/**
 * @brief HKDF-SHA256 (RFC 5869) extract-then-expand
 *
 * @param salt Extract salt; empty means the RFC default (HashLen zero bytes)
 * @param ikm Input keying material
 * @param info Context string passed to expand
 * @param length Output length, at most 255 * 32 bytes
 *
 * @throws core::ConfigurationError if length is zero or too large
 * @throws core::CryptoError if libsodium reports a failure
 */
core::SecretBytes hkdf_sha256(const std::vector<uint8_t>& salt,
                              const core::SecretBytes& ikm,
                              const std::string& info,
                              size_t length);

/**
 * @brief Derive a 32-byte session key from a BB84 raw secret
 *
 * Deterministic in (raw_secret, label). The label is the HKDF info string,
 * so different labels give independent keys for the same secret.
 *
 * @throws core::ConfigurationError if raw_secret is empty
 */
core::SecretBytes derive(const core::SecretBytes& raw_secret, const std::string& label);

/**
 * @brief Derive from raw_secret || extra_material
 *
 * Used by hybrid mode, where extra_material is an ML-KEM shared secret.
 *
 * @throws core::ConfigurationError if either input is empty
 */
core::SecretBytes derive_hybrid(const core::SecretBytes& raw_secret,
                                const core::SecretBytes& extra_material,
                                const std::string& label);

} // namespace qkd
} // namespace sentinel
