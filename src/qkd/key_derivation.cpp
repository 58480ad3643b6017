#include "key_derivation.hpp"
#include "../core/errors.hpp"
#include <sodium.h>

namespace sentinel {
namespace qkd {

core::SecretBytes hkdf_sha256(const std::vector<uint8_t>& salt,
                              const core::SecretBytes& ikm,
                              const std::string& info,
                              size_t length) {
    if (length == 0 || length > crypto_kdf_hkdf_sha256_BYTES_MAX) {
        throw core::ConfigurationError("HKDF output length must be within [1, " +
                                       std::to_string(crypto_kdf_hkdf_sha256_BYTES_MAX) +
                                       "], got " + std::to_string(length));
    }
    core::ensure_sodium();

    core::SecretBytes prk(crypto_kdf_hkdf_sha256_KEYBYTES);
    if (crypto_kdf_hkdf_sha256_extract(prk.data(),
                                       salt.empty() ? nullptr : salt.data(), salt.size(),
                                       ikm.data(), ikm.size()) != 0) {
        throw core::CryptoError("crypto_kdf_hkdf_sha256_extract");
    }

    core::SecretBytes okm(length);
    if (crypto_kdf_hkdf_sha256_expand(okm.data(), okm.size(),
                                      info.data(), info.size(),
                                      prk.data()) != 0) {
        throw core::CryptoError("crypto_kdf_hkdf_sha256_expand");
    }

    return okm;
}

core::SecretBytes derive(const core::SecretBytes& raw_secret, const std::string& label) {
    if (raw_secret.empty()) {
        throw core::ConfigurationError("cannot derive a session key from an empty raw secret");
    }
    return hkdf_sha256({}, raw_secret, label, SESSION_KEY_BYTES);
}

core::SecretBytes derive_hybrid(const core::SecretBytes& raw_secret,
                                const core::SecretBytes& extra_material,
                                const std::string& label) {
    if (raw_secret.empty() || extra_material.empty()) {
        throw core::ConfigurationError("hybrid derivation needs both BB84 and PQC material");
    }

    core::SecretBytes ikm;
    ikm.append(raw_secret.data(), raw_secret.size());
    ikm.append(extra_material.data(), extra_material.size());

    return hkdf_sha256({}, ikm, label, SESSION_KEY_BYTES);
}

} // namespace qkd
} // namespace sentinel
