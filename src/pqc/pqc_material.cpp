#include "pqc_material.hpp"
#include "../core/errors.hpp"
#include <vector>

namespace sentinel {
namespace pqc {

#ifdef SENTINEL_ENABLE_PQC

MlKemMaterialSource::MlKemMaterialSource() {
    kem_.reset(OQS_KEM_new(OQS_KEM_alg_ml_kem_1024));
    if (!kem_) {
        throw core::CryptoError("OQS_KEM_new", "ML-KEM-1024 not enabled in liboqs");
    }

    // Verify algorithm parameters match FIPS 203
    if (kem_->length_public_key != PUBLIC_KEY_BYTES ||
        kem_->length_secret_key != SECRET_KEY_BYTES ||
        kem_->length_ciphertext != CIPHERTEXT_BYTES ||
        kem_->length_shared_secret != SHARED_SECRET_BYTES) {
        throw core::CryptoError("OQS_KEM_new",
                                "ML-KEM-1024 size mismatch with FIPS 203 "
                                "(expected pk=1568, sk=3168, ct=1568, ss=32 bytes)");
    }
}

core::SecretBytes MlKemMaterialSource::shared_secret() {
    std::vector<uint8_t> public_key(PUBLIC_KEY_BYTES);
    core::SecretBytes secret_key(SECRET_KEY_BYTES);
    std::vector<uint8_t> ciphertext(CIPHERTEXT_BYTES);
    core::SecretBytes sender_secret(SHARED_SECRET_BYTES);
    core::SecretBytes receiver_secret(SHARED_SECRET_BYTES);

    if (OQS_KEM_keypair(kem_.get(), public_key.data(), secret_key.data()) != OQS_SUCCESS) {
        throw core::CryptoError("OQS_KEM_keypair", ALGORITHM_NAME);
    }

    if (OQS_KEM_encaps(kem_.get(), ciphertext.data(), sender_secret.data(),
                       public_key.data()) != OQS_SUCCESS) {
        throw core::CryptoError("OQS_KEM_encaps", ALGORITHM_NAME);
    }

    if (OQS_KEM_decaps(kem_.get(), receiver_secret.data(), ciphertext.data(),
                       secret_key.data()) != OQS_SUCCESS) {
        throw core::CryptoError("OQS_KEM_decaps", ALGORITHM_NAME);
    }

    if (!sender_secret.equals(receiver_secret)) {
        throw core::CryptoError("ML-KEM-1024 self-check", "shared secrets differ");
    }

    return sender_secret;
}

bool pqc_available() {
    return true;
}

std::shared_ptr<PqcMaterialSource> make_default_pqc_source() {
    return std::make_shared<MlKemMaterialSource>();
}

#else

bool pqc_available() {
    return false;
}

std::shared_ptr<PqcMaterialSource> make_default_pqc_source() {
    return nullptr;
}

#endif // SENTINEL_ENABLE_PQC

} // namespace pqc
} // namespace sentinel
