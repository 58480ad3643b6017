/**
 * @file pqc_material.hpp
 * @brief Post-quantum keying material for hybrid session keys
 *
 * Hybrid mode mixes a BB84 raw secret with an ML-KEM-1024 shared secret
 * before derivation, so a session key stays secret as long as either
 * source does.
 *
 * ML-KEM-1024 (FIPS 203, NIST Level 5) sizes:
 * - Public key: 1,568 bytes
 * - Secret key: 3,168 bytes
 * - Ciphertext: 1,568 bytes
 * - Shared secret: 32 bytes
 */

#pragma once

#include "../core/secure_memory.hpp"
#include <memory>
#include <string>

namespace sentinel {
namespace pqc {

/**
 * @brief Supplier of additional keying material for hybrid derivation
 *
 * Implementations must be safe to call from several threads at once.
 */
class PqcMaterialSource {
public:
    virtual ~PqcMaterialSource() = default;

    /**
     * @brief Produce a fresh shared secret
     * @throws core::CryptoError on primitive failure
     */
    virtual core::SecretBytes shared_secret() = 0;

    virtual std::string algorithm_name() const = 0;
};

/**
 * @brief True when the build links liboqs (ENABLE_PQC=ON)
 */
bool pqc_available();

/**
 * @brief ML-KEM-1024 source when PQC is compiled in, otherwise nullptr
 */
std::shared_ptr<PqcMaterialSource> make_default_pqc_source();

} // namespace pqc
} // namespace sentinel

#ifdef SENTINEL_ENABLE_PQC
#include <oqs/oqs.h>

namespace sentinel {
namespace pqc {

/**
 * @brief ML-KEM-1024 material via liboqs
 *
 * Each call runs one full KEM round (keypair, encapsulate, decapsulate)
 * and checks that both sides agree before releasing the secret.
 */
class MlKemMaterialSource : public PqcMaterialSource {
public:
    static constexpr const char* ALGORITHM_NAME = "ML-KEM-1024";
    static constexpr size_t PUBLIC_KEY_BYTES = 1568;
    static constexpr size_t SECRET_KEY_BYTES = 3168;
    static constexpr size_t CIPHERTEXT_BYTES = 1568;
    static constexpr size_t SHARED_SECRET_BYTES = 32;

    /**
     * @throws core::CryptoError if liboqs lacks ML-KEM-1024 or reports
     *         sizes that differ from FIPS 203
     */
    MlKemMaterialSource();
    ~MlKemMaterialSource() override = default;

    core::SecretBytes shared_secret() override;

    std::string algorithm_name() const override { return ALGORITHM_NAME; }

private:
    /**
     * @brief RAII deleter for OQS_KEM
     */
    struct OQSKEMDeleter {
        void operator()(OQS_KEM* kem) {
            if (kem) {
                OQS_KEM_free(kem);
            }
        }
    };

    std::unique_ptr<OQS_KEM, OQSKEMDeleter> kem_;
};

} // namespace pqc
} // namespace sentinel

#endif // SENTINEL_ENABLE_PQC
