/**
 * @file key_manager.hpp
 * @brief QBER-gated session key issuance and link health bookkeeping
 *
 * Each request runs its own BB84 simulation outside the bookkeeping lock;
 * only the commit (link health, session table, pairing window) is a
 * critical section. Link health readers never take that lock: every commit
 * publishes an immutable snapshot which check_link_health() loads atomically.
 */

#pragma once

#include "link_health.hpp"
#include "session_registry.hpp"
#include "../qkd/bb84_simulator.hpp"
#include "../qkd/qkd_config.hpp"
#include "../qkd/random_source.hpp"
#include "../pqc/pqc_material.hpp"
#include "../security/audit_logger.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace sentinel {
namespace kms {

/**
 * @brief Key manager configuration
 */
struct KeyManagerConfig {
    qkd::ChannelConfig channel;

    /// Extra simulation runs allowed when a run yields too few bits
    size_t material_retry_limit = 2;

    /// Let a second device receive the key of the last accepted issuance
    bool enable_demo_pairing = false;

    std::string label = SENTINEL_LABEL_BB84;
    std::string hybrid_label = SENTINEL_LABEL_HYBRID;

    /**
     * @throws core::ConfigurationError
     */
    void validate() const;
};

enum class RejectionReason {
    SECURITY_THRESHOLD,         ///< Attempt classified RED
    INSUFFICIENT_KEY_MATERIAL   ///< Retry budget exhausted; link health untouched
};

const char* rejection_reason_to_string(RejectionReason reason);

struct IssuedKey {
    SessionKeyPtr key;
    double qber = 0.0;
    LinkStatus status = LinkStatus::GREEN;
    bool hybrid = false;
    bool paired = false;
};

struct Rejection {
    RejectionReason reason = RejectionReason::SECURITY_THRESHOLD;
    double qber = 0.0;
    LinkStatus status = LinkStatus::RED;
    bool retryable = false;
    std::string message;
};

/**
 * @brief Outcome of a key request: either an issued key or a rejection
 */
class SessionKeyResult {
public:
    SessionKeyResult(IssuedKey issued) : value_(std::move(issued)) {}
    SessionKeyResult(Rejection rejection) : value_(std::move(rejection)) {}

    bool ok() const { return std::holds_alternative<IssuedKey>(value_); }
    explicit operator bool() const { return ok(); }

    /// @throws std::bad_variant_access if the request was rejected
    const IssuedKey& issued() const { return std::get<IssuedKey>(value_); }

    /// @throws std::bad_variant_access if a key was issued
    const Rejection& rejection() const { return std::get<Rejection>(value_); }

    double qber() const;
    LinkStatus status() const;

private:
    std::variant<IssuedKey, Rejection> value_;
};

/**
 * @brief Result of an operator link probe
 */
struct LinkProbeResult {
    double qber = 0.0;
    bool eavesdropper_detected = false;
    bool attack_forced = false;
    LinkStatus status = LinkStatus::GREEN;
    size_t sifted_bits = 0;
};

/**
 * @brief Key management service
 *
 * Thread-safe. One instance owns the process-wide link health record.
 */
class KeyManager {
public:
    /**
     * @param config Validated on construction
     * @param random_factory Supplies one RandomSource per simulation run
     * @param pqc_source ML-KEM material for hybrid requests; nullptr
     *        disables hybrid mode
     * @param audit Optional audit trail
     *
     * @throws core::ConfigurationError on invalid configuration
     */
    explicit KeyManager(KeyManagerConfig config = KeyManagerConfig{},
                        qkd::RandomSourceFactory random_factory = qkd::sodium_random_factory(),
                        std::shared_ptr<pqc::PqcMaterialSource> pqc_source = nullptr,
                        security::AuditLoggerPtr audit = nullptr);

    KeyManager(const KeyManager&) = delete;
    KeyManager& operator=(const KeyManager&) = delete;

    /**
     * @brief Request a session key for a device
     *
     * Runs a simulation with an eavesdropper when force_eavesdropper is set
     * or an operator forced attack is armed. An attempt classified RED is
     * rejected and counted as a detected attack; otherwise a key is derived,
     * recorded for the device and returned.
     *
     * @throws core::ConfigurationError for an empty device id, or a hybrid
     *         request without PQC support
     * @throws core::RandomSourceError if the random source fails
     * @throws core::CryptoError on derivation or ML-KEM failure
     */
    SessionKeyResult get_fresh_key(const std::string& device_id,
                                   bool force_eavesdropper = false,
                                   bool hybrid = false);

    /**
     * @brief Last committed link health; never blocks on issuance
     */
    LinkHealthSnapshot check_link_health() const;

    /**
     * @brief Clear link health, sessions, pairing and forced attack
     */
    void reset_for_demo();

    /// Arm the operator forced attack; closes any pairing epoch
    void force_attack();
    void clear_forced_attack();
    bool attack_forced() const { return forced_attack_.load(); }

    /**
     * @brief Run one simulation and commit its QBER without issuing a key
     *
     * A RED probe counts as a detected attack.
     *
     * @throws core::InsufficientKeyMaterialError if every attempt came up short
     */
    LinkProbeResult probe_link();

    /**
     * @brief Remove a device's session
     * @return true if a session existed
     */
    bool invalidate_session(const std::string& device_id);

    std::optional<SessionInfo> find_session(const std::string& device_id) const;

    bool hybrid_available() const { return static_cast<bool>(pqc_source_); }
    const KeyManagerConfig& config() const { return config_; }

private:
    std::unique_ptr<qkd::RandomSource> make_random_source() const;

    /**
     * @brief Simulate, retrying on insufficient material
     * @param last_available Retained bits of the last short attempt
     * @return nullopt once the retry budget is spent
     */
    std::optional<qkd::SimulationResult> run_simulation(bool eavesdropper,
                                                        qkd::RandomSource& rng,
                                                        size_t& last_available) const;

    std::optional<SessionKeyResult> try_paired_issue(const std::string& device_id, bool hybrid);

    void audit(security::AuditSeverity severity,
               const std::string& action,
               const std::string& subject,
               const std::string& result,
               const std::string& message,
               std::optional<double> qber = std::nullopt) const;

    KeyManagerConfig config_;
    qkd::QuantumChannelSimulator simulator_;
    qkd::RandomSourceFactory random_factory_;
    std::shared_ptr<pqc::PqcMaterialSource> pqc_source_;
    security::AuditLoggerPtr audit_;

    std::atomic<bool> forced_attack_{false};

    // Guards everything below
    mutable std::mutex mutex_;
    LinkHealthTracker tracker_;
    SessionRegistry sessions_;
    KeyPairing pairing_;
};

} // namespace kms
} // namespace sentinel
