#include "key_manager.hpp"
#include "../core/errors.hpp"
#include "../qkd/key_derivation.hpp"

#include <cstdio>

namespace sentinel {
namespace kms {

namespace {

constexpr const char* AUDIT_CATEGORY = "KMS";

std::string percent(double qber) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f%%", qber * 100.0);
    return buf;
}

} // namespace

void KeyManagerConfig::validate() const {
    channel.validate();
    if (label.empty() || hybrid_label.empty()) {
        throw core::ConfigurationError("derivation labels must not be empty");
    }
    if (label == hybrid_label) {
        throw core::ConfigurationError("BB84 and hybrid derivation labels must differ");
    }
}

const char* rejection_reason_to_string(RejectionReason reason) {
    switch (reason) {
        case RejectionReason::SECURITY_THRESHOLD: return "SECURITY_THRESHOLD";
        case RejectionReason::INSUFFICIENT_KEY_MATERIAL: return "INSUFFICIENT_KEY_MATERIAL";
    }
    return "UNKNOWN";
}

double SessionKeyResult::qber() const {
    return ok() ? issued().qber : rejection().qber;
}

LinkStatus SessionKeyResult::status() const {
    return ok() ? issued().status : rejection().status;
}

KeyManager::KeyManager(KeyManagerConfig config,
                       qkd::RandomSourceFactory random_factory,
                       std::shared_ptr<pqc::PqcMaterialSource> pqc_source,
                       security::AuditLoggerPtr audit)
    : config_(std::move(config)),
      simulator_(config_.channel),
      random_factory_(std::move(random_factory)),
      pqc_source_(std::move(pqc_source)),
      audit_(std::move(audit)),
      tracker_(config_.channel.safe_threshold, config_.channel.security_threshold) {
    config_.validate();
    if (!random_factory_) {
        throw core::RandomSourceError("no random source factory configured");
    }
}

std::unique_ptr<qkd::RandomSource> KeyManager::make_random_source() const {
    std::unique_ptr<qkd::RandomSource> rng = random_factory_();
    if (!rng) {
        throw core::RandomSourceError("factory returned no source");
    }
    return rng;
}

std::optional<qkd::SimulationResult>
KeyManager::run_simulation(bool eavesdropper,
                           qkd::RandomSource& rng,
                           size_t& last_available) const {
    last_available = 0;
    for (size_t attempt = 0; attempt <= config_.material_retry_limit; ++attempt) {
        try {
            return simulator_.run(eavesdropper, rng);
        } catch (const core::InsufficientKeyMaterialError& e) {
            last_available = e.available_bits();
            audit(security::AuditSeverity::DEBUG, "SIMULATION_SHORT", "", "RETRY",
                  "attempt " + std::to_string(attempt + 1) + ": " + e.what());
        }
    }
    return std::nullopt;
}

std::optional<SessionKeyResult>
KeyManager::try_paired_issue(const std::string& device_id, bool hybrid) {
    IssuedKey issued;
    std::string owner;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (forced_attack_.load() || tracker_.status() == LinkStatus::RED) {
            return std::nullopt;
        }
        owner = pairing_.owner();
        SessionKeyPtr key = pairing_.claim(device_id, hybrid);
        if (!key) {
            return std::nullopt;
        }

        SessionRecord record;
        record.device_id = device_id;
        record.key = key;
        record.issued_at = std::chrono::system_clock::now();
        record.qber = tracker_.last_qber();
        record.hybrid = hybrid;
        record.paired = true;
        sessions_.put(std::move(record));

        tracker_.record_issued();
        tracker_.set_active_sessions(sessions_.size());
        tracker_.publish();

        issued.key = std::move(key);
        issued.qber = tracker_.last_qber();
        issued.status = tracker_.status();
        issued.hybrid = hybrid;
        issued.paired = true;
    }

    audit(security::AuditSeverity::INFO, "PAIRED_KEY_ISSUED", device_id, "SUCCESS",
          "paired with " + owner + ", key fp " + issued.key->fingerprint(), issued.qber);
    return SessionKeyResult(std::move(issued));
}

SessionKeyResult KeyManager::get_fresh_key(const std::string& device_id,
                                           bool force_eavesdropper,
                                           bool hybrid) {
    if (device_id.empty()) {
        throw core::ConfigurationError("device_id must not be empty");
    }
    if (hybrid && !pqc_source_) {
        throw core::ConfigurationError("hybrid mode requires PQC support (built without liboqs)");
    }

    const bool eavesdropper = force_eavesdropper || forced_attack_.load();

    if (config_.enable_demo_pairing && !eavesdropper) {
        if (auto paired = try_paired_issue(device_id, hybrid)) {
            return std::move(*paired);
        }
    }

    // Simulation and derivation run outside the bookkeeping lock
    std::unique_ptr<qkd::RandomSource> rng = make_random_source();
    size_t available = 0;
    std::optional<qkd::SimulationResult> sim = run_simulation(eavesdropper, *rng, available);

    if (!sim) {
        Rejection rejection;
        rejection.reason = RejectionReason::INSUFFICIENT_KEY_MATERIAL;
        rejection.retryable = true;
        rejection.message = "simulation retained " + std::to_string(available) + " of " +
                            std::to_string(config_.channel.raw_secret_bits) + " bits after " +
                            std::to_string(config_.material_retry_limit + 1) + " attempts";
        {
            // Link health is untouched, but the pairing epoch ends
            std::lock_guard<std::mutex> lock(mutex_);
            pairing_.close();
            rejection.qber = tracker_.last_qber();
            rejection.status = tracker_.status();
        }

        audit(security::AuditSeverity::WARNING, "INSUFFICIENT_MATERIAL", device_id, "REJECTED",
              rejection.message);
        return SessionKeyResult(std::move(rejection));
    }

    const LinkStatus attempt_status = classify(sim->qber, sim->eavesdropper_detected,
                                               config_.channel.safe_threshold,
                                               config_.channel.security_threshold);

    SessionKeyPtr key;
    if (attempt_status != LinkStatus::RED) {
        if (hybrid) {
            core::SecretBytes pqc_secret = pqc_source_->shared_secret();
            key = std::make_shared<const SessionKey>(
                qkd::derive_hybrid(sim->raw_secret, pqc_secret, config_.hybrid_label));
        } else {
            key = std::make_shared<const SessionKey>(
                qkd::derive(sim->raw_secret, config_.label));
        }
    }

    LinkStatus status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status = tracker_.record_attempt(sim->qber, sim->eavesdropper_detected);

        if (status == LinkStatus::RED) {
            tracker_.record_attack();
            pairing_.close();
        } else {
            SessionRecord record;
            record.device_id = device_id;
            record.key = key;
            record.issued_at = std::chrono::system_clock::now();
            record.qber = sim->qber;
            record.hybrid = hybrid;
            sessions_.put(std::move(record));

            tracker_.record_issued();
            tracker_.set_active_sessions(sessions_.size());

            if (config_.enable_demo_pairing) {
                pairing_.open(device_id, key, hybrid);
            }
        }
        tracker_.publish();
    }

    if (status == LinkStatus::RED) {
        Rejection rejection;
        rejection.reason = RejectionReason::SECURITY_THRESHOLD;
        rejection.qber = sim->qber;
        rejection.status = status;
        rejection.retryable = false;
        rejection.message = "QBER " + percent(sim->qber) + " exceeds security threshold " +
                            percent(config_.channel.security_threshold);

        audit(security::AuditSeverity::SECURITY, "EAVESDROPPER_DETECTED", device_id, "REJECTED",
              rejection.message, sim->qber);
        return SessionKeyResult(std::move(rejection));
    }

    audit(security::AuditSeverity::INFO, "KEY_ISSUED", device_id, "SUCCESS",
          std::string(hybrid ? "hybrid " : "") + "key fp " + key->fingerprint() +
              ", status " + link_status_to_string(status),
          sim->qber);

    IssuedKey issued;
    issued.key = std::move(key);
    issued.qber = sim->qber;
    issued.status = status;
    issued.hybrid = hybrid;
    issued.paired = false;
    return SessionKeyResult(std::move(issued));
}

LinkHealthSnapshot KeyManager::check_link_health() const {
    return *tracker_.snapshot();
}

void KeyManager::reset_for_demo() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        forced_attack_.store(false);
        tracker_.reset();
        sessions_.clear();
        pairing_.close();
        tracker_.publish();
    }
    audit(security::AuditSeverity::NOTICE, "RESET", "", "SUCCESS",
          "link health, sessions and forced attack cleared");
}

void KeyManager::force_attack() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        forced_attack_.store(true);
        pairing_.close();
        tracker_.set_attack_forced(true);
        tracker_.publish();
    }
    audit(security::AuditSeverity::WARNING, "FORCE_ATTACK", "", "ARMED",
          "subsequent simulations include an eavesdropper");
}

void KeyManager::clear_forced_attack() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        forced_attack_.store(false);
        tracker_.set_attack_forced(false);
        tracker_.publish();
    }
    audit(security::AuditSeverity::NOTICE, "FORCE_ATTACK", "", "CLEARED", "");
}

LinkProbeResult KeyManager::probe_link() {
    const bool eavesdropper = forced_attack_.load();

    std::unique_ptr<qkd::RandomSource> rng = make_random_source();
    size_t available = 0;
    std::optional<qkd::SimulationResult> sim = run_simulation(eavesdropper, *rng, available);
    if (!sim) {
        throw core::InsufficientKeyMaterialError(available, config_.channel.raw_secret_bits);
    }

    LinkProbeResult probe;
    probe.qber = sim->qber;
    probe.eavesdropper_detected = sim->eavesdropper_detected;
    probe.attack_forced = eavesdropper;
    probe.sifted_bits = sim->sifted_bits;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        probe.status = tracker_.record_attempt(sim->qber, sim->eavesdropper_detected);
        if (probe.status == LinkStatus::RED) {
            tracker_.record_attack();
            pairing_.close();
        }
        tracker_.publish();
    }

    audit(probe.status == LinkStatus::RED ? security::AuditSeverity::SECURITY
                                          : security::AuditSeverity::INFO,
          "PROBE", "", link_status_to_string(probe.status),
          eavesdropper ? "forced eavesdropper" : "clean channel", probe.qber);
    return probe;
}

bool KeyManager::invalidate_session(const std::string& device_id) {
    bool removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = sessions_.erase(device_id);
        if (removed) {
            if (pairing_.is_open() && pairing_.owner() == device_id) {
                pairing_.close();
            }
            tracker_.set_active_sessions(sessions_.size());
            tracker_.publish();
        }
    }
    audit(security::AuditSeverity::INFO, "SESSION_INVALIDATED", device_id,
          removed ? "SUCCESS" : "NOT_FOUND", "");
    return removed;
}

std::optional<SessionInfo> KeyManager::find_session(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.info(device_id);
}

void KeyManager::audit(security::AuditSeverity severity,
                       const std::string& action,
                       const std::string& subject,
                       const std::string& result,
                       const std::string& message,
                       std::optional<double> qber) const {
    if (audit_) {
        audit_->log(severity, AUDIT_CATEGORY, action, subject, result, message, qber);
    }
}

} // namespace kms
} // namespace sentinel
