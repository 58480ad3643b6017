#pragma once

#include "../qkd/qkd_config.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace sentinel {
namespace kms {

/**
 * @brief Graded trust signal derived from the latest QBER
 */
enum class LinkStatus {
    GREEN,      ///< QBER below the safe threshold
    YELLOW,     ///< Safe threshold <= QBER < security threshold
    RED         ///< QBER at or above the security threshold, or detection flagged
};

const char* link_status_to_string(LinkStatus status);

/**
 * @brief Pure classifier over a single QBER observation
 *
 * No hysteresis: the result depends only on the arguments.
 */
LinkStatus classify(double qber,
                    bool eavesdropper_detected = false,
                    double safe_threshold = SENTINEL_QBER_SAFE_THRESHOLD,
                    double security_threshold = SENTINEL_QBER_SECURITY_THRESHOLD);

/**
 * @brief Immutable, consistent view of the link health record
 */
struct LinkHealthSnapshot {
    LinkStatus status = LinkStatus::GREEN;
    double last_qber = 0.0;
    uint64_t keys_issued = 0;
    uint64_t attacks_detected = 0;
    size_t active_sessions = 0;
    bool attack_forced = false;
    std::chrono::system_clock::time_point updated_at;
};

/**
 * @brief Process-wide link health record
 *
 * Mutators are not synchronised: the owning KeyManager calls them under its
 * bookkeeping lock and then publish()es. snapshot() is safe from any thread
 * and returns the last published state without taking that lock.
 */
class LinkHealthTracker {
public:
    /**
     * @throws core::ConfigurationError unless 0 <= safe < security <= 1
     */
    LinkHealthTracker(double safe_threshold, double security_threshold);

    /**
     * @brief Record an attempt's QBER and recompute status from scratch
     * @return the status of this attempt
     */
    LinkStatus record_attempt(double qber, bool eavesdropper_detected);

    void record_issued() { ++keys_issued_; }
    void record_attack() { ++attacks_detected_; }
    void set_active_sessions(size_t count) { active_sessions_ = count; }
    void set_attack_forced(bool forced) { attack_forced_ = forced; }

    /// Back to baseline: GREEN, QBER 0, counters 0, no forced attack
    void reset();

    /// Make the current record visible to snapshot()
    void publish();

    std::shared_ptr<const LinkHealthSnapshot> snapshot() const;

    LinkStatus status() const { return status_; }
    double last_qber() const { return last_qber_; }
    double safe_threshold() const { return safe_threshold_; }
    double security_threshold() const { return security_threshold_; }

private:
    double safe_threshold_;
    double security_threshold_;

    LinkStatus status_ = LinkStatus::GREEN;
    double last_qber_ = 0.0;
    uint64_t keys_issued_ = 0;
    uint64_t attacks_detected_ = 0;
    size_t active_sessions_ = 0;
    bool attack_forced_ = false;

    std::shared_ptr<const LinkHealthSnapshot> published_;
};

} // namespace kms
} // namespace sentinel
