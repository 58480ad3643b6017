#include "link_health.hpp"
#include "../core/errors.hpp"
#include <atomic>

namespace sentinel {
namespace kms {

const char* link_status_to_string(LinkStatus status) {
    switch (status) {
        case LinkStatus::GREEN: return "GREEN";
        case LinkStatus::YELLOW: return "YELLOW";
        case LinkStatus::RED: return "RED";
    }
    return "UNKNOWN";
}

LinkStatus classify(double qber, bool eavesdropper_detected,
                    double safe_threshold, double security_threshold) {
    if (eavesdropper_detected || qber >= security_threshold) {
        return LinkStatus::RED;
    }
    if (qber >= safe_threshold) {
        return LinkStatus::YELLOW;
    }
    return LinkStatus::GREEN;
}

LinkHealthTracker::LinkHealthTracker(double safe_threshold, double security_threshold)
    : safe_threshold_(safe_threshold),
      security_threshold_(security_threshold) {
    qkd::require_unit_interval("safe_threshold", safe_threshold);
    qkd::require_unit_interval("security_threshold", security_threshold);
    if (!(safe_threshold < security_threshold)) {
        throw core::ConfigurationError("safe_threshold must be below security_threshold");
    }
    publish();
}

LinkStatus LinkHealthTracker::record_attempt(double qber, bool eavesdropper_detected) {
    last_qber_ = qber;
    status_ = classify(qber, eavesdropper_detected, safe_threshold_, security_threshold_);
    return status_;
}

void LinkHealthTracker::reset() {
    status_ = LinkStatus::GREEN;
    last_qber_ = 0.0;
    keys_issued_ = 0;
    attacks_detected_ = 0;
    active_sessions_ = 0;
    attack_forced_ = false;
}

void LinkHealthTracker::publish() {
    auto snap = std::make_shared<LinkHealthSnapshot>();
    snap->status = status_;
    snap->last_qber = last_qber_;
    snap->keys_issued = keys_issued_;
    snap->attacks_detected = attacks_detected_;
    snap->active_sessions = active_sessions_;
    snap->attack_forced = attack_forced_;
    snap->updated_at = std::chrono::system_clock::now();

    std::atomic_store(&published_, std::shared_ptr<const LinkHealthSnapshot>(std::move(snap)));
}

std::shared_ptr<const LinkHealthSnapshot> LinkHealthTracker::snapshot() const {
    return std::atomic_load(&published_);
}

} // namespace kms
} // namespace sentinel
