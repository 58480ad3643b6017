#include "link_enforcement_agent.hpp"
#include "../core/errors.hpp"

namespace sentinel {
namespace enforcement {

namespace {

constexpr const char* AUDIT_CATEGORY = "ENFORCEMENT";

} // namespace

const char* firewall_action_to_string(FirewallAction action) {
    switch (action) {
        case FirewallAction::ALLOW: return "ALLOW";
        case FirewallAction::BLOCK: return "BLOCK";
    }
    return "UNKNOWN";
}

void RecordingFirewallBackend::block() {
    ++block_calls_;
    blocked_.store(true);
    if (audit_) {
        audit_->log(security::AuditSeverity::WARNING, AUDIT_CATEGORY, "FIREWALL_BLOCK",
                    "firewall", "APPLIED", "secure link traffic blocked");
    }
}

void RecordingFirewallBackend::allow() {
    ++allow_calls_;
    blocked_.store(false);
    if (audit_) {
        audit_->log(security::AuditSeverity::NOTICE, AUDIT_CATEGORY, "FIREWALL_ALLOW",
                    "firewall", "APPLIED", "secure link traffic allowed");
    }
}

HealthSource key_manager_health_source(const kms::KeyManager& manager) {
    return [&manager] { return manager.check_link_health(); };
}

LinkEnforcementAgent::LinkEnforcementAgent(HealthSource source,
                                           std::shared_ptr<FirewallBackend> backend,
                                           AgentConfig config,
                                           security::AuditLoggerPtr audit)
    : source_(std::move(source)),
      backend_(std::move(backend)),
      config_(config),
      audit_(std::move(audit)) {
    if (!source_) {
        throw core::ConfigurationError("enforcement agent needs a health source");
    }
    if (!backend_) {
        throw core::ConfigurationError("enforcement agent needs a firewall backend");
    }
    if (config_.poll_interval.count() <= 0) {
        throw core::ConfigurationError("poll_interval must be positive");
    }
}

LinkEnforcementAgent::~LinkEnforcementAgent() {
    stop();
}

PollOutcome LinkEnforcementAgent::poll_once() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++polls_;

    PollOutcome outcome;
    try {
        outcome.observed = source_().status;
    } catch (const std::exception& e) {
        audit(security::AuditSeverity::ERROR, "HEALTH_QUERY", "UNKNOWN",
              std::string("link health unavailable: ") + e.what());
    }

    if (outcome.observed) {
        outcome.desired = (*outcome.observed == kms::LinkStatus::RED) ? FirewallAction::BLOCK
                                                                      : FirewallAction::ALLOW;
    } else if (config_.unreachable_policy == UnreachablePolicy::BLOCK) {
        outcome.desired = FirewallAction::BLOCK;
    } else {
        outcome.desired = last_applied_;
    }

    if (!outcome.desired || outcome.desired == last_applied_) {
        return outcome;
    }

    try {
        if (*outcome.desired == FirewallAction::BLOCK) {
            backend_->block();
        } else {
            backend_->allow();
        }
    } catch (const std::exception& e) {
        outcome.backend_failed = true;
        audit(security::AuditSeverity::ERROR, firewall_action_to_string(*outcome.desired),
              "FAILURE", std::string("firewall backend: ") + e.what());
        return outcome;
    }

    std::string from = last_applied_ ? firewall_action_to_string(*last_applied_) : "NONE";
    last_applied_ = outcome.desired;
    outcome.applied = true;

    audit(*outcome.desired == FirewallAction::BLOCK ? security::AuditSeverity::SECURITY
                                                    : security::AuditSeverity::NOTICE,
          firewall_action_to_string(*outcome.desired), "APPLIED",
          "transition " + from + " -> " + firewall_action_to_string(*outcome.desired) +
              " (link " +
              (outcome.observed ? kms::link_status_to_string(*outcome.observed) : "UNKNOWN") +
              ")");
    return outcome;
}

void LinkEnforcementAgent::start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread(&LinkEnforcementAgent::run_loop, this);
}

void LinkEnforcementAgent::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_.exchange(false)) {
            // Not running; still reap a finished worker
            if (worker_.joinable()) {
                worker_.join();
            }
            return;
        }
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::optional<FirewallAction> LinkEnforcementAgent::last_applied() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_applied_;
}

void LinkEnforcementAgent::run_loop() {
    while (running_.load()) {
        poll_once();

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_.wait_for(lock, config_.poll_interval, [this] { return !running_.load(); });
    }
}

void LinkEnforcementAgent::audit(security::AuditSeverity severity,
                                 const std::string& action,
                                 const std::string& result,
                                 const std::string& message) const {
    if (audit_) {
        audit_->log(severity, AUDIT_CATEGORY, action, "link-enforcement", result, message);
    }
}

} // namespace enforcement
} // namespace sentinel
