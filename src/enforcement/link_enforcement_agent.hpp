/**
 * @file link_enforcement_agent.hpp
 * @brief Pull-based consumer of link health that drives a network block
 *
 * The agent polls a health source on a fixed interval and translates status
 * into a firewall state: RED blocks, GREEN and YELLOW allow. It remembers
 * the last state it applied and only acts on transitions, so redundant
 * polls issue no backend calls. Packet-filter commands themselves live
 * behind FirewallBackend.
 */

#pragma once

#include "../kms/key_manager.hpp"
#include "../kms/link_health.hpp"
#include "../security/audit_logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace sentinel {
namespace enforcement {

enum class FirewallAction {
    ALLOW,
    BLOCK
};

const char* firewall_action_to_string(FirewallAction action);

/**
 * @brief What to do when the health query fails
 */
enum class UnreachablePolicy {
    BLOCK,              ///< Fail closed
    KEEP_LAST_KNOWN     ///< Leave the last applied state in place
};

/**
 * @brief Mutates the packet filter
 *
 * Both calls must be idempotent. Failures are reported by throwing.
 */
class FirewallBackend {
public:
    virtual ~FirewallBackend() = default;
    virtual void block() = 0;
    virtual void allow() = 0;
};

/**
 * @brief Backend that only records the requested state
 *
 * Used by the command-line demo and tests in place of real packet-filter
 * rules.
 */
class RecordingFirewallBackend : public FirewallBackend {
public:
    explicit RecordingFirewallBackend(security::AuditLoggerPtr audit = nullptr)
        : audit_(std::move(audit)) {}

    void block() override;
    void allow() override;

    bool blocked() const { return blocked_.load(); }
    uint64_t block_calls() const { return block_calls_.load(); }
    uint64_t allow_calls() const { return allow_calls_.load(); }

private:
    security::AuditLoggerPtr audit_;
    std::atomic<bool> blocked_{false};
    std::atomic<uint64_t> block_calls_{0};
    std::atomic<uint64_t> allow_calls_{0};
};

using HealthSource = std::function<kms::LinkHealthSnapshot()>;

/// Health source reading a KeyManager in-process
HealthSource key_manager_health_source(const kms::KeyManager& manager);

struct AgentConfig {
    std::chrono::milliseconds poll_interval{3000};
    UnreachablePolicy unreachable_policy = UnreachablePolicy::BLOCK;
};

/**
 * @brief Result of one poll
 */
struct PollOutcome {
    std::optional<kms::LinkStatus> observed;    ///< nullopt when the query failed
    std::optional<FirewallAction> desired;      ///< nullopt when nothing is known yet
    bool applied = false;                       ///< A transition reached the backend
    bool backend_failed = false;
};

class LinkEnforcementAgent {
public:
    LinkEnforcementAgent(HealthSource source,
                         std::shared_ptr<FirewallBackend> backend,
                         AgentConfig config = AgentConfig{},
                         security::AuditLoggerPtr audit = nullptr);
    ~LinkEnforcementAgent();

    LinkEnforcementAgent(const LinkEnforcementAgent&) = delete;
    LinkEnforcementAgent& operator=(const LinkEnforcementAgent&) = delete;

    /**
     * @brief Read health once and apply a transition if one is due
     *
     * A failed backend call leaves the remembered state unchanged so the
     * next poll retries it.
     */
    PollOutcome poll_once();

    /// Poll on a worker thread every poll_interval until stop()
    void start();
    void stop();
    bool running() const { return running_.load(); }

    std::optional<FirewallAction> last_applied() const;
    uint64_t poll_count() const { return polls_.load(); }

private:
    void run_loop();

    void audit(security::AuditSeverity severity,
               const std::string& action,
               const std::string& result,
               const std::string& message) const;

    HealthSource source_;
    std::shared_ptr<FirewallBackend> backend_;
    AgentConfig config_;
    security::AuditLoggerPtr audit_;

    mutable std::mutex state_mutex_;
    std::optional<FirewallAction> last_applied_;

    std::atomic<uint64_t> polls_{0};
    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::thread worker_;
};

} // namespace enforcement
} // namespace sentinel
