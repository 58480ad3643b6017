#ifndef SENTINEL_SECURITY_AUDIT_LOGGER_HPP
#define SENTINEL_SECURITY_AUDIT_LOGGER_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sentinel {
namespace security {

/**
 * @brief Audit log severity levels (aligned with syslog RFC 5424)
 */
enum class AuditSeverity {
    DEBUG = 7,      ///< Detailed debugging information
    INFO = 6,       ///< Informational messages
    NOTICE = 5,     ///< Normal but significant condition
    WARNING = 4,    ///< Warning conditions
    ERROR = 3,      ///< Error conditions
    CRITICAL = 2,   ///< Critical conditions
    ALERT = 1,      ///< Action must be taken immediately
    SECURITY = 99   ///< Security events (custom)
};

const char* severity_to_string(AuditSeverity sev);

/**
 * @brief One entry in the audit trail
 *
 * Key material never appears here; at most a short fingerprint in message.
 */
struct AuditRecord {
    uint64_t sequence_number = 0;                         ///< Monotonic sequence number
    std::chrono::system_clock::time_point timestamp;      ///< Event timestamp (UTC)
    AuditSeverity severity = AuditSeverity::INFO;

    std::string category;                                 ///< e.g. "KMS", "LINK", "ENFORCEMENT"
    std::string action;                                   ///< e.g. "KEY_ISSUED", "BLOCK"
    std::string subject;                                  ///< Device identifier or component
    std::string result;                                   ///< SUCCESS, REJECTED, FAILURE
    std::string message;

    std::optional<double> qber;                           ///< Observed error rate, if any

    // Hash chaining
    std::array<uint8_t, 32> previous_hash{};
    std::array<uint8_t, 32> current_hash{};
};

/**
 * @brief Audit logger configuration
 */
struct AuditLoggerConfig {
    std::optional<std::filesystem::path> log_file;        ///< JSON Lines output
    bool mirror_to_stderr = false;                        ///< Human-readable "[TAG] ..." lines
    std::string stderr_tag = "KMS";
};

/**
 * @brief Hash-chained audit trail
 *
 * Every record carries the BLAKE2b-256 hash of its canonical encoding,
 * which covers the previous record's hash, so deleting or editing a
 * record breaks verify_chain(). Thread-safe.
 */
class AuditLogger {
public:
    explicit AuditLogger(const AuditLoggerConfig& config = AuditLoggerConfig{});

    AuditLogger(const AuditLogger&) = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;

    /**
     * @brief Sequence, timestamp, chain and emit a record
     */
    void log(AuditRecord record);

    /**
     * @brief Convenience method: log with basic fields
     */
    void log(AuditSeverity severity,
             const std::string& category,
             const std::string& action,
             const std::string& subject,
             const std::string& result,
             const std::string& message = "",
             std::optional<double> qber = std::nullopt);

    /**
     * @brief Recompute the chain over records in sequence order
     * @return true if every hash matches and links to its predecessor
     */
    static bool verify_chain(const std::vector<AuditRecord>& records);

    /**
     * @brief BLAKE2b-256 over the record's canonical encoding
     */
    static std::array<uint8_t, 32> compute_hash(const AuditRecord& record);

    static std::string to_json(const AuditRecord& record);

    /// Invoked under the logger lock; the callback must not log
    void set_on_record_written(std::function<void(const AuditRecord&)> callback);
    void set_on_error(std::function<void(const std::string&)> callback);

    uint64_t get_sequence_number() const;
    std::optional<std::array<uint8_t, 32>> get_last_hash() const;

private:
    void write_to_file(const AuditRecord& record);
    void write_to_stderr(const AuditRecord& record) const;
    void report_error(const std::string& message);

    AuditLoggerConfig config_;

    std::array<uint8_t, 32> last_hash_{};
    bool have_last_hash_ = false;
    uint64_t sequence_number_ = 0;

    std::function<void(const AuditRecord&)> on_record_written_;
    std::function<void(const std::string&)> on_error_;

    mutable std::mutex mutex_;
};

using AuditLoggerPtr = std::shared_ptr<AuditLogger>;

} // namespace security
} // namespace sentinel

#endif // SENTINEL_SECURITY_AUDIT_LOGGER_HPP
