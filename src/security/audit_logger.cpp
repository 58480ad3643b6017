#include "audit_logger.hpp"
#include "../core/errors.hpp"
#include "../core/secure_memory.hpp"

#include <sodium.h>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace sentinel {
namespace security {

namespace {

std::string json_escape(const std::string& s) {
    std::ostringstream escaped;
    for (char c : s) {
        switch (c) {
            case '"': escaped << "\\\""; break;
            case '\\': escaped << "\\\\"; break;
            case '\n': escaped << "\\n"; break;
            case '\r': escaped << "\\r"; break;
            case '\t': escaped << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    escaped << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                            << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    escaped << c;
                }
        }
    }
    return escaped.str();
}

std::string iso8601(std::chrono::system_clock::time_point tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf;
    gmtime_r(&time_t, &tm_buf);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::ostringstream out;
    out << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms << "Z";
    return out.str();
}

std::string format_qber(double qber) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6f", qber);
    return buf;
}

std::vector<uint8_t> canonical_bytes(const AuditRecord& record) {
    std::vector<uint8_t> bytes;
    bytes.reserve(256);

    bytes.insert(bytes.end(), record.previous_hash.begin(), record.previous_hash.end());

    // Sequence number and timestamp, 8 bytes little-endian each
    uint64_t seq = record.sequence_number;
    for (int i = 0; i < 8; ++i) {
        bytes.push_back(static_cast<uint8_t>((seq >> (8 * i)) & 0xFF));
    }
    uint64_t ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        record.timestamp.time_since_epoch()).count());
    for (int i = 0; i < 8; ++i) {
        bytes.push_back(static_cast<uint8_t>((ms >> (8 * i)) & 0xFF));
    }

    bytes.push_back(static_cast<uint8_t>(record.severity));
    bytes.push_back(0);

    auto append_string = [&](const std::string& s) {
        bytes.insert(bytes.end(), s.begin(), s.end());
        bytes.push_back(0);
    };

    append_string(record.category);
    append_string(record.action);
    append_string(record.subject);
    append_string(record.result);
    append_string(record.message);

    if (record.qber) {
        bytes.push_back(1);
        append_string(format_qber(*record.qber));
    } else {
        bytes.push_back(0);
    }

    return bytes;
}

} // namespace

const char* severity_to_string(AuditSeverity sev) {
    switch (sev) {
        case AuditSeverity::DEBUG: return "DEBUG";
        case AuditSeverity::INFO: return "INFO";
        case AuditSeverity::NOTICE: return "NOTICE";
        case AuditSeverity::WARNING: return "WARNING";
        case AuditSeverity::ERROR: return "ERROR";
        case AuditSeverity::CRITICAL: return "CRITICAL";
        case AuditSeverity::ALERT: return "ALERT";
        case AuditSeverity::SECURITY: return "SECURITY";
    }
    return "UNKNOWN";
}

AuditLogger::AuditLogger(const AuditLoggerConfig& config)
    : config_(config) {
    core::ensure_sodium();
}

std::array<uint8_t, 32> AuditLogger::compute_hash(const AuditRecord& record) {
    std::vector<uint8_t> canonical = canonical_bytes(record);
    std::array<uint8_t, 32> hash;
    if (crypto_generichash(hash.data(), hash.size(),
                           canonical.data(), canonical.size(),
                           nullptr, 0) != 0) {
        throw core::CryptoError("crypto_generichash", "audit record hash");
    }
    return hash;
}

std::string AuditLogger::to_json(const AuditRecord& record) {
    std::ostringstream json;

    json << "{";
    json << "\"seq\":" << record.sequence_number << ",";
    json << "\"ts\":\"" << iso8601(record.timestamp) << "\",";
    json << "\"sev\":\"" << severity_to_string(record.severity) << "\",";
    json << "\"cat\":\"" << json_escape(record.category) << "\",";
    json << "\"act\":\"" << json_escape(record.action) << "\",";
    json << "\"sub\":\"" << json_escape(record.subject) << "\",";
    json << "\"res\":\"" << json_escape(record.result) << "\",";
    json << "\"msg\":\"" << json_escape(record.message) << "\",";
    if (record.qber) {
        json << "\"qber\":" << format_qber(*record.qber) << ",";
    }
    json << "\"prev\":\"" << core::to_hex(record.previous_hash.data(), 32) << "\",";
    json << "\"hash\":\"" << core::to_hex(record.current_hash.data(), 32) << "\"";
    json << "}";

    return json.str();
}

void AuditLogger::log(AuditRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);

    record.sequence_number = ++sequence_number_;
    if (record.timestamp.time_since_epoch().count() == 0) {
        record.timestamp = std::chrono::system_clock::now();
    }
    record.previous_hash = have_last_hash_ ? last_hash_ : std::array<uint8_t, 32>{};
    record.current_hash = compute_hash(record);

    last_hash_ = record.current_hash;
    have_last_hash_ = true;

    write_to_file(record);
    if (config_.mirror_to_stderr) {
        write_to_stderr(record);
    }
    if (on_record_written_) {
        on_record_written_(record);
    }
}

void AuditLogger::log(AuditSeverity severity,
                      const std::string& category,
                      const std::string& action,
                      const std::string& subject,
                      const std::string& result,
                      const std::string& message,
                      std::optional<double> qber) {
    AuditRecord record;
    record.severity = severity;
    record.category = category;
    record.action = action;
    record.subject = subject;
    record.result = result;
    record.message = message;
    record.qber = qber;

    log(std::move(record));
}

bool AuditLogger::verify_chain(const std::vector<AuditRecord>& records) {
    std::array<uint8_t, 32> expected_prev{};
    bool first = true;
    uint64_t last_seq = 0;

    for (const AuditRecord& record : records) {
        if (!first) {
            if (record.sequence_number != last_seq + 1) {
                return false;
            }
            if (!core::constant_time_compare(record.previous_hash.data(),
                                             expected_prev.data(), 32)) {
                return false;
            }
        }

        std::array<uint8_t, 32> recomputed = compute_hash(record);
        if (!core::constant_time_compare(recomputed.data(), record.current_hash.data(), 32)) {
            return false;
        }

        expected_prev = record.current_hash;
        last_seq = record.sequence_number;
        first = false;
    }

    return true;
}

void AuditLogger::set_on_record_written(std::function<void(const AuditRecord&)> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_record_written_ = std::move(callback);
}

void AuditLogger::set_on_error(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_error_ = std::move(callback);
}

uint64_t AuditLogger::get_sequence_number() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_number_;
}

std::optional<std::array<uint8_t, 32>> AuditLogger::get_last_hash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (have_last_hash_) {
        return last_hash_;
    }
    return std::nullopt;
}

void AuditLogger::write_to_file(const AuditRecord& record) {
    if (!config_.log_file) return;

    std::error_code ec;
    if (config_.log_file->has_parent_path()) {
        std::filesystem::create_directories(config_.log_file->parent_path(), ec);
    }

    std::ofstream f(*config_.log_file, std::ios::app);
    if (!f) {
        report_error("Failed to open audit log file " + config_.log_file->string());
        return;
    }

    f << to_json(record) << '\n';
}

void AuditLogger::write_to_stderr(const AuditRecord& record) const {
    std::ostringstream line;
    line << "[" << config_.stderr_tag << "] "
         << severity_to_string(record.severity) << " "
         << record.action;
    if (!record.subject.empty()) {
        line << " " << record.subject;
    }
    line << ": " << record.result;
    if (record.qber) {
        line << " (QBER " << std::fixed << std::setprecision(2) << (*record.qber * 100.0) << "%)";
    }
    if (!record.message.empty()) {
        line << " - " << record.message;
    }
    std::cerr << line.str() << std::endl;
}

void AuditLogger::report_error(const std::string& message) {
    if (on_error_) {
        on_error_(message);
    }
}

} // namespace security
} // namespace sentinel
