/**
 * @file test_audit_logger.cpp
 * @brief Hash-chained audit trail tests
 */

#include <catch2/catch_test_macros.hpp>
#include "../../src/security/audit_logger.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace sentinel::security;

TEST_CASE("Audit records are sequenced and chained", "[security][audit]") {
    AuditLogger logger;
    std::vector<AuditRecord> records;
    logger.set_on_record_written([&](const AuditRecord& r) { records.push_back(r); });

    logger.log(AuditSeverity::INFO, "KMS", "KEY_ISSUED", "Alpha", "SUCCESS", "key fp 00", 0.0);
    logger.log(AuditSeverity::SECURITY, "KMS", "EAVESDROPPER_DETECTED", "Alpha", "REJECTED", "", 0.25);
    logger.log(AuditSeverity::NOTICE, "KMS", "RESET", "", "SUCCESS");

    REQUIRE(records.size() == 3);
    REQUIRE(logger.get_sequence_number() == 3);

    SECTION("Sequence numbers increase by one") {
        REQUIRE(records[0].sequence_number == 1);
        REQUIRE(records[1].sequence_number == 2);
        REQUIRE(records[2].sequence_number == 3);
    }

    SECTION("Each record links to its predecessor") {
        REQUIRE(records[1].previous_hash == records[0].current_hash);
        REQUIRE(records[2].previous_hash == records[1].current_hash);
        REQUIRE(logger.get_last_hash().value() == records[2].current_hash);
    }

    SECTION("Intact chain verifies") {
        REQUIRE(AuditLogger::verify_chain(records));
    }

    SECTION("Edited record breaks the chain") {
        records[1].subject = "Bravo";
        REQUIRE_FALSE(AuditLogger::verify_chain(records));
    }

    SECTION("Edited QBER breaks the chain") {
        records[1].qber = 0.01;
        REQUIRE_FALSE(AuditLogger::verify_chain(records));
    }

    SECTION("Deleted record breaks the chain") {
        records.erase(records.begin() + 1);
        REQUIRE_FALSE(AuditLogger::verify_chain(records));
    }
}

TEST_CASE("Audit records serialise to JSON lines", "[security][audit][json]") {
    AuditLogger logger;
    std::vector<AuditRecord> records;
    logger.set_on_record_written([&](const AuditRecord& r) { records.push_back(r); });

    logger.log(AuditSeverity::WARNING, "KMS", "FORCE_ATTACK", "", "ARMED", "quote \" and\nnewline");
    REQUIRE(records.size() == 1);

    std::string json = AuditLogger::to_json(records[0]);
    REQUIRE(json.front() == '{');
    REQUIRE(json.back() == '}');
    REQUIRE(json.find("\"act\":\"FORCE_ATTACK\"") != std::string::npos);
    REQUIRE(json.find("\"sev\":\"WARNING\"") != std::string::npos);
    REQUIRE(json.find("quote \\\" and\\nnewline") != std::string::npos);
    REQUIRE(json.find('\n') == std::string::npos);
    REQUIRE(json.find("\"qber\"") == std::string::npos);
}

TEST_CASE("Audit log file sink", "[security][audit][file]") {
    auto path = std::filesystem::temp_directory_path() / "sentinel_audit_test" / "audit.jsonl";
    std::filesystem::remove_all(path.parent_path());

    {
        AuditLoggerConfig cfg;
        cfg.log_file = path;
        AuditLogger logger(cfg);
        logger.log(AuditSeverity::INFO, "KMS", "KEY_ISSUED", "Alpha", "SUCCESS", "", 0.0);
        logger.log(AuditSeverity::INFO, "KMS", "KEY_ISSUED", "Bravo", "SUCCESS", "", 0.02);
    }

    std::ifstream in(path);
    REQUIRE(in.good());
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[1].find("\"sub\":\"Bravo\"") != std::string::npos);
    REQUIRE(lines[1].find("\"qber\":0.020000") != std::string::npos);

    std::filesystem::remove_all(path.parent_path());
}

TEST_CASE("Unwritable log file is reported", "[security][audit][file]") {
    AuditLoggerConfig cfg;
    cfg.log_file = std::filesystem::path("/proc/sentinel-does-not-exist/audit.jsonl");
    AuditLogger logger(cfg);

    std::vector<std::string> errors;
    logger.set_on_error([&](const std::string& e) { errors.push_back(e); });
    logger.log(AuditSeverity::INFO, "KMS", "RESET", "", "SUCCESS");

    REQUIRE(errors.size() == 1);
    REQUIRE(logger.get_sequence_number() == 1);
}
