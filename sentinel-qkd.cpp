// sentinel-qkd.cpp
// Command-line front end for the BB84 key management core.
// Runs simulations, issues keys, and walks through the link-health demo.

#include "src/core/errors.hpp"
#include "src/core/secure_memory.hpp"
#include "src/enforcement/link_enforcement_agent.hpp"
#include "src/kms/key_manager.hpp"
#include "src/pqc/pqc_material.hpp"
#include "src/qkd/bb84_simulator.hpp"
#include "src/qkd/key_derivation.hpp"
#include "src/qkd/qkd_config.hpp"
#include "src/qkd/random_source.hpp"
#include "src/security/audit_logger.hpp"

#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace sentinel;

namespace {

std::string pct(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f%%", v * 100.0);
    return buf;
}

size_t parse_count(const std::string& flag, const std::string& value) {
    try {
        size_t consumed = 0;
        unsigned long long n = std::stoull(value, &consumed);
        if (consumed != value.size() || value[0] == '-') throw std::invalid_argument(value);
        return static_cast<size_t>(n);
    } catch (const std::exception&) {
        throw core::ConfigurationError("invalid " + flag + ": must be a positive integer");
    }
}

double parse_rate(const std::string& flag, const std::string& value) {
    try {
        size_t consumed = 0;
        double r = std::stod(value, &consumed);
        if (consumed != value.size()) throw std::invalid_argument(value);
        return r;
    } catch (const std::exception&) {
        throw core::ConfigurationError("invalid " + flag + ": must be a number in [0, 1]");
    }
}

security::AuditLoggerPtr make_audit(const std::optional<std::filesystem::path>& log_file) {
    security::AuditLoggerConfig cfg;
    cfg.log_file = log_file;
    cfg.mirror_to_stderr = true;
    cfg.stderr_tag = "KMS";
    auto audit = std::make_shared<security::AuditLogger>(cfg);
    audit->set_on_error([](const std::string& msg) {
        std::cerr << "WARNING: audit log: " << msg << "\n";
    });
    return audit;
}

void print_health(const kms::LinkHealthSnapshot& h) {
    std::cout << "  link status      : " << kms::link_status_to_string(h.status) << "\n"
              << "  last QBER        : " << pct(h.last_qber) << "\n"
              << "  keys issued      : " << h.keys_issued << "\n"
              << "  attacks detected : " << h.attacks_detected << "\n"
              << "  active sessions  : " << h.active_sessions << "\n"
              << "  forced attack    : " << (h.attack_forced ? "armed" : "off") << "\n";
}

void print_result(const std::string& device, const kms::SessionKeyResult& r) {
    if (r.ok()) {
        const kms::IssuedKey& k = r.issued();
        std::cout << "  " << device << ": key issued"
                  << (k.hybrid ? " (hybrid BB84 + ML-KEM-1024)" : "")
                  << (k.paired ? " (paired)" : "") << "\n"
                  << "    fingerprint " << k.key->fingerprint()
                  << ", QBER " << pct(k.qber)
                  << ", status " << kms::link_status_to_string(k.status) << "\n";
    } else {
        const kms::Rejection& rej = r.rejection();
        std::cout << "  " << device << ": REJECTED ("
                  << kms::rejection_reason_to_string(rej.reason) << ")\n"
                  << "    " << rej.message
                  << ", status " << kms::link_status_to_string(rej.status)
                  << (rej.retryable ? ", retryable" : "") << "\n";
    }
}

// Usage message
void usage() {
    std::cout <<
R"(sentinel-qkd (C++23, libsodium, liboqs) - BB84 key management core

Subcommands:

  simulate [--bits <n>] [--eve] [--intercept <rate>] [--noise <rate>] [--seed <n>]
      -> Runs one BB84 exchange and prints sifting and QBER diagnostics.

  request-key <device> [--attack] [--hybrid] [--audit-log <path>]
      -> Requests a session key from a fresh key manager.

  demo [--audit-log <path>]
      -> Normal issuance, forced attack, reset, paired issuance and the
         enforcement agent reacting to each link status.

  self-test
      -> Checks the simulator, key derivation and ML-KEM material source.

  help
      -> Shows this message.

Environment:
  SENTINEL_BIT_COUNT, SENTINEL_NOISE_LEVEL, SENTINEL_INTERCEPT_RATE,
  SENTINEL_DISCLOSED_FRACTION, SENTINEL_RAW_SECRET_BITS,
  SENTINEL_QBER_THRESHOLD, SENTINEL_SAFE_THRESHOLD override channel defaults.
)";
}

int cmd_simulate(int argc, char** argv) {
    qkd::ChannelConfig channel = qkd::ChannelConfig::from_environment();
    qkd::SimulationParams params = qkd::SimulationParams::from_config(channel, false);
    std::optional<uint64_t> seed;

    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        auto need = [&]() {
            if (i + 1 >= argc) {
                throw core::ConfigurationError("missing value for argument: " + a);
            }
            return std::string(argv[++i]);
        };

        if      (a == "--bits") params.bit_count = parse_count(a, need());
        else if (a == "--eve") params.eavesdropper_present = true;
        else if (a == "--intercept") params.intercept_rate = parse_rate(a, need());
        else if (a == "--noise") params.noise_level = parse_rate(a, need());
        else if (a == "--seed") seed = parse_count(a, need());
        else throw core::ConfigurationError("unknown argument: " + a);
    }

    std::unique_ptr<qkd::RandomSource> rng;
    if (seed) {
        rng = std::make_unique<qkd::SeededRandomSource>(*seed);
    } else {
        rng = std::make_unique<qkd::SodiumRandomSource>();
    }

    qkd::SimulationResult r = qkd::QuantumChannelSimulator::simulate(params, *rng);
    kms::LinkStatus status = kms::classify(r.qber, r.eavesdropper_detected,
                                           channel.safe_threshold, channel.security_threshold);

    std::cout << "BB84 simulation\n"
              << "  qubits sent       : " << params.bit_count << "\n"
              << "  eavesdropper      : "
              << (params.eavesdropper_present ? "present (intercept " + pct(params.intercept_rate) + ")"
                                              : std::string("absent")) << "\n"
              << "  intercepted       : " << r.intercepted_positions << "\n"
              << "  sifted bits       : " << r.sifted_bits << "\n"
              << "  disclosed sample  : " << r.sample_size
              << " (" << r.sample_mismatches << " mismatches)\n"
              << "  retained bits     : " << r.retained_bits << "\n"
              << "  QBER              : " << pct(r.qber) << "\n"
              << "  attack detected   : " << (r.eavesdropper_detected ? "YES" : "no") << "\n"
              << "  link status       : " << kms::link_status_to_string(status) << "\n"
              << "  raw secret fp     : "
              << core::fingerprint(r.raw_secret.data(), r.raw_secret.size()) << "\n";
    return 0;
}

int cmd_request_key(int argc, char** argv) {
    if (argc < 3) { usage(); return 1; }
    std::string device = argv[2];
    bool attack = false, hybrid = false;
    std::optional<std::filesystem::path> audit_log;

    for (int i = 3; i < argc; ++i) {
        std::string a = argv[i];
        if      (a == "--attack") attack = true;
        else if (a == "--hybrid") hybrid = true;
        else if (a == "--audit-log") {
            if (i + 1 >= argc) throw core::ConfigurationError("missing value for argument: " + a);
            audit_log = std::filesystem::path(argv[++i]);
        }
        else throw core::ConfigurationError("unknown argument: " + a);
    }

    kms::KeyManagerConfig cfg;
    cfg.channel = qkd::ChannelConfig::from_environment();
    kms::KeyManager manager(cfg, qkd::sodium_random_factory(),
                            hybrid ? pqc::make_default_pqc_source() : nullptr,
                            make_audit(audit_log));

    kms::SessionKeyResult r = manager.get_fresh_key(device, attack, hybrid);
    print_result(device, r);
    std::cout << "Link health:\n";
    print_health(manager.check_link_health());
    return r.ok() ? 0 : 3;
}

int cmd_demo(int argc, char** argv) {
    std::optional<std::filesystem::path> audit_log;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--audit-log") {
            if (i + 1 >= argc) throw core::ConfigurationError("missing value for argument: " + a);
            audit_log = std::filesystem::path(argv[++i]);
        }
        else throw core::ConfigurationError("unknown argument: " + a);
    }

    auto audit = make_audit(audit_log);

    kms::KeyManagerConfig cfg;
    cfg.channel = qkd::ChannelConfig::from_environment();
    cfg.enable_demo_pairing = true;
    kms::KeyManager manager(cfg, qkd::sodium_random_factory(),
                            pqc::make_default_pqc_source(), audit);

    auto firewall = std::make_shared<enforcement::RecordingFirewallBackend>(audit);
    enforcement::LinkEnforcementAgent agent(enforcement::key_manager_health_source(manager),
                                            firewall, enforcement::AgentConfig{}, audit);

    auto enforce = [&]() {
        agent.poll_once();
        std::cout << "  firewall         : " << (firewall->blocked() ? "BLOCKED" : "open") << "\n";
    };

    std::cout << "\n== Scenario A: normal issuance ==\n";
    print_result("Alpha", manager.get_fresh_key("Alpha"));
    print_health(manager.check_link_health());
    enforce();

    std::cout << "\n== Paired issuance: second device shares Alpha's key ==\n";
    kms::SessionKeyResult bravo = manager.get_fresh_key("Bravo");
    print_result("Bravo", bravo);
    auto alpha_session = manager.find_session("Alpha");
    if (bravo.ok() && alpha_session) {
        std::cout << "  keys match       : "
                  << (alpha_session->key_fingerprint == bravo.issued().key->fingerprint() ? "yes" : "no")
                  << "\n";
    }

    if (manager.hybrid_available()) {
        std::cout << "\n== Hybrid issuance (BB84 + ML-KEM-1024) ==\n";
        print_result("Charlie", manager.get_fresh_key("Charlie", false, true));
    }

    std::cout << "\n== Scenario B: forced eavesdropper ==\n";
    manager.force_attack();
    print_result("Alpha", manager.get_fresh_key("Alpha"));
    print_health(manager.check_link_health());
    enforce();

    std::cout << "\n== Scenario C: operator reset ==\n";
    manager.reset_for_demo();
    print_health(manager.check_link_health());
    enforce();

    return 0;
}

int cmd_self_test() {
    int failures = 0;
    auto check = [&](const std::string& name, bool ok) {
        std::cout << (ok ? "  [PASS] " : "  [FAIL] ") << name << "\n";
        if (!ok) ++failures;
    };

    std::cout << "Running self-tests...\n";

    qkd::ChannelConfig channel;
    channel.bit_count = 4096;
    qkd::QuantumChannelSimulator sim(channel);
    qkd::SodiumRandomSource rng;

    qkd::SimulationResult clean = sim.run(false, rng);
    check("clean channel has zero QBER", clean.qber == 0.0 && !clean.eavesdropper_detected);
    check("raw secret is 32 bytes", clean.raw_secret.size() == 32);

    qkd::SimulationResult attacked = sim.run(true, rng);
    check("intercept-resend is detected", attacked.eavesdropper_detected);

    // RFC 5869 test case 1
    std::vector<uint8_t> salt = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06,
                                 0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c};
    std::vector<uint8_t> ikm_bytes(22, 0x0b);
    core::SecretBytes ikm(ikm_bytes.data(), ikm_bytes.size());
    std::string info = "\xf0\xf1\xf2\xf3\xf4\xf5\xf6\xf7\xf8\xf9";
    core::SecretBytes okm = qkd::hkdf_sha256(salt, ikm, info, 42);
    check("HKDF-SHA256 matches RFC 5869 vector",
          core::to_hex(okm.data(), okm.size()) ==
          "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf34007208d5b887185865");

    core::SecretBytes k1 = qkd::derive(clean.raw_secret, SENTINEL_LABEL_BB84);
    core::SecretBytes k2 = qkd::derive(clean.raw_secret, SENTINEL_LABEL_HYBRID);
    check("labels separate derived keys", !k1.equals(k2));

    if (pqc::pqc_available()) {
        auto source = pqc::make_default_pqc_source();
        core::SecretBytes ss = source->shared_secret();
        check("ML-KEM-1024 round trip yields 32 bytes", ss.size() == 32);
    } else {
        std::cout << "  [SKIP] ML-KEM-1024 (built without liboqs)\n";
    }

    std::cout << (failures == 0 ? "All self-tests passed.\n" : "Self-tests FAILED.\n");
    return failures == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    try {
        core::ensure_sodium();
        if (argc < 2) { usage(); return 1; }
        std::string cmd = argv[1];

        if (cmd == "simulate") return cmd_simulate(argc, argv);
        if (cmd == "request-key") return cmd_request_key(argc, argv);
        if (cmd == "demo") return cmd_demo(argc, argv);
        if (cmd == "self-test") {
            if (argc != 2) { usage(); return 1; }
            return cmd_self_test();
        }
        if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            usage();
            return 0;
        }

        usage();
        return 1;
    } catch (const core::ConfigurationError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        std::cerr << "Use 'sentinel-qkd help' for usage information.\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "ERR: " << e.what() << "\n";
        return 2;
    }
}
