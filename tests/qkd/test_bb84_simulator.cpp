/**
 * @file test_bb84_simulator.cpp
 * @brief BB84 simulator properties over seeded random sources
 *
 * Tests:
 * - Clean channel yields zero QBER
 * - Full intercept-resend lands in the ~25% band
 * - Sifting statistics and sample/retained partitioning
 * - Determinism under a fixed seed
 * - Insufficient material and configuration failures
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../../src/qkd/bb84_simulator.hpp"
#include "../../src/core/errors.hpp"
#include <cmath>
#include <vector>

using namespace sentinel;
using Catch::Approx;

namespace {

qkd::SimulationParams params_with(size_t bits, bool eve, double intercept = 1.0, double noise = 0.0) {
    qkd::SimulationParams p;
    p.bit_count = bits;
    p.eavesdropper_present = eve;
    p.intercept_rate = intercept;
    p.noise_level = noise;
    return p;
}

// Alice always prepares in the rectilinear basis and Bob always measures in
// the diagonal one, so nothing survives sifting
class MismatchedBasisSource : public qkd::RandomSource {
public:
    void fill(uint8_t* out, size_t len) override {
        for (size_t i = 0; i < len; ++i) out[i] = 0;
    }

    uint8_t bit() override {
        // Per position: Alice bit, Alice basis, Bob basis, Bob's random outcome
        static const uint8_t pattern[] = {0, 0, 1, 0};
        return pattern[calls_++ % 4];
    }

private:
    size_t calls_ = 0;
};

} // namespace

TEST_CASE("Clean channel has zero QBER", "[qkd][bb84]") {
    for (uint64_t seed = 1; seed <= 20; ++seed) {
        qkd::SeededRandomSource rng(seed);
        qkd::SimulationResult r = qkd::QuantumChannelSimulator::simulate(params_with(1024, false), rng);

        REQUIRE(r.qber == 0.0);
        REQUIRE_FALSE(r.eavesdropper_detected);
        REQUIRE(r.raw_secret.size() == 32);
        REQUIRE(r.sample_mismatches == 0);
        REQUIRE(r.intercepted_positions == 0);
    }
}

TEST_CASE("Full intercept-resend raises QBER to ~25%", "[qkd][bb84][eve]") {
    double total = 0.0;
    const int trials = 20;

    for (uint64_t seed = 100; seed < 100 + trials; ++seed) {
        qkd::SeededRandomSource rng(seed);
        qkd::SimulationResult r = qkd::QuantumChannelSimulator::simulate(params_with(4096, true), rng);

        REQUIRE(r.qber >= 0.15);
        REQUIRE(r.qber <= 0.35);
        REQUIRE(r.eavesdropper_detected);
        REQUIRE(r.intercepted_positions == 4096);
        total += r.qber;
    }

    REQUIRE(total / trials == Approx(0.25).margin(0.03));
}

TEST_CASE("Eavesdropper with zero intercept rate is invisible", "[qkd][bb84][eve]") {
    qkd::SeededRandomSource rng(7);
    qkd::SimulationResult r = qkd::QuantumChannelSimulator::simulate(params_with(2048, true, 0.0), rng);

    REQUIRE(r.intercepted_positions == 0);
    REQUIRE(r.qber == 0.0);
    REQUIRE_FALSE(r.eavesdropper_detected);
}

TEST_CASE("Channel noise shows up as QBER without an eavesdropper", "[qkd][bb84][noise]") {
    qkd::SeededRandomSource rng(11);
    qkd::SimulationResult r = qkd::QuantumChannelSimulator::simulate(params_with(8192, false, 1.0, 0.03), rng);

    REQUIRE(r.qber > 0.0);
    REQUIRE(r.qber < 0.08);
    REQUIRE_FALSE(r.eavesdropper_detected);
}

TEST_CASE("Sifting and sample partitioning", "[qkd][bb84][sifting]") {
    SECTION("Sifted length concentrates near half") {
        qkd::SeededRandomSource rng(3);
        qkd::SimulationResult r = qkd::QuantumChannelSimulator::simulate(params_with(20000, false), rng);

        REQUIRE(r.sifted_bits <= 20000);
        REQUIRE(r.sifted_bits > 9500);
        REQUIRE(r.sifted_bits < 10500);
    }

    SECTION("Disclosed and retained bits partition the sifted key") {
        for (uint64_t seed = 1; seed <= 10; ++seed) {
            qkd::SeededRandomSource rng(seed);
            qkd::SimulationResult r = qkd::QuantumChannelSimulator::simulate(params_with(1024, seed % 2 == 0), rng);

            REQUIRE(r.sample_size == qkd::disclosed_sample_size(r.sifted_bits, 0.2));
            REQUIRE(r.sample_size + r.retained_bits == r.sifted_bits);
            REQUIRE(r.retained_bits >= 256);
        }
    }

    SECTION("Sample size rounds up") {
        REQUIRE(qkd::disclosed_sample_size(0, 0.2) == 0);
        REQUIRE(qkd::disclosed_sample_size(1, 0.2) == 1);
        REQUIRE(qkd::disclosed_sample_size(11, 0.2) == 3);
        REQUIRE(qkd::disclosed_sample_size(100, 0.5) == 50);
    }
}

TEST_CASE("Fixed seed gives identical runs", "[qkd][bb84][determinism]") {
    qkd::SeededRandomSource a(42);
    qkd::SeededRandomSource b(42);
    qkd::SimulationResult ra = qkd::QuantumChannelSimulator::simulate(params_with(2048, true, 0.5), a);
    qkd::SimulationResult rb = qkd::QuantumChannelSimulator::simulate(params_with(2048, true, 0.5), b);

    REQUIRE(ra.qber == rb.qber);
    REQUIRE(ra.sifted_bits == rb.sifted_bits);
    REQUIRE(ra.raw_secret.equals(rb.raw_secret));

    qkd::SeededRandomSource c(43);
    qkd::SimulationResult rc = qkd::QuantumChannelSimulator::simulate(params_with(2048, true, 0.5), c);
    REQUIRE_FALSE(ra.raw_secret.equals(rc.raw_secret));
}

TEST_CASE("Bound simulator uses its configuration", "[qkd][bb84]") {
    qkd::ChannelConfig cfg;
    cfg.bit_count = 4096;
    qkd::QuantumChannelSimulator sim(cfg);
    qkd::SeededRandomSource rng(5);

    qkd::SimulationResult clean = sim.run(false, rng);
    REQUIRE(clean.qber == 0.0);

    qkd::SimulationResult attacked = sim.run(4096, true, 1.0, 0.0, rng);
    REQUIRE(attacked.eavesdropper_detected);
}

TEST_CASE("Bits pack most-significant first", "[qkd][bb84][packing]") {
    std::vector<uint8_t> bits = {1, 0, 0, 0, 0, 0, 0, 1,
                                 1};
    std::vector<uint8_t> packed = qkd::pack_bits_msb_first(bits);

    REQUIRE(packed.size() == 2);
    REQUIRE(packed[0] == 0x81);
    REQUIRE(packed[1] == 0x80);
}

TEST_CASE("Simulation failures", "[qkd][bb84][errors]") {
    SECTION("Empty sifted key is insufficient material, never QBER 0") {
        MismatchedBasisSource rng;
        REQUIRE_THROWS_AS(qkd::QuantumChannelSimulator::simulate(params_with(1024, false), rng),
                          core::InsufficientKeyMaterialError);
    }

    SECTION("Invalid parameters are configuration errors") {
        qkd::SeededRandomSource rng(1);
        REQUIRE_THROWS_AS(qkd::QuantumChannelSimulator::simulate(params_with(0, false), rng),
                          core::ConfigurationError);
        REQUIRE_THROWS_AS(qkd::QuantumChannelSimulator::simulate(params_with(1024, true, 1.5), rng),
                          core::ConfigurationError);
        REQUIRE_THROWS_AS(qkd::QuantumChannelSimulator::simulate(params_with(1024, false, 1.0, -0.2), rng),
                          core::ConfigurationError);
    }

    SECTION("Undersized bit count is rejected up front") {
        qkd::SeededRandomSource rng(1);
        REQUIRE_THROWS_AS(qkd::QuantumChannelSimulator::simulate(params_with(256, false), rng),
                          core::ConfigurationError);
    }
}

TEST_CASE("Random source draws", "[qkd][random]") {
    qkd::SeededRandomSource rng(9);

    SECTION("below() stays in range") {
        for (int i = 0; i < 1000; ++i) {
            REQUIRE(rng.below(7) < 7);
        }
        REQUIRE_THROWS_AS(rng.below(0), core::ConfigurationError);
    }

    SECTION("uniform() stays in [0, 1)") {
        for (int i = 0; i < 1000; ++i) {
            double u = rng.uniform();
            REQUIRE(u >= 0.0);
            REQUIRE(u < 1.0);
        }
    }

    SECTION("bit() is roughly balanced") {
        int ones = 0;
        for (int i = 0; i < 10000; ++i) ones += rng.bit();
        REQUIRE(ones > 4700);
        REQUIRE(ones < 5300);
    }

    SECTION("Sodium source fills buffers") {
        qkd::SodiumRandomSource sodium;
        std::vector<uint8_t> a(1000), b(1000);
        sodium.fill(a.data(), a.size());
        sodium.fill(b.data(), b.size());
        REQUIRE(a != b);
    }

    SECTION("Seeded factory hands out distinct streams") {
        qkd::RandomSourceFactory factory = qkd::seeded_random_factory(1);
        auto s1 = factory();
        auto s2 = factory();
        std::vector<uint8_t> a(32), b(32);
        s1->fill(a.data(), a.size());
        s2->fill(b.data(), b.size());
        REQUIRE(a != b);

        // Successive sources take successive seeds
        qkd::SeededRandomSource expected(2);
        std::vector<uint8_t> c(32);
        expected.fill(c.data(), c.size());
        REQUIRE(b == c);
    }

    SECTION("Sodium factory hands out independent libsodium sources") {
        qkd::RandomSourceFactory factory = qkd::sodium_random_factory();
        auto s1 = factory();
        auto s2 = factory();
        REQUIRE(s1);
        REQUIRE(s2);
        REQUIRE(s1.get() != s2.get());
        REQUIRE(dynamic_cast<qkd::SodiumRandomSource*>(s1.get()) != nullptr);

        std::vector<uint8_t> a(64), b(64);
        s1->fill(a.data(), a.size());
        s2->fill(b.data(), b.size());
        REQUIRE(a != b);
    }
}
