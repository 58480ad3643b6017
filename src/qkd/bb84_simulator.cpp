#include "bb84_simulator.hpp"
#include "../core/errors.hpp"

#include <cmath>
#include <numeric>
#include <string>
#include <utility>

namespace sentinel {
namespace qkd {

namespace {

struct SiftedPosition {
    uint8_t alice_bit;
    uint8_t bob_bit;
};

} // namespace

SimulationParams SimulationParams::from_config(const ChannelConfig& cfg, bool eavesdropper_present) {
    SimulationParams p;
    p.bit_count = cfg.bit_count;
    p.eavesdropper_present = eavesdropper_present;
    p.intercept_rate = cfg.intercept_rate;
    p.noise_level = cfg.noise_level;
    p.disclosed_fraction = cfg.disclosed_fraction;
    p.raw_secret_bits = cfg.raw_secret_bits;
    p.security_threshold = cfg.security_threshold;
    return p;
}

void SimulationParams::validate() const {
    ChannelConfig cfg;
    cfg.bit_count = bit_count;
    cfg.intercept_rate = intercept_rate;
    cfg.noise_level = noise_level;
    cfg.disclosed_fraction = disclosed_fraction;
    cfg.raw_secret_bits = raw_secret_bits;
    cfg.security_threshold = security_threshold;
    cfg.safe_threshold = 0.0;
    if (!(security_threshold > 0.0)) {
        throw core::ConfigurationError("security_threshold must be positive");
    }
    cfg.validate();
}

std::vector<uint8_t> pack_bits_msb_first(const std::vector<uint8_t>& bits) {
    std::vector<uint8_t> out((bits.size() + 7) / 8, 0);
    for (size_t i = 0; i < bits.size(); ++i) {
        if (bits[i] & 1u) {
            out[i / 8] |= static_cast<uint8_t>(0x80u >> (i % 8));
        }
    }
    return out;
}

size_t disclosed_sample_size(size_t sifted_bits, double fraction) {
    if (sifted_bits == 0) {
        return 0;
    }
    double exact = std::ceil(fraction * static_cast<double>(sifted_bits));
    size_t n = static_cast<size_t>(exact);
    if (n == 0) n = 1;
    if (n > sifted_bits) n = sifted_bits;
    return n;
}

QuantumChannelSimulator::QuantumChannelSimulator(const ChannelConfig& config)
    : config_(config) {
    config_.validate();
}

SimulationResult QuantumChannelSimulator::run(size_t bit_count,
                                              bool eavesdropper_present,
                                              double intercept_rate,
                                              double noise_level,
                                              RandomSource& rng) const {
    SimulationParams p = SimulationParams::from_config(config_, eavesdropper_present);
    p.bit_count = bit_count;
    p.intercept_rate = intercept_rate;
    p.noise_level = noise_level;
    return simulate(p, rng);
}

SimulationResult QuantumChannelSimulator::run(bool eavesdropper_present, RandomSource& rng) const {
    return simulate(SimulationParams::from_config(config_, eavesdropper_present), rng);
}

SimulationResult QuantumChannelSimulator::simulate(const SimulationParams& params, RandomSource& rng) {
    params.validate();

    SimulationResult result;
    std::vector<SiftedPosition> sifted;
    sifted.reserve(params.bit_count / 2 + 64);

    // Preparation, transmission, measurement and sifting in one pass.
    // Draw order per position: Alice bit, Alice basis, Bob basis, then
    // Eve's intercept draw and basis, then channel noise.
    for (size_t i = 0; i < params.bit_count; ++i) {
        const uint8_t alice_bit = rng.bit();
        const uint8_t alice_basis = rng.bit();
        const uint8_t bob_basis = rng.bit();

        uint8_t photon_bit = alice_bit;
        uint8_t photon_basis = alice_basis;

        if (params.eavesdropper_present && rng.chance(params.intercept_rate)) {
            ++result.intercepted_positions;
            const uint8_t eve_basis = rng.bit();
            // Measuring in the wrong basis yields a random outcome, which
            // Eve re-sends prepared in her own basis
            photon_bit = (eve_basis == alice_basis) ? alice_bit : rng.bit();
            photon_basis = eve_basis;
        }

        // Bob only learns the photon bit when his basis matches its preparation
        uint8_t bob_bit = (bob_basis == photon_basis) ? photon_bit : rng.bit();

        if (rng.chance(params.noise_level)) {
            bob_bit ^= 1u;
        }

        if (alice_basis == bob_basis) {
            sifted.push_back(SiftedPosition{alice_bit, bob_bit});
        }
    }

    result.sifted_bits = sifted.size();
    result.sample_size = disclosed_sample_size(sifted.size(), params.disclosed_fraction);

    if (result.sample_size == 0) {
        // QBER over an empty sample is undefined, never zero
        throw core::InsufficientKeyMaterialError(0, params.raw_secret_bits);
    }

    // Choose a uniformly random disclosed subset (partial Fisher-Yates)
    std::vector<size_t> order(sifted.size());
    std::iota(order.begin(), order.end(), size_t{0});
    for (size_t i = 0; i < result.sample_size; ++i) {
        size_t j = i + static_cast<size_t>(rng.below(order.size() - i));
        std::swap(order[i], order[j]);
    }

    std::vector<uint8_t> disclosed(sifted.size(), 0);
    for (size_t i = 0; i < result.sample_size; ++i) {
        const SiftedPosition& pos = sifted[order[i]];
        disclosed[order[i]] = 1;
        if (pos.alice_bit != pos.bob_bit) {
            ++result.sample_mismatches;
        }
    }

    result.qber = static_cast<double>(result.sample_mismatches) /
                  static_cast<double>(result.sample_size);
    result.eavesdropper_detected = result.qber > params.security_threshold;

    // Retained bits keep their sifted order; sample positions are excluded
    std::vector<uint8_t> retained;
    retained.reserve(sifted.size() - result.sample_size);
    for (size_t i = 0; i < sifted.size(); ++i) {
        if (!disclosed[i]) {
            retained.push_back(sifted[i].alice_bit);
        }
    }
    result.retained_bits = retained.size();

    if (retained.size() < params.raw_secret_bits) {
        core::secure_zero_memory(retained.data(), retained.size());
        throw core::InsufficientKeyMaterialError(retained.size(), params.raw_secret_bits);
    }

    retained.resize(params.raw_secret_bits);
    std::vector<uint8_t> packed = pack_bits_msb_first(retained);
    result.raw_secret = core::SecretBytes(packed.data(), packed.size());

    core::secure_zero_memory(packed.data(), packed.size());
    core::secure_zero_memory(retained.data(), retained.size());
    for (SiftedPosition& pos : sifted) {
        pos.alice_bit = 0;
        pos.bob_bit = 0;
    }

    return result;
}

} // namespace qkd
} // namespace sentinel
