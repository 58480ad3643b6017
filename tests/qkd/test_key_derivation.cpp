/**
 * @file test_key_derivation.cpp
 * @brief HKDF-SHA256 session key derivation
 */

#include <catch2/catch_test_macros.hpp>
#include "../../src/qkd/key_derivation.hpp"
#include "../../src/qkd/qkd_config.hpp"
#include "../../src/core/errors.hpp"
#include <string>
#include <vector>

using namespace sentinel;

namespace {

core::SecretBytes secret_of(uint8_t fill, size_t len = 32) {
    std::vector<uint8_t> v(len, fill);
    return core::SecretBytes(v.data(), v.size());
}

std::string hex(const core::SecretBytes& s) {
    return core::to_hex(s.data(), s.size());
}

} // namespace

TEST_CASE("HKDF-SHA256 RFC 5869 vectors", "[qkd][kdf][vectors]") {
    SECTION("Test case 1") {
        std::vector<uint8_t> salt = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06,
                                     0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c};
        core::SecretBytes ikm = secret_of(0x0b, 22);
        std::string info = "\xf0\xf1\xf2\xf3\xf4\xf5\xf6\xf7\xf8\xf9";

        core::SecretBytes okm = qkd::hkdf_sha256(salt, ikm, info, 42);
        REQUIRE(hex(okm) ==
                "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf34007208d5b887185865");
    }

    SECTION("Test case 3 (empty salt and info)") {
        core::SecretBytes ikm = secret_of(0x0b, 22);

        core::SecretBytes okm = qkd::hkdf_sha256({}, ikm, "", 42);
        REQUIRE(hex(okm) ==
                "8da4e775a563c18f715f802a063c5a31b8a11f5c5ee1879ec3454e5f3c738d2d9d201395faa4b61a96c8");
    }
}

TEST_CASE("Session key derivation", "[qkd][kdf]") {
    core::SecretBytes raw = secret_of(0x5a);

    SECTION("Output is 32 bytes") {
        REQUIRE(qkd::derive(raw, SENTINEL_LABEL_BB84).size() == qkd::SESSION_KEY_BYTES);
    }

    SECTION("Deterministic for identical inputs") {
        core::SecretBytes k1 = qkd::derive(raw, SENTINEL_LABEL_BB84);
        core::SecretBytes k2 = qkd::derive(raw, SENTINEL_LABEL_BB84);
        REQUIRE(k1.equals(k2));
    }

    SECTION("Labels separate domains") {
        core::SecretBytes k1 = qkd::derive(raw, SENTINEL_LABEL_BB84);
        core::SecretBytes k2 = qkd::derive(raw, SENTINEL_LABEL_HYBRID);
        REQUIRE_FALSE(k1.equals(k2));
    }

    SECTION("Different secrets give different keys") {
        core::SecretBytes other = secret_of(0x5b);
        REQUIRE_FALSE(qkd::derive(raw, SENTINEL_LABEL_BB84).equals(qkd::derive(other, SENTINEL_LABEL_BB84)));
    }

    SECTION("Empty secret is refused") {
        core::SecretBytes empty;
        REQUIRE_THROWS_AS(qkd::derive(empty, SENTINEL_LABEL_BB84), core::ConfigurationError);
    }
}

TEST_CASE("Hybrid derivation", "[qkd][kdf][hybrid]") {
    core::SecretBytes raw = secret_of(0x11);
    core::SecretBytes pqc = secret_of(0x22);

    SECTION("Equals HKDF over the concatenation") {
        core::SecretBytes concat;
        concat.append(raw.data(), raw.size());
        concat.append(pqc.data(), pqc.size());

        core::SecretBytes expected = qkd::derive(concat, SENTINEL_LABEL_HYBRID);
        REQUIRE(qkd::derive_hybrid(raw, pqc, SENTINEL_LABEL_HYBRID).equals(expected));
    }

    SECTION("Extra material changes the key") {
        core::SecretBytes other_pqc = secret_of(0x23);
        REQUIRE_FALSE(qkd::derive_hybrid(raw, pqc, SENTINEL_LABEL_HYBRID)
                          .equals(qkd::derive_hybrid(raw, other_pqc, SENTINEL_LABEL_HYBRID)));
    }

    SECTION("Missing material is refused") {
        core::SecretBytes empty;
        REQUIRE_THROWS_AS(qkd::derive_hybrid(raw, empty, SENTINEL_LABEL_HYBRID), core::ConfigurationError);
    }
}

TEST_CASE("HKDF length bounds", "[qkd][kdf]") {
    core::SecretBytes ikm = secret_of(0x01);
    REQUIRE_THROWS_AS(qkd::hkdf_sha256({}, ikm, "x", 0), core::ConfigurationError);
    REQUIRE_THROWS_AS(qkd::hkdf_sha256({}, ikm, "x", 255 * 32 + 1), core::ConfigurationError);
    REQUIRE(qkd::hkdf_sha256({}, ikm, "x", 255 * 32).size() == 255 * 32);
}
