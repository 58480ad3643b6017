/**
 * @file test_link_health.cpp
 * @brief QBER classifier and link health record
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../../src/kms/link_health.hpp"
#include "../../src/core/errors.hpp"
#include <string>

using namespace sentinel;
using Catch::Approx;

TEST_CASE("Classifier table", "[kms][health]") {
    REQUIRE(kms::classify(0.02) == kms::LinkStatus::GREEN);
    REQUIRE(kms::classify(0.08) == kms::LinkStatus::YELLOW);
    REQUIRE(kms::classify(0.20) == kms::LinkStatus::RED);

    SECTION("Boundaries") {
        REQUIRE(kms::classify(0.0) == kms::LinkStatus::GREEN);
        REQUIRE(kms::classify(0.05) == kms::LinkStatus::YELLOW);
        REQUIRE(kms::classify(0.11) == kms::LinkStatus::RED);
    }

    SECTION("Detection flag forces RED") {
        REQUIRE(kms::classify(0.0, true) == kms::LinkStatus::RED);
    }

    SECTION("Custom thresholds") {
        REQUIRE(kms::classify(0.08, false, 0.10, 0.20) == kms::LinkStatus::GREEN);
        REQUIRE(kms::classify(0.15, false, 0.10, 0.20) == kms::LinkStatus::YELLOW);
    }
}

TEST_CASE("Link status names", "[kms][health]") {
    REQUIRE(std::string(kms::link_status_to_string(kms::LinkStatus::GREEN)) == "GREEN");
    REQUIRE(std::string(kms::link_status_to_string(kms::LinkStatus::YELLOW)) == "YELLOW");
    REQUIRE(std::string(kms::link_status_to_string(kms::LinkStatus::RED)) == "RED");
}

TEST_CASE("Link health tracker", "[kms][health]") {
    kms::LinkHealthTracker tracker(0.05, 0.11);

    SECTION("Starts at baseline") {
        auto snap = tracker.snapshot();
        REQUIRE(snap);
        REQUIRE(snap->status == kms::LinkStatus::GREEN);
        REQUIRE(snap->last_qber == 0.0);
        REQUIRE(snap->keys_issued == 0);
        REQUIRE(snap->attacks_detected == 0);
    }

    SECTION("Status depends only on the latest attempt") {
        REQUIRE(tracker.record_attempt(0.30, false) == kms::LinkStatus::RED);
        REQUIRE(tracker.record_attempt(0.02, false) == kms::LinkStatus::GREEN);
        REQUIRE(tracker.record_attempt(0.08, false) == kms::LinkStatus::YELLOW);
        REQUIRE(tracker.status() == kms::LinkStatus::YELLOW);
        REQUIRE(tracker.last_qber() == Approx(0.08));
    }

    SECTION("Mutations are invisible until published") {
        tracker.record_attempt(0.25, true);
        tracker.record_attack();
        REQUIRE(tracker.snapshot()->status == kms::LinkStatus::GREEN);

        tracker.publish();
        auto snap = tracker.snapshot();
        REQUIRE(snap->status == kms::LinkStatus::RED);
        REQUIRE(snap->last_qber == Approx(0.25));
        REQUIRE(snap->attacks_detected == 1);
    }

    SECTION("Earlier snapshots stay immutable") {
        auto before = tracker.snapshot();
        tracker.record_issued();
        tracker.set_active_sessions(3);
        tracker.publish();

        REQUIRE(before->keys_issued == 0);
        REQUIRE(tracker.snapshot()->keys_issued == 1);
        REQUIRE(tracker.snapshot()->active_sessions == 3);
    }

    SECTION("Reset returns to baseline") {
        tracker.record_attempt(0.4, true);
        tracker.record_attack();
        tracker.record_issued();
        tracker.set_active_sessions(2);
        tracker.set_attack_forced(true);
        tracker.reset();
        tracker.publish();

        auto snap = tracker.snapshot();
        REQUIRE(snap->status == kms::LinkStatus::GREEN);
        REQUIRE(snap->last_qber == 0.0);
        REQUIRE(snap->keys_issued == 0);
        REQUIRE(snap->attacks_detected == 0);
        REQUIRE(snap->active_sessions == 0);
        REQUIRE_FALSE(snap->attack_forced);
    }
}

TEST_CASE("Tracker threshold validation", "[kms][health][config]") {
    REQUIRE_THROWS_AS(kms::LinkHealthTracker(0.11, 0.05), core::ConfigurationError);
    REQUIRE_THROWS_AS(kms::LinkHealthTracker(0.05, 0.05), core::ConfigurationError);
    REQUIRE_THROWS_AS(kms::LinkHealthTracker(-0.01, 0.11), core::ConfigurationError);
    REQUIRE_THROWS_AS(kms::LinkHealthTracker(0.05, 1.5), core::ConfigurationError);
}
