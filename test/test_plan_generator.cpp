// test/test_plan_generator.cpp
/**
 * Unit Test: OperatingPlanGenerator
 *
 * Test Coverage:
 *   1. Price threshold boundaries (80 / 50 / 25)
 *   2. Default daily pattern
 *   3. Default plan shape and static fields
 *   4. Generated plans pass validation for several resources
 *   5. Price mode, partial forecasts and initial SOC
 *   6. AS commitment overlay during generation
 *   7. Invalid input
 */

#include "plan/operating_plan_generator.hpp"
#include "plan/operating_plan_validator.hpp"
#include "utils/logging.hpp"
#include "utils/time_utils.hpp"
#include <iostream>
#include <cmath>
#include <stdexcept>
#include <string>

// ANSI color codes
#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_RESET  "\033[0m"

struct TestResult {
    int passed = 0;
    int failed = 0;

    void pass(const std::string& msg) {
        std::cout << COLOR_GREEN << "  ✓ " << msg << COLOR_RESET << "\n";
        ++passed;
    }

    void fail(const std::string& msg) {
        std::cout << COLOR_RED << "  ✗ " << msg << COLOR_RESET << "\n";
        ++failed;
    }

    void check(bool ok, const std::string& msg) {
        if (ok) pass(msg); else fail(msg);
    }

    void summary() {
        std::cout << "\n========================================\n";
        if (failed == 0) {
            std::cout << COLOR_GREEN << "ALL TESTS PASSED" << COLOR_RESET;
        } else {
            std::cout << COLOR_RED << "SOME TESTS FAILED" << COLOR_RESET;
        }
        std::cout << " (" << passed << " passed, " << failed << " failed)\n";
        std::cout << "========================================\n";
    }
};

// 2024-01-01T00:00:00Z
const std::time_t kStart = 1704067200;

bool is_close(double actual, double expected, double tolerance = 1e-6) {
    return std::abs(actual - expected) < tolerance;
}

void test_price_boundaries(TestResult& result) {
    std::cout << "\n=== Test 1: Price Threshold Boundaries ===\n";

    plan::OperatingPlanGenerator gen;
    resource::ResourceProfile profile;   // 100 MW

    auto d = gen.price_dispatch(80.0, profile);
    result.check(d.mode == plan::OperatingMode::Discharge && is_close(d.target_mw, 50.0),
                 "Price 80 -> partial discharge (HSL x 0.5)");

    d = gen.price_dispatch(80.01, profile);
    result.check(d.mode == plan::OperatingMode::Discharge && is_close(d.target_mw, 100.0),
                 "Price 80.01 -> full discharge");

    d = gen.price_dispatch(50.0, profile);
    result.check(d.mode == plan::OperatingMode::Hold && d.target_mw == 0.0, "Price 50 -> hold");

    d = gen.price_dispatch(50.01, profile);
    result.check(d.mode == plan::OperatingMode::Discharge && is_close(d.target_mw, 50.0),
                 "Price 50.01 -> partial discharge");

    d = gen.price_dispatch(25.0, profile);
    result.check(d.mode == plan::OperatingMode::Hold && d.target_mw == 0.0, "Price 25 -> hold");

    d = gen.price_dispatch(24.99, profile);
    result.check(d.mode == plan::OperatingMode::Charge && is_close(d.target_mw, -100.0),
                 "Price 24.99 -> full charge");

    // Custom bands
    plan::PriceThresholds t;
    t.discharge_full_above = 200.0;
    t.discharge_partial_above = 100.0;
    t.charge_full_below = 0.0;
    plan::OperatingPlanGenerator custom(t);
    d = custom.price_dispatch(150.0, profile);
    result.check(d.mode == plan::OperatingMode::Discharge && is_close(d.target_mw, 50.0),
                 "Custom thresholds honoured");
}

void test_default_pattern(TestResult& result) {
    std::cout << "\n=== Test 2: Default Daily Pattern ===\n";

    resource::ResourceProfile profile;
    using G = plan::OperatingPlanGenerator;

    auto d = G::default_dispatch(0, profile);
    result.check(d.mode == plan::OperatingMode::Charge && is_close(d.target_mw, -80.0),
                 "Hour 0 charges at LSL x 0.8");
    d = G::default_dispatch(5, profile);
    result.check(d.mode == plan::OperatingMode::Charge, "Hour 5 charges");
    d = G::default_dispatch(6, profile);
    result.check(d.mode == plan::OperatingMode::Hold, "Hour 6 holds");
    d = G::default_dispatch(14, profile);
    result.check(d.mode == plan::OperatingMode::Discharge && is_close(d.target_mw, 90.0),
                 "Hour 14 discharges at HSL x 0.9");
    d = G::default_dispatch(19, profile);
    result.check(d.mode == plan::OperatingMode::Discharge, "Hour 19 discharges");
    d = G::default_dispatch(20, profile);
    result.check(d.mode == plan::OperatingMode::Hold, "Hour 20 holds");
}

void test_default_plan_shape(TestResult& result) {
    std::cout << "\n=== Test 3: Default Plan Shape ===\n";

    resource::ResourceProfileParams p;
    p.resource_name = "BESS_WEST_100MW";
    resource::ResourceProfile profile(p);

    plan::OperatingPlanGenerator gen;
    auto cop = gen.generate(profile, kStart);

    result.check(cop.size() == 168, "168 hours by default");
    result.check(cop.resource_name == "BESS_WEST_100MW", "Resource name copied");
    result.check(cop.resource_type == "ESR" && cop.fuel_type == "BATTERY", "Resource and fuel type set");
    result.check(cop.hours.front().hour_ending == kStart, "First hour_ending is the start time");
    result.check(cop.hours.back().hour_ending == kStart + 167 * utils::kSecondsPerHour,
                 "Last hour_ending is start + 167 h");
    result.check(is_close(cop.hours.front().soc_begin_mwh, 100.0), "Initial SOC is 50% of max_soc");

    const auto& h = cop.hours[10];
    result.check(h.status == resource::ResourceStatus::ON, "Status ON without commitments");
    result.check(h.hsl == 100.0 && h.lsl == -100.0, "HSL/LSL from capacity");
    result.check(h.hel == h.hsl && h.lel == h.lsl, "HEL/LEL equal HSL/LSL");
    result.check(is_close(h.emergency_ramp_up, 75.0), "Emergency ramp is 1.5 x normal");
    result.check(h.aux_load_mw == 2.0, "Aux load from profile");

    bool all_fields = true;
    for (auto f : plan::all_plan_fields()) {
        if (!cop.has_field(f)) all_fields = false;
    }
    result.check(all_fields, "Plan carries every field");

    bool bounded = true;
    for (const auto& hr : cop.hours) {
        if (hr.soc_begin_mwh < profile.min_soc() || hr.soc_begin_mwh > profile.max_soc()) bounded = false;
    }
    result.check(bounded, "Every soc_begin within [min_soc, max_soc]");
}

void test_generated_plans_validate(TestResult& result) {
    std::cout << "\n=== Test 4: Generated Plans Validate ===\n";

    plan::OperatingPlanGenerator gen;
    plan::OperatingPlanValidator validator;

    resource::ResourceProfileParams profiles[4];
    profiles[0].resource_name = "DEFAULT";

    profiles[1].resource_name = "SMALL_4H";
    profiles[1].capacity_mw = 10.0;
    profiles[1].capacity_mwh = 40.0;
    profiles[1].round_trip_efficiency = 0.9;
    profiles[1].min_soc_mwh = 4.0;
    profiles[1].max_soc_mwh = 40.0;

    profiles[2].resource_name = "SHORT_LOSSY";
    profiles[2].capacity_mw = 50.0;
    profiles[2].capacity_mwh = 25.0;
    profiles[2].round_trip_efficiency = 0.5;
    profiles[2].min_soc_mwh = 2.5;
    profiles[2].max_soc_mwh = 25.0;

    profiles[3].resource_name = "SLOW_RAMP";
    profiles[3].ramp_up_mw_per_min = 0.5;
    profiles[3].ramp_down_mw_per_min = 0.5;

    for (const auto& p : profiles) {
        resource::ResourceProfile profile(p);
        auto cop = gen.generate(profile, kStart, 168);
        auto report = validator.validate(cop, profile);
        result.check(report.valid && report.error_count() == 0,
                     p.resource_name + ": default plan valid (" + report.summary + ")");
        result.check(!report.has(plan::IssueType::SocMinInconsistent) &&
                     !report.has(plan::IssueType::SocMaxInconsistent),
                     p.resource_name + ": SOC bracket consistent");
    }

    // Start mid-afternoon so discharge comes first
    resource::ResourceProfile profile;
    auto cop = gen.generate(profile, kStart + 15 * utils::kSecondsPerHour, 168);
    auto report = validator.validate(cop, profile);
    result.check(report.valid, "Afternoon start plan valid");
    result.check(report.warning_count() == 0, "Default resource plan has no warnings");
}

void test_price_mode(TestResult& result) {
    std::cout << "\n=== Test 5: Price Mode ===\n";

    resource::ResourceProfile profile;   // 100 MW / 200 MWh, eff 0.86
    plan::OperatingPlanGenerator gen;

    plan::PriceForecast prices;
    prices[kStart] = 100.0;                              // full discharge
    prices[kStart + utils::kSecondsPerHour] = 10.0;      // full charge
    prices[kStart + 2 * utils::kSecondsPerHour] = 50.0;  // hold

    auto cop = gen.generate(profile, kStart, 24, prices);

    result.check(cop.size() == 24, "Horizon honoured");
    result.check(cop.hours[0].mode == plan::OperatingMode::Discharge && cop.hours[0].target_mw == 100.0,
                 "Hour 0 discharges at HSL");
    result.check(is_close(cop.hours[1].soc_begin_mwh, 0.0), "SOC drops to 0 after full discharge");
    result.check(cop.hours[1].mode == plan::OperatingMode::Charge && cop.hours[1].target_mw == -100.0,
                 "Hour 1 charges at LSL");
    result.check(is_close(cop.hours[2].soc_begin_mwh, 86.0), "Charge applies efficiency (86 MWh)");
    result.check(cop.hours[2].mode == plan::OperatingMode::Hold, "Hour 2 holds at price 50");
    result.check(cop.hours[10].mode == plan::OperatingMode::Hold, "Uncovered hour uses neutral price");

    auto with_soc = gen.generate(profile, kStart, 24, prices, std::nullopt, 150.0);
    result.check(is_close(with_soc.hours[0].soc_begin_mwh, 150.0), "Explicit initial SOC used");

    auto clamped = gen.generate(profile, kStart, 24, std::nullopt, std::nullopt, 500.0);
    result.check(is_close(clamped.hours[0].soc_begin_mwh, 200.0), "Initial SOC above max clamped");
}

void test_commitments_in_generation(TestResult& result) {
    std::cout << "\n=== Test 6: Commitments During Generation ===\n";

    resource::ResourceProfile profile;
    plan::OperatingPlanGenerator gen;

    plan::CommitmentSchedule as;
    as[kStart + 8 * utils::kSecondsPerHour].regulation_mw = 10.0;
    as[kStart + 9 * utils::kSecondsPerHour].rrs_mw = 20.0;

    auto cop = gen.generate(profile, kStart, 48, std::nullopt, as);

    result.check(cop.hours[8].status == resource::ResourceStatus::ONREG, "Hour 8 ONREG");
    result.check(cop.hours[8].target_mw == 0.0, "Regulation hour energy neutral");
    result.check(cop.hours[9].status == resource::ResourceStatus::ONRR, "Hour 9 ONRR");
    result.check(cop.hours[9].soc_min_mwh >= 20.0, "RRS raises soc_min to 20 MWh");
    result.check(cop.hours[10].status == resource::ResourceStatus::ON, "Other hours stay ON");
}

void test_invalid_input(TestResult& result) {
    std::cout << "\n=== Test 7: Invalid Input ===\n";

    plan::OperatingPlanGenerator gen;

    resource::ResourceProfileParams p;
    p.capacity_mw = 0.0;
    try {
        gen.generate(resource::ResourceProfile(p), kStart);
        result.fail("Zero capacity accepted");
    } catch (const resource::InvalidProfileError&) {
        result.pass("Zero capacity raises InvalidProfileError");
    }

    p = {};
    p.min_soc_mwh = 200.0;
    p.max_soc_mwh = 100.0;
    try {
        gen.generate(resource::ResourceProfile(p), kStart);
        result.fail("Inverted SOC range accepted");
    } catch (const resource::InvalidProfileError&) {
        result.pass("Inverted SOC range raises InvalidProfileError");
    }

    try {
        gen.generate(resource::ResourceProfile(), kStart, 0);
        result.fail("Zero horizon accepted");
    } catch (const std::invalid_argument&) {
        result.pass("Zero horizon raises invalid_argument");
    }
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            OperatingPlanGenerator Unit Tests                 ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    utils::set_level(utils::LogLevel::Error);

    TestResult result;

    test_price_boundaries(result);
    test_default_pattern(result);
    test_default_plan_shape(result);
    test_generated_plans_validate(result);
    test_price_mode(result);
    test_commitments_in_generation(result);
    test_invalid_input(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
