// src/plan/operating_plan_generator.cpp
#include "plan/operating_plan_generator.hpp"
#include "plan/feasibility.hpp"
#include "plan/plan_assembler.hpp"
#include "utils/logging.hpp"
#include "utils/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace plan {

namespace {

// Default pattern power levels as fractions of HSL/LSL
constexpr double kNightChargeFraction = 0.8;
constexpr double kPeakDischargeFraction = 0.9;
constexpr double kPartialDischargeFraction = 0.5;

} // namespace

OperatingPlanGenerator::OperatingPlanGenerator(const PriceThresholds& thresholds)
    : thresholds_(thresholds) {}

OperatingPlan OperatingPlanGenerator::generate(const resource::ResourceProfile& profile,
                                               std::time_t start_time,
                                               int horizon_hours,
                                               const std::optional<PriceForecast>& price_forecast,
                                               const std::optional<CommitmentSchedule>& as_commitments,
                                               std::optional<double> initial_soc) const {
    profile.validate();

    if (horizon_hours <= 0) {
        throw std::invalid_argument("[OperatingPlanGenerator] horizon_hours must be > 0, got " +
                                    std::to_string(horizon_hours));
    }

    LOG_INFO("[OperatingPlanGenerator] %s: %d hours from %s (%s mode)",
             profile.resource_name().c_str(), horizon_hours,
             utils::format_iso8601_utc(start_time).c_str(),
             price_forecast ? "price" : "default");

    OperatingPlan cop = build_skeleton(profile, start_time, horizon_hours, price_forecast);

    double soc0 = initial_soc.value_or(profile.max_soc() * 0.5);
    if (soc0 < profile.min_soc() || soc0 > profile.max_soc()) {
        const double clamped = std::clamp(soc0, profile.min_soc(), profile.max_soc());
        LOG_WARN("[OperatingPlanGenerator] Initial SOC %.2f MWh outside [%.2f, %.2f], using %.2f",
                 soc0, profile.min_soc(), profile.max_soc(), clamped);
        soc0 = clamped;
    }

    compute_soc_trajectory(cop, profile, soc0);

    const auto repairs = enforce_feasibility(cop, profile);
    if (!repairs.empty()) {
        // Keep the working bracket around the repaired trajectory
        for (auto& hour : cop.hours) {
            refresh_soc_bracket(hour, profile);
        }
        LOG_INFO("[OperatingPlanGenerator] %zu SOC transitions repaired", repairs.size());
    }

    if (as_commitments) {
        AncillaryCommitmentApplier applier;
        cop = applier.apply(cop, *as_commitments);
    }

    PlanAssembler::assemble(cop, profile);

    LOG_DEBUG("[OperatingPlanGenerator] SOC %.2f MWh at start, %.2f MWh at hour %zu",
              cop.hours.front().soc_begin_mwh, cop.hours.back().soc_begin_mwh, cop.hours.size() - 1);

    return cop;
}

OperatingPlan OperatingPlanGenerator::build_skeleton(const resource::ResourceProfile& profile,
                                                     std::time_t start_time,
                                                     int horizon_hours,
                                                     const std::optional<PriceForecast>& price_forecast) const {
    OperatingPlan cop;
    cop.resource_name = profile.resource_name();
    cop.hours.resize(static_cast<size_t>(horizon_hours));

    size_t priced_hours = 0;

    for (size_t i = 0; i < cop.hours.size(); ++i) {
        PlanHour& hour = cop.hours[i];
        const std::time_t t = start_time + static_cast<std::time_t>(i) * utils::kSecondsPerHour;

        hour.hour_ending = t;
        hour.status = resource::ResourceStatus::ON;
        hour.hsl = profile.hsl();
        hour.lsl = profile.lsl();

        HourlyDispatch dispatch;
        if (price_forecast) {
            double price = thresholds_.neutral_price;
            const auto it = price_forecast->find(t);
            if (it != price_forecast->end() && !std::isnan(it->second)) {
                price = it->second;
                ++priced_hours;
            }
            dispatch = price_dispatch(price, profile);
        } else {
            dispatch = default_dispatch(utils::hour_of_day_utc(t), profile);
        }

        hour.mode = dispatch.mode;
        hour.target_mw = dispatch.target_mw;
    }

    if (price_forecast && priced_hours < cop.hours.size()) {
        LOG_WARN("[OperatingPlanGenerator] Price forecast covers %zu of %zu hours, "
                 "uncovered hours use neutral price %.2f",
                 priced_hours, cop.hours.size(), thresholds_.neutral_price);
    }

    cop.fields.insert({PlanField::HourEnding, PlanField::Status,
                       PlanField::Hsl, PlanField::Lsl,
                       PlanField::TargetMw, PlanField::Mode});
    return cop;
}

HourlyDispatch OperatingPlanGenerator::default_dispatch(int hour_of_day,
                                                        const resource::ResourceProfile& profile) {
    if (hour_of_day >= 0 && hour_of_day < 6) {
        // Night - charge
        return {OperatingMode::Charge, profile.lsl() * kNightChargeFraction};
    }
    if (hour_of_day >= 14 && hour_of_day < 20) {
        // Afternoon peak - discharge
        return {OperatingMode::Discharge, profile.hsl() * kPeakDischargeFraction};
    }
    // Morning [6,10) and all other hours hold
    return {OperatingMode::Hold, 0.0};
}

HourlyDispatch OperatingPlanGenerator::price_dispatch(double price,
                                                      const resource::ResourceProfile& profile) const {
    if (price > thresholds_.discharge_full_above) {
        return {OperatingMode::Discharge, profile.hsl()};
    }
    if (price < thresholds_.charge_full_below) {
        return {OperatingMode::Charge, profile.lsl()};
    }
    if (price > thresholds_.discharge_partial_above) {
        return {OperatingMode::Discharge, profile.hsl() * kPartialDischargeFraction};
    }
    return {OperatingMode::Hold, 0.0};
}

void OperatingPlanGenerator::compute_soc_trajectory(OperatingPlan& plan,
                                                    const resource::ResourceProfile& profile,
                                                    double initial_soc) {
    for (size_t i = 0; i < plan.hours.size(); ++i) {
        PlanHour& hour = plan.hours[i];

        if (i == 0) {
            hour.soc_begin_mwh = initial_soc;
        } else {
            const PlanHour& prev = plan.hours[i - 1];
            double soc_change = 0.0;
            if (prev.target_mw > 0.0) {
                soc_change = -prev.target_mw;
            } else if (prev.target_mw < 0.0) {
                soc_change = -prev.target_mw * profile.efficiency();
            }
            hour.soc_begin_mwh = prev.soc_begin_mwh + soc_change;
        }

        refresh_soc_bracket(hour, profile);
    }

    plan.fields.insert({PlanField::SocBegin, PlanField::SocMin, PlanField::SocMax});
}

void OperatingPlanGenerator::refresh_soc_bracket(PlanHour& hour,
                                                 const resource::ResourceProfile& profile) {
    hour.soc_min_mwh = std::max(profile.min_soc(), hour.soc_begin_mwh - profile.hsl());
    hour.soc_max_mwh = std::min(profile.max_soc(),
                                hour.soc_begin_mwh + std::abs(profile.lsl()) * profile.efficiency());
}

} // namespace plan
