// src/plan/operating_plan_generator.hpp
#pragma once

#include "plan/ancillary_commitment_applier.hpp"
#include "plan/operating_plan.hpp"
#include "resource/resource_profile.hpp"

#include <ctime>
#include <map>
#include <optional>

namespace plan {

// hour_ending -> price ($/MWh)
using PriceForecast = std::map<std::time_t, double>;

/**
 * PriceThresholds - Price bands for the threshold dispatch rule
 *
 * Boundary convention (all comparisons strict):
 *   price >  discharge_full_above     -> discharge at HSL
 *   price <  charge_full_below        -> charge at LSL
 *   price >  discharge_partial_above  -> discharge at HSL * 0.5
 *   otherwise                         -> hold
 * With the defaults: 80 -> partial discharge, 50 -> hold, 25 -> hold.
 */
struct PriceThresholds {
    double discharge_full_above = 80.0;
    double discharge_partial_above = 50.0;
    double charge_full_below = 25.0;

    // Used for hours the forecast does not cover
    double neutral_price = 50.0;
};

struct HourlyDispatch {
    OperatingMode mode = OperatingMode::Hold;
    double target_mw = 0.0;
};

/**
 * OperatingPlanGenerator - Builds a feasible hourly operating plan
 *
 * Pipeline:
 *   1. Dispatch skeleton (default daily pattern or price thresholds)
 *   2. SOC trajectory from the targets
 *   3. Feasibility repair (see enforce_feasibility)
 *   4. AS commitment overlay (optional)
 *   5. Static COP fields (PlanAssembler)
 *
 * Stateless apart from the thresholds; safe to share between threads.
 *
 * Usage:
 *   OperatingPlanGenerator gen;
 *   OperatingPlan cop = gen.generate(profile, start, 168);
 */
class OperatingPlanGenerator {
public:
    explicit OperatingPlanGenerator(const PriceThresholds& thresholds = {});

    /**
     * generate() - Produce a complete plan
     * @param profile Resource parameters
     * @param start_time First hour_ending (UTC epoch seconds)
     * @param horizon_hours Number of hourly records (> 0)
     * @param price_forecast Selects price mode when present
     * @param as_commitments Overlaid after feasibility repair when present
     * @param initial_soc Starting SOC in MWh (default 50% of max_soc)
     * @throws resource::InvalidProfileError for a non-physical profile
     * @throws std::invalid_argument if horizon_hours <= 0
     */
    OperatingPlan generate(const resource::ResourceProfile& profile,
                           std::time_t start_time,
                           int horizon_hours = kDefaultHorizonHours,
                           const std::optional<PriceForecast>& price_forecast = std::nullopt,
                           const std::optional<CommitmentSchedule>& as_commitments = std::nullopt,
                           std::optional<double> initial_soc = std::nullopt) const;

    // Fixed diurnal pattern by UTC hour of day
    static HourlyDispatch default_dispatch(int hour_of_day, const resource::ResourceProfile& profile);

    HourlyDispatch price_dispatch(double price, const resource::ResourceProfile& profile) const;

    /**
     * compute_soc_trajectory() - Fill soc_begin and the working bracket
     *
     * soc_begin[i] = soc_begin[i-1] - target[i-1]        (discharge)
     *              = soc_begin[i-1] - target[i-1] * eff  (charge)
     */
    static void compute_soc_trajectory(OperatingPlan& plan,
                                       const resource::ResourceProfile& profile,
                                       double initial_soc);

    // soc_min = max(min_soc, soc - HSL), soc_max = min(max_soc, soc + |LSL| * eff)
    static void refresh_soc_bracket(PlanHour& hour, const resource::ResourceProfile& profile);

    const PriceThresholds& thresholds() const { return thresholds_; }

private:
    PriceThresholds thresholds_;

    OperatingPlan build_skeleton(const resource::ResourceProfile& profile,
                                 std::time_t start_time,
                                 int horizon_hours,
                                 const std::optional<PriceForecast>& price_forecast) const;
};

} // namespace plan
