// src/plan/feasibility.hpp
#pragma once

#include "plan/operating_plan.hpp"
#include "resource/resource_profile.hpp"

#include <cstddef>
#include <vector>

namespace plan {

/**
 * TransitionLimits - Largest SOC change the resource can make in one hour
 *
 *   max_charge_mwh    = min(|LSL| * eff, max_soc - soc_begin)
 *   max_discharge_mwh = min(HSL, soc_begin - min_soc)
 *
 * Shared by the repair pass and the validator so both use the same rule.
 */
struct TransitionLimits {
    double max_charge_mwh = 0.0;
    double max_discharge_mwh = 0.0;
};

TransitionLimits transition_limits(double soc_begin_mwh, const resource::ResourceProfile& profile);

enum class RepairKind {
    ChargeLimited,     // SOC rise clamped, target forced to LSL
    DischargeLimited   // SOC drop clamped, target forced to HSL
};

const char* to_string(RepairKind kind);

/**
 * SocRepair - One clamped transition
 *
 * hour is the index i of the pair (i, i+1); soc_begin[i+1] was moved and
 * target[i] was forced.
 */
struct SocRepair {
    size_t hour = 0;
    RepairKind kind = RepairKind::ChargeLimited;
    double requested_mwh = 0.0;   // delta before repair
    double allowed_mwh = 0.0;     // delta after repair
};

struct FeasibilityResult {
    std::vector<double> soc_mwh;
    std::vector<SocRepair> repairs;
};

/**
 * enforce_feasibility() - Repair an SOC sequence so every hourly
 * transition is physically reachable
 *
 * Walks adjacent pairs in order and clamps soc[i+1] into
 * [soc[i] - max_discharge, soc[i] + max_charge]; clamped values feed the
 * next pair. The first element is clipped into [min_soc, max_soc] before
 * the walk and every element after it. Repairs, never rejects.
 *
 * Idempotent: a repaired sequence passes through unchanged.
 *
 * @throws resource::InvalidProfileError for a non-physical profile
 */
FeasibilityResult enforce_feasibility(const std::vector<double>& soc_mwh,
                                      const resource::ResourceProfile& profile);

/**
 * enforce_feasibility() - In-place variant over a plan
 *
 * Applies the sequence repair to soc_begin and forces target_mw/mode of
 * each repaired hour (LSL/charge or HSL/discharge). Logs each repair.
 */
std::vector<SocRepair> enforce_feasibility(OperatingPlan& plan,
                                           const resource::ResourceProfile& profile);

} // namespace plan
