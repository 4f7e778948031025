// src/plan/feasibility.cpp
#include "plan/feasibility.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>

namespace plan {

namespace {

// Rounding slack so a repaired pair is not repaired again on a second pass
constexpr double kRepairEpsilonMwh = 1e-9;

} // namespace

TransitionLimits transition_limits(double soc_begin_mwh, const resource::ResourceProfile& profile) {
    TransitionLimits limits;
    limits.max_charge_mwh = std::min(std::abs(profile.lsl()) * profile.efficiency(),
                                     profile.max_soc() - soc_begin_mwh);
    limits.max_discharge_mwh = std::min(profile.hsl(),
                                        soc_begin_mwh - profile.min_soc());
    return limits;
}

const char* to_string(RepairKind kind) {
    switch (kind) {
        case RepairKind::ChargeLimited:
            return "infeasible charge";
        case RepairKind::DischargeLimited:
        default:
            return "infeasible discharge";
    }
}

FeasibilityResult enforce_feasibility(const std::vector<double>& soc_mwh,
                                      const resource::ResourceProfile& profile) {
    profile.validate();

    FeasibilityResult result;
    result.soc_mwh = soc_mwh;
    auto& soc = result.soc_mwh;

    if (soc.empty()) {
        return result;
    }

    // An out-of-range start would make both limits of the first pair
    // meaningless, so it is clipped before the walk
    soc.front() = std::clamp(soc.front(), profile.min_soc(), profile.max_soc());

    for (size_t i = 0; i + 1 < soc.size(); ++i) {
        const double current = soc[i];
        const TransitionLimits limits = transition_limits(current, profile);
        const double delta = soc[i + 1] - current;

        if (delta > limits.max_charge_mwh + kRepairEpsilonMwh) {
            soc[i + 1] = current + limits.max_charge_mwh;
            result.repairs.push_back({i, RepairKind::ChargeLimited, delta, limits.max_charge_mwh});
        } else if (delta < -limits.max_discharge_mwh - kRepairEpsilonMwh) {
            soc[i + 1] = current - limits.max_discharge_mwh;
            result.repairs.push_back({i, RepairKind::DischargeLimited, delta, -limits.max_discharge_mwh});
        }
    }

    for (auto& value : soc) {
        value = std::clamp(value, profile.min_soc(), profile.max_soc());
    }

    return result;
}

std::vector<SocRepair> enforce_feasibility(OperatingPlan& plan,
                                           const resource::ResourceProfile& profile) {
    FeasibilityResult result = enforce_feasibility(plan.soc_sequence(), profile);

    for (size_t i = 0; i < plan.hours.size(); ++i) {
        plan.hours[i].soc_begin_mwh = result.soc_mwh[i];
    }

    for (const auto& repair : result.repairs) {
        PlanHour& hour = plan.hours[repair.hour];
        if (repair.kind == RepairKind::ChargeLimited) {
            hour.target_mw = profile.lsl();
            hour.mode = OperatingMode::Charge;
        } else {
            hour.target_mw = profile.hsl();
            hour.mode = OperatingMode::Discharge;
        }

        LOG_WARN("[Feasibility] Adjusted SOC at hour %zu - %s (requested %.2f MWh, allowed %.2f MWh)",
                 repair.hour + 1, to_string(repair.kind),
                 repair.requested_mwh, repair.allowed_mwh);
    }

    return result.repairs;
}

} // namespace plan
