// src/plan/ancillary_commitment_applier.hpp
#pragma once

#include "plan/operating_plan.hpp"

#include <ctime>
#include <map>
#include <optional>
#include <vector>

namespace plan {

// Ancillary-service award for one hour (MW)
struct AsCommitment {
    double regulation_mw = 0.0;
    double rrs_mw = 0.0;
    double ecrs_mw = 0.0;
};

// hour_ending -> commitment
using CommitmentSchedule = std::map<std::time_t, AsCommitment>;

enum class AsProduct {
    Regulation,
    ResponsiveReserve,   // RRS
    Ecrs
};

const char* to_string(AsProduct product);

// Hours of energy that must be held per committed MW (0 for regulation)
double reserve_hours(AsProduct product);

double committed_mw(const AsCommitment& commitment, AsProduct product);

// Regulation, then RRS, then ECRS
const std::vector<AsProduct>& default_as_priority();

/**
 * AncillaryCommitmentApplier - Overlays AS awards onto a plan
 *
 * For every committed hour present in the plan, the first product in the
 * priority list with a positive award is applied:
 *   Regulation -> status ONREG, target 0 (treated as energy neutral)
 *   RRS        -> status ONRR,   soc_min >= 1 h x MW
 *   ECRS       -> status ONECRS, soc_min >= 2 h x MW
 * Lower-priority awards in the same hour are ignored.
 *
 * Usage:
 *   AncillaryCommitmentApplier applier;
 *   OperatingPlan with_as = applier.apply(plan, schedule);
 */
class AncillaryCommitmentApplier {
public:
    explicit AncillaryCommitmentApplier(std::vector<AsProduct> priority = default_as_priority());

    // Returns a modified copy; the input plan is untouched
    OperatingPlan apply(const OperatingPlan& plan, const CommitmentSchedule& commitments) const;

    // Product that wins for this commitment, if any award is positive
    std::optional<AsProduct> select_product(const AsCommitment& commitment) const;

    const std::vector<AsProduct>& priority() const { return priority_; }

private:
    std::vector<AsProduct> priority_;

    static void overlay(PlanHour& hour, AsProduct product, double mw);
};

} // namespace plan
