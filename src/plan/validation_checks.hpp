// src/plan/validation_checks.hpp
#pragma once

#include "plan/validation_check.hpp"

#include <vector>

namespace plan {

// SOC transitions beyond the physical limits by more than this are errors
constexpr double kSocFeasibilityToleranceMwh = 0.01;

// Allowed overshoot of the hourly ramp capability
constexpr double kRampTolerance = 1.05;

/**
 * SocFeasibilityCheck - SOC_INFEASIBLE_CHARGE / SOC_INFEASIBLE_DISCHARGE
 *
 * Recomputes the transition limits of each adjacent pair with the same
 * rule the generator's repair pass uses.
 */
class SocFeasibilityCheck : public ValidationCheck {
public:
    void run(const OperatingPlan& plan, const resource::ResourceProfile& profile,
             ValidationReport& report) const override;
    const char* name() const override { return "SocFeasibility"; }
};

/**
 * SocBoundsCheck - SOC_BELOW_MIN / SOC_ABOVE_MAX (errors),
 * SOC_MIN_INCONSISTENT / SOC_MAX_INCONSISTENT (warnings)
 */
class SocBoundsCheck : public ValidationCheck {
public:
    void run(const OperatingPlan& plan, const resource::ResourceProfile& profile,
             ValidationReport& report) const override;
    const char* name() const override { return "SocBounds"; }
};

/**
 * RampRateCheck - RAMP_RATE_EXCEEDED (warning)
 *
 * Only adjacent hours with the same status are compared; a status change
 * is assumed to cover startup/shutdown ramping.
 */
class RampRateCheck : public ValidationCheck {
public:
    void run(const OperatingPlan& plan, const resource::ResourceProfile& profile,
             ValidationReport& report) const override;
    const char* name() const override { return "RampRate"; }
};

// INSUFFICIENT_SOC_FOR_RRS / INSUFFICIENT_SOC_FOR_ECRS (warnings)
class AsSufficiencyCheck : public ValidationCheck {
public:
    void run(const OperatingPlan& plan, const resource::ResourceProfile& profile,
             ValidationReport& report) const override;
    const char* name() const override { return "AsSufficiency"; }
};

/**
 * CompletenessCheck - MISSING_FIELDS / NULL_VALUES (errors)
 */
class CompletenessCheck : public ValidationCheck {
public:
    void run(const OperatingPlan& plan, const resource::ResourceProfile& profile,
             ValidationReport& report) const override;
    const char* name() const override { return "Completeness"; }

    static const std::vector<PlanField>& required_fields();
};

/**
 * HorizonCheck - INSUFFICIENT_HORIZON (warning) for plans shorter than
 * 7 days, NON_CONTIGUOUS_HOURS (error) for gaps, duplicates or disorder
 */
class HorizonCheck : public ValidationCheck {
public:
    void run(const OperatingPlan& plan, const resource::ResourceProfile& profile,
             ValidationReport& report) const override;
    const char* name() const override { return "Horizon"; }
};

} // namespace plan
