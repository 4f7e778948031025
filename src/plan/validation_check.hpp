// src/plan/validation_check.hpp
#pragma once

#include "plan/operating_plan.hpp"
#include "plan/validation_report.hpp"
#include "resource/resource_profile.hpp"

namespace plan {

/**
 * ValidationCheck - Base class for one family of plan rules
 *
 * A check only reads the plan and appends findings to the report it is
 * given. Checks hold no per-run state, so one validator can audit many
 * plans concurrently.
 *
 * Families:
 *   SocFeasibilityCheck, SocBoundsCheck, RampRateCheck,
 *   AsSufficiencyCheck, CompletenessCheck, HorizonCheck
 */
class ValidationCheck {
public:
    virtual ~ValidationCheck() = default;

    virtual void run(const OperatingPlan& plan,
                     const resource::ResourceProfile& profile,
                     ValidationReport& report) const = 0;

    // Identifier for logging and lookup
    virtual const char* name() const = 0;
};

} // namespace plan
