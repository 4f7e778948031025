// src/plan/operating_plan_validator.hpp
#pragma once

#include "plan/validation_check.hpp"
#include "plan/validation_report.hpp"

#include <memory>
#include <vector>

namespace plan {

/**
 * OperatingPlanValidator - Read-only audit of a finished plan
 *
 * Runs every registered check in registration order; all checks always
 * run and their findings are concatenated. Each validate() call builds a
 * fresh report, so one validator may be shared across threads once its
 * checks are registered.
 *
 * Usage:
 *   OperatingPlanValidator validator;   // six standard checks
 *   ValidationReport r = validator.validate(cop, profile);
 *   if (r.valid) submit(cop);
 */
class OperatingPlanValidator {
public:
    OperatingPlanValidator();
    ~OperatingPlanValidator() = default;

    // Non-copyable (owns unique_ptr checks)
    OperatingPlanValidator(const OperatingPlanValidator&) = delete;
    OperatingPlanValidator& operator=(const OperatingPlanValidator&) = delete;

    /**
     * validate() - Audit a plan against the resource it was built for
     * @throws resource::InvalidProfileError for a non-physical profile
     */
    ValidationReport validate(const OperatingPlan& plan,
                              const resource::ResourceProfile& profile) const;

    // Adds a check after the existing ones
    void register_check(std::unique_ptr<ValidationCheck> check);

    // Returns nullptr if not found
    const ValidationCheck* find_check(const char* name) const;

    size_t check_count() const { return checks_.size(); }

private:
    std::vector<std::unique_ptr<ValidationCheck>> checks_;
};

} // namespace plan
