// src/plan/operating_plan_validator.cpp
#include "plan/operating_plan_validator.hpp"
#include "plan/validation_checks.hpp"
#include "utils/logging.hpp"

#include <cstring>
#include <utility>

namespace plan {

OperatingPlanValidator::OperatingPlanValidator() {
    register_check(std::make_unique<SocFeasibilityCheck>());
    register_check(std::make_unique<SocBoundsCheck>());
    register_check(std::make_unique<RampRateCheck>());
    register_check(std::make_unique<AsSufficiencyCheck>());
    register_check(std::make_unique<CompletenessCheck>());
    register_check(std::make_unique<HorizonCheck>());
}

void OperatingPlanValidator::register_check(std::unique_ptr<ValidationCheck> check) {
    if (!check) {
        LOG_WARN("[OperatingPlanValidator] Ignoring null check");
        return;
    }
    LOG_DEBUG("[OperatingPlanValidator] Registered check: %s", check->name());
    checks_.push_back(std::move(check));
}

const ValidationCheck* OperatingPlanValidator::find_check(const char* name) const {
    for (const auto& check : checks_) {
        if (std::strcmp(check->name(), name) == 0) {
            return check.get();
        }
    }
    return nullptr;
}

ValidationReport OperatingPlanValidator::validate(const OperatingPlan& plan,
                                                  const resource::ResourceProfile& profile) const {
    profile.validate();

    ValidationReport report;
    for (const auto& check : checks_) {
        const size_t before = report.error_count() + report.warning_count();
        check->run(plan, profile, report);
        LOG_DEBUG("[OperatingPlanValidator] %s: %zu findings",
                  check->name(), report.error_count() + report.warning_count() - before);
    }
    report.finalize();

    if (report.valid) {
        LOG_INFO("[OperatingPlanValidator] %s (%zu hours, %zu warnings)",
                 report.summary.c_str(), plan.size(), report.warning_count());
    } else {
        LOG_WARN("[OperatingPlanValidator] %s (%zu warnings)",
                 report.summary.c_str(), report.warning_count());
    }

    for (const auto& e : report.errors) {
        LOG_DEBUG("[OperatingPlanValidator] %s %s: %s",
                  to_string(e.severity), to_string(e.type), e.message.c_str());
    }

    return report;
}

} // namespace plan
