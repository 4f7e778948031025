// src/plan/validation_checks.cpp
#include "plan/validation_checks.hpp"
#include "plan/ancillary_commitment_applier.hpp"
#include "plan/feasibility.hpp"
#include "utils/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <string>
#include <utility>

namespace plan {

namespace {

std::string format_message(const char* fmt, ...) {
    char buf[512];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    return buf;
}

ValidationIssue make_issue(IssueType type, std::optional<size_t> hour,
                           std::string message, Severity severity) {
    ValidationIssue issue;
    issue.type = type;
    issue.hour = hour;
    issue.message = std::move(message);
    issue.severity = severity;
    return issue;
}

} // namespace

// ============================================================================
// SOC feasibility
// ============================================================================

void SocFeasibilityCheck::run(const OperatingPlan& plan,
                              const resource::ResourceProfile& profile,
                              ValidationReport& report) const {
    for (size_t i = 0; i + 1 < plan.hours.size(); ++i) {
        const double current = plan.hours[i].soc_begin_mwh;
        const double next = plan.hours[i + 1].soc_begin_mwh;
        if (std::isnan(current) || std::isnan(next)) {
            continue;  // reported by CompletenessCheck
        }

        const TransitionLimits limits = transition_limits(current, profile);
        const double soc_change = next - current;

        if (soc_change > limits.max_charge_mwh + kSocFeasibilityToleranceMwh) {
            report.add(make_issue(IssueType::SocInfeasibleCharge, i,
                                  format_message("Hour %zu: Cannot charge %.1f MWh (max: %.1f)",
                                                 i, soc_change, limits.max_charge_mwh),
                                  Severity::Error));
        } else if (soc_change < -(limits.max_discharge_mwh + kSocFeasibilityToleranceMwh)) {
            report.add(make_issue(IssueType::SocInfeasibleDischarge, i,
                                  format_message("Hour %zu: Cannot discharge %.1f MWh (max: %.1f)",
                                                 i, -soc_change, limits.max_discharge_mwh),
                                  Severity::Error));
        }
    }
}

// ============================================================================
// SOC bounds
// ============================================================================

void SocBoundsCheck::run(const OperatingPlan& plan,
                         const resource::ResourceProfile& profile,
                         ValidationReport& report) const {
    for (size_t i = 0; i < plan.hours.size(); ++i) {
        const PlanHour& hour = plan.hours[i];
        const double soc = hour.soc_begin_mwh;
        if (std::isnan(soc)) {
            continue;
        }

        if (soc < profile.min_soc()) {
            report.add(make_issue(IssueType::SocBelowMin, i,
                                  format_message("Hour %zu: SOC %.1f below minimum %.1f",
                                                 i, soc, profile.min_soc()),
                                  Severity::Error));
        } else if (soc > profile.max_soc()) {
            report.add(make_issue(IssueType::SocAboveMax, i,
                                  format_message("Hour %zu: SOC %.1f above maximum %.1f",
                                                 i, soc, profile.max_soc()),
                                  Severity::Error));
        }

        if (hour.soc_min_mwh > soc) {
            report.add(make_issue(IssueType::SocMinInconsistent, i,
                                  format_message("Hour %zu: MinSOC %.1f > Beginning SOC %.1f",
                                                 i, hour.soc_min_mwh, soc),
                                  Severity::Warning));
        }
        if (hour.soc_max_mwh < soc) {
            report.add(make_issue(IssueType::SocMaxInconsistent, i,
                                  format_message("Hour %zu: MaxSOC %.1f < Beginning SOC %.1f",
                                                 i, hour.soc_max_mwh, soc),
                                  Severity::Warning));
        }
    }
}

// ============================================================================
// Ramp rate
// ============================================================================

void RampRateCheck::run(const OperatingPlan& plan,
                        const resource::ResourceProfile& profile,
                        ValidationReport& report) const {
    (void)profile;  // ramp capability comes from the plan's own fields

    if (!plan.has_field(PlanField::TargetMw)) {
        return;
    }

    for (size_t i = 0; i + 1 < plan.hours.size(); ++i) {
        const PlanHour& current = plan.hours[i];
        const PlanHour& next = plan.hours[i + 1];

        if (current.status != next.status) {
            continue;
        }
        if (std::isnan(current.normal_ramp_up) || std::isnan(current.normal_ramp_down) ||
            std::isnan(current.target_mw) || std::isnan(next.target_mw)) {
            continue;
        }

        const double mw_change = std::abs(next.target_mw - current.target_mw);
        const double max_ramp = std::max(current.normal_ramp_up, current.normal_ramp_down) * 60.0;

        if (mw_change > max_ramp * kRampTolerance) {
            report.add(make_issue(IssueType::RampRateExceeded, i,
                                  format_message("Hour %zu: Ramp %.1f MW exceeds capability %.1f MW/hr",
                                                 i, mw_change, max_ramp),
                                  Severity::Warning));
        }
    }
}

// ============================================================================
// AS sufficiency
// ============================================================================

void AsSufficiencyCheck::run(const OperatingPlan& plan,
                             const resource::ResourceProfile& profile,
                             ValidationReport& report) const {
    (void)profile;

    for (size_t i = 0; i < plan.hours.size(); ++i) {
        const PlanHour& hour = plan.hours[i];
        if (!hour.status || std::isnan(hour.soc_begin_mwh) || std::isnan(hour.hsl)) {
            continue;
        }

        if (*hour.status == resource::ResourceStatus::ONRR) {
            const double required = hour.hsl * reserve_hours(AsProduct::ResponsiveReserve);
            if (hour.soc_begin_mwh < required) {
                report.add(make_issue(IssueType::InsufficientSocForRrs, i,
                                      format_message("Hour %zu: SOC %.1f insufficient for RRS %.1f",
                                                     i, hour.soc_begin_mwh, required),
                                      Severity::Warning));
            }
        } else if (*hour.status == resource::ResourceStatus::ONECRS) {
            const double required = hour.hsl * reserve_hours(AsProduct::Ecrs);
            if (hour.soc_begin_mwh < required) {
                report.add(make_issue(IssueType::InsufficientSocForEcrs, i,
                                      format_message("Hour %zu: SOC %.1f insufficient for ECRS %.1f",
                                                     i, hour.soc_begin_mwh, required),
                                      Severity::Warning));
            }
        }
    }
}

// ============================================================================
// Completeness
// ============================================================================

const std::vector<PlanField>& CompletenessCheck::required_fields() {
    static const std::vector<PlanField> fields = {
        PlanField::HourEnding,
        PlanField::Status,
        PlanField::Hsl,
        PlanField::Lsl,
        PlanField::SocBegin,
        PlanField::SocMin,
        PlanField::SocMax,
        PlanField::NormalRampUp,
        PlanField::NormalRampDown,
    };
    return fields;
}

void CompletenessCheck::run(const OperatingPlan& plan,
                            const resource::ResourceProfile& profile,
                            ValidationReport& report) const {
    (void)profile;

    std::string missing;
    for (PlanField field : required_fields()) {
        if (!plan.has_field(field)) {
            if (!missing.empty()) missing += ", ";
            missing += field_name(field);
        }
    }

    if (!missing.empty()) {
        report.add(make_issue(IssueType::MissingFields, std::nullopt,
                              "Missing required fields: " + missing,
                              Severity::Error));
    }

    for (PlanField field : required_fields()) {
        if (!plan.has_field(field)) {
            continue;
        }
        for (const auto& hour : plan.hours) {
            if (hour.is_null(field)) {
                report.add(make_issue(IssueType::NullValues, std::nullopt,
                                      std::string("Null values found in required field: ") + field_name(field),
                                      Severity::Error));
                break;
            }
        }
    }
}

// ============================================================================
// Horizon
// ============================================================================

void HorizonCheck::run(const OperatingPlan& plan,
                       const resource::ResourceProfile& profile,
                       ValidationReport& report) const {
    (void)profile;

    if (plan.hours.size() < static_cast<size_t>(kDefaultHorizonHours)) {
        report.add(make_issue(IssueType::InsufficientHorizon, std::nullopt,
                              format_message("COP contains %zu hours, %d required for 7 days",
                                             plan.hours.size(), kDefaultHorizonHours),
                              Severity::Warning));
    }

    for (size_t i = 0; i + 1 < plan.hours.size(); ++i) {
        const auto& current = plan.hours[i].hour_ending;
        const auto& next = plan.hours[i + 1].hour_ending;
        if (!current || !next) {
            continue;
        }

        const std::time_t step = *next - *current;
        if (step != utils::kSecondsPerHour) {
            report.add(make_issue(IssueType::NonContiguousHours, i,
                                  format_message("Hour %zu: next record %s follows %s (step %lld s, expected %lld s)",
                                                 i,
                                                 utils::format_iso8601_utc(*next).c_str(),
                                                 utils::format_iso8601_utc(*current).c_str(),
                                                 static_cast<long long>(step),
                                                 static_cast<long long>(utils::kSecondsPerHour)),
                                  Severity::Error));
        }
    }
}

} // namespace plan
