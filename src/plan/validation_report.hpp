// src/plan/validation_report.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace plan {

enum class Severity {
    Error,    // blocks submission
    Warning   // informational
};

const char* to_string(Severity severity);

enum class IssueType {
    SocInfeasibleCharge,
    SocInfeasibleDischarge,
    SocBelowMin,
    SocAboveMax,
    SocMinInconsistent,
    SocMaxInconsistent,
    RampRateExceeded,
    InsufficientSocForRrs,
    InsufficientSocForEcrs,
    MissingFields,
    NullValues,
    InsufficientHorizon,
    NonContiguousHours
};

// Market code, e.g. "SOC_BELOW_MIN"
const char* to_string(IssueType type);

struct ValidationIssue {
    IssueType type = IssueType::MissingFields;
    std::optional<size_t> hour;   // empty for plan-level findings
    std::string message;
    Severity severity = Severity::Error;
};

/**
 * ValidationReport - Findings of one validation run
 *
 * valid is true exactly when there are no errors; warnings never block.
 */
struct ValidationReport {
    bool valid = true;
    std::vector<ValidationIssue> errors;
    std::vector<ValidationIssue> warnings;
    std::string summary;

    // Routes the issue to errors or warnings by severity
    void add(ValidationIssue issue);

    size_t error_count() const { return errors.size(); }
    size_t warning_count() const { return warnings.size(); }

    size_t count(IssueType type) const;
    bool has(IssueType type) const { return count(type) > 0; }

    // Sets valid and summary from the collected issues
    void finalize();
};

} // namespace plan
