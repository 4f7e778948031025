// src/plan/validation_report.cpp
#include "plan/validation_report.hpp"

#include <set>
#include <sstream>
#include <utility>

namespace plan {

const char* to_string(Severity severity) {
    return severity == Severity::Error ? "ERROR" : "WARNING";
}

const char* to_string(IssueType type) {
    switch (type) {
        case IssueType::SocInfeasibleCharge:    return "SOC_INFEASIBLE_CHARGE";
        case IssueType::SocInfeasibleDischarge: return "SOC_INFEASIBLE_DISCHARGE";
        case IssueType::SocBelowMin:            return "SOC_BELOW_MIN";
        case IssueType::SocAboveMax:            return "SOC_ABOVE_MAX";
        case IssueType::SocMinInconsistent:     return "SOC_MIN_INCONSISTENT";
        case IssueType::SocMaxInconsistent:     return "SOC_MAX_INCONSISTENT";
        case IssueType::RampRateExceeded:       return "RAMP_RATE_EXCEEDED";
        case IssueType::InsufficientSocForRrs:  return "INSUFFICIENT_SOC_FOR_RRS";
        case IssueType::InsufficientSocForEcrs: return "INSUFFICIENT_SOC_FOR_ECRS";
        case IssueType::MissingFields:          return "MISSING_FIELDS";
        case IssueType::NullValues:             return "NULL_VALUES";
        case IssueType::InsufficientHorizon:    return "INSUFFICIENT_HORIZON";
        case IssueType::NonContiguousHours:     return "NON_CONTIGUOUS_HOURS";
    }
    return "UNKNOWN";
}

void ValidationReport::add(ValidationIssue issue) {
    if (issue.severity == Severity::Error) {
        errors.push_back(std::move(issue));
    } else {
        warnings.push_back(std::move(issue));
    }
}

size_t ValidationReport::count(IssueType type) const {
    size_t n = 0;
    for (const auto& e : errors) {
        if (e.type == type) ++n;
    }
    for (const auto& w : warnings) {
        if (w.type == type) ++n;
    }
    return n;
}

void ValidationReport::finalize() {
    valid = errors.empty();

    if (valid) {
        summary = "COP validation PASSED - ready for submission";
        return;
    }

    // Sorted by code so the summary is stable between runs
    std::set<std::string> types;
    for (const auto& e : errors) {
        types.insert(to_string(e.type));
    }

    std::ostringstream out;
    out << "COP validation FAILED - " << errors.size() << " errors: ";
    bool first = true;
    for (const auto& t : types) {
        if (!first) out << ", ";
        out << t;
        first = false;
    }
    summary = out.str();
}

} // namespace plan
