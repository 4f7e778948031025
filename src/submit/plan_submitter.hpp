// src/submit/plan_submitter.hpp
#pragma once

#include "plan/operating_plan.hpp"
#include "plan/validation_report.hpp"

#include <cstddef>
#include <ctime>
#include <string>
#include <vector>

namespace submit {

enum class SubmissionStatus {
    TestSuccess,      // accepted by the test-mode submitter, nothing sent
    Success,          // accepted by the market operator
    Error,            // transport or HTTP failure
    RejectedInvalid   // plan failed validation, nothing sent
};

const char* to_string(SubmissionStatus status);

struct SubmissionResult {
    SubmissionStatus status = SubmissionStatus::Error;
    std::string message;
    std::string timestamp;      // ISO-8601 UTC
    std::string cop_id;         // empty unless accepted
    size_t payload_size = 0;    // bytes
    std::string error;          // transport/HTTP detail on failure

    bool accepted() const {
        return status == SubmissionStatus::Success || status == SubmissionStatus::TestSuccess;
    }
};

struct SubmissionRecord {
    std::time_t submitted_at = 0;
    SubmissionStatus status = SubmissionStatus::Error;
    std::string cop_id;
    size_t hours = 0;
    std::time_t first_hour = 0;
    std::time_t last_hour = 0;
};

/**
 * PlanSubmitter - Hands a validated plan to the market operator
 *
 * submit() refuses plans whose report is not valid and records every
 * attempt in history(). Meeting the daily submission deadline is the
 * caller's responsibility.
 *
 * Implementations:
 * - TestModeSubmitter (builds the payload, sends nothing)
 * - HttpSubmitter (POST over libcurl)
 */
class PlanSubmitter {
public:
    virtual ~PlanSubmitter() = default;

    SubmissionResult submit(const plan::OperatingPlan& plan,
                            const plan::ValidationReport& report);

    const std::vector<SubmissionRecord>& history() const { return history_; }

    virtual const char* name() const = 0;

protected:
    // Called only for valid plans
    virtual SubmissionResult send(const plan::OperatingPlan& plan) = 0;

private:
    std::vector<SubmissionRecord> history_;
};

} // namespace submit
