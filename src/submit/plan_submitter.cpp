// src/submit/plan_submitter.cpp
#include "submit/plan_submitter.hpp"
#include "utils/logging.hpp"
#include "utils/time_utils.hpp"

namespace submit {

const char* to_string(SubmissionStatus status) {
    switch (status) {
        case SubmissionStatus::TestSuccess:
            return "TEST_SUCCESS";
        case SubmissionStatus::Success:
            return "SUCCESS";
        case SubmissionStatus::RejectedInvalid:
            return "REJECTED_INVALID";
        case SubmissionStatus::Error:
        default:
            return "ERROR";
    }
}

SubmissionResult PlanSubmitter::submit(const plan::OperatingPlan& plan,
                                       const plan::ValidationReport& report) {
    const std::time_t now = std::time(nullptr);
    SubmissionResult result;

    if (!report.valid) {
        result.status = SubmissionStatus::RejectedInvalid;
        result.message = "Plan not submitted: " + report.summary;
        result.timestamp = utils::format_iso8601_utc(now);
        LOG_ERROR("[%s] %s", name(), result.message.c_str());
    } else {
        result = send(plan);
        if (result.timestamp.empty()) {
            result.timestamp = utils::format_iso8601_utc(now);
        }
        LOG_INFO("[%s] Submission %s: %s", name(), to_string(result.status), result.message.c_str());
    }

    SubmissionRecord record;
    record.submitted_at = now;
    record.status = result.status;
    record.cop_id = result.cop_id;
    record.hours = plan.size();
    if (!plan.empty()) {
        record.first_hour = plan.hours.front().hour_ending.value_or(0);
        record.last_hour = plan.hours.back().hour_ending.value_or(0);
    }
    history_.push_back(record);

    return result;
}

} // namespace submit
