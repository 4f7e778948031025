// test/test_submitter.cpp
// Unit tests for plan submission (no network access)

#include "submit/cop_payload.hpp"
#include "submit/http_submitter.hpp"
#include "submit/test_mode_submitter.hpp"
#include "plan/operating_plan_generator.hpp"
#include "plan/operating_plan_validator.hpp"
#include "utils/logging.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

// Test helper macros
#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "FAILED: " << message << std::endl; \
            std::cerr << "  at " << __FILE__ << ":" << __LINE__ << std::endl; \
            return false; \
        } \
    } while (0)

#define RUN_TEST(test_func) \
    do { \
        std::cout << "Running " << #test_func << "... "; \
        if (test_func()) { \
            std::cout << "PASSED" << std::endl; \
            passed++; \
        } else { \
            std::cout << "FAILED" << std::endl; \
            failed++; \
        } \
        total++; \
    } while (0)

const std::time_t kStart = 1704067200;   // 2024-01-01T00:00:00Z

size_t count_occurrences(const std::string& text, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}

struct ValidatedPlan {
    plan::OperatingPlan plan;
    plan::ValidationReport report;
};

ValidatedPlan create_valid_plan(int hours = 168) {
    resource::ResourceProfileParams p;
    p.resource_name = "BESS_WEST_100MW";
    resource::ResourceProfile profile(p);

    ValidatedPlan v;
    v.plan = plan::OperatingPlanGenerator().generate(profile, kStart, hours);
    v.report = plan::OperatingPlanValidator().validate(v.plan, profile);
    return v;
}

plan::ValidationReport create_failed_report() {
    plan::ValidationReport report;
    plan::ValidationIssue issue;
    issue.type = plan::IssueType::SocBelowMin;
    issue.hour = 3;
    issue.message = "Hour 3: SOC -1.0 below minimum 0.0";
    report.add(issue);
    report.finalize();
    return report;
}

bool test_test_mode_success() {
    auto v = create_valid_plan();
    TEST_ASSERT(v.report.valid, "Fixture plan should be valid");

    submit::TestModeSubmitter submitter("QSE_UNIT");
    auto result = submitter.submit(v.plan, v.report);

    TEST_ASSERT(result.status == submit::SubmissionStatus::TestSuccess, "Status should be TEST_SUCCESS");
    TEST_ASSERT(result.accepted(), "Test-mode result counts as accepted");
    TEST_ASSERT(result.cop_id.rfind("TEST_", 0) == 0, "Id should start with TEST_");
    TEST_ASSERT(result.cop_id.size() == 19, "Id should be TEST_ + 14 digits");
    TEST_ASSERT(result.payload_size == submitter.last_payload().size(), "Payload size recorded");
    TEST_ASSERT(!result.timestamp.empty(), "Timestamp recorded");
    return true;
}

bool test_payload_contents() {
    auto v = create_valid_plan();
    submit::TestModeSubmitter submitter("QSE_UNIT");
    submitter.submit(v.plan, v.report);
    const std::string& json = submitter.last_payload();

    TEST_ASSERT(json.rfind("{\"cop_submission\":{", 0) == 0, "Top-level cop_submission object");
    TEST_ASSERT(json.find("\"qse_name\":\"QSE_UNIT\"") != std::string::npos, "QSE name present");
    TEST_ASSERT(count_occurrences(json, "\"hour_ending\":") == 168, "One entry per hour");
    TEST_ASSERT(json.find("\"hour_ending\":\"2024-01-01T00:00:00\"") != std::string::npos, "First hour formatted");
    TEST_ASSERT(json.find("\"resource_name\":\"BESS_WEST_100MW\"") != std::string::npos, "Resource name present");
    TEST_ASSERT(json.find("\"resource_status\":\"ON\"") != std::string::npos, "Status present");
    TEST_ASSERT(json.find("\"emergency_ramp_rate_up\":75") != std::string::npos, "Emergency ramp present");
    TEST_ASSERT(json.find("\"hour_beginning_planned_soc\":100") != std::string::npos, "Planned SOC present");
    return true;
}

bool test_payload_nulls_and_escaping() {
    plan::OperatingPlan cop;
    cop.resource_name = "BESS \"A\"\\1";
    plan::PlanHour h;
    h.hsl = 10.0;
    h.lsl = -10.0;
    h.normal_ramp_up = 2.0;
    h.normal_ramp_down = 2.0;
    cop.hours.push_back(h);

    const std::string json = submit::build_cop_payload(cop, "Q\nSE", kStart);

    TEST_ASSERT(json.find("\"resource_name\":\"BESS \\\"A\\\"\\\\1\"") != std::string::npos, "Quotes and backslash escaped");
    TEST_ASSERT(json.find("\"qse_name\":\"Q\\nSE\"") != std::string::npos, "Newline escaped");
    TEST_ASSERT(json.find("\"hour_ending\":null") != std::string::npos, "Missing hour_ending is null");
    TEST_ASSERT(json.find("\"resource_status\":null") != std::string::npos, "Missing status is null");
    TEST_ASSERT(json.find("\"minimum_soc\":null") != std::string::npos, "Null SOC is JSON null");
    TEST_ASSERT(json.find("\"hel\":10") != std::string::npos, "HEL defaults to HSL");
    TEST_ASSERT(json.find("\"emergency_ramp_rate_down\":3") != std::string::npos, "Emergency ramp defaults to 1.5x");
    TEST_ASSERT(json.find("\"submission_time\":\"2024-01-01T00:00:00\"") != std::string::npos, "Submission time formatted");
    return true;
}

bool test_invalid_plan_rejected() {
    auto v = create_valid_plan(24);
    submit::TestModeSubmitter submitter;

    auto result = submitter.submit(v.plan, create_failed_report());

    TEST_ASSERT(result.status == submit::SubmissionStatus::RejectedInvalid, "Status should be REJECTED_INVALID");
    TEST_ASSERT(!result.accepted(), "Rejected result not accepted");
    TEST_ASSERT(result.cop_id.empty(), "No id for rejected plan");
    TEST_ASSERT(submitter.last_payload().empty(), "Nothing should be built for a rejected plan");
    TEST_ASSERT(result.message.find("SOC_BELOW_MIN") != std::string::npos, "Message carries the summary");
    return true;
}

bool test_history() {
    auto v = create_valid_plan(48);
    submit::TestModeSubmitter submitter;

    submitter.submit(v.plan, v.report);
    submitter.submit(v.plan, create_failed_report());

    const auto& history = submitter.history();
    TEST_ASSERT(history.size() == 2, "Both attempts recorded");
    TEST_ASSERT(history[0].status == submit::SubmissionStatus::TestSuccess, "First attempt succeeded");
    TEST_ASSERT(history[0].hours == 48, "Hour count recorded");
    TEST_ASSERT(history[0].first_hour == kStart, "First hour recorded");
    TEST_ASSERT(history[0].last_hour == kStart + 47 * 3600, "Last hour recorded");
    TEST_ASSERT(history[1].status == submit::SubmissionStatus::RejectedInvalid, "Second attempt rejected");
    return true;
}

bool test_http_requires_endpoint() {
    submit::HttpSubmitter::Config config;
    try {
        submit::HttpSubmitter submitter(config);
    } catch (const std::runtime_error&) {
        return true;
    }
    TEST_ASSERT(false, "Empty endpoint should throw");
    return false;
}

bool test_http_rejects_invalid_plan_without_sending() {
    submit::HttpSubmitter::Config config;
    config.endpoint = "http://127.0.0.1:9/cop/submit";
    config.api_key = "unit-test-key";
    config.timeout_s = 1;
    submit::HttpSubmitter submitter(config);

    TEST_ASSERT(submitter.get_config().endpoint == config.endpoint, "Config stored");

    auto v = create_valid_plan(24);
    auto result = submitter.submit(v.plan, create_failed_report());

    TEST_ASSERT(result.status == submit::SubmissionStatus::RejectedInvalid, "Invalid plan refused before sending");
    TEST_ASSERT(result.payload_size == 0, "No payload built");
    return true;
}

bool test_response_parsing() {
    using submit::HttpSubmitter;
    TEST_ASSERT(HttpSubmitter::extract_json_string("{\"cop_id\": \"COP-123\", \"ok\": true}", "cop_id") == "COP-123",
                "cop_id extracted");
    TEST_ASSERT(HttpSubmitter::extract_json_string("{\"status\":\"accepted\",\"cop_id\":\"X9\"}", "cop_id") == "X9",
                "cop_id after other keys");
    TEST_ASSERT(HttpSubmitter::extract_json_string("{\"cop_id\": 42}", "cop_id").empty(), "Non-string value ignored");
    TEST_ASSERT(HttpSubmitter::extract_json_string("{}", "cop_id").empty(), "Absent key gives empty");
    return true;
}

bool test_status_names() {
    TEST_ASSERT(std::string(submit::to_string(submit::SubmissionStatus::TestSuccess)) == "TEST_SUCCESS", "TEST_SUCCESS");
    TEST_ASSERT(std::string(submit::to_string(submit::SubmissionStatus::Success)) == "SUCCESS", "SUCCESS");
    TEST_ASSERT(std::string(submit::to_string(submit::SubmissionStatus::Error)) == "ERROR", "ERROR");
    TEST_ASSERT(std::string(submit::to_string(submit::SubmissionStatus::RejectedInvalid)) == "REJECTED_INVALID",
                "REJECTED_INVALID");
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Plan Submitter Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    utils::set_level(utils::LogLevel::Error);

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_test_mode_success);
    RUN_TEST(test_payload_contents);
    RUN_TEST(test_payload_nulls_and_escaping);
    RUN_TEST(test_invalid_plan_rejected);
    RUN_TEST(test_history);
    RUN_TEST(test_http_requires_endpoint);
    RUN_TEST(test_http_rejects_invalid_plan_without_sending);
    RUN_TEST(test_response_parsing);
    RUN_TEST(test_status_names);

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    std::cout << "========================================" << std::endl;

    return (failed == 0) ? 0 : 1;
}
