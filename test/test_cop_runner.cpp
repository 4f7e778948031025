// test/test_cop_runner.cpp
// Unit tests for the planning cycle runner

#include "app/cop_runner.hpp"
#include "io/plan_csv.hpp"
#include "submit/test_mode_submitter.hpp"
#include "utils/logging.hpp"
#include <iostream>
#include <fstream>
#include <cstdio>
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

void write_file(const std::string& path, const std::string& text) {
    std::ofstream f(path);
    f << text;
}

app::CopRunConfig create_test_config() {
    app::CopRunConfig cfg;
    cfg.resource_config = config::ResourceConfig::get_default();
    cfg.start_time = kStart;
    return cfg;
}

bool test_default_cycle() {
    auto cfg = create_test_config();
    app::CopRunner runner(cfg);
    auto result = runner.run();

    TEST_ASSERT(result.plan.size() == 168, "Default horizon from config");
    TEST_ASSERT(result.report.valid, "Default plan should validate");
    TEST_ASSERT(!result.submission, "No submission unless requested");
    TEST_ASSERT(!result.csv_written, "No CSV unless requested");
    TEST_ASSERT(result.exit_code() == 0, "Exit code 0 for a valid plan");
    return true;
}

bool test_csv_output_and_submission() {
    auto cfg = create_test_config();
    cfg.resource_config.planning.horizon_hours = 48;
    cfg.out_csv_path = "/tmp/test_runner_plan.csv";
    cfg.submit = true;

    submit::TestModeSubmitter submitter("QSE_RUNNER");
    app::CopRunner runner(cfg);
    auto result = runner.run(&submitter);

    TEST_ASSERT(result.csv_written, "CSV should be written");
    auto back = io::PlanCsv::read(cfg.out_csv_path);
    std::remove(cfg.out_csv_path.c_str());
    TEST_ASSERT(back.size() == 48, "CSV holds the plan");

    TEST_ASSERT(result.report.has(plan::IssueType::InsufficientHorizon), "48 hours gives horizon warning");
    TEST_ASSERT(result.report.valid, "Warning does not block");
    TEST_ASSERT(result.submission.has_value(), "Submission attempted");
    TEST_ASSERT(result.submission->status == submit::SubmissionStatus::TestSuccess, "Test-mode submission accepted");
    TEST_ASSERT(submitter.history().size() == 1, "Injected submitter used");
    TEST_ASSERT(result.exit_code() == 0, "Exit code 0");
    return true;
}

bool test_default_submitter_from_config() {
    auto cfg = create_test_config();
    cfg.resource_config.planning.horizon_hours = 24;
    cfg.submit = true;

    app::CopRunner runner(cfg);
    auto result = runner.run();

    TEST_ASSERT(result.submission.has_value(), "Submission attempted");
    TEST_ASSERT(result.submission->cop_id.rfind("TEST_", 0) == 0, "Test-mode submitter built from config");
    return true;
}

bool test_price_and_commitment_inputs() {
    const std::string prices = "/tmp/test_runner_prices.csv";
    const std::string as = "/tmp/test_runner_as.csv";
    write_file(prices,
               "hour_ending,price\n"
               "2024-01-01T00:00:00,100\n"
               "2024-01-01T01:00:00,10\n");
    write_file(as,
               "hour_ending,regulation,rrs,ecrs\n"
               "2024-01-01T03:00:00,5,0,0\n");

    auto cfg = create_test_config();
    cfg.resource_config.planning.horizon_hours = 24;
    cfg.prices_csv_path = prices;
    cfg.commitments_csv_path = as;

    app::CopRunner runner(cfg);
    auto result = runner.run();
    std::remove(prices.c_str());
    std::remove(as.c_str());

    TEST_ASSERT(result.plan.hours[0].mode == plan::OperatingMode::Discharge, "Price 100 discharges");
    TEST_ASSERT(result.plan.hours[1].mode == plan::OperatingMode::Charge, "Price 10 charges");
    TEST_ASSERT(result.plan.hours[3].status == resource::ResourceStatus::ONREG, "Regulation overlay applied");
    return true;
}

bool test_input_errors_propagate() {
    auto cfg = create_test_config();
    cfg.prices_csv_path = "/tmp/test_runner_missing_prices.csv";

    bool threw = false;
    try {
        app::CopRunner(cfg).run();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Missing forecast file should throw");

    cfg = create_test_config();
    cfg.resource_config.resource.capacity_mw = -1.0;
    threw = false;
    try {
        app::CopRunner runner(cfg);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Invalid resource config should throw");
    return true;
}

bool test_make_submitter() {
    config::SubmissionConfig sub;
    sub.test_mode = true;
    auto test_mode = app::CopRunner::make_submitter(sub);
    TEST_ASSERT(std::string(test_mode->name()) == "TestModeSubmitter", "Test mode builds TestModeSubmitter");

    sub.test_mode = false;
    sub.endpoint = "http://127.0.0.1:9/cop/submit";
    sub.api_key_env = "COP_RUNNER_TEST_UNSET_KEY";
    auto live = app::CopRunner::make_submitter(sub);
    TEST_ASSERT(std::string(live->name()) == "HttpSubmitter", "Live mode builds HttpSubmitter");
    return true;
}

bool test_exit_codes() {
    app::RunResult r;
    r.report.finalize();
    TEST_ASSERT(r.exit_code() == 0, "Valid, no submission -> 0");

    plan::ValidationIssue issue;
    issue.type = plan::IssueType::MissingFields;
    r.report.add(issue);
    r.report.finalize();
    TEST_ASSERT(r.exit_code() == 2, "Invalid plan -> 2");

    app::RunResult s;
    s.report.finalize();
    s.submission = submit::SubmissionResult{};
    s.submission->status = submit::SubmissionStatus::Error;
    TEST_ASSERT(s.exit_code() == 3, "Valid plan, failed submission -> 3");
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "CopRunner Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    utils::set_level(utils::LogLevel::Error);

    int total = 0;
    int passed = 0;
    int failed = 0;

    RUN_TEST(test_default_cycle);
    RUN_TEST(test_csv_output_and_submission);
    RUN_TEST(test_default_submitter_from_config);
    RUN_TEST(test_price_and_commitment_inputs);
    RUN_TEST(test_input_errors_propagate);
    RUN_TEST(test_make_submitter);
    RUN_TEST(test_exit_codes);

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    std::cout << "========================================" << std::endl;

    return (failed == 0) ? 0 : 1;
}
