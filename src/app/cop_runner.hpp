// src/app/cop_runner.hpp
#pragma once

#include "config/resource_config.hpp"
#include "plan/operating_plan.hpp"
#include "plan/validation_report.hpp"
#include "submit/plan_submitter.hpp"

#include <ctime>
#include <memory>
#include <optional>
#include <string>

namespace app {

struct CopRunConfig {
    config::ResourceConfig resource_config = config::ResourceConfig::get_default();

    // Inputs (empty path = not used)
    std::string prices_csv_path;        // empty -> default daily pattern
    std::string commitments_csv_path;   // empty -> no AS overlay

    std::optional<std::time_t> start_time;   // default: next midnight UTC

    // Outputs
    std::string out_csv_path;           // empty -> no CSV written
    bool submit = false;
};

struct RunResult {
    plan::OperatingPlan plan;
    plan::ValidationReport report;
    std::optional<submit::SubmissionResult> submission;
    bool csv_written = false;

    /**
     * exit_code() - Process exit status for the run
     *   0 plan valid (and submission accepted, if requested)
     *   2 plan failed validation
     *   3 plan valid but submission not accepted
     */
    int exit_code() const;
};

/**
 * CopRunner - One planning cycle: load inputs, generate, validate,
 * write, submit
 *
 * Input and configuration errors propagate as exceptions; validation and
 * submission outcomes are returned in RunResult.
 *
 * Usage:
 *   CopRunner runner(cfg);
 *   RunResult r = runner.run();
 *   return r.exit_code();
 */
class CopRunner {
public:
    explicit CopRunner(CopRunConfig cfg);

    /**
     * run() - Execute the cycle
     * @param submitter Used when cfg.submit is set; built from the
     *                  submission config when null
     * @throws std::runtime_error on configuration or input errors
     */
    RunResult run(submit::PlanSubmitter* submitter = nullptr) const;

    /**
     * make_submitter() - Submitter for a submission config
     *
     * test_mode -> TestModeSubmitter; otherwise HttpSubmitter with the
     * API key read from the environment variable named by api_key_env.
     */
    static std::unique_ptr<submit::PlanSubmitter> make_submitter(const config::SubmissionConfig& cfg);

    const CopRunConfig& config() const { return cfg_; }

private:
    CopRunConfig cfg_;
};

} // namespace app
