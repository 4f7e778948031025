// src/app/cop_runner.cpp
#include "app/cop_runner.hpp"
#include "io/forecast_csv.hpp"
#include "io/plan_csv.hpp"
#include "plan/operating_plan_generator.hpp"
#include "plan/operating_plan_validator.hpp"
#include "submit/http_submitter.hpp"
#include "submit/test_mode_submitter.hpp"
#include "utils/logging.hpp"
#include "utils/time_utils.hpp"

#include <cstdlib>
#include <utility>

namespace app {

int RunResult::exit_code() const {
    if (!report.valid) {
        return 2;
    }
    if (submission && !submission->accepted()) {
        return 3;
    }
    return 0;
}

CopRunner::CopRunner(CopRunConfig cfg) : cfg_(std::move(cfg)) {
    cfg_.resource_config.validate();
}

std::unique_ptr<submit::PlanSubmitter> CopRunner::make_submitter(const config::SubmissionConfig& cfg) {
    if (cfg.test_mode) {
        return std::make_unique<submit::TestModeSubmitter>(cfg.qse_name);
    }

    submit::HttpSubmitter::Config http;
    http.endpoint = cfg.endpoint;
    http.qse_name = cfg.qse_name;
    http.timeout_s = cfg.timeout_s;

    const char* key = cfg.api_key_env.empty() ? nullptr : std::getenv(cfg.api_key_env.c_str());
    if (key) {
        http.api_key = key;
    } else {
        LOG_WARN("[CopRunner] Environment variable %s not set", cfg.api_key_env.c_str());
    }

    return std::make_unique<submit::HttpSubmitter>(http);
}

RunResult CopRunner::run(submit::PlanSubmitter* submitter) const {
    const config::ResourceConfig& rc = cfg_.resource_config;
    const resource::ResourceProfile profile = rc.profile();

    // ========================================================================
    // Inputs
    // ========================================================================
    std::optional<plan::PriceForecast> prices;
    if (!cfg_.prices_csv_path.empty()) {
        prices = io::load_price_forecast(cfg_.prices_csv_path);
    }

    std::optional<plan::CommitmentSchedule> commitments;
    if (!cfg_.commitments_csv_path.empty()) {
        commitments = io::load_as_commitments(cfg_.commitments_csv_path);
    }

    const std::time_t start = cfg_.start_time ? *cfg_.start_time
                                              : utils::next_midnight_utc(std::time(nullptr));
    LOG_INFO("[CopRunner] Planning %s from %s (%d hours, %s mode)",
             profile.resource_name().c_str(), utils::format_iso8601_utc(start).c_str(),
             rc.planning.horizon_hours, prices ? "price" : "default");

    // ========================================================================
    // Generate + validate
    // ========================================================================
    RunResult result;

    plan::OperatingPlanGenerator generator(rc.planning.price_thresholds);
    result.plan = generator.generate(profile, start, rc.planning.horizon_hours,
                                     prices, commitments, rc.planning.initial_soc_mwh);

    plan::OperatingPlanValidator validator;
    result.report = validator.validate(result.plan, profile);

    for (const auto& e : result.report.errors) {
        LOG_ERROR("[CopRunner] %s: %s", plan::to_string(e.type), e.message.c_str());
    }
    for (const auto& w : result.report.warnings) {
        LOG_WARN("[CopRunner] %s: %s", plan::to_string(w.type), w.message.c_str());
    }
    LOG_INFO("[CopRunner] %s", result.report.summary.c_str());

    // ========================================================================
    // Outputs
    // ========================================================================
    if (!cfg_.out_csv_path.empty()) {
        result.csv_written = io::PlanCsv::write(result.plan, cfg_.out_csv_path);
        if (result.csv_written) {
            LOG_INFO("[CopRunner] Plan written to %s", cfg_.out_csv_path.c_str());
        } else {
            LOG_ERROR("[CopRunner] Failed to write plan to %s", cfg_.out_csv_path.c_str());
        }
    }

    if (cfg_.submit) {
        std::unique_ptr<submit::PlanSubmitter> owned;
        if (!submitter) {
            owned = make_submitter(rc.submission);
            submitter = owned.get();
        }
        result.submission = submitter->submit(result.plan, result.report);
        if (!result.submission->cop_id.empty()) {
            LOG_INFO("[CopRunner] COP id: %s", result.submission->cop_id.c_str());
        }
    }

    return result;
}

} // namespace app
