// src/submit/http_submitter.hpp
#pragma once

#include "submit/plan_submitter.hpp"

#include <memory>
#include <string>

namespace submit {

/**
 * HttpSubmitter - POSTs the COP payload to the market operator endpoint
 *
 * Request:  POST <endpoint>, Content-Type: application/json,
 *           Authorization: Bearer <api_key>
 * Response: HTTP 200 -> SUCCESS (cop_id taken from the response body),
 *           anything else -> ERROR with the status and body in error.
 */
class HttpSubmitter : public PlanSubmitter {
public:
    struct Config {
        std::string endpoint;          // required
        std::string api_key;           // sent as bearer token when non-empty
        std::string qse_name = "TEST_QSE";
        long timeout_s = 30;
    };

    /**
     * @throws std::runtime_error if endpoint is empty or libcurl fails to initialize
     */
    explicit HttpSubmitter(const Config& config);
    ~HttpSubmitter() override;

    HttpSubmitter(const HttpSubmitter&) = delete;
    HttpSubmitter& operator=(const HttpSubmitter&) = delete;

    const char* name() const override { return "HttpSubmitter"; }

    const Config& get_config() const { return config_; }

    // Value of a top-level string field in a flat JSON response, "" if absent
    static std::string extract_json_string(const std::string& body, const std::string& key);

protected:
    SubmissionResult send(const plan::OperatingPlan& plan) override;

private:
    Config config_;

    // Implementation details hidden (pimpl pattern)
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace submit
