// src/submit/http_submitter.cpp
#include "submit/http_submitter.hpp"
#include "submit/cop_payload.hpp"
#include "utils/logging.hpp"
#include "utils/time_utils.hpp"

#include <curl/curl.h>
#include <ctime>
#include <stdexcept>

namespace submit {

struct HttpSubmitter::Impl {
    CURL* curl = nullptr;
    struct curl_slist* headers = nullptr;
    std::string auth_header;
    std::string response_body;

    Impl() {
        curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    }

    ~Impl() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

// Collects the response body so the cop_id can be read from it
static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    body->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

HttpSubmitter::HttpSubmitter(const Config& config)
    : config_(config)
{
    if (config_.endpoint.empty()) {
        throw std::runtime_error("[HttpSubmitter] endpoint is required");
    }

    impl_ = std::make_unique<Impl>();

    impl_->headers = curl_slist_append(impl_->headers, "Content-Type: application/json");
    if (!config_.api_key.empty()) {
        impl_->auth_header = "Authorization: Bearer " + config_.api_key;
        impl_->headers = curl_slist_append(impl_->headers, impl_->auth_header.c_str());
    } else {
        LOG_WARN("[HttpSubmitter] No API key configured - submission may be refused");
    }

    curl_easy_setopt(impl_->curl, CURLOPT_URL, config_.endpoint.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, impl_->headers);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEDATA, &impl_->response_body);
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT, config_.timeout_s);

    LOG_INFO("[HttpSubmitter] Initialized: endpoint=%s qse=%s timeout=%lds",
             config_.endpoint.c_str(), config_.qse_name.c_str(), config_.timeout_s);
}

HttpSubmitter::~HttpSubmitter() = default;

SubmissionResult HttpSubmitter::send(const plan::OperatingPlan& plan) {
    const std::time_t now = std::time(nullptr);
    const std::string payload = build_cop_payload(plan, config_.qse_name, now);

    SubmissionResult result;
    result.timestamp = utils::format_iso8601_utc(now);
    result.payload_size = payload.size();

    impl_->response_body.clear();
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));

    CURLcode res = curl_easy_perform(impl_->curl);
    if (res != CURLE_OK) {
        result.status = SubmissionStatus::Error;
        result.message = "Submission failed";
        result.error = std::string("CURL error: ") + curl_easy_strerror(res);
        LOG_ERROR("[HttpSubmitter] %s", result.error.c_str());
        return result;
    }

    long http_code = 0;
    curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code != 200) {
        result.status = SubmissionStatus::Error;
        result.message = "Submission failed";
        result.error = "HTTP " + std::to_string(http_code) + ": " + impl_->response_body;
        LOG_ERROR("[HttpSubmitter] Submission failed: HTTP %ld (expected 200)", http_code);
        return result;
    }

    result.status = SubmissionStatus::Success;
    result.message = "COP submitted successfully";
    result.cop_id = extract_json_string(impl_->response_body, "cop_id");
    if (result.cop_id.empty()) {
        LOG_WARN("[HttpSubmitter] Response carried no cop_id");
    }
    return result;
}

std::string HttpSubmitter::extract_json_string(const std::string& body, const std::string& key) {
    const std::string quoted = "\"" + key + "\"";
    size_t pos = body.find(quoted);
    if (pos == std::string::npos) {
        return "";
    }

    size_t colon = body.find(':', pos + quoted.size());
    if (colon == std::string::npos) {
        return "";
    }

    size_t open = body.find_first_not_of(" \t\r\n", colon + 1);
    if (open == std::string::npos || body[open] != '"') {
        return "";
    }

    size_t close = body.find('"', open + 1);
    if (close == std::string::npos) {
        return "";
    }
    return body.substr(open + 1, close - open - 1);
}

} // namespace submit
