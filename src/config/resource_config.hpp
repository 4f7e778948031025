// src/config/resource_config.hpp
#pragma once

#include <optional>
#include <string>
#include "plan/operating_plan_generator.hpp"
#include "resource/resource_profile.hpp"

namespace config {

struct PlanningConfig {
    int horizon_hours = plan::kDefaultHorizonHours;
    std::optional<double> initial_soc_mwh;   // default: 50% of max_soc
    plan::PriceThresholds price_thresholds;
};

struct SubmissionConfig {
    std::string qse_name = "TEST_QSE";
    std::string endpoint;
    std::string api_key_env = "COP_API_KEY";  // environment variable holding the key
    long timeout_s = 30;
    bool test_mode = true;
};

/**
 * ResourceConfig - Loads resource, planning and submission settings from YAML
 *
 * Usage:
 *   auto cfg = ResourceConfig::load("config/resources/bess_west_100mw.yaml");
 *   resource::ResourceProfile profile = cfg.profile();
 *
 * Falls back to the built-in 100 MW / 200 MWh resource if file not found.
 */
class ResourceConfig {
public:
    std::string description;

    resource::ResourceProfileParams resource;
    PlanningConfig planning;
    SubmissionConfig submission;

    /**
     * Load config from YAML file
     * @param yaml_path Path to YAML file
     * @return ResourceConfig with loaded parameters
     * @throws std::runtime_error if file exists but is invalid
     *
     * If file doesn't exist, returns default configuration with warning.
     */
    static ResourceConfig load(const std::string& yaml_path);

    static ResourceConfig get_default();

    /**
     * Validate loaded parameters
     * @throws std::runtime_error if any parameter is invalid
     */
    void validate() const;

    void print_summary() const;

    resource::ResourceProfile profile() const { return resource::ResourceProfile(resource); }

    ResourceConfig() = default;
};

} // namespace config
