// src/config/resource_config.cpp
#include "config/resource_config.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <stdexcept>

namespace config {

ResourceConfig ResourceConfig::load(const std::string& yaml_path) {
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[ResourceConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[ResourceConfig] Using default configuration");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[ResourceConfig] Loading resource config from: %s", yaml_path.c_str());

    ResourceConfig cfg = get_default();

    try {
        YAML::Node root = YAML::LoadFile(yaml_path);

        // ====================================================================
        // Resource parameters
        // ====================================================================
        if (root["resource"]) {
            auto r = root["resource"];
            auto& p = cfg.resource;
            p.resource_name = r["name"].as<std::string>(p.resource_name);
            p.capacity_mw = r["capacity_mw"].as<double>(p.capacity_mw);
            p.capacity_mwh = r["capacity_mwh"].as<double>(p.capacity_mwh);
            p.round_trip_efficiency = r["efficiency"].as<double>(p.round_trip_efficiency);
            p.ramp_up_mw_per_min = r["ramp_rate_up"].as<double>(p.ramp_up_mw_per_min);
            p.ramp_down_mw_per_min = r["ramp_rate_down"].as<double>(p.ramp_down_mw_per_min);
            p.min_soc_mwh = r["min_soc"].as<double>(p.min_soc_mwh);
            p.max_soc_mwh = r["max_soc"].as<double>(p.max_soc_mwh);
            p.aux_load_mw = r["aux_load"].as<double>(p.aux_load_mw);
            cfg.description = r["description"].as<std::string>("");
        }

        // ====================================================================
        // Planning
        // ====================================================================
        if (root["planning"]) {
            auto pl = root["planning"];
            cfg.planning.horizon_hours = pl["horizon_hours"].as<int>(cfg.planning.horizon_hours);
            if (pl["initial_soc"]) {
                cfg.planning.initial_soc_mwh = pl["initial_soc"].as<double>();
            }

            if (pl["price_thresholds"]) {
                auto th = pl["price_thresholds"];
                auto& t = cfg.planning.price_thresholds;
                t.discharge_full_above = th["discharge_full_above"].as<double>(t.discharge_full_above);
                t.discharge_partial_above = th["discharge_partial_above"].as<double>(t.discharge_partial_above);
                t.charge_full_below = th["charge_full_below"].as<double>(t.charge_full_below);
                t.neutral_price = th["neutral_price"].as<double>(t.neutral_price);
            }
        }

        // ====================================================================
        // Submission
        // ====================================================================
        if (root["submission"]) {
            auto s = root["submission"];
            auto& sub = cfg.submission;
            sub.qse_name = s["qse_name"].as<std::string>(sub.qse_name);
            sub.endpoint = s["endpoint"].as<std::string>(sub.endpoint);
            sub.api_key_env = s["api_key_env"].as<std::string>(sub.api_key_env);
            sub.timeout_s = s["timeout_s"].as<long>(sub.timeout_s);
            sub.test_mode = s["test_mode"].as<bool>(sub.test_mode);
        }

        cfg.validate();

        LOG_INFO("[ResourceConfig] Successfully loaded: %s", cfg.resource.resource_name.c_str());
        return cfg;

    } catch (const YAML::Exception& e) {
        throw std::runtime_error(
            std::string("[ResourceConfig] YAML parse error: ") + e.what()
        );
    } catch (const std::exception& e) {
        throw std::runtime_error(
            std::string("[ResourceConfig] Load error: ") + e.what()
        );
    }
}

ResourceConfig ResourceConfig::get_default() {
    ResourceConfig cfg;

    cfg.description = "Default 100 MW / 200 MWh storage resource";

    cfg.resource.resource_name = "BESS_WEST_100MW";
    cfg.resource.capacity_mw = 100.0;
    cfg.resource.capacity_mwh = 200.0;
    cfg.resource.round_trip_efficiency = 0.86;
    cfg.resource.ramp_up_mw_per_min = 50.0;
    cfg.resource.ramp_down_mw_per_min = 50.0;
    cfg.resource.min_soc_mwh = 0.0;
    cfg.resource.max_soc_mwh = 200.0;
    cfg.resource.aux_load_mw = 2.0;

    cfg.planning.horizon_hours = plan::kDefaultHorizonHours;

    cfg.submission.qse_name = "TEST_QSE";
    cfg.submission.test_mode = true;

    return cfg;
}

void ResourceConfig::validate() const {
    // Resource parameters (InvalidProfileError is a std::runtime_error)
    profile().validate();

    if (resource.capacity_mwh < resource.max_soc_mwh) {
        LOG_WARN("[ResourceConfig] max_soc %.1f MWh exceeds capacity %.1f MWh",
                 resource.max_soc_mwh, resource.capacity_mwh);
    }

    // Planning validation
    if (planning.horizon_hours <= 0) {
        throw std::runtime_error("Invalid horizon_hours: must be > 0");
    }
    if (planning.initial_soc_mwh &&
        (*planning.initial_soc_mwh < resource.min_soc_mwh || *planning.initial_soc_mwh > resource.max_soc_mwh)) {
        throw std::runtime_error("Invalid initial_soc: must be within [min_soc, max_soc]");
    }

    const auto& t = planning.price_thresholds;
    if (!(t.charge_full_below <= t.discharge_partial_above &&
          t.discharge_partial_above <= t.discharge_full_above)) {
        throw std::runtime_error(
            "Invalid price_thresholds: charge_full_below <= discharge_partial_above <= discharge_full_above");
    }

    // Submission validation
    if (submission.timeout_s <= 0) {
        throw std::runtime_error("Invalid submission timeout_s: must be > 0");
    }
    if (!submission.test_mode && submission.endpoint.empty()) {
        throw std::runtime_error("Invalid submission endpoint: required when test_mode is false");
    }

    LOG_DEBUG("[ResourceConfig] Validation passed");
}

void ResourceConfig::print_summary() const {
    const auto p = profile();

    LOG_INFO("========================================");
    LOG_INFO("Resource Configuration Summary");
    LOG_INFO("========================================");
    LOG_INFO("Name: %s", p.resource_name().c_str());
    if (!description.empty()) {
        LOG_INFO("Description: %s", description.c_str());
    }
    LOG_INFO("----------------------------------------");
    LOG_INFO("Capacity: %.1f MW / %.1f MWh (%.1f h)",
             p.capacity_mw(), p.capacity_mwh(), p.duration_hours());
    LOG_INFO("Efficiency: %.0f%%", p.efficiency() * 100.0);
    LOG_INFO("SOC range: %.1f .. %.1f MWh", p.min_soc(), p.max_soc());
    LOG_INFO("Ramp: up %.1f / down %.1f MW/min", p.ramp_up_mw_per_min(), p.ramp_down_mw_per_min());
    LOG_INFO("Horizon: %d hours", planning.horizon_hours);
    LOG_INFO("Submission: %s (QSE %s)",
             submission.test_mode ? "test mode" : submission.endpoint.c_str(),
             submission.qse_name.c_str());
    LOG_INFO("========================================");
}

} // namespace config
