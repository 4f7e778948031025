// src/resource/resource_profile.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace resource {

/**
 * InvalidProfileError - Non-physical resource parameters
 *
 * Thrown by ResourceProfile::validate() and therefore by every engine
 * entry point that receives a profile. Not retryable.
 */
class InvalidProfileError : public std::runtime_error {
public:
    explicit InvalidProfileError(const std::string& what)
        : std::runtime_error(what) {}
};

struct ResourceProfileParams {
    std::string resource_name = "BESS";
    double capacity_mw = 100.0;           // Nameplate MW
    double capacity_mwh = 200.0;          // Nameplate MWh
    double round_trip_efficiency = 0.86;  // (0, 1]
    double ramp_up_mw_per_min = 50.0;
    double ramp_down_mw_per_min = 50.0;
    double min_soc_mwh = 0.0;
    double max_soc_mwh = 200.0;
    double aux_load_mw = 2.0;
};

/**
 * ResourceProfile - Immutable technical parameters of one battery resource
 *
 * Sign convention for power: positive = discharge, negative = charge.
 * HSL is the discharge ceiling, LSL the (negative) charge ceiling.
 */
class ResourceProfile {
public:
    explicit ResourceProfile(const ResourceProfileParams& params = {});

    /**
     * validate() - Check the parameters are physical
     * @throws InvalidProfileError naming the first offending parameter
     */
    void validate() const;

    const std::string& resource_name() const { return params_.resource_name; }
    double capacity_mw() const { return params_.capacity_mw; }
    double capacity_mwh() const { return params_.capacity_mwh; }
    double efficiency() const { return params_.round_trip_efficiency; }
    double ramp_up_mw_per_min() const { return params_.ramp_up_mw_per_min; }
    double ramp_down_mw_per_min() const { return params_.ramp_down_mw_per_min; }
    double min_soc() const { return params_.min_soc_mwh; }
    double max_soc() const { return params_.max_soc_mwh; }
    double aux_load_mw() const { return params_.aux_load_mw; }

    // High Sustained Limit (MW)
    double hsl() const { return params_.capacity_mw; }

    // Low Sustained Limit (MW, negative)
    double lsl() const { return -params_.capacity_mw; }

    double duration_hours() const { return params_.capacity_mwh / params_.capacity_mw; }

    const ResourceProfileParams& params() const { return params_; }

private:
    ResourceProfileParams params_;
};

} // namespace resource
