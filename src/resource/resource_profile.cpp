// src/resource/resource_profile.cpp
#include "resource/resource_profile.hpp"
#include "utils/logging.hpp"

namespace resource {

ResourceProfile::ResourceProfile(const ResourceProfileParams& params)
    : params_(params) {}

void ResourceProfile::validate() const {
    // Comparisons are written so that NaN fails them
    if (!(params_.capacity_mw > 0.0)) {
        throw InvalidProfileError("Invalid capacity_mw: must be > 0");
    }
    if (!(params_.capacity_mwh > 0.0)) {
        throw InvalidProfileError("Invalid capacity_mwh: must be > 0");
    }
    if (!(params_.round_trip_efficiency > 0.0 && params_.round_trip_efficiency <= 1.0)) {
        throw InvalidProfileError("Invalid efficiency: must be 0 < eff <= 1");
    }
    if (!(params_.ramp_up_mw_per_min > 0.0)) {
        throw InvalidProfileError("Invalid ramp_rate_up: must be > 0");
    }
    if (!(params_.ramp_down_mw_per_min > 0.0)) {
        throw InvalidProfileError("Invalid ramp_rate_down: must be > 0");
    }
    if (!(params_.min_soc_mwh >= 0.0 && params_.min_soc_mwh < params_.max_soc_mwh)) {
        throw InvalidProfileError("Invalid SOC range: 0 <= min_soc < max_soc");
    }
    if (!(params_.aux_load_mw >= 0.0)) {
        throw InvalidProfileError("Invalid aux_load: must be >= 0");
    }

    LOG_DEBUG("[ResourceProfile] %s: validation passed", params_.resource_name.c_str());
}

} // namespace resource
