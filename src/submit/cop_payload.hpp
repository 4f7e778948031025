// src/submit/cop_payload.hpp
#pragma once

#include "plan/operating_plan.hpp"

#include <ctime>
#include <string>

namespace submit {

/**
 * build_cop_payload() - JSON document sent to the market operator
 *
 *   {"cop_submission": {"qse_name": ..., "submission_time": ...,
 *                       "cop_data": [ {one object per hour}, ... ]}}
 *
 * Per-hour keys: hour_ending, resource_name, resource_status, hsl, lsl,
 * hel, lel, normal_ramp_rate_up, normal_ramp_rate_down,
 * emergency_ramp_rate_up, emergency_ramp_rate_down, minimum_soc,
 * maximum_soc, hour_beginning_planned_soc. Null values are emitted as
 * JSON null; missing emergency values default to 1.5 x normal.
 */
std::string build_cop_payload(const plan::OperatingPlan& plan,
                              const std::string& qse_name,
                              std::time_t submission_time);

// Escapes quotes, backslashes and control characters
std::string json_escape(const std::string& text);

} // namespace submit
