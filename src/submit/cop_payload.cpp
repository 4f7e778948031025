// src/submit/cop_payload.cpp
#include "submit/cop_payload.hpp"
#include "plan/plan_assembler.hpp"
#include "utils/time_utils.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace submit {

namespace {

std::string json_number(double v) {
    if (std::isnan(v) || std::isinf(v)) {
        return "null";
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.6g", v);
    return buf;
}

std::string json_string(const std::string& s) {
    return "\"" + json_escape(s) + "\"";
}

double or_default(double v, double fallback) {
    return std::isnan(v) ? fallback : v;
}

} // namespace

std::string json_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

std::string build_cop_payload(const plan::OperatingPlan& cop,
                              const std::string& qse_name,
                              std::time_t submission_time) {
    std::ostringstream json;

    json << "{\"cop_submission\":{"
         << "\"qse_name\":" << json_string(qse_name) << ","
         << "\"submission_time\":" << json_string(utils::format_iso8601_utc(submission_time)) << ","
         << "\"cop_data\":[";

    for (size_t i = 0; i < cop.hours.size(); ++i) {
        const plan::PlanHour& h = cop.hours[i];
        if (i > 0) {
            json << ",";
        }

        json << "{"
             << "\"hour_ending\":"
             << (h.hour_ending ? json_string(utils::format_iso8601_utc(*h.hour_ending)) : "null") << ","
             << "\"resource_name\":" << json_string(cop.resource_name) << ","
             << "\"resource_status\":"
             << (h.status ? json_string(resource::to_string(*h.status)) : "null") << ","
             << "\"hsl\":" << json_number(h.hsl) << ","
             << "\"lsl\":" << json_number(h.lsl) << ","
             << "\"hel\":" << json_number(or_default(h.hel, h.hsl)) << ","
             << "\"lel\":" << json_number(or_default(h.lel, h.lsl)) << ","
             << "\"normal_ramp_rate_up\":" << json_number(h.normal_ramp_up) << ","
             << "\"normal_ramp_rate_down\":" << json_number(h.normal_ramp_down) << ","
             << "\"emergency_ramp_rate_up\":"
             << json_number(or_default(h.emergency_ramp_up, h.normal_ramp_up * plan::kEmergencyRampFactor)) << ","
             << "\"emergency_ramp_rate_down\":"
             << json_number(or_default(h.emergency_ramp_down, h.normal_ramp_down * plan::kEmergencyRampFactor)) << ","
             << "\"minimum_soc\":" << json_number(h.soc_min_mwh) << ","
             << "\"maximum_soc\":" << json_number(h.soc_max_mwh) << ","
             << "\"hour_beginning_planned_soc\":" << json_number(h.soc_begin_mwh)
             << "}";
    }

    json << "]}}";
    return json.str();
}

} // namespace submit
