// src/plan/operating_plan.cpp
#include "plan/operating_plan.hpp"
#include "utils/time_utils.hpp"

#include <array>
#include <cmath>
#include <utility>

namespace plan {

namespace {

const std::array<std::pair<PlanField, const char*>, 17> kFieldNames = {{
    {PlanField::HourEnding, "hour_ending"},
    {PlanField::ResourceName, "resource_name"},
    {PlanField::Status, "status"},
    {PlanField::Hsl, "hsl"},
    {PlanField::Lsl, "lsl"},
    {PlanField::Hel, "hel"},
    {PlanField::Lel, "lel"},
    {PlanField::NormalRampUp, "normal_ramp_up"},
    {PlanField::NormalRampDown, "normal_ramp_down"},
    {PlanField::EmergencyRampUp, "emergency_ramp_up"},
    {PlanField::EmergencyRampDown, "emergency_ramp_down"},
    {PlanField::SocBegin, "soc_begin"},
    {PlanField::SocMin, "soc_min"},
    {PlanField::SocMax, "soc_max"},
    {PlanField::TargetMw, "target_mw"},
    {PlanField::Mode, "mode"},
    {PlanField::AuxLoad, "aux_load"},
}};

} // namespace

const char* to_string(OperatingMode mode) {
    switch (mode) {
        case OperatingMode::Charge:
            return "charge";
        case OperatingMode::Discharge:
            return "discharge";
        case OperatingMode::Hold:
        default:
            return "hold";
    }
}

std::optional<OperatingMode> mode_from_string(const std::string& name) {
    if (name == "charge") return OperatingMode::Charge;
    if (name == "discharge") return OperatingMode::Discharge;
    if (name == "hold") return OperatingMode::Hold;
    return std::nullopt;
}

const char* field_name(PlanField field) {
    for (const auto& entry : kFieldNames) {
        if (entry.first == field) {
            return entry.second;
        }
    }
    return "unknown";
}

std::optional<PlanField> field_from_name(const std::string& name) {
    for (const auto& entry : kFieldNames) {
        if (name == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

const std::vector<PlanField>& all_plan_fields() {
    static const std::vector<PlanField> fields = [] {
        std::vector<PlanField> out;
        out.reserve(kFieldNames.size());
        for (const auto& entry : kFieldNames) {
            out.push_back(entry.first);
        }
        return out;
    }();
    return fields;
}

bool PlanHour::is_null(PlanField field) const {
    switch (field) {
        case PlanField::HourEnding:        return !hour_ending.has_value();
        case PlanField::Status:            return !status.has_value();
        case PlanField::Hsl:               return std::isnan(hsl);
        case PlanField::Lsl:               return std::isnan(lsl);
        case PlanField::Hel:               return std::isnan(hel);
        case PlanField::Lel:               return std::isnan(lel);
        case PlanField::NormalRampUp:      return std::isnan(normal_ramp_up);
        case PlanField::NormalRampDown:    return std::isnan(normal_ramp_down);
        case PlanField::EmergencyRampUp:   return std::isnan(emergency_ramp_up);
        case PlanField::EmergencyRampDown: return std::isnan(emergency_ramp_down);
        case PlanField::SocBegin:          return std::isnan(soc_begin_mwh);
        case PlanField::SocMin:            return std::isnan(soc_min_mwh);
        case PlanField::SocMax:            return std::isnan(soc_max_mwh);
        case PlanField::TargetMw:          return std::isnan(target_mw);
        case PlanField::AuxLoad:           return std::isnan(aux_load_mw);
        case PlanField::ResourceName:      // plan-level
        case PlanField::Mode:              // always set
        default:
            return false;
    }
}

void OperatingPlan::mark_all_fields() {
    const auto& all = all_plan_fields();
    fields.insert(all.begin(), all.end());
}

std::optional<size_t> OperatingPlan::find_hour(std::time_t hour_ending) const {
    // Fast path for contiguous plans
    if (!hours.empty() && hours.front().hour_ending.has_value()) {
        const std::time_t offset = hour_ending - *hours.front().hour_ending;
        if (offset >= 0 && offset % utils::kSecondsPerHour == 0) {
            const auto idx = static_cast<size_t>(offset / utils::kSecondsPerHour);
            if (idx < hours.size() && hours[idx].hour_ending == hour_ending) {
                return idx;
            }
        }
    }

    for (size_t i = 0; i < hours.size(); ++i) {
        if (hours[i].hour_ending == hour_ending) {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<double> OperatingPlan::soc_sequence() const {
    std::vector<double> soc;
    soc.reserve(hours.size());
    for (const auto& h : hours) {
        soc.push_back(h.soc_begin_mwh);
    }
    return soc;
}

} // namespace plan
