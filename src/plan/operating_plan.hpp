// src/plan/operating_plan.hpp
#pragma once

#include "resource/resource_status.hpp"

#include <cstddef>
#include <ctime>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace plan {

constexpr int kDefaultHorizonHours = 168;  // 7 days x 24 hours

// Marker for an unknown numeric value (an empty CSV cell, a field never set)
constexpr double kNull = std::numeric_limits<double>::quiet_NaN();

enum class OperatingMode {
    Charge,
    Discharge,
    Hold
};

const char* to_string(OperatingMode mode);
std::optional<OperatingMode> mode_from_string(const std::string& name);

/**
 * PlanField - Columns of an operating plan
 *
 * field_name() returns the column name used in CSV files and the
 * submission payload. An OperatingPlan records which fields it carries
 * so that incomplete plans read from disk can be audited.
 */
enum class PlanField {
    HourEnding,
    ResourceName,
    Status,
    Hsl,
    Lsl,
    Hel,
    Lel,
    NormalRampUp,
    NormalRampDown,
    EmergencyRampUp,
    EmergencyRampDown,
    SocBegin,
    SocMin,
    SocMax,
    TargetMw,
    Mode,
    AuxLoad
};

const char* field_name(PlanField field);
std::optional<PlanField> field_from_name(const std::string& name);

// Every field, in CSV column order
const std::vector<PlanField>& all_plan_fields();

/**
 * PlanHour - One clock hour of the plan
 *
 * Units are embedded in field names where they are not MW.
 * target_mw: positive = discharge, negative = charge.
 */
struct PlanHour {
    std::optional<std::time_t> hour_ending;
    std::optional<resource::ResourceStatus> status;

    // Power envelope (MW)
    double hsl = kNull;
    double lsl = kNull;
    double hel = kNull;
    double lel = kNull;

    // Ramp rates (MW/min)
    double normal_ramp_up = kNull;
    double normal_ramp_down = kNull;
    double emergency_ramp_up = kNull;
    double emergency_ramp_down = kNull;

    // State of charge (MWh)
    double soc_begin_mwh = kNull;
    double soc_min_mwh = kNull;
    double soc_max_mwh = kNull;

    // Internal planning fields
    double target_mw = 0.0;
    OperatingMode mode = OperatingMode::Hold;

    double aux_load_mw = kNull;

    // True when the field holds no value
    bool is_null(PlanField field) const;
};

/**
 * OperatingPlan - Ordered hourly schedule for one resource
 *
 * Owned by whoever produced it. Hours are expected to be contiguous and
 * strictly increasing; the validator reports when they are not.
 */
struct OperatingPlan {
    std::string resource_name;
    std::string resource_type;
    std::string fuel_type;

    std::vector<PlanHour> hours;

    // Fields this plan carries
    std::set<PlanField> fields;

    size_t size() const { return hours.size(); }
    bool empty() const { return hours.empty(); }

    bool has_field(PlanField field) const { return fields.count(field) > 0; }
    void mark_all_fields();

    // Index of the hour with the given timestamp, if present
    std::optional<size_t> find_hour(std::time_t hour_ending) const;

    std::vector<double> soc_sequence() const;
};

} // namespace plan
