// src/plan/plan_assembler.hpp
#pragma once

#include "plan/operating_plan.hpp"
#include "resource/resource_profile.hpp"

namespace plan {

// Emergency ramp rates are this multiple of the normal rates
constexpr double kEmergencyRampFactor = 1.5;

/**
 * PlanAssembler - Adds the static fields a submitted plan must carry
 *
 * Ramp rates, emergency ramp rates, emergency limits (HEL = HSL,
 * LEL = LSL for storage), auxiliary load and the resource/fuel type.
 */
class PlanAssembler {
public:
    static constexpr const char* kResourceType = "ESR";
    static constexpr const char* kFuelType = "BATTERY";

    static void assemble(OperatingPlan& plan, const resource::ResourceProfile& profile);
};

} // namespace plan
