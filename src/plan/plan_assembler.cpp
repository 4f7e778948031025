// src/plan/plan_assembler.cpp
#include "plan/plan_assembler.hpp"

namespace plan {

void PlanAssembler::assemble(OperatingPlan& plan, const resource::ResourceProfile& profile) {
    plan.resource_name = profile.resource_name();
    plan.resource_type = kResourceType;
    plan.fuel_type = kFuelType;

    for (auto& hour : plan.hours) {
        hour.normal_ramp_up = profile.ramp_up_mw_per_min();
        hour.normal_ramp_down = profile.ramp_down_mw_per_min();
        hour.emergency_ramp_up = profile.ramp_up_mw_per_min() * kEmergencyRampFactor;
        hour.emergency_ramp_down = profile.ramp_down_mw_per_min() * kEmergencyRampFactor;

        hour.hel = hour.hsl;
        hour.lel = hour.lsl;

        hour.aux_load_mw = profile.aux_load_mw();
    }

    plan.fields.insert({PlanField::ResourceName,
                        PlanField::NormalRampUp, PlanField::NormalRampDown,
                        PlanField::EmergencyRampUp, PlanField::EmergencyRampDown,
                        PlanField::Hel, PlanField::Lel, PlanField::AuxLoad});
}

} // namespace plan
