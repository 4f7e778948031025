// src/plan/ancillary_commitment_applier.cpp
#include "plan/ancillary_commitment_applier.hpp"
#include "utils/logging.hpp"
#include "utils/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace plan {

const char* to_string(AsProduct product) {
    switch (product) {
        case AsProduct::Regulation:
            return "REG";
        case AsProduct::ResponsiveReserve:
            return "RRS";
        case AsProduct::Ecrs:
        default:
            return "ECRS";
    }
}

double reserve_hours(AsProduct product) {
    switch (product) {
        case AsProduct::ResponsiveReserve:
            return 1.0;
        case AsProduct::Ecrs:
            return 2.0;
        case AsProduct::Regulation:
        default:
            return 0.0;
    }
}

double committed_mw(const AsCommitment& commitment, AsProduct product) {
    switch (product) {
        case AsProduct::Regulation:
            return commitment.regulation_mw;
        case AsProduct::ResponsiveReserve:
            return commitment.rrs_mw;
        case AsProduct::Ecrs:
        default:
            return commitment.ecrs_mw;
    }
}

const std::vector<AsProduct>& default_as_priority() {
    static const std::vector<AsProduct> priority = {
        AsProduct::Regulation,
        AsProduct::ResponsiveReserve,
        AsProduct::Ecrs,
    };
    return priority;
}

AncillaryCommitmentApplier::AncillaryCommitmentApplier(std::vector<AsProduct> priority)
    : priority_(std::move(priority)) {
    if (priority_.empty()) {
        throw std::invalid_argument("[AncillaryCommitmentApplier] priority list must not be empty");
    }
}

std::optional<AsProduct> AncillaryCommitmentApplier::select_product(const AsCommitment& commitment) const {
    for (AsProduct product : priority_) {
        if (committed_mw(commitment, product) > 0.0) {
            return product;
        }
    }
    return std::nullopt;
}

OperatingPlan AncillaryCommitmentApplier::apply(const OperatingPlan& plan,
                                                const CommitmentSchedule& commitments) const {
    OperatingPlan out = plan;
    size_t applied = 0;

    for (const auto& [hour_ending, commitment] : commitments) {
        const auto idx = out.find_hour(hour_ending);
        if (!idx) {
            LOG_DEBUG("[AncillaryCommitmentApplier] No plan hour for %s, commitment ignored",
                      utils::format_iso8601_utc(hour_ending).c_str());
            continue;
        }

        const auto product = select_product(commitment);
        if (!product) {
            continue;
        }

        overlay(out.hours[*idx], *product, committed_mw(commitment, *product));
        ++applied;
    }

    if (applied > 0) {
        out.fields.insert(PlanField::Status);
        out.fields.insert(PlanField::SocMin);
    }

    LOG_INFO("[AncillaryCommitmentApplier] Applied %zu of %zu commitments", applied, commitments.size());
    return out;
}

void AncillaryCommitmentApplier::overlay(PlanHour& hour, AsProduct product, double mw) {
    switch (product) {
        case AsProduct::Regulation:
            hour.status = resource::ResourceStatus::ONREG;
            hour.target_mw = 0.0;
            hour.mode = OperatingMode::Hold;
            break;
        case AsProduct::ResponsiveReserve:
        case AsProduct::Ecrs: {
            hour.status = (product == AsProduct::ResponsiveReserve)
                              ? resource::ResourceStatus::ONRR
                              : resource::ResourceStatus::ONECRS;
            const double reserved = mw * reserve_hours(product);
            hour.soc_min_mwh = std::isnan(hour.soc_min_mwh)
                                   ? reserved
                                   : std::max(hour.soc_min_mwh, reserved);
            break;
        }
    }
}

} // namespace plan
