// src/resource/resource_status.cpp
#include "resource/resource_status.hpp"

#include <array>
#include <utility>

namespace resource {

namespace {

constexpr std::array<std::pair<ResourceStatus, const char*>, 12> kStatusCodes = {{
    {ResourceStatus::ON, "ON"},
    {ResourceStatus::OFF, "OFF"},
    {ResourceStatus::ONTEST, "ONTEST"},
    {ResourceStatus::ONREG, "ONREG"},
    {ResourceStatus::ONRR, "ONRR"},
    {ResourceStatus::ONECRS, "ONECRS"},
    {ResourceStatus::OFFNS, "OFFNS"},
    {ResourceStatus::OFFQS, "OFFQS"},
    {ResourceStatus::OUT, "OUT"},
    {ResourceStatus::STARTUP, "STARTUP"},
    {ResourceStatus::SHUTDOWN, "SHUTDOWN"},
    {ResourceStatus::ONEMR, "ONEMR"},
}};

} // namespace

const char* to_string(ResourceStatus status) {
    for (const auto& entry : kStatusCodes) {
        if (entry.first == status) {
            return entry.second;
        }
    }
    return "UNKNOWN";
}

std::optional<ResourceStatus> status_from_string(const std::string& code) {
    for (const auto& entry : kStatusCodes) {
        if (code == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

} // namespace resource
