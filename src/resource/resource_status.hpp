// src/resource/resource_status.hpp
#pragma once

#include <optional>
#include <string>

namespace resource {

/**
 * ResourceStatus - Market resource status code for one plan hour
 *
 * Each hour carries its own status. No transition rules are enforced
 * between consecutive hours (e.g. ON -> OFF without SHUTDOWN is accepted).
 */
enum class ResourceStatus {
    ON,        // Online and dispatchable
    OFF,       // Offline
    ONTEST,    // Testing
    ONREG,     // Providing Regulation
    ONRR,      // Providing Responsive Reserve
    ONECRS,    // Providing ECRS
    OFFNS,     // Offline Non-Spin
    OFFQS,     // Offline Quick Start
    OUT,       // Forced Outage
    STARTUP,
    SHUTDOWN,
    ONEMR      // Emergency run
};

const char* to_string(ResourceStatus status);

// Exact, case-sensitive match on the market code ("ONREG", ...)
std::optional<ResourceStatus> status_from_string(const std::string& code);

} // namespace resource
