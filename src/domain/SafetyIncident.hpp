/**
 * @file SafetyIncident.hpp
 * @brief Persisted record of a blocked turn, consumed by the parent dashboard.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "domain/SafetyCategory.hpp"

namespace sunflower::domain {

struct SafetyIncident {
    static constexpr std::size_t kMaxInputLength = 500;

    std::string id;
    std::chrono::system_clock::time_point timestamp;
    std::string childId;
    int childAge = 0;                 ///< Age at the time of the incident.
    std::string sessionId;
    std::string inputText;            ///< At most kMaxInputLength bytes.
    SafetyCategory category = SafetyCategory::OffTopic;
    SeverityLevel severity = SeverityLevel::Safe;
    std::string actionTaken;
    bool parentNotified = false;
    nlohmann::json details = nlohmann::json::object();
};

} // namespace sunflower::domain
