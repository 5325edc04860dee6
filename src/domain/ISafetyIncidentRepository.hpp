/**
 * @file ISafetyIncidentRepository.hpp
 * @brief Interface for persisting and querying safety incidents.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "domain/SafetyIncident.hpp"

namespace sunflower::domain {

class ISafetyIncidentRepository {
public:
    virtual ~ISafetyIncidentRepository() = default;

    virtual void save(const SafetyIncident& incident) = 0;

    // Incidents for one child with from <= timestamp <= to, oldest first.
    virtual std::vector<SafetyIncident> findByChild(const std::string& childId,
                                                    std::chrono::system_clock::time_point from,
                                                    std::chrono::system_clock::time_point to) = 0;
};

} // namespace sunflower::domain
