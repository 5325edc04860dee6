/**
 * @file SafetyIncidentStoreFs.cpp
 * @brief Implementation of SafetyIncidentStoreFs.
 */

#include "infrastructure/SafetyIncidentStoreFs.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "domain/SafetyErrors.hpp"
#include "infrastructure/PathUtils.hpp"

namespace sunflower::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;
using domain::SafetyIncident;

namespace {

std::chrono::system_clock::time_point ToMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
}

} // namespace

SafetyIncidentStoreFs::SafetyIncidentStoreFs(std::string dataRoot, std::shared_ptr<PersistenceService> persistence,
                                             std::size_t cacheLimit)
    : m_dataRoot(std::move(dataRoot)), m_persistence(std::move(persistence)), m_cacheLimit(cacheLimit) {
    if (!m_persistence) {
        throw domain::ConfigurationError("incident store requires a persistence service");
    }
    if (m_cacheLimit == 0) {
        throw domain::ConfigurationError("incident store cache limit must be positive");
    }
}

std::string SafetyIncidentStoreFs::getIncidentFilePath(const std::string& childId) const {
    // Structure: <root>/incidents/<child_id>.ndjson
    fs::path path = fs::path(m_dataRoot) / "incidents" / (PathUtils::SanitizeFileStem(childId) + ".ndjson");
    return path.string();
}

void SafetyIncidentStoreFs::save(const SafetyIncident& incident) {
    if (incident.id.empty()) {
        throw std::invalid_argument("incident id must not be empty");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string stem = PathUtils::SanitizeFileStem(incident.childId);
    auto& incidents = loadLocked(stem, incident.childId);

    SafetyIncident stored = incident;
    stored.timestamp = ToMillis(incident.timestamp);
    m_persistence->appendTextAsync(getIncidentFilePath(incident.childId), ToJson(stored).dump() + "\n");
    incidents.push_back(std::move(stored));
    evictLocked();
}

std::size_t SafetyIncidentStoreFs::cachedLogCount() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cache.size();
}

std::vector<SafetyIncident> SafetyIncidentStoreFs::findByChild(const std::string& childId,
                                                               std::chrono::system_clock::time_point from,
                                                               std::chrono::system_clock::time_point to) {
    std::vector<SafetyIncident> results;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto& incidents = loadLocked(PathUtils::SanitizeFileStem(childId), childId);
        for (const auto& incident : incidents) {
            // Distinct ids may share a sanitized file name.
            if (incident.childId != childId) continue;
            if (incident.timestamp < from || incident.timestamp > to) continue;
            results.push_back(incident);
        }
        evictLocked();
    }
    std::stable_sort(results.begin(), results.end(), [](const SafetyIncident& a, const SafetyIncident& b) {
        return a.timestamp < b.timestamp;
    });
    return results;
}

std::vector<SafetyIncident>& SafetyIncidentStoreFs::loadLocked(const std::string& fileStem, const std::string& childId) {
    auto it = m_cache.find(fileStem);
    if (it != m_cache.end()) {
        it->second.lastUse = ++m_useTick;
        return it->second.incidents;
    }

    // Appends for an evicted log may still be queued.
    m_persistence->flush();

    std::vector<SafetyIncident> loaded;
    std::string filepath = getIncidentFilePath(childId);
    if (fs::exists(filepath)) {
        std::ifstream inFile(filepath);
        std::string line;
        std::size_t lineNo = 0;
        while (std::getline(inFile, line)) {
            ++lineNo;
            if (line.empty()) continue;
            try {
                loaded.push_back(FromJson(json::parse(line)));
            } catch (const std::exception& e) {
                std::cerr << "[IncidentStore] Skipping malformed record " << filepath << ":" << lineNo
                          << " (" << e.what() << ")" << std::endl;
            }
        }
    }
    CachedLog& log = m_cache[fileStem];
    log.incidents = std::move(loaded);
    log.lastUse = ++m_useTick;
    return log.incidents;
}

void SafetyIncidentStoreFs::evictLocked() {
    while (m_cache.size() > m_cacheLimit) {
        auto oldest = std::min_element(m_cache.begin(), m_cache.end(), [](const auto& a, const auto& b) {
            return a.second.lastUse < b.second.lastUse;
        });
        m_cache.erase(oldest);
    }
}

json SafetyIncidentStoreFs::ToJson(const SafetyIncident& incident) {
    json j;
    j["id"] = incident.id;
    j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        incident.timestamp.time_since_epoch()).count();
    j["child_id"] = incident.childId;
    j["child_age"] = incident.childAge;
    j["session_id"] = incident.sessionId;
    j["input_text"] = incident.inputText;
    j["category"] = domain::CategoryToString(incident.category);
    j["severity"] = domain::SeverityValue(incident.severity);
    j["action_taken"] = incident.actionTaken;
    j["parent_notified"] = incident.parentNotified;
    j["details"] = incident.details;
    return j;
}

SafetyIncident SafetyIncidentStoreFs::FromJson(const json& j) {
    SafetyIncident incident;
    incident.id = j.at("id").get<std::string>();
    long long ts = j.at("timestamp").get<long long>();
    incident.timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(ts));
    incident.childId = j.at("child_id").get<std::string>();
    incident.childAge = j.value("child_age", 0);
    incident.sessionId = j.value("session_id", "");
    incident.inputText = j.value("input_text", "");

    auto category = domain::CategoryFromString(j.at("category").get<std::string>());
    if (!category) {
        throw std::invalid_argument("unknown category '" + j.at("category").get<std::string>() + "'");
    }
    incident.category = *category;

    int severity = j.at("severity").get<int>();
    if (severity < 0 || severity > domain::SeverityValue(domain::SeverityLevel::Critical)) {
        throw std::invalid_argument("severity out of range: " + std::to_string(severity));
    }
    incident.severity = static_cast<domain::SeverityLevel>(severity);

    incident.actionTaken = j.value("action_taken", "");
    incident.parentNotified = j.value("parent_notified", false);
    incident.details = j.value("details", json::object());
    return incident;
}

} // namespace sunflower::infrastructure
