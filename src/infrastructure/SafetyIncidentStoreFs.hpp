/**
 * @file SafetyIncidentStoreFs.hpp
 * @brief File-system store for safety incidents, one NDJSON log per child.
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/ISafetyIncidentRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace sunflower::infrastructure {

/**
 * @class SafetyIncidentStoreFs
 * @brief Keeps <root>/incidents/<child_id>.ndjson and an in-memory cache of it.
 *
 * A child's log is read from disk the first time it is touched and then
 * served from memory. Each save appends one line through PersistenceService.
 * At most cacheLimit logs stay in memory; the least recently used one is
 * dropped and read back from disk when next needed.
 */
class SafetyIncidentStoreFs : public domain::ISafetyIncidentRepository {
public:
    SafetyIncidentStoreFs(std::string dataRoot, std::shared_ptr<PersistenceService> persistence,
                          std::size_t cacheLimit = 64);

    void save(const domain::SafetyIncident& incident) override;

    std::vector<domain::SafetyIncident> findByChild(const std::string& childId,
                                                    std::chrono::system_clock::time_point from,
                                                    std::chrono::system_clock::time_point to) override;

    /** @brief Number of child logs currently held in memory. */
    std::size_t cachedLogCount();

    /** @brief Path of the log that holds a child's incidents. */
    std::string getIncidentFilePath(const std::string& childId) const;

    static nlohmann::json ToJson(const domain::SafetyIncident& incident);
    /** @throws nlohmann::json::exception or std::invalid_argument on malformed records. */
    static domain::SafetyIncident FromJson(const nlohmann::json& j);

private:
    struct CachedLog {
        std::vector<domain::SafetyIncident> incidents;
        std::uint64_t lastUse = 0;
    };

    std::vector<domain::SafetyIncident>& loadLocked(const std::string& fileStem, const std::string& childId);
    void evictLocked();

    std::string m_dataRoot;
    std::shared_ptr<PersistenceService> m_persistence;
    std::size_t m_cacheLimit;

    std::mutex m_mutex;
    std::map<std::string, CachedLog> m_cache; ///< Keyed by file stem.
    std::uint64_t m_useTick = 0;
};

} // namespace sunflower::infrastructure
