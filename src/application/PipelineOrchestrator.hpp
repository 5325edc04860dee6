/**
 * @file PipelineOrchestrator.hpp
 * @brief Runs the configured stage list for one turn with safety short-circuit.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/AppConfig.hpp"
#include "domain/PipelineContext.hpp"
#include "domain/PipelineStage.hpp"

namespace sunflower::application {

/**
 * @enum PipelineStatus
 * @brief Per-session state. Completed, Error and SafetyBlocked describe the last turn.
 */
enum class PipelineStatus {
    Idle,
    Processing,
    Completed,
    Error,
    SafetyBlocked
};

std::string StatusToString(PipelineStatus status);

/**
 * @struct PipelineOutcome
 * @brief What a caller receives for a turn that did not raise.
 */
struct PipelineOutcome {
    std::string response;
    nlohmann::json stageMetadata = nlohmann::json::object();
    PipelineStatus status = PipelineStatus::Idle;
    std::vector<std::string> safetyFlags;
};

/**
 * @class PipelineOrchestrator
 * @brief Executes stages in configured order over a per-turn context.
 *
 * The safety stage is the only one that may halt the turn. Any other stage
 * that throws marks the session Error and the failure reaches the caller as
 * a StageExecutionError with the original exception nested inside.
 * Safe to call process() concurrently for different sessions.
 */
class PipelineOrchestrator {
public:
    /**
     * @throws ConfigurationError if the order names an unregistered stage,
     *         repeats a stage or does not start with the safety stage.
     */
    PipelineOrchestrator(std::shared_ptr<const AppConfig> config,
                         std::shared_ptr<domain::SafetyStage> safetyStage,
                         std::vector<std::shared_ptr<domain::PipelineStage>> stages);

    PipelineOutcome process(domain::PipelineContext context);

    /** @brief Idle for sessions that never ran or were cleaned up. */
    PipelineStatus getSessionStatus(const std::string& sessionId) const;

    void cleanupSession(const std::string& sessionId);

    std::size_t activeSessionCount() const;

private:
    void setStatus(const std::string& sessionId, PipelineStatus status);
    PipelineOutcome blockedOutcome(const domain::PipelineContext& context, nlohmann::json stageMetadata) const;

    static void CheckContract(const std::string& stageName,
                              const domain::PipelineContext& before,
                              const domain::PipelineContext& after);

    std::shared_ptr<const AppConfig> m_config;
    std::shared_ptr<domain::SafetyStage> m_safetyStage;
    std::vector<std::shared_ptr<domain::PipelineStage>> m_orderedStages; ///< Everything after the safety stage.

    mutable std::mutex m_statusMutex;
    std::map<std::string, PipelineStatus> m_sessionStatus;
};

} // namespace sunflower::application
