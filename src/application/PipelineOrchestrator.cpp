/**
 * @file PipelineOrchestrator.cpp
 * @brief Implementation of PipelineOrchestrator.
 */

#include "application/PipelineOrchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <set>

#include "application/TextUtils.hpp"
#include "domain/SafetyErrors.hpp"

namespace sunflower::application {

using domain::PipelineContext;

std::string StatusToString(PipelineStatus status) {
    switch (status) {
        case PipelineStatus::Idle: return "idle";
        case PipelineStatus::Processing: return "processing";
        case PipelineStatus::Completed: return "completed";
        case PipelineStatus::Error: return "error";
        case PipelineStatus::SafetyBlocked: return "safety_blocked";
    }
    return "error";
}

PipelineOrchestrator::PipelineOrchestrator(std::shared_ptr<const AppConfig> config,
                                           std::shared_ptr<domain::SafetyStage> safetyStage,
                                           std::vector<std::shared_ptr<domain::PipelineStage>> stages)
    : m_config(std::move(config)), m_safetyStage(std::move(safetyStage)) {
    if (!m_config) {
        throw domain::ConfigurationError("orchestrator requires a configuration");
    }
    if (!m_safetyStage) {
        throw domain::ConfigurationError("orchestrator requires a safety stage");
    }

    const std::vector<std::string>& order = m_config->pipeline.order;
    if (order.empty() || order.front() != m_safetyStage->name()) {
        throw domain::ConfigurationError("pipeline order must start with the safety stage '" +
                                         m_safetyStage->name() + "'");
    }

    std::map<std::string, std::shared_ptr<domain::PipelineStage>> registered;
    for (auto& stage : stages) {
        if (!stage) {
            throw domain::ConfigurationError("null pipeline stage registered");
        }
        if (!registered.emplace(stage->name(), stage).second) {
            throw domain::ConfigurationError("stage '" + stage->name() + "' registered twice");
        }
    }

    std::set<std::string> seen{order.front()};
    for (std::size_t i = 1; i < order.size(); ++i) {
        const std::string& name = order[i];
        if (!seen.insert(name).second) {
            throw domain::ConfigurationError("stage '" + name + "' appears twice in pipeline order");
        }
        auto it = registered.find(name);
        if (it == registered.end()) {
            throw domain::ConfigurationError("pipeline order names unregistered stage '" + name + "'");
        }
        m_orderedStages.push_back(it->second);
    }

    for (const auto& [name, stage] : registered) {
        if (seen.count(name) == 0) {
            std::cerr << "[Pipeline] Stage '" << name << "' is registered but not in pipeline order; it will not run." << std::endl;
        }
    }
}

PipelineOutcome PipelineOrchestrator::process(PipelineContext context) {
    const std::string sessionId = context.sessionId;
    setStatus(sessionId, PipelineStatus::Processing);

    nlohmann::json stageMetadata = nlohmann::json::object();
    const std::string safetyName = m_safetyStage->name();

    // Safety gate. Any failure here is a block, never a pass.
    auto blockOnSafetyFailure = [&](const std::string& reason) {
        std::cerr << "[Pipeline] Safety stage failed for session " << sessionId << ", blocking turn: " << reason << std::endl;
        context.appendSafetyFlag("safety_stage_error");
        context.responseText.clear();
        stageMetadata[safetyName] = {{"safe", false}, {"error", true}};
        setStatus(sessionId, PipelineStatus::SafetyBlocked);
        return blockedOutcome(context, std::move(stageMetadata));
    };

    domain::SafetyVerdict verdict;
    try {
        verdict = m_safetyStage->apply(context);
    } catch (const std::exception& e) {
        return blockOnSafetyFailure(e.what());
    } catch (...) {
        return blockOnSafetyFailure("unknown exception");
    }

    nlohmann::json safetyEntry = {{"safe", verdict.safe}};
    if (verdict.context.metadata.contains("safety")) {
        const auto& safety = verdict.context.metadata["safety"];
        safetyEntry["category"] = safety.value("category", "safe");
        safetyEntry["severity"] = safety.value("severity", 0);
    }
    stageMetadata[safetyName] = safetyEntry;

    if (!verdict.safe) {
        setStatus(sessionId, PipelineStatus::SafetyBlocked);
        return blockedOutcome(verdict.context, std::move(stageMetadata));
    }

    context = std::move(verdict.context);
    for (const auto& stage : m_orderedStages) {
        const std::string name = stage->name();
        auto started = std::chrono::steady_clock::now();
        try {
            PipelineContext before = context;
            PipelineContext after = stage->apply(std::move(context));
            CheckContract(name, before, after);
            context = std::move(after);
        } catch (const domain::StageExecutionError& e) {
            std::cerr << "[Pipeline] Stage '" << name << "' violated the context contract: " << e.detail() << std::endl;
            setStatus(sessionId, PipelineStatus::Error);
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[Pipeline] Stage '" << name << "' failed for session " << sessionId << ": " << e.what() << std::endl;
            setStatus(sessionId, PipelineStatus::Error);
            std::throw_with_nested(domain::StageExecutionError(name, e.what()));
        } catch (...) {
            std::cerr << "[Pipeline] Stage '" << name << "' failed for session " << sessionId << " with a non-standard exception" << std::endl;
            setStatus(sessionId, PipelineStatus::Error);
            std::throw_with_nested(domain::StageExecutionError(name, "unknown exception"));
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
        stageMetadata[name] = {{"processed", true}, {"elapsed_us", elapsed.count()}};
    }

    setStatus(sessionId, PipelineStatus::Completed);

    PipelineOutcome outcome;
    outcome.response = context.responseText;
    outcome.stageMetadata = std::move(stageMetadata);
    outcome.status = PipelineStatus::Completed;
    outcome.safetyFlags = context.safetyFlags;
    return outcome;
}

PipelineOutcome PipelineOrchestrator::blockedOutcome(const PipelineContext& context, nlohmann::json stageMetadata) const {
    PipelineOutcome outcome;
    outcome.response = TextUtils::IsBlank(context.responseText) ? m_config->redirects.fallback : context.responseText;
    outcome.stageMetadata = std::move(stageMetadata);
    outcome.status = PipelineStatus::SafetyBlocked;
    outcome.safetyFlags = context.safetyFlags;
    return outcome;
}

void PipelineOrchestrator::CheckContract(const std::string& stageName,
                                         const PipelineContext& before,
                                         const PipelineContext& after) {
    if (after.inputText != before.inputText) {
        throw domain::StageExecutionError(stageName, "stage modified the input text");
    }
    if (after.safetyFlags.size() < before.safetyFlags.size() ||
        !std::equal(before.safetyFlags.begin(), before.safetyFlags.end(), after.safetyFlags.begin())) {
        throw domain::StageExecutionError(stageName, "stage removed or rewrote safety flags");
    }
}

PipelineStatus PipelineOrchestrator::getSessionStatus(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(m_statusMutex);
    auto it = m_sessionStatus.find(sessionId);
    return it == m_sessionStatus.end() ? PipelineStatus::Idle : it->second;
}

void PipelineOrchestrator::cleanupSession(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(m_statusMutex);
    m_sessionStatus.erase(sessionId);
}

std::size_t PipelineOrchestrator::activeSessionCount() const {
    std::lock_guard<std::mutex> lock(m_statusMutex);
    return m_sessionStatus.size();
}

void PipelineOrchestrator::setStatus(const std::string& sessionId, PipelineStatus status) {
    std::lock_guard<std::mutex> lock(m_statusMutex);
    m_sessionStatus[sessionId] = status;
}

} // namespace sunflower::application
