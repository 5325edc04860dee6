/**
 * @file ContentFilterStage.cpp
 * @brief Implementation of ContentFilterStage.
 */

#include "application/stages/ContentFilterStage.hpp"

#include <iostream>
#include <random>

#include "application/TextUtils.hpp"
#include "domain/SafetyErrors.hpp"

namespace sunflower::application::stages {

using domain::PipelineContext;
using domain::SafetyResult;

namespace {
const char* kActionBlocked = "blocked_and_redirected";
}

ContentFilterStage::ContentFilterStage(std::shared_ptr<const AppConfig> config,
                                       std::shared_ptr<const SafetyEngine> engine,
                                       std::shared_ptr<domain::ISafetyIncidentRepository> incidents)
    : m_config(std::move(config)), m_engine(std::move(engine)), m_incidents(std::move(incidents)) {
    if (!m_config || !m_engine) {
        throw domain::ConfigurationError("content filter requires a configuration and a safety engine");
    }
}

std::string ContentFilterStage::name() const {
    return m_config->pipeline.safetyStage;
}

domain::SafetyVerdict ContentFilterStage::apply(PipelineContext context) {
    SafetyResult result = m_engine->evaluate(context.inputText, context.childAge);
    std::string source = "input";
    if (result.isSafe() && !TextUtils::IsBlank(context.responseText)) {
        SafetyResult responseResult = m_engine->evaluate(context.responseText, context.childAge);
        if (!responseResult.isSafe()) {
            result = responseResult;
            source = "response";
        }
    }

    nlohmann::json safety = result.toJson();
    safety["source"] = source;
    if (result.getEducationalRedirect()) {
        safety["educational_redirect"] = *result.getEducationalRedirect();
    }
    context.metadata["safety"] = std::move(safety);

    if (result.isSafe()) {
        return domain::SafetyVerdict{true, std::move(context)};
    }

    for (const auto& flag : result.getFlags()) {
        context.appendSafetyFlag(flag);
    }
    context.responseText = result.getSuggestedRedirect().value_or(m_engine->fallbackRedirect());
    recordIncident(context, result, source);

    return domain::SafetyVerdict{false, std::move(context)};
}

void ContentFilterStage::recordIncident(const PipelineContext& context,
                                        const SafetyResult& result,
                                        const std::string& source) {
    if (!m_incidents) return;

    domain::SafetyIncident incident;
    incident.id = GenerateIncidentId();
    incident.timestamp = std::chrono::system_clock::now();
    incident.childId = context.profileId.empty() ? context.childName : context.profileId;
    incident.childAge = context.childAge;
    incident.sessionId = context.sessionId;
    incident.inputText = TextUtils::Utf8Truncate(context.inputText, m_config->policy.incidentTextLimit);
    incident.category = result.getCategory();
    incident.severity = result.getSeverity();
    incident.actionTaken = kActionBlocked;
    incident.parentNotified = result.requiresParentAlert();
    incident.details = {{"flags", result.getFlags()}, {"source", source}, {"score", result.getScore()}};

    try {
        m_incidents->save(incident);
    } catch (const std::exception& e) {
        std::cerr << "[ContentFilter] Failed to record incident " << incident.id << ": " << e.what() << std::endl;
    }
}

std::string ContentFilterStage::GenerateIncidentId() {
    static const char hex[] = "0123456789abcdef";
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 15);
    std::string id;
    id.reserve(32);
    for (int i = 0; i < 32; ++i) {
        id += hex[dist(engine)];
    }
    return id;
}

} // namespace sunflower::application::stages
