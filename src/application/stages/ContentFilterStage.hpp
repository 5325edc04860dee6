/**
 * @file ContentFilterStage.hpp
 * @brief Safety gate stage backed by SafetyEngine.
 */

#pragma once

#include <memory>
#include <string>

#include "application/AppConfig.hpp"
#include "application/SafetyEngine.hpp"
#include "domain/ISafetyIncidentRepository.hpp"
#include "domain/PipelineStage.hpp"

namespace sunflower::application::stages {

/**
 * @class ContentFilterStage
 * @brief Evaluates the child's input and the draft response for the child's age.
 *
 * On an unsafe verdict the redirect replaces the response, the flags are
 * appended to the context and one incident is recorded. A failing incident
 * store never changes the verdict.
 */
class ContentFilterStage : public domain::SafetyStage {
public:
    /**
     * @param incidents Optional; incidents are not recorded when null.
     */
    ContentFilterStage(std::shared_ptr<const AppConfig> config,
                       std::shared_ptr<const SafetyEngine> engine,
                       std::shared_ptr<domain::ISafetyIncidentRepository> incidents = nullptr);

    std::string name() const override;

    domain::SafetyVerdict apply(domain::PipelineContext context) override;

private:
    void recordIncident(const domain::PipelineContext& context,
                        const domain::SafetyResult& result,
                        const std::string& source);

    static std::string GenerateIncidentId();

    std::shared_ptr<const AppConfig> m_config;
    std::shared_ptr<const SafetyEngine> m_engine;
    std::shared_ptr<domain::ISafetyIncidentRepository> m_incidents;
};

} // namespace sunflower::application::stages
