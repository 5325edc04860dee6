/**
 * @file AgeAdapterStage.hpp
 * @brief Adaptation stage that rewrites the draft response for the child's band.
 */

#pragma once

#include <memory>
#include <string>

#include "application/AgeAdapter.hpp"
#include "application/AppConfig.hpp"
#include "domain/PipelineStage.hpp"

namespace sunflower::application::stages {

class AgeAdapterStage : public domain::PipelineStage {
public:
    AgeAdapterStage(std::shared_ptr<const AppConfig> config, std::shared_ptr<const AgeAdapter> adapter);

    std::string name() const override;

    /**
     * @brief Rewrites responseText and records metadata["age_adapter"].
     * @throws InvalidAgeError if the child's age is outside [2, 18].
     */
    domain::PipelineContext apply(domain::PipelineContext context) override;

private:
    std::shared_ptr<const AppConfig> m_config;
    std::shared_ptr<const AgeAdapter> m_adapter;
};

} // namespace sunflower::application::stages
