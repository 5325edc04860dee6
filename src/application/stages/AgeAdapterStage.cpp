/**
 * @file AgeAdapterStage.cpp
 * @brief Implementation of AgeAdapterStage.
 */

#include "application/stages/AgeAdapterStage.hpp"

#include "application/ComplexityAnalyzer.hpp"
#include "application/TextUtils.hpp"
#include "domain/AgeClassifier.hpp"
#include "domain/SafetyErrors.hpp"

namespace sunflower::application::stages {

AgeAdapterStage::AgeAdapterStage(std::shared_ptr<const AppConfig> config, std::shared_ptr<const AgeAdapter> adapter)
    : m_config(std::move(config)), m_adapter(std::move(adapter)) {
    if (!m_config || !m_adapter) {
        throw domain::ConfigurationError("age adapter stage requires a configuration and an adapter");
    }
}

std::string AgeAdapterStage::name() const {
    return m_config->pipeline.adaptationStage;
}

domain::PipelineContext AgeAdapterStage::apply(domain::PipelineContext context) {
    const domain::AgeBand band = domain::AgeClassifier::Classify(context.childAge);
    const std::size_t originalWords = TextUtils::CountWords(context.responseText);

    context.responseText = m_adapter->adapt(context.responseText, band, context.childName);

    context.metadata["age_adapter"] = {
        {"band", domain::BandToString(band)},
        {"reading_level", ComplexityAnalyzer::ReadingLevel(context.responseText)},
        {"original_words", originalWords},
        {"adapted_words", TextUtils::CountWords(context.responseText)}
    };
    return context;
}

} // namespace sunflower::application::stages
