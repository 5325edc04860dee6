/**
 * @file AppConfig.hpp
 * @brief Immutable application configuration shared by every component.
 */

#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "domain/AgeBand.hpp"
#include "domain/AgeProfile.hpp"
#include "domain/SafetyCategory.hpp"
#include "domain/SafetyErrors.hpp"

namespace sunflower::application {

/**
 * @enum RuleGate
 * @brief Profile toggle that disables a term rule for tolerant bands.
 */
enum class RuleGate { Always, Violent, Scary, Romantic };

/**
 * @struct TermRule
 * @brief Entry of the fixed pattern table, matched with word boundaries.
 */
struct TermRule {
    std::string name;
    domain::SafetyCategory category = domain::SafetyCategory::OffTopic;
    domain::SeverityLevel severity = domain::SeverityLevel::Low;
    RuleGate gate = RuleGate::Always;
    std::set<domain::AgeBand> bands;          ///< Empty means every band.
    std::vector<std::string> terms;
};

struct RedirectTable {
    std::map<domain::SafetyCategory, std::map<domain::AgeBand, std::vector<std::string>>> positive;
    std::map<domain::SafetyCategory, std::vector<std::string>> educational;
    std::string fallback;
};

struct VocabularyEntry {
    std::string term;
    std::string replacement;
};

struct EngagementPhrases {
    std::vector<std::string> greetings;       ///< Each contains a {name} slot.
    std::vector<std::string> followUps;
    std::string continuationPrompt;
    std::string vagueQuantityWord;
};

struct SafetyPolicy {
    double scorePenaltyPerIssue = 0.2;
    domain::SeverityLevel parentAlertSeverity = domain::SeverityLevel::Moderate;
    std::size_t incidentTextLimit = 500;
};

struct PipelineSettings {
    std::vector<std::string> order;
    std::string safetyStage = "content_filter";
    std::string adaptationStage = "age_adapter";
};

/**
 * @struct AppConfig
 * @brief Built once at startup by infrastructure::ConfigLoader.
 */
struct AppConfig {
    std::map<domain::AgeBand, domain::AgeProfile> profiles;
    PipelineSettings pipeline;
    std::vector<TermRule> termRules;
    RedirectTable redirects;
    std::map<domain::VocabularyTier, std::vector<VocabularyEntry>> vocabulary;
    EngagementPhrases engagement;
    SafetyPolicy policy;

    const domain::AgeProfile& profileFor(domain::AgeBand band) const {
        auto it = profiles.find(band);
        if (it == profiles.end()) {
            throw domain::ConfigurationError("no age profile for band '" + domain::BandToString(band) + "'");
        }
        return it->second;
    }
};

} // namespace sunflower::application
