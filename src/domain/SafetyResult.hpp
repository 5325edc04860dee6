/**
 * @file SafetyResult.hpp
 * @brief Immutable outcome of a single safety evaluation.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/SafetyCategory.hpp"

namespace sunflower::domain {

/**
 * @struct SafetyIssue
 * @brief One pattern match found while scanning a text.
 */
struct SafetyIssue {
    SafetyCategory type;
    std::string matchedPattern;   ///< Rule or term that matched.
    SeverityLevel baseSeverity;
};

/**
 * @class SafetyResult
 * @brief Produced fresh per evaluation; exposes read-only accessors.
 */
class SafetyResult {
public:
    /**
     * @struct Data
     * @brief Field bundle used to construct a result.
     */
    struct Data {
        bool safe = false;
        double score = 0.0;
        std::vector<std::string> flags;
        SafetyCategory category = SafetyCategory::OffTopic;
        SeverityLevel severity = SeverityLevel::Safe;
        bool ageAppropriate = false;
        std::optional<std::string> suggestedRedirect;
        std::optional<std::string> educationalRedirect;
        bool parentAlert = false;
        nlohmann::json details = nlohmann::json::object();
    };

    explicit SafetyResult(Data data) : m_data(std::move(data)) {}

    bool isSafe() const { return m_data.safe; }
    double getScore() const { return m_data.score; }
    const std::vector<std::string>& getFlags() const { return m_data.flags; }
    SafetyCategory getCategory() const { return m_data.category; }
    SeverityLevel getSeverity() const { return m_data.severity; }
    bool isAgeAppropriate() const { return m_data.ageAppropriate; }
    const std::optional<std::string>& getSuggestedRedirect() const { return m_data.suggestedRedirect; }
    const std::optional<std::string>& getEducationalRedirect() const { return m_data.educationalRedirect; }
    bool requiresParentAlert() const { return m_data.parentAlert; }
    const nlohmann::json& getDetails() const { return m_data.details; }

    /** @brief Compact JSON view for stage metadata and incident details. */
    nlohmann::json toJson() const {
        nlohmann::json j;
        j["safe"] = m_data.safe;
        j["score"] = m_data.score;
        j["flags"] = m_data.flags;
        j["category"] = CategoryToString(m_data.category);
        j["severity"] = SeverityValue(m_data.severity);
        j["age_appropriate"] = m_data.ageAppropriate;
        j["parent_alert"] = m_data.parentAlert;
        j["details"] = m_data.details;
        return j;
    }

private:
    Data m_data;
};

} // namespace sunflower::domain
