/**
 * @file SafetyCategory.hpp
 * @brief Closed category and severity scales used by safety evaluation.
 */

#pragma once

#include <optional>
#include <string>

namespace sunflower::domain {

/**
 * @enum SafetyCategory
 * @brief Primary classification of an evaluated text.
 */
enum class SafetyCategory {
    Safe,
    Violence,
    Inappropriate,
    PersonalInfo,
    Dangerous,
    Scary,
    Bullying,
    Medical,
    Commercial,
    Profanity,
    OffTopic
};

/**
 * @enum SeverityLevel
 * @brief Ordered 0..4 severity scale.
 */
enum class SeverityLevel {
    Safe = 0,
    Low = 1,
    Moderate = 2,
    Severe = 3,
    Critical = 4
};

inline std::string CategoryToString(SafetyCategory category) {
    switch (category) {
        case SafetyCategory::Safe: return "safe";
        case SafetyCategory::Violence: return "violence";
        case SafetyCategory::Inappropriate: return "inappropriate";
        case SafetyCategory::PersonalInfo: return "personal_info";
        case SafetyCategory::Dangerous: return "dangerous";
        case SafetyCategory::Scary: return "scary";
        case SafetyCategory::Bullying: return "bullying";
        case SafetyCategory::Medical: return "medical";
        case SafetyCategory::Commercial: return "commercial";
        case SafetyCategory::Profanity: return "profanity";
        case SafetyCategory::OffTopic: return "off_topic";
    }
    return "off_topic";
}

inline std::optional<SafetyCategory> CategoryFromString(const std::string& key) {
    static const SafetyCategory all[] = {
        SafetyCategory::Safe, SafetyCategory::Violence, SafetyCategory::Inappropriate,
        SafetyCategory::PersonalInfo, SafetyCategory::Dangerous, SafetyCategory::Scary,
        SafetyCategory::Bullying, SafetyCategory::Medical, SafetyCategory::Commercial,
        SafetyCategory::Profanity, SafetyCategory::OffTopic
    };
    for (SafetyCategory category : all) {
        if (CategoryToString(category) == key) return category;
    }
    return std::nullopt;
}

/**
 * @brief Rank used to pick the primary category when several match.
 *
 * Lower rank wins: Violence > Inappropriate > PersonalInfo > Dangerous >
 * Scary > Bullying > Profanity > Medical > Commercial > OffTopic.
 * Safe is never an issue type and ranks last.
 */
inline int CategoryPriority(SafetyCategory category) {
    switch (category) {
        case SafetyCategory::Violence: return 0;
        case SafetyCategory::Inappropriate: return 1;
        case SafetyCategory::PersonalInfo: return 2;
        case SafetyCategory::Dangerous: return 3;
        case SafetyCategory::Scary: return 4;
        case SafetyCategory::Bullying: return 5;
        case SafetyCategory::Profanity: return 6;
        case SafetyCategory::Medical: return 7;
        case SafetyCategory::Commercial: return 8;
        case SafetyCategory::OffTopic: return 9;
        case SafetyCategory::Safe: return 10;
    }
    return 10;
}

inline std::string SeverityToString(SeverityLevel severity) {
    switch (severity) {
        case SeverityLevel::Safe: return "safe";
        case SeverityLevel::Low: return "low";
        case SeverityLevel::Moderate: return "moderate";
        case SeverityLevel::Severe: return "severe";
        case SeverityLevel::Critical: return "critical";
    }
    return "critical";
}

inline std::optional<SeverityLevel> SeverityFromString(const std::string& key) {
    for (int level = 0; level <= 4; ++level) {
        auto severity = static_cast<SeverityLevel>(level);
        if (SeverityToString(severity) == key) return severity;
    }
    return std::nullopt;
}

inline int SeverityValue(SeverityLevel severity) { return static_cast<int>(severity); }

/** @brief Adds a boost to a severity, capped at Critical. */
inline SeverityLevel BoostSeverity(SeverityLevel severity, int boost) {
    int value = SeverityValue(severity) + boost;
    if (value > SeverityValue(SeverityLevel::Critical)) value = SeverityValue(SeverityLevel::Critical);
    if (value < 0) value = 0;
    return static_cast<SeverityLevel>(value);
}

} // namespace sunflower::domain
