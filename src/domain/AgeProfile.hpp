/**
 * @file AgeProfile.hpp
 * @brief Per-band reading and filtering profile.
 */

#pragma once

#include <optional>
#include <set>
#include <string>
#include "domain/AgeBand.hpp"
#include "domain/SafetyCategory.hpp"

namespace sunflower::domain {

enum class SentenceComplexity { Simple, Compound, Complex, Sophisticated };

/** @brief Vocabulary tier; Academic means no substitution. */
enum class VocabularyTier { Basic, Intermediate, Advanced, Academic };

enum class FilterStrictness { Maximum, High, Moderate, Standard };

inline std::string ComplexityToString(SentenceComplexity c) {
    switch (c) {
        case SentenceComplexity::Simple: return "simple";
        case SentenceComplexity::Compound: return "compound";
        case SentenceComplexity::Complex: return "complex";
        case SentenceComplexity::Sophisticated: return "sophisticated";
    }
    return "sophisticated";
}

inline std::string TierToString(VocabularyTier t) {
    switch (t) {
        case VocabularyTier::Basic: return "basic";
        case VocabularyTier::Intermediate: return "intermediate";
        case VocabularyTier::Advanced: return "advanced";
        case VocabularyTier::Academic: return "academic";
    }
    return "academic";
}

inline std::string StrictnessToString(FilterStrictness s) {
    switch (s) {
        case FilterStrictness::Maximum: return "maximum";
        case FilterStrictness::High: return "high";
        case FilterStrictness::Moderate: return "moderate";
        case FilterStrictness::Standard: return "standard";
    }
    return "maximum";
}

/**
 * @struct TolerancePolicy
 * @brief Decides whether a flagged text still counts as age-appropriate.
 *
 * A band with maxIssues == 0 is strict. Otherwise the text is age-appropriate
 * when the issue count is at most maxIssues and no issue exceeds
 * severityCeiling. The ceiling is always below Critical.
 */
struct TolerancePolicy {
    int maxIssues = 0;
    SeverityLevel severityCeiling = SeverityLevel::Low;
};

/**
 * @struct AgeProfile
 * @brief Immutable configuration attached to one AgeBand.
 */
struct AgeProfile {
    AgeBand band = AgeBand::Toddler;
    std::string gradeLevel;
    int maxWordCount = 50;
    SentenceComplexity complexity = SentenceComplexity::Simple;
    VocabularyTier vocabularyTier = VocabularyTier::Basic;
    FilterStrictness strictness = FilterStrictness::Maximum;
    std::set<std::string> allowedTopics;
    std::set<std::string> blockedTopics;
    bool allowScary = false;
    bool allowViolent = false;
    bool allowRomantic = false;
    int severityBoost = 0;              ///< 0 or 1; younger bands amplify severity.
    TolerancePolicy tolerance;
    bool engagement = false;            ///< Greeting and follow-up injection.
    std::optional<long long> maxPlainNumber; ///< Larger numbers become a vague word.
};

} // namespace sunflower::domain
