/**
 * @file SafetyEngine.hpp
 * @brief Age-aware category and severity scoring for child-facing text.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

#include "application/AppConfig.hpp"
#include "domain/AgeBand.hpp"
#include "domain/AgeProfile.hpp"
#include "domain/RandomSource.hpp"
#include "domain/SafetyResult.hpp"

namespace sunflower::application {

/**
 * @class SafetyEngine
 * @brief Decides safe/unsafe for a text and a child age, and computes the redirect.
 *
 * Stateless apart from running statistics; safe to call from several worker
 * threads. Any exception raised while evaluating is converted into an unsafe
 * verdict at the boundary of evaluate().
 */
class SafetyEngine {
public:
    struct Statistics {
        std::uint64_t totalChecks = 0;
        std::uint64_t blocked = 0;
        std::uint64_t parentAlerts = 0;
    };

    /**
     * @param config Shared immutable configuration.
     * @param random Phrase selection source; defaults to first-choice.
     * @throws ConfigurationError if a configured pattern does not compile.
     */
    explicit SafetyEngine(std::shared_ptr<const AppConfig> config,
                          std::shared_ptr<domain::RandomSource> random = nullptr);

    /**
     * @brief Evaluates a text for a child of the given age.
     *
     * Never throws. Invalid ages and internal failures yield an unsafe result
     * with parent alert set.
     */
    domain::SafetyResult evaluate(const std::string& text, int age) const;

    /** @brief Positive redirect phrase for a (category, band) pair. */
    std::string redirectFor(domain::SafetyCategory category, domain::AgeBand band) const;

    /** @brief Generic redirect used when nothing more specific applies. */
    const std::string& fallbackRedirect() const { return m_config->redirects.fallback; }

    Statistics getStatistics() const;

private:
    struct CompiledRule {
        std::string name;
        domain::SafetyCategory category;
        domain::SeverityLevel severity;
        RuleGate gate;
        std::set<domain::AgeBand> bands;
        std::regex pattern;
    };

    domain::SafetyResult evaluateUnchecked(const std::string& text, int age) const;
    domain::SafetyResult failClosed(const std::string& flag, const std::string& reason) const;

    std::vector<domain::SafetyIssue> scan(const std::string& normalized,
                                          const domain::AgeProfile& profile) const;
    bool ruleApplies(const CompiledRule& rule, const domain::AgeProfile& profile) const;
    bool isOnTopic(const std::string& normalized, domain::AgeBand band) const;
    std::optional<std::string> educationalRedirectFor(domain::SafetyCategory category) const;

    static std::string Normalize(const std::string& text);
    static std::string FoldLeetspeak(const std::string& normalized);
    static bool LooksEncoded(const std::string& normalized);
    static void CountMatches(const std::regex& pattern,
                             const std::string& text,
                             domain::SafetyCategory category,
                             domain::SeverityLevel severity,
                             const std::string& name,
                             std::vector<domain::SafetyIssue>& out);

    std::shared_ptr<const AppConfig> m_config;
    std::shared_ptr<domain::RandomSource> m_random;

    std::vector<CompiledRule> m_termRules;
    std::vector<CompiledRule> m_builtinRules;
    std::map<domain::AgeBand, std::regex> m_blockedTopics;
    std::map<domain::AgeBand, std::regex> m_allowedTopics;

    mutable std::atomic<std::uint64_t> m_totalChecks{0};
    mutable std::atomic<std::uint64_t> m_blocked{0};
    mutable std::atomic<std::uint64_t> m_parentAlerts{0};
};

} // namespace sunflower::application
