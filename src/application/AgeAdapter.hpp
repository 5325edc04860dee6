/**
 * @file AgeAdapter.hpp
 * @brief Rewrites safe text to match a band's reading profile.
 */

#pragma once

#include <map>
#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "application/AppConfig.hpp"
#include "domain/AgeBand.hpp"
#include "domain/AgeProfile.hpp"
#include "domain/RandomSource.hpp"

namespace sunflower::application {

/**
 * @class AgeAdapter
 * @brief Pure text rewrite with no safety authority.
 *
 * Only ever called on text the SafetyEngine accepted. The five steps run in a
 * fixed order and adapt(adapt(t)) == adapt(t) for a fixed random source.
 */
class AgeAdapter {
public:
    explicit AgeAdapter(std::shared_ptr<const AppConfig> config,
                        std::shared_ptr<domain::RandomSource> random = nullptr);

    /**
     * @brief Full adaptation for a band.
     * @param childName Used by the greeting; empty disables it.
     */
    std::string adapt(const std::string& text, domain::AgeBand band, const std::string& childName = "") const;

    // Individual steps, exposed for tests.
    std::string substituteVocabulary(const std::string& text, domain::VocabularyTier tier) const;
    std::string restructure(const std::string& text, domain::SentenceComplexity complexity) const;
    std::string enforceLength(const std::string& text, const domain::AgeProfile& profile,
                              const std::string& childName) const;
    std::string injectEngagement(const std::string& text, const domain::AgeProfile& profile,
                                 const std::string& childName) const;
    std::string scrub(const std::string& text, const domain::AgeProfile& profile) const;

private:
    struct CompiledTerm {
        std::regex pattern;
        std::string replacement;
    };

    std::size_t reservedEngagementWords(const domain::AgeProfile& profile, const std::string& childName) const;
    std::string renderGreeting(const std::string& templ, const std::string& childName) const;
    bool nameAlreadyPresent(const std::string& text, const std::string& childName) const;
    std::string replaceLargeNumbers(const std::string& text, long long limit) const;

    static std::string MatchCase(const std::string& original, const std::string& replacement);
    static std::string TruncateWords(const std::string& text, std::size_t maxWords);

    std::shared_ptr<const AppConfig> m_config;
    std::shared_ptr<domain::RandomSource> m_random;
    std::map<domain::VocabularyTier, std::vector<CompiledTerm>> m_vocabulary;

    std::regex m_simpleSeparator;
    std::regex m_compoundSeparator;
    std::regex m_url;
    std::regex m_email;
    std::regex m_phone;
};

} // namespace sunflower::application
