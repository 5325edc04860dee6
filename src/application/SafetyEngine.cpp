/**
 * @file SafetyEngine.cpp
 * @brief Implementation of SafetyEngine.
 */

#include "application/SafetyEngine.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "application/TextUtils.hpp"
#include "domain/AgeClassifier.hpp"
#include "domain/SafetyErrors.hpp"

namespace sunflower::application {

using domain::AgeBand;
using domain::SafetyCategory;
using domain::SafetyIssue;
using domain::SafetyResult;
using domain::SeverityLevel;

namespace {

constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

// Texts at least this long whose visible characters are mostly symbols look encoded.
constexpr std::size_t kEncodedMinLength = 12;
constexpr double kEncodedSymbolRatio = 0.3;

struct BuiltinPattern {
    const char* name;
    SafetyCategory category;
    SeverityLevel severity;
    const char* pattern;
};

// Phrasings that are unsafe for every band regardless of profile toggles.
const BuiltinPattern kBuiltinPatterns[] = {
    {"self_harm", SafetyCategory::Dangerous, SeverityLevel::Critical,
     R"(\b(?:hurt|harm|kill|cut|starve)\s+(?:myself|yourself|himself|herself|themselves)\b|\bself[- ]harm\b|\bsuicide\b|\bunalive\b|\bend\s+my\s+life\b|\bself[- ]delete\b|\bforever\s+sleep\b)"},
    {"explosives", SafetyCategory::Dangerous, SeverityLevel::Critical,
     R"(\b(?:make|build|create|assemble|mix)\s+(?:an?\s+|some\s+|my\s+own\s+)?(?:bombs?|explosives?|grenades?|molotovs?|pipe\s+bombs?|poison)\b|\bhow\s+to\s+(?:make|build)\s+.*\bexplode\b)"},
    {"location_request", SafetyCategory::PersonalInfo, SeverityLevel::Severe,
     R"(\bwhat(?:'s|s|\s+is)\s+(?:your|ur)\s+(?:home\s+|street\s+)?address\b|\bwhere\s+do\s+you\s+live\b|\bwhere\s+(?:is|are)\s+(?:your|ur)\s+(?:house|home|school)\b|\b(?:home|street)\s+address\b)"},
    {"financial_request", SafetyCategory::PersonalInfo, SeverityLevel::Severe,
     R"(\b(?:send|give|transfer|wire)\s+(?:me\s+)?(?:your\s+|some\s+)?(?:money|cash|gift\s+cards?|bank\s+details|credit\s+card)\b|\bcredit\s+card\s+number\b|\bbank\s+account\b)"},
    {"stranger_meeting", SafetyCategory::PersonalInfo, SeverityLevel::Critical,
     R"(\bmeet\s+(?:me|up)\b|\bmeet\s+(?:in\s+person|in\s+real\s+life|irl)\b|\bmeet\s+(?:a|this|that)\s+(?:stranger|person|man|woman)\b|\bdon'?t\s+tell\s+(?:your|ur)\s+(?:parents|mom|dad|teacher)\b|\bkeep\s+(?:it|this)\s+(?:a\s+)?secret\s+from\b)"},
    {"phone_number", SafetyCategory::PersonalInfo, SeverityLevel::Severe,
     R"(\b\d{3}[-. ]?\d{3}[-. ]?\d{4}\b)"},
    {"email_address", SafetyCategory::PersonalInfo, SeverityLevel::Severe,
     R"(\b[a-z0-9._%+-]+@[a-z0-9.-]+\.[a-z]{2,}\b)"},
    // Attempts to talk around the filter rather than name the topic.
    {"circumvention", SafetyCategory::Inappropriate, SeverityLevel::Moderate,
     R"(\bhow\s+(?:do\s+i|can\s+i|to)\s+(?:get\s+around|bypass|avoid|trick|turn\s+off|disable|hack)\s+(?:the\s+|this\s+|your\s+|my\s+)?(?:filters?|safety|parental\s+controls?|controls?|rules|blocks?|ai|bot|system)\b)"},
    {"indirect_adult", SafetyCategory::Inappropriate, SeverityLevel::Severe,
     R"(\b(?:tell|show|give|send)\s+me\b.*\b(?:adult|mature|grown[- ]up|18\+)\s+(?:stuff|things|content|videos?|pictures?|pics|movies?|sites?|websites?|jokes?)\b)"},
    {"roleplay", SafetyCategory::Inappropriate, SeverityLevel::Severe,
     R"(\b(?:pretend|imagine|act\s+like)\b.*\b(?:boyfriend|girlfriend|dating|date)\b)"},
};

bool IsLeetLetter(char c) {
    switch (c) {
        case '0': case '1': case '3': case '4': case '5':
        case '7': case '8': case '@': case '$': case '!':
            return true;
        default:
            return false;
    }
}

char FoldLeetChar(char c) {
    switch (c) {
        case '0': return 'o';
        case '1': return 'i';
        case '3': return 'e';
        case '4': return 'a';
        case '5': return 's';
        case '7': return 't';
        case '8': return 'b';
        case '@': return 'a';
        case '$': return 's';
        case '!': return 'i';
        default: return c;
    }
}

std::string IssueKey(const SafetyIssue& issue) {
    return domain::CategoryToString(issue.type) + ":" + issue.matchedPattern;
}

std::string JoinFlags(const std::vector<std::string>& flags) {
    std::string out;
    for (const auto& f : flags) {
        if (!out.empty()) out += ",";
        out += f;
    }
    return out;
}

} // namespace

SafetyEngine::SafetyEngine(std::shared_ptr<const AppConfig> config,
                           std::shared_ptr<domain::RandomSource> random)
    : m_config(std::move(config)), m_random(std::move(random)) {
    if (!m_config) {
        throw domain::ConfigurationError("SafetyEngine requires a configuration");
    }
    if (!m_random) {
        m_random = std::make_shared<domain::FirstChoiceSource>();
    }

    try {
        for (const auto& rule : m_config->termRules) {
            m_termRules.push_back(CompiledRule{
                rule.name, rule.category, rule.severity, rule.gate, rule.bands,
                std::regex(TextUtils::BuildTermPattern(rule.terms), kRegexFlags)});
        }
        for (const auto& builtin : kBuiltinPatterns) {
            m_builtinRules.push_back(CompiledRule{
                builtin.name, builtin.category, builtin.severity, RuleGate::Always, {},
                std::regex(builtin.pattern, kRegexFlags)});
        }
        for (const auto& [band, profile] : m_config->profiles) {
            if (!profile.blockedTopics.empty()) {
                std::vector<std::string> topics(profile.blockedTopics.begin(), profile.blockedTopics.end());
                m_blockedTopics.emplace(band, std::regex(TextUtils::BuildTermPattern(topics), kRegexFlags));
            }
            if (!profile.allowedTopics.empty()) {
                std::vector<std::string> topics(profile.allowedTopics.begin(), profile.allowedTopics.end());
                m_allowedTopics.emplace(band, std::regex(TextUtils::BuildTermPattern(topics), kRegexFlags));
            }
        }
    } catch (const std::regex_error& e) {
        throw domain::ConfigurationError(std::string("safety pattern failed to compile: ") + e.what());
    }
}

SafetyResult SafetyEngine::evaluate(const std::string& text, int age) const {
    m_totalChecks++;

    std::optional<SafetyResult> result;
    try {
        result.emplace(evaluateUnchecked(text, age));
    } catch (const domain::InvalidAgeError& e) {
        std::cerr << "[SafetyEngine] " << e.what() << std::endl;
        result.emplace(failClosed("invalid_age", e.what()));
    } catch (const std::exception& e) {
        std::cerr << "[SafetyEngine] Evaluation failed, treating as unsafe: " << e.what() << std::endl;
        result.emplace(failClosed("evaluation_error", e.what()));
    }

    if (!result->isSafe()) {
        m_blocked++;
        if (result->requiresParentAlert()) m_parentAlerts++;
        std::cerr << "[SafetyEngine] Blocked: band=" << result->getDetails().value("band", "unknown")
                  << " category=" << domain::CategoryToString(result->getCategory())
                  << " severity=" << domain::SeverityToString(result->getSeverity())
                  << " issues=" << result->getFlags().size()
                  << " flags=" << JoinFlags(result->getFlags()) << std::endl;
    }
    return *result;
}

SafetyResult SafetyEngine::evaluateUnchecked(const std::string& text, int age) const {
    const AgeBand band = domain::AgeClassifier::Classify(age);
    const domain::AgeProfile& profile = m_config->profileFor(band);

    SafetyResult::Data data;
    data.details["band"] = domain::BandToString(band);
    data.details["strictness"] = domain::StrictnessToString(profile.strictness);

    if (TextUtils::IsBlank(text)) {
        data.safe = true;
        data.score = 1.0;
        data.category = SafetyCategory::Safe;
        data.severity = SeverityLevel::Safe;
        data.ageAppropriate = true;
        data.details["issue_count"] = 0;
        data.details["on_topic"] = false;
        return SafetyResult(std::move(data));
    }

    const std::string normalized = Normalize(text);
    std::vector<SafetyIssue> issues = scan(normalized, profile);

    // A second pass over the leetspeak-folded text only adds matches the plain pass missed.
    const std::string folded = FoldLeetspeak(normalized);
    if (folded != normalized) {
        std::map<std::string, int> plainCounts;
        for (const auto& issue : issues) plainCounts[IssueKey(issue)]++;
        bool evaded = false;
        for (auto& issue : scan(folded, profile)) {
            int& remaining = plainCounts[IssueKey(issue)];
            if (remaining > 0) {
                --remaining;
            } else {
                issues.push_back(std::move(issue));
                evaded = true;
            }
        }
        if (evaded) data.details["leetspeak"] = true;
    }

    if (LooksEncoded(normalized)) {
        issues.push_back(SafetyIssue{SafetyCategory::Inappropriate, "encoded_text", SeverityLevel::Moderate});
    }

    data.details["on_topic"] = isOnTopic(normalized, band);
    data.details["issue_count"] = issues.size();

    if (issues.empty()) {
        data.safe = true;
        data.score = 1.0;
        data.category = SafetyCategory::Safe;
        data.severity = SeverityLevel::Safe;
        data.ageAppropriate = true;
        return SafetyResult(std::move(data));
    }

    data.safe = false;
    data.score = std::max(0.0, 1.0 - m_config->policy.scorePenaltyPerIssue * static_cast<double>(issues.size()));

    SafetyCategory primary = issues.front().type;
    SeverityLevel worst = SeverityLevel::Safe;
    bool anyCritical = false;
    bool anyAboveCeiling = false;
    nlohmann::json issueList = nlohmann::json::array();
    for (const auto& issue : issues) {
        if (domain::CategoryPriority(issue.type) < domain::CategoryPriority(primary)) {
            primary = issue.type;
        }
        if (domain::SeverityValue(issue.baseSeverity) > domain::SeverityValue(worst)) {
            worst = issue.baseSeverity;
        }
        if (issue.baseSeverity == SeverityLevel::Critical) anyCritical = true;
        if (domain::SeverityValue(issue.baseSeverity) > domain::SeverityValue(profile.tolerance.severityCeiling)) {
            anyAboveCeiling = true;
        }
        data.flags.push_back(domain::CategoryToString(issue.type) + ":" + issue.matchedPattern);
        issueList.push_back({{"type", domain::CategoryToString(issue.type)},
                             {"pattern", issue.matchedPattern},
                             {"severity", domain::SeverityValue(issue.baseSeverity)}});
    }
    data.details["issues"] = std::move(issueList);

    data.category = primary;
    data.severity = domain::BoostSeverity(worst, profile.severityBoost);

    const int count = static_cast<int>(issues.size());
    if (profile.tolerance.maxIssues == 0) {
        data.ageAppropriate = false;
    } else {
        data.ageAppropriate = !anyCritical && !anyAboveCeiling && count <= profile.tolerance.maxIssues;
    }

    data.parentAlert = domain::SeverityValue(data.severity) >= domain::SeverityValue(m_config->policy.parentAlertSeverity)
                       || !data.ageAppropriate;
    data.suggestedRedirect = redirectFor(primary, band);
    data.educationalRedirect = educationalRedirectFor(primary);

    return SafetyResult(std::move(data));
}

SafetyResult SafetyEngine::failClosed(const std::string& flag, const std::string& reason) const {
    SafetyResult::Data data;
    data.safe = false;
    data.score = 0.0;
    data.flags.push_back(flag);
    data.category = SafetyCategory::OffTopic;
    data.severity = SeverityLevel::Moderate;
    data.ageAppropriate = false;
    data.parentAlert = true;
    data.suggestedRedirect = m_config->redirects.fallback;
    data.details["error"] = reason;
    return SafetyResult(std::move(data));
}

std::vector<SafetyIssue> SafetyEngine::scan(const std::string& normalized,
                                            const domain::AgeProfile& profile) const {
    std::vector<SafetyIssue> issues;

    auto blocked = m_blockedTopics.find(profile.band);
    if (blocked != m_blockedTopics.end()) {
        CountMatches(blocked->second, normalized, SafetyCategory::OffTopic, SeverityLevel::Low,
                     "blocked_topic", issues);
    }

    for (const auto& rule : m_termRules) {
        if (!ruleApplies(rule, profile)) continue;
        CountMatches(rule.pattern, normalized, rule.category, rule.severity, rule.name, issues);
    }

    for (const auto& rule : m_builtinRules) {
        CountMatches(rule.pattern, normalized, rule.category, rule.severity, rule.name, issues);
    }

    return issues;
}

bool SafetyEngine::ruleApplies(const CompiledRule& rule, const domain::AgeProfile& profile) const {
    if (!rule.bands.empty() && rule.bands.count(profile.band) == 0) {
        return false;
    }
    switch (rule.gate) {
        case RuleGate::Always: return true;
        case RuleGate::Violent: return !profile.allowViolent;
        case RuleGate::Scary: return !profile.allowScary;
        case RuleGate::Romantic: return !profile.allowRomantic;
    }
    return true;
}

bool SafetyEngine::isOnTopic(const std::string& normalized, AgeBand band) const {
    auto it = m_allowedTopics.find(band);
    if (it == m_allowedTopics.end()) return false;
    return std::regex_search(normalized, it->second);
}

void SafetyEngine::CountMatches(const std::regex& pattern,
                                const std::string& text,
                                SafetyCategory category,
                                SeverityLevel severity,
                                const std::string& name,
                                std::vector<SafetyIssue>& out) {
    auto begin = std::sregex_iterator(text.begin(), text.end(), pattern);
    auto end = std::sregex_iterator();
    for (auto it = begin; it != end; ++it) {
        out.push_back(SafetyIssue{category, name, severity});
    }
}

std::string SafetyEngine::redirectFor(SafetyCategory category, AgeBand band) const {
    const auto& positive = m_config->redirects.positive;
    auto byCategory = positive.find(category);
    if (byCategory != positive.end()) {
        auto byBand = byCategory->second.find(band);
        if (byBand != byCategory->second.end() && !byBand->second.empty()) {
            const auto& phrases = byBand->second;
            std::size_t index = m_random->pick(phrases.size());
            return phrases[std::min(index, phrases.size() - 1)];
        }
    }
    return m_config->redirects.fallback;
}

std::optional<std::string> SafetyEngine::educationalRedirectFor(SafetyCategory category) const {
    const auto& educational = m_config->redirects.educational;
    auto it = educational.find(category);
    if (it == educational.end() || it->second.empty()) {
        return std::nullopt;
    }
    std::size_t index = m_random->pick(it->second.size());
    return it->second[std::min(index, it->second.size() - 1)];
}

SafetyEngine::Statistics SafetyEngine::getStatistics() const {
    Statistics stats;
    stats.totalChecks = m_totalChecks.load();
    stats.blocked = m_blocked.load();
    stats.parentAlerts = m_parentAlerts.load();
    return stats;
}

std::string SafetyEngine::FoldLeetspeak(const std::string& normalized) {
    std::string out = normalized;
    std::size_t start = 0;
    while (start < out.size()) {
        while (start < out.size() && std::isspace(static_cast<unsigned char>(out[start]))) ++start;
        std::size_t end = start;
        bool hasLetter = false;
        while (end < out.size() && !std::isspace(static_cast<unsigned char>(out[end]))) {
            if (std::isalpha(static_cast<unsigned char>(out[end]))) hasLetter = true;
            ++end;
        }
        // Only tokens that already contain letters; "5000" and "555-1234" stay numbers.
        // Trailing '!' is ordinary punctuation.
        std::size_t stop = end;
        while (stop > start && out[stop - 1] == '!') --stop;
        if (hasLetter) {
            for (std::size_t i = start; i < stop; ++i) {
                if (IsLeetLetter(out[i])) out[i] = FoldLeetChar(out[i]);
            }
        }
        start = end;
    }
    return out;
}

bool SafetyEngine::LooksEncoded(const std::string& normalized) {
    std::size_t visible = 0;
    std::size_t symbols = 0;
    for (unsigned char c : normalized) {
        if (std::isspace(c)) continue;
        ++visible;
        // Sentence punctuation and multi-byte UTF-8 (emoji, accents) are not symbols.
        if (c < 0x80 && std::ispunct(c) && std::string(".,!?'\"").find(static_cast<char>(c)) == std::string::npos) {
            ++symbols;
        }
    }
    if (visible < kEncodedMinLength) {
        return false;
    }
    return static_cast<double>(symbols) > kEncodedSymbolRatio * static_cast<double>(visible);
}

std::string SafetyEngine::Normalize(const std::string& text) {
    std::string folded = TextUtils::ReplaceAll(text, "\xE2\x80\x99", "'");  // right single quote
    folded = TextUtils::ReplaceAll(folded, "\xE2\x80\x98", "'");            // left single quote
    return TextUtils::ToLower(folded);
}

} // namespace sunflower::application
