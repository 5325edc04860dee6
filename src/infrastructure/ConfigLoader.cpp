/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <set>

#include "application/TextUtils.hpp"
#include "domain/SafetyErrors.hpp"
#include "infrastructure/DefaultConfig.hpp"

namespace sunflower::infrastructure {

using json = nlohmann::json;
using application::AppConfig;
using application::TextUtils;
using domain::ConfigurationError;

namespace {

const json& Require(const json& obj, const std::string& key, const std::string& where) {
    if (!obj.is_object() || !obj.contains(key)) {
        throw ConfigurationError("missing '" + key + "' in " + where);
    }
    return obj.at(key);
}

template <typename T>
T As(const json& value, const std::string& key, const std::string& where) {
    try {
        return value.get<T>();
    } catch (const json::exception&) {
        throw ConfigurationError("'" + key + "' in " + where + " has the wrong type");
    }
}

template <typename T>
T RequireAs(const json& obj, const std::string& key, const std::string& where) {
    return As<T>(Require(obj, key, where), key, where);
}

template <typename T>
T OptionalAs(const json& obj, const std::string& key, const std::string& where, T fallback) {
    if (!obj.is_object() || !obj.contains(key)) return fallback;
    return As<T>(obj.at(key), key, where);
}

domain::AgeBand ParseBand(const std::string& key, const std::string& where) {
    auto band = domain::BandFromString(key);
    if (!band) throw ConfigurationError("unknown age band '" + key + "' in " + where);
    return *band;
}

std::vector<domain::AgeBand> ParseBandGroup(const std::string& key, const std::string& where) {
    std::vector<domain::AgeBand> bands;
    std::size_t start = 0;
    while (start <= key.size()) {
        std::size_t bar = key.find('|', start);
        std::string part = TextUtils::Trim(key.substr(start, bar == std::string::npos ? std::string::npos : bar - start));
        bands.push_back(ParseBand(part, where));
        if (bar == std::string::npos) break;
        start = bar + 1;
    }
    return bands;
}

domain::SafetyCategory ParseCategory(const std::string& key, const std::string& where) {
    auto category = domain::CategoryFromString(key);
    if (!category || *category == domain::SafetyCategory::Safe) {
        throw ConfigurationError("unknown safety category '" + key + "' in " + where);
    }
    return *category;
}

domain::SeverityLevel ParseSeverity(const std::string& key, const std::string& where) {
    auto severity = domain::SeverityFromString(key);
    if (!severity) throw ConfigurationError("unknown severity '" + key + "' in " + where);
    return *severity;
}

domain::SentenceComplexity ParseComplexity(const std::string& key, const std::string& where) {
    for (auto c : {domain::SentenceComplexity::Simple, domain::SentenceComplexity::Compound,
                   domain::SentenceComplexity::Complex, domain::SentenceComplexity::Sophisticated}) {
        if (domain::ComplexityToString(c) == key) return c;
    }
    throw ConfigurationError("unknown sentence complexity '" + key + "' in " + where);
}

domain::VocabularyTier ParseTier(const std::string& key, const std::string& where) {
    for (auto t : {domain::VocabularyTier::Basic, domain::VocabularyTier::Intermediate,
                   domain::VocabularyTier::Advanced, domain::VocabularyTier::Academic}) {
        if (domain::TierToString(t) == key) return t;
    }
    throw ConfigurationError("unknown vocabulary tier '" + key + "' in " + where);
}

domain::FilterStrictness ParseStrictness(const std::string& key, const std::string& where) {
    for (auto s : {domain::FilterStrictness::Maximum, domain::FilterStrictness::High,
                   domain::FilterStrictness::Moderate, domain::FilterStrictness::Standard}) {
        if (domain::StrictnessToString(s) == key) return s;
    }
    throw ConfigurationError("unknown filter strictness '" + key + "' in " + where);
}

application::RuleGate ParseGate(const std::string& key, const std::string& where) {
    if (key == "always") return application::RuleGate::Always;
    if (key == "violent") return application::RuleGate::Violent;
    if (key == "scary") return application::RuleGate::Scary;
    if (key == "romantic") return application::RuleGate::Romantic;
    throw ConfigurationError("unknown rule gate '" + key + "' in " + where);
}

domain::AgeProfile ParseProfile(const json& j, domain::AgeBand band, const std::set<std::string>& commonTopics) {
    const std::string where = "profile '" + domain::BandToString(band) + "'";
    if (!j.is_object()) throw ConfigurationError(where + " must be an object");

    domain::AgeProfile profile;
    profile.band = band;
    profile.gradeLevel = OptionalAs<std::string>(j, "grade_level", where, "");
    profile.maxWordCount = RequireAs<int>(j, "max_words", where);
    profile.complexity = ParseComplexity(RequireAs<std::string>(j, "complexity", where), where);
    profile.vocabularyTier = ParseTier(RequireAs<std::string>(j, "vocabulary_tier", where), where);
    profile.strictness = ParseStrictness(RequireAs<std::string>(j, "strictness", where), where);
    profile.allowScary = RequireAs<bool>(j, "allow_scary", where);
    profile.allowViolent = RequireAs<bool>(j, "allow_violent", where);
    profile.allowRomantic = RequireAs<bool>(j, "allow_romantic", where);
    profile.severityBoost = OptionalAs<int>(j, "severity_boost", where, 0);
    profile.engagement = OptionalAs<bool>(j, "engagement", where, false);

    const json& tolerance = Require(j, "tolerance", where);
    profile.tolerance.maxIssues = RequireAs<int>(tolerance, "max_issues", where + " tolerance");
    profile.tolerance.severityCeiling =
        ParseSeverity(RequireAs<std::string>(tolerance, "severity_ceiling", where + " tolerance"), where);

    if (j.contains("max_plain_number") && !j.at("max_plain_number").is_null()) {
        profile.maxPlainNumber = As<long long>(j.at("max_plain_number"), "max_plain_number", where);
    }

    profile.allowedTopics = commonTopics;
    for (const auto& topic : OptionalAs<std::vector<std::string>>(j, "allowed_topics", where, {})) {
        profile.allowedTopics.insert(TextUtils::ToLower(TextUtils::Trim(topic)));
    }
    for (const auto& topic : OptionalAs<std::vector<std::string>>(j, "blocked_topics", where, {})) {
        profile.blockedTopics.insert(TextUtils::ToLower(TextUtils::Trim(topic)));
    }
    // A blocked topic wins over the shared allowed list.
    for (const auto& topic : profile.blockedTopics) {
        profile.allowedTopics.erase(topic);
    }
    return profile;
}

AppConfig Parse(const json& doc) {
    if (!doc.is_object()) throw ConfigurationError("document root must be an object");
    AppConfig config;

    const json& pipeline = Require(doc, "pipeline", "configuration");
    config.pipeline.order = RequireAs<std::vector<std::string>>(pipeline, "order", "pipeline");
    config.pipeline.safetyStage = OptionalAs<std::string>(pipeline, "safety_stage", "pipeline", "content_filter");
    config.pipeline.adaptationStage = OptionalAs<std::string>(pipeline, "adaptation_stage", "pipeline", "age_adapter");

    if (doc.contains("policy")) {
        const json& policy = doc.at("policy");
        config.policy.scorePenaltyPerIssue = OptionalAs<double>(policy, "score_penalty_per_issue", "policy", 0.2);
        config.policy.parentAlertSeverity =
            ParseSeverity(OptionalAs<std::string>(policy, "parent_alert_severity", "policy", "moderate"), "policy");
        // Read signed so a negative limit is rejected instead of wrapping.
        const long long textLimit = OptionalAs<long long>(policy, "incident_text_limit", "policy", 500);
        if (textLimit <= 0) {
            throw ConfigurationError("incident_text_limit must be positive, got " + std::to_string(textLimit));
        }
        config.policy.incidentTextLimit = static_cast<std::size_t>(textLimit);
    }

    std::set<std::string> commonTopics;
    for (const auto& topic : OptionalAs<std::vector<std::string>>(doc, "common_allowed_topics", "configuration", {})) {
        commonTopics.insert(TextUtils::ToLower(TextUtils::Trim(topic)));
    }

    const json& profiles = Require(doc, "profiles", "configuration");
    if (!profiles.is_object()) throw ConfigurationError("'profiles' must be an object keyed by age band");
    for (const auto& [key, value] : profiles.items()) {
        domain::AgeBand band = ParseBand(key, "profiles");
        config.profiles.emplace(band, ParseProfile(value, band, commonTopics));
    }

    const json& rules = Require(doc, "term_rules", "configuration");
    if (!rules.is_array()) throw ConfigurationError("'term_rules' must be an array");
    for (const auto& r : rules) {
        application::TermRule rule;
        rule.name = RequireAs<std::string>(r, "name", "term rule");
        const std::string where = "term rule '" + rule.name + "'";
        rule.category = ParseCategory(RequireAs<std::string>(r, "category", where), where);
        rule.severity = ParseSeverity(RequireAs<std::string>(r, "severity", where), where);
        rule.gate = ParseGate(OptionalAs<std::string>(r, "gate", where, "always"), where);
        for (const auto& band : OptionalAs<std::vector<std::string>>(r, "bands", where, {})) {
            rule.bands.insert(ParseBand(band, where));
        }
        for (const auto& term : RequireAs<std::vector<std::string>>(r, "terms", where)) {
            rule.terms.push_back(TextUtils::ToLower(term));
        }
        config.termRules.push_back(std::move(rule));
    }

    const json& redirects = Require(doc, "redirects", "configuration");
    config.redirects.fallback = RequireAs<std::string>(redirects, "fallback", "redirects");
    if (redirects.contains("positive")) {
        for (const auto& [categoryKey, byBand] : redirects.at("positive").items()) {
            domain::SafetyCategory category = ParseCategory(categoryKey, "redirects.positive");
            const std::string where = "redirects.positive." + categoryKey;
            if (!byBand.is_object()) throw ConfigurationError(where + " must be an object keyed by age band");
            for (const auto& [bandKey, phrases] : byBand.items()) {
                auto list = As<std::vector<std::string>>(phrases, bandKey, where);
                for (domain::AgeBand band : ParseBandGroup(bandKey, where)) {
                    auto& slot = config.redirects.positive[category][band];
                    if (!slot.empty()) {
                        throw ConfigurationError("age band '" + domain::BandToString(band) + "' listed twice in " + where);
                    }
                    slot = list;
                }
            }
        }
    }
    if (redirects.contains("educational")) {
        for (const auto& [categoryKey, phrases] : redirects.at("educational").items()) {
            domain::SafetyCategory category = ParseCategory(categoryKey, "redirects.educational");
            config.redirects.educational[category] =
                As<std::vector<std::string>>(phrases, categoryKey, "redirects.educational");
        }
    }

    if (doc.contains("vocabulary")) {
        for (const auto& [tierKey, entries] : doc.at("vocabulary").items()) {
            domain::VocabularyTier tier = ParseTier(tierKey, "vocabulary");
            const std::string where = "vocabulary." + tierKey;
            if (!entries.is_array()) throw ConfigurationError(where + " must be an array");
            auto& list = config.vocabulary[tier];
            for (const auto& e : entries) {
                list.push_back(application::VocabularyEntry{
                    RequireAs<std::string>(e, "term", where), RequireAs<std::string>(e, "replacement", where)});
            }
        }
    }

    const json& engagement = Require(doc, "engagement", "configuration");
    config.engagement.greetings = OptionalAs<std::vector<std::string>>(engagement, "greetings", "engagement", {});
    config.engagement.followUps = OptionalAs<std::vector<std::string>>(engagement, "follow_ups", "engagement", {});
    config.engagement.continuationPrompt = RequireAs<std::string>(engagement, "continuation_prompt", "engagement");
    config.engagement.vagueQuantityWord = RequireAs<std::string>(engagement, "vague_quantity_word", "engagement");

    return config;
}

const std::regex& ClauseSeparator() {
    static const std::regex separator(R"(,\s|;|\s(?:and|but)\s)", std::regex::ECMAScript | std::regex::icase);
    return separator;
}

void ValidateProfiles(const AppConfig& config) {
    for (domain::AgeBand band : domain::kAllAgeBands) {
        if (config.profiles.find(band) == config.profiles.end()) {
            throw ConfigurationError("missing age profile for band '" + domain::BandToString(band) + "'");
        }
    }
    for (const auto& [band, profile] : config.profiles) {
        const std::string where = "profile '" + domain::BandToString(band) + "'";
        if (profile.band != band) {
            throw ConfigurationError(where + " is filed under the wrong band");
        }
        if (profile.maxWordCount <= 0) {
            throw ConfigurationError(where + " needs a positive max_words");
        }
        if (profile.severityBoost < 0 || profile.severityBoost > 1) {
            throw ConfigurationError(where + " severity_boost must be 0 or 1");
        }
        if (profile.tolerance.maxIssues < 0) {
            throw ConfigurationError(where + " tolerance max_issues must not be negative");
        }
        if (profile.tolerance.severityCeiling == domain::SeverityLevel::Critical) {
            throw ConfigurationError(where + " tolerance ceiling must stay below critical");
        }
        if (profile.maxPlainNumber && *profile.maxPlainNumber < 0) {
            throw ConfigurationError(where + " max_plain_number must not be negative");
        }
    }
}

void ValidatePipeline(const AppConfig& config) {
    const auto& p = config.pipeline;
    if (p.safetyStage.empty() || p.adaptationStage.empty() || p.safetyStage == p.adaptationStage) {
        throw ConfigurationError("safety and adaptation stages need distinct, non-empty names");
    }
    if (p.order.empty() || p.order.front() != p.safetyStage) {
        throw ConfigurationError("pipeline order must start with the safety stage '" + p.safetyStage + "'");
    }
    std::set<std::string> seen;
    bool adaptationFound = false;
    for (const auto& name : p.order) {
        if (name.empty()) throw ConfigurationError("pipeline order contains an empty stage name");
        if (!seen.insert(name).second) {
            throw ConfigurationError("stage '" + name + "' appears twice in pipeline order");
        }
        if (name == p.adaptationStage) adaptationFound = true;
    }
    if (!adaptationFound) {
        throw ConfigurationError("pipeline order is missing the adaptation stage '" + p.adaptationStage + "'");
    }
}

void ValidateTermRules(const AppConfig& config) {
    std::set<std::string> names;
    for (const auto& rule : config.termRules) {
        if (rule.name.empty()) throw ConfigurationError("term rule without a name");
        if (!names.insert(rule.name).second) {
            throw ConfigurationError("term rule '" + rule.name + "' defined twice");
        }
        bool hasTerm = false;
        for (const auto& term : rule.terms) {
            if (!TextUtils::IsBlank(term)) hasTerm = true;
        }
        if (!hasTerm) throw ConfigurationError("term rule '" + rule.name + "' has no terms");
        try {
            std::regex compiled(TextUtils::BuildTermPattern(rule.terms), std::regex::ECMAScript | std::regex::icase);
            (void)compiled;
        } catch (const std::regex_error& e) {
            throw ConfigurationError("term rule '" + rule.name + "' does not compile: " + e.what());
        }
    }
}

void ValidateRedirects(const AppConfig& config) {
    if (TextUtils::IsBlank(config.redirects.fallback)) {
        throw ConfigurationError("fallback redirect must not be empty");
    }
    for (const auto& [category, byBand] : config.redirects.positive) {
        for (const auto& [band, phrases] : byBand) {
            for (const auto& phrase : phrases) {
                if (TextUtils::IsBlank(phrase)) {
                    throw ConfigurationError("empty redirect for " + domain::CategoryToString(category) + "/" +
                                             domain::BandToString(band));
                }
            }
        }
    }
}

void ValidateVocabulary(const AppConfig& config) {
    const auto flags = std::regex::ECMAScript | std::regex::icase;
    for (const auto& [tier, entries] : config.vocabulary) {
        const std::string where = "vocabulary tier '" + domain::TierToString(tier) + "'";
        std::vector<std::string> terms;
        std::set<std::string> seen;
        for (const auto& entry : entries) {
            if (TextUtils::IsBlank(entry.term) || TextUtils::IsBlank(entry.replacement)) {
                throw ConfigurationError(where + " has an empty term or replacement");
            }
            if (!seen.insert(TextUtils::ToLower(TextUtils::Trim(entry.term))).second) {
                throw ConfigurationError(where + " lists '" + entry.term + "' twice");
            }
            terms.push_back(entry.term);
        }
        if (terms.empty()) continue;

        std::regex anyTerm(TextUtils::BuildTermPattern(terms), flags);
        for (const auto& entry : entries) {
            if (std::regex_search(entry.replacement, anyTerm)) {
                throw ConfigurationError(where + " replacement '" + entry.replacement +
                                         "' contains a term of the same tier");
            }
            if (std::regex_search(entry.replacement, ClauseSeparator())) {
                throw ConfigurationError(where + " replacement '" + entry.replacement +
                                         "' contains a clause separator");
            }
        }
    }
}

void ValidateEngagement(const AppConfig& config) {
    const auto& e = config.engagement;
    for (const auto& greeting : e.greetings) {
        if (greeting.find("{name}") == std::string::npos) {
            throw ConfigurationError("greeting '" + greeting + "' has no {name} slot");
        }
        if (std::regex_search(greeting, ClauseSeparator())) {
            throw ConfigurationError("greeting '" + greeting + "' contains a clause separator");
        }
    }
    for (const auto& question : e.followUps) {
        if (question.empty() || question.back() != '?') {
            throw ConfigurationError("follow-up '" + question + "' must end with a question mark");
        }
        if (std::regex_search(question, ClauseSeparator())) {
            throw ConfigurationError("follow-up '" + question + "' contains a clause separator");
        }
    }
    if (TextUtils::IsBlank(e.continuationPrompt) || std::regex_search(e.continuationPrompt, ClauseSeparator())) {
        throw ConfigurationError("continuation prompt must be non-empty and a single clause");
    }
    if (TextUtils::CountWords(e.vagueQuantityWord) != 1) {
        throw ConfigurationError("vague quantity word must be exactly one word");
    }

    bool needsPhrases = false;
    for (const auto& [band, profile] : config.profiles) {
        if (profile.engagement) needsPhrases = true;
    }
    if (needsPhrases && e.followUps.empty()) {
        throw ConfigurationError("engagement is enabled but no follow-up questions are configured");
    }
}

} // namespace

std::shared_ptr<const AppConfig> ConfigLoader::LoadFromFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigurationError("file not found: " + path);
    }
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigurationError("cannot open " + path);
    }
    json document;
    try {
        f >> document;
    } catch (const json::exception& e) {
        throw ConfigurationError("cannot parse " + path + ": " + e.what());
    }
    std::cout << "[ConfigLoader] Loading configuration from " << path << std::endl;
    return LoadFromJson(document);
}

std::shared_ptr<const AppConfig> ConfigLoader::LoadFromJson(const json& document) {
    AppConfig config;
    try {
        config = Parse(document);
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("malformed document: ") + e.what());
    }
    Validate(config);
    return std::make_shared<const AppConfig>(std::move(config));
}

std::shared_ptr<const AppConfig> ConfigLoader::LoadDefaults() {
    return LoadFromJson(DefaultConfigJson());
}

json ConfigLoader::DefaultConfigJson() {
    return json::parse(EmbeddedDefaultConfig());
}

void ConfigLoader::Validate(const AppConfig& config) {
    ValidateProfiles(config);
    ValidatePipeline(config);
    ValidateTermRules(config);
    ValidateRedirects(config);
    ValidateVocabulary(config);
    ValidateEngagement(config);

    if (config.policy.scorePenaltyPerIssue <= 0.0 || config.policy.scorePenaltyPerIssue > 1.0) {
        throw ConfigurationError("score_penalty_per_issue must be in (0, 1]");
    }
    if (config.policy.incidentTextLimit == 0) {
        throw ConfigurationError("incident_text_limit must be positive");
    }
}

} // namespace sunflower::infrastructure
