/**
 * @file AgeAdapter.cpp
 * @brief Implementation of AgeAdapter.
 */

#include "application/AgeAdapter.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "application/TextUtils.hpp"
#include "domain/SafetyErrors.hpp"

namespace sunflower::application {

using domain::AgeProfile;
using domain::SentenceComplexity;

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;
constexpr double kSentenceKeepRatio = 0.7;

const char* kLinkPlaceholder = "[link-removed]";
const char* kEmailPlaceholder = "[email-removed]";
const char* kPhonePlaceholder = "[phone-removed]";

bool IsWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool IsTerminal(char c) {
    return c == '.' || c == '!' || c == '?';
}

bool StartsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Ends a dangling clause so text appended after it starts a new sentence.
std::string CloseSentence(std::string text) {
    while (!text.empty() && std::string(",;: \t\n").find(text.back()) != std::string::npos) {
        text.pop_back();
    }
    std::size_t last = text.size();
    while (last > 0 && std::string("\"')]").find(text[last - 1]) != std::string::npos) {
        --last;
    }
    if (!text.empty() && (last == 0 || !IsTerminal(text[last - 1]))) {
        text.push_back('.');
    }
    return text;
}

std::vector<std::string> SplitClauses(const std::string& body, const std::regex& separator) {
    std::vector<std::string> clauses;
    std::sregex_token_iterator it(body.begin(), body.end(), separator, -1);
    std::sregex_token_iterator end;
    for (; it != end; ++it) {
        std::string clause = TextUtils::Trim(it->str());
        if (!clause.empty()) clauses.push_back(clause);
    }
    return clauses;
}

std::string ReplaceMatches(const std::string& text, const std::regex& pattern, const std::string& replacement) {
    return std::regex_replace(text, pattern, replacement);
}

} // namespace

AgeAdapter::AgeAdapter(std::shared_ptr<const AppConfig> config,
                       std::shared_ptr<domain::RandomSource> random)
    : m_config(std::move(config)), m_random(std::move(random)) {
    if (!m_config) {
        throw domain::ConfigurationError("AgeAdapter requires a configuration");
    }
    if (!m_random) {
        m_random = std::make_shared<domain::FirstChoiceSource>();
    }

    try {
        for (const auto& [tier, entries] : m_config->vocabulary) {
            // Longer terms first so "scientific method" wins over "method".
            std::vector<VocabularyEntry> sorted = entries;
            std::stable_sort(sorted.begin(), sorted.end(), [](const VocabularyEntry& a, const VocabularyEntry& b) {
                return a.term.size() > b.term.size();
            });
            auto& compiled = m_vocabulary[tier];
            for (const auto& entry : sorted) {
                compiled.push_back(CompiledTerm{
                    std::regex(TextUtils::BuildTermPattern({entry.term}), kIcase), entry.replacement});
            }
        }

        m_simpleSeparator = std::regex(R"(\s*(?:,\s+|;\s*)(?:(?:and|but)\s+)?|\s+(?:and|but)\s+)", kIcase);
        m_compoundSeparator = std::regex(R"(\s*(?:,\s+|;\s*))", kIcase);
        m_url = std::regex(R"(\b(?:https?://|www\.)[^\s<>"]*[^\s<>".,;:!?)])", kIcase);
        m_email = std::regex(R"(\b[a-z0-9._%+-]+@[a-z0-9.-]+\.[a-z]{2,}\b)", kIcase);
        m_phone = std::regex(R"((?:\(\d{3}\)\s?|\b\d{3}[-. ]?)\d{3}[-. ]?\d{4}\b)", kIcase);
    } catch (const std::regex_error& e) {
        throw domain::ConfigurationError(std::string("adapter pattern failed to compile: ") + e.what());
    }
}

std::string AgeAdapter::adapt(const std::string& text, domain::AgeBand band, const std::string& childName) const {
    if (TextUtils::IsBlank(text)) {
        return text;
    }
    const AgeProfile& profile = m_config->profileFor(band);

    std::string out = substituteVocabulary(text, profile.vocabularyTier);
    out = restructure(out, profile.complexity);
    out = enforceLength(out, profile, childName);
    out = injectEngagement(out, profile, childName);
    out = scrub(out, profile);
    return out;
}

std::string AgeAdapter::substituteVocabulary(const std::string& text, domain::VocabularyTier tier) const {
    auto it = m_vocabulary.find(tier);
    if (it == m_vocabulary.end()) {
        return text;
    }

    std::string current = text;
    for (const auto& term : it->second) {
        std::string rewritten;
        auto last = current.cbegin();
        for (std::sregex_iterator m(current.begin(), current.end(), term.pattern), end; m != end; ++m) {
            rewritten.append(last, current.cbegin() + m->position(0));
            rewritten += MatchCase(m->str(0), term.replacement);
            last = current.cbegin() + m->position(0) + m->length(0);
        }
        rewritten.append(last, current.cend());
        current = std::move(rewritten);
    }
    return current;
}

std::string AgeAdapter::restructure(const std::string& text, SentenceComplexity complexity) const {
    if (complexity != SentenceComplexity::Simple && complexity != SentenceComplexity::Compound) {
        return text;
    }

    const bool simple = complexity == SentenceComplexity::Simple;
    const std::regex& separator = simple ? m_simpleSeparator : m_compoundSeparator;
    const std::size_t maxClauses = simple ? 1 : 2;

    std::vector<std::string> out;
    for (const auto& sentence : TextUtils::SplitSentences(text)) {
        std::string body = sentence;
        std::string terminal;
        while (!body.empty() && IsTerminal(body.back())) {
            terminal.insert(terminal.begin(), body.back());
            body.pop_back();
        }

        std::vector<std::string> clauses = SplitClauses(body, separator);
        if (clauses.size() <= maxClauses) {
            out.push_back(sentence);
            continue;
        }

        for (std::size_t i = 0; i < clauses.size(); i += maxClauses) {
            std::string group = TextUtils::CapitalizeFirst(clauses[i]);
            for (std::size_t j = i + 1; j < std::min(i + maxClauses, clauses.size()); ++j) {
                group += ", " + clauses[j];
            }
            const bool lastGroup = i + maxClauses >= clauses.size();
            group += lastGroup ? terminal : ".";
            out.push_back(group);
        }
    }
    return TextUtils::JoinSentences(out);
}

std::string AgeAdapter::enforceLength(const std::string& text, const AgeProfile& profile,
                                      const std::string& childName) const {
    const EngagementPhrases& phrases = m_config->engagement;

    // Set aside phrases a previous pass injected so they are never measured or cut.
    std::string body = text;
    std::string greeting;
    std::string followUp;
    if (profile.engagement) {
        if (!childName.empty()) {
            for (const auto& templ : phrases.greetings) {
                std::string rendered = renderGreeting(templ, childName);
                if (StartsWith(body, rendered + " ")) {
                    greeting = rendered;
                    body = body.substr(rendered.size() + 1);
                    break;
                }
            }
        }
        for (const auto& question : phrases.followUps) {
            if (body.size() > question.size() && EndsWith(body, " " + question)) {
                followUp = question;
                body = body.substr(0, body.size() - question.size() - 1);
                break;
            }
        }
    }
    body = TextUtils::Trim(body);

    const std::size_t limit = static_cast<std::size_t>(profile.maxWordCount);
    const std::size_t reserved = reservedEngagementWords(profile, childName);
    const std::size_t promptWords = TextUtils::CountWords(phrases.continuationPrompt);
    std::size_t effectiveMax = limit > reserved ? limit - reserved : 0;
    if (effectiveMax <= promptWords) {
        effectiveMax = promptWords + 1;
    }

    if (TextUtils::CountWords(body) > effectiveMax) {
        std::vector<std::string> kept;
        std::size_t keptWords = 0;
        for (const auto& sentence : TextUtils::SplitSentences(body)) {
            std::size_t words = TextUtils::CountWords(sentence);
            if (keptWords + words > effectiveMax) break;
            kept.push_back(sentence);
            keptWords += words;
        }

        if (!kept.empty() && static_cast<double>(keptWords) >= kSentenceKeepRatio * static_cast<double>(effectiveMax)) {
            body = TextUtils::JoinSentences(kept);
        } else {
            body = TruncateWords(body, effectiveMax - promptWords) + "... " + phrases.continuationPrompt;
        }
    }

    std::string out = greeting;
    if (!body.empty()) {
        if (!out.empty()) out += " ";
        out += body;
    }
    if (!followUp.empty()) {
        if (!out.empty()) out += " ";
        out += followUp;
    }
    return out;
}

std::string AgeAdapter::injectEngagement(const std::string& text, const AgeProfile& profile,
                                         const std::string& childName) const {
    if (!profile.engagement) {
        return text;
    }
    const EngagementPhrases& phrases = m_config->engagement;
    std::string out = TextUtils::Trim(text);
    if (!phrases.followUps.empty() && !out.empty() && out.back() != '?') {
        out = CloseSentence(out);
    }

    if (!childName.empty() && !phrases.greetings.empty() && !nameAlreadyPresent(out, childName)) {
        std::size_t index = std::min(m_random->pick(phrases.greetings.size()), phrases.greetings.size() - 1);
        std::string greeting = renderGreeting(phrases.greetings[index], childName);
        out = out.empty() ? greeting : greeting + " " + out;
    }

    if (!phrases.followUps.empty() && (out.empty() || out.back() != '?')) {
        std::size_t index = std::min(m_random->pick(phrases.followUps.size()), phrases.followUps.size() - 1);
        out = out.empty() ? phrases.followUps[index] : out + " " + phrases.followUps[index];
    }
    return out;
}

std::string AgeAdapter::scrub(const std::string& text, const AgeProfile& profile) const {
    std::string out = ReplaceMatches(text, m_url, kLinkPlaceholder);
    out = ReplaceMatches(out, m_email, kEmailPlaceholder);
    out = ReplaceMatches(out, m_phone, kPhonePlaceholder);
    if (profile.maxPlainNumber) {
        out = replaceLargeNumbers(out, *profile.maxPlainNumber);
    }
    return out;
}

std::size_t AgeAdapter::reservedEngagementWords(const AgeProfile& profile, const std::string& childName) const {
    if (!profile.engagement) {
        return 0;
    }
    const EngagementPhrases& phrases = m_config->engagement;
    std::size_t greetingWords = 0;
    if (!childName.empty()) {
        for (const auto& templ : phrases.greetings) {
            greetingWords = std::max(greetingWords, TextUtils::CountWords(renderGreeting(templ, childName)));
        }
    }
    std::size_t followUpWords = 0;
    for (const auto& question : phrases.followUps) {
        followUpWords = std::max(followUpWords, TextUtils::CountWords(question));
    }
    return greetingWords + followUpWords;
}

std::string AgeAdapter::renderGreeting(const std::string& templ, const std::string& childName) const {
    return TextUtils::ReplaceAll(templ, "{name}", childName);
}

bool AgeAdapter::nameAlreadyPresent(const std::string& text, const std::string& childName) const {
    std::size_t pos = 0;
    while ((pos = text.find(childName, pos)) != std::string::npos) {
        bool startOk = pos == 0 || !IsWordChar(text[pos - 1]);
        std::size_t after = pos + childName.size();
        bool endOk = after >= text.size() || !IsWordChar(text[after]);
        if (startOk && endOk) return true;
        pos = after;
    }
    return false;
}

std::string AgeAdapter::replaceLargeNumbers(const std::string& text, long long limit) const {
    const std::string& vague = m_config->engagement.vagueQuantityWord;
    std::string out;
    std::size_t i = 0;
    while (i < text.size()) {
        const bool digit = std::isdigit(static_cast<unsigned char>(text[i])) != 0;
        const bool boundary = i == 0 || (!IsWordChar(text[i - 1]) && text[i - 1] != '.');
        if (!digit || !boundary) {
            out.push_back(text[i++]);
            continue;
        }

        std::size_t end = i;
        std::string integerPart;
        bool inFraction = false;
        while (end < text.size()) {
            char c = text[end];
            bool nextIsDigit = end + 1 < text.size() && std::isdigit(static_cast<unsigned char>(text[end + 1]));
            if (std::isdigit(static_cast<unsigned char>(c))) {
                if (!inFraction) integerPart.push_back(c);
                ++end;
            } else if (c == ',' && !inFraction && nextIsDigit) {
                ++end;
            } else if (c == '.' && !inFraction && nextIsDigit) {
                inFraction = true;
                ++end;
            } else {
                break;
            }
        }

        // "5th", "3D" and similar tokens are left alone.
        if (end < text.size() && IsWordChar(text[end])) {
            out.append(text, i, end - i);
            i = end;
            continue;
        }

        std::size_t firstNonZero = integerPart.find_first_not_of('0');
        std::string significant = firstNonZero == std::string::npos ? "0" : integerPart.substr(firstNonZero);
        bool large = significant.size() > 18 || std::stoll(significant) > limit;

        if (large) {
            out += vague;
        } else {
            out.append(text, i, end - i);
        }
        i = end;
    }
    return out;
}

std::string AgeAdapter::MatchCase(const std::string& original, const std::string& replacement) {
    std::size_t letters = 0;
    bool allUpper = true;
    for (unsigned char c : original) {
        if (std::isalpha(c)) {
            ++letters;
            if (!std::isupper(c)) allUpper = false;
        }
    }
    if (letters > 1 && allUpper) {
        std::string upper = replacement;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return upper;
    }
    if (!original.empty() && std::isupper(static_cast<unsigned char>(original[0]))) {
        return TextUtils::CapitalizeFirst(replacement);
    }
    return replacement;
}

std::string AgeAdapter::TruncateWords(const std::string& text, std::size_t maxWords) {
    std::istringstream iss(text);
    std::string word;
    std::string out;
    std::size_t count = 0;
    while (count < maxWords && iss >> word) {
        if (!out.empty()) out += " ";
        out += word;
        ++count;
    }
    while (!out.empty() && std::string(".,;:!? ").find(out.back()) != std::string::npos) {
        out.pop_back();
    }
    return out;
}

} // namespace sunflower::application
