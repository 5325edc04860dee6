/**
 * @file TextUtils.cpp
 * @brief Implementation of TextUtils.
 */

#include "application/TextUtils.hpp"

#include <cctype>
#include <sstream>

namespace sunflower::application {

std::string TextUtils::ToLower(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::string TextUtils::Trim(const std::string& text) {
    std::size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(start, end - start);
}

bool TextUtils::IsBlank(const std::string& text) {
    for (unsigned char c : text) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

std::size_t TextUtils::CountWords(const std::string& text) {
    std::istringstream iss(text);
    std::size_t count = 0;
    std::string word;
    while (iss >> word) ++count;
    return count;
}

std::string TextUtils::RegexEscape(const std::string& text) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (special.find(c) != std::string::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

std::string TextUtils::BuildTermPattern(const std::vector<std::string>& terms) {
    std::string pattern = "\\b(?:";
    bool first = true;
    for (const auto& term : terms) {
        std::string trimmed = Trim(term);
        if (trimmed.empty()) continue;
        if (!first) pattern += "|";
        first = false;

        std::istringstream iss(trimmed);
        std::string word;
        bool firstWord = true;
        while (iss >> word) {
            if (!firstWord) pattern += "\\s+";
            pattern += RegexEscape(word);
            firstWord = false;
        }
    }
    pattern += ")\\b";
    return pattern;
}

std::vector<std::string> TextUtils::SplitSentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::string current;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        current.push_back(c);
        if (c == '.' || c == '!' || c == '?') {
            bool atEnd = (i + 1 == text.size());
            bool followedBySpace = !atEnd && std::isspace(static_cast<unsigned char>(text[i + 1]));
            if (atEnd || followedBySpace) {
                std::string sentence = Trim(current);
                if (!sentence.empty()) sentences.push_back(sentence);
                current.clear();
            }
        }
    }
    std::string rest = Trim(current);
    if (!rest.empty()) sentences.push_back(rest);
    return sentences;
}

std::string TextUtils::JoinSentences(const std::vector<std::string>& sentences) {
    std::string out;
    for (const auto& sentence : sentences) {
        if (sentence.empty()) continue;
        if (!out.empty()) out += " ";
        out += sentence;
    }
    return out;
}

std::string TextUtils::CapitalizeFirst(const std::string& text) {
    if (text.empty()) return text;
    std::string out = text;
    unsigned char c = static_cast<unsigned char>(out[0]);
    if (std::islower(c)) out[0] = static_cast<char>(std::toupper(c));
    return out;
}

std::string TextUtils::Utf8Truncate(const std::string& text, std::size_t maxBytes) {
    if (text.size() <= maxBytes) return text;
    std::size_t cut = maxBytes;
    // Step back over continuation bytes (10xxxxxx) so a sequence is never split.
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

std::string TextUtils::ReplaceAll(std::string text, const std::string& from, const std::string& to) {
    if (from.empty()) return text;
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

} // namespace sunflower::application
