/**
 * @file TextUtils.hpp
 * @brief Small text helpers shared by the safety engine and the age adapter.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sunflower::application {

class TextUtils {
public:
    static std::string ToLower(const std::string& text);
    static std::string Trim(const std::string& text);
    static bool IsBlank(const std::string& text);

    /** @brief Whitespace-separated token count. */
    static std::size_t CountWords(const std::string& text);

    /** @brief Escapes ECMAScript regex metacharacters. */
    static std::string RegexEscape(const std::string& text);

    /**
     * @brief Builds a word-bounded alternation, e.g. \b(?:gun|credit\s+card)\b.
     * Inner spaces of multi-word terms match any run of whitespace.
     */
    static std::string BuildTermPattern(const std::vector<std::string>& terms);

    /**
     * @brief Splits at sentence punctuation followed by whitespace.
     * Each sentence keeps its terminal punctuation; trailing text without
     * punctuation is returned as a final sentence.
     */
    static std::vector<std::string> SplitSentences(const std::string& text);

    static std::string JoinSentences(const std::vector<std::string>& sentences);

    /** @brief Upper-cases the first character when it is a lowercase ASCII letter. */
    static std::string CapitalizeFirst(const std::string& text);

    /** @brief Truncates to at most maxBytes without splitting a UTF-8 sequence. */
    static std::string Utf8Truncate(const std::string& text, std::size_t maxBytes);

    /** @brief Replaces every occurrence of from with to. */
    static std::string ReplaceAll(std::string text, const std::string& from, const std::string& to);
};

} // namespace sunflower::application
