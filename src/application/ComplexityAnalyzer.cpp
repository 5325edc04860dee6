/**
 * @file ComplexityAnalyzer.cpp
 * @brief Implementation of ComplexityAnalyzer.
 */

#include "application/ComplexityAnalyzer.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "application/TextUtils.hpp"

namespace sunflower::application {

double ComplexityAnalyzer::ReadingLevel(const std::string& text) {
    std::istringstream iss(text);
    std::string word;
    std::size_t words = 0;
    std::size_t syllables = 0;
    while (iss >> word) {
        ++words;
        syllables += static_cast<std::size_t>(CountSyllables(word));
    }
    std::size_t sentences = TextUtils::SplitSentences(text).size();
    if (words == 0 || sentences == 0) {
        return 0.0;
    }

    double grade = 0.39 * (static_cast<double>(words) / static_cast<double>(sentences)) +
                   11.8 * (static_cast<double>(syllables) / static_cast<double>(words)) - 15.59;
    return std::max(0.0, std::min(kMaxGrade, grade));
}

int ComplexityAnalyzer::CountSyllables(const std::string& word) {
    std::string letters;
    for (unsigned char c : word) {
        if (std::isalpha(c)) letters.push_back(static_cast<char>(std::tolower(c)));
    }

    int count = 0;
    bool previousVowel = false;
    for (char c : letters) {
        bool vowel = std::string("aeiouy").find(c) != std::string::npos;
        if (vowel && !previousVowel) ++count;
        previousVowel = vowel;
    }
    // Silent trailing e.
    if (letters.size() > 2 && letters.back() == 'e' && letters[letters.size() - 2] != 'l') {
        --count;
    }
    return std::max(1, count);
}

} // namespace sunflower::application
