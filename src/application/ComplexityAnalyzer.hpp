/**
 * @file ComplexityAnalyzer.hpp
 * @brief Approximate reading grade level of a text.
 */

#pragma once

#include <string>

namespace sunflower::application {

/**
 * @class ComplexityAnalyzer
 * @brief Flesch-Kincaid grade level with a vowel-group syllable heuristic.
 */
class ComplexityAnalyzer {
public:
    static constexpr double kMaxGrade = 18.0;

    /** @brief Grade level clamped to [0, 18]; 0 for empty text. */
    static double ReadingLevel(const std::string& text);

    static int CountSyllables(const std::string& word);
};

} // namespace sunflower::application
