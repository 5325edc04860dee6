/**
 * @file AgeClassifier.hpp
 * @brief Single source of truth for the age-to-band boundaries.
 */

#pragma once

#include <vector>
#include "domain/AgeBand.hpp"

namespace sunflower::domain {

/**
 * @class AgeClassifier
 * @brief Stateless mapping from an integer age to exactly one AgeBand.
 *
 * Every other component resolves bands through this class; no other table of
 * boundaries exists in the codebase.
 */
class AgeClassifier {
public:
    static constexpr int kMinAge = 2;
    static constexpr int kMaxAge = 18;

    /**
     * @brief Maps an age to its band.
     * @throws InvalidAgeError if age < 2 or age > 18. Never clamps.
     */
    static AgeBand Classify(int age);

    /** @brief Inclusive bounds owned by a band. */
    static AgeRange RangeOf(AgeBand band);

    /** @brief Every band claiming the given age (exactly one for valid ages). */
    static std::vector<AgeBand> BandsClaiming(int age);

    static bool IsValidAge(int age) { return age >= kMinAge && age <= kMaxAge; }
};

} // namespace sunflower::domain
