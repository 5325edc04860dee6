/**
 * @file AgeClassifier.cpp
 * @brief Implementation of AgeClassifier.
 */

#include "domain/AgeClassifier.hpp"
#include "domain/SafetyErrors.hpp"

namespace sunflower::domain {

AgeRange AgeClassifier::RangeOf(AgeBand band) {
    switch (band) {
        case AgeBand::Toddler: return {2, 4};
        case AgeBand::Preschool: return {5, 6};
        case AgeBand::EarlyElementary: return {7, 8};
        case AgeBand::LateElementary: return {9, 10};
        case AgeBand::Middle: return {11, 13};
        case AgeBand::High: return {14, 17};
        case AgeBand::Adult: return {18, 18};
    }
    throw SunflowerError("AgeClassifier: unhandled band");
}

std::vector<AgeBand> AgeClassifier::BandsClaiming(int age) {
    std::vector<AgeBand> claims;
    for (AgeBand band : kAllAgeBands) {
        if (RangeOf(band).contains(age)) {
            claims.push_back(band);
        }
    }
    return claims;
}

AgeBand AgeClassifier::Classify(int age) {
    if (!IsValidAge(age)) {
        throw InvalidAgeError(age);
    }
    for (AgeBand band : kAllAgeBands) {
        if (RangeOf(band).contains(age)) {
            return band;
        }
    }
    // Unreachable while the ranges above cover [kMinAge, kMaxAge].
    throw InvalidAgeError(age);
}

} // namespace sunflower::domain
