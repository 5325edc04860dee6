/**
 * @file AgeBand.hpp
 * @brief Value Object defining the closed, ordered partition of supported ages.
 */

#pragma once

#include <array>
#include <optional>
#include <string>

namespace sunflower::domain {

/**
 * @enum AgeBand
 * @brief One cell of the exhaustive age partition over [2, 18].
 */
enum class AgeBand {
    Toddler,            ///< Ages 2-4.
    Preschool,          ///< Ages 5-6.
    EarlyElementary,    ///< Ages 7-8.
    LateElementary,     ///< Ages 9-10.
    Middle,             ///< Ages 11-13.
    High,               ///< Ages 14-17.
    Adult               ///< Age 18.
};

/** @brief All bands, youngest first. */
inline constexpr std::array<AgeBand, 7> kAllAgeBands = {
    AgeBand::Toddler,
    AgeBand::Preschool,
    AgeBand::EarlyElementary,
    AgeBand::LateElementary,
    AgeBand::Middle,
    AgeBand::High,
    AgeBand::Adult
};

/**
 * @struct AgeRange
 * @brief Inclusive bounds of a band.
 */
struct AgeRange {
    int min;
    int max;

    bool contains(int age) const { return age >= min && age <= max; }
};

/**
 * @brief Stable key used in configuration files and logs.
 */
inline std::string BandToString(AgeBand band) {
    switch (band) {
        case AgeBand::Toddler: return "toddler";
        case AgeBand::Preschool: return "preschool";
        case AgeBand::EarlyElementary: return "early_elementary";
        case AgeBand::LateElementary: return "late_elementary";
        case AgeBand::Middle: return "middle";
        case AgeBand::High: return "high";
        case AgeBand::Adult: return "adult";
    }
    return "unknown";
}

/**
 * @brief Parses a configuration key back into a band.
 */
inline std::optional<AgeBand> BandFromString(const std::string& key) {
    for (AgeBand band : kAllAgeBands) {
        if (BandToString(band) == key) return band;
    }
    return std::nullopt;
}

} // namespace sunflower::domain
