/**
 * @file SafetyErrors.hpp
 * @brief Exception taxonomy shared by every pipeline component.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sunflower::domain {

/**
 * @class SunflowerError
 * @brief Base class for all application-specific errors.
 */
class SunflowerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class InvalidAgeError
 * @brief Raised when an age lies outside the supported domain [2, 18].
 */
class InvalidAgeError : public SunflowerError {
public:
    explicit InvalidAgeError(int age)
        : SunflowerError("Invalid age: " + std::to_string(age) + " (supported range is 2-18)"),
          m_age(age) {}

    int age() const { return m_age; }

private:
    int m_age;
};

/**
 * @class ConfigurationError
 * @brief Raised for missing or malformed configuration. Fatal at startup.
 */
class ConfigurationError : public SunflowerError {
public:
    explicit ConfigurationError(const std::string& message)
        : SunflowerError("Configuration error: " + message) {}
};

/**
 * @class StageExecutionError
 * @brief Raised when a non-safety pipeline stage fails.
 *
 * what() carries the user-facing message only; the diagnostic detail and the
 * failing stage are kept separately for logs.
 */
class StageExecutionError : public SunflowerError {
public:
    StageExecutionError(std::string stageName, std::string detail)
        : SunflowerError("Something went wrong while preparing the answer. Please try again."),
          m_stageName(std::move(stageName)),
          m_detail(std::move(detail)) {}

    const std::string& stageName() const { return m_stageName; }
    const std::string& detail() const { return m_detail; }

private:
    std::string m_stageName;
    std::string m_detail;
};

} // namespace sunflower::domain
