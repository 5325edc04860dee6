/**
 * @file ConfigLoader.hpp
 * @brief Static utility that builds and validates the application configuration.
 *
 * Every entry point goes through the same parser and validator, so a
 * malformed table stops the process at startup instead of being patched
 * with defaults.
 */

#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "application/AppConfig.hpp"

namespace sunflower::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads a complete configuration from a JSON file.
     * @throws ConfigurationError if the file is missing, unreadable or invalid.
     */
    static std::shared_ptr<const application::AppConfig> LoadFromFile(const std::string& path);

    /**
     * @brief Builds a configuration from an already parsed document.
     * @throws ConfigurationError on any missing key, unknown name or failed check.
     */
    static std::shared_ptr<const application::AppConfig> LoadFromJson(const nlohmann::json& document);

    /** @brief The built-in table. */
    static std::shared_ptr<const application::AppConfig> LoadDefaults();

    /** @brief Parsed copy of the built-in table, e.g. as a starting point for a custom file. */
    static nlohmann::json DefaultConfigJson();

    /**
     * @brief Cross-field checks on a configuration built in code.
     * @throws ConfigurationError describing the first failed check.
     */
    static void Validate(const application::AppConfig& config);
};

} // namespace sunflower::infrastructure
