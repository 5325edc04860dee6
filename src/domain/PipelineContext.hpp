/**
 * @file PipelineContext.hpp
 * @brief Mutable record threaded through every stage for one turn.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sunflower::domain {

/**
 * @struct PipelineContext
 * @brief Created per inbound turn and owned by the orchestrator for one
 *        process() call.
 *
 * Stages receive it by value, mutate it and hand it back. inputText is
 * read-only for every stage and safetyFlags is append-only.
 */
struct PipelineContext {
    std::string sessionId;
    std::string profileId;
    std::string childName;
    int childAge = 0;
    std::string inputText;
    std::string responseText;                 ///< Draft model output, rewritten by stages.
    std::vector<std::string> safetyFlags;
    nlohmann::json metadata = nlohmann::json::object();
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    void appendSafetyFlag(const std::string& flag) { safetyFlags.push_back(flag); }
};

} // namespace sunflower::domain
