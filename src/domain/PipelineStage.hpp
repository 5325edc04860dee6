/**
 * @file PipelineStage.hpp
 * @brief Interfaces every pipeline stage implements.
 */

#pragma once

#include <string>
#include "domain/PipelineContext.hpp"

namespace sunflower::domain {

/**
 * @class PipelineStage
 * @brief Pass-through context transformer (adaptation and external collaborators).
 *
 * A stage may append to metadata, responseText and safetyFlags. It must not
 * touch inputText, must not retain the context after returning, and reports
 * failure by throwing.
 */
class PipelineStage {
public:
    virtual ~PipelineStage() = default;

    virtual std::string name() const = 0;

    virtual PipelineContext apply(PipelineContext context) = 0;
};

/**
 * @struct SafetyVerdict
 * @brief Output of the safety stage: the boolean gate plus the updated context.
 */
struct SafetyVerdict {
    bool safe = false;
    PipelineContext context;
};

/**
 * @class SafetyStage
 * @brief The only stage permitted to halt the pipeline.
 *
 * On an unsafe verdict the stage leaves the redirect message in
 * context.responseText.
 */
class SafetyStage {
public:
    virtual ~SafetyStage() = default;

    virtual std::string name() const = 0;

    virtual SafetyVerdict apply(PipelineContext context) = 0;
};

} // namespace sunflower::domain
