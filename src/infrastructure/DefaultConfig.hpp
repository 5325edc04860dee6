/**
 * @file DefaultConfig.hpp
 * @brief Built-in configuration table used when no file is supplied.
 */

#pragma once

namespace sunflower::infrastructure {

/** @brief JSON text of the built-in configuration. */
const char* EmbeddedDefaultConfig();

} // namespace sunflower::infrastructure
