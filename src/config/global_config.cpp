/***
 * Name: stackscope::config::GlobalConfig
 * Purpose: Provide the process-wide configuration.
 * Inputs: Process environment
 * Outputs: Reference to an immutable Config
 * Theory of Operation: Function-local static; if loading throws, the next call retries.
 */
#include "stackscope/config/config.h"

#include <cstdlib>

namespace stackscope::config {

auto GlobalConfig() -> const Config& {
  static const Config cfg = LoadConfig([](const char* name) { return std::getenv(name); });
  return cfg;
}

}  // namespace stackscope::config
