/***
 * Name: stackscope::config::LoadConfig
 * Purpose: Read stackscope tunables from an environment lookup.
 * Inputs:
 *   - lookup: returns the variable's value or nullptr when unset
 * Outputs:
 *   - Config with defaults for unset variables
 * Theory of Operation: Each numeric variable is parsed with ParseU64LiteralStrict
 *   and range checked; failures throw ConfigError naming the variable.
 */
#include "stackscope/config/config.h"

#include <cstddef>
#include <cstdint>
#include <string>

#include "stackscope/exceptions/config_error.h"
#include "stackscope/support/parse.h"

namespace stackscope::config {

static std::size_t ReadBounded(const EnvLookup& lookup, const char* name, std::size_t fallback,
                               std::size_t max_value) {
  const char* raw = lookup(name);
  if (raw == nullptr || *raw == '\0') {
    return fallback;
  }
  std::uint64_t value = 0;
  std::string err;
  if (!support::ParseU64LiteralStrict(raw, value, &err)) {
    throw exceptions::ConfigError(std::string(name) + ": " + err + " ('" + raw + "')");
  }
  if (value == 0 || value > max_value) {
    throw exceptions::ConfigError(std::string(name) + ": value out of range 1.." +
                                  std::to_string(max_value) + " ('" + raw + "')");
  }
  return static_cast<std::size_t>(value);
}

auto LoadConfig(const EnvLookup& lookup) -> Config {
  Config cfg;
  cfg.debug = (lookup("STACKSCOPE_DEBUG") != nullptr);
  cfg.frameCapacity = ReadBounded(lookup, "STACKSCOPE_FRAME_CAPACITY", kDefaultFrameCapacity, kMaxFrameCapacity);
  cfg.storeShards = ReadBounded(lookup, "STACKSCOPE_STORE_SHARDS", kDefaultStoreShards, kMaxStoreShards);
  return cfg;
}

}  // namespace stackscope::config
