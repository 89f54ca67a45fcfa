/***
 * Name: stackscope::config
 * Purpose: Runtime tunables for the scope encoder/decoder and binding store.
 * Inputs: Environment variables (or an injected lookup for tests)
 * Outputs: Config values
 * Theory of Operation: Values are read once by GlobalConfig() on first use.
 *   Recognized variables:
 *     STACKSCOPE_DEBUG           any value enables [stackscope] diagnostics on stderr
 *     STACKSCOPE_FRAME_CAPACITY  initial return-address buffer size (1..1048576)
 *     STACKSCOPE_STORE_SHARDS    binding store shard count (1..1024)
 *   Malformed or out-of-range numbers throw exceptions::ConfigError.
 */
#pragma once

#include <cstddef>
#include <functional>

namespace stackscope {
namespace config {

inline constexpr std::size_t kDefaultFrameCapacity = 128;
inline constexpr std::size_t kMaxFrameCapacity = 1U << 20U;
inline constexpr std::size_t kDefaultStoreShards = 16;
inline constexpr std::size_t kMaxStoreShards = 1024;

struct Config {
  bool debug{false};
  std::size_t frameCapacity{kDefaultFrameCapacity};
  std::size_t storeShards{kDefaultStoreShards};
};

// Returns the value of the named variable or nullptr when unset.
using EnvLookup = std::function<const char*(const char*)>;

/*** LoadConfig: Build a Config from the given environment lookup. Throws ConfigError. */
Config LoadConfig(const EnvLookup& lookup);

/*** GlobalConfig: Process-wide Config loaded from the real environment on first call. */
const Config& GlobalConfig();

}  // namespace config
}  // namespace stackscope
