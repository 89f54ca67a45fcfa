/***
 * Name: stackscope::exceptions::ConfigError
 * Purpose: Exception for configuration and environment value errors.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from StackscopeException.
 */
#pragma once

#include <string>
#include <utility>

#include "stackscope/exceptions/stackscope_exception.h"

namespace stackscope {
namespace exceptions {

class ConfigError : public StackscopeException {
 public:
  explicit ConfigError(std::string msg) noexcept : StackscopeException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace stackscope
