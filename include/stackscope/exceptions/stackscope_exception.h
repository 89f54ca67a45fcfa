/***
 * Name: stackscope::exceptions::StackscopeException
 * Purpose: Base class for all stackscope exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in stackscope must use a custom type derived from this base.
 *   Invariant violations inside the encoder/decoder are not exceptions; they abort.
 */
#pragma once

#include <exception>
#include <string>

namespace stackscope {
namespace exceptions {

class StackscopeException : public std::exception {
 public:
  virtual ~StackscopeException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit StackscopeException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace stackscope
