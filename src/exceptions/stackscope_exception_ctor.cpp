/***
 * Name: stackscope::exceptions::StackscopeException::StackscopeException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "stackscope/exceptions/stackscope_exception.h"

#include <string>
#include <utility>

namespace stackscope {
namespace exceptions {

StackscopeException::StackscopeException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace stackscope
