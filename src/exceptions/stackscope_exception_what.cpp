/***
 * Name: stackscope::exceptions::StackscopeException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "stackscope/exceptions/stackscope_exception.h"

namespace stackscope::exceptions {

const char* StackscopeException::what() const noexcept { return message_.c_str(); }

}  // namespace stackscope::exceptions
