/***
 * Name: stackscope::support::ParseU64LiteralStrict
 * Purpose: Parse a base-10 unsigned integer without throwing; fail on extra tokens.
 * Inputs:
 *   - text: string view of the literal
 * Outputs:
 *   - out_val: parsed integer on success
 *   - err: optional error message on failure
 * Theory of Operation: Trim, reject a '-' sign, parse digits, then require that
 *   only whitespace follows the digits.
 */
#include "stackscope/support/parse.h"
#include "stackscope/support/parse_util.h"

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace stackscope::support {

static void SetError(std::string* err, const char* msg) {
  if (err != nullptr) {
    *err = msg;
  }
}

auto ParseU64LiteralStrict(std::string_view text, std::uint64_t& out_val, std::string* err) -> bool {
  TrimLeadingSpaces(text);
  bool is_negative = false;
  (void)ConsumeSign(text, is_negative);
  if (is_negative) {
    SetError(err, "negative value not allowed");
    return false;
  }
  if (text.empty() || std::isdigit(static_cast<unsigned char>(text[0])) == 0) {
    SetError(err, "invalid integer literal");
    return false;
  }
  std::uint64_t value = 0;
  if (!ParseDigitsStrict(text, value, err)) {
    return false;
  }
  std::size_t index = 0;
  while (index < text.size() && std::isdigit(static_cast<unsigned char>(text[index])) != 0) {
    ++index;
  }
  for (; index < text.size(); ++index) {
    if (std::isspace(static_cast<unsigned char>(text[index])) == 0) {
      SetError(err, "trailing characters after integer literal");
      return false;
    }
  }
  out_val = value;
  return true;
}

}  // namespace stackscope::support
