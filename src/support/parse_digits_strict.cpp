/***
 * Name: stackscope::support::ParseDigitsStrict
 * Purpose: Parse contiguous base-10 digits into a uint64; stop at whitespace; report errors.
 * Inputs: text view, out value, optional error string pointer
 * Outputs: value and status; err set on failure
 * Theory of Operation: Overflow is detected before the multiply-add wraps.
 */
#include "stackscope/support/parse_util.h"

#include <cctype>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace stackscope {
namespace support {

auto ParseDigitsStrict(std::string_view text, std::uint64_t& value, std::string* err) -> bool {
  value = 0;
  constexpr std::uint64_t kBase10 = 10;
  constexpr char kZeroChar = '0';
  constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
  bool is_success = true;
  std::string local_err;
  for (const char digit_char : text) {
    if (std::isspace(static_cast<unsigned char>(digit_char)) != 0) {
      break;
    }
    if (std::isdigit(static_cast<unsigned char>(digit_char)) == 0) {
      local_err = "invalid character in integer literal";
      is_success = false;
      break;
    }
    const auto digit = static_cast<std::uint64_t>(digit_char - kZeroChar);
    if (value > (kMax - digit) / kBase10) {
      local_err = "integer overflow";
      is_success = false;
      break;
    }
    value = (value * kBase10) + digit;
  }
  if (!is_success) {
    if (err != nullptr) {
      *err = local_err;
    }
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace stackscope
