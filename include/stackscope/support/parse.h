/***
 * Name: stackscope::support::ParseU64LiteralStrict
 * Purpose: Parse a base-10 unsigned integer from a string view without throwing exceptions.
 * Inputs: Text containing an optional '+' and digits; optional error out
 * Outputs: Parsed integer via out_val; returns true on success
 * Theory of Operation: Validates characters and range; ignores surrounding whitespace.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace stackscope {
namespace support {

bool ParseU64LiteralStrict(std::string_view text, std::uint64_t& out_val, std::string* err = nullptr);

}  // namespace support
}  // namespace stackscope
