/**
 * @file
 * @brief Fatal error reporting for broken encoder/decoder invariants.
 */
#pragma once

#include <cstdint>
#include <string>

namespace stackscope::rt::detail {

// Symbolized description of a code address ("symbol+0x1c (module)"), via dladdr.
std::string describe_pc(std::uintptr_t pc);

// Prints "[stackscope] fatal: <message>" (and the frame when pc != 0) to stderr, then aborts.
[[noreturn]] void fatal(const std::string& message, std::uintptr_t pc = 0);

} // namespace stackscope::rt::detail
