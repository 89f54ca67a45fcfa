/***
 * Name: stackscope::rt::detail (fatal reporting impl)
 * Purpose: Report invariant violations loudly and stop the process.
 * Theory of Operation: Decoder inconsistencies never return. They abort after
 *   printing a diagnostic that names the offending frame when one is known.
 */
#include "stackscope/runtime/detail/Fatal.h"

#include <dlfcn.h>

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace stackscope::rt::detail {

std::string describe_pc(std::uintptr_t pc) {
  Dl_info info{};
  if (dladdr(reinterpret_cast<void*>(pc), &info) == 0) { return "??"; } // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast,performance-no-int-to-ptr)
  std::string out = (info.dli_sname != nullptr) ? info.dli_sname : "??";
  if (info.dli_saddr != nullptr) {
    char off[32];
    std::snprintf(off, sizeof(off), "+0x%" PRIxPTR, pc - reinterpret_cast<std::uintptr_t>(info.dli_saddr)); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
    out += off;
  }
  if (info.dli_fname != nullptr) {
    out += " (";
    out += info.dli_fname;
    out += ")";
  }
  return out;
}

void fatal(const std::string& message, std::uintptr_t pc) {
  if (pc != 0) {
    std::fprintf(stderr, "[stackscope] fatal: %s at pc=0x%" PRIxPTR " %s\n", message.c_str(), pc, describe_pc(pc).c_str());
  } else {
    std::fprintf(stderr, "[stackscope] fatal: %s\n", message.c_str());
  }
  std::fflush(stderr);
  std::abort();
}

} // namespace stackscope::rt::detail
