/***
 * Name: stackscope::rt stack decoder (impl)
 * Purpose: Capture return addresses with backtrace() and decode relay frames.
 */
#include "stackscope/runtime/Decoder.h"

#include <execinfo.h>

#include <atomic>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "stackscope/config/config.h"
#include "stackscope/runtime/AddressIndex.h"
#include "stackscope/runtime/Relay.h"
#include "stackscope/runtime/detail/Counters.h"
#include "stackscope/runtime/detail/Fatal.h"

namespace stackscope::rt {

void capture_frames(std::vector<std::uintptr_t>& out) {
  thread_local std::vector<void*> raw;
  std::size_t capacity = raw.size() > config::GlobalConfig().frameCapacity ? raw.size()
                                                                           : config::GlobalConfig().frameCapacity;
  for (;;) {
    if (capacity > static_cast<std::size_t>(INT_MAX)) { detail::fatal("call stack too deep to capture"); }
    raw.resize(capacity);
    const int got = ::backtrace(raw.data(), static_cast<int>(capacity));
    const std::size_t n = got > 0 ? static_cast<std::size_t>(got) : 0U;
    if (n < capacity) {
      out.resize(n);
      for (std::size_t i = 0; i < n; ++i) { out[i] = reinterpret_cast<std::uintptr_t>(raw[i]); } // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
      return;
    }
    // A full buffer may have cut off the oldest frames; the scope-start frame could be among them.
    capacity *= 2;
  }
}

namespace {

[[noreturn]] void fail_at(const std::string& message, std::uintptr_t pc, const FrameMatch& m) {
  detail::fatal(message + " [" + frame_name(m) + "]", pc);
}

} // namespace

std::optional<ScopeId> decode_frames(const std::uintptr_t* pcs, std::size_t count, std::size_t* scanned) {
  return decode_frames(AddressIndex::instance(), pcs, count, scanned);
}

// NOLINTNEXTLINE(readability-function-size)
std::optional<ScopeId> decode_frames(const AddressIndex& index, const std::uintptr_t* pcs, std::size_t count,
                                     std::size_t* scanned) {
  std::size_t visited = 0;
  auto report = [&](std::optional<ScopeId> result) {
    if (scanned != nullptr) { *scanned = visited; }
    return result;
  };

  std::size_t i = 0;
  for (; i < count; ++i) {
    ++visited;
    const std::uintptr_t pc = pcs[i];
    if (!index.contains(pc)) { continue; }
    const FrameMatch m = index.resolve(pc);
    if (m.kind == FrameKind::Unrelated) { fail_at("return address inside the relay section matches no relay", pc, m); }
    if (m.kind == FrameKind::ScopeEnd) { break; }
  }
  if (i == count) { return report(std::nullopt); }

  const std::uintptr_t endPc = pcs[i];
  ScopeId value = 0;
  std::size_t bytes = 0;
  for (++i; i < count; ++i) {
    ++visited;
    const std::uintptr_t pc = pcs[i];
    if (!index.contains(pc)) { continue; }  // ordinary frame between relays
    const FrameMatch m = index.resolve(pc);
    switch (m.kind) {
      case FrameKind::ScopeStart:
        if (bytes != kEncodedBytes) {
          fail_at("scope-start reached after " + std::to_string(bytes) + " relay frames", pc, m);
        }
        return report(value);
      case FrameKind::Relay:
        if (bytes == kEncodedBytes) { fail_at("more relay frames than an identifier has bytes", pc, m); }
        value = (value << 8U) | m.byte;
        ++bytes;
        break;
      case FrameKind::ScopeEnd:
        fail_at("second scope-end frame before scope-start", pc, m);
      case FrameKind::Unrelated:
        fail_at("return address inside the relay section matches no relay", pc, m);
    }
  }
  detail::fatal("stack exhausted before the scope-start frame (after " + std::to_string(bytes) + " relay frames)",
                endPc);
}

std::optional<ScopeId> last_id() {
  thread_local std::vector<std::uintptr_t> pcs;
  capture_frames(pcs);
  std::size_t scanned = 0;
  const auto id = decode_frames(pcs.data(), pcs.size(), &scanned);
  detail::counters().framesScanned.fetch_add(scanned, std::memory_order_relaxed);
  return id;
}

} // namespace stackscope::rt
