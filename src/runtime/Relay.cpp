/***
 * Name: stackscope::rt relay table (impl)
 * Purpose: Define the 256 relay functions, the two sentinels, and encode_start.
 * Theory of Operation:
 *   Relays are 256 ordinary functions, relay_00 .. relay_FF, stamped out by
 *   STACKSCOPE_RELAY_ROW and gathered into a constexpr dispatch table. They
 *   cannot be template instantiations: GCC ignores the section attribute on
 *   those. Every relay and sentinel is emitted into the `stackscope_relays`
 *   section so the decoder can reject unrelated return addresses with a range
 *   check before resolving them.
 *   Each relay folds its byte into RelayCursor::echoed; the scope-end sentinel
 *   checks that the echoed value equals the identifier being encoded.
 */
#include "stackscope/runtime/Relay.h"

#include <array>
#include <cinttypes>
#include <cstddef>
#include <cstdint>
#include <cstdio>

#include "stackscope/runtime/detail/Fatal.h"

#if !defined(__ELF__)
#error "stackscope relay frames need an ELF target (section start/stop symbols)"
#endif

// The section name must be a valid C identifier so the linker defines
// __start_stackscope_relays / __stop_stackscope_relays.
#define STACKSCOPE_RELAY_SECTION "stackscope_relays"

#if defined(__clang__)
#define STACKSCOPE_RELAY_FN __attribute__((noinline, disable_tail_calls, used, section(STACKSCOPE_RELAY_SECTION)))
#elif defined(__GNUC__)
// noipa implies noinline, noclone and no_icf.
#define STACKSCOPE_RELAY_FN __attribute__((noipa, used, section(STACKSCOPE_RELAY_SECTION)))
#else
#error "stackscope relay frames need GCC or Clang function attributes"
#endif

// Keeps the preceding call out of tail position.
#define STACKSCOPE_FRAME_BARRIER() __asm__ __volatile__("" ::: "memory")

extern "C" {
extern const char __start_stackscope_relays[] __attribute__((visibility("hidden"))); // NOLINT(bugprone-reserved-identifier)
extern const char __stop_stackscope_relays[] __attribute__((visibility("hidden")));  // NOLINT(bugprone-reserved-identifier)
}

namespace stackscope::rt {

namespace {

struct RelayCursor {
  ScopeId id{0};
  std::array<std::uint8_t, kEncodedBytes> bytes{};
  std::size_t next{0};  // index of the next byte to dispatch
  ScopeId echoed{0};
  const Continuation* cont{nullptr};
};

using RelayFn = void (*)(RelayCursor*);

RelayFn relay_at(std::uint8_t byte);

STACKSCOPE_RELAY_FN void scope_end(RelayCursor* cur) {
  if (cur->echoed != cur->id) {
    char msg[96];
    std::snprintf(msg, sizeof(msg), "relay chain echoed 0x%016" PRIx64 " while encoding 0x%016" PRIx64,
                  cur->echoed, cur->id);
    detail::fatal(msg);
  }
  (*cur->cont)();
  STACKSCOPE_FRAME_BARRIER();
}

// Shared body of every relay; Byte is a literal so each relay compiles to distinct code.
#define STACKSCOPE_RELAY_BODY(cur, Byte)                                                 \
  do {                                                                                   \
    (cur)->echoed = ((cur)->echoed >> 8U) | (static_cast<ScopeId>(Byte) << 56U);         \
    if ((cur)->next == kEncodedBytes) {                                                  \
      scope_end(cur);                                                                    \
    } else {                                                                             \
      relay_at((cur)->bytes[(cur)->next++])(cur);                                        \
    }                                                                                    \
    STACKSCOPE_FRAME_BARRIER();                                                          \
  } while (0)

#define STACKSCOPE_RELAY(H, L) \
  STACKSCOPE_RELAY_FN void relay_##H##L(RelayCursor* cur) { STACKSCOPE_RELAY_BODY(cur, 0x##H##L); }

#define STACKSCOPE_RELAY_ADDR(H, L) &relay_##H##L,

// One row per high nibble: X(H, 0) .. X(H, F).
#define STACKSCOPE_RELAY_ROW(X, H)                                                              \
  X(H, 0) X(H, 1) X(H, 2) X(H, 3) X(H, 4) X(H, 5) X(H, 6) X(H, 7) X(H, 8) X(H, 9) X(H, A) X(H, B) \
  X(H, C) X(H, D) X(H, E) X(H, F)

#define STACKSCOPE_RELAY_ROWS(X)                                                                  \
  STACKSCOPE_RELAY_ROW(X, 0) STACKSCOPE_RELAY_ROW(X, 1) STACKSCOPE_RELAY_ROW(X, 2)                 \
  STACKSCOPE_RELAY_ROW(X, 3) STACKSCOPE_RELAY_ROW(X, 4) STACKSCOPE_RELAY_ROW(X, 5)                 \
  STACKSCOPE_RELAY_ROW(X, 6) STACKSCOPE_RELAY_ROW(X, 7) STACKSCOPE_RELAY_ROW(X, 8)                 \
  STACKSCOPE_RELAY_ROW(X, 9) STACKSCOPE_RELAY_ROW(X, A) STACKSCOPE_RELAY_ROW(X, B)                 \
  STACKSCOPE_RELAY_ROW(X, C) STACKSCOPE_RELAY_ROW(X, D) STACKSCOPE_RELAY_ROW(X, E)                 \
  STACKSCOPE_RELAY_ROW(X, F)

STACKSCOPE_RELAY_ROWS(STACKSCOPE_RELAY)

// Row-major over (high nibble, low nibble), so index == byte value.
constexpr std::array<RelayFn, kRelayCount> kRelayTable = {{STACKSCOPE_RELAY_ROWS(STACKSCOPE_RELAY_ADDR)}};

#undef STACKSCOPE_RELAY_ROWS
#undef STACKSCOPE_RELAY_ROW
#undef STACKSCOPE_RELAY_ADDR
#undef STACKSCOPE_RELAY
#undef STACKSCOPE_RELAY_BODY

RelayFn relay_at(std::uint8_t byte) { return kRelayTable[byte]; }

STACKSCOPE_RELAY_FN void scope_start(RelayCursor* cur) {
  relay_at(cur->bytes[cur->next++])(cur);
  STACKSCOPE_FRAME_BARRIER();
}

} // namespace

void encode_start(ScopeId id, const Continuation& k) {
  RelayCursor cur;
  cur.id = id;
  cur.cont = &k;
  // Least significant byte first: it ends up as the oldest relay frame.
  for (std::size_t i = 0; i < kEncodedBytes; ++i) {
    cur.bytes[i] = static_cast<std::uint8_t>((id >> (8U * i)) & 0xFFU);
  }
  scope_start(&cur);
  STACKSCOPE_FRAME_BARRIER();
}

namespace detail {

std::uintptr_t relay_entry(std::uint8_t byte) { return reinterpret_cast<std::uintptr_t>(kRelayTable[byte]); } // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)

std::uintptr_t scope_start_entry() { return reinterpret_cast<std::uintptr_t>(&scope_start); } // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)

std::uintptr_t scope_end_entry() { return reinterpret_cast<std::uintptr_t>(&scope_end); } // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)

std::uintptr_t relay_section_begin() { return reinterpret_cast<std::uintptr_t>(__start_stackscope_relays); } // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)

std::uintptr_t relay_section_end() { return reinterpret_cast<std::uintptr_t>(__stop_stackscope_relays); } // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)

} // namespace detail

} // namespace stackscope::rt
