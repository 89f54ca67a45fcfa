/***
 * Name: stackscope::rt relay table and stack encoder
 * Purpose: Encode a scope identifier into the shape of the current call stack.
 * Inputs: Scope identifier and the continuation to run underneath the encoding.
 * Outputs: None; the continuation runs with the encoding live on the stack.
 * Theory of Operation:
 *   256 relay functions, one per byte value, plus a scope-start and a
 *   scope-end sentinel, live in the dedicated text section `stackscope_relays`.
 *   encode_start calls the scope-start sentinel, which dispatches the relay for
 *   the identifier's least significant byte; each relay dispatches the relay for
 *   the next byte until all 8 bytes are on the stack, then the scope-end
 *   sentinel invokes the continuation. The continuation therefore always runs
 *   exactly 10 frames above encode_start, newest first:
 *     scope-end, relay(byte 7), ..., relay(byte 0), scope-start.
 *   Relays are never inlined, cloned, folded together, or tail-called, so
 *   each of them shows up as its own return address in a backtrace.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include "stackscope/runtime/IdGenerator.h"

namespace stackscope::rt {
    using Continuation = std::function<void()>;

    inline constexpr std::size_t kEncodedBytes = 8;
    inline constexpr std::size_t kRelayCount = 256;

    // Runs k with id encoded on the stack. Exceptions thrown by k propagate.
    void encode_start(ScopeId id, const Continuation &k);

    namespace detail {
        // Entry addresses used to build the AddressIndex.
        std::uintptr_t relay_entry(std::uint8_t byte);

        std::uintptr_t scope_start_entry();

        std::uintptr_t scope_end_entry();

        // Linker-provided bounds of the relay section: [begin, end).
        std::uintptr_t relay_section_begin();

        std::uintptr_t relay_section_end();
    } // namespace detail
} // namespace stackscope::rt
