/***
 * Name: stackscope::rt stack decoder
 * Purpose: Recover the innermost encoded scope identifier from the current call stack.
 * Inputs: Return addresses of the current thread (captured or supplied).
 * Outputs: The identifier, or std::nullopt when no scope encloses the caller.
 * Theory of Operation:
 *   decode_frames walks the frames newest first. It looks for the newest
 *   scope-end frame, then folds in one byte per relay frame (most significant
 *   first) until the matching scope-start frame. Frames that are not relays
 *   are skipped. Any frame sequence that no valid encoding can produce is
 *   fatal: see detail::fatal.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "stackscope/runtime/IdGenerator.h"

namespace stackscope::rt {
    class AddressIndex;

    // Return addresses of the calling thread, newest first. The buffer grows
    // until the whole stack fits, so deep stacks are never truncated.
    void capture_frames(std::vector<std::uintptr_t> &out);

    // scanned (optional) receives the number of frames visited.
    std::optional<ScopeId> decode_frames(const std::uintptr_t *pcs, std::size_t count,
                                         std::size_t *scanned = nullptr);

    // Same scan against an explicit index instead of AddressIndex::instance().
    std::optional<ScopeId> decode_frames(const AddressIndex &index, const std::uintptr_t *pcs, std::size_t count,
                                         std::size_t *scanned = nullptr);

    // capture_frames + decode_frames for the calling thread.
    std::optional<ScopeId> last_id();
} // namespace stackscope::rt
