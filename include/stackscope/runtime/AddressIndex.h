/***
 * Name: stackscope::rt::AddressIndex
 * Purpose: Reverse lookup from a return address to the relay or sentinel it belongs to.
 * Inputs: Return addresses captured from the current stack.
 * Outputs: FrameMatch (kind plus byte value for relays).
 * Theory of Operation:
 *   instance() is built once from the relays linked into the process; tests
 *   may build others from a synthetic RelayLayout. 258 entry addresses are
 *   sorted ascending.
 *   contains() is a range check against the relay section bounds and filters
 *   out nearly every frame. resolve() then binary-searches for the greatest
 *   entry at or below pc - 1 (a return address points just past its call
 *   instruction, which may be the last byte of the function). A pc inside the
 *   section but below the lowest entry resolves to Unrelated. The constructor
 *   aborts if two entries share an address or an entry falls outside the
 *   section.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "stackscope/runtime/Relay.h"

namespace stackscope::rt {

enum class FrameKind : std::uint8_t { Unrelated, Relay, ScopeStart, ScopeEnd };

struct FrameMatch {
  FrameKind kind{FrameKind::Unrelated};
  std::uint8_t byte{0};
};

// "relay(0x2a)", "scope-start", "scope-end" or "unrelated".
std::string frame_name(const FrameMatch& match);

// Entry addresses and section bounds an index is built from.
struct RelayLayout {
  std::uintptr_t sectionBegin{0};
  std::uintptr_t sectionEnd{0};
  std::array<std::uintptr_t, kRelayCount> relays{};
  std::uintptr_t scopeStart{0};
  std::uintptr_t scopeEnd{0};

  // Layout of the relays linked into this process.
  static RelayLayout live();
};

class AddressIndex {
 public:
  // Index over RelayLayout::live(), built during static initialization.
  static const AddressIndex& instance();

  // Aborts if entries collide or fall outside [sectionBegin, sectionEnd).
  explicit AddressIndex(const RelayLayout& layout);

  bool contains(std::uintptr_t pc) const { return pc > begin_ && pc <= end_; }

  // Unrelated for addresses outside the relay section.
  FrameMatch resolve(std::uintptr_t pc) const;

  // byte is only meaningful for FrameKind::Relay.
  std::uintptr_t entryOf(FrameKind kind, std::uint8_t byte = 0) const;

  std::size_t size() const { return entries_.size(); }
  std::uintptr_t sectionBegin() const { return begin_; }
  std::uintptr_t sectionEnd() const { return end_; }

  AddressIndex(const AddressIndex&) = delete;
  AddressIndex& operator=(const AddressIndex&) = delete;

 private:
  struct Entry {
    std::uintptr_t addr;
    FrameMatch match;
  };

  std::vector<Entry> entries_;
  std::array<std::uintptr_t, kRelayCount> relays_{};
  std::uintptr_t start_{0};
  std::uintptr_t end_entry_{0};
  std::uintptr_t begin_{0};
  std::uintptr_t end_{0};
};

} // namespace stackscope::rt
