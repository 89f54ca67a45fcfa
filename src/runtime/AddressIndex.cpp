/***
 * Name: stackscope::rt::AddressIndex (impl)
 * Purpose: Build and query the relay entry-address index.
 */
#include "stackscope/runtime/AddressIndex.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <iterator>
#include <string>

#include "stackscope/runtime/detail/Fatal.h"

namespace stackscope::rt {

std::string frame_name(const FrameMatch& match) {
  switch (match.kind) {
    case FrameKind::Relay: {
      char buf[16];
      std::snprintf(buf, sizeof(buf), "relay(0x%02x)", static_cast<unsigned>(match.byte));
      return buf;
    }
    case FrameKind::ScopeStart: return "scope-start";
    case FrameKind::ScopeEnd: return "scope-end";
    case FrameKind::Unrelated: break;
  }
  return "unrelated";
}

RelayLayout RelayLayout::live() {
  RelayLayout layout;
  layout.sectionBegin = detail::relay_section_begin();
  layout.sectionEnd = detail::relay_section_end();
  for (std::size_t b = 0; b < kRelayCount; ++b) { layout.relays[b] = detail::relay_entry(static_cast<std::uint8_t>(b)); }
  layout.scopeStart = detail::scope_start_entry();
  layout.scopeEnd = detail::scope_end_entry();
  return layout;
}

AddressIndex::AddressIndex(const RelayLayout& layout)
    : relays_(layout.relays),
      start_(layout.scopeStart),
      end_entry_(layout.scopeEnd),
      begin_(layout.sectionBegin),
      end_(layout.sectionEnd) {
  entries_.reserve(kRelayCount + 2);
  for (std::size_t b = 0; b < kRelayCount; ++b) {
    entries_.push_back(Entry{relays_[b], FrameMatch{FrameKind::Relay, static_cast<std::uint8_t>(b)}});
  }
  entries_.push_back(Entry{start_, FrameMatch{FrameKind::ScopeStart, 0}});
  entries_.push_back(Entry{end_entry_, FrameMatch{FrameKind::ScopeEnd, 0}});
  // Stable, so colliding entries are reported in byte order.
  std::stable_sort(entries_.begin(), entries_.end(), [](const Entry& a, const Entry& b) { return a.addr < b.addr; });

  if (begin_ >= end_) { detail::fatal("relay section is empty or missing"); }
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    const Entry& e = entries_[i];
    if (e.addr < begin_ || e.addr >= end_) {
      detail::fatal(frame_name(e.match) + " entry lies outside the stackscope_relays section", e.addr);
    }
    if (i > 0 && entries_[i - 1].addr == e.addr) {
      detail::fatal(frame_name(entries_[i - 1].match) + " and " + frame_name(e.match) +
                        " share one entry address (identical code folding?)",
                    e.addr);
    }
  }
}

const AddressIndex& AddressIndex::instance() {
  static const AddressIndex index(RelayLayout::live());
  return index;
}

FrameMatch AddressIndex::resolve(std::uintptr_t pc) const {
  if (!contains(pc)) { return FrameMatch{}; }
  const std::uintptr_t target = pc - 1;
  auto it = std::upper_bound(entries_.begin(), entries_.end(), target,
                             [](std::uintptr_t value, const Entry& e) { return value < e.addr; });
  if (it == entries_.begin()) { return FrameMatch{}; }
  return std::prev(it)->match;
}

std::uintptr_t AddressIndex::entryOf(FrameKind kind, std::uint8_t byte) const {
  switch (kind) {
    case FrameKind::Relay: return relays_[byte];
    case FrameKind::ScopeStart: return start_;
    case FrameKind::ScopeEnd: return end_entry_;
    case FrameKind::Unrelated: break;
  }
  return 0;
}

// Build the index during static initialization rather than on the first lookup.
[[maybe_unused]] static const AddressIndex& g_index = AddressIndex::instance(); // NOLINT(cert-err58-cpp)

} // namespace stackscope::rt
