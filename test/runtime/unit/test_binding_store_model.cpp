/***
 * Name: test_binding_store_model
 * Purpose: Random operation sequences agree with a mutex-guarded std::map model.
 */
#include <gtest/gtest.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

#include "stackscope/runtime/BindingStore.h"

using namespace stackscope::rt;

namespace {

enum class Op : int { Store, Load, Erase, LoadOrStore, LoadAndDelete, kCount };

struct Model {
  std::mutex mu;
  std::map<std::uint64_t, std::uint64_t> map;
};

} // namespace

TEST(BindingStoreModel, SingleThreadSequenceMatchesModel) {
  BindingStore<std::uint64_t, std::uint64_t> s(5);
  std::map<std::uint64_t, std::uint64_t> model;
  std::mt19937_64 rng(0x5eedULL);
  std::uniform_int_distribution<int> pickOp(0, static_cast<int>(Op::kCount) - 1);
  std::uniform_int_distribution<std::uint64_t> pickKey(0, 63);

  for (int step = 0; step < 20000; ++step) {
    const std::uint64_t key = pickKey(rng);
    const std::uint64_t val = rng();
    switch (static_cast<Op>(pickOp(rng))) {
      case Op::Store:
        s.store(key, val);
        model[key] = val;
        break;
      case Op::Load: {
        auto got = s.load(key);
        auto it = model.find(key);
        ASSERT_EQ(got.has_value(), it != model.end()) << "step " << step;
        if (got) { ASSERT_EQ(*got, it->second); }
        break;
      }
      case Op::Erase:
        s.erase(key);
        model.erase(key);
        break;
      case Op::LoadOrStore: {
        auto [got, loaded] = s.loadOrStore(key, val);
        auto [it, inserted] = model.try_emplace(key, val);
        ASSERT_EQ(loaded, !inserted) << "step " << step;
        ASSERT_EQ(got, it->second);
        break;
      }
      case Op::LoadAndDelete: {
        auto got = s.loadAndDelete(key);
        auto it = model.find(key);
        ASSERT_EQ(got.has_value(), it != model.end()) << "step " << step;
        if (got) {
          ASSERT_EQ(*got, it->second);
          model.erase(it);
        }
        break;
      }
      case Op::kCount:
        break;
    }
  }
  EXPECT_EQ(s.size(), model.size());
  std::map<std::uint64_t, std::uint64_t> visited;
  s.forEach([&](const std::uint64_t& k, const std::uint64_t& v) {
    visited.emplace(k, v);
    return true;
  });
  EXPECT_EQ(visited, model);
}

TEST(BindingStoreModel, ThreadsOwningKeyRangesMatchModel) {
  // Each thread only touches its own keys, so per-key order is that thread's order
  // and the final contents must equal the model regardless of interleaving.
  BindingStore<std::uint64_t, std::uint64_t> s(16);
  Model model;
  constexpr int kThreads = 8;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      std::mt19937_64 rng(static_cast<std::uint64_t>(t) * 7919U + 1U);
      std::map<std::uint64_t, std::uint64_t> local;
      const std::uint64_t base = static_cast<std::uint64_t>(t) * 1000U;
      for (int step = 0; step < 5000; ++step) {
        const std::uint64_t key = base + rng() % 100U;
        const std::uint64_t val = rng();
        switch (rng() % 3U) {
          case 0:
            s.store(key, val);
            local[key] = val;
            break;
          case 1:
            s.erase(key);
            local.erase(key);
            break;
          default: {
            auto got = s.load(key);
            auto it = local.find(key);
            EXPECT_EQ(got.has_value(), it != local.end());
            if (got && it != local.end()) { EXPECT_EQ(*got, it->second); }
            break;
          }
        }
      }
      const std::lock_guard<std::mutex> lk(model.mu);
      model.map.insert(local.begin(), local.end());
    });
  }
  for (auto& th : threads) { th.join(); }

  std::map<std::uint64_t, std::uint64_t> visited;
  s.forEach([&](const std::uint64_t& k, const std::uint64_t& v) {
    visited.emplace(k, v);
    return true;
  });
  EXPECT_EQ(visited, model.map);
}
