/***
 * Name: test_scope_threads
 * Purpose: Scopes on different threads are independent and bindings do not leak into spawned threads.
 */
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "stackscope/runtime/All.h"
#include "util/Heartbeat.h"

using namespace stackscope::rt;

namespace {

ContextPtr ctx(int v) { return Context::withValue(Context::background(), "n", v); }

int current_n() {
  auto c = get_context();
  const int* v = c ? c->valueAs<int>("n") : nullptr;
  return v != nullptr ? *v : -1;
}

struct NestRun {
  int threads;
  int depth;
  std::atomic<int> atBottom{0};
  std::atomic<int> mismatches{0};
};

// Opens depth nested scopes, checking the innermost value on the way down and back up.
// At the bottom it waits until every thread is at full depth, so all scopes are live at once.
void nest(NestRun& run, int tid, int level) {
  if (level == run.depth) {
    run.atBottom.fetch_add(1, std::memory_order_acq_rel);
    while (run.atBottom.load(std::memory_order_acquire) < run.threads) { std::this_thread::yield(); }
    return;
  }
  const int v = tid * 100000 + level;
  with_context(ctx(v), [&]() {
    if (current_n() != v) { run.mismatches.fetch_add(1); }
    nest(run, tid, level + 1);
    if (current_n() != v) { run.mismatches.fetch_add(1); }
  });
}

} // namespace

TEST(ScopeThreads, SpawnedThreadDoesNotInheritBinding) {
  int inParent = 0;
  int inChild = 0;
  with_context(ctx(8), [&]() {
    inParent = current_n();
    std::thread t([&inChild]() { inChild = current_n(); });
    t.join();
  });
  EXPECT_EQ(inParent, 8);
  EXPECT_EQ(inChild, -1);
}

TEST(ScopeThreads, ChildMayOpenItsOwnScope) {
  int inChild = 0;
  with_context(ctx(1), [&]() {
    std::thread t([&inChild]() { with_context(ctx(2), [&inChild]() { inChild = current_n(); }); });
    t.join();
    EXPECT_EQ(current_n(), 1);
  });
  EXPECT_EQ(inChild, 2);
}

TEST(ScopeThreads, ConcurrentScopesSeeOnlyTheirOwnValues) {
  stackscope::testutil::Heartbeat hb("scope threads");
  constexpr int kThreads = 8;
  constexpr int kIters = 300;
  std::atomic<int> mismatches{0};
  std::atomic<bool> go{false};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      while (!go.load(std::memory_order_acquire)) { std::this_thread::yield(); }
      for (int i = 0; i < kIters; ++i) {
        const int outer = t * 100000 + i * 2;
        with_context(ctx(outer), [&]() {
          if (current_n() != outer) { mismatches.fetch_add(1); }
          with_context(ctx(outer + 1), [&]() {
            if (current_n() != outer + 1) { mismatches.fetch_add(1); }
          });
          // Sibling scope after the nested one has exited.
          with_context(ctx(-outer), [&]() {
            if (current_n() != -outer) { mismatches.fetch_add(1); }
          });
          if (current_n() != outer) { mismatches.fetch_add(1); }
        });
        if (current_n() != -1) { mismatches.fetch_add(1); }
      }
    });
  }
  go.store(true, std::memory_order_release);
  for (auto& th : threads) { th.join(); }
  EXPECT_EQ(mismatches.load(), 0);
}

TEST(ScopeThreads, LongRunningScopeWhileOthersChurn) {
  std::atomic<bool> stop{false};
  std::atomic<int> mismatches{0};
  std::thread holder([&]() {
    with_context(ctx(4242), [&]() {
      while (!stop.load(std::memory_order_acquire)) {
        if (current_n() != 4242) { mismatches.fetch_add(1); }
        std::this_thread::sleep_for(std::chrono::microseconds(50));
      }
    });
  });
  std::vector<std::thread> churn;
  for (int t = 0; t < 4; ++t) {
    churn.emplace_back([&, t]() {
      for (int i = 0; i < 500; ++i) {
        with_context(ctx(t), [&]() {
          if (current_n() != t) { mismatches.fetch_add(1); }
        });
      }
    });
  }
  for (auto& th : churn) { th.join(); }
  stop.store(true, std::memory_order_release);
  holder.join();
  EXPECT_EQ(mismatches.load(), 0);
}

TEST(ScopeThreads, ThousandsOfNestedScopesAcrossThreads) {
  stackscope::testutil::Heartbeat hb("deep nested scopes");
  scope_reset_stats_for_tests();
  const auto baseline = scope_stats();
  NestRun run{8, 160};
  std::vector<std::thread> threads;
  for (int t = 0; t < run.threads; ++t) {
    threads.emplace_back([&run, t]() {
      nest(run, t, 0);
      if (current_n() != -1) { run.mismatches.fetch_add(1); }
    });
  }
  for (auto& th : threads) { th.join(); }
  EXPECT_EQ(run.mismatches.load(), 0);

  const auto st = scope_stats();
  EXPECT_GE(st.peakLiveBindings, baseline.liveBindings + 1280);
  EXPECT_EQ(st.liveBindings, baseline.liveBindings);
  EXPECT_EQ(st.scopesEntered, 1280u);
  EXPECT_EQ(st.scopesExited, 1280u);
}
