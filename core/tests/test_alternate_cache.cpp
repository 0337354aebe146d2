#include "arbor/alternate_cache.hpp"
#include "arbor/memory_object_database.hpp"
#include "arbor/window_cursor.hpp"
#include "tree_fixtures.hpp"
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace arbor;
using namespace arbor::testing;

namespace {

constexpr int NUM_THREADS = 8;

/// Primary database whose alternate loader counts invocations.
struct CountingSetup {
  std::atomic<int> loads{0};
  std::vector<std::shared_ptr<MemoryObjectDatabase>> alternates;
  std::unique_ptr<MemoryObjectDatabase> primary;

  explicit CountingSetup(int n_alternates) {
    for (int i = 0; i < n_alternates; ++i)
      alternates.push_back(std::make_shared<MemoryObjectDatabase>());

    MemoryObjectDatabase::Options opts;
    opts.alternate_loader = [this]() -> AlternateLoadResult {
      loads.fetch_add(1);
      // Widen the window in which concurrent first callers race.
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      return AlternateList(alternates.begin(), alternates.end());
    };
    primary = std::make_unique<MemoryObjectDatabase>(std::move(opts));
  }
};

template <typename Fn> void run_concurrently(Fn fn) {
  std::atomic<bool> go{false};
  std::vector<std::thread> threads;
  for (int t = 0; t < NUM_THREADS; ++t) {
    threads.emplace_back([&, t] {
      while (!go.load())
        std::this_thread::yield();
      fn(t);
    });
  }
  go.store(true);
  for (auto &th : threads)
    th.join();
}

} // namespace

// ============================================================================
// AlternateCache
// ============================================================================

TEST(AlternateCache, PublishesOnceUntilReset) {
  AlternateCache cache;
  EXPECT_FALSE(cache.loaded());

  int calls = 0;
  auto loader = [&]() -> AlternateLoadResult {
    ++calls;
    return AlternateList{std::make_shared<MemoryObjectDatabase>()};
  };

  AlternateSnapshot first = cache.get(loader);
  AlternateSnapshot second = cache.get(loader);
  EXPECT_EQ(first, second);
  EXPECT_EQ(first->size(), 1u);
  EXPECT_EQ(calls, 1);

  AlternateSnapshot taken = cache.reset();
  EXPECT_EQ(taken, first);
  EXPECT_EQ(cache.generation(), 1u);
  EXPECT_EQ(cache.reset(), nullptr);

  AlternateSnapshot third = cache.get(loader);
  EXPECT_NE(third, first);
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(cache.load_count(), 2u);
}

TEST(AlternateCache, EmptyListSharesNone) {
  AlternateCache cache;
  auto snap = cache.get([]() -> AlternateLoadResult { return AlternateList{}; });
  EXPECT_EQ(snap, AlternateCache::none());
  EXPECT_TRUE(snap->empty());
  EXPECT_EQ(cache.failed_loads(), 0u);
  EXPECT_EQ(cache.last_error(), StorageError::Ok);
}

TEST(AlternateCache, SnapshotSurvivesReset) {
  AlternateCache cache;
  auto alt = std::make_shared<MemoryObjectDatabase>();
  auto snap =
      cache.get([&]() -> AlternateLoadResult { return AlternateList{alt}; });
  cache.reset();
  ASSERT_EQ(snap->size(), 1u);
  EXPECT_EQ(snap->front(), alt);
}

// ============================================================================
// Concurrent Loading and Closing
// ============================================================================

TEST(AlternateConcurrency, FirstUseLoadsOnce) {
  CountingSetup setup(3);
  std::atomic<int> misses{0};

  run_concurrently([&](int t) {
    WindowCursor curs;
    const ObjectId id = id_of_byte(static_cast<uint8_t>(t + 1));
    if (!setup.primary->has_object(id))
      misses.fetch_add(1);
    EXPECT_EQ(setup.primary->open_object(curs, id), nullptr);
  });

  EXPECT_EQ(setup.loads.load(), 1);
  EXPECT_EQ(misses.load(), NUM_THREADS);
  EXPECT_EQ(setup.primary->alternates()->size(), 3u);
}

TEST(AlternateConcurrency, ReloadAfterCloseHappensOnce) {
  CountingSetup setup(2);
  const ObjectId id = setup.alternates[1]->insert(ObjectType::Blob, "shared");

  ASSERT_TRUE(setup.primary->has_object(id));
  ASSERT_EQ(setup.loads.load(), 1);

  setup.primary->close();

  std::atomic<int> hits{0};
  run_concurrently([&](int) {
    if (setup.primary->has_object(id))
      hits.fetch_add(1);
  });

  EXPECT_EQ(setup.loads.load(), 2);
  EXPECT_EQ(hits.load(), NUM_THREADS);
  EXPECT_EQ(setup.primary->alternate_cache().generation(), 1u);
}

TEST(AlternateConcurrency, ConcurrentCloseClosesEachAlternateOnce) {
  CountingSetup setup(4);
  setup.primary->alternates();

  run_concurrently([&](int) { setup.primary->close_alternates(); });

  for (const auto &alt : setup.alternates)
    EXPECT_EQ(alt->close_count(), 1u);
  EXPECT_EQ(setup.primary->alternate_cache().generation(),
            static_cast<uint64_t>(NUM_THREADS));
  EXPECT_FALSE(setup.primary->alternate_cache().loaded());
}

TEST(AlternateConcurrency, ReadersAndClosersInterleave) {
  CountingSetup setup(2);
  const ObjectId id = setup.alternates[0]->insert(ObjectType::Blob, "kept");
  std::atomic<int> hits{0};

  run_concurrently([&](int t) {
    for (int i = 0; i < 50; ++i) {
      if (t == 0) {
        setup.primary->close_alternates();
      } else if (setup.primary->has_object(id)) {
        hits.fetch_add(1);
      }
    }
  });

  // A reader always sees either the old or the reloaded list, both of which
  // hold the object.
  EXPECT_EQ(hits.load(), (NUM_THREADS - 1) * 50);
  EXPECT_GE(setup.loads.load(), 1);
}
