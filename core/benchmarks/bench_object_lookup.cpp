// ===========================================================================
// Object lookup across an alternate chain
// ---------------------------------------------------------------------------
// Measures has_object/open_object on a primary database backed by a chain of
// N alternates, for hits in the primary, hits in the last alternate's fast
// half, slow-half hits, and misses that visit everything.
// ===========================================================================

#include "arbor/memory_object_database.hpp"
#include "arbor/window_cursor.hpp"
#include <benchmark/benchmark.h>
#include <memory>
#include <string>
#include <vector>

namespace {

struct Chain {
  std::unique_ptr<arbor::MemoryObjectDatabase> primary;
  std::vector<std::shared_ptr<arbor::MemoryObjectDatabase>> alternates;
  arbor::ObjectId in_primary;
  arbor::ObjectId in_last;
  arbor::ObjectId loose_in_last;
  arbor::ObjectId absent;
};

Chain build_chain(size_t depth, size_t objects_per_db) {
  Chain c;
  for (size_t i = 0; i < depth; ++i)
    c.alternates.push_back(std::make_shared<arbor::MemoryObjectDatabase>());

  arbor::MemoryObjectDatabase::Options opts;
  auto alts = c.alternates;
  opts.alternate_loader = [alts]() -> arbor::AlternateLoadResult {
    return arbor::AlternateList(alts.begin(), alts.end());
  };
  c.primary = std::make_unique<arbor::MemoryObjectDatabase>(std::move(opts));

  for (size_t i = 0; i < objects_per_db; ++i) {
    c.in_primary =
        c.primary->insert(arbor::ObjectType::Blob, "p" + std::to_string(i));
    for (size_t d = 0; d < depth; ++d) {
      c.in_last = c.alternates[d]->insert(
          arbor::ObjectType::Blob,
          "a" + std::to_string(d) + "/" + std::to_string(i));
    }
  }
  const std::string loose = "loose";
  auto &last = depth > 0 ? *c.alternates.back() : *c.primary;
  c.loose_in_last = last.insert_loose(
      arbor::ObjectType::Blob,
      std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(loose.data()),
                               loose.size()));
  c.absent = arbor::MemoryObjectDatabase::compute_object_id(
      arbor::ObjectType::Blob, {});
  return c;
}

} // namespace

static void BM_HasObject_PrimaryHit(benchmark::State &state) {
  Chain c = build_chain(static_cast<size_t>(state.range(0)), 1000);
  for (auto _ : state)
    benchmark::DoNotOptimize(c.primary->has_object(c.in_primary));
}
BENCHMARK(BM_HasObject_PrimaryHit)->Arg(0)->Arg(4)->Arg(16);

static void BM_HasObject_LastAlternateHit(benchmark::State &state) {
  Chain c = build_chain(static_cast<size_t>(state.range(0)), 1000);
  for (auto _ : state)
    benchmark::DoNotOptimize(c.primary->has_object(c.in_last));
}
BENCHMARK(BM_HasObject_LastAlternateHit)->Arg(1)->Arg(4)->Arg(16);

static void BM_HasObject_SlowHit(benchmark::State &state) {
  Chain c = build_chain(static_cast<size_t>(state.range(0)), 1000);
  for (auto _ : state)
    benchmark::DoNotOptimize(c.primary->has_object(c.loose_in_last));
}
BENCHMARK(BM_HasObject_SlowHit)->Arg(1)->Arg(4)->Arg(16);

static void BM_HasObject_Miss(benchmark::State &state) {
  Chain c = build_chain(static_cast<size_t>(state.range(0)), 1000);
  for (auto _ : state)
    benchmark::DoNotOptimize(c.primary->has_object(c.absent));
}
BENCHMARK(BM_HasObject_Miss)->Arg(0)->Arg(4)->Arg(16);

static void BM_OpenObject_LastAlternate(benchmark::State &state) {
  Chain c = build_chain(static_cast<size_t>(state.range(0)), 1000);
  arbor::WindowCursor curs;
  for (auto _ : state) {
    auto ldr = c.primary->open_object(curs, c.in_last);
    benchmark::DoNotOptimize(ldr->cached_bytes().data());
  }
}
BENCHMARK(BM_OpenObject_LastAlternate)->Arg(1)->Arg(4)->Arg(16);

// ---------------------------------------------------------------------------
// Concurrent readers sharing one primary; the alternate snapshot is taken
// under a shared lock on every lookup.
// ---------------------------------------------------------------------------
static void BM_HasObject_Concurrent(benchmark::State &state) {
  static Chain *chain = nullptr;
  if (state.thread_index() == 0)
    chain = new Chain(build_chain(8, 1000));

  for (auto _ : state)
    benchmark::DoNotOptimize(chain->primary->has_object(chain->in_last));

  if (state.thread_index() == 0) {
    delete chain;
    chain = nullptr;
  }
}
BENCHMARK(BM_HasObject_Concurrent)->ThreadRange(1, 8)->UseRealTime();

BENCHMARK_MAIN();
