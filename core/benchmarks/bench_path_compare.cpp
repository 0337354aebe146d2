// ===========================================================================
// Path comparison and tree parsing throughput
// ---------------------------------------------------------------------------
// Measures the cost of the tree sort comparator on raw paths, lock-step
// comparison of two sibling trees, and a full parse of a wide tree object.
// ===========================================================================

#include "arbor/canonical_tree_parser.hpp"
#include "arbor/file_mode.hpp"
#include "arbor/tree_formatter.hpp"
#include "arbor/tree_iterator.hpp"
#include <benchmark/benchmark.h>
#include <algorithm>
#include <random>
#include <string>
#include <vector>

namespace {

std::vector<std::string> generate_names(size_t count, size_t length, int seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> dist('a', 'z');
  std::vector<std::string> names(count);
  for (auto &n : names) {
    n.resize(length);
    for (auto &c : n)
      c = static_cast<char>(dist(rng));
  }
  return names;
}

arbor::ObjectId id_for(size_t i) {
  arbor::ObjectId::Raw raw{};
  for (size_t b = 0; b < sizeof(i); ++b)
    raw[b] = static_cast<uint8_t>(i >> (8 * b));
  return arbor::ObjectId(raw);
}

} // namespace

// ---------------------------------------------------------------------------
// BM_ComparePaths: raw comparator over paths sharing a long prefix
// ---------------------------------------------------------------------------
static void BM_ComparePaths(benchmark::State &state) {
  const size_t prefix_len = static_cast<size_t>(state.range(0));
  const std::string prefix(prefix_len, 'p');
  const std::string a = prefix + "/A.c";
  const std::string b = prefix + "/A";

  for (auto _ : state) {
    int r = arbor::compare_paths(
        reinterpret_cast<const uint8_t *>(a.data()), a.size(),
        arbor::file_mode::REGULAR_FILE,
        reinterpret_cast<const uint8_t *>(b.data()), b.size(),
        arbor::file_mode::TREE);
    benchmark::DoNotOptimize(r);
  }
  state.SetBytesProcessed(state.iterations() *
                          static_cast<int64_t>(a.size()));
}
BENCHMARK(BM_ComparePaths)->Arg(8)->Arg(64)->Arg(512);

// ---------------------------------------------------------------------------
// BM_ParseTree: walk every entry of a tree with N sorted entries
// ---------------------------------------------------------------------------
static void BM_ParseTree(benchmark::State &state) {
  const size_t count = static_cast<size_t>(state.range(0));
  auto names = generate_names(count, 16, 7);
  std::sort(names.begin(), names.end());
  names.erase(std::unique(names.begin(), names.end()), names.end());

  arbor::TreeFormatter fmt;
  for (size_t i = 0; i < names.size(); ++i)
    fmt.append(names[i], arbor::file_mode::REGULAR_FILE, id_for(i));
  const std::span<const uint8_t> raw(fmt.bytes());

  for (auto _ : state) {
    arbor::CanonicalTreeParser p(raw);
    size_t seen = 0;
    for (; !p.eof(); p.next(1))
      seen += p.name_length();
    benchmark::DoNotOptimize(seen);
  }
  state.SetItemsProcessed(state.iterations() *
                          static_cast<int64_t>(names.size()));
}
BENCHMARK(BM_ParseTree)->Arg(16)->Arg(256)->Arg(4096);

// ---------------------------------------------------------------------------
// BM_SiblingCompare: two parsers walked in lock-step, as a diff walker does
// ---------------------------------------------------------------------------
static void BM_SiblingCompare(benchmark::State &state) {
  auto names = generate_names(1024, 12, 11);
  std::sort(names.begin(), names.end());
  names.erase(std::unique(names.begin(), names.end()), names.end());

  arbor::TreeFormatter left;
  arbor::TreeFormatter right;
  for (size_t i = 0; i < names.size(); ++i) {
    left.append(names[i], arbor::file_mode::REGULAR_FILE, id_for(i));
    right.append(names[i], arbor::file_mode::REGULAR_FILE,
                 id_for(i % 3 == 0 ? i + 1 : i));
  }

  for (auto _ : state) {
    arbor::CanonicalTreeParser a{std::span<const uint8_t>(left.bytes())};
    arbor::CanonicalTreeParser b{std::span<const uint8_t>(right.bytes())};
    size_t changed = 0;
    while (!a.eof() && !b.eof()) {
      if (a.path_compare(b) == 0 && !a.id_equal(b))
        ++changed;
      a.next(1);
      b.next(1);
    }
    benchmark::DoNotOptimize(changed);
  }
}
BENCHMARK(BM_SiblingCompare);

BENCHMARK_MAIN();
