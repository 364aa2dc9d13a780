// ===========================================================================
// Reader Throughput: bounds-checked parsing of forged buffers
// ---------------------------------------------------------------------------
// Claims under test:
//   - Tuple iteration costs one header check per child
//   - Vector element access is O(1) after a single eager size check
//   - Object lookup is a linear scan (last key wins)
//
// Methodology:
//   - Buffers are forged once in setup and parsed every iteration
//   - Custom counters: AtomsPerSec
// ===========================================================================

#include "atomkit/forge.hpp"
#include "atomkit/reader.hpp"
#include "atomkit/registry.hpp"
#include <benchmark/benchmark.h>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace {

constexpr size_t BUFFER_BYTES = 256 * 1024;

struct Fixture {
  atomkit::HashTypeRegistry registry;
  atomkit::AtomTypes types = atomkit::AtomTypes::from_registry(registry);
  std::vector<uint8_t> buffer = std::vector<uint8_t>(BUFFER_BYTES);
  size_t size = 0;

  /// Reports a setup failure once; the benchmark then skips.
  bool check(atomkit::Forge &forge, const char *what) {
    size = forge.size();
    if (forge.is_complete())
      return true;
    std::printf("[bench_reader] %s setup failed\n", what);
    return false;
  }
};

} // namespace

// ----------------------------------------------------------------------------
// 1. Tuple of Ints
// ----------------------------------------------------------------------------
static void BM_ReadTupleInts(benchmark::State &state) {
  const auto count = static_cast<int32_t>(state.range(0));
  Fixture fx;
  atomkit::Forge forge(fx.types, fx.buffer);
  (void)forge.push_tuple();
  for (int32_t i = 0; i < count; ++i)
    (void)forge.write_int(i);
  (void)forge.pop_frame();
  if (!fx.check(forge, "tuple")) {
    state.SkipWithError("forge failed");
    return;
  }

  atomkit::Reader reader(fx.types, fx.buffer.data(), fx.size);
  for (auto _ : state) {
    int64_t sum = 0;
    auto tuple = reader.iterate_tuple(0);
    for (const auto &child : *tuple) {
      if (auto v = reader.read_int(*child))
        sum += *v;
    }
    benchmark::DoNotOptimize(sum);
  }

  state.counters["AtomsPerSec"] = benchmark::Counter(
      static_cast<double>(count) * state.iterations(),
      benchmark::Counter::kIsRate);
}
BENCHMARK(BM_ReadTupleInts)->Arg(16)->Arg(1024)->Arg(8192);

// ----------------------------------------------------------------------------
// 2. Vector of doubles
// ----------------------------------------------------------------------------
static void BM_ReadDoubleVector(benchmark::State &state) {
  const auto count = static_cast<int>(state.range(0));
  Fixture fx;
  atomkit::Forge forge(fx.types, fx.buffer);
  (void)forge.push_vector(fx.types.double_, 8);
  for (int i = 0; i < count; ++i)
    (void)forge.write_double(i * 0.25);
  (void)forge.pop_frame();
  if (!fx.check(forge, "vector")) {
    state.SkipWithError("forge failed");
    return;
  }

  atomkit::Reader reader(fx.types, fx.buffer.data(), fx.size);
  for (auto _ : state) {
    double sum = 0.0;
    auto vector = reader.iterate_vector(0);
    for (auto element : *vector) {
      double v;
      std::memcpy(&v, element.data(), sizeof(v));
      sum += v;
    }
    benchmark::DoNotOptimize(sum);
  }

  state.SetBytesProcessed(state.iterations() * count * 8);
}
BENCHMARK(BM_ReadDoubleVector)->Arg(64)->Arg(4096)->Arg(16384);

// ----------------------------------------------------------------------------
// 3. Object lookup
// ----------------------------------------------------------------------------
static void BM_ObjectFind(benchmark::State &state) {
  const auto properties = static_cast<int>(state.range(0));
  Fixture fx;
  std::vector<atomkit::TypeId> keys;
  for (int i = 0; i < properties; ++i)
    keys.push_back(fx.registry.map("urn:bench:key" + std::to_string(i)));

  atomkit::Forge forge(fx.types, fx.buffer);
  (void)forge.push_object();
  for (int i = 0; i < properties; ++i) {
    (void)forge.write_property(keys[i]);
    (void)forge.write_float(static_cast<float>(i));
  }
  (void)forge.pop_frame();
  if (!fx.check(forge, "object")) {
    state.SkipWithError("forge failed");
    return;
  }

  atomkit::Reader reader(fx.types, fx.buffer.data(), fx.size);
  auto object = reader.iterate_object(0);
  size_t i = 0;
  for (auto _ : state) {
    auto found = object->find(keys[i++ % keys.size()]);
    benchmark::DoNotOptimize(found);
  }
}
BENCHMARK(BM_ObjectFind)->Arg(4)->Arg(32)->Arg(256);

// ----------------------------------------------------------------------------
// 4. Sequence monotonicity scan
// ----------------------------------------------------------------------------
static void BM_SequenceMonotonic(benchmark::State &state) {
  const auto events = static_cast<int>(state.range(0));
  Fixture fx;
  atomkit::Forge forge(fx.types, fx.buffer);
  (void)forge.push_sequence(atomkit::TimeUnit::Frames);
  for (int i = 0; i < events; ++i) {
    (void)forge.write_timestamp(atomkit::Timestamp::from_frames(i));
    (void)forge.write_int(i);
  }
  (void)forge.pop_frame();
  if (!fx.check(forge, "sequence")) {
    state.SkipWithError("forge failed");
    return;
  }

  atomkit::Reader reader(fx.types, fx.buffer.data(), fx.size);
  auto sequence = reader.iterate_sequence(0);
  for (auto _ : state) {
    bool ordered = sequence->is_monotonic();
    benchmark::DoNotOptimize(ordered);
  }

  state.counters["AtomsPerSec"] = benchmark::Counter(
      static_cast<double>(events) * state.iterations(),
      benchmark::Counter::kIsRate);
}
BENCHMARK(BM_SequenceMonotonic)->Arg(16)->Arg(512)->Arg(4096);

BENCHMARK_MAIN();
