// ===========================================================================
// Forge Throughput: cost of writing atoms into a caller-owned buffer
// ---------------------------------------------------------------------------
// Claims under test:
//   - Scalar writes are a bounds check plus two stores
//   - Container cost is dominated by children, not by size back-patching
//   - Performance is flat in nesting depth (fixed frame stack, no heap)
//
// Methodology:
//   - One 64 KiB buffer per benchmark, reset() every iteration
//   - Custom counters: AtomsPerSec, BytesPerSec
// ===========================================================================

#include "atomkit/forge.hpp"
#include "atomkit/registry.hpp"
#include <benchmark/benchmark.h>
#include <cstdint>
#include <cstdio>
#include <vector>

namespace {

constexpr size_t BUFFER_BYTES = 64 * 1024;

atomkit::AtomTypes &shared_types() {
  static atomkit::HashTypeRegistry registry;
  static atomkit::AtomTypes types = atomkit::AtomTypes::from_registry(registry);
  return types;
}

} // namespace

// ----------------------------------------------------------------------------
// 1. Flat run of Int atoms
// ----------------------------------------------------------------------------
static void BM_ForgeInts(benchmark::State &state) {
  const auto count = static_cast<int32_t>(state.range(0));
  std::vector<uint8_t> buffer(BUFFER_BYTES);
  atomkit::Forge forge(shared_types(), buffer);

  for (auto _ : state) {
    forge.reset(buffer);
    for (int32_t i = 0; i < count; ++i) {
      auto r = forge.write_int(i);
      benchmark::DoNotOptimize(r);
    }
    benchmark::ClobberMemory();
  }

  state.counters["AtomsPerSec"] = benchmark::Counter(
      static_cast<double>(count) * state.iterations(),
      benchmark::Counter::kIsRate);
  state.SetBytesProcessed(state.iterations() * count * 16);
}
BENCHMARK(BM_ForgeInts)->Arg(16)->Arg(256)->Arg(2048);

// ----------------------------------------------------------------------------
// 2. Vector of floats (bare elements, no per-element header)
// ----------------------------------------------------------------------------
static void BM_ForgeFloatVector(benchmark::State &state) {
  const auto count = static_cast<int>(state.range(0));
  std::vector<uint8_t> buffer(BUFFER_BYTES);
  const auto &types = shared_types();
  atomkit::Forge forge(types, buffer);

  for (auto _ : state) {
    forge.reset(buffer);
    auto frame = forge.push_vector(types.float_, 4);
    benchmark::DoNotOptimize(frame);
    for (int i = 0; i < count; ++i) {
      auto r = forge.write_float(static_cast<float>(i) * 0.5f);
      benchmark::DoNotOptimize(r);
    }
    auto pop = forge.pop_frame();
    benchmark::DoNotOptimize(pop);
  }

  state.SetBytesProcessed(state.iterations() * count * 4);
}
BENCHMARK(BM_ForgeFloatVector)->Arg(64)->Arg(1024)->Arg(8192);

// ----------------------------------------------------------------------------
// 3. Sequence of MIDI-like events (stamp + small object)
// ----------------------------------------------------------------------------
static void BM_ForgeEventSequence(benchmark::State &state) {
  const auto events = static_cast<int>(state.range(0));
  std::vector<uint8_t> buffer(BUFFER_BYTES);
  const auto &types = shared_types();
  atomkit::Forge forge(types, buffer);

  for (auto _ : state) {
    forge.reset(buffer);
    (void)forge.push_sequence(atomkit::TimeUnit::Frames);
    for (int i = 0; i < events; ++i) {
      (void)forge.write_timestamp(atomkit::Timestamp::from_frames(i * 32));
      (void)forge.push_object();
      (void)forge.write_property(types.int_);
      (void)forge.write_int(60 + i % 12);
      (void)forge.write_property(types.float_);
      (void)forge.write_float(0.75f);
      (void)forge.pop_frame();
    }
    auto r = forge.pop_frame();
    benchmark::DoNotOptimize(r);
  }

  state.counters["AtomsPerSec"] = benchmark::Counter(
      static_cast<double>(events) * state.iterations(),
      benchmark::Counter::kIsRate);
}
BENCHMARK(BM_ForgeEventSequence)->Arg(8)->Arg(128)->Arg(512);

// ----------------------------------------------------------------------------
// 4. Nesting depth
// ----------------------------------------------------------------------------
static void BM_ForgeNestedTuples(benchmark::State &state) {
  const auto depth = static_cast<size_t>(state.range(0));
  std::vector<uint8_t> buffer(BUFFER_BYTES);
  atomkit::Forge forge(shared_types(), buffer);

  for (auto _ : state) {
    forge.reset(buffer);
    for (size_t d = 0; d < depth; ++d)
      (void)forge.push_tuple();
    (void)forge.write_long(1);
    for (size_t d = 0; d < depth; ++d)
      (void)forge.pop_frame();
    benchmark::DoNotOptimize(forge.size());
  }

  if (!forge.is_complete())
    std::printf("[bench_forge] nested tuples incomplete at depth %zu\n", depth);
}
BENCHMARK(BM_ForgeNestedTuples)->DenseRange(1, atomkit::MAX_FRAME_DEPTH, 5);

BENCHMARK_MAIN();
