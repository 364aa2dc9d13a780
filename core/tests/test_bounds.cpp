/**
 * @file test_bounds.cpp
 * @brief Truncation and corruption safety: the Reader must report an error
 *        for every cut point and every corrupted size, never read outside
 *        the buffer it was given.
 *
 * Prefixes are copied into exact-size heap blocks so that a sanitizer build
 * flags any read past the end.
 */

#include "atomkit/forge.hpp"
#include "atomkit/reader.hpp"
#include <array>
#include <cstring>
#include <gtest/gtest.h>
#include <random>
#include <vector>

using namespace atomkit;

namespace {

/// Visits every atom reachable from `atom`, decoding each leaf.
/// @return Number of errors met along the way.
size_t walk(const Reader &reader, const AtomView &atom, size_t depth = 0) {
  if (depth > MAX_FRAME_DEPTH)
    return 1;

  const auto &types = reader.types();
  size_t errors = 0;

  if (atom.type == types.tuple) {
    auto tuple = reader.iterate_tuple(atom);
    if (!tuple)
      return 1;
    for (const auto &child : *tuple)
      errors += child ? walk(reader, *child, depth + 1) : 1;
  } else if (types.is_object(atom.type)) {
    auto object = reader.iterate_object(atom);
    if (!object)
      return 1;
    for (const auto &property : *object)
      errors += property ? walk(reader, property->value, depth + 1) : 1;
  } else if (atom.type == types.sequence) {
    auto sequence = reader.iterate_sequence(atom);
    if (!sequence)
      return 1;
    for (const auto &event : *sequence)
      errors += event ? walk(reader, event->value, depth + 1) : 1;
    (void)sequence->is_monotonic();
  } else if (atom.type == types.vector) {
    auto vector = reader.iterate_vector(atom);
    if (!vector)
      return 1;
    for (auto element : *vector)
      (void)decode_scalar(types, vector->child_type(), element);
  } else if (atom.type == types.string) {
    errors += reader.read_string(atom) ? 0 : 1;
  } else if (atom.type == types.literal) {
    errors += reader.read_literal(atom) ? 0 : 1;
  } else if (scalar_kind(types, atom.type)) {
    errors += reader.read_scalar(atom) ? 0 : 1;
  }
  return errors;
}

size_t walk_all(const Reader &reader) {
  size_t errors = 0;
  for (const auto &atom : reader.iterate_atoms())
    errors += atom ? walk(reader, *atom) : 1;
  return errors;
}

} // namespace

// ===========================================================================
// Test Fixture: a message using every container kind
// ===========================================================================

class BoundsTest : public ::testing::Test {
protected:
  HashTypeRegistry registry_;
  AtomTypes types_ = AtomTypes::from_registry(registry_);
  std::vector<uint8_t> message_;
  std::vector<size_t> header_offsets_;

  void SetUp() override {
    alignas(8) std::array<uint8_t, 512> buffer{};
    Forge forge(types_, buffer);
    TypeId key = registry_.map("urn:test:key");

    ASSERT_TRUE(forge.push_tuple().has_value());
    ASSERT_TRUE(forge.write_int(1).has_value());
    ASSERT_TRUE(forge.write_string("hello").has_value());
    ASSERT_TRUE(forge.push_vector(types_.long_, 8).has_value());
    ASSERT_TRUE(forge.write_long(10).has_value());
    ASSERT_TRUE(forge.write_long(20).has_value());
    ASSERT_TRUE(forge.pop_frame().has_value());
    ASSERT_TRUE(forge.push_object(NO_TYPE, key).has_value());
    ASSERT_TRUE(forge.write_property(key).has_value());
    ASSERT_TRUE(forge.write_literal("lit").has_value());
    ASSERT_TRUE(forge.pop_frame().has_value());
    ASSERT_TRUE(forge.push_sequence(TimeUnit::Frames).has_value());
    ASSERT_TRUE(forge.write_timestamp(Timestamp::from_frames(4)).has_value());
    ASSERT_TRUE(forge.write_double(0.5).has_value());
    ASSERT_TRUE(forge.pop_frame().has_value());
    ASSERT_TRUE(forge.pop_frame().has_value());

    auto data = forge.data();
    message_.assign(data.begin(), data.end());

    // Header positions, found by walking the intact message.
    Reader reader(types_, message_);
    ASSERT_EQ(walk_all(reader), 0u);
    header_offsets_ = {0};
    collect(reader, 0);
  }

  void collect(const Reader &reader, size_t offset) {
    auto tuple = reader.iterate_tuple(offset);
    ASSERT_TRUE(tuple.has_value());
    for (const auto &child : *tuple) {
      ASSERT_TRUE(child.has_value());
      header_offsets_.push_back(child->offset);
    }
  }
};

TEST_F(BoundsTest, IntactMessageParses) {
  Reader reader(types_, message_);
  auto atom = reader.read_atom(0);
  ASSERT_TRUE(atom.has_value());
  EXPECT_EQ(atom->next_offset, message_.size());
  EXPECT_EQ(header_offsets_.size(), 6u);
}

TEST_F(BoundsTest, EveryCutPointIsReported) {
  for (size_t cut = 0; cut < message_.size(); ++cut) {
    std::vector<uint8_t> prefix(message_.begin(), message_.begin() + cut);
    Reader reader(types_, prefix);

    auto atom = reader.read_atom(0);
    ASSERT_FALSE(atom.has_value()) << "cut at " << cut;
    EXPECT_EQ(atom.error(), AtomError::TruncatedBuffer) << "cut at " << cut;

    if (cut > 0)
      EXPECT_GT(walk_all(reader), 0u) << "cut at " << cut;
    else
      EXPECT_EQ(walk_all(reader), 0u);
  }
}

TEST_F(BoundsTest, EveryCutPointInsideTheTupleBody) {
  // Shrink the outer tuple's declared size to every smaller value; children
  // must then be rejected against the tuple bound, not the buffer bound.
  auto original = message_;
  AtomHeader outer{};
  std::memcpy(&outer, original.data(), sizeof(outer));

  for (uint32_t size = 0; size < outer.body_size; ++size) {
    auto shrunk = original;
    AtomHeader header{outer.type, size};
    std::memcpy(shrunk.data(), &header, sizeof(header));

    Reader reader(types_, shrunk);
    auto tuple = reader.iterate_tuple(0);
    ASSERT_TRUE(tuple.has_value()) << "size " << size;

    size_t good = 0;
    size_t bad = 0;
    for (const auto &child : *tuple) {
      if (child) {
        EXPECT_LE(child->offset + sizeof(AtomHeader) + child->body_size,
                  sizeof(AtomHeader) + size);
        ++good;
      } else {
        EXPECT_EQ(child.error(), AtomError::MalformedContainer);
        ++bad;
      }
    }
    EXPECT_LT(good, header_offsets_.size() - 1) << "size " << size;
    EXPECT_LE(bad, 1u);
  }
}

TEST_F(BoundsTest, CorruptedBodySizesAreContained) {
  std::mt19937 rng(1234);
  std::uniform_int_distribution<uint32_t> any_size(0, 0xFFFFFFFFu);
  std::uniform_int_distribution<uint32_t> small_size(0, 256);

  for (size_t offset : header_offsets_) {
    for (int round = 0; round < 64; ++round) {
      std::vector<uint8_t> corrupt = message_;
      uint32_t size = round % 2 ? any_size(rng) : small_size(rng);
      std::memcpy(corrupt.data() + offset + 4, &size, sizeof(size));

      Reader reader(types_, corrupt);
      // Must terminate without touching bytes outside `corrupt`.
      (void)walk_all(reader);
    }
  }
  SUCCEED();
}

TEST_F(BoundsTest, CorruptedTypeIdsAreContained) {
  const TypeId swaps[] = {types_.tuple,  types_.vector, types_.object,
                          types_.sequence, types_.string, types_.literal,
                          types_.long_,  NO_TYPE,       0xDEADBEEFu};

  for (size_t offset : header_offsets_) {
    for (TypeId type : swaps) {
      std::vector<uint8_t> corrupt = message_;
      std::memcpy(corrupt.data() + offset, &type, sizeof(type));
      Reader reader(types_, corrupt);
      (void)walk_all(reader);
    }
  }
  SUCCEED();
}

TEST_F(BoundsTest, OffsetsPastTheEnd) {
  Reader reader(types_, message_);
  for (size_t offset : {message_.size(), message_.size() + 1, size_t{0} - 1}) {
    auto h = reader.read_header(offset);
    ASSERT_FALSE(h.has_value());
    EXPECT_EQ(h.error(), AtomError::TruncatedBuffer);
    EXPECT_TRUE(reader.iterate_atoms(offset).empty());
  }
}
