/**
 * @file test_schema.cpp
 * @brief Wire layout of headers and body prefixes, alignment helpers,
 *        timestamps, error names and the registry hash.
 */

#include "atomkit/core.hpp"
#include "atomkit/error.hpp"
#include "atomkit/hash.hpp"
#include "atomkit/schema.hpp"
#include <cstddef>
#include <gtest/gtest.h>
#include <string>

using namespace atomkit;

// ===========================================================================
// Layout
// ===========================================================================

TEST(SchemaTest, HeaderIsTypeThenSize) {
  EXPECT_EQ(sizeof(AtomHeader), 8u);
  EXPECT_EQ(offsetof(AtomHeader, type), 0u);
  EXPECT_EQ(offsetof(AtomHeader, body_size), 4u);
}

TEST(SchemaTest, BodyPrefixesAreEightBytes) {
  EXPECT_EQ(sizeof(VectorBody), 8u);
  EXPECT_EQ(offsetof(VectorBody, child_size), 4u);
  EXPECT_EQ(sizeof(ObjectBody), 8u);
  EXPECT_EQ(offsetof(ObjectBody, otype), 4u);
  EXPECT_EQ(sizeof(PropertyBody), 8u);
  EXPECT_EQ(offsetof(PropertyBody, context), 4u);
  EXPECT_EQ(sizeof(SequenceBody), 8u);
  EXPECT_EQ(sizeof(EventStamp), 8u);
  EXPECT_EQ(sizeof(LiteralBody), 8u);
}

// ===========================================================================
// Alignment
// ===========================================================================

TEST(SchemaTest, AlignUp) {
  EXPECT_EQ(align_up(0), 0u);
  EXPECT_EQ(align_up(1), 8u);
  EXPECT_EQ(align_up(7), 8u);
  EXPECT_EQ(align_up(8), 8u);
  EXPECT_EQ(align_up(9), 16u);
  EXPECT_EQ(align_up(13, 4), 16u);
}

TEST(SchemaTest, PaddingAndFootprint) {
  EXPECT_EQ(padding_for(4), 4u);
  EXPECT_EQ(padding_for(8), 0u);
  EXPECT_EQ(padding_for(13), 3u);
  EXPECT_EQ(padded_atom_size(13), 24u);
  EXPECT_EQ(padded_atom_size(1008), 1016u);
}

// ===========================================================================
// Timestamps
// ===========================================================================

TEST(SchemaTest, FrameStampsOrder) {
  auto a = Timestamp::from_frames(3);
  auto b = Timestamp::from_frames(5);
  EXPECT_TRUE(a.before(b));
  EXPECT_FALSE(b.before(a));
  EXPECT_FALSE(a.before(a));
  EXPECT_EQ(b.frames(), 5);
}

TEST(SchemaTest, BeatStampsOrder) {
  auto a = Timestamp::from_beats(0.25);
  auto b = Timestamp::from_beats(1.5);
  EXPECT_TRUE(a.before(b));
  EXPECT_DOUBLE_EQ(b.beats(), 1.5);
}

TEST(SchemaTest, MixedUnitsAreUnordered) {
  auto frames = Timestamp::from_frames(0);
  auto beats = Timestamp::from_beats(100.0);
  EXPECT_FALSE(frames.before(beats));
  EXPECT_FALSE(beats.before(frames));
}

// ===========================================================================
// Errors & hash
// ===========================================================================

TEST(SchemaTest, ErrorNames) {
  EXPECT_EQ(to_string(AtomError::OutOfSpace), "OutOfSpace");
  EXPECT_EQ(to_string(AtomError::FrameOverflow), "FrameOverflow");
  EXPECT_EQ(to_string(AtomError::MalformedContainer), "MalformedContainer");
  EXPECT_EQ(to_string(AtomError::TypeMismatch), "TypeMismatch");
}

TEST(SchemaTest, Fnv1aKnownVectors) {
  EXPECT_EQ(hash::fnv1a_64(""), hash::FNV1A_OFFSET_BASIS);
  EXPECT_EQ(hash::fnv1a_64("a"), 0xaf63dc4c8601ec8cULL);

  const std::string uri = "urn:test:a";
  EXPECT_EQ(hash::UriHash{}(uri),
            static_cast<size_t>(hash::fnv1a_64("urn:test:a")));

  static_assert(hash::fnv1a_64("Int") != hash::fnv1a_64("Long"));
}

TEST(SchemaTest, BuildInfoReportsHostOrder) {
  EXPECT_FALSE(core::version().empty());

  auto info = core::get_build_info();
  EXPECT_FALSE(info.compiler.empty());
  EXPECT_FALSE(info.architecture.empty());
  EXPECT_TRUE(info.byte_order == "little" || info.byte_order == "big");
}
