/**
 * @file test_c_api.cpp
 * @brief Smoke tests for the extern "C" surface: handle lifecycle, error
 *        codes, and a forge/read round trip through caller-owned memory.
 */

#include "atomkit/atomkit_c_api.h"
#include <array>
#include <cstring>
#include <gtest/gtest.h>
#include <string>

class CApiTest : public ::testing::Test {
protected:
  atomkit_registry_t *registry_ = nullptr;
  atomkit_forge_t *forge_ = nullptr;
  alignas(8) std::array<uint8_t, 256> buffer_{};

  void SetUp() override {
    ASSERT_EQ(atomkit_registry_create(&registry_), ATOMKIT_OK);
    ASSERT_EQ(atomkit_forge_create(registry_, buffer_.data(), buffer_.size(),
                                   &forge_),
              ATOMKIT_OK);
  }

  void TearDown() override {
    EXPECT_EQ(atomkit_forge_destroy(forge_), ATOMKIT_OK);
    EXPECT_EQ(atomkit_registry_destroy(registry_), ATOMKIT_OK);
  }

  size_t written() const {
    size_t size = 0;
    EXPECT_EQ(atomkit_forge_size(forge_, &size), ATOMKIT_OK);
    return size;
  }
};

TEST_F(CApiTest, Version) {
  const char *version = atomkit_version();
  ASSERT_NE(version, nullptr);
  EXPECT_GT(std::strlen(version), 0u);
}

TEST_F(CApiTest, NullArguments) {
  EXPECT_EQ(atomkit_registry_create(nullptr), ATOMKIT_ERR_NULL_PTR);
  EXPECT_EQ(atomkit_forge_write_int(nullptr, 1), ATOMKIT_ERR_NULL_PTR);
  EXPECT_EQ(atomkit_forge_write_string(forge_, nullptr), ATOMKIT_ERR_NULL_PTR);
  EXPECT_EQ(atomkit_forge_destroy(nullptr), ATOMKIT_OK);
  EXPECT_EQ(atomkit_registry_destroy(nullptr), ATOMKIT_OK);

  uint32_t id = 0;
  EXPECT_EQ(atomkit_registry_map(registry_, nullptr, &id),
            ATOMKIT_ERR_NULL_PTR);
}

TEST_F(CApiTest, RegistryMapAndUnmap) {
  uint32_t a = 0;
  uint32_t again = 0;
  ASSERT_EQ(atomkit_registry_map(registry_, "urn:test:a", &a), ATOMKIT_OK);
  ASSERT_EQ(atomkit_registry_map(registry_, "urn:test:a", &again), ATOMKIT_OK);
  EXPECT_NE(a, 0u);
  EXPECT_EQ(a, again);

  uint32_t empty = 0;
  EXPECT_EQ(atomkit_registry_map(registry_, "", &empty),
            ATOMKIT_ERR_INVALID_ARG);

  char uri[64];
  size_t length = 0;
  ASSERT_EQ(atomkit_registry_unmap(registry_, a, uri, sizeof(uri), &length),
            ATOMKIT_OK);
  EXPECT_EQ(std::string(uri), "urn:test:a");
  EXPECT_EQ(length, 10u);

  char tiny[4];
  EXPECT_EQ(atomkit_registry_unmap(registry_, a, tiny, sizeof(tiny), &length),
            ATOMKIT_ERR_BUFFER_TOO_SMALL);
  EXPECT_EQ(length, 10u);

  EXPECT_EQ(atomkit_registry_unmap(registry_, 0xFFFFu, uri, sizeof(uri),
                                   &length),
            ATOMKIT_ERR_NOT_FOUND);
}

TEST_F(CApiTest, TupleRoundTrip) {
  ASSERT_EQ(atomkit_forge_push_tuple(forge_), ATOMKIT_OK);
  ASSERT_EQ(atomkit_forge_write_int(forge_, 42), ATOMKIT_OK);
  ASSERT_EQ(atomkit_forge_write_double(forge_, 0.25), ATOMKIT_OK);
  ASSERT_EQ(atomkit_forge_write_string(forge_, "kick"), ATOMKIT_OK);

  size_t depth = 0;
  ASSERT_EQ(atomkit_forge_depth(forge_, &depth), ATOMKIT_OK);
  EXPECT_EQ(depth, 1u);
  ASSERT_EQ(atomkit_forge_pop(forge_), ATOMKIT_OK);

  size_t size = written();
  EXPECT_EQ(size, 56u);

  size_t count = 0;
  ASSERT_EQ(
      atomkit_tuple_child_count(registry_, buffer_.data(), size, 0, &count),
      ATOMKIT_OK);
  EXPECT_EQ(count, 3u);

  atomkit_header_t tuple{};
  ASSERT_EQ(atomkit_read_header(registry_, buffer_.data(), size, 0, &tuple),
            ATOMKIT_OK);
  EXPECT_EQ(tuple.body_size, 48u);
  EXPECT_EQ(tuple.next_offset, size);

  int32_t i = 0;
  ASSERT_EQ(atomkit_read_int(registry_, buffer_.data(), size, 8, &i),
            ATOMKIT_OK);
  EXPECT_EQ(i, 42);

  double d = 0.0;
  ASSERT_EQ(atomkit_read_double(registry_, buffer_.data(), size, 24, &d),
            ATOMKIT_OK);
  EXPECT_DOUBLE_EQ(d, 0.25);

  char text[16];
  size_t length = 0;
  ASSERT_EQ(atomkit_read_string(registry_, buffer_.data(), size, 40, text,
                                sizeof(text), &length),
            ATOMKIT_OK);
  EXPECT_EQ(std::string(text), "kick");
  EXPECT_EQ(length, 4u);

  // Typed reads are strict.
  int64_t l = 0;
  EXPECT_EQ(atomkit_read_long(registry_, buffer_.data(), size, 8, &l),
            ATOMKIT_ERR_TYPE_MISMATCH);
  EXPECT_EQ(atomkit_read_int(registry_, buffer_.data(), size, 0, &i),
            ATOMKIT_ERR_UNEXPECTED_TYPE);
}

TEST_F(CApiTest, ObjectAndSequence) {
  uint32_t key = 0;
  ASSERT_EQ(atomkit_registry_map(registry_, "urn:test:gain", &key), ATOMKIT_OK);

  ASSERT_EQ(atomkit_forge_push_sequence(forge_, ATOMKIT_UNIT_BEATS),
            ATOMKIT_OK);
  EXPECT_EQ(atomkit_forge_write_frame_time(forge_, 0),
            ATOMKIT_ERR_TYPE_MISMATCH);
  ASSERT_EQ(atomkit_forge_write_beat_time(forge_, 1.0), ATOMKIT_OK);
  ASSERT_EQ(atomkit_forge_push_object(forge_, 0, 0), ATOMKIT_OK);
  ASSERT_EQ(atomkit_forge_write_property(forge_, key, 0), ATOMKIT_OK);
  ASSERT_EQ(atomkit_forge_write_float(forge_, 0.5f), ATOMKIT_OK);
  ASSERT_EQ(atomkit_forge_pop(forge_), ATOMKIT_OK);
  ASSERT_EQ(atomkit_forge_pop(forge_), ATOMKIT_OK);

  // sequence(8) + unit(8) + stamp(8) + object(8) + id/otype(8) +
  // key(8) + float atom(16)
  EXPECT_EQ(written(), 64u);

  float f = 0.0f;
  ASSERT_EQ(atomkit_read_float(registry_, buffer_.data(), written(), 48, &f),
            ATOMKIT_OK);
  EXPECT_FLOAT_EQ(f, 0.5f);
}

TEST_F(CApiTest, VectorElements) {
  uint32_t byte_type = 0;
  ASSERT_EQ(atomkit_registry_map(registry_, "urn:test:byte", &byte_type),
            ATOMKIT_OK);
  ASSERT_EQ(atomkit_forge_push_vector(forge_, byte_type, 1), ATOMKIT_OK);
  const uint8_t b = 7;
  ASSERT_EQ(atomkit_forge_write_vector_element(forge_, &b, 1), ATOMKIT_OK);
  EXPECT_EQ(atomkit_forge_write_vector_element(forge_, &b, 2),
            ATOMKIT_ERR_FRAME_MISMATCH);
  ASSERT_EQ(atomkit_forge_pop(forge_), ATOMKIT_OK);
  EXPECT_EQ(written(), 24u);
}

TEST_F(CApiTest, ForgeErrorsMapToCodes) {
  EXPECT_EQ(atomkit_forge_pop(forge_), ATOMKIT_ERR_FRAME_UNDERFLOW);
  EXPECT_EQ(atomkit_forge_write_property(forge_, 1, 0),
            ATOMKIT_ERR_FRAME_MISMATCH);

  std::array<uint8_t, 8> small{};
  ASSERT_EQ(atomkit_forge_reset(forge_, small.data(), small.size()),
            ATOMKIT_OK);
  EXPECT_EQ(atomkit_forge_write_long(forge_, 1), ATOMKIT_ERR_OUT_OF_SPACE);
  EXPECT_EQ(atomkit_forge_push_tuple(forge_), ATOMKIT_ERR_OUT_OF_SPACE);

  ASSERT_EQ(atomkit_forge_reset(forge_, buffer_.data(), buffer_.size()),
            ATOMKIT_OK);
  EXPECT_EQ(atomkit_forge_write_bool(forge_, 2), ATOMKIT_OK);
  EXPECT_EQ(atomkit_forge_write_urid(forge_, 3), ATOMKIT_OK);
  EXPECT_EQ(written(), 32u);
}

TEST_F(CApiTest, TruncatedReads) {
  ASSERT_EQ(atomkit_forge_write_long(forge_, 99), ATOMKIT_OK);

  atomkit_header_t header{};
  EXPECT_EQ(atomkit_read_header(registry_, buffer_.data(), 12, 0, &header),
            ATOMKIT_ERR_TRUNCATED);
  EXPECT_EQ(atomkit_read_header(registry_, nullptr, 0, 0, &header),
            ATOMKIT_ERR_TRUNCATED);
  EXPECT_EQ(atomkit_read_header(registry_, nullptr, 16, 0, &header),
            ATOMKIT_ERR_NULL_PTR);

  size_t count = 0;
  EXPECT_EQ(atomkit_tuple_child_count(registry_, buffer_.data(), 16, 0, &count),
            ATOMKIT_ERR_UNEXPECTED_TYPE);
}
