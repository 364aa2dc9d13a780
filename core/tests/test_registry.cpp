/**
 * @file test_registry.cpp
 * @brief HashTypeRegistry contract and AtomTypes resolution.
 */

#include "atomkit/registry.hpp"
#include <atomic>
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace atomkit;

TEST(RegistryTest, MapIsIdempotent) {
  HashTypeRegistry registry;
  TypeId a = registry.map("urn:test:a");
  EXPECT_NE(a, NO_TYPE);
  EXPECT_EQ(registry.map("urn:test:a"), a);
  EXPECT_EQ(registry.size(), 1u);
}

TEST(RegistryTest, DistinctUrisGetDistinctIds) {
  HashTypeRegistry registry;
  TypeId a = registry.map("urn:test:a");
  TypeId b = registry.map("urn:test:b");
  EXPECT_NE(a, b);
  EXPECT_EQ(a, 1u);
  EXPECT_EQ(b, 2u);
}

TEST(RegistryTest, EmptyUriMapsToNone) {
  HashTypeRegistry registry;
  EXPECT_EQ(registry.map(""), NO_TYPE);
  EXPECT_EQ(registry.size(), 0u);
}

TEST(RegistryTest, UnmapRoundTrip) {
  HashTypeRegistry registry;
  TypeId id = registry.map("http://example.org/gain");
  auto uri = registry.unmap(id);
  ASSERT_TRUE(uri.has_value());
  EXPECT_EQ(*uri, "http://example.org/gain");
}

TEST(RegistryTest, UnmapUnknownId) {
  HashTypeRegistry registry;
  registry.map("urn:test:a");
  EXPECT_FALSE(registry.unmap(NO_TYPE).has_value());
  EXPECT_FALSE(registry.unmap(2).has_value());
  EXPECT_FALSE(registry.unmap(0xFFFFFFFFu).has_value());
}

TEST(RegistryTest, ConcurrentMapAgrees) {
  HashTypeRegistry registry;
  constexpr int THREADS = 8;
  constexpr int URIS = 200;

  std::vector<std::vector<TypeId>> seen(THREADS);
  std::vector<std::thread> workers;
  for (int t = 0; t < THREADS; ++t) {
    workers.emplace_back([&, t] {
      for (int i = 0; i < URIS; ++i)
        seen[t].push_back(registry.map("urn:test:" + std::to_string(i)));
    });
  }
  for (auto &w : workers)
    w.join();

  EXPECT_EQ(registry.size(), static_cast<size_t>(URIS));
  for (int t = 1; t < THREADS; ++t)
    EXPECT_EQ(seen[t], seen[0]);

  std::set<TypeId> unique(seen[0].begin(), seen[0].end());
  EXPECT_EQ(unique.size(), static_cast<size_t>(URIS));
}

// ===========================================================================
// AtomTypes
// ===========================================================================

TEST(AtomTypesTest, AllStandardTypesResolved) {
  HashTypeRegistry registry;
  auto types = AtomTypes::from_registry(registry);

  std::set<TypeId> ids{types.int_,   types.long_,    types.float_,
                       types.double_, types.bool_,   types.urid,
                       types.string, types.path,     types.uri,
                       types.literal, types.chunk,   types.vector,
                       types.tuple,  types.object,   types.blank,
                       types.property, types.sequence, types.frame,
                       types.beat};
  EXPECT_EQ(ids.size(), 19u);
  EXPECT_EQ(ids.count(NO_TYPE), 0u);
  EXPECT_EQ(registry.unmap(types.int_), std::string(uris::INT));
}

TEST(AtomTypesTest, ResolutionIsStable) {
  HashTypeRegistry registry;
  auto first = AtomTypes::from_registry(registry);
  auto second = AtomTypes::from_registry(registry);
  EXPECT_EQ(first.sequence, second.sequence);
  EXPECT_EQ(first.beat, second.beat);
  EXPECT_EQ(registry.size(), 19u);
}

TEST(AtomTypesTest, Classification) {
  HashTypeRegistry registry;
  auto types = AtomTypes::from_registry(registry);

  EXPECT_TRUE(types.is_container(types.tuple));
  EXPECT_TRUE(types.is_container(types.vector));
  EXPECT_TRUE(types.is_container(types.sequence));
  EXPECT_TRUE(types.is_container(types.blank));
  EXPECT_FALSE(types.is_container(types.int_));
  EXPECT_FALSE(types.is_container(types.string));
  EXPECT_FALSE(types.is_container(NO_TYPE));

  EXPECT_TRUE(types.is_object(types.object));
  EXPECT_TRUE(types.is_object(types.blank));
  EXPECT_FALSE(types.is_object(types.tuple));
  EXPECT_FALSE(types.is_object(NO_TYPE));
}
