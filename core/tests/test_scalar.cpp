/**
 * @file test_scalar.cpp
 * @brief Scalar payload encoding: widths, kinds and strict typing.
 */

#include "atomkit/scalar.hpp"
#include <cstring>
#include <gtest/gtest.h>
#include <limits>

using namespace atomkit;

class ScalarTest : public ::testing::Test {
protected:
  HashTypeRegistry registry_;
  AtomTypes types_ = AtomTypes::from_registry(registry_);
};

TEST_F(ScalarTest, Widths) {
  EXPECT_EQ(scalar_width(ScalarKind::Int), 4u);
  EXPECT_EQ(scalar_width(ScalarKind::Long), 8u);
  EXPECT_EQ(scalar_width(ScalarKind::Float), 4u);
  EXPECT_EQ(scalar_width(ScalarKind::Double), 8u);
  EXPECT_EQ(scalar_width(ScalarKind::Bool), 4u);
  EXPECT_EQ(scalar_width(ScalarKind::Urid), 4u);
}

TEST_F(ScalarTest, KindLookup) {
  EXPECT_EQ(scalar_kind(types_, types_.double_), ScalarKind::Double);
  EXPECT_EQ(scalar_kind(types_, types_.urid), ScalarKind::Urid);
  EXPECT_FALSE(scalar_kind(types_, types_.tuple).has_value());
  EXPECT_FALSE(scalar_kind(types_, NO_TYPE).has_value());
  EXPECT_EQ(scalar_type(types_, ScalarKind::Long), types_.long_);
}

TEST_F(ScalarTest, IntUsesNativeLayout) {
  auto bytes = encode_scalar(types_, types_.int_, ScalarValue{int32_t{-7}});
  ASSERT_TRUE(bytes.has_value());
  ASSERT_EQ(bytes->size, 4u);
  int32_t raw = 0;
  std::memcpy(&raw, bytes->data.data(), 4);
  EXPECT_EQ(raw, -7);
}

TEST_F(ScalarTest, BoolEncodesAsInt) {
  auto bytes = encode_scalar(types_, types_.bool_, ScalarValue{true});
  ASSERT_TRUE(bytes.has_value());
  int32_t raw = 0;
  std::memcpy(&raw, bytes->data.data(), 4);
  EXPECT_EQ(raw, 1);

  // Any nonzero payload reads back as true.
  int32_t seven = 7;
  auto value = decode_scalar(
      types_, types_.bool_,
      std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(&seven), 4));
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(std::get<bool>(*value), true);
}

TEST_F(ScalarTest, EveryKindRoundTrips) {
  const ScalarValue values[] = {
      ScalarValue{std::numeric_limits<int32_t>::min()},
      ScalarValue{std::numeric_limits<int64_t>::max()},
      ScalarValue{-0.125f},
      ScalarValue{3.141592653589793},
      ScalarValue{false},
      ScalarValue{Urid{42}},
  };
  for (const auto &value : values) {
    TypeId type = scalar_type(types_, kind_of(value));
    auto bytes = encode_scalar(types_, type, value);
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(bytes->size, scalar_width(kind_of(value)));

    auto decoded = decode_scalar(types_, type, bytes->bytes());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, value);
  }
}

TEST_F(ScalarTest, NoNumericCoercion) {
  auto r = encode_scalar(types_, types_.long_, ScalarValue{int32_t{1}});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), AtomError::TypeMismatch);

  r = encode_scalar(types_, types_.int_, ScalarValue{Urid{1}});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), AtomError::TypeMismatch);
}

TEST_F(ScalarTest, NonScalarTypeRejected) {
  auto r = encode_scalar(types_, types_.string, ScalarValue{int32_t{1}});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), AtomError::TypeMismatch);

  uint8_t bytes[8] = {};
  auto d = decode_scalar(types_, types_.tuple, bytes);
  ASSERT_FALSE(d.has_value());
  EXPECT_EQ(d.error(), AtomError::TypeMismatch);
}

TEST_F(ScalarTest, ShortPayloadIsTruncated) {
  uint8_t bytes[4] = {};
  auto d = decode_scalar(types_, types_.double_, bytes);
  ASSERT_FALSE(d.has_value());
  EXPECT_EQ(d.error(), AtomError::TruncatedBuffer);
}
