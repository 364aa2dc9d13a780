#pragma once

#include "atomkit/error.hpp"
#include "atomkit/registry.hpp"
#include "atomkit/schema.hpp"
#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <variant>

namespace atomkit {

/// Closed set of fixed-width primitive kinds.
/// Order matches the alternatives of ScalarValue.
enum class ScalarKind : uint8_t {
  Int,    // int32_t
  Long,   // int64_t
  Float,  // float
  Double, // double
  Bool,   // int32_t 0/1 on the wire
  Urid,   // uint32_t registry id
};

/// A URID carried as a value (distinct from int32 so the two never coerce).
struct Urid {
  TypeId id = NO_TYPE;
  bool operator==(const Urid &) const = default;
};

using ScalarValue = std::variant<int32_t, int64_t, float, double, bool, Urid>;

inline ScalarKind kind_of(const ScalarValue &value) noexcept {
  return static_cast<ScalarKind>(value.index());
}

/// Wire width of a scalar kind: 4 or 8 bytes.
constexpr uint32_t scalar_width(ScalarKind kind) noexcept {
  switch (kind) {
  case ScalarKind::Long:
  case ScalarKind::Double:
    return 8;
  case ScalarKind::Int:
  case ScalarKind::Float:
  case ScalarKind::Bool:
  case ScalarKind::Urid:
    return 4;
  }
  return 0;
}

/// Encoded scalar payload; only the first `size` bytes are meaningful.
struct ScalarBytes {
  std::array<uint8_t, 8> data{};
  uint32_t size = 0;

  std::span<const uint8_t> bytes() const noexcept {
    return {data.data(), size};
  }
};

/// Kind of `type`, or std::nullopt if it is not a scalar type id.
std::optional<ScalarKind> scalar_kind(const AtomTypes &types,
                                      TypeId type) noexcept;

/// Registry id used for values of `kind`.
TypeId scalar_type(const AtomTypes &types, ScalarKind kind) noexcept;

/**
 * @brief Encode a scalar payload (no header, no padding).
 *
 * Fails with TypeMismatch if `type` is not a scalar id, or if the value's
 * kind differs from the kind `type` denotes. No numeric coercion.
 */
std::expected<ScalarBytes, AtomError>
encode_scalar(const AtomTypes &types, TypeId type,
              const ScalarValue &value) noexcept;

/**
 * @brief Decode a scalar payload.
 *
 * Fails with TypeMismatch if `type` is not a scalar id, TruncatedBuffer if
 * `bytes` is shorter than the kind's width. Extra trailing bytes are
 * ignored.
 */
std::expected<ScalarValue, AtomError>
decode_scalar(const AtomTypes &types, TypeId type,
              std::span<const uint8_t> bytes) noexcept;

} // namespace atomkit
