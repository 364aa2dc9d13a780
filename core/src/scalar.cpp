#include "atomkit/scalar.hpp"

#include <cstring>

namespace atomkit {

namespace {

template <typename T> ScalarBytes pack(T value) noexcept {
  static_assert(sizeof(T) <= 8);
  ScalarBytes out;
  std::memcpy(out.data.data(), &value, sizeof(T));
  out.size = sizeof(T);
  return out;
}

template <typename T> T unpack(std::span<const uint8_t> bytes) noexcept {
  T value;
  std::memcpy(&value, bytes.data(), sizeof(T));
  return value;
}

} // namespace

std::optional<ScalarKind> scalar_kind(const AtomTypes &types,
                                      TypeId type) noexcept {
  if (type == NO_TYPE)
    return std::nullopt;
  if (type == types.int_)
    return ScalarKind::Int;
  if (type == types.long_)
    return ScalarKind::Long;
  if (type == types.float_)
    return ScalarKind::Float;
  if (type == types.double_)
    return ScalarKind::Double;
  if (type == types.bool_)
    return ScalarKind::Bool;
  if (type == types.urid)
    return ScalarKind::Urid;
  return std::nullopt;
}

TypeId scalar_type(const AtomTypes &types, ScalarKind kind) noexcept {
  switch (kind) {
  case ScalarKind::Int:
    return types.int_;
  case ScalarKind::Long:
    return types.long_;
  case ScalarKind::Float:
    return types.float_;
  case ScalarKind::Double:
    return types.double_;
  case ScalarKind::Bool:
    return types.bool_;
  case ScalarKind::Urid:
    return types.urid;
  }
  return NO_TYPE;
}

std::expected<ScalarBytes, AtomError>
encode_scalar(const AtomTypes &types, TypeId type,
              const ScalarValue &value) noexcept {
  auto kind = scalar_kind(types, type);
  if (!kind || *kind != kind_of(value))
    return std::unexpected(AtomError::TypeMismatch);

  switch (*kind) {
  case ScalarKind::Int:
    return pack(std::get<int32_t>(value));
  case ScalarKind::Long:
    return pack(std::get<int64_t>(value));
  case ScalarKind::Float:
    return pack(std::get<float>(value));
  case ScalarKind::Double:
    return pack(std::get<double>(value));
  case ScalarKind::Bool:
    return pack(static_cast<int32_t>(std::get<bool>(value) ? 1 : 0));
  case ScalarKind::Urid:
    return pack(std::get<Urid>(value).id);
  }
  return std::unexpected(AtomError::TypeMismatch);
}

std::expected<ScalarValue, AtomError>
decode_scalar(const AtomTypes &types, TypeId type,
              std::span<const uint8_t> bytes) noexcept {
  auto kind = scalar_kind(types, type);
  if (!kind)
    return std::unexpected(AtomError::TypeMismatch);
  if (bytes.size() < scalar_width(*kind))
    return std::unexpected(AtomError::TruncatedBuffer);

  switch (*kind) {
  case ScalarKind::Int:
    return ScalarValue{unpack<int32_t>(bytes)};
  case ScalarKind::Long:
    return ScalarValue{unpack<int64_t>(bytes)};
  case ScalarKind::Float:
    return ScalarValue{unpack<float>(bytes)};
  case ScalarKind::Double:
    return ScalarValue{unpack<double>(bytes)};
  case ScalarKind::Bool:
    return ScalarValue{unpack<int32_t>(bytes) != 0};
  case ScalarKind::Urid:
    return ScalarValue{Urid{unpack<uint32_t>(bytes)}};
  }
  return std::unexpected(AtomError::TypeMismatch);
}

} // namespace atomkit
