#pragma once

#include "atomkit/hash.hpp"
#include "atomkit/schema.hpp"
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace atomkit {

/**
 * @brief URI ↔ TypeId capability consumed by the codec.
 *
 * Contract:
 *   - map() is idempotent: the same URI always yields the same id from the
 *     same instance, and distinct URIs never share a nonzero id.
 *   - map() returns NO_TYPE only for a malformed (empty) URI.
 *   - unmap() returns std::nullopt for ids it never handed out.
 *
 * Implementations may allocate and lock; a registry is consulted while a
 * component is being set up, never from inside the real-time callback.
 */
class TypeRegistry {
public:
  virtual ~TypeRegistry() = default;

  virtual TypeId map(std::string_view uri) = 0;
  virtual std::optional<std::string> unmap(TypeId id) const = 0;
};

/**
 * @brief In-process registry handing out dense ids 1, 2, 3, ...
 *
 * Thread safety: concurrent unmap() and lookups of known URIs take a shared
 * lock; the first map() of a new URI takes the exclusive lock.
 */
class HashTypeRegistry final : public TypeRegistry {
public:
  HashTypeRegistry() = default;

  // Non-copyable (owns a mutex)
  HashTypeRegistry(const HashTypeRegistry &) = delete;
  HashTypeRegistry &operator=(const HashTypeRegistry &) = delete;

  TypeId map(std::string_view uri) override;
  std::optional<std::string> unmap(TypeId id) const override;

  /// Number of URIs mapped so far.
  size_t size() const;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, TypeId, hash::UriHash, std::equal_to<>>
      ids_;
  /// uris_[id - 1] is the URI for id.
  std::vector<std::string> uris_;
};

/**
 * @brief Resolved ids for every atom type the codec understands.
 *
 * Populate once with from_registry() when the component is instantiated;
 * afterwards it is a plain value that the Forge and Reader copy freely.
 */
struct AtomTypes {
  // Scalars
  TypeId int_ = NO_TYPE;
  TypeId long_ = NO_TYPE;
  TypeId float_ = NO_TYPE;
  TypeId double_ = NO_TYPE;
  TypeId bool_ = NO_TYPE;
  TypeId urid = NO_TYPE;

  // Byte strings
  TypeId string = NO_TYPE;
  TypeId path = NO_TYPE;
  TypeId uri = NO_TYPE;
  TypeId literal = NO_TYPE;
  TypeId chunk = NO_TYPE;

  // Containers
  TypeId vector = NO_TYPE;
  TypeId tuple = NO_TYPE;
  TypeId object = NO_TYPE;
  TypeId blank = NO_TYPE;
  TypeId property = NO_TYPE;
  TypeId sequence = NO_TYPE;

  // Sequence time units
  TypeId frame = NO_TYPE;
  TypeId beat = NO_TYPE;

  static AtomTypes from_registry(TypeRegistry &registry);

  /// True for Vector, Tuple, Object, Blank, Property and Sequence.
  bool is_container(TypeId type) const noexcept;

  /// True for Object and its legacy alias Blank.
  bool is_object(TypeId type) const noexcept {
    return type != NO_TYPE && (type == object || type == blank);
  }
};

} // namespace atomkit
