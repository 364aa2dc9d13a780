#include "atomkit/registry.hpp"

#include <mutex>

namespace atomkit {

TypeId HashTypeRegistry::map(std::string_view uri) {
  if (uri.empty())
    return NO_TYPE;

  {
    std::shared_lock lock(mutex_);
    auto it = ids_.find(uri);
    if (it != ids_.end())
      return it->second;
  }

  std::unique_lock lock(mutex_);
  // Another thread may have inserted between the two locks.
  auto it = ids_.find(uri);
  if (it != ids_.end())
    return it->second;

  uris_.emplace_back(uri);
  const auto id = static_cast<TypeId>(uris_.size());
  ids_.emplace(std::string(uri), id);
  return id;
}

std::optional<std::string> HashTypeRegistry::unmap(TypeId id) const {
  std::shared_lock lock(mutex_);
  if (id == NO_TYPE || id > uris_.size())
    return std::nullopt;
  return uris_[id - 1];
}

size_t HashTypeRegistry::size() const {
  std::shared_lock lock(mutex_);
  return uris_.size();
}

AtomTypes AtomTypes::from_registry(TypeRegistry &registry) {
  AtomTypes types;
  types.int_ = registry.map(uris::INT);
  types.long_ = registry.map(uris::LONG);
  types.float_ = registry.map(uris::FLOAT);
  types.double_ = registry.map(uris::DOUBLE);
  types.bool_ = registry.map(uris::BOOL);
  types.urid = registry.map(uris::URID);

  types.string = registry.map(uris::STRING);
  types.path = registry.map(uris::PATH);
  types.uri = registry.map(uris::URI);
  types.literal = registry.map(uris::LITERAL);
  types.chunk = registry.map(uris::CHUNK);

  types.vector = registry.map(uris::VECTOR);
  types.tuple = registry.map(uris::TUPLE);
  types.object = registry.map(uris::OBJECT);
  types.blank = registry.map(uris::BLANK);
  types.property = registry.map(uris::PROPERTY);
  types.sequence = registry.map(uris::SEQUENCE);

  types.frame = registry.map(uris::UNIT_FRAME);
  types.beat = registry.map(uris::UNIT_BEAT);
  return types;
}

bool AtomTypes::is_container(TypeId type) const noexcept {
  if (type == NO_TYPE)
    return false;
  return type == vector || type == tuple || type == object ||
         type == blank || type == property || type == sequence;
}

} // namespace atomkit
