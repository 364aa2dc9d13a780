/**
 * @file atomkit_c_api.cpp
 * @brief C-API implementation: exception-safe FFI boundary.
 *
 * Every extern "C" function validates its pointers, then runs inside
 *   try { ... } catch (const std::bad_alloc&) { ... } catch (...) { ... }
 * so no C++ exception ever reaches the caller. Codec errors arrive as
 * std::expected and are translated by to_error().
 *
 * This file is compiled into the shared library (libatomkit.so).
 */

#include "atomkit/atomkit_c_api.h"
#include "atomkit/core.hpp"
#include "atomkit/forge.hpp"
#include "atomkit/reader.hpp"
#include "atomkit/registry.hpp"

#include <cstring>
#include <exception>
#include <new>
#include <span>
#include <string>

namespace {

struct RegistryHandle {
  atomkit::HashTypeRegistry registry;
  atomkit::AtomTypes types;

  RegistryHandle() : types(atomkit::AtomTypes::from_registry(registry)) {}
};

struct ForgeHandle {
  ForgeHandle(const atomkit::AtomTypes &types, std::span<uint8_t> buffer)
      : forge(types, buffer) {}

  atomkit::Forge forge;
};

// ===========================================================================
// Internal: cast opaque pointers to C++ objects
// ===========================================================================

RegistryHandle *to_registry(atomkit_registry_t *handle) {
  return reinterpret_cast<RegistryHandle *>(handle);
}

const RegistryHandle *to_registry(const atomkit_registry_t *handle) {
  return reinterpret_cast<const RegistryHandle *>(handle);
}

ForgeHandle *to_forge(atomkit_forge_t *handle) {
  return reinterpret_cast<ForgeHandle *>(handle);
}

const ForgeHandle *to_forge(const atomkit_forge_t *handle) {
  return reinterpret_cast<const ForgeHandle *>(handle);
}

atomkit_error_t to_error(atomkit::AtomError error) {
  using atomkit::AtomError;
  switch (error) {
  case AtomError::OutOfSpace:
    return ATOMKIT_ERR_OUT_OF_SPACE;
  case AtomError::FrameUnderflow:
    return ATOMKIT_ERR_FRAME_UNDERFLOW;
  case AtomError::FrameOverflow:
    return ATOMKIT_ERR_FRAME_OVERFLOW;
  case AtomError::FrameMismatch:
    return ATOMKIT_ERR_FRAME_MISMATCH;
  case AtomError::TruncatedBuffer:
    return ATOMKIT_ERR_TRUNCATED;
  case AtomError::UnexpectedType:
    return ATOMKIT_ERR_UNEXPECTED_TYPE;
  case AtomError::MalformedContainer:
    return ATOMKIT_ERR_MALFORMED;
  case AtomError::TypeMismatch:
    return ATOMKIT_ERR_TYPE_MISMATCH;
  }
  return ATOMKIT_ERR_UNKNOWN;
}

template <typename T>
atomkit_error_t status_of(const std::expected<T, atomkit::AtomError> &result) {
  return result ? ATOMKIT_OK : to_error(result.error());
}

/// Runs a forge operation with the shared null check and catch-all.
template <typename Op> atomkit_error_t with_forge(atomkit_forge_t *forge, Op op) {
  if (!forge)
    return ATOMKIT_ERR_NULL_PTR;
  try {
    return status_of(op(to_forge(forge)->forge));
  } catch (...) {
    return ATOMKIT_ERR_UNKNOWN;
  }
}

/// Builds a Reader over the caller's bytes and reads the atom at `offset`.
template <typename Op>
atomkit_error_t with_atom(const atomkit_registry_t *registry,
                          const uint8_t *buffer, size_t length, size_t offset,
                          Op op) {
  if (!registry || (!buffer && length))
    return ATOMKIT_ERR_NULL_PTR;
  try {
    atomkit::Reader reader(to_registry(registry)->types, buffer, length);
    auto atom = reader.read_atom(offset);
    if (!atom)
      return to_error(atom.error());
    return op(reader, *atom);
  } catch (...) {
    return ATOMKIT_ERR_UNKNOWN;
  }
}

/// Copies `text` plus a NUL into a caller buffer.
atomkit_error_t copy_text(std::string_view text, char *out, size_t capacity,
                          size_t *out_length) {
  *out_length = text.size();
  if (!out || capacity <= text.size())
    return ATOMKIT_ERR_BUFFER_TOO_SMALL;
  std::memcpy(out, text.data(), text.size());
  out[text.size()] = '\0';
  return ATOMKIT_OK;
}

} // namespace

extern "C" {

// ===========================================================================
// Version
// ===========================================================================

ATOMKIT_API const char *atomkit_version(void) {
  // version() views a string literal, so data() is NUL-terminated.
  return atomkit::core::version().data();
}

// ===========================================================================
// Registry
// ===========================================================================

ATOMKIT_API atomkit_error_t
atomkit_registry_create(atomkit_registry_t **out_registry) {
  if (!out_registry)
    return ATOMKIT_ERR_NULL_PTR;

  try {
    auto *handle = new RegistryHandle();
    *out_registry = reinterpret_cast<atomkit_registry_t *>(handle);
    return ATOMKIT_OK;
  } catch (const std::bad_alloc &) {
    return ATOMKIT_ERR_OUT_OF_MEMORY;
  } catch (...) {
    return ATOMKIT_ERR_UNKNOWN;
  }
}

ATOMKIT_API atomkit_error_t
atomkit_registry_destroy(atomkit_registry_t *registry) {
  if (!registry)
    return ATOMKIT_OK; // No-op for NULL

  try {
    delete to_registry(registry);
    return ATOMKIT_OK;
  } catch (...) {
    return ATOMKIT_ERR_UNKNOWN;
  }
}

ATOMKIT_API atomkit_error_t atomkit_registry_map(atomkit_registry_t *registry,
                                                 const char *uri,
                                                 uint32_t *out_id) {
  if (!registry || !uri || !out_id)
    return ATOMKIT_ERR_NULL_PTR;

  try {
    atomkit::TypeId id = to_registry(registry)->registry.map(uri);
    if (id == atomkit::NO_TYPE)
      return ATOMKIT_ERR_INVALID_ARG;
    *out_id = id;
    return ATOMKIT_OK;
  } catch (const std::bad_alloc &) {
    return ATOMKIT_ERR_OUT_OF_MEMORY;
  } catch (...) {
    return ATOMKIT_ERR_UNKNOWN;
  }
}

ATOMKIT_API atomkit_error_t atomkit_registry_unmap(
    const atomkit_registry_t *registry, uint32_t id, char *buffer,
    size_t capacity, size_t *out_length) {
  if (!registry || !out_length)
    return ATOMKIT_ERR_NULL_PTR;

  try {
    auto uri = to_registry(registry)->registry.unmap(id);
    if (!uri)
      return ATOMKIT_ERR_NOT_FOUND;
    return copy_text(*uri, buffer, capacity, out_length);
  } catch (const std::bad_alloc &) {
    return ATOMKIT_ERR_OUT_OF_MEMORY;
  } catch (...) {
    return ATOMKIT_ERR_UNKNOWN;
  }
}

// ===========================================================================
// Forge: lifecycle
// ===========================================================================

ATOMKIT_API atomkit_error_t atomkit_forge_create(atomkit_registry_t *registry,
                                                 uint8_t *buffer,
                                                 size_t capacity,
                                                 atomkit_forge_t **out_forge) {
  if (!registry || !out_forge || (!buffer && capacity))
    return ATOMKIT_ERR_NULL_PTR;

  try {
    auto *handle = new ForgeHandle(to_registry(registry)->types,
                                   std::span<uint8_t>(buffer, capacity));
    *out_forge = reinterpret_cast<atomkit_forge_t *>(handle);
    return ATOMKIT_OK;
  } catch (const std::bad_alloc &) {
    return ATOMKIT_ERR_OUT_OF_MEMORY;
  } catch (...) {
    return ATOMKIT_ERR_UNKNOWN;
  }
}

ATOMKIT_API atomkit_error_t atomkit_forge_destroy(atomkit_forge_t *forge) {
  if (!forge)
    return ATOMKIT_OK;

  try {
    delete to_forge(forge);
    return ATOMKIT_OK;
  } catch (...) {
    return ATOMKIT_ERR_UNKNOWN;
  }
}

ATOMKIT_API atomkit_error_t atomkit_forge_reset(atomkit_forge_t *forge,
                                                uint8_t *buffer,
                                                size_t capacity) {
  if (!forge || (!buffer && capacity))
    return ATOMKIT_ERR_NULL_PTR;

  to_forge(forge)->forge.reset(std::span<uint8_t>(buffer, capacity));
  return ATOMKIT_OK;
}

ATOMKIT_API atomkit_error_t atomkit_forge_size(const atomkit_forge_t *forge,
                                               size_t *out_size) {
  if (!forge || !out_size)
    return ATOMKIT_ERR_NULL_PTR;
  *out_size = to_forge(forge)->forge.size();
  return ATOMKIT_OK;
}

ATOMKIT_API atomkit_error_t atomkit_forge_depth(const atomkit_forge_t *forge,
                                                size_t *out_depth) {
  if (!forge || !out_depth)
    return ATOMKIT_ERR_NULL_PTR;
  *out_depth = to_forge(forge)->forge.depth();
  return ATOMKIT_OK;
}

// ===========================================================================
// Forge: values
// ===========================================================================

ATOMKIT_API atomkit_error_t atomkit_forge_write_int(atomkit_forge_t *forge,
                                                    int32_t value) {
  return with_forge(forge, [&](atomkit::Forge &f) { return f.write_int(value); });
}

ATOMKIT_API atomkit_error_t atomkit_forge_write_long(atomkit_forge_t *forge,
                                                     int64_t value) {
  return with_forge(forge,
                    [&](atomkit::Forge &f) { return f.write_long(value); });
}

ATOMKIT_API atomkit_error_t atomkit_forge_write_float(atomkit_forge_t *forge,
                                                      float value) {
  return with_forge(forge,
                    [&](atomkit::Forge &f) { return f.write_float(value); });
}

ATOMKIT_API atomkit_error_t atomkit_forge_write_double(atomkit_forge_t *forge,
                                                       double value) {
  return with_forge(forge,
                    [&](atomkit::Forge &f) { return f.write_double(value); });
}

ATOMKIT_API atomkit_error_t atomkit_forge_write_bool(atomkit_forge_t *forge,
                                                     int value) {
  return with_forge(
      forge, [&](atomkit::Forge &f) { return f.write_bool(value != 0); });
}

ATOMKIT_API atomkit_error_t atomkit_forge_write_urid(atomkit_forge_t *forge,
                                                     uint32_t value) {
  return with_forge(forge,
                    [&](atomkit::Forge &f) { return f.write_urid(value); });
}

ATOMKIT_API atomkit_error_t atomkit_forge_write_string(atomkit_forge_t *forge,
                                                       const char *text) {
  if (!text)
    return ATOMKIT_ERR_NULL_PTR;
  return with_forge(forge,
                    [&](atomkit::Forge &f) { return f.write_string(text); });
}

// ===========================================================================
// Forge: containers
// ===========================================================================

ATOMKIT_API atomkit_error_t atomkit_forge_push_tuple(atomkit_forge_t *forge) {
  return with_forge(forge, [](atomkit::Forge &f) { return f.push_tuple(); });
}

ATOMKIT_API atomkit_error_t atomkit_forge_push_object(atomkit_forge_t *forge,
                                                      uint32_t id,
                                                      uint32_t otype) {
  return with_forge(
      forge, [&](atomkit::Forge &f) { return f.push_object(id, otype); });
}

ATOMKIT_API atomkit_error_t atomkit_forge_push_vector(atomkit_forge_t *forge,
                                                      uint32_t child_type,
                                                      uint32_t child_size) {
  return with_forge(forge, [&](atomkit::Forge &f) {
    return f.push_vector(child_type, child_size);
  });
}

ATOMKIT_API atomkit_error_t
atomkit_forge_push_sequence(atomkit_forge_t *forge, atomkit_time_unit_t unit) {
  if (unit != ATOMKIT_UNIT_FRAMES && unit != ATOMKIT_UNIT_BEATS)
    return ATOMKIT_ERR_INVALID_ARG;
  return with_forge(forge, [&](atomkit::Forge &f) {
    return f.push_sequence(unit == ATOMKIT_UNIT_BEATS
                               ? atomkit::TimeUnit::Beats
                               : atomkit::TimeUnit::Frames);
  });
}

ATOMKIT_API atomkit_error_t atomkit_forge_write_property(atomkit_forge_t *forge,
                                                         uint32_t key,
                                                         uint32_t context) {
  return with_forge(
      forge, [&](atomkit::Forge &f) { return f.write_property(key, context); });
}

ATOMKIT_API atomkit_error_t
atomkit_forge_write_frame_time(atomkit_forge_t *forge, int64_t frames) {
  return with_forge(forge, [&](atomkit::Forge &f) {
    return f.write_timestamp(atomkit::Timestamp::from_frames(frames));
  });
}

ATOMKIT_API atomkit_error_t
atomkit_forge_write_beat_time(atomkit_forge_t *forge, double beats) {
  return with_forge(forge, [&](atomkit::Forge &f) {
    return f.write_timestamp(atomkit::Timestamp::from_beats(beats));
  });
}

ATOMKIT_API atomkit_error_t
atomkit_forge_write_vector_element(atomkit_forge_t *forge, const void *data,
                                   size_t size) {
  if (!data && size)
    return ATOMKIT_ERR_NULL_PTR;
  return with_forge(forge, [&](atomkit::Forge &f) {
    return f.write_vector_element(
        std::span<const uint8_t>(static_cast<const uint8_t *>(data), size));
  });
}

ATOMKIT_API atomkit_error_t atomkit_forge_pop(atomkit_forge_t *forge) {
  return with_forge(forge, [](atomkit::Forge &f) { return f.pop_frame(); });
}

// ===========================================================================
// Reader
// ===========================================================================

ATOMKIT_API atomkit_error_t
atomkit_read_header(const atomkit_registry_t *registry, const uint8_t *buffer,
                    size_t length, size_t offset, atomkit_header_t *out_header) {
  if (!out_header)
    return ATOMKIT_ERR_NULL_PTR;
  return with_atom(registry, buffer, length, offset,
                   [&](const atomkit::Reader &, const atomkit::AtomView &atom) {
                     out_header->type = atom.type;
                     out_header->body_size = atom.body_size;
                     out_header->next_offset = atom.next_offset;
                     return ATOMKIT_OK;
                   });
}

ATOMKIT_API atomkit_error_t atomkit_read_int(const atomkit_registry_t *registry,
                                             const uint8_t *buffer,
                                             size_t length, size_t offset,
                                             int32_t *out_value) {
  if (!out_value)
    return ATOMKIT_ERR_NULL_PTR;
  return with_atom(registry, buffer, length, offset,
                   [&](const atomkit::Reader &reader,
                       const atomkit::AtomView &atom) {
                     auto value = reader.read_int(atom);
                     if (value)
                       *out_value = *value;
                     return status_of(value);
                   });
}

ATOMKIT_API atomkit_error_t
atomkit_read_long(const atomkit_registry_t *registry, const uint8_t *buffer,
                  size_t length, size_t offset, int64_t *out_value) {
  if (!out_value)
    return ATOMKIT_ERR_NULL_PTR;
  return with_atom(registry, buffer, length, offset,
                   [&](const atomkit::Reader &reader,
                       const atomkit::AtomView &atom) {
                     auto value = reader.read_long(atom);
                     if (value)
                       *out_value = *value;
                     return status_of(value);
                   });
}

ATOMKIT_API atomkit_error_t
atomkit_read_float(const atomkit_registry_t *registry, const uint8_t *buffer,
                   size_t length, size_t offset, float *out_value) {
  if (!out_value)
    return ATOMKIT_ERR_NULL_PTR;
  return with_atom(registry, buffer, length, offset,
                   [&](const atomkit::Reader &reader,
                       const atomkit::AtomView &atom) {
                     auto value = reader.read_float(atom);
                     if (value)
                       *out_value = *value;
                     return status_of(value);
                   });
}

ATOMKIT_API atomkit_error_t
atomkit_read_double(const atomkit_registry_t *registry, const uint8_t *buffer,
                    size_t length, size_t offset, double *out_value) {
  if (!out_value)
    return ATOMKIT_ERR_NULL_PTR;
  return with_atom(registry, buffer, length, offset,
                   [&](const atomkit::Reader &reader,
                       const atomkit::AtomView &atom) {
                     auto value = reader.read_double(atom);
                     if (value)
                       *out_value = *value;
                     return status_of(value);
                   });
}

ATOMKIT_API atomkit_error_t
atomkit_read_string(const atomkit_registry_t *registry, const uint8_t *buffer,
                    size_t length, size_t offset, char *out, size_t capacity,
                    size_t *out_length) {
  if (!out_length)
    return ATOMKIT_ERR_NULL_PTR;
  return with_atom(registry, buffer, length, offset,
                   [&](const atomkit::Reader &reader,
                       const atomkit::AtomView &atom) {
                     auto text = reader.read_string(atom);
                     if (!text)
                       return to_error(text.error());
                     return copy_text(*text, out, capacity, out_length);
                   });
}

ATOMKIT_API atomkit_error_t
atomkit_tuple_child_count(const atomkit_registry_t *registry,
                          const uint8_t *buffer, size_t length, size_t offset,
                          size_t *out_count) {
  if (!out_count)
    return ATOMKIT_ERR_NULL_PTR;
  return with_atom(registry, buffer, length, offset,
                   [&](const atomkit::Reader &reader,
                       const atomkit::AtomView &atom) {
                     auto tuple = reader.iterate_tuple(atom);
                     if (!tuple)
                       return to_error(tuple.error());
                     size_t count = 0;
                     for (const auto &child : *tuple) {
                       if (!child)
                         return to_error(child.error());
                       ++count;
                     }
                     *out_count = count;
                     return ATOMKIT_OK;
                   });
}

} // extern "C"
