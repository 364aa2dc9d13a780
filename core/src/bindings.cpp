#include "atomkit/core.hpp"
#include "atomkit/forge.hpp"
#include "atomkit/reader.hpp"
#include "atomkit/registry.hpp"
#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace {

/// Python-facing forge: owns its byte buffer so callers never see a raw
/// pointer. The buffer is sized once; it never reallocates under the Forge.
class PyForge {
public:
  PyForge(atomkit::TypeRegistry &registry, size_t capacity)
      : storage_(capacity),
        forge_(atomkit::AtomTypes::from_registry(registry),
               std::span<uint8_t>(storage_)) {}

  atomkit::Forge &forge() { return forge_; }
  const atomkit::Forge &forge() const { return forge_; }

  void reset() { forge_.reset(std::span<uint8_t>(storage_)); }

private:
  std::vector<uint8_t> storage_;
  atomkit::Forge forge_;
};

template <typename T> T check(std::expected<T, atomkit::AtomError> result) {
  if (!result)
    throw std::runtime_error(std::string(atomkit::to_string(result.error())));
  return std::move(*result);
}

inline void check(std::expected<void, atomkit::AtomError> result) {
  if (!result)
    throw std::runtime_error(std::string(atomkit::to_string(result.error())));
}

/// Python nesting guard; hostile buffers can nest one level per 8 bytes.
constexpr size_t MAX_DECODE_DEPTH = 64;

nb::object to_python(const atomkit::Reader &reader,
                     const atomkit::TypeRegistry &registry,
                     const atomkit::AtomView &atom, size_t depth);

nb::object scalar_to_python(const atomkit::ScalarValue &value) {
  return std::visit(
      [](const auto &v) -> nb::object {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>)
          return nb::bool_(v);
        else if constexpr (std::is_same_v<T, atomkit::Urid>)
          return nb::int_(v.id);
        else if constexpr (std::is_floating_point_v<T>)
          return nb::float_(static_cast<double>(v));
        else
          return nb::int_(v);
      },
      value);
}

/// Object keys become URIs where the registry knows them.
nb::object key_to_python(const atomkit::TypeRegistry &registry,
                         atomkit::TypeId key) {
  if (auto uri = registry.unmap(key))
    return nb::str(uri->c_str(), uri->size());
  return nb::int_(key);
}

nb::object to_python(const atomkit::Reader &reader,
                     const atomkit::TypeRegistry &registry,
                     const atomkit::AtomView &atom, size_t depth) {
  if (depth > MAX_DECODE_DEPTH)
    throw std::invalid_argument("Atom nesting too deep");

  const auto &types = reader.types();

  if (atomkit::scalar_kind(types, atom.type))
    return scalar_to_python(check(reader.read_scalar(atom)));

  if (atom.type == types.string || atom.type == types.path ||
      atom.type == types.uri) {
    auto text = check(atom.type == types.string ? reader.read_string(atom)
                      : atom.type == types.path ? reader.read_path(atom)
                                                : reader.read_uri(atom));
    return nb::str(text.data(), text.size());
  }

  if (atom.type == types.literal) {
    auto literal = check(reader.read_literal(atom));
    return nb::str(literal.text.data(), literal.text.size());
  }

  if (atom.type == types.vector) {
    auto vector = check(reader.iterate_vector(atom));
    nb::list out;
    for (auto element : vector) {
      auto value = atomkit::decode_scalar(types, vector.child_type(), element);
      if (value)
        out.append(scalar_to_python(*value));
      else
        out.append(nb::bytes(reinterpret_cast<const char *>(element.data()),
                             element.size()));
    }
    return out;
  }

  if (atom.type == types.tuple) {
    nb::list out;
    for (const auto &child : check(reader.iterate_tuple(atom)))
      out.append(to_python(reader, registry, check(child), depth + 1));
    return out;
  }

  if (types.is_object(atom.type)) {
    nb::dict out;
    for (const auto &property : check(reader.iterate_object(atom))) {
      auto p = check(property);
      out[key_to_python(registry, p.key)] =
          to_python(reader, registry, p.value, depth + 1);
    }
    return out;
  }

  if (atom.type == types.sequence) {
    auto sequence = check(reader.iterate_sequence(atom));
    nb::list out;
    for (const auto &event : sequence) {
      auto e = check(event);
      nb::object stamp = sequence.unit() == atomkit::TimeUnit::Beats
                             ? nb::object(nb::float_(e.stamp.beats()))
                             : nb::object(nb::int_(e.stamp.frames()));
      out.append(
          nb::make_tuple(stamp, to_python(reader, registry, e.value, depth + 1)));
    }
    return out;
  }

  // Chunks and unknown types surface as raw body bytes.
  return nb::bytes(reinterpret_cast<const char *>(atom.body.data()),
                   atom.body.size());
}

} // namespace

NB_MODULE(atomkit, m) {
  m.doc() = "atomkit: typed binary atom codec";

  // --- Core Utils ---
  m.def("version", &atomkit::core::version, "Get the library version");

  nb::class_<atomkit::core::BuildInfo>(m, "BuildInfo")
      .def_ro("compiler", &atomkit::core::BuildInfo::compiler)
      .def_ro("architecture", &atomkit::core::BuildInfo::architecture)
      .def_ro("byte_order", &atomkit::core::BuildInfo::byte_order)
      .def_ro("standard", &atomkit::core::BuildInfo::standard)
      .def_prop_ro("repr", [](const atomkit::core::BuildInfo &b) {
        return "<BuildInfo arch='" + b.architecture + "' order='" +
               b.byte_order + "' compiler='" + b.compiler + "'>";
      });

  m.def("get_build_info", &atomkit::core::get_build_info,
        "Get build environment details");

  // --- Registry ---

  nb::class_<atomkit::TypeRegistry>(m, "TypeRegistryBase");

  nb::class_<atomkit::HashTypeRegistry, atomkit::TypeRegistry>(m,
                                                               "TypeRegistry")
      .def(nb::init<>())
      .def(
          "map",
          [](atomkit::HashTypeRegistry &self, std::string_view uri) {
            if (uri.empty())
              throw std::invalid_argument("URI must not be empty");
            return self.map(uri);
          },
          "uri"_a, "Id for a URI, assigned on first use")
      .def("unmap", &atomkit::HashTypeRegistry::unmap, "id"_a,
           "URI of an id, or None")
      .def("__len__", &atomkit::HashTypeRegistry::size);

  // --- Forge ---

  nb::class_<PyForge>(m, "Forge")
      .def(nb::init<atomkit::TypeRegistry &, size_t>(), "registry"_a,
           "capacity"_a = 4096)
      .def("reset", &PyForge::reset, "Discard everything written")
      .def("bytes",
           [](const PyForge &self) {
             auto data = self.forge().data();
             return nb::bytes(reinterpret_cast<const char *>(data.data()),
                              data.size());
           })
      .def_prop_ro("size", [](const PyForge &self) { return self.forge().size(); })
      .def_prop_ro("depth",
                   [](const PyForge &self) { return self.forge().depth(); })

      .def("write_int",
           [](PyForge &self, int32_t v) { check(self.forge().write_int(v)); })
      .def("write_long",
           [](PyForge &self, int64_t v) { check(self.forge().write_long(v)); })
      .def("write_float",
           [](PyForge &self, float v) { check(self.forge().write_float(v)); })
      .def("write_double",
           [](PyForge &self, double v) { check(self.forge().write_double(v)); })
      .def("write_bool",
           [](PyForge &self, bool v) { check(self.forge().write_bool(v)); })
      .def("write_urid",
           [](PyForge &self, uint32_t v) { check(self.forge().write_urid(v)); })
      .def("write_string",
           [](PyForge &self, std::string_view text) {
             check(self.forge().write_string(text));
           })
      .def("write_path",
           [](PyForge &self, std::string_view path) {
             check(self.forge().write_path(path));
           })
      .def("write_uri",
           [](PyForge &self, std::string_view uri) {
             check(self.forge().write_uri(uri));
           })
      .def("write_chunk",
           [](PyForge &self, nb::bytes data) {
             check(self.forge().write_chunk(std::span<const uint8_t>(
                 reinterpret_cast<const uint8_t *>(data.c_str()),
                 data.size())));
           })

      .def("push_tuple",
           [](PyForge &self) { check(self.forge().push_tuple()); })
      .def(
          "push_object",
          [](PyForge &self, uint32_t id, uint32_t otype) {
            check(self.forge().push_object(id, otype));
          },
          "id"_a = 0, "otype"_a = 0)
      .def(
          "push_vector",
          [](PyForge &self, uint32_t child_type, uint32_t child_size) {
            check(self.forge().push_vector(child_type, child_size));
          },
          "child_type"_a = 0, "child_size"_a = 0)
      .def(
          "push_sequence",
          [](PyForge &self, bool beats) {
            check(self.forge().push_sequence(
                beats ? atomkit::TimeUnit::Beats : atomkit::TimeUnit::Frames));
          },
          "beats"_a = false)
      .def(
          "write_property",
          [](PyForge &self, uint32_t key, uint32_t context) {
            check(self.forge().write_property(key, context));
          },
          "key"_a, "context"_a = 0)
      .def("write_frame_time",
           [](PyForge &self, int64_t frames) {
             check(self.forge().write_timestamp(
                 atomkit::Timestamp::from_frames(frames)));
           })
      .def("write_beat_time",
           [](PyForge &self, double beats) {
             check(self.forge().write_timestamp(
                 atomkit::Timestamp::from_beats(beats)));
           })
      .def("pop", [](PyForge &self) { check(self.forge().pop_frame()); });

  // --- Reader ---

  m.def(
      "decode",
      [](atomkit::TypeRegistry &registry, nb::bytes data, size_t offset) {
        atomkit::Reader reader(atomkit::AtomTypes::from_registry(registry),
                               data.c_str(), data.size());
        auto atom = check(reader.read_atom(offset));
        return to_python(reader, registry, atom, 0);
      },
      "registry"_a, "data"_a, "offset"_a = 0,
      "Decode the atom at `offset` into Python values");
}
