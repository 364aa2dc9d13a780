#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace atomkit {

// ═══════════════════════════════════════════════════════════════════════════
// Type Identifiers
// ═══════════════════════════════════════════════════════════════════════════

/// Opaque 32-bit identifier handed out by a TypeRegistry.
/// Only equality is meaningful; ids carry no ordering.
using TypeId = uint32_t;

/// Reserved id meaning "absent / none".
inline constexpr TypeId NO_TYPE = 0;

// ═══════════════════════════════════════════════════════════════════════════
// Compile-Time Constants (Defaults & Limits)
// ═══════════════════════════════════════════════════════════════════════════

/// Every atom header starts at a multiple of this many bytes.
inline constexpr size_t ATOM_ALIGNMENT = 8;

/// Maximum number of simultaneously open container frames in a Forge.
/// The frame stack is a fixed array member, so this bounds the Forge size.
inline constexpr size_t MAX_FRAME_DEPTH = 16;

// ═══════════════════════════════════════════════════════════════════════════
// Standard URIs: mapped once through the registry into AtomTypes
// ═══════════════════════════════════════════════════════════════════════════

namespace uris {

#define ATOMKIT_ATOM_PREFIX "http://lv2plug.in/ns/ext/atom#"

inline constexpr const char *BLANK = ATOMKIT_ATOM_PREFIX "Blank";
inline constexpr const char *BOOL = ATOMKIT_ATOM_PREFIX "Bool";
inline constexpr const char *CHUNK = ATOMKIT_ATOM_PREFIX "Chunk";
inline constexpr const char *DOUBLE = ATOMKIT_ATOM_PREFIX "Double";
inline constexpr const char *FLOAT = ATOMKIT_ATOM_PREFIX "Float";
inline constexpr const char *INT = ATOMKIT_ATOM_PREFIX "Int";
inline constexpr const char *LITERAL = ATOMKIT_ATOM_PREFIX "Literal";
inline constexpr const char *LONG = ATOMKIT_ATOM_PREFIX "Long";
inline constexpr const char *OBJECT = ATOMKIT_ATOM_PREFIX "Object";
inline constexpr const char *PATH = ATOMKIT_ATOM_PREFIX "Path";
inline constexpr const char *PROPERTY = ATOMKIT_ATOM_PREFIX "Property";
inline constexpr const char *SEQUENCE = ATOMKIT_ATOM_PREFIX "Sequence";
inline constexpr const char *STRING = ATOMKIT_ATOM_PREFIX "String";
inline constexpr const char *TUPLE = ATOMKIT_ATOM_PREFIX "Tuple";
inline constexpr const char *URI = ATOMKIT_ATOM_PREFIX "URI";
inline constexpr const char *URID = ATOMKIT_ATOM_PREFIX "URID";
inline constexpr const char *VECTOR = ATOMKIT_ATOM_PREFIX "Vector";

#undef ATOMKIT_ATOM_PREFIX

/// Sequence time units.
inline constexpr const char *UNIT_FRAME = "http://lv2plug.in/ns/ext/units#frame";
inline constexpr const char *UNIT_BEAT = "http://lv2plug.in/ns/ext/units#beat";

} // namespace uris

// ═══════════════════════════════════════════════════════════════════════════
// AtomHeader: 8-byte prefix of every atom
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Self-description prefixed to every atom in a buffer.
 *
 * Layout in the byte stream:
 *
 *   [type: 4][body_size: 4][body: body_size bytes][padding → 8]
 *
 * body_size counts the payload only: never the header, never the trailing
 * padding. Byte order is the host's native order.
 */
struct AtomHeader {
  TypeId type;        // 0x00: Registry id of the atom's type
  uint32_t body_size; // 0x04: Exact payload length in bytes
};

static_assert(sizeof(AtomHeader) == 8, "AtomHeader must be exactly 8 bytes");
static_assert(std::is_standard_layout_v<AtomHeader>);
static_assert(std::is_trivially_copyable_v<AtomHeader>);

// ═══════════════════════════════════════════════════════════════════════════
// Container Body Prefixes
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Leading 8 bytes of a Vector body.
 *
 * Followed by `count` elements of exactly child_size bytes each, with no
 * per-element header or padding:
 *   body_size = sizeof(VectorBody) + child_size * count
 */
struct VectorBody {
  TypeId child_type;   // 0x00: Type of every element
  uint32_t child_size; // 0x04: Byte width of every element
};
static_assert(sizeof(VectorBody) == 8, "VectorBody must be 8 bytes");

/**
 * @brief Leading 8 bytes of an Object body.
 *
 * Followed by zero or more properties: PropertyBody + one padded atom.
 */
struct ObjectBody {
  TypeId id;    // 0x00: Instance id (NO_TYPE if anonymous)
  TypeId otype; // 0x04: Class of the object (NO_TYPE if untyped)
};
static_assert(sizeof(ObjectBody) == 8, "ObjectBody must be 8 bytes");

/// Key half of an object property record. The value atom follows directly.
struct PropertyBody {
  TypeId key;     // 0x00: Property key, never NO_TYPE in well-formed data
  TypeId context; // 0x04: Optional context (NO_TYPE if none)
};
static_assert(sizeof(PropertyBody) == 8, "PropertyBody must be 8 bytes");

/**
 * @brief Leading 8 bytes of a Sequence body.
 *
 * Followed by events: EventStamp (8 bytes) + one padded atom.
 * unit selects how every stamp in the sequence is interpreted.
 */
struct SequenceBody {
  TypeId unit;  // 0x00: Frame or beat unit id (NO_TYPE reads as frames)
  uint32_t pad; // 0x04: Zero
};
static_assert(sizeof(SequenceBody) == 8, "SequenceBody must be 8 bytes");

/// 8-byte event time stamp; which member is live depends on the unit.
union EventStamp {
  int64_t frames;
  double beats;
};
static_assert(sizeof(EventStamp) == 8, "EventStamp must be 8 bytes");

/// Leading 8 bytes of a Literal body. At most one field is nonzero.
struct LiteralBody {
  TypeId lang;     // 0x00: Language tag id (NO_TYPE if none)
  TypeId datatype; // 0x04: Datatype id (NO_TYPE if none)
};
static_assert(sizeof(LiteralBody) == 8, "LiteralBody must be 8 bytes");

// ═══════════════════════════════════════════════════════════════════════════
// Sequence Time Stamps
// ═══════════════════════════════════════════════════════════════════════════

/// Unit shared by every stamp of one sequence.
enum class TimeUnit : uint8_t {
  Frames = 0, // int64 audio frames
  Beats = 1,  // double musical beats
};

/// A decoded event stamp together with the unit it was read under.
struct Timestamp {
  TimeUnit unit = TimeUnit::Frames;
  EventStamp value{0};

  static constexpr Timestamp from_frames(int64_t frames) noexcept {
    Timestamp t;
    t.unit = TimeUnit::Frames;
    t.value.frames = frames;
    return t;
  }

  static Timestamp from_beats(double beats) noexcept {
    Timestamp t;
    t.unit = TimeUnit::Beats;
    t.value.beats = beats;
    return t;
  }

  int64_t frames() const noexcept { return value.frames; }
  double beats() const noexcept { return value.beats; }

  /// True if `*this` is strictly earlier than `other`. Stamps of
  /// different units are unordered.
  bool before(const Timestamp &other) const noexcept {
    if (unit != other.unit)
      return false;
    return unit == TimeUnit::Frames ? value.frames < other.value.frames
                                    : value.beats < other.value.beats;
  }
};

// ═══════════════════════════════════════════════════════════════════════════
// Alignment Utilities
// ═══════════════════════════════════════════════════════════════════════════

/// Round `size` up to the nearest multiple of `alignment`.
/// alignment MUST be a power of 2.
constexpr size_t align_up(size_t size,
                          size_t alignment = ATOM_ALIGNMENT) noexcept {
  return (size + alignment - 1) & ~(alignment - 1);
}

/// Number of padding bytes that follow a body of `body_size` bytes.
constexpr size_t padding_for(size_t body_size) noexcept {
  return align_up(body_size) - body_size;
}

/// Total footprint of an atom in the stream: header + body + padding.
constexpr size_t padded_atom_size(size_t body_size) noexcept {
  return sizeof(AtomHeader) + align_up(body_size);
}

static_assert(padded_atom_size(4) == 16);
static_assert(padded_atom_size(8) == 16);
static_assert(padded_atom_size(0) == 8);

} // namespace atomkit
