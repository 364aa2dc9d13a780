#pragma once

/**
 * @file forge.hpp
 * @brief Append-only atom writer over a caller-owned, fixed-capacity buffer.
 *
 * The Forge never allocates and never reads back what it wrote (except the
 * header slots it back-patches). All state besides the payload bytes lives
 * in the Forge object itself:
 *
 *   - cursor_:  next free byte in the buffer
 *   - frames_:  fixed-size stack of open containers (MAX_FRAME_DEPTH)
 *   - fault_:   sticky OutOfSpace
 *
 * Container sizes are unknown until their last child is written, so
 * push_*() writes the header with body_size = 0 and pop_frame() patches in
 * `cursor - body_start`. Children are padded to 8 bytes as they are written,
 * so a container's body_size includes its children's padding; the
 * container's own padding is written by pop_frame().
 *
 * Usage protocol inside containers:
 *   Tuple     any number of values
 *   Vector    only elements of the locked child type/width
 *   Object    write_property() then exactly one value, repeated
 *   Sequence  write_timestamp() then exactly one value, repeated
 *
 * Any violation is reported as FrameMismatch and leaves the buffer
 * untouched.
 */

#include "atomkit/error.hpp"
#include "atomkit/registry.hpp"
#include "atomkit/scalar.hpp"
#include "atomkit/schema.hpp"
#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string_view>

namespace atomkit {

/// Runtime knobs for a Forge. Defaults suit host-facing buffers.
struct ForgeOptions {
  /// Fill alignment padding with zeros. Padding content is unspecified on
  /// the wire; zeroing keeps buffers byte-comparable.
  bool zero_padding = true;
};

/// Kind of an open container frame.
enum class FrameKind : uint8_t { Vector, Tuple, Object, Sequence };

/// Identifies one open frame; returned by push_*(), checked by pop_frame().
struct FrameHandle {
  uint32_t depth = 0;  ///< 1-based stack position
  size_t offset = 0;   ///< Header offset of the container in the buffer
};

class Forge {
public:
  explicit Forge(const AtomTypes &types, ForgeOptions options = {}) noexcept;
  Forge(const AtomTypes &types, std::span<uint8_t> buffer,
        ForgeOptions options = {}) noexcept;

  // A Forge is bound to one buffer; copying would alias it.
  Forge(const Forge &) = delete;
  Forge &operator=(const Forge &) = delete;

  /// Re-arm over `buffer`: clears the cursor, frame stack and sticky fault.
  void reset(std::span<uint8_t> buffer) noexcept;

  /**
   * @brief Claim exactly `n` bytes at the cursor.
   *
   * The only place capacity is checked. On failure the Forge records a
   * sticky OutOfSpace: every later call returns it until reset().
   *
   * @return Offset of the first reserved byte.
   */
  std::expected<size_t, AtomError> reserve(size_t n) noexcept;

  // ─── Scalars ───

  /// Header + payload + padding; or a bare element inside a Vector frame
  /// whose child type is `type`.
  std::expected<void, AtomError> write_scalar(TypeId type,
                                              const ScalarValue &value) noexcept;

  std::expected<void, AtomError> write_int(int32_t value) noexcept;
  std::expected<void, AtomError> write_long(int64_t value) noexcept;
  std::expected<void, AtomError> write_float(float value) noexcept;
  std::expected<void, AtomError> write_double(double value) noexcept;
  std::expected<void, AtomError> write_bool(bool value) noexcept;
  std::expected<void, AtomError> write_urid(TypeId value) noexcept;

  // ─── Byte strings ───

  /// UTF-8 text plus a terminating NUL (body_size = size + 1).
  std::expected<void, AtomError> write_string(std::string_view text) noexcept;
  std::expected<void, AtomError> write_path(std::string_view path) noexcept;
  std::expected<void, AtomError> write_uri(std::string_view uri) noexcept;

  /// Text tagged with either a language or a datatype (not both).
  std::expected<void, AtomError>
  write_literal(std::string_view text, TypeId lang = NO_TYPE,
                TypeId datatype = NO_TYPE) noexcept;

  std::expected<void, AtomError>
  write_chunk(std::span<const uint8_t> bytes) noexcept;

  /// Write an atom of any type whose body is already encoded. Used to
  /// forward atoms obtained from a Reader.
  std::expected<void, AtomError>
  write_atom(TypeId type, std::span<const uint8_t> body) noexcept;

  // ─── Containers ───

  /**
   * @brief Open a Vector of `child_size`-byte elements of `child_type`.
   *
   * Pass NO_TYPE / 0 to let the first write_scalar() lock the child type.
   */
  std::expected<FrameHandle, AtomError> push_vector(TypeId child_type,
                                                    uint32_t child_size) noexcept;

  /// Append one element; `bytes` must be exactly child_size long.
  std::expected<void, AtomError>
  write_vector_element(std::span<const uint8_t> bytes) noexcept;

  std::expected<FrameHandle, AtomError> push_tuple() noexcept;

  std::expected<FrameHandle, AtomError>
  push_object(TypeId id = NO_TYPE, TypeId otype = NO_TYPE) noexcept;

  /// Key header of the next object property; exactly one value must follow.
  std::expected<void, AtomError>
  write_property(TypeId key, TypeId context = NO_TYPE) noexcept;

  std::expected<FrameHandle, AtomError> push_sequence(TimeUnit unit) noexcept;

  /// Stamp of the next event; exactly one value must follow. Stamps are
  /// not required to be ordered here (see SequenceView::is_monotonic()).
  std::expected<void, AtomError> write_timestamp(Timestamp stamp) noexcept;

  /// Close the innermost frame, back-patching its body_size.
  std::expected<void, AtomError> pop_frame() noexcept;

  /// Close `handle`, which must be the innermost frame.
  std::expected<void, AtomError> pop_frame(FrameHandle handle) noexcept;

  // ─── Introspection ───

  /// Number of open frames (0 = Idle).
  size_t depth() const noexcept { return depth_; }

  /// Bytes written so far, padding included.
  size_t size() const noexcept { return cursor_; }

  size_t capacity() const noexcept { return buffer_.size(); }

  std::optional<AtomError> fault() const noexcept { return fault_; }

  /// No open frame, no fault, and at least one top-level atom finished.
  bool is_complete() const noexcept {
    return depth_ == 0 && !fault_ && completed_ > 0;
  }

  /// The encoded bytes (valid while the underlying buffer is).
  std::span<const uint8_t> data() const noexcept {
    return buffer_.first(cursor_);
  }

  const AtomTypes &types() const noexcept { return types_; }

private:
  struct Frame {
    FrameKind kind = FrameKind::Tuple;
    /// Object/Sequence: key or stamp written, value not yet.
    bool awaiting_value = false;
    TimeUnit unit = TimeUnit::Frames;
    TypeId child_type = NO_TYPE;
    uint32_t child_size = 0;
    size_t header_offset = 0;
  };

  /// Check that a complete atom may start here and consume the pending
  /// property/timestamp slot if any.
  std::expected<void, AtomError> begin_value() noexcept;

  /// Reserve a padded atom, write its header and padding.
  /// @return Offset of the body.
  std::expected<size_t, AtomError> open_atom(TypeId type,
                                             size_t body_size) noexcept;

  std::expected<void, AtomError> write_text(TypeId type,
                                            std::string_view text) noexcept;

  std::expected<FrameHandle, AtomError>
  push_frame(FrameKind kind, TypeId type,
             std::span<const uint8_t> body_prefix) noexcept;

  std::expected<void, AtomError>
  append_element(Frame &frame, TypeId type, const ScalarValue &value) noexcept;

  void store(size_t offset, const void *src, size_t n) noexcept;
  void fill_padding(size_t offset, size_t n) noexcept;
  void finish_atom() noexcept;

  Frame *top() noexcept { return depth_ ? &frames_[depth_ - 1] : nullptr; }

  AtomTypes types_;
  ForgeOptions options_;
  std::span<uint8_t> buffer_;
  size_t cursor_ = 0;
  std::array<Frame, MAX_FRAME_DEPTH> frames_{};
  size_t depth_ = 0;
  size_t completed_ = 0; ///< Top-level atoms finished since reset()
  std::optional<AtomError> fault_;
};

} // namespace atomkit
