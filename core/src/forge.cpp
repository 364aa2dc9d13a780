#include "atomkit/forge.hpp"

#include <cstddef>
#include <cstring>
#include <limits>

namespace atomkit {

namespace {

/// Offset of the body_size field inside an AtomHeader.
constexpr size_t BODY_SIZE_FIELD = offsetof(AtomHeader, body_size);

template <typename T> std::span<const uint8_t> bytes_of(const T &value) {
  return {reinterpret_cast<const uint8_t *>(&value), sizeof(T)};
}

} // namespace

Forge::Forge(const AtomTypes &types, ForgeOptions options) noexcept
    : types_(types), options_(options) {}

Forge::Forge(const AtomTypes &types, std::span<uint8_t> buffer,
             ForgeOptions options) noexcept
    : types_(types), options_(options), buffer_(buffer) {}

void Forge::reset(std::span<uint8_t> buffer) noexcept {
  buffer_ = buffer;
  cursor_ = 0;
  depth_ = 0;
  completed_ = 0;
  fault_.reset();
}

std::expected<size_t, AtomError> Forge::reserve(size_t n) noexcept {
  if (fault_)
    return std::unexpected(*fault_);
  if (n > buffer_.size() - cursor_) {
    fault_ = AtomError::OutOfSpace;
    return std::unexpected(*fault_);
  }
  size_t offset = cursor_;
  cursor_ += n;
  return offset;
}

// ===========================================================================
// Internal helpers
// ===========================================================================

void Forge::store(size_t offset, const void *src, size_t n) noexcept {
  if (n)
    std::memcpy(buffer_.data() + offset, src, n);
}

void Forge::fill_padding(size_t offset, size_t n) noexcept {
  if (n && options_.zero_padding)
    std::memset(buffer_.data() + offset, 0, n);
}

void Forge::finish_atom() noexcept {
  if (depth_ == 0)
    ++completed_;
}

std::expected<void, AtomError> Forge::begin_value() noexcept {
  if (fault_)
    return std::unexpected(*fault_);

  Frame *frame = top();
  if (!frame)
    return {};

  switch (frame->kind) {
  case FrameKind::Tuple:
    return {};
  case FrameKind::Vector:
    // Vectors hold bare elements, never complete atoms.
    return std::unexpected(AtomError::FrameMismatch);
  case FrameKind::Object:
  case FrameKind::Sequence:
    if (!frame->awaiting_value)
      return std::unexpected(AtomError::FrameMismatch);
    frame->awaiting_value = false;
    return {};
  }
  return std::unexpected(AtomError::FrameMismatch);
}

std::expected<size_t, AtomError> Forge::open_atom(TypeId type,
                                                  size_t body_size) noexcept {
  if (body_size > std::numeric_limits<uint32_t>::max()) {
    fault_ = AtomError::OutOfSpace;
    return std::unexpected(*fault_);
  }

  auto offset = reserve(padded_atom_size(body_size));
  if (!offset)
    return std::unexpected(offset.error());

  AtomHeader header{type, static_cast<uint32_t>(body_size)};
  store(*offset, &header, sizeof(header));

  size_t body = *offset + sizeof(AtomHeader);
  fill_padding(body + body_size, padding_for(body_size));
  return body;
}

// ===========================================================================
// Scalars
// ===========================================================================

std::expected<void, AtomError>
Forge::append_element(Frame &frame, TypeId type,
                      const ScalarValue &value) noexcept {
  auto encoded = encode_scalar(types_, type, value);
  if (!encoded)
    return std::unexpected(encoded.error());

  if (frame.child_type == NO_TYPE) {
    // First element of an untyped vector locks its child type and width.
    auto offset = reserve(encoded->size);
    if (!offset)
      return std::unexpected(offset.error());
    frame.child_type = type;
    frame.child_size = encoded->size;
    VectorBody body{frame.child_type, frame.child_size};
    store(frame.header_offset + sizeof(AtomHeader), &body, sizeof(body));
    store(*offset, encoded->data.data(), encoded->size);
    return {};
  }

  if (frame.child_type != type || frame.child_size != encoded->size)
    return std::unexpected(AtomError::FrameMismatch);

  auto offset = reserve(encoded->size);
  if (!offset)
    return std::unexpected(offset.error());
  store(*offset, encoded->data.data(), encoded->size);
  return {};
}

std::expected<void, AtomError>
Forge::write_scalar(TypeId type, const ScalarValue &value) noexcept {
  if (fault_)
    return std::unexpected(*fault_);

  Frame *frame = top();
  if (frame && frame->kind == FrameKind::Vector)
    return append_element(*frame, type, value);

  auto encoded = encode_scalar(types_, type, value);
  if (!encoded)
    return std::unexpected(encoded.error());

  if (auto ok = begin_value(); !ok)
    return ok;

  auto body = open_atom(type, encoded->size);
  if (!body)
    return std::unexpected(body.error());
  store(*body, encoded->data.data(), encoded->size);
  finish_atom();
  return {};
}

std::expected<void, AtomError> Forge::write_int(int32_t value) noexcept {
  return write_scalar(types_.int_, ScalarValue{value});
}

std::expected<void, AtomError> Forge::write_long(int64_t value) noexcept {
  return write_scalar(types_.long_, ScalarValue{value});
}

std::expected<void, AtomError> Forge::write_float(float value) noexcept {
  return write_scalar(types_.float_, ScalarValue{value});
}

std::expected<void, AtomError> Forge::write_double(double value) noexcept {
  return write_scalar(types_.double_, ScalarValue{value});
}

std::expected<void, AtomError> Forge::write_bool(bool value) noexcept {
  return write_scalar(types_.bool_, ScalarValue{value});
}

std::expected<void, AtomError> Forge::write_urid(TypeId value) noexcept {
  return write_scalar(types_.urid, ScalarValue{Urid{value}});
}

// ===========================================================================
// Byte strings
// ===========================================================================

std::expected<void, AtomError>
Forge::write_text(TypeId type, std::string_view text) noexcept {
  if (fault_)
    return std::unexpected(*fault_);
  if (type == NO_TYPE)
    return std::unexpected(AtomError::TypeMismatch);
  if (auto ok = begin_value(); !ok)
    return ok;

  auto body = open_atom(type, text.size() + 1);
  if (!body)
    return std::unexpected(body.error());
  store(*body, text.data(), text.size());
  buffer_[*body + text.size()] = 0;
  finish_atom();
  return {};
}

std::expected<void, AtomError>
Forge::write_string(std::string_view text) noexcept {
  return write_text(types_.string, text);
}

std::expected<void, AtomError>
Forge::write_path(std::string_view path) noexcept {
  return write_text(types_.path, path);
}

std::expected<void, AtomError> Forge::write_uri(std::string_view uri) noexcept {
  return write_text(types_.uri, uri);
}

std::expected<void, AtomError> Forge::write_literal(std::string_view text,
                                                    TypeId lang,
                                                    TypeId datatype) noexcept {
  if (fault_)
    return std::unexpected(*fault_);
  if (types_.literal == NO_TYPE || (lang != NO_TYPE && datatype != NO_TYPE))
    return std::unexpected(AtomError::TypeMismatch);
  if (auto ok = begin_value(); !ok)
    return ok;

  auto body = open_atom(types_.literal, sizeof(LiteralBody) + text.size() + 1);
  if (!body)
    return std::unexpected(body.error());

  LiteralBody info{lang, datatype};
  store(*body, &info, sizeof(info));
  store(*body + sizeof(info), text.data(), text.size());
  buffer_[*body + sizeof(info) + text.size()] = 0;
  finish_atom();
  return {};
}

std::expected<void, AtomError>
Forge::write_chunk(std::span<const uint8_t> bytes) noexcept {
  return write_atom(types_.chunk, bytes);
}

std::expected<void, AtomError>
Forge::write_atom(TypeId type, std::span<const uint8_t> body) noexcept {
  if (fault_)
    return std::unexpected(*fault_);
  if (type == NO_TYPE)
    return std::unexpected(AtomError::TypeMismatch);
  if (auto ok = begin_value(); !ok)
    return ok;

  auto offset = open_atom(type, body.size());
  if (!offset)
    return std::unexpected(offset.error());
  store(*offset, body.data(), body.size());
  finish_atom();
  return {};
}

// ===========================================================================
// Containers
// ===========================================================================

std::expected<FrameHandle, AtomError>
Forge::push_frame(FrameKind kind, TypeId type,
                  std::span<const uint8_t> body_prefix) noexcept {
  if (fault_)
    return std::unexpected(*fault_);
  if (type == NO_TYPE)
    return std::unexpected(AtomError::TypeMismatch);
  if (depth_ == MAX_FRAME_DEPTH)
    return std::unexpected(AtomError::FrameOverflow);
  if (auto ok = begin_value(); !ok)
    return std::unexpected(ok.error());

  // Header with body_size = 0; pop_frame() patches the real size.
  auto offset = reserve(sizeof(AtomHeader) + body_prefix.size());
  if (!offset)
    return std::unexpected(offset.error());

  AtomHeader header{type, 0};
  store(*offset, &header, sizeof(header));
  store(*offset + sizeof(header), body_prefix.data(), body_prefix.size());

  Frame &frame = frames_[depth_++];
  frame = Frame{};
  frame.kind = kind;
  frame.header_offset = *offset;
  return FrameHandle{static_cast<uint32_t>(depth_), *offset};
}

std::expected<FrameHandle, AtomError>
Forge::push_vector(TypeId child_type, uint32_t child_size) noexcept {
  if (fault_)
    return std::unexpected(*fault_);
  if (child_type != NO_TYPE && child_size == 0)
    return std::unexpected(AtomError::FrameMismatch);

  VectorBody body{child_type, child_type == NO_TYPE ? 0u : child_size};
  auto handle = push_frame(FrameKind::Vector, types_.vector, bytes_of(body));
  if (!handle)
    return handle;

  Frame &frame = frames_[depth_ - 1];
  frame.child_type = body.child_type;
  frame.child_size = body.child_size;
  return handle;
}

std::expected<void, AtomError>
Forge::write_vector_element(std::span<const uint8_t> bytes) noexcept {
  if (fault_)
    return std::unexpected(*fault_);

  Frame *frame = top();
  if (!frame || frame->kind != FrameKind::Vector ||
      frame->child_type == NO_TYPE || bytes.size() != frame->child_size)
    return std::unexpected(AtomError::FrameMismatch);

  auto offset = reserve(bytes.size());
  if (!offset)
    return std::unexpected(offset.error());
  store(*offset, bytes.data(), bytes.size());
  return {};
}

std::expected<FrameHandle, AtomError> Forge::push_tuple() noexcept {
  return push_frame(FrameKind::Tuple, types_.tuple, {});
}

std::expected<FrameHandle, AtomError> Forge::push_object(TypeId id,
                                                         TypeId otype) noexcept {
  ObjectBody body{id, otype};
  return push_frame(FrameKind::Object, types_.object, bytes_of(body));
}

std::expected<void, AtomError> Forge::write_property(TypeId key,
                                                     TypeId context) noexcept {
  if (fault_)
    return std::unexpected(*fault_);

  Frame *frame = top();
  if (!frame || frame->kind != FrameKind::Object || frame->awaiting_value)
    return std::unexpected(AtomError::FrameMismatch);
  if (key == NO_TYPE)
    return std::unexpected(AtomError::TypeMismatch);

  auto offset = reserve(sizeof(PropertyBody));
  if (!offset)
    return std::unexpected(offset.error());

  PropertyBody property{key, context};
  store(*offset, &property, sizeof(property));
  frame->awaiting_value = true;
  return {};
}

std::expected<FrameHandle, AtomError>
Forge::push_sequence(TimeUnit unit) noexcept {
  SequenceBody body{unit == TimeUnit::Beats ? types_.beat : types_.frame, 0};
  auto handle =
      push_frame(FrameKind::Sequence, types_.sequence, bytes_of(body));
  if (!handle)
    return handle;

  frames_[depth_ - 1].unit = unit;
  return handle;
}

std::expected<void, AtomError> Forge::write_timestamp(Timestamp stamp) noexcept {
  if (fault_)
    return std::unexpected(*fault_);

  Frame *frame = top();
  if (!frame || frame->kind != FrameKind::Sequence || frame->awaiting_value)
    return std::unexpected(AtomError::FrameMismatch);
  if (stamp.unit != frame->unit)
    return std::unexpected(AtomError::TypeMismatch);

  auto offset = reserve(sizeof(EventStamp));
  if (!offset)
    return std::unexpected(offset.error());

  store(*offset, &stamp.value, sizeof(EventStamp));
  frame->awaiting_value = true;
  return {};
}

std::expected<void, AtomError> Forge::pop_frame() noexcept {
  if (fault_)
    return std::unexpected(*fault_);

  Frame *frame = top();
  if (!frame)
    return std::unexpected(AtomError::FrameUnderflow);
  // A key or stamp without its value.
  if (frame->awaiting_value)
    return std::unexpected(AtomError::FrameMismatch);

  size_t body_start = frame->header_offset + sizeof(AtomHeader);
  size_t body_size = cursor_ - body_start;
  if (body_size > std::numeric_limits<uint32_t>::max()) {
    fault_ = AtomError::OutOfSpace;
    return std::unexpected(*fault_);
  }

  auto pad = reserve(padding_for(body_size));
  if (!pad)
    return std::unexpected(pad.error());
  fill_padding(*pad, padding_for(body_size));

  auto size_field = static_cast<uint32_t>(body_size);
  store(frame->header_offset + BODY_SIZE_FIELD, &size_field,
        sizeof(size_field));

  --depth_;
  finish_atom();
  return {};
}

std::expected<void, AtomError> Forge::pop_frame(FrameHandle handle) noexcept {
  if (fault_)
    return std::unexpected(*fault_);
  if (depth_ == 0)
    return std::unexpected(AtomError::FrameUnderflow);
  if (handle.depth != depth_ ||
      handle.offset != frames_[depth_ - 1].header_offset)
    return std::unexpected(AtomError::FrameMismatch);
  return pop_frame();
}

} // namespace atomkit
