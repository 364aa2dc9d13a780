#include "atomkit/reader.hpp"

#include <algorithm>
#include <cstring>
#include <variant>

namespace atomkit {

namespace {

template <typename T>
T load(std::span<const uint8_t> data, size_t offset) noexcept {
  T value;
  std::memcpy(&value, data.data() + offset, sizeof(T));
  return value;
}

} // namespace

// ===========================================================================
// Child parsers
// ===========================================================================

namespace detail {

std::expected<AtomView, AtomError> read_child(std::span<const uint8_t> data,
                                              size_t pos, size_t end,
                                              AtomError overrun) noexcept {
  if (pos > end || end - pos < sizeof(AtomHeader))
    return std::unexpected(overrun);

  auto header = load<AtomHeader>(data, pos);
  size_t body_start = pos + sizeof(AtomHeader);
  if (header.body_size > end - body_start)
    return std::unexpected(overrun);

  AtomView view;
  view.type = header.type;
  view.body_size = header.body_size;
  view.offset = pos;
  view.next_offset = std::min(body_start + align_up(header.body_size), end);
  view.body = data.subspan(body_start, header.body_size);
  return view;
}

std::expected<AtomView, AtomError>
AtomParser::operator()(std::span<const uint8_t> data, size_t pos, size_t end,
                       size_t &next) const noexcept {
  auto child = read_child(data, pos, end, overrun);
  if (child)
    next = child->next_offset;
  return child;
}

std::expected<PropertyView, AtomError>
PropertyParser::operator()(std::span<const uint8_t> data, size_t pos,
                           size_t end, size_t &next) const noexcept {
  if (end - pos < sizeof(PropertyBody))
    return std::unexpected(AtomError::MalformedContainer);

  auto property = load<PropertyBody>(data, pos);
  auto value = read_child(data, pos + sizeof(PropertyBody), end,
                          AtomError::MalformedContainer);
  if (!value)
    return std::unexpected(value.error());

  next = value->next_offset;
  return PropertyView{property.key, property.context, *value};
}

std::expected<EventView, AtomError>
EventParser::operator()(std::span<const uint8_t> data, size_t pos, size_t end,
                        size_t &next) const noexcept {
  if (end - pos < sizeof(EventStamp))
    return std::unexpected(AtomError::MalformedContainer);

  Timestamp stamp;
  stamp.unit = unit;
  stamp.value = load<EventStamp>(data, pos);
  auto value = read_child(data, pos + sizeof(EventStamp), end,
                          AtomError::MalformedContainer);
  if (!value)
    return std::unexpected(value.error());

  next = value->next_offset;
  return EventView{stamp, *value};
}

} // namespace detail

// ===========================================================================
// Views
// ===========================================================================

std::optional<AtomView> ObjectView::find(TypeId key) const noexcept {
  std::optional<AtomView> found;
  for (const auto &property : *this) {
    if (!property)
      break;
    if (property->key == key)
      found = property->value;
  }
  return found;
}

std::optional<size_t> SequenceView::first_decrease() const noexcept {
  std::optional<Timestamp> previous;
  size_t index = 0;
  for (const auto &event : *this) {
    if (!event)
      break;
    if (previous && event->stamp.before(*previous))
      return index;
    previous = event->stamp;
    ++index;
  }
  return std::nullopt;
}

// ===========================================================================
// Reader
// ===========================================================================

Reader::Reader(const AtomTypes &types, std::span<const uint8_t> buffer) noexcept
    : types_(types), buffer_(buffer) {}

Reader::Reader(const AtomTypes &types, const void *data, size_t length) noexcept
    : types_(types),
      buffer_(static_cast<const uint8_t *>(data), data ? length : 0) {}

std::expected<HeaderInfo, AtomError>
Reader::read_header(size_t offset) const noexcept {
  if (offset > buffer_.size() || buffer_.size() - offset < sizeof(AtomHeader))
    return std::unexpected(AtomError::TruncatedBuffer);

  auto header = load<AtomHeader>(buffer_, offset);
  size_t remaining = buffer_.size() - offset - sizeof(AtomHeader);
  if (align_up(header.body_size) > remaining)
    return std::unexpected(AtomError::TruncatedBuffer);

  return HeaderInfo{header.type, header.body_size,
                    offset + padded_atom_size(header.body_size)};
}

std::expected<AtomView, AtomError>
Reader::read_atom(size_t offset) const noexcept {
  auto header = read_header(offset);
  if (!header)
    return std::unexpected(header.error());

  AtomView view;
  view.type = header->type;
  view.body_size = header->body_size;
  view.offset = offset;
  view.next_offset = header->next_offset;
  view.body = buffer_.subspan(offset + sizeof(AtomHeader), header->body_size);
  return view;
}

TupleView Reader::iterate_atoms(size_t offset) const noexcept {
  return TupleView(buffer_, offset, buffer_.size(),
                   detail::AtomParser{AtomError::TruncatedBuffer});
}

std::expected<void, AtomError>
Reader::check_view(const AtomView &atom) const noexcept {
  // Views may come from another Reader; only trust ones inside buffer_.
  if (atom.offset > buffer_.size() ||
      buffer_.size() - atom.offset < sizeof(AtomHeader))
    return std::unexpected(AtomError::TruncatedBuffer);
  size_t body_offset = atom.body_offset();
  if (atom.body_size > buffer_.size() - body_offset ||
      atom.body.size() != atom.body_size ||
      atom.body.data() != buffer_.data() + body_offset)
    return std::unexpected(AtomError::TruncatedBuffer);
  return {};
}

// ─── Scalars ───

std::expected<ScalarValue, AtomError>
Reader::read_scalar(size_t offset) const noexcept {
  auto atom = read_atom(offset);
  if (!atom)
    return std::unexpected(atom.error());
  return read_scalar(*atom);
}

std::expected<ScalarValue, AtomError>
Reader::read_scalar(const AtomView &atom) const noexcept {
  if (auto valid = check_view(atom); !valid)
    return std::unexpected(valid.error());
  if (types_.is_container(atom.type))
    return std::unexpected(AtomError::UnexpectedType);
  return decode_scalar(types_, atom.type, atom.body);
}

template <typename T>
std::expected<T, AtomError>
Reader::read_as(const AtomView &atom) const noexcept {
  auto value = read_scalar(atom);
  if (!value)
    return std::unexpected(value.error());
  if (!std::holds_alternative<T>(*value))
    return std::unexpected(AtomError::TypeMismatch);
  return std::get<T>(*value);
}

std::expected<int32_t, AtomError>
Reader::read_int(const AtomView &atom) const noexcept {
  return read_as<int32_t>(atom);
}

std::expected<int64_t, AtomError>
Reader::read_long(const AtomView &atom) const noexcept {
  return read_as<int64_t>(atom);
}

std::expected<float, AtomError>
Reader::read_float(const AtomView &atom) const noexcept {
  return read_as<float>(atom);
}

std::expected<double, AtomError>
Reader::read_double(const AtomView &atom) const noexcept {
  return read_as<double>(atom);
}

std::expected<bool, AtomError>
Reader::read_bool(const AtomView &atom) const noexcept {
  return read_as<bool>(atom);
}

std::expected<TypeId, AtomError>
Reader::read_urid(const AtomView &atom) const noexcept {
  auto urid = read_as<Urid>(atom);
  if (!urid)
    return std::unexpected(urid.error());
  return urid->id;
}

// ─── Byte strings ───

std::expected<std::string_view, AtomError>
Reader::read_text(const AtomView &atom, TypeId expected_type) const noexcept {
  if (auto valid = check_view(atom); !valid)
    return std::unexpected(valid.error());
  if (expected_type == NO_TYPE || atom.type != expected_type)
    return std::unexpected(AtomError::UnexpectedType);
  if (atom.body.empty() || atom.body.back() != 0)
    return std::unexpected(AtomError::MalformedContainer);
  return std::string_view(reinterpret_cast<const char *>(atom.body.data()),
                          atom.body.size() - 1);
}

std::expected<std::string_view, AtomError>
Reader::read_string(const AtomView &atom) const noexcept {
  return read_text(atom, types_.string);
}

std::expected<std::string_view, AtomError>
Reader::read_path(const AtomView &atom) const noexcept {
  return read_text(atom, types_.path);
}

std::expected<std::string_view, AtomError>
Reader::read_uri(const AtomView &atom) const noexcept {
  return read_text(atom, types_.uri);
}

std::expected<LiteralView, AtomError>
Reader::read_literal(const AtomView &atom) const noexcept {
  if (auto valid = check_view(atom); !valid)
    return std::unexpected(valid.error());
  if (types_.literal == NO_TYPE || atom.type != types_.literal)
    return std::unexpected(AtomError::UnexpectedType);
  if (atom.body.size() <= sizeof(LiteralBody) || atom.body.back() != 0)
    return std::unexpected(AtomError::MalformedContainer);

  auto info = load<LiteralBody>(atom.body, 0);
  auto text = atom.body.subspan(sizeof(LiteralBody));
  return LiteralView{info.lang, info.datatype,
                     std::string_view(reinterpret_cast<const char *>(text.data()),
                                      text.size() - 1)};
}

std::expected<std::span<const uint8_t>, AtomError>
Reader::read_chunk(const AtomView &atom) const noexcept {
  if (auto valid = check_view(atom); !valid)
    return std::unexpected(valid.error());
  if (types_.chunk == NO_TYPE || atom.type != types_.chunk)
    return std::unexpected(AtomError::UnexpectedType);
  return atom.body;
}

// ─── Containers ───

std::expected<VectorView, AtomError>
Reader::iterate_vector(size_t offset) const noexcept {
  auto atom = read_atom(offset);
  if (!atom)
    return std::unexpected(atom.error());
  return iterate_vector(*atom);
}

std::expected<VectorView, AtomError>
Reader::iterate_vector(const AtomView &atom) const noexcept {
  if (auto valid = check_view(atom); !valid)
    return std::unexpected(valid.error());
  if (atom.type != types_.vector)
    return std::unexpected(AtomError::UnexpectedType);
  if (atom.body.size() < sizeof(VectorBody))
    return std::unexpected(AtomError::MalformedContainer);

  auto info = load<VectorBody>(atom.body, 0);
  auto elements = atom.body.subspan(sizeof(VectorBody));
  // body_size must be exactly sizeof(VectorBody) + child_size * count.
  if (info.child_size == 0 ? !elements.empty()
                           : elements.size() % info.child_size != 0)
    return std::unexpected(AtomError::MalformedContainer);

  return VectorView(info.child_type, info.child_size, elements);
}

std::expected<TupleView, AtomError>
Reader::iterate_tuple(size_t offset) const noexcept {
  auto atom = read_atom(offset);
  if (!atom)
    return std::unexpected(atom.error());
  return iterate_tuple(*atom);
}

std::expected<TupleView, AtomError>
Reader::iterate_tuple(const AtomView &atom) const noexcept {
  if (auto valid = check_view(atom); !valid)
    return std::unexpected(valid.error());
  if (atom.type != types_.tuple)
    return std::unexpected(AtomError::UnexpectedType);
  size_t first = atom.body_offset();
  return TupleView(buffer_, first, first + atom.body_size);
}

std::expected<ObjectView, AtomError>
Reader::iterate_object(size_t offset) const noexcept {
  auto atom = read_atom(offset);
  if (!atom)
    return std::unexpected(atom.error());
  return iterate_object(*atom);
}

std::expected<ObjectView, AtomError>
Reader::iterate_object(const AtomView &atom) const noexcept {
  if (auto valid = check_view(atom); !valid)
    return std::unexpected(valid.error());
  if (!types_.is_object(atom.type))
    return std::unexpected(AtomError::UnexpectedType);
  if (atom.body.size() < sizeof(ObjectBody))
    return std::unexpected(AtomError::MalformedContainer);

  auto header = load<ObjectBody>(atom.body, 0);
  size_t first = atom.body_offset() + sizeof(ObjectBody);
  return ObjectView(buffer_, first, atom.body_offset() + atom.body_size,
                    header);
}

std::expected<SequenceView, AtomError>
Reader::iterate_sequence(size_t offset) const noexcept {
  auto atom = read_atom(offset);
  if (!atom)
    return std::unexpected(atom.error());
  return iterate_sequence(*atom);
}

std::expected<SequenceView, AtomError>
Reader::iterate_sequence(const AtomView &atom) const noexcept {
  if (auto valid = check_view(atom); !valid)
    return std::unexpected(valid.error());
  if (atom.type != types_.sequence)
    return std::unexpected(AtomError::UnexpectedType);
  if (atom.body.size() < sizeof(SequenceBody))
    return std::unexpected(AtomError::MalformedContainer);

  auto header = load<SequenceBody>(atom.body, 0);
  // Anything but the beat unit (including 0) is read as frames.
  TimeUnit unit = header.unit != NO_TYPE && header.unit == types_.beat
                      ? TimeUnit::Beats
                      : TimeUnit::Frames;
  size_t first = atom.body_offset() + sizeof(SequenceBody);
  return SequenceView(buffer_, first, atom.body_offset() + atom.body_size,
                      unit);
}

} // namespace atomkit
