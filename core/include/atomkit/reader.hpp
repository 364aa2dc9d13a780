#pragma once

/**
 * @file reader.hpp
 * @brief Bounds-checked, zero-copy parser over an existing atom buffer.
 *
 * The Reader borrows a read-only byte span; it never mutates or allocates.
 * Scalars are copied out, everything else is returned as a view (span +
 * offsets) into the borrowed bytes.
 *
 * Every header is checked against the buffer before its body is touched,
 * and every child against its container's bound, so a hostile or truncated
 * buffer yields an AtomError instead of an out-of-range read.
 *
 * Offsets are always absolute positions in the Reader's buffer, so a child
 * view obtained from a container can be handed straight back to any
 * read_*() / iterate_*() call.
 *
 * Container iteration is lazy and restartable: begin() re-parses from the
 * container's first child every time. Each item is a
 * std::expected<Item, AtomError>; after an error item the iteration ends.
 */

#include "atomkit/error.hpp"
#include "atomkit/registry.hpp"
#include "atomkit/scalar.hpp"
#include "atomkit/schema.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <iterator>
#include <optional>
#include <span>
#include <string_view>

namespace atomkit {

/// Result of read_header(): type, declared size, and where the next
/// sibling starts (after padding).
struct HeaderInfo {
  TypeId type = NO_TYPE;
  uint32_t body_size = 0;
  size_t next_offset = 0;
};

/// A validated atom inside a Reader's buffer.
struct AtomView {
  TypeId type = NO_TYPE;
  uint32_t body_size = 0;
  size_t offset = 0;      ///< Header position
  size_t next_offset = 0; ///< First byte after body + padding
  std::span<const uint8_t> body;

  size_t body_offset() const noexcept { return offset + sizeof(AtomHeader); }
};

/// One object property.
struct PropertyView {
  TypeId key = NO_TYPE;
  TypeId context = NO_TYPE;
  AtomView value;
};

/// One sequence event.
struct EventView {
  Timestamp stamp;
  AtomView value;
};

/// Decoded Literal body.
struct LiteralView {
  TypeId lang = NO_TYPE;
  TypeId datatype = NO_TYPE;
  std::string_view text;
};

namespace detail {

/**
 * @brief Parse the padded atom at `pos`, which must lie inside [pos, end).
 *
 * `overrun` is the error reported when the atom does not fit: the
 * container's MalformedContainer, or TruncatedBuffer at top level.
 * next_offset is clamped to `end` so a container whose size excludes its
 * last child's padding still terminates cleanly.
 */
std::expected<AtomView, AtomError> read_child(std::span<const uint8_t> data,
                                              size_t pos, size_t end,
                                              AtomError overrun) noexcept;

/// Tuple children (and top-level atom runs).
struct AtomParser {
  using item_type = AtomView;
  AtomError overrun = AtomError::MalformedContainer;

  std::expected<AtomView, AtomError> operator()(std::span<const uint8_t> data,
                                                size_t pos, size_t end,
                                                size_t &next) const noexcept;
};

/// Object properties: PropertyBody + atom.
struct PropertyParser {
  using item_type = PropertyView;

  std::expected<PropertyView, AtomError>
  operator()(std::span<const uint8_t> data, size_t pos, size_t end,
             size_t &next) const noexcept;
};

/// Sequence events: EventStamp + atom.
struct EventParser {
  using item_type = EventView;
  TimeUnit unit = TimeUnit::Frames;

  std::expected<EventView, AtomError>
  operator()(std::span<const uint8_t> data, size_t pos, size_t end,
             size_t &next) const noexcept;
};

/**
 * @brief Forward iterator over the children of a bounded region.
 *
 * Holds only offsets into the borrowed buffer. Compares equal to
 * std::default_sentinel once the region is consumed or an error item has
 * been yielded.
 */
template <typename Parser> class ChildIterator {
public:
  using value_type = std::expected<typename Parser::item_type, AtomError>;
  using difference_type = std::ptrdiff_t;
  using iterator_category = std::forward_iterator_tag;

  ChildIterator() = default;
  ChildIterator(std::span<const uint8_t> data, size_t pos, size_t end,
                Parser parser) noexcept
      : data_(data), pos_(pos), end_(end), parser_(parser) {
    parse();
  }

  const value_type &operator*() const noexcept { return current_; }
  const value_type *operator->() const noexcept { return &current_; }

  ChildIterator &operator++() noexcept {
    if (done_)
      return *this;
    if (!current_) {
      done_ = true; // nothing is trusted after a malformed child
      return *this;
    }
    pos_ = next_;
    parse();
    return *this;
  }

  ChildIterator operator++(int) noexcept {
    ChildIterator copy = *this;
    ++*this;
    return copy;
  }

  bool operator==(std::default_sentinel_t) const noexcept { return done_; }

  bool operator==(const ChildIterator &other) const noexcept {
    if (done_ || other.done_)
      return done_ == other.done_;
    return data_.data() == other.data_.data() && pos_ == other.pos_;
  }

private:
  void parse() noexcept {
    if (pos_ >= end_) {
      done_ = true;
      return;
    }
    done_ = false;
    current_ = parser_(data_, pos_, end_, next_);
  }

  std::span<const uint8_t> data_;
  size_t pos_ = 0;
  size_t end_ = 0;
  size_t next_ = 0;
  Parser parser_{};
  value_type current_{std::unexpected(AtomError::MalformedContainer)};
  bool done_ = true;
};

/// Restartable range over [first, end) of a buffer.
template <typename Parser> class ChildRange {
public:
  using iterator = ChildIterator<Parser>;

  ChildRange() = default;
  ChildRange(std::span<const uint8_t> data, size_t first, size_t end,
             Parser parser = {}) noexcept
      : data_(data), first_(first), end_(end), parser_(parser) {}

  iterator begin() const noexcept {
    return iterator(data_, first_, end_, parser_);
  }
  std::default_sentinel_t end() const noexcept { return {}; }

  bool empty() const noexcept { return first_ >= end_; }

  /// Number of children up to the end or the first malformed one.
  size_t count() const noexcept {
    size_t n = 0;
    for (const auto &item : *this) {
      if (!item)
        break;
      ++n;
    }
    return n;
  }

protected:
  std::span<const uint8_t> data_;
  size_t first_ = 0;
  size_t end_ = 0;
  Parser parser_{};
};

} // namespace detail

/// Elements of a Vector; each element is child_size() raw bytes.
class VectorView {
public:
  VectorView() = default;
  VectorView(TypeId child_type, uint32_t child_size,
             std::span<const uint8_t> elements) noexcept
      : child_type_(child_type), child_size_(child_size),
        elements_(elements) {}

  TypeId child_type() const noexcept { return child_type_; }
  uint32_t child_size() const noexcept { return child_size_; }

  size_t size() const noexcept {
    return child_size_ ? elements_.size() / child_size_ : 0;
  }
  bool empty() const noexcept { return size() == 0; }

  /// Empty span when `index` is out of range.
  std::span<const uint8_t> operator[](size_t index) const noexcept {
    if (index >= size())
      return {};
    return elements_.subspan(index * child_size_, child_size_);
  }

  /// All element bytes back to back.
  std::span<const uint8_t> bytes() const noexcept { return elements_; }

  /// Holds the element bytes by value, so it outlives the view.
  class iterator {
  public:
    using value_type = std::span<const uint8_t>;
    using difference_type = std::ptrdiff_t;
    using iterator_category = std::forward_iterator_tag;

    iterator() = default;
    iterator(std::span<const uint8_t> elements, uint32_t child_size,
             size_t index) noexcept
        : elements_(elements), child_size_(child_size), index_(index) {}

    value_type operator*() const noexcept {
      size_t start = index_ * child_size_;
      if (child_size_ == 0 || start + child_size_ > elements_.size())
        return {};
      return elements_.subspan(start, child_size_);
    }
    iterator &operator++() noexcept {
      ++index_;
      return *this;
    }
    iterator operator++(int) noexcept {
      iterator copy = *this;
      ++index_;
      return copy;
    }
    bool operator==(const iterator &other) const noexcept {
      return elements_.data() == other.elements_.data() &&
             index_ == other.index_;
    }

  private:
    std::span<const uint8_t> elements_;
    uint32_t child_size_ = 0;
    size_t index_ = 0;
  };

  iterator begin() const noexcept { return {elements_, child_size_, 0}; }
  iterator end() const noexcept { return {elements_, child_size_, size()}; }

private:
  TypeId child_type_ = NO_TYPE;
  uint32_t child_size_ = 0;
  std::span<const uint8_t> elements_;
};

/// Children of a Tuple, in write order.
class TupleView : public detail::ChildRange<detail::AtomParser> {
public:
  using ChildRange::ChildRange;
};

/// Properties of an Object (or Blank), in write order.
class ObjectView : public detail::ChildRange<detail::PropertyParser> {
public:
  ObjectView() = default;
  ObjectView(std::span<const uint8_t> data, size_t first, size_t end,
             ObjectBody header) noexcept
      : ChildRange(data, first, end), header_(header) {}

  TypeId id() const noexcept { return header_.id; }
  TypeId otype() const noexcept { return header_.otype; }

  /// Value of `key`. Repeated keys resolve to the last occurrence;
  /// scanning stops at the first malformed property.
  std::optional<AtomView> find(TypeId key) const noexcept;

private:
  ObjectBody header_{};
};

/// Events of a Sequence, in stored order (not re-sorted).
class SequenceView : public detail::ChildRange<detail::EventParser> {
public:
  SequenceView() = default;
  SequenceView(std::span<const uint8_t> data, size_t first, size_t end,
               TimeUnit unit) noexcept
      : ChildRange(data, first, end, detail::EventParser{unit}) {}

  TimeUnit unit() const noexcept { return parser_.unit; }

  /// Index of the first event whose stamp is earlier than its predecessor.
  std::optional<size_t> first_decrease() const noexcept;

  /// True if stamps never decrease. Only well-formed events are compared.
  bool is_monotonic() const noexcept { return !first_decrease(); }
};

class Reader {
public:
  Reader(const AtomTypes &types, std::span<const uint8_t> buffer) noexcept;
  Reader(const AtomTypes &types, const void *data, size_t length) noexcept;

  size_t size() const noexcept { return buffer_.size(); }
  std::span<const uint8_t> buffer() const noexcept { return buffer_; }
  const AtomTypes &types() const noexcept { return types_; }

  // ─── Headers ───

  /// TruncatedBuffer if fewer than 8 bytes remain at `offset`, or if the
  /// body plus its padding runs past the end of the buffer.
  std::expected<HeaderInfo, AtomError> read_header(size_t offset) const noexcept;

  std::expected<AtomView, AtomError> read_atom(size_t offset) const noexcept;

  /// Consecutive top-level atoms from `offset` to the end of the buffer.
  TupleView iterate_atoms(size_t offset = 0) const noexcept;

  // ─── Scalars ───

  std::expected<ScalarValue, AtomError> read_scalar(size_t offset) const noexcept;
  std::expected<ScalarValue, AtomError>
  read_scalar(const AtomView &atom) const noexcept;

  std::expected<int32_t, AtomError> read_int(const AtomView &atom) const noexcept;
  std::expected<int64_t, AtomError> read_long(const AtomView &atom) const noexcept;
  std::expected<float, AtomError> read_float(const AtomView &atom) const noexcept;
  std::expected<double, AtomError>
  read_double(const AtomView &atom) const noexcept;
  std::expected<bool, AtomError> read_bool(const AtomView &atom) const noexcept;
  std::expected<TypeId, AtomError> read_urid(const AtomView &atom) const noexcept;

  // ─── Byte strings ───

  /// Text without its terminating NUL. MalformedContainer if the NUL is
  /// missing.
  std::expected<std::string_view, AtomError>
  read_string(const AtomView &atom) const noexcept;
  std::expected<std::string_view, AtomError>
  read_path(const AtomView &atom) const noexcept;
  std::expected<std::string_view, AtomError>
  read_uri(const AtomView &atom) const noexcept;
  std::expected<LiteralView, AtomError>
  read_literal(const AtomView &atom) const noexcept;
  std::expected<std::span<const uint8_t>, AtomError>
  read_chunk(const AtomView &atom) const noexcept;

  // ─── Containers ───

  /// Eagerly checks 8 + child_size * count == body_size.
  std::expected<VectorView, AtomError> iterate_vector(size_t offset) const noexcept;
  std::expected<VectorView, AtomError>
  iterate_vector(const AtomView &atom) const noexcept;

  std::expected<TupleView, AtomError> iterate_tuple(size_t offset) const noexcept;
  std::expected<TupleView, AtomError>
  iterate_tuple(const AtomView &atom) const noexcept;

  /// Accepts both Object and Blank atoms.
  std::expected<ObjectView, AtomError> iterate_object(size_t offset) const noexcept;
  std::expected<ObjectView, AtomError>
  iterate_object(const AtomView &atom) const noexcept;

  std::expected<SequenceView, AtomError>
  iterate_sequence(size_t offset) const noexcept;
  std::expected<SequenceView, AtomError>
  iterate_sequence(const AtomView &atom) const noexcept;

private:
  template <typename T>
  std::expected<T, AtomError> read_as(const AtomView &atom) const noexcept;

  std::expected<std::string_view, AtomError>
  read_text(const AtomView &atom, TypeId expected_type) const noexcept;

  /// TruncatedBuffer unless `atom` lies inside this reader's buffer.
  std::expected<void, AtomError> check_view(const AtomView &atom) const noexcept;

  AtomTypes types_;
  std::span<const uint8_t> buffer_;
};

} // namespace atomkit
