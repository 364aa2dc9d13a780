#pragma once

#include <string_view>

namespace atomkit {

/**
 * @brief Failure taxonomy shared by the Forge and the Reader.
 *
 * Writer side:
 *   - OutOfSpace:      buffer capacity exhausted. Sticky until Forge::reset().
 *   - FrameUnderflow:  pop_frame() with no open frame.
 *   - FrameOverflow:   more than MAX_FRAME_DEPTH nested frames.
 *   - FrameMismatch:   operation illegal in the innermost frame (property
 *                      outside an object, value without a timestamp, element
 *                      of the wrong width, ...).
 *
 * Reader side:
 *   - TruncatedBuffer:    an atom extends past the end of the buffer.
 *   - UnexpectedType:     a container was found where a scalar was asked for
 *                         (or the reverse).
 *   - MalformedContainer: a child overruns its container, or a container's
 *                         declared sizes are inconsistent.
 *
 * Both:
 *   - TypeMismatch: the type id is not of the requested kind.
 */
enum class AtomError {
  OutOfSpace,
  FrameUnderflow,
  FrameOverflow,
  FrameMismatch,
  TruncatedBuffer,
  UnexpectedType,
  MalformedContainer,
  TypeMismatch,
};

/// Stable name of an error, for diagnostics and test output.
constexpr std::string_view to_string(AtomError error) noexcept {
  switch (error) {
  case AtomError::OutOfSpace:
    return "OutOfSpace";
  case AtomError::FrameUnderflow:
    return "FrameUnderflow";
  case AtomError::FrameOverflow:
    return "FrameOverflow";
  case AtomError::FrameMismatch:
    return "FrameMismatch";
  case AtomError::TruncatedBuffer:
    return "TruncatedBuffer";
  case AtomError::UnexpectedType:
    return "UnexpectedType";
  case AtomError::MalformedContainer:
    return "MalformedContainer";
  case AtomError::TypeMismatch:
    return "TypeMismatch";
  }
  return "Unknown";
}

} // namespace atomkit
