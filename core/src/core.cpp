#include "atomkit/core.hpp"

#include <bit>

namespace atomkit::core {

std::string_view version() noexcept { return "0.3.0"; }

BuildInfo get_build_info() {
  BuildInfo info;

// Detect Compiler
#if defined(__clang__)
  info.compiler = std::string("Clang ") + __clang_version__;
#elif defined(__GNUC__)
  info.compiler = "GCC " + std::to_string(__GNUC__) + "." +
                  std::to_string(__GNUC_MINOR__) + "." +
                  std::to_string(__GNUC_PATCHLEVEL__);
#elif defined(_MSC_VER)
  info.compiler = "MSVC " + std::to_string(_MSC_VER);
#else
  info.compiler = "Unknown";
#endif

// Detect Architecture
#if defined(__x86_64__) || defined(_M_X64)
  info.architecture = "x86_64";
#elif defined(__aarch64__) || defined(_M_ARM64)
  info.architecture = "arm64";
#else
  info.architecture = "Unknown";
#endif

  if constexpr (std::endian::native == std::endian::little)
    info.byte_order = "little";
  else if constexpr (std::endian::native == std::endian::big)
    info.byte_order = "big";
  else
    info.byte_order = "mixed";

  // C++ Standard
  info.standard = "C++" + std::to_string(__cplusplus / 100 % 100);

  return info;
}

} // namespace atomkit::core
