#pragma once

#include <string>
#include <string_view>

// Symbol visibility macros
#if defined(_WIN32)
  #if defined(ATOMKIT_CORE_EXPORTS)
    #define ATOMKIT_CORE_EXPORT __declspec(dllexport)
  #else
    #define ATOMKIT_CORE_EXPORT __declspec(dllimport)
  #endif
#else
  #define ATOMKIT_CORE_EXPORT __attribute__((visibility("default")))
#endif

namespace atomkit::core {

    struct BuildInfo {
        std::string compiler;
        std::string architecture;
        std::string byte_order; // Atoms are encoded in host order
        std::string standard;
    };

    /**
     * @brief Returns the version of the atomkit library.
     */
    ATOMKIT_CORE_EXPORT std::string_view version() noexcept;

    /**
     * @brief Returns build-time information about the library.
     */
    ATOMKIT_CORE_EXPORT BuildInfo get_build_info();

} // namespace atomkit::core
