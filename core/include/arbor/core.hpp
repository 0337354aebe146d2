#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// Symbol visibility macros
#if defined(_WIN32)
  #if defined(ARBOR_CORE_EXPORTS)
    #define ARBOR_CORE_EXPORT __declspec(dllexport)
  #else
    #define ARBOR_CORE_EXPORT __declspec(dllimport)
  #endif
#else
  #define ARBOR_CORE_EXPORT __attribute__((visibility("default")))
#endif

namespace arbor::core {

    struct BuildInfo {
        std::string compiler;
        std::string architecture;
        std::string standard;
        size_t object_id_length;
        size_t default_path_size;
    };

    /**
     * @brief Returns the version of the arbor core library.
     */
    ARBOR_CORE_EXPORT std::string_view version() noexcept;

    /**
     * @brief Returns build-time information about the library.
     */
    ARBOR_CORE_EXPORT BuildInfo get_build_info();

} // namespace arbor::core
