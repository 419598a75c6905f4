#pragma once

/**
@file
@brief Nitro library version definitions.
*/

#if Nitro_DEV_BUILD
    #define Nitro_FULL_VERSION Nitro_VERSION "-dev"
#else
    #define Nitro_FULL_VERSION Nitro_VERSION
#endif

namespace nitro::version {

/// @brief The library version string in the format "<major>.<minor>.<patch>".
inline constexpr auto string = Nitro_VERSION;

/// @brief The library version string with a `-dev` suffix for development builds.
inline constexpr auto fullstring = Nitro_FULL_VERSION;

inline constexpr auto major = static_cast<unsigned>(Nitro_VERSION_MAJOR); ///< The library's major version
inline constexpr auto minor = static_cast<unsigned>(Nitro_VERSION_MINOR); ///< The library's minor version
inline constexpr auto patch = static_cast<unsigned>(Nitro_VERSION_PATCH); ///< The library's patch version

} // namespace nitro::version
