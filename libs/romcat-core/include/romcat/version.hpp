#pragma once

/**
@file
@brief romcat library version definitions.
*/

#if Romcat_DEV_BUILD
    #define Romcat_FULL_VERSION Romcat_VERSION "-dev"
#else
    #define Romcat_FULL_VERSION Romcat_VERSION
#endif

namespace romcat::version {

/// @brief The library version string in the format "<major>.<minor>.<patch>".
inline constexpr auto string = Romcat_VERSION;

/// @brief The library version string with a `-dev` suffix on development builds.
inline constexpr auto fullstring = Romcat_FULL_VERSION;

inline constexpr auto major = static_cast<unsigned>(Romcat_VERSION_MAJOR); ///< The library's major version
inline constexpr auto minor = static_cast<unsigned>(Romcat_VERSION_MINOR); ///< The library's minor version
inline constexpr auto patch = static_cast<unsigned>(Romcat_VERSION_PATCH); ///< The library's patch version
inline constexpr auto prerelease = Romcat_VERSION_PRERELEASE;              ///< The library's prerelease version
inline constexpr auto build = Romcat_VERSION_BUILD;                        ///< The library's build version

} // namespace romcat::version
