#pragma once

/**
@file
@brief Core type definitions.

Defines aliases for the fixed-width integer types used throughout the library and the identifier type of catalog rows.
*/

#include <cstdint>

using uint8 = uint8_t;
using uint16 = uint16_t;
using uint32 = uint32_t;
using uint64 = uint64_t;

using sint8 = int8_t;
using sint16 = int16_t;
using sint32 = int32_t;
using sint64 = int64_t;

namespace romcat {

/// @brief Identifier of a Work, Release, Media, Disagreement or ImportLog row in the catalog.
///
/// Identifiers are assigned by the catalog store in increasing order and are never reused.
using EntityID = sint64;

/// @brief An identifier that never refers to a stored entity.
inline constexpr EntityID kInvalidEntityID = 0;

} // namespace romcat
