#pragma once

/**
@file
@brief Application of human-curated overrides to the catalog.
*/

#include <romcat/catalog/catalog_db.hpp>
#include <romcat/catalog/catalog_types.hpp>

#include <romcat/core/types.hpp>

#include <optional>
#include <span>
#include <string_view>
#include <system_error>

namespace romcat::import {

/// @brief Matches a string against a glob pattern.
///
/// `*` matches any run of characters, including an empty one; `?` matches exactly one character. Every other character
/// matches itself. The whole string must match.
///
/// @param[in] pattern the glob pattern
/// @param[in] text the string to test
/// @return `true` if `text` matches `pattern`
bool GlobMatch(std::string_view pattern, std::string_view text);

/// @brief Applies overrides to the catalog.
///
/// Overrides with an entity ID update that entity. Overrides with a dat-name pattern update every media whose dat-name
/// matches, restricted to the override's platform if it has one; release overrides update the release owning each
/// matching media. An override that matches nothing is not an error.
///
/// All updates run in a single transaction.
///
/// @param[in] db the catalog store
/// @param[in] overrides the overrides to apply
/// @param[out] error receives the error if an update failed
/// @return the number of field updates made, or `std::nullopt` on error
std::optional<uint64> ApplyOverrides(catalog::CatalogDB &db, std::span<const catalog::Override> overrides,
                                     std::error_code &error);

} // namespace romcat::import
