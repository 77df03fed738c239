#pragma once

/**
@file
@brief Field-level merging of facts from multiple sources with disagreement tracking.
*/

#include <romcat/catalog/catalog_db.hpp>
#include <romcat/catalog/catalog_types.hpp>

#include <romcat/core/types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace romcat::import {

/// @brief Source name under which reference-database imports hold authority over existing catalog values.
inline constexpr std::string_view kDatImportSource = "dat-import";

/// @brief Compares an existing field value with a value proposed by another source.
///
/// Records an unresolved disagreement if both values are present and differ. The existing value is never changed; the
/// first writer keeps authority until a human resolves the conflict.
///
/// @param[in] db the catalog store
/// @param[in] type the type of the entity that owns the field
/// @param[in] entityId the ID of the entity that owns the field
/// @param[in] field the field name
/// @param[in] sourceA the source of the existing value
/// @param[in] existing the existing value; absent or empty means there is nothing to disagree with
/// @param[in] sourceB the source of the proposed value
/// @param[in] proposed the proposed value
/// @param[out] error receives the error if the disagreement could not be recorded
/// @return `true` if a disagreement was recorded; `false` if the values agree, if either is missing, or on error
bool CheckField(catalog::CatalogDB &db, catalog::EntityType type, EntityID entityId, std::string_view field,
                std::string_view sourceA, const std::optional<std::string> &existing, std::string_view sourceB,
                const std::optional<std::string> &proposed, std::error_code &error);

/// @brief Values proposed by a source for the mutable fields of a release. Absent fields propose nothing.
struct ReleaseFields {
    std::optional<std::string> title;
    std::optional<std::string> altTitle;
    std::optional<std::string> releaseDate;
    std::optional<std::string> genre;
    std::optional<std::string> players;
    std::optional<std::string> description;
};

/// @brief Merges the values proposed by a source into a release.
///
/// Fields that are empty in the release are filled with the proposed value. Fields that are set and differ from the
/// proposed value produce a disagreement and keep their value. Runs in a single transaction.
///
/// @param[in] db the catalog store
/// @param[in] releaseId the release to merge into
/// @param[in] existingSource the source holding authority over the release's current values
/// @param[in] newSource the source of the proposed values
/// @param[in] fields the proposed values
/// @param[out] error receives the error if the merge failed
/// @return the number of disagreements recorded, or `std::nullopt` on error
std::optional<uint64> MergeReleaseFields(catalog::CatalogDB &db, EntityID releaseId, std::string_view existingSource,
                                         std::string_view newSource, const ReleaseFields &fields,
                                         std::error_code &error);

} // namespace romcat::import
