#pragma once

/**
@file
@brief Batch deduplication of works created under inconsistent names.
*/

#include <romcat/catalog/catalog_db.hpp>

#include <romcat/core/types.hpp>

#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace romcat::import {

struct ReconcileOptions {
    /// @brief Platforms to reconcile. An empty list reconciles every platform.
    std::vector<std::string> platformIds;

    /// @brief Compute the statistics without modifying the catalog.
    bool dryRun = false;
};

struct ReconcileStats {
    uint64 groupsFound = 0;        ///< Number of title groups spanning more than one work
    uint64 worksMerged = 0;        ///< Number of works absorbed into a surviving work
    uint64 worksDeleted = 0;       ///< Number of absorbed works deleted
    uint64 releasesReassigned = 0; ///< Number of releases moved to a surviving work
    uint64 releasesMerged = 0;     ///< Number of colliding releases folded into an existing release
    uint64 mediaMoved = 0;         ///< Number of media moved off colliding releases

    bool operator==(const ReconcileStats &) const = default;
};

/// @brief What happened to one group of duplicate works.
struct MergeDetail {
    std::string platformId;
    EntityID survivorId = kInvalidEntityID;
    std::string survivorTitle;
    std::vector<EntityID> absorbedIds;
    std::vector<std::string> absorbedTitles;

    /// @brief Total number of releases attached to the works of the group before the merge.
    uint64 totalReleases = 0;
};

struct ReconcileResult {
    ReconcileStats stats;
    std::vector<MergeDetail> details;
};

/// @brief Merges works whose releases on a platform share a normalized title.
///
/// Releases are grouped by platform and `catalog::NormalizeTitleKey` of their title. Releases whose title yields an empty key are
/// left out. In each group spanning more than
/// one work, the work with the most releases survives (ties go to the lowest ID). Every release of the other works is
/// moved to the survivor and the absorbed works are deleted. When a moved release collides with a release of the
/// survivor on the same platform and region, its media and disagreements are moved to the existing release and the
/// duplicate release is deleted.
///
/// The whole batch runs in a single transaction. A dry run reports exactly the statistics and details of a real run
/// without modifying the catalog.
///
/// @param[in] db the catalog store
/// @param[in] options the reconciliation options
/// @param[out] error receives the error if the catalog could not be read or written
/// @return the statistics and per-group details, or `std::nullopt` on error
std::optional<ReconcileResult> ReconcileWorks(catalog::CatalogDB &db, const ReconcileOptions &options,
                                              std::error_code &error);

} // namespace romcat::import
