#pragma once

/**
@file
@brief Import of reference database records into the catalog.
*/

#include <romcat/catalog/catalog_db.hpp>
#include <romcat/catalog/catalog_types.hpp>
#include <romcat/catalog/name_parser.hpp>
#include <romcat/db/reference_record.hpp>

#include <romcat/core/types.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace romcat::import {

/// @brief Counters reported by `ImportReferenceRecords`.
struct ImportStats {
    uint64 records = 0;       ///< Number of records processed
    uint64 created = 0;       ///< Number of media created
    uint64 updated = 0;       ///< Number of existing media whose fields changed
    uint64 unchanged = 0;     ///< Number of existing media left as they were
    uint64 skipped = 0;       ///< Number of records not imported (bad dumps and invalid records)
    uint64 disagreements = 0; ///< Number of disagreements recorded while merging release fields
};

/// @brief Receives progress notifications from `ImportReferenceRecords`.
///
/// Callbacks are invoked synchronously on the importing thread.
class IImportListener {
public:
    virtual ~IImportListener() = default;

    /// @brief Invoked before a record is processed.
    /// @param[in] current the zero-based index of the record
    /// @param[in] total the number of records in the batch
    /// @param[in] name the record name
    virtual void OnRecord(size_t current, size_t total, std::string_view name) {}

    /// @brief Invoked when a record is skipped.
    virtual void OnSkipped(std::string_view name, std::string_view reason) {}

    /// @brief Invoked once after the whole batch has been imported.
    virtual void OnComplete(const ImportStats &stats) {}
};

/// @brief Identifies the reference database being imported.
struct ImportSource {
    std::string type = "dat";           ///< Kind of source, recorded in the import log
    std::string name;                   ///< Source name, recorded in media and disagreements
    std::optional<std::string> version; ///< Source version, recorded in the import log
};

/// @brief Derives a media status from the dump status and flags of a parsed name.
///
/// `[b]` maps to bad, `[o]` to overdump; otherwise flags starting with `Proto` or `Beta` map to prototype or beta and a
/// `Sample` flag maps to sample.
catalog::MediaStatus StatusFromName(const catalog::ParsedName &name);

/// @brief Imports reference records for one platform into the catalog.
///
/// For each record:
/// - bad dumps are skipped;
/// - the work is found by its exact title or created;
/// - the release is found by (work, platform, region slug of the first region) or created; existing releases are merged
///   with `MergeReleaseFields`, with the catalog's values holding authority;
/// - the media is found by dat-name and created, updated or left unchanged.
///
/// A record that cannot be written is rolled back and counted as skipped; the batch continues. The run appends one
/// entry to the import log.
///
/// @param[in] db the catalog store
/// @param[in] platformId the platform the records belong to
/// @param[in] records the reference records
/// @param[in] source the reference database being imported
/// @param[in] listener receives progress notifications; may be `nullptr`
/// @param[out] error receives the error if the import could not run
/// @return the import statistics, or `std::nullopt` on error
std::optional<ImportStats> ImportReferenceRecords(catalog::CatalogDB &db, std::string_view platformId,
                                                  std::span<const db::ReferenceRecord> records,
                                                  const ImportSource &source, IImportListener *listener,
                                                  std::error_code &error);

} // namespace romcat::import
