#pragma once

/**
@file
@brief Classification of dump files against the catalog and a reference index.

Each file is hashed (after skipping its format header) and classified as:
- `ScanMatched`: the catalog has a media with the same digests;
- `ScanUnmatched`: neither the catalog nor a repair hypothesis recognizes the file;
- `ScanNeedsRepair`: the file matches a reference record once padding is added.
*/

#include <romcat/catalog/catalog_db.hpp>
#include <romcat/core/configuration.hpp>
#include <romcat/core/hash.hpp>
#include <romcat/core/types.hpp>
#include <romcat/db/hash_index.hpp>
#include <romcat/media/hasher.hpp>
#include <romcat/media/header_format.hpp>
#include <romcat/repair/repair_strategy.hpp>

#include <atomic>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace romcat::import {

struct ScanMatched {
    EntityID mediaId = kInvalidEntityID;
};

struct ScanUnmatched {
    /// @brief The reference record whose digests match the file, if the index knows it but the catalog does not.
    const db::ReferenceRecord *record = nullptr;
};

struct ScanNeedsRepair {
    repair::RepairMatch repair;
};

using ScanClassification = std::variant<ScanMatched, ScanUnmatched, ScanNeedsRepair>;

/// @brief The outcome of classifying one file.
struct ClassifiedFile {
    std::filesystem::path path;
    uint64 headerSkip = 0;
    FileDigests digests;
    ScanClassification classification;
};

/// @brief Parameters shared by every file of a scan.
struct ScanOptions {
    /// @brief Header format of the platform the files belong to.
    media::HeaderFormat headerFormat = media::HeaderFormat::None;

    /// @brief Kind of media the files were dumped from; selects the repair hypotheses.
    db::SourceKind sourceKind = db::SourceKind::Cartridge;

    size_t chunkSize = media::kDefaultChunkSize;

    /// @brief Whether to try repair hypotheses on files the catalog and the index do not recognize.
    bool tryRepair = true;
};

/// @brief Classifies a single file.
///
/// The file is matched in this order:
/// 1. a catalog media with the same SHA-1, or else the same CRC32 and size;
/// 2. a reference record in the index, resolved to the catalog media with the record's name;
/// 3. a repair hypothesis from `repair::FindRepairAny`.
///
/// @param[in] path the file to classify
/// @param[in] index the reference index
/// @param[in] db the catalog store
/// @param[in] options the scan parameters
/// @param[out] error receives the error if the file or the catalog could not be read
/// @return the classification, or `std::nullopt` on error
std::optional<ClassifiedFile> ClassifyFile(const std::filesystem::path &path, const db::HashIndex &index,
                                           catalog::CatalogDB &db, const ScanOptions &options,
                                           std::error_code &error);

/// @brief Counters reported by `ScanFiles`.
struct ScanStats {
    uint64 files = 0;      ///< Number of files processed
    uint64 matched = 0;    ///< Number of files matched to a catalog media
    uint64 unmatched = 0;  ///< Number of unrecognized files
    uint64 repairable = 0; ///< Number of files that match after a repair
    uint64 errors = 0;     ///< Number of files that could not be classified
    bool cancelled = false;
};

/// @brief Receives per-file notifications from `ScanFiles`.
///
/// Callbacks are invoked synchronously on the scanning thread.
class IScanListener {
public:
    virtual ~IScanListener() = default;

    /// @brief Invoked before a file is classified.
    /// @param[in] current the zero-based index of the file
    /// @param[in] total the number of files in the batch
    /// @param[in] path the file path
    virtual void OnFile(size_t current, size_t total, const std::filesystem::path &path) {}

    /// @brief Invoked when a file matches a catalog media.
    /// @param[in] file the classified file
    /// @param[in] title the name of the matched media
    virtual void OnMatch(const ClassifiedFile &file, std::string_view title) {}

    virtual void OnNoMatch(const ClassifiedFile &file) {}

    virtual void OnRepairable(const ClassifiedFile &file, const repair::RepairMatch &repair) {}

    /// @brief Invoked when a file could not be classified. The scan continues with the next file.
    virtual void OnError(const std::filesystem::path &path, std::error_code error) {}

    virtual void OnComplete(const ScanStats &stats) {}
};

/// @brief Classifies a list of files.
///
/// Files that cannot be classified are reported to `IScanListener::OnError` and counted as errors; the scan continues.
///
/// @param[in] paths the files to classify
/// @param[in] index the reference index
/// @param[in] db the catalog store
/// @param[in] options the scan parameters
/// @param[in] listener receives progress notifications; may be `nullptr`
/// @param[in] cancel checked between files; the scan stops when set. May be `nullptr`
/// @return the scan statistics
ScanStats ScanFiles(std::span<const std::filesystem::path> paths, const db::HashIndex &index, catalog::CatalogDB &db,
                    const ScanOptions &options, IScanListener *listener, const std::atomic_bool *cancel);

/// @brief Collects the regular files under a directory that the scan configuration accepts.
///
/// @param[in] root the directory to scan
/// @param[in] config the scan configuration (extensions and recursion)
/// @param[out] error receives the error if the directory could not be listed
/// @return the file paths sorted by path
std::vector<std::filesystem::path> CollectScanFiles(const std::filesystem::path &root,
                                                    const Configuration::Scan &config, std::error_code &error);

} // namespace romcat::import
