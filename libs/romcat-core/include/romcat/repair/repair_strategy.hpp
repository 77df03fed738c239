#pragma once

/**
@file
@brief Detection of byte-imperfect dumps by testing padding hypotheses against a reference index.

A dump whose hash is not in the reference index may still be a known game with missing padding: a cartridge dump
trimmed to its used size, or a disc image ripped without the lead-in pregap. The functions here generate padding
hypotheses, hash the file as if the padding were present and look the result up in the index. Files are never
modified during detection; `ApplyRepair` writes a detected repair on explicit request.
*/

#include <romcat/core/hash.hpp>
#include <romcat/core/types.hpp>
#include <romcat/db/hash_index.hpp>
#include <romcat/db/reference_record.hpp>
#include <romcat/media/hasher.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace romcat::repair {

/// @brief Size of the standard CD lead-in pregap: 2 seconds * 75 sectors per second * 2352 bytes per sector.
inline constexpr uint64 kCDPregapSize = 2 * 75 * 2352;

static_assert(kCDPregapSize == 352800);

/// @brief A repair hypothesis.
struct RepairStrategy {
    media::PaddingSpec padding;

    /// @brief Number of bytes the repair adds to the file.
    uint64 BytesAdded() const {
        return padding.TotalSize();
    }

    /// @brief Describes the repair, e.g. `"append 1 MB of 0x00"` or `"prepend 352800 bytes of 0x00"`.
    std::string Describe() const;

    bool operator==(const RepairStrategy &) const = default;
};

/// @brief Generates the repair hypotheses for a dump, in the order they should be tried.
///
/// - If the expected size is known and larger than the actual size: append the difference, filled with 0x00 and then
///   with 0xFF.
/// - For optical disc dumps: prepend the CD pregap, filled with 0x00.
/// - If the expected size is unknown, the dump is a cartridge and its size is not a power of two: append up to the next
///   power of two, filled with 0x00 and then with 0xFF.
///
/// @param[in] actualSize the size of the dump data, excluding any header
/// @param[in] expectedSize the size of a good dump, if known
/// @param[in] sourceKind the kind of media the dump comes from
/// @return the hypotheses; empty if there is nothing to try
std::vector<RepairStrategy> BuildStrategies(uint64 actualSize, std::optional<uint64> expectedSize,
                                            db::SourceKind sourceKind);

/// @brief A successful repair detection.
struct RepairMatch {
    const db::ReferenceRecord *record = nullptr; ///< The matched reference record, owned by the index
    media::PaddingSpec padding;
    std::string method; ///< Human-readable description of the repair
    uint64 bytesAdded = 0;
    FileDigests digests; ///< The digests of the repaired data
};

/// @brief Parameters of a repair search.
struct RepairQuery {
    /// @brief Number of leading header bytes excluded from hashing.
    uint64 headerSkip = 0;

    db::SourceKind sourceKind = db::SourceKind::Cartridge;

    /// @brief Size of the buffer used to stream the file and padding into the hash functions.
    size_t chunkSize = media::kDefaultChunkSize;
};

/// @brief Tries the repair hypotheses for a file against the index.
///
/// Hypotheses are tried in the order produced by `BuildStrategies`; when every record in the index has an expected
/// length, hypotheses whose resulting size matches no record are skipped without hashing. The first hypothesis whose digests are found in the index wins.
///
/// @param[in] path the file to test
/// @param[in] expectedSize the size of a good dump excluding any header, if known
/// @param[in] query the search parameters
/// @param[in] index the reference index
/// @param[out] error receives the error if the file could not be read
/// @return the detected repair, or `std::nullopt` if no hypothesis matched or on error
std::optional<RepairMatch> FindRepair(const std::filesystem::path &path, std::optional<uint64> expectedSize,
                                      const RepairQuery &query, const db::HashIndex &index, std::error_code &error);

/// @brief Tries every plausible repair for a file whose expected size is unknown.
///
/// Only the hypotheses for an unknown expected size are tried, so the file is hashed at most a few times regardless of
/// the size of the index.
///
/// @param[in] path the file to test
/// @param[in] query the search parameters
/// @param[in] index the reference index
/// @param[out] error receives the error if the file could not be read
/// @return the detected repair, or `std::nullopt` if no hypothesis matched or on error
std::optional<RepairMatch> FindRepairAny(const std::filesystem::path &path, const RepairQuery &query,
                                         const db::HashIndex &index, std::error_code &error);

/// @brief Returns the path of the backup made by `ApplyRepair`: the file name with `.bak` appended.
std::filesystem::path BackupPath(const std::filesystem::path &path);

/// @brief Writes the padding into a file.
///
/// Appended padding is written in place. Prepended padding is written to a temporary file together with the original
/// contents, which then replaces the original. An existing backup is never overwritten.
///
/// @param[in] path the file to repair
/// @param[in] padding the padding to write
/// @param[in] createBackup whether to copy the original to `BackupPath(path)` first
/// @param[out] error receives the error if the file could not be written
/// @return `true` if the file was repaired
bool ApplyRepair(const std::filesystem::path &path, const media::PaddingSpec &padding, bool createBackup,
                 std::error_code &error);

} // namespace romcat::repair
