#pragma once

/**
@file
@brief Defines `romcat::db::HashIndex`, an immutable lookup index over a reference database.
*/

#include "reference_record.hpp"

#include <romcat/core/hash.hpp>
#include <romcat/core/types.hpp>

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace romcat::db {

/// @brief An immutable index of reference records by primary hash, secondary hash and serial.
///
/// When two records share a key, the record inserted first wins and later duplicates are not reachable through that
/// key. All lookups ignore the letter case of hex digits.
///
/// The index is never modified after construction and may be shared across threads without synchronization.
class HashIndex {
public:
    HashIndex() = default;

    /// @brief Builds the index from a batch of records.
    /// @param[in] records the reference records, in priority order
    explicit HashIndex(std::vector<ReferenceRecord> records);

    /// @brief Looks up a record by primary hash (SHA-1).
    /// @param[in] hash the hex-encoded hash
    /// @return a pointer to the record, or `nullptr` if no record has that hash
    const ReferenceRecord *LookupPrimary(std::string_view hash) const;

    /// @brief Looks up a record by secondary hash (CRC32).
    /// @param[in] hash the hex-encoded hash
    /// @return a pointer to the record, or `nullptr` if no record has that hash
    const ReferenceRecord *LookupSecondary(std::string_view hash) const;

    /// @brief Looks up a record by product serial.
    ///
    /// Serials are compared ignoring case, spaces and dashes, so `"SLUS-00594"` matches `"slus 00594"`.
    ///
    /// @param[in] serial the serial
    /// @return a pointer to the record, or `nullptr` if no record has that serial
    const ReferenceRecord *LookupSerial(std::string_view serial) const;

    /// @brief Looks up a record by the digests of a file.
    ///
    /// Tries the SHA-1 first. The CRC32 fallback rejects records whose expected length is known and differs from
    /// `digests.dataSize`.
    ///
    /// @param[in] digests the digests to look up
    /// @return a pointer to the record, or `nullptr` if no record matched
    const ReferenceRecord *LookupDigests(const FileDigests &digests) const;

    /// @brief Retrieves every record with the given expected length, in insertion order.
    std::vector<const ReferenceRecord *> CandidatesBySize(uint64 length) const;

    /// @brief Retrieves the distinct expected lengths of all records, in ascending order.
    std::vector<uint64> ExpectedLengths() const;

    /// @brief Total number of records, including those shadowed by duplicates.
    size_t Size() const {
        return m_records.size();
    }

    /// @brief Number of distinct primary hashes.
    size_t PrimaryCount() const {
        return m_byPrimary.size();
    }

    /// @brief Number of distinct secondary hashes.
    size_t SecondaryCount() const {
        return m_bySecondary.size();
    }

    /// @brief Number of records without an expected length.
    size_t UnsizedCount() const {
        return m_unsizedCount;
    }

    /// @brief Number of distinct normalized serials.
    size_t SerialCount() const {
        return m_bySerial.size();
    }

    const std::vector<ReferenceRecord> &Records() const {
        return m_records;
    }

private:
    std::vector<ReferenceRecord> m_records;

    // Values are indices into m_records
    std::unordered_map<std::string, size_t> m_byPrimary;
    std::unordered_map<std::string, size_t> m_bySecondary;
    std::unordered_map<std::string, size_t> m_bySerial;

    size_t m_unsizedCount = 0;

    const ReferenceRecord *Find(const std::unordered_map<std::string, size_t> &map, const std::string &key) const;
};

/// @brief Normalizes a serial for comparison: uppercase with spaces and dashes removed.
std::string NormalizeSerial(std::string_view serial);

} // namespace romcat::db
