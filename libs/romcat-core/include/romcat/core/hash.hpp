#pragma once

/**
@file
@brief Digest types for the hash algorithms used by reference databases.
*/

#include <romcat/core/types.hpp>

#include <array>
#include <string>

namespace romcat {

/// @brief Canonical representation of a SHA-1 digest.
using SHA1Hash = std::array<uint8, 20>;

/// @brief Canonical representation of an MD5 digest.
using MD5Hash = std::array<uint8, 16>;

/// @brief The digests computed in a single pass over a data stream.
struct FileDigests {
    uint32 crc32 = 0;
    SHA1Hash sha1{};
    MD5Hash md5{};

    /// @brief Number of bytes fed into the hash functions, including any logical padding.
    uint64 dataSize = 0;
};

/// @brief Converts a CRC32 checksum into a string.
/// @param[in] crc32 the checksum
/// @return the checksum as an 8-character string of lowercase hex digits
std::string ToString(uint32 crc32);

/// @brief Converts a SHA-1 digest into a string.
/// @param[in] hash the digest
/// @return the digest as a 40-character string of lowercase hex digits
std::string ToString(const SHA1Hash &hash);

/// @brief Converts an MD5 digest into a string.
/// @param[in] hash the digest
/// @return the digest as a 32-character string of lowercase hex digits
std::string ToString(const MD5Hash &hash);

} // namespace romcat
