#pragma once

/**
@file
@brief Streaming CRC32, SHA-1 and MD5 hashing with logical padding.
*/

#include <romcat/core/hash.hpp>
#include <romcat/core/types.hpp>

#include <romcat/util/size_ops.hpp>

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <span>
#include <system_error>

namespace romcat::media {

/// @brief Default size of the buffer used to stream data and padding into the hash functions.
inline constexpr size_t kDefaultChunkSize = 64_KiB;

/// @brief Bytes logically added around the hashed data without modifying the source.
struct PaddingSpec {
    uint64 prependSize = 0; ///< Number of fill bytes hashed before the data
    uint64 appendSize = 0;  ///< Number of fill bytes hashed after the data
    uint8 fillByte = 0x00;

    uint64 TotalSize() const {
        return prependSize + appendSize;
    }

    bool IsEmpty() const {
        return prependSize == 0 && appendSize == 0;
    }

    bool operator==(const PaddingSpec &) const = default;
};

/// @brief Computes CRC32, SHA-1 and MD5 digests in a single pass over incrementally supplied data.
class Hasher {
public:
    Hasher();
    ~Hasher();

    Hasher(const Hasher &) = delete;
    Hasher &operator=(const Hasher &) = delete;

    /// @brief Feeds data into the hash functions.
    /// @param[in] data the data to hash
    /// @param[out] error receives the error if the digest functions failed
    /// @return `true` if the data was hashed
    bool Update(std::span<const uint8> data, std::error_code &error);

    /// @brief Feeds `count` copies of `fillByte` into the hash functions, `chunkSize` bytes at a time.
    bool UpdateFill(uint8 fillByte, uint64 count, size_t chunkSize, std::error_code &error);

    /// @brief Finalizes the digests. The hasher cannot be updated afterwards.
    /// @param[out] error receives the error if the digest functions failed
    /// @return the digests, or `std::nullopt` on failure
    std::optional<FileDigests> Finish(std::error_code &error);

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

/// @brief Hashes an in-memory buffer with optional padding.
/// @param[in] data the data to hash
/// @param[in] padding the padding to hash around the data
/// @param[out] error receives the error if the digest functions failed
/// @return the digests, or `std::nullopt` on failure
std::optional<FileDigests> HashBuffer(std::span<const uint8> data, const PaddingSpec &padding,
                                      std::error_code &error);

/// @brief Hashes the contents of a stream with optional padding.
///
/// Skips `skip` bytes from the current position, then hashes the prepended padding, the rest of the stream and the
/// appended padding, in that order. Memory use is bounded by `chunkSize` regardless of the padding size.
///
/// @param[in] in the stream to read
/// @param[in] skip the number of leading bytes to exclude from the hash (e.g. a copier header)
/// @param[in] padding the padding to hash around the data
/// @param[in] chunkSize the size of the read buffer
/// @param[out] error receives the error if the stream could not be read
/// @return the digests, or `std::nullopt` on failure
std::optional<FileDigests> HashStream(std::istream &in, uint64 skip, const PaddingSpec &padding, size_t chunkSize,
                                      std::error_code &error);

/// @brief Hashes a file with optional padding. See `HashStream`.
std::optional<FileDigests> HashFile(const std::filesystem::path &path, uint64 skip, const PaddingSpec &padding,
                                    size_t chunkSize, std::error_code &error);

} // namespace romcat::media
