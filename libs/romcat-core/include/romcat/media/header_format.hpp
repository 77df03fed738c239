#pragma once

/**
@file
@brief Per-platform dump header formats and detection of the header bytes excluded from hashing.

Reference databases hash the raw ROM data, but dumps of several platforms commonly carry a format header in front of
it. The formats are a closed set; each platform definition names the one its dumps may use.
*/

#include <romcat/core/types.hpp>

#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <system_error>

namespace romcat::media {

/// @brief Dump header formats.
enum class HeaderFormat {
    None,       ///< No header; hash the whole file
    INES,       ///< NES iNES/NES 2.0: 16 bytes starting with "NES\x1A"
    FDS,        ///< Famicom Disk System fwNES: 16 bytes starting with "FDS\x1A"
    SNESCopier, ///< SNES copier header: 512 bytes, detected by file size modulo 1024
    AtariLynx,  ///< Atari Lynx LNX: 64 bytes starting with "LYNX"
    Atari7800,  ///< Atari 7800 A78: 128 bytes with "ATARI7800" at offset 1
};

/// @brief Number of leading bytes `DeriveHeaderSkip` needs to inspect.
inline constexpr size_t kHeaderProbeSize = 16;

/// @brief Determines how many leading bytes of a dump are a format header.
///
/// The result never exceeds `fileSize`. A header is only reported when its signature is present, so headerless dumps
/// of the same platform hash in full.
///
/// @param[in] format the header format used by the dump's platform
/// @param[in] head the first bytes of the file (up to `kHeaderProbeSize`; shorter for small files)
/// @param[in] fileSize the total size of the file
/// @return the number of bytes to skip before hashing
uint64 DeriveHeaderSkip(HeaderFormat format, std::span<const uint8> head, uint64 fileSize);

/// @brief Determines how many leading bytes of a file are a format header.
/// @param[in] format the header format used by the dump's platform
/// @param[in] path the path to the file
/// @param[out] error receives the error if the file could not be read
/// @return the number of bytes to skip before hashing, or 0 on error
uint64 DeriveHeaderSkip(HeaderFormat format, const std::filesystem::path &path, std::error_code &error);

std::string_view ToString(HeaderFormat format);
std::optional<HeaderFormat> ParseHeaderFormat(std::string_view str);

} // namespace romcat::media
