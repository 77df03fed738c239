#pragma once

/**
@file
@brief Defines `romcat::db::ReferenceRecord`, an entry of a reference game database.
*/

#include <romcat/core/types.hpp>

#include <optional>
#include <string>

namespace romcat::db {

/// @brief Physical origin of the dumps described by a reference database.
enum class SourceKind {
    Cartridge,   ///< ROM chips; dumps are usually sized to a power of two
    OpticalDisc, ///< CD/DVD images; dumps may be missing the lead-in pregap
};

/// @brief A game entry from a reference database (a No-Intro/Redump DAT or similar).
struct ReferenceRecord {
    /// @brief The entry name, e.g. `"Super Mario Bros. (World)"`.
    std::string name;

    /// @brief The game title without tags.
    std::string title;

    /// @brief Primary hash as a hex string (SHA-1 in practice). Compared ignoring case.
    std::optional<std::string> primaryHash;

    /// @brief Secondary hash as a hex string (CRC32 in practice). Compared ignoring case.
    std::optional<std::string> secondaryHash;

    /// @brief MD5 hash as a hex string, when the reference database provides one.
    std::optional<std::string> md5;

    /// @brief Product serial, possibly a comma-separated list of serials.
    std::optional<std::string> serial;

    /// @brief Size of a good dump in bytes.
    std::optional<uint64> expectedLength;

    SourceKind sourceKind = SourceKind::Cartridge;

    std::optional<std::string> region;
    std::optional<std::string> releaseDate;
    std::optional<std::string> developer;
    std::optional<std::string> publisher;
    std::optional<std::string> genre;
    std::optional<std::string> players;
};

} // namespace romcat::db
