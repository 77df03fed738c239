#pragma once

/**
@file
@brief Parser for No-Intro/Redump style release names such as `"The Legend of Zelda (USA) (Rev A)"`.
*/

#include <romcat/core/types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace romcat::catalog {

/// @brief Fidelity of a dump relative to the reference, as encoded in square-bracket tags.
enum class DumpStatus { Verified, BadDump, Overdump };

/// @brief The structured fields extracted from a release name.
struct ParsedName {
    /// @brief The text before the first tag group, trimmed.
    std::string title;

    /// @brief Region names in order of appearance, without duplicates (e.g. `"USA"`, `"Europe"`).
    std::vector<std::string> regions;

    /// @brief Revision tag, e.g. `"Rev A"` or `"Rev 1"`.
    std::optional<std::string> revision;

    /// @brief Version tag, e.g. `"v1.1"`.
    std::optional<std::string> version;

    /// @brief Language codes in order of appearance (e.g. `"En"`, `"Fr"`).
    std::vector<std::string> languages;

    /// @brief Disc number from a `(Disc N)` tag.
    std::optional<uint32> discNumber;

    /// @brief Disc label from a `(Disc N - Label)` tag.
    std::optional<std::string> discLabel;

    /// @brief Every tag that is not one of the above, in order of appearance.
    ///
    /// Parenthesised flags are stored without parentheses (`"Proto"`), unknown bracketed flags keep their brackets
    /// (`"[T+Eng]"`).
    std::vector<std::string> flags;

    /// @brief Dump status from `[!]`, `[b]` or `[o]`. Defaults to `Verified`.
    DumpStatus dumpStatus = DumpStatus::Verified;

    /// @brief Determines if a flag was present, ignoring case.
    bool HasFlag(std::string_view flag) const;
};

/// @brief Parses a release name into structured fields.
///
/// The title ends at the first `(` or `[`. Each parenthesised group is classified independently as a region list, a
/// revision, a version, a disc spec, a language list or, failing all of those, a flag. Square-bracket groups encode
/// the dump status or are kept as flags. Names without any tag groups produce a title and default fields.
///
/// @param[in] name the release name
/// @return the parsed fields
ParsedName ParseName(std::string_view name);

/// @brief Determines if the string is a known region name or a comma-separated list of known region names.
///
/// The comparison ignores case.
///
/// @param[in] str the string to check
/// @return `true` if every comma-separated part is a known region
bool IsRegionList(std::string_view str);

/// @brief Converts a region display name to a lowercase hyphenated slug, e.g. `"United Kingdom"` to
/// `"united-kingdom"`.
///
/// Common abbreviations and alternate names map to the same slug as the canonical name (`"UK"` -> `"united-kingdom"`,
/// `"US"` -> `"usa"`). An empty name maps to `"unknown"`.
///
/// @param[in] region the region display name
/// @return the region slug
std::string RegionToSlug(std::string_view region);

/// @brief Converts free text to a lowercase slug: ASCII letters and digits are kept, every other run of characters
/// becomes a single hyphen.
///
/// @param[in] text the text to convert
/// @return the slug, without leading or trailing hyphens
std::string Slugify(std::string_view text);

/// @brief Builds the key used to detect titles that refer to the same work.
///
/// Tag groups are stripped, a trailing article is moved to the front (`"Legend of Zelda, The"` compares equal to
/// `"The Legend of Zelda"`), ASCII letters are lowercased, ASCII punctuation and whitespace are dropped
/// and non-ASCII characters are kept unchanged. A title made only of punctuation yields an empty key.
///
/// @param[in] title the title to normalize
/// @return the comparison key
std::string NormalizeTitleKey(std::string_view title);

} // namespace romcat::catalog
