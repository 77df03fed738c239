#pragma once

/**
@file
@brief Entity types stored in the game catalog.

The catalog is a graph of platforms, companies, works, releases and media:
- A `Work` is an abstract game independent of region and platform.
- A `Release` is one platform- and region-specific edition of a work.
- A `Media` is one dump of a release, carrying its hashes and dump status.

`Override`s, `Disagreement`s and `ImportLog`s record curated corrections, conflicts between sources and the import
audit trail.
*/

#include <romcat/core/types.hpp>

#include <romcat/media/header_format.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace romcat::catalog {

/// @brief Physical media type of a platform.
enum class MediaType { Cartridge, Disc, Card, Digital };

/// @brief Kind of relationship between two platforms.
enum class PlatformRelationship { RegionalVariant, Successor, Addon, Compatible };

/// @brief Status of a media dump.
enum class MediaStatus { Verified, Bad, Overdump, Prototype, Beta, Sample };

/// @brief Entity types that can be targeted by overrides and disagreements.
enum class EntityType { Work, Release, Media };

std::string_view ToString(MediaType type);
std::string_view ToString(PlatformRelationship rel);
std::string_view ToString(MediaStatus status);
std::string_view ToString(EntityType type);

std::optional<MediaType> ParseMediaType(std::string_view str);
std::optional<PlatformRelationship> ParsePlatformRelationship(std::string_view str);
std::optional<EntityType> ParseEntityType(std::string_view str);

/// @brief Parses a media status leniently. Accepts `proto` for `Prototype`; unknown strings map to `Verified`.
MediaStatus ParseMediaStatus(std::string_view str);

// -----------------------------------------------------------------------------
// Curated entities

/// @brief Release date of a platform in one region.
struct PlatformRegion {
    std::string region;
    std::optional<std::string> releaseDate;
};

/// @brief A relationship from a platform to another platform.
struct PlatformRelation {
    std::string platformId;
    PlatformRelationship type = PlatformRelationship::RegionalVariant;
};

/// @brief A game platform, loaded from curated definitions.
struct Platform {
    std::string id; ///< Slug, e.g. `"nes"`
    std::string displayName;
    std::string shortName;
    std::string manufacturer;
    std::optional<uint32> generation;
    MediaType mediaType = MediaType::Cartridge;
    std::optional<uint32> releaseYear;
    std::optional<std::string> description;

    /// @brief The header format of dumps for this platform, used to locate the hashed data.
    media::HeaderFormat headerFormat = media::HeaderFormat::None;

    std::vector<PlatformRegion> regions;
    std::vector<PlatformRelation> relationships;
};

/// @brief A publisher or developer, loaded from curated definitions.
struct Company {
    std::string id;
    std::string name;
    std::optional<std::string> country;

    /// @brief Alternate spellings used to resolve free-text publisher and developer strings.
    std::vector<std::string> aliases;
};

/// @brief A human-curated correction applied after imports.
///
/// Targets either a single entity by `entityId` or every media whose dat-name matches `datNamePattern`, optionally
/// restricted to one platform. For `EntityType::Release` overrides matched by pattern, the field is set on the release
/// that owns each matching media.
struct Override {
    EntityType entityType = EntityType::Media;
    std::optional<EntityID> entityId;
    std::optional<std::string> platformId;

    /// @brief Glob pattern matched against `Media::datName`. `*` matches any run of characters, `?` one character.
    std::optional<std::string> datNamePattern;

    std::string field;
    std::string value;
    std::string reason;
};

// -----------------------------------------------------------------------------
// Imported entities

/// @brief An abstract game independent of region and platform.
struct Work {
    EntityID id = kInvalidEntityID;
    std::string title;
    std::string createdAt;
    std::string updatedAt;
};

/// @brief A regional release of a work on a platform.
///
/// `workId` and `platformId` must refer to existing entities. Releases are expected to be unique by
/// (`workId`, `platformId`, `region`), but duplicates are tolerated until reconciliation merges them.
struct Release {
    EntityID id = kInvalidEntityID;
    EntityID workId = kInvalidEntityID;
    std::string platformId;
    std::string region; ///< Region slug, e.g. `"usa"`
    std::string title;
    std::optional<std::string> altTitle;
    std::optional<std::string> publisherId;
    std::optional<std::string> developerId;
    std::optional<std::string> releaseDate;
    std::optional<std::string> serial;
    std::optional<std::string> genre;
    std::optional<std::string> players;
    std::optional<double> rating;
    std::optional<std::string> description;
    std::optional<std::string> externalId; ///< Identifier in the enrichment source
    bool notFoundInEnrichment = false;
    std::string createdAt;
    std::string updatedAt;
};

/// @brief A dump of a release.
///
/// `releaseId` must refer to an existing release. Hashes are lowercase hex strings and need not be unique across the
/// catalog.
struct Media {
    EntityID id = kInvalidEntityID;
    EntityID releaseId = kInvalidEntityID;
    std::optional<std::string> serial;
    std::optional<uint32> discNumber;
    std::optional<std::string> discLabel;
    std::optional<std::string> revision;
    MediaStatus status = MediaStatus::Verified;
    std::optional<std::string> datName;   ///< Name of the entry in the reference database
    std::optional<std::string> datSource; ///< Reference database that supplied the entry
    std::optional<uint64> fileSize;
    std::optional<std::string> crc32;
    std::optional<std::string> sha1;
    std::optional<std::string> md5;
    std::string createdAt;
    std::string updatedAt;
};

/// @brief A conflict between two sources' values for one field of an entity.
struct Disagreement {
    EntityID id = kInvalidEntityID;
    EntityType entityType = EntityType::Release;
    EntityID entityId = kInvalidEntityID;
    std::string field;
    std::string sourceA;
    std::optional<std::string> valueA;
    std::string sourceB;
    std::optional<std::string> valueB;
    bool resolved = false;
    std::optional<std::string> resolution;
    std::optional<std::string> resolvedAt;
    std::string createdAt;
};

/// @brief An entry in the append-only import audit trail.
struct ImportLog {
    EntityID id = kInvalidEntityID;
    std::string sourceType; ///< Kind of source, e.g. `"dat"`
    std::string sourceName;
    std::optional<std::string> sourceVersion;
    std::string importedAt;
    uint64 recordsCreated = 0;
    uint64 recordsUpdated = 0;
    uint64 recordsUnchanged = 0;
    uint64 disagreementsFound = 0;
};

// -----------------------------------------------------------------------------
// Queries

/// @brief Number of rows per entity type.
struct CatalogStats {
    uint64 platforms = 0;
    uint64 companies = 0;
    uint64 works = 0;
    uint64 releases = 0;
    uint64 media = 0;
    uint64 overrides = 0;
    uint64 unresolvedDisagreements = 0;
    uint64 importLogs = 0;
};

/// @brief Narrows down `CatalogDB::ListUnresolvedDisagreements`.
struct DisagreementFilter {
    std::optional<EntityType> entityType;
    std::optional<std::string> field;
    std::optional<EntityID> entityId;
    size_t limit = 0; ///< Maximum number of rows, or 0 for no limit
};

} // namespace romcat::catalog
