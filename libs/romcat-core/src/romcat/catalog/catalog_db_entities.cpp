#include <romcat/catalog/catalog_db.hpp>

#include "sqlite_statement.hpp"

#include <romcat/util/dev_log.hpp>
#include <romcat/util/string_ops.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <concepts>

namespace romcat::catalog {

namespace grp {

    struct entities {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "CatalogDB-Entities";
    };

} // namespace grp

// -----------------------------------------------------------------------------
// Helpers

namespace {

    template <std::unsigned_integral T>
    std::optional<sint64> ToOptionalInt(const std::optional<T> &value) {
        if (value) {
            return static_cast<sint64>(*value);
        }
        return std::nullopt;
    }

    template <std::unsigned_integral T>
    std::optional<T> FromOptionalInt(const std::optional<sint64> &value) {
        if (value && *value >= 0) {
            return static_cast<T>(*value);
        }
        return std::nullopt;
    }

    std::optional<std::string> LowercaseHash(const std::optional<std::string> &hash) {
        if (hash) {
            return util::ToLower(*hash);
        }
        return std::nullopt;
    }

    // Escapes LIKE wildcards so that user text matches literally with ESCAPE '\'
    std::string EscapeLike(std::string_view text) {
        std::string result{};
        result.reserve(text.size());
        for (char ch : text) {
            if (ch == '%' || ch == '_' || ch == '\\') {
                result += '\\';
            }
            result += ch;
        }
        return result;
    }

    constexpr const char *kPlatformColumns = "id, display_name, short_name, manufacturer, generation, media_type, "
                                             "release_year, description, header_format";

    constexpr const char *kReleaseColumns =
        "r.id, r.work_id, r.platform_id, r.region, r.title, r.alt_title, r.publisher_id, r.developer_id, "
        "r.release_date, r.serial, r.genre, r.players, r.rating, r.description, r.external_id, "
        "r.enrichment_not_found, r.created_at, r.updated_at";

    constexpr const char *kMediaColumns = "m.id, m.release_id, m.serial, m.disc_number, m.disc_label, m.revision, "
                                          "m.status, m.dat_name, m.dat_source, m.file_size, m.crc32, m.sha1, m.md5, "
                                          "m.created_at, m.updated_at";

    Platform ReadPlatform(const sqlite::Statement &stmt) {
        return Platform{
            .id = stmt.Text(0),
            .displayName = stmt.Text(1),
            .shortName = stmt.Text(2),
            .manufacturer = stmt.Text(3),
            .generation = FromOptionalInt<uint32>(stmt.OptionalInt(4)),
            .mediaType = ParseMediaType(stmt.Text(5)).value_or(MediaType::Cartridge),
            .releaseYear = FromOptionalInt<uint32>(stmt.OptionalInt(6)),
            .description = stmt.OptionalText(7),
            .headerFormat = media::ParseHeaderFormat(stmt.Text(8)).value_or(media::HeaderFormat::None),
        };
    }

    Release ReadRelease(const sqlite::Statement &stmt) {
        return Release{
            .id = stmt.Int(0),
            .workId = stmt.Int(1),
            .platformId = stmt.Text(2),
            .region = stmt.Text(3),
            .title = stmt.Text(4),
            .altTitle = stmt.OptionalText(5),
            .publisherId = stmt.OptionalText(6),
            .developerId = stmt.OptionalText(7),
            .releaseDate = stmt.OptionalText(8),
            .serial = stmt.OptionalText(9),
            .genre = stmt.OptionalText(10),
            .players = stmt.OptionalText(11),
            .rating = stmt.OptionalReal(12),
            .description = stmt.OptionalText(13),
            .externalId = stmt.OptionalText(14),
            .notFoundInEnrichment = stmt.Int(15) != 0,
            .createdAt = stmt.Text(16),
            .updatedAt = stmt.Text(17),
        };
    }

    Media ReadMedia(const sqlite::Statement &stmt) {
        return Media{
            .id = stmt.Int(0),
            .releaseId = stmt.Int(1),
            .serial = stmt.OptionalText(2),
            .discNumber = FromOptionalInt<uint32>(stmt.OptionalInt(3)),
            .discLabel = stmt.OptionalText(4),
            .revision = stmt.OptionalText(5),
            .status = ParseMediaStatus(stmt.Text(6)),
            .datName = stmt.OptionalText(7),
            .datSource = stmt.OptionalText(8),
            .fileSize = FromOptionalInt<uint64>(stmt.OptionalInt(9)),
            .crc32 = stmt.OptionalText(10),
            .sha1 = stmt.OptionalText(11),
            .md5 = stmt.OptionalText(12),
            .createdAt = stmt.Text(13),
            .updatedAt = stmt.Text(14),
        };
    }

    template <typename T, typename Reader>
    std::vector<T> ReadAll(sqlite::Statement &stmt, Reader &&reader, std::error_code &error) {
        std::vector<T> result{};
        while (stmt.Step(error)) {
            result.push_back(reader(stmt));
        }
        if (error) {
            result.clear();
        }
        return result;
    }

    template <typename T, typename Reader>
    std::optional<T> ReadOne(sqlite::Statement &stmt, Reader &&reader, std::error_code &error) {
        if (stmt.Step(error)) {
            return reader(stmt);
        }
        return std::nullopt;
    }

    // Binds the release's descriptive columns to parameters 1 through 15
    void BindReleaseFields(sqlite::Statement &stmt, const Release &release) {
        stmt.BindInt(1, release.workId);
        stmt.BindText(2, release.platformId);
        stmt.BindText(3, release.region);
        stmt.BindText(4, release.title);
        stmt.BindOptionalText(5, release.altTitle);
        stmt.BindOptionalText(6, release.publisherId);
        stmt.BindOptionalText(7, release.developerId);
        stmt.BindOptionalText(8, release.releaseDate);
        stmt.BindOptionalText(9, release.serial);
        stmt.BindOptionalText(10, release.genre);
        stmt.BindOptionalText(11, release.players);
        stmt.BindOptionalReal(12, release.rating);
        stmt.BindOptionalText(13, release.description);
        stmt.BindOptionalText(14, release.externalId);
        stmt.BindInt(15, release.notFoundInEnrichment ? 1 : 0);
    }

    // Binds the media's descriptive columns to parameters 1 through 12
    void BindMediaFields(sqlite::Statement &stmt, const Media &media) {
        stmt.BindInt(1, media.releaseId);
        stmt.BindOptionalText(2, media.serial);
        stmt.BindOptionalInt(3, ToOptionalInt(media.discNumber));
        stmt.BindOptionalText(4, media.discLabel);
        stmt.BindOptionalText(5, media.revision);
        stmt.BindText(6, ToString(media.status));
        stmt.BindOptionalText(7, media.datName);
        stmt.BindOptionalText(8, media.datSource);
        stmt.BindOptionalInt(9, ToOptionalInt(media.fileSize));
        stmt.BindOptionalText(10, LowercaseHash(media.crc32));
        stmt.BindOptionalText(11, LowercaseHash(media.sha1));
        stmt.BindOptionalText(12, LowercaseHash(media.md5));
    }

    constexpr std::array<std::string_view, 7> kWritableReleaseFields = {
        "title", "alt_title", "release_date", "serial", "genre", "players", "description",
    };

    constexpr std::array<std::string_view, 4> kWritableMediaFields = {
        "serial",
        "revision",
        "status",
        "disc_label",
    };

} // namespace

// -----------------------------------------------------------------------------
// Platforms

bool CatalogDB::UpsertPlatform(const Platform &platform, std::error_code &error) {
    auto tx = BeginTransaction(error);
    if (!tx.IsActive()) {
        return false;
    }

    {
        sqlite::Statement stmt{m_db,
                               "INSERT INTO platforms (id, display_name, short_name, manufacturer, generation, "
                               "media_type, release_year, description, header_format) "
                               "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9) "
                               "ON CONFLICT(id) DO UPDATE SET display_name = excluded.display_name, "
                               "short_name = excluded.short_name, manufacturer = excluded.manufacturer, "
                               "generation = excluded.generation, media_type = excluded.media_type, "
                               "release_year = excluded.release_year, description = excluded.description, "
                               "header_format = excluded.header_format",
                               error};
        stmt.BindText(1, platform.id);
        stmt.BindText(2, platform.displayName);
        stmt.BindText(3, platform.shortName);
        stmt.BindText(4, platform.manufacturer);
        stmt.BindOptionalInt(5, ToOptionalInt(platform.generation));
        stmt.BindText(6, ToString(platform.mediaType));
        stmt.BindOptionalInt(7, ToOptionalInt(platform.releaseYear));
        stmt.BindOptionalText(8, platform.description);
        stmt.BindText(9, media::ToString(platform.headerFormat));
        if (!stmt.Execute(error)) {
            return false;
        }
    }

    {
        sqlite::Statement stmt{m_db, "DELETE FROM platform_regions WHERE platform_id = ?1", error};
        stmt.BindText(1, platform.id);
        if (!stmt.Execute(error)) {
            return false;
        }
    }
    {
        sqlite::Statement stmt{m_db, "DELETE FROM platform_relationships WHERE platform_a = ?1", error};
        stmt.BindText(1, platform.id);
        if (!stmt.Execute(error)) {
            return false;
        }
    }

    {
        sqlite::Statement stmt{
            m_db, "INSERT OR REPLACE INTO platform_regions (platform_id, region, release_date) VALUES (?1, ?2, ?3)",
            error};
        for (const PlatformRegion &region : platform.regions) {
            stmt.Reset();
            stmt.BindText(1, platform.id);
            stmt.BindText(2, region.region);
            stmt.BindOptionalText(3, region.releaseDate);
            if (!stmt.Execute(error)) {
                return false;
            }
        }
    }
    {
        sqlite::Statement stmt{m_db,
                               "INSERT OR IGNORE INTO platform_relationships (platform_a, platform_b, relationship) "
                               "VALUES (?1, ?2, ?3)",
                               error};
        for (const PlatformRelation &rel : platform.relationships) {
            stmt.Reset();
            stmt.BindText(1, platform.id);
            stmt.BindText(2, rel.platformId);
            stmt.BindText(3, ToString(rel.type));
            if (!stmt.Execute(error)) {
                return false;
            }
        }
    }

    return tx.Commit(error);
}

std::optional<Platform> CatalogDB::GetPlatform(std::string_view id, std::error_code &error) {
    if (!CheckOpen(error)) {
        return std::nullopt;
    }

    std::optional<Platform> platform{};
    {
        sqlite::Statement stmt{m_db, fmt::format("SELECT {} FROM platforms WHERE id = ?1", kPlatformColumns), error};
        stmt.BindText(1, id);
        platform = ReadOne<Platform>(stmt, ReadPlatform, error);
        if (!platform) {
            return std::nullopt;
        }
    }

    {
        sqlite::Statement stmt{
            m_db, "SELECT region, release_date FROM platform_regions WHERE platform_id = ?1 ORDER BY region", error};
        stmt.BindText(1, id);
        platform->regions = ReadAll<PlatformRegion>(
            stmt,
            [](const sqlite::Statement &s) {
                return PlatformRegion{.region = s.Text(0), .releaseDate = s.OptionalText(1)};
            },
            error);
        if (error) {
            return std::nullopt;
        }
    }

    {
        sqlite::Statement stmt{m_db,
                               "SELECT platform_b, relationship FROM platform_relationships WHERE platform_a = ?1 "
                               "ORDER BY platform_b, relationship",
                               error};
        stmt.BindText(1, id);
        while (stmt.Step(error)) {
            const auto type = ParsePlatformRelationship(stmt.Text(1));
            if (!type) {
                devlog::warn<grp::entities>("Platform {} has unknown relationship type {}", id, stmt.Text(1));
                continue;
            }
            platform->relationships.push_back({.platformId = stmt.Text(0), .type = *type});
        }
        if (error) {
            return std::nullopt;
        }
    }

    return platform;
}

std::vector<Platform> CatalogDB::ListPlatforms(std::error_code &error) {
    std::vector<Platform> result{};
    if (!CheckOpen(error)) {
        return result;
    }

    std::vector<std::string> ids{};
    {
        sqlite::Statement stmt{m_db, "SELECT id FROM platforms ORDER BY id", error};
        ids = ReadAll<std::string>(stmt, [](const sqlite::Statement &s) { return s.Text(0); }, error);
        if (error) {
            return result;
        }
    }

    for (const std::string &id : ids) {
        auto platform = GetPlatform(id, error);
        if (error) {
            result.clear();
            return result;
        }
        if (platform) {
            result.push_back(std::move(*platform));
        }
    }
    return result;
}

// -----------------------------------------------------------------------------
// Companies

bool CatalogDB::UpsertCompany(const Company &company, std::error_code &error) {
    auto tx = BeginTransaction(error);
    if (!tx.IsActive()) {
        return false;
    }

    {
        sqlite::Statement stmt{m_db,
                               "INSERT INTO companies (id, name, country) VALUES (?1, ?2, ?3) "
                               "ON CONFLICT(id) DO UPDATE SET name = excluded.name, country = excluded.country",
                               error};
        stmt.BindText(1, company.id);
        stmt.BindText(2, company.name);
        stmt.BindOptionalText(3, company.country);
        if (!stmt.Execute(error)) {
            return false;
        }
    }
    {
        sqlite::Statement stmt{m_db, "DELETE FROM company_aliases WHERE company_id = ?1", error};
        stmt.BindText(1, company.id);
        if (!stmt.Execute(error)) {
            return false;
        }
    }
    {
        sqlite::Statement stmt{m_db, "INSERT OR IGNORE INTO company_aliases (company_id, alias) VALUES (?1, ?2)",
                               error};
        for (const std::string &alias : company.aliases) {
            stmt.Reset();
            stmt.BindText(1, company.id);
            stmt.BindText(2, alias);
            if (!stmt.Execute(error)) {
                return false;
            }
        }
    }

    return tx.Commit(error);
}

std::optional<Company> CatalogDB::GetCompany(std::string_view id, std::error_code &error) {
    if (!CheckOpen(error)) {
        return std::nullopt;
    }

    std::optional<Company> company{};
    {
        sqlite::Statement stmt{m_db, "SELECT id, name, country FROM companies WHERE id = ?1", error};
        stmt.BindText(1, id);
        company = ReadOne<Company>(
            stmt,
            [](const sqlite::Statement &s) {
                return Company{.id = s.Text(0), .name = s.Text(1), .country = s.OptionalText(2)};
            },
            error);
        if (!company) {
            return std::nullopt;
        }
    }

    sqlite::Statement stmt{m_db, "SELECT alias FROM company_aliases WHERE company_id = ?1 ORDER BY alias", error};
    stmt.BindText(1, id);
    company->aliases = ReadAll<std::string>(stmt, [](const sqlite::Statement &s) { return s.Text(0); }, error);
    if (error) {
        return std::nullopt;
    }
    return company;
}

std::optional<std::string> CatalogDB::FindCompanyByAlias(std::string_view name, std::error_code &error) {
    if (!CheckOpen(error)) {
        return std::nullopt;
    }
    sqlite::Statement stmt{m_db,
                           "SELECT id FROM companies WHERE name = ?1 COLLATE NOCASE "
                           "UNION SELECT company_id FROM company_aliases WHERE alias = ?1 COLLATE NOCASE "
                           "ORDER BY 1 LIMIT 1",
                           error};
    stmt.BindText(1, util::Trim(name));
    return ReadOne<std::string>(stmt, [](const sqlite::Statement &s) { return s.Text(0); }, error);
}

// -----------------------------------------------------------------------------
// Works

std::optional<EntityID> CatalogDB::InsertWork(std::string_view title, std::error_code &error) {
    if (!CheckOpen(error)) {
        return std::nullopt;
    }
    sqlite::Statement stmt{m_db, "INSERT INTO works (title) VALUES (?1)", error};
    stmt.BindText(1, title);
    if (!stmt.Execute(error)) {
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(m_db);
}

static Work ReadWork(const sqlite::Statement &stmt) {
    return Work{
        .id = stmt.Int(0),
        .title = stmt.Text(1),
        .createdAt = stmt.Text(2),
        .updatedAt = stmt.Text(3),
    };
}

std::optional<Work> CatalogDB::GetWork(EntityID id, std::error_code &error) {
    if (!CheckOpen(error)) {
        return std::nullopt;
    }
    sqlite::Statement stmt{m_db, "SELECT id, title, created_at, updated_at FROM works WHERE id = ?1", error};
    stmt.BindInt(1, id);
    return ReadOne<Work>(stmt, ReadWork, error);
}

std::optional<Work> CatalogDB::FindWorkByTitle(std::string_view title, std::error_code &error) {
    if (!CheckOpen(error)) {
        return std::nullopt;
    }
    sqlite::Statement stmt{
        m_db, "SELECT id, title, created_at, updated_at FROM works WHERE title = ?1 ORDER BY id LIMIT 1", error};
    stmt.BindText(1, title);
    return ReadOne<Work>(stmt, ReadWork, error);
}

bool CatalogDB::UpdateWorkTitle(EntityID id, std::string_view title, std::error_code &error) {
    if (!CheckOpen(error)) {
        return false;
    }
    sqlite::Statement stmt{m_db, "UPDATE works SET title = ?2, updated_at = datetime('now') WHERE id = ?1", error};
    stmt.BindInt(1, id);
    stmt.BindText(2, title);
    if (!stmt.Execute(error)) {
        return false;
    }
    if (sqlite3_changes(m_db) == 0) {
        error = CatalogError::NotFound;
        return false;
    }
    return true;
}

bool CatalogDB::DeleteWork(EntityID id, std::error_code &error) {
    if (!CheckOpen(error)) {
        return false;
    }
    sqlite::Statement stmt{m_db, "DELETE FROM works WHERE id = ?1", error};
    stmt.BindInt(1, id);
    if (!stmt.Execute(error)) {
        return false;
    }
    if (sqlite3_changes(m_db) == 0) {
        error = CatalogError::NotFound;
        return false;
    }
    return true;
}

std::optional<uint64> CatalogDB::CountReleasesForWork(EntityID id, std::error_code &error) {
    if (!CheckOpen(error)) {
        return std::nullopt;
    }
    sqlite::Statement stmt{m_db, "SELECT COUNT(*) FROM releases WHERE work_id = ?1", error};
    stmt.BindInt(1, id);
    if (!stmt.Step(error)) {
        return std::nullopt;
    }
    return static_cast<uint64>(stmt.Int(0));
}

// -----------------------------------------------------------------------------
// Releases

std::optional<EntityID> CatalogDB::InsertRelease(const Release &release, std::error_code &error) {
    if (!CheckOpen(error)) {
        return std::nullopt;
    }
    if (!Exists("works", release.workId, error)) {
        if (!error) {
            error = CatalogError::MissingWork;
        }
        return std::nullopt;
    }
    if (!Exists("platforms", release.platformId, error)) {
        if (!error) {
            error = CatalogError::MissingPlatform;
        }
        return std::nullopt;
    }

    sqlite::Statement stmt{m_db,
                           "INSERT INTO releases (work_id, platform_id, region, title, alt_title, publisher_id, "
                           "developer_id, release_date, serial, genre, players, rating, description, external_id, "
                           "enrichment_not_found) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, "
                           "?14, ?15)",
                           error};
    BindReleaseFields(stmt, release);
    if (!stmt.Execute(error)) {
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(m_db);
}

bool CatalogDB::UpdateRelease(const Release &release, std::error_code &error) {
    if (!CheckOpen(error)) {
        return false;
    }
    if (!Exists("works", release.workId, error)) {
        if (!error) {
            error = CatalogError::MissingWork;
        }
        return false;
    }
    if (!Exists("platforms", release.platformId, error)) {
        if (!error) {
            error = CatalogError::MissingPlatform;
        }
        return false;
    }

    sqlite::Statement stmt{m_db,
                           "UPDATE releases SET work_id = ?1, platform_id = ?2, region = ?3, title = ?4, "
                           "alt_title = ?5, publisher_id = ?6, developer_id = ?7, release_date = ?8, serial = ?9, "
                           "genre = ?10, players = ?11, rating = ?12, description = ?13, external_id = ?14, "
                           "enrichment_not_found = ?15, updated_at = datetime('now') WHERE id = ?16",
                           error};
    BindReleaseFields(stmt, release);
    stmt.BindInt(16, release.id);
    if (!stmt.Execute(error)) {
        return false;
    }
    if (sqlite3_changes(m_db) == 0) {
        error = CatalogError::NotFound;
        return false;
    }
    return true;
}

std::optional<Release> CatalogDB::GetRelease(EntityID id, std::error_code &error) {
    if (!CheckOpen(error)) {
        return std::nullopt;
    }
    sqlite::Statement stmt{m_db, fmt::format("SELECT {} FROM releases r WHERE r.id = ?1", kReleaseColumns), error};
    stmt.BindInt(1, id);
    return ReadOne<Release>(stmt, ReadRelease, error);
}

std::optional<Release> CatalogDB::FindRelease(EntityID workId, std::string_view platformId, std::string_view region,
                                              std::error_code &error) {
    if (!CheckOpen(error)) {
        return std::nullopt;
    }
    sqlite::Statement stmt{m_db,
                           fmt::format("SELECT {} FROM releases r WHERE r.work_id = ?1 AND r.platform_id = ?2 AND "
                                       "r.region = ?3 ORDER BY r.id LIMIT 1",
                                       kReleaseColumns),
                           error};
    stmt.BindInt(1, workId);
    stmt.BindText(2, platformId);
    stmt.BindText(3, region);
    return ReadOne<Release>(stmt, ReadRelease, error);
}

std::vector<Release> CatalogDB::ReleasesForWork(EntityID workId, std::error_code &error) {
    if (!CheckOpen(error)) {
        return {};
    }
    sqlite::Statement stmt{
        m_db, fmt::format("SELECT {} FROM releases r WHERE r.work_id = ?1 ORDER BY r.id", kReleaseColumns), error};
    stmt.BindInt(1, workId);
    return ReadAll<Release>(stmt, ReadRelease, error);
}

std::vector<Release> CatalogDB::ReleasesForPlatform(std::string_view platformId, std::error_code &error) {
    if (!CheckOpen(error)) {
        return {};
    }
    sqlite::Statement stmt{
        m_db, fmt::format("SELECT {} FROM releases r WHERE r.platform_id = ?1 ORDER BY r.id", kReleaseColumns),
        error};
    stmt.BindText(1, platformId);
    return ReadAll<Release>(stmt, ReadRelease, error);
}

std::vector<Release> CatalogDB::SearchReleases(std::string_view text, std::error_code &error) {
    if (!CheckOpen(error)) {
        return {};
    }
    sqlite::Statement stmt{m_db,
                           fmt::format("SELECT {} FROM releases r WHERE r.title LIKE '%' || ?1 || '%' ESCAPE '\\' "
                                       "ORDER BY r.title, r.id",
                                       kReleaseColumns),
                           error};
    stmt.BindText(1, EscapeLike(text));
    return ReadAll<Release>(stmt, ReadRelease, error);
}

std::vector<Release> CatalogDB::FindReleasesBySerial(std::string_view serial, std::error_code &error) {
    if (!CheckOpen(error)) {
        return {};
    }
    sqlite::Statement stmt{
        m_db,
        fmt::format("SELECT {} FROM releases r WHERE r.serial = ?1 COLLATE NOCASE ORDER BY r.id", kReleaseColumns),
        error};
    stmt.BindText(1, serial);
    return ReadAll<Release>(stmt, ReadRelease, error);
}

bool CatalogDB::ReassignRelease(EntityID releaseId, EntityID workId, std::error_code &error) {
    if (!CheckOpen(error)) {
        return false;
    }
    if (!Exists("works", workId, error)) {
        if (!error) {
            error = CatalogError::MissingWork;
        }
        return false;
    }
    sqlite::Statement stmt{m_db, "UPDATE releases SET work_id = ?2, updated_at = datetime('now') WHERE id = ?1",
                           error};
    stmt.BindInt(1, releaseId);
    stmt.BindInt(2, workId);
    if (!stmt.Execute(error)) {
        return false;
    }
    if (sqlite3_changes(m_db) == 0) {
        error = CatalogError::NotFound;
        return false;
    }
    return true;
}

bool CatalogDB::DeleteRelease(EntityID id, std::error_code &error) {
    if (!CheckOpen(error)) {
        return false;
    }
    sqlite::Statement stmt{m_db, "DELETE FROM releases WHERE id = ?1", error};
    stmt.BindInt(1, id);
    if (!stmt.Execute(error)) {
        return false;
    }
    if (sqlite3_changes(m_db) == 0) {
        error = CatalogError::NotFound;
        return false;
    }
    return true;
}

// -----------------------------------------------------------------------------
// Media

std::optional<EntityID> CatalogDB::InsertMedia(const Media &media, std::error_code &error) {
    if (!CheckOpen(error)) {
        return std::nullopt;
    }
    if (!Exists("releases", media.releaseId, error)) {
        if (!error) {
            error = CatalogError::MissingRelease;
        }
        return std::nullopt;
    }

    sqlite::Statement stmt{m_db,
                           "INSERT INTO media (release_id, serial, disc_number, disc_label, revision, status, "
                           "dat_name, dat_source, file_size, crc32, sha1, md5) "
                           "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)",
                           error};
    BindMediaFields(stmt, media);
    if (!stmt.Execute(error)) {
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(m_db);
}

bool CatalogDB::UpdateMedia(const Media &media, std::error_code &error) {
    if (!CheckOpen(error)) {
        return false;
    }
    if (!Exists("releases", media.releaseId, error)) {
        if (!error) {
            error = CatalogError::MissingRelease;
        }
        return false;
    }

    sqlite::Statement stmt{m_db,
                           "UPDATE media SET release_id = ?1, serial = ?2, disc_number = ?3, disc_label = ?4, "
                           "revision = ?5, status = ?6, dat_name = ?7, dat_source = ?8, file_size = ?9, crc32 = ?10, "
                           "sha1 = ?11, md5 = ?12, updated_at = datetime('now') WHERE id = ?13",
                           error};
    BindMediaFields(stmt, media);
    stmt.BindInt(13, media.id);
    if (!stmt.Execute(error)) {
        return false;
    }
    if (sqlite3_changes(m_db) == 0) {
        error = CatalogError::NotFound;
        return false;
    }
    return true;
}

std::optional<Media> CatalogDB::GetMedia(EntityID id, std::error_code &error) {
    if (!CheckOpen(error)) {
        return std::nullopt;
    }
    sqlite::Statement stmt{m_db, fmt::format("SELECT {} FROM media m WHERE m.id = ?1", kMediaColumns), error};
    stmt.BindInt(1, id);
    return ReadOne<Media>(stmt, ReadMedia, error);
}

std::vector<Media> CatalogDB::MediaForRelease(EntityID releaseId, std::error_code &error) {
    if (!CheckOpen(error)) {
        return {};
    }
    sqlite::Statement stmt{
        m_db, fmt::format("SELECT {} FROM media m WHERE m.release_id = ?1 ORDER BY m.id", kMediaColumns), error};
    stmt.BindInt(1, releaseId);
    return ReadAll<Media>(stmt, ReadMedia, error);
}

std::vector<Media> CatalogDB::FindMediaByCRC32(std::string_view crc32, std::error_code &error) {
    if (!CheckOpen(error)) {
        return {};
    }
    sqlite::Statement stmt{m_db, fmt::format("SELECT {} FROM media m WHERE m.crc32 = ?1 ORDER BY m.id", kMediaColumns),
                           error};
    stmt.BindText(1, util::ToLower(crc32));
    return ReadAll<Media>(stmt, ReadMedia, error);
}

std::vector<Media> CatalogDB::FindMediaBySHA1(std::string_view sha1, std::error_code &error) {
    if (!CheckOpen(error)) {
        return {};
    }
    sqlite::Statement stmt{m_db, fmt::format("SELECT {} FROM media m WHERE m.sha1 = ?1 ORDER BY m.id", kMediaColumns),
                           error};
    stmt.BindText(1, util::ToLower(sha1));
    return ReadAll<Media>(stmt, ReadMedia, error);
}

std::vector<Media> CatalogDB::FindMediaByMD5(std::string_view md5, std::error_code &error) {
    if (!CheckOpen(error)) {
        return {};
    }
    sqlite::Statement stmt{m_db, fmt::format("SELECT {} FROM media m WHERE m.md5 = ?1 ORDER BY m.id", kMediaColumns),
                           error};
    stmt.BindText(1, util::ToLower(md5));
    return ReadAll<Media>(stmt, ReadMedia, error);
}

std::vector<Media> CatalogDB::FindMediaBySerial(std::string_view serial, std::error_code &error) {
    if (!CheckOpen(error)) {
        return {};
    }
    sqlite::Statement stmt{
        m_db, fmt::format("SELECT {} FROM media m WHERE m.serial = ?1 COLLATE NOCASE ORDER BY m.id", kMediaColumns),
        error};
    stmt.BindText(1, serial);
    return ReadAll<Media>(stmt, ReadMedia, error);
}

std::optional<Media> CatalogDB::FindMediaByDatName(std::string_view datName, std::error_code &error) {
    if (!CheckOpen(error)) {
        return std::nullopt;
    }
    sqlite::Statement stmt{
        m_db, fmt::format("SELECT {} FROM media m WHERE m.dat_name = ?1 ORDER BY m.id LIMIT 1", kMediaColumns), error};
    stmt.BindText(1, datName);
    return ReadOne<Media>(stmt, ReadMedia, error);
}

std::vector<Media> CatalogDB::ListMediaWithDatName(std::optional<std::string_view> platformId,
                                                   std::error_code &error) {
    if (!CheckOpen(error)) {
        return {};
    }
    if (platformId) {
        sqlite::Statement stmt{m_db,
                               fmt::format("SELECT {} FROM media m JOIN releases r ON r.id = m.release_id "
                                           "WHERE m.dat_name IS NOT NULL AND r.platform_id = ?1 ORDER BY m.id",
                                           kMediaColumns),
                               error};
        stmt.BindText(1, *platformId);
        return ReadAll<Media>(stmt, ReadMedia, error);
    }
    sqlite::Statement stmt{
        m_db, fmt::format("SELECT {} FROM media m WHERE m.dat_name IS NOT NULL ORDER BY m.id", kMediaColumns), error};
    return ReadAll<Media>(stmt, ReadMedia, error);
}

std::optional<uint64> CatalogDB::MoveMedia(EntityID fromReleaseId, EntityID toReleaseId, std::error_code &error) {
    if (!CheckOpen(error)) {
        return std::nullopt;
    }
    if (!Exists("releases", toReleaseId, error)) {
        if (!error) {
            error = CatalogError::MissingRelease;
        }
        return std::nullopt;
    }
    sqlite::Statement stmt{
        m_db, "UPDATE media SET release_id = ?2, updated_at = datetime('now') WHERE release_id = ?1", error};
    stmt.BindInt(1, fromReleaseId);
    stmt.BindInt(2, toReleaseId);
    if (!stmt.Execute(error)) {
        return std::nullopt;
    }
    return static_cast<uint64>(sqlite3_changes(m_db));
}

// -----------------------------------------------------------------------------
// Field updates

bool CatalogDB::IsWritableField(EntityType type, std::string_view field) {
    switch (type) {
    case EntityType::Release:
        return std::find(kWritableReleaseFields.begin(), kWritableReleaseFields.end(), field) !=
               kWritableReleaseFields.end();
    case EntityType::Media:
        return std::find(kWritableMediaFields.begin(), kWritableMediaFields.end(), field) != kWritableMediaFields.end();
    case EntityType::Work: return false;
    }
    return false;
}

bool CatalogDB::SetField(EntityType type, EntityID id, std::string_view field, std::string_view value,
                         std::error_code &error) {
    if (!CheckOpen(error)) {
        return false;
    }
    if (!IsWritableField(type, field)) {
        devlog::warn<grp::entities>("Field {} of {} cannot be written", field, ToString(type));
        error = CatalogError::UnknownField;
        return false;
    }

    // The field name is one of the whitelisted column names at this point
    const std::string_view table = type == EntityType::Release ? "releases" : "media";
    sqlite::Statement stmt{
        m_db, fmt::format("UPDATE {} SET {} = ?2, updated_at = datetime('now') WHERE id = ?1", table, field), error};
    stmt.BindInt(1, id);
    if (type == EntityType::Media && field == "status") {
        stmt.BindText(2, ToString(ParseMediaStatus(value)));
    } else {
        stmt.BindText(2, value);
    }
    if (!stmt.Execute(error)) {
        return false;
    }
    if (sqlite3_changes(m_db) == 0) {
        error = CatalogError::NotFound;
        return false;
    }
    devlog::trace<grp::entities>("Set {} #{} {} = {}", ToString(type), id, field, value);
    return true;
}

// -----------------------------------------------------------------------------
// Overrides

bool CatalogDB::UpsertOverride(const Override &ovr, std::error_code &error) {
    auto tx = BeginTransaction(error);
    if (!tx.IsActive()) {
        return false;
    }

    {
        sqlite::Statement stmt{m_db,
                               "DELETE FROM overrides WHERE entity_type = ?1 AND entity_id IS ?2 AND "
                               "platform_id IS ?3 AND dat_name_pattern IS ?4 AND field = ?5",
                               error};
        stmt.BindText(1, ToString(ovr.entityType));
        stmt.BindOptionalInt(2, ovr.entityId);
        stmt.BindOptionalText(3, ovr.platformId);
        stmt.BindOptionalText(4, ovr.datNamePattern);
        stmt.BindText(5, ovr.field);
        if (!stmt.Execute(error)) {
            return false;
        }
    }
    {
        sqlite::Statement stmt{m_db,
                               "INSERT INTO overrides (entity_type, entity_id, platform_id, dat_name_pattern, field, "
                               "override_value, reason) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)",
                               error};
        stmt.BindText(1, ToString(ovr.entityType));
        stmt.BindOptionalInt(2, ovr.entityId);
        stmt.BindOptionalText(3, ovr.platformId);
        stmt.BindOptionalText(4, ovr.datNamePattern);
        stmt.BindText(5, ovr.field);
        stmt.BindText(6, ovr.value);
        stmt.BindText(7, ovr.reason);
        if (!stmt.Execute(error)) {
            return false;
        }
    }

    return tx.Commit(error);
}

std::vector<Override> CatalogDB::ListOverrides(std::error_code &error) {
    if (!CheckOpen(error)) {
        return {};
    }
    sqlite::Statement stmt{m_db,
                           "SELECT entity_type, entity_id, platform_id, dat_name_pattern, field, override_value, "
                           "reason FROM overrides ORDER BY id",
                           error};
    return ReadAll<Override>(
        stmt,
        [](const sqlite::Statement &s) {
            return Override{
                .entityType = ParseEntityType(s.Text(0)).value_or(EntityType::Media),
                .entityId = s.OptionalInt(1),
                .platformId = s.OptionalText(2),
                .datNamePattern = s.OptionalText(3),
                .field = s.Text(4),
                .value = s.Text(5),
                .reason = s.Text(6),
            };
        },
        error);
}

} // namespace romcat::catalog
