#pragma once

/**
@file
@brief Defines `romcat::catalog::CatalogDB`, the SQLite-backed catalog store.
*/

#include "catalog_error.hpp"
#include "catalog_types.hpp"

#include <romcat/core/types.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

struct sqlite3;

namespace romcat::catalog {

/// @brief Current version of the catalog database schema.
///
/// Version history:
/// - 1: initial schema
/// - 2: `releases.enrichment_not_found`
inline constexpr int kSchemaVersion = 2;

/// @brief The catalog store.
///
/// Persists the catalog entity graph in an SQLite database, either in a file or in memory. The schema carries a version
/// marker that is checked when the database is opened: older schemas are migrated in place, newer schemas are
/// rejected.
///
/// Every operation reports failures through its `std::error_code` out-parameter, which is cleared on success. Lookups
/// that find nothing are not failures: they return `std::nullopt` or an empty list with a cleared error code.
///
/// Writes check referential integrity before touching the database: releases must refer to an existing work and
/// platform, media must refer to an existing release.
///
/// Thread-safety
/// -------------
/// Instances are not thread-safe. Funnel all writes through a single owner.
class CatalogDB {
public:
    /// @brief A transaction scope.
    ///
    /// Changes made through the store while the transaction is alive are rolled back when it is destroyed without a
    /// successful `Commit()`. Transactions nest: an inner transaction commits into the outer one, and rolling back the
    /// outer transaction discards the inner changes as well.
    class Transaction {
    public:
        Transaction(Transaction &&other) noexcept;
        Transaction(const Transaction &) = delete;
        Transaction &operator=(Transaction &&) = delete;
        Transaction &operator=(const Transaction &) = delete;

        ~Transaction();

        /// @brief Commits the changes made in this transaction.
        /// @param[out] error receives the error if the commit failed
        /// @return `true` if the changes were committed
        bool Commit(std::error_code &error);

        /// @brief Determines if the transaction was started and is still pending.
        bool IsActive() const {
            return m_db != nullptr;
        }

    private:
        Transaction(sqlite3 *db, bool outermost)
            : m_db(db)
            , m_outermost(outermost) {}

        void Rollback();

        sqlite3 *m_db = nullptr;
        bool m_outermost = false;

        friend class CatalogDB;
    };

    CatalogDB() = default;
    ~CatalogDB();

    CatalogDB(const CatalogDB &) = delete;
    CatalogDB &operator=(const CatalogDB &) = delete;

    // -------------------------------------------------------------------------
    // Connection lifecycle

    /// @brief Opens or creates a catalog database file.
    ///
    /// Creates the schema in new databases and migrates databases written by older schema versions. Fails with
    /// `CatalogError::SchemaTooNew` if the database was written by a newer version.
    ///
    /// @param[in] path the path to the database file
    /// @param[out] error receives the error if the database could not be opened
    /// @return `true` if the database is open and ready
    bool Open(const std::filesystem::path &path, std::error_code &error);

    /// @brief Creates an empty catalog in memory.
    /// @param[out] error receives the error if the database could not be created
    /// @return `true` if the database is open and ready
    bool OpenInMemory(std::error_code &error);

    /// @brief Closes the database. Does nothing if the store is not open.
    void Close();

    bool IsOpen() const {
        return m_db != nullptr;
    }

    /// @brief The schema version of the open database after migrations, or 0 if the store is closed.
    int SchemaVersion() const {
        return m_schemaVersion;
    }

    /// @brief Starts a transaction.
    ///
    /// The returned transaction is inactive if it could not be started.
    ///
    /// @param[out] error receives the error if the transaction could not be started
    /// @return the transaction scope
    Transaction BeginTransaction(std::error_code &error);

    // -------------------------------------------------------------------------
    // Platforms

    /// @brief Inserts or replaces a platform, including its region and relationship lists.
    bool UpsertPlatform(const Platform &platform, std::error_code &error);
    std::optional<Platform> GetPlatform(std::string_view id, std::error_code &error);
    std::vector<Platform> ListPlatforms(std::error_code &error);

    // -------------------------------------------------------------------------
    // Companies

    /// @brief Inserts or replaces a company, including its alias list.
    bool UpsertCompany(const Company &company, std::error_code &error);
    std::optional<Company> GetCompany(std::string_view id, std::error_code &error);

    /// @brief Resolves a free-text company name to a company ID.
    ///
    /// Matches the canonical name and every alias, ignoring case.
    ///
    /// @param[in] name the company name to resolve
    /// @param[out] error receives the error if the query failed
    /// @return the company ID, if a company matched
    std::optional<std::string> FindCompanyByAlias(std::string_view name, std::error_code &error);

    // -------------------------------------------------------------------------
    // Works

    /// @brief Creates a work with the given canonical title.
    /// @return the new work's ID
    std::optional<EntityID> InsertWork(std::string_view title, std::error_code &error);
    std::optional<Work> GetWork(EntityID id, std::error_code &error);

    /// @brief Finds the work with the lowest ID whose canonical title is exactly `title`.
    std::optional<Work> FindWorkByTitle(std::string_view title, std::error_code &error);

    bool UpdateWorkTitle(EntityID id, std::string_view title, std::error_code &error);

    /// @brief Deletes a work. Fails if any release still refers to it.
    bool DeleteWork(EntityID id, std::error_code &error);

    std::optional<uint64> CountReleasesForWork(EntityID id, std::error_code &error);

    // -------------------------------------------------------------------------
    // Releases

    /// @brief Inserts a release. The `id`, `createdAt` and `updatedAt` fields are ignored.
    ///
    /// Fails with `CatalogError::MissingWork` or `CatalogError::MissingPlatform` if the release refers to entities that
    /// do not exist.
    ///
    /// @return the new release's ID
    std::optional<EntityID> InsertRelease(const Release &release, std::error_code &error);

    /// @brief Writes every field of an existing release.
    bool UpdateRelease(const Release &release, std::error_code &error);

    std::optional<Release> GetRelease(EntityID id, std::error_code &error);

    /// @brief Finds the release with the lowest ID matching the natural key (`workId`, `platformId`, `region`).
    std::optional<Release> FindRelease(EntityID workId, std::string_view platformId, std::string_view region,
                                       std::error_code &error);

    std::vector<Release> ReleasesForWork(EntityID workId, std::error_code &error);
    std::vector<Release> ReleasesForPlatform(std::string_view platformId, std::error_code &error);

    /// @brief Finds releases whose title contains `text`, ignoring ASCII case. Results are ordered by title.
    std::vector<Release> SearchReleases(std::string_view text, std::error_code &error);

    /// @brief Finds releases by serial, ignoring case.
    std::vector<Release> FindReleasesBySerial(std::string_view serial, std::error_code &error);

    /// @brief Moves a release to another work. Fails with `CatalogError::MissingWork` if the work does not exist.
    bool ReassignRelease(EntityID releaseId, EntityID workId, std::error_code &error);

    /// @brief Deletes a release. Fails if any media still refers to it.
    bool DeleteRelease(EntityID id, std::error_code &error);

    // -------------------------------------------------------------------------
    // Media

    /// @brief Inserts a media. Hashes are stored lowercase. The `id`, `createdAt` and `updatedAt` fields are ignored.
    ///
    /// Fails with `CatalogError::MissingRelease` if the media refers to a release that does not exist.
    ///
    /// @return the new media's ID
    std::optional<EntityID> InsertMedia(const Media &media, std::error_code &error);

    /// @brief Writes every field of an existing media.
    bool UpdateMedia(const Media &media, std::error_code &error);

    std::optional<Media> GetMedia(EntityID id, std::error_code &error);
    std::vector<Media> MediaForRelease(EntityID releaseId, std::error_code &error);

    std::vector<Media> FindMediaByCRC32(std::string_view crc32, std::error_code &error);
    std::vector<Media> FindMediaBySHA1(std::string_view sha1, std::error_code &error);
    std::vector<Media> FindMediaByMD5(std::string_view md5, std::error_code &error);
    std::vector<Media> FindMediaBySerial(std::string_view serial, std::error_code &error);

    /// @brief Finds the media with the lowest ID recorded under the given reference database entry name.
    std::optional<Media> FindMediaByDatName(std::string_view datName, std::error_code &error);

    /// @brief Lists every media with a recorded dat-name, optionally restricted to releases on one platform.
    std::vector<Media> ListMediaWithDatName(std::optional<std::string_view> platformId, std::error_code &error);

    /// @brief Moves every media of one release to another release.
    /// @return the number of media moved
    std::optional<uint64> MoveMedia(EntityID fromReleaseId, EntityID toReleaseId, std::error_code &error);

    // -------------------------------------------------------------------------
    // Field updates

    /// @brief Sets a single text field of a release or media by name.
    ///
    /// Only descriptive fields can be written this way; identity and ownership columns are rejected with
    /// `CatalogError::UnknownField`. Fails with `CatalogError::NotFound` if the entity does not exist.
    ///
    /// Writable release fields: `title`, `alt_title`, `release_date`, `serial`, `genre`, `players`, `description`.
    /// Writable media fields: `serial`, `revision`, `status`, `disc_label`.
    bool SetField(EntityType type, EntityID id, std::string_view field, std::string_view value,
                  std::error_code &error);

    /// @brief Determines if `SetField` accepts the given field for the entity type.
    static bool IsWritableField(EntityType type, std::string_view field);

    // -------------------------------------------------------------------------
    // Overrides

    /// @brief Inserts an override, replacing any override with the same target and field.
    bool UpsertOverride(const Override &ovr, std::error_code &error);
    std::vector<Override> ListOverrides(std::error_code &error);

    // -------------------------------------------------------------------------
    // Disagreements

    /// @brief Records an unresolved disagreement. The `id`, `resolved*` and `createdAt` fields are ignored.
    /// @return the new disagreement's ID
    std::optional<EntityID> InsertDisagreement(const Disagreement &disagreement, std::error_code &error);

    std::vector<Disagreement> ListUnresolvedDisagreements(const DisagreementFilter &filter, std::error_code &error);

    /// @brief Marks a disagreement as resolved.
    ///
    /// Fails with `CatalogError::NotFound` if there is no unresolved disagreement with the given ID.
    bool ResolveDisagreement(EntityID id, std::string_view resolution, std::error_code &error);

    /// @brief Points every disagreement about one entity to another entity of the same type.
    std::optional<uint64> MoveDisagreements(EntityType type, EntityID fromId, EntityID toId, std::error_code &error);

    // -------------------------------------------------------------------------
    // Import log

    /// @brief Appends an entry to the import log. If `importedAt` is empty, the current time is recorded.
    /// @return the new entry's ID
    std::optional<EntityID> InsertImportLog(const ImportLog &log, std::error_code &error);

    /// @brief Lists the most recent import log entries, newest first.
    std::vector<ImportLog> ListImportLogs(size_t limit, std::error_code &error);

    // -------------------------------------------------------------------------
    // Statistics

    std::optional<CatalogStats> Stats(std::error_code &error);

private:
    sqlite3 *m_db = nullptr;
    int m_schemaVersion = 0;

    bool Initialize(std::error_code &error);
    bool ReadSchemaVersion(int &version, std::error_code &error);
    bool Migrate(int fromVersion, std::error_code &error);

    bool CheckOpen(std::error_code &error) const;
    bool Exists(std::string_view table, std::string_view id, std::error_code &error);
    bool Exists(std::string_view table, EntityID id, std::error_code &error);
};

} // namespace romcat::catalog
