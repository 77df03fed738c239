#include <romcat/catalog/catalog_db.hpp>

#include "sqlite_statement.hpp"

#include <romcat/util/dev_log.hpp>
#include <romcat/util/scope_guard.hpp>

#include <fmt/format.h>

namespace romcat::catalog {

namespace grp {

    // Hierarchy:
    //
    // base
    //   schema
    //   tx

    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "CatalogDB";
    };

    struct schema : public base {
        static constexpr std::string_view name = "CatalogDB-Schema";
    };

    struct tx : public base {
        static constexpr devlog::Level level = devlog::level::info;
        static constexpr std::string_view name = "CatalogDB-Tx";
    };

} // namespace grp

// -----------------------------------------------------------------------------
// Schema

static constexpr const char *kSchemaSQL = R"(
CREATE TABLE IF NOT EXISTS schema_version (
    version INTEGER NOT NULL,
    applied_at TEXT NOT NULL DEFAULT (datetime('now'))
);

CREATE TABLE IF NOT EXISTS platforms (
    id TEXT PRIMARY KEY,
    display_name TEXT NOT NULL,
    short_name TEXT NOT NULL,
    manufacturer TEXT NOT NULL,
    generation INTEGER,
    media_type TEXT NOT NULL,
    release_year INTEGER,
    description TEXT,
    header_format TEXT NOT NULL DEFAULT 'none'
);

CREATE TABLE IF NOT EXISTS platform_regions (
    platform_id TEXT NOT NULL REFERENCES platforms(id) ON DELETE CASCADE,
    region TEXT NOT NULL,
    release_date TEXT,
    PRIMARY KEY (platform_id, region)
);

CREATE TABLE IF NOT EXISTS platform_relationships (
    platform_a TEXT NOT NULL REFERENCES platforms(id) ON DELETE CASCADE,
    platform_b TEXT NOT NULL,
    relationship TEXT NOT NULL,
    PRIMARY KEY (platform_a, platform_b, relationship)
);

CREATE TABLE IF NOT EXISTS companies (
    id TEXT PRIMARY KEY,
    name TEXT NOT NULL,
    country TEXT
);

CREATE TABLE IF NOT EXISTS company_aliases (
    company_id TEXT NOT NULL REFERENCES companies(id) ON DELETE CASCADE,
    alias TEXT NOT NULL,
    PRIMARY KEY (company_id, alias)
);

CREATE TABLE IF NOT EXISTS works (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    title TEXT NOT NULL,
    created_at TEXT NOT NULL DEFAULT (datetime('now')),
    updated_at TEXT NOT NULL DEFAULT (datetime('now'))
);
CREATE INDEX IF NOT EXISTS idx_works_title ON works(title);

CREATE TABLE IF NOT EXISTS releases (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    work_id INTEGER NOT NULL REFERENCES works(id),
    platform_id TEXT NOT NULL REFERENCES platforms(id),
    region TEXT NOT NULL,
    title TEXT NOT NULL,
    alt_title TEXT,
    publisher_id TEXT,
    developer_id TEXT,
    release_date TEXT,
    serial TEXT,
    genre TEXT,
    players TEXT,
    rating REAL,
    description TEXT,
    external_id TEXT,
    enrichment_not_found INTEGER NOT NULL DEFAULT 0,
    created_at TEXT NOT NULL DEFAULT (datetime('now')),
    updated_at TEXT NOT NULL DEFAULT (datetime('now'))
);
CREATE INDEX IF NOT EXISTS idx_releases_natural ON releases(work_id, platform_id, region);
CREATE INDEX IF NOT EXISTS idx_releases_platform ON releases(platform_id);
CREATE INDEX IF NOT EXISTS idx_releases_serial ON releases(serial);

CREATE TABLE IF NOT EXISTS media (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    release_id INTEGER NOT NULL REFERENCES releases(id),
    serial TEXT,
    disc_number INTEGER,
    disc_label TEXT,
    revision TEXT,
    status TEXT NOT NULL DEFAULT 'verified',
    dat_name TEXT,
    dat_source TEXT,
    file_size INTEGER,
    crc32 TEXT,
    sha1 TEXT,
    md5 TEXT,
    created_at TEXT NOT NULL DEFAULT (datetime('now')),
    updated_at TEXT NOT NULL DEFAULT (datetime('now'))
);
CREATE INDEX IF NOT EXISTS idx_media_release ON media(release_id);
CREATE INDEX IF NOT EXISTS idx_media_crc32 ON media(crc32);
CREATE INDEX IF NOT EXISTS idx_media_sha1 ON media(sha1);
CREATE INDEX IF NOT EXISTS idx_media_md5 ON media(md5);
CREATE INDEX IF NOT EXISTS idx_media_serial ON media(serial);
CREATE INDEX IF NOT EXISTS idx_media_dat_name ON media(dat_name);

CREATE TABLE IF NOT EXISTS import_log (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    source_type TEXT NOT NULL,
    source_name TEXT NOT NULL,
    source_version TEXT,
    imported_at TEXT NOT NULL,
    records_created INTEGER NOT NULL DEFAULT 0,
    records_updated INTEGER NOT NULL DEFAULT 0,
    records_unchanged INTEGER NOT NULL DEFAULT 0,
    disagreements_found INTEGER NOT NULL DEFAULT 0
);

CREATE TABLE IF NOT EXISTS disagreements (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    entity_type TEXT NOT NULL,
    entity_id INTEGER NOT NULL,
    field TEXT NOT NULL,
    source_a TEXT NOT NULL,
    value_a TEXT,
    source_b TEXT NOT NULL,
    value_b TEXT,
    resolved INTEGER NOT NULL DEFAULT 0,
    resolution TEXT,
    resolved_at TEXT,
    created_at TEXT NOT NULL DEFAULT (datetime('now'))
);
CREATE INDEX IF NOT EXISTS idx_disagreements_unresolved ON disagreements(resolved) WHERE resolved = 0;
CREATE INDEX IF NOT EXISTS idx_disagreements_entity ON disagreements(entity_type, entity_id);

CREATE TABLE IF NOT EXISTS overrides (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    entity_type TEXT NOT NULL,
    entity_id INTEGER,
    platform_id TEXT,
    dat_name_pattern TEXT,
    field TEXT NOT NULL,
    override_value TEXT NOT NULL,
    reason TEXT NOT NULL,
    created_at TEXT NOT NULL DEFAULT (datetime('now'))
);
)";

// -----------------------------------------------------------------------------
// Transaction

CatalogDB::Transaction::Transaction(Transaction &&other) noexcept
    : m_db(other.m_db)
    , m_outermost(other.m_outermost) {
    other.m_db = nullptr;
}

CatalogDB::Transaction::~Transaction() {
    if (m_db != nullptr) {
        Rollback();
    }
}

bool CatalogDB::Transaction::Commit(std::error_code &error) {
    error.clear();
    if (m_db == nullptr) {
        error = CatalogError::NotOpen;
        return false;
    }
    if (!sqlite::Exec(m_db, m_outermost ? "COMMIT" : "RELEASE romcat_tx", error)) {
        devlog::error<grp::tx>("Commit failed: {}", error.message());
        Rollback();
        return false;
    }
    m_db = nullptr;
    return true;
}

void CatalogDB::Transaction::Rollback() {
    std::error_code error{};
    if (!sqlite::Exec(m_db, m_outermost ? "ROLLBACK" : "ROLLBACK TO romcat_tx; RELEASE romcat_tx", error)) {
        // SQLite may have already rolled back the transaction on its own after a failed statement
        devlog::warn<grp::tx>("Rollback failed: {}", error.message());
    } else {
        devlog::info<grp::tx>("Transaction rolled back");
    }
    m_db = nullptr;
}

CatalogDB::Transaction CatalogDB::BeginTransaction(std::error_code &error) {
    if (!CheckOpen(error)) {
        return Transaction{nullptr, false};
    }
    const bool outermost = sqlite3_get_autocommit(m_db) != 0;
    if (!sqlite::Exec(m_db, outermost ? "BEGIN IMMEDIATE" : "SAVEPOINT romcat_tx", error)) {
        return Transaction{nullptr, false};
    }
    return Transaction{m_db, outermost};
}

// -----------------------------------------------------------------------------
// Connection lifecycle

CatalogDB::~CatalogDB() {
    Close();
}

bool CatalogDB::Open(const std::filesystem::path &path, std::error_code &error) {
    Close();
    error.clear();

    const int rc = sqlite3_open_v2(path.string().c_str(), &m_db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        devlog::error<grp::base>("Could not open {}: {}", path.string(),
                                 m_db != nullptr ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc));
        error = MakeSQLiteError(rc);
        Close();
        return false;
    }

    util::ScopeGuard sgClose{[&] { Close(); }};
    if (!sqlite::Exec(m_db, "PRAGMA journal_mode=WAL", error)) {
        return false;
    }
    if (!Initialize(error)) {
        return false;
    }
    sgClose.Cancel();

    devlog::info<grp::base>("Opened catalog {} (schema version {})", path.string(), m_schemaVersion);
    return true;
}

bool CatalogDB::OpenInMemory(std::error_code &error) {
    Close();
    error.clear();

    const int rc = sqlite3_open_v2(":memory:", &m_db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        error = MakeSQLiteError(rc);
        Close();
        return false;
    }

    util::ScopeGuard sgClose{[&] { Close(); }};
    if (!Initialize(error)) {
        return false;
    }
    sgClose.Cancel();
    return true;
}

void CatalogDB::Close() {
    if (m_db != nullptr) {
        sqlite3_close_v2(m_db);
        m_db = nullptr;
    }
    m_schemaVersion = 0;
}

bool CatalogDB::Initialize(std::error_code &error) {
    if (!sqlite::Exec(m_db, "PRAGMA foreign_keys=ON", error)) {
        return false;
    }

    int version = 0;
    if (!ReadSchemaVersion(version, error)) {
        return false;
    }
    if (version > kSchemaVersion) {
        devlog::error<grp::schema>("Database schema version {} is newer than supported version {}", version,
                                   kSchemaVersion);
        error = CatalogError::SchemaTooNew;
        return false;
    }

    if (version == 0) {
        auto tx = BeginTransaction(error);
        if (!tx.IsActive()) {
            return false;
        }
        if (!sqlite::Exec(m_db, kSchemaSQL, error)) {
            return false;
        }
        sqlite::Statement stmt{m_db, "INSERT INTO schema_version (version) VALUES (?1)", error};
        stmt.BindInt(1, kSchemaVersion);
        if (!stmt.Execute(error)) {
            return false;
        }
        if (!tx.Commit(error)) {
            return false;
        }
        devlog::debug<grp::schema>("Created schema version {}", kSchemaVersion);
    } else if (version < kSchemaVersion) {
        if (!Migrate(version, error)) {
            return false;
        }
    }

    m_schemaVersion = kSchemaVersion;
    return true;
}

bool CatalogDB::ReadSchemaVersion(int &version, std::error_code &error) {
    version = 0;
    {
        sqlite::Statement stmt{m_db, "SELECT EXISTS(SELECT 1 FROM sqlite_master WHERE type='table' AND "
                                     "name='schema_version')",
                               error};
        if (!stmt.Step(error)) {
            return !error;
        }
        if (stmt.Int(0) == 0) {
            return true;
        }
    }

    sqlite::Statement stmt{m_db, "SELECT COALESCE(MAX(version), 0) FROM schema_version", error};
    if (!stmt.Step(error)) {
        return !error;
    }
    version = static_cast<int>(stmt.Int(0));
    return true;
}

bool CatalogDB::Migrate(int fromVersion, std::error_code &error) {
    auto tx = BeginTransaction(error);
    if (!tx.IsActive()) {
        return false;
    }

    for (int version = fromVersion; version < kSchemaVersion; ++version) {
        switch (version) {
        case 1:
            if (!sqlite::Exec(m_db, "ALTER TABLE releases ADD COLUMN enrichment_not_found INTEGER NOT NULL DEFAULT 0",
                              error)) {
                return false;
            }
            break;
        }

        sqlite::Statement stmt{m_db, "INSERT INTO schema_version (version) VALUES (?1)", error};
        stmt.BindInt(1, version + 1);
        if (!stmt.Execute(error)) {
            return false;
        }
        devlog::info<grp::schema>("Migrated schema from version {} to {}", version, version + 1);
    }

    return tx.Commit(error);
}

bool CatalogDB::CheckOpen(std::error_code &error) const {
    error.clear();
    if (m_db == nullptr) {
        error = CatalogError::NotOpen;
        return false;
    }
    return true;
}

bool CatalogDB::Exists(std::string_view table, std::string_view id, std::error_code &error) {
    sqlite::Statement stmt{m_db, fmt::format("SELECT 1 FROM {} WHERE id = ?1", table), error};
    stmt.BindText(1, id);
    return stmt.Step(error);
}

bool CatalogDB::Exists(std::string_view table, EntityID id, std::error_code &error) {
    sqlite::Statement stmt{m_db, fmt::format("SELECT 1 FROM {} WHERE id = ?1", table), error};
    stmt.BindInt(1, id);
    return stmt.Step(error);
}

// -----------------------------------------------------------------------------
// Disagreements

static constexpr const char *kDisagreementColumns = "id, entity_type, entity_id, field, source_a, value_a, source_b, "
                                                    "value_b, resolved, resolution, resolved_at, created_at";

static Disagreement ReadDisagreement(const sqlite::Statement &stmt) {
    return Disagreement{
        .id = stmt.Int(0),
        .entityType = ParseEntityType(stmt.Text(1)).value_or(EntityType::Release),
        .entityId = stmt.Int(2),
        .field = stmt.Text(3),
        .sourceA = stmt.Text(4),
        .valueA = stmt.OptionalText(5),
        .sourceB = stmt.Text(6),
        .valueB = stmt.OptionalText(7),
        .resolved = stmt.Int(8) != 0,
        .resolution = stmt.OptionalText(9),
        .resolvedAt = stmt.OptionalText(10),
        .createdAt = stmt.Text(11),
    };
}

std::optional<EntityID> CatalogDB::InsertDisagreement(const Disagreement &disagreement, std::error_code &error) {
    if (!CheckOpen(error)) {
        return std::nullopt;
    }
    sqlite::Statement stmt{m_db,
                           "INSERT INTO disagreements (entity_type, entity_id, field, source_a, value_a, source_b, "
                           "value_b) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)",
                           error};
    stmt.BindText(1, ToString(disagreement.entityType));
    stmt.BindInt(2, disagreement.entityId);
    stmt.BindText(3, disagreement.field);
    stmt.BindText(4, disagreement.sourceA);
    stmt.BindOptionalText(5, disagreement.valueA);
    stmt.BindText(6, disagreement.sourceB);
    stmt.BindOptionalText(7, disagreement.valueB);
    if (!stmt.Execute(error)) {
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(m_db);
}

std::vector<Disagreement> CatalogDB::ListUnresolvedDisagreements(const DisagreementFilter &filter,
                                                                 std::error_code &error) {
    std::vector<Disagreement> result{};
    if (!CheckOpen(error)) {
        return result;
    }

    std::string sql = fmt::format("SELECT {} FROM disagreements WHERE resolved = 0", kDisagreementColumns);
    if (filter.entityType) {
        sql += " AND entity_type = ?1";
    }
    if (filter.field) {
        sql += " AND field = ?2";
    }
    if (filter.entityId) {
        sql += " AND entity_id = ?3";
    }
    sql += " ORDER BY id";
    if (filter.limit > 0) {
        sql += fmt::format(" LIMIT {}", filter.limit);
    }

    sqlite::Statement stmt{m_db, sql, error};
    if (filter.entityType) {
        stmt.BindText(1, ToString(*filter.entityType));
    }
    if (filter.field) {
        stmt.BindText(2, *filter.field);
    }
    if (filter.entityId) {
        stmt.BindInt(3, *filter.entityId);
    }
    while (stmt.Step(error)) {
        result.push_back(ReadDisagreement(stmt));
    }
    if (error) {
        result.clear();
    }
    return result;
}

bool CatalogDB::ResolveDisagreement(EntityID id, std::string_view resolution, std::error_code &error) {
    if (!CheckOpen(error)) {
        return false;
    }
    sqlite::Statement stmt{m_db,
                           "UPDATE disagreements SET resolved = 1, resolution = ?2, resolved_at = datetime('now') "
                           "WHERE id = ?1 AND resolved = 0",
                           error};
    stmt.BindInt(1, id);
    stmt.BindText(2, resolution);
    if (!stmt.Execute(error)) {
        return false;
    }
    if (sqlite3_changes(m_db) == 0) {
        error = CatalogError::NotFound;
        return false;
    }
    return true;
}

std::optional<uint64> CatalogDB::MoveDisagreements(EntityType type, EntityID fromId, EntityID toId,
                                                   std::error_code &error) {
    if (!CheckOpen(error)) {
        return std::nullopt;
    }
    sqlite::Statement stmt{m_db, "UPDATE disagreements SET entity_id = ?3 WHERE entity_type = ?1 AND entity_id = ?2",
                           error};
    stmt.BindText(1, ToString(type));
    stmt.BindInt(2, fromId);
    stmt.BindInt(3, toId);
    if (!stmt.Execute(error)) {
        return std::nullopt;
    }
    return static_cast<uint64>(sqlite3_changes(m_db));
}

// -----------------------------------------------------------------------------
// Import log

std::optional<EntityID> CatalogDB::InsertImportLog(const ImportLog &log, std::error_code &error) {
    if (!CheckOpen(error)) {
        return std::nullopt;
    }
    sqlite::Statement stmt{m_db,
                           "INSERT INTO import_log (source_type, source_name, source_version, imported_at, "
                           "records_created, records_updated, records_unchanged, disagreements_found) "
                           "VALUES (?1, ?2, ?3, COALESCE(?4, datetime('now')), ?5, ?6, ?7, ?8)",
                           error};
    stmt.BindText(1, log.sourceType);
    stmt.BindText(2, log.sourceName);
    stmt.BindOptionalText(3, log.sourceVersion);
    if (log.importedAt.empty()) {
        stmt.BindNull(4);
    } else {
        stmt.BindText(4, log.importedAt);
    }
    stmt.BindInt(5, static_cast<sint64>(log.recordsCreated));
    stmt.BindInt(6, static_cast<sint64>(log.recordsUpdated));
    stmt.BindInt(7, static_cast<sint64>(log.recordsUnchanged));
    stmt.BindInt(8, static_cast<sint64>(log.disagreementsFound));
    if (!stmt.Execute(error)) {
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(m_db);
}

std::vector<ImportLog> CatalogDB::ListImportLogs(size_t limit, std::error_code &error) {
    std::vector<ImportLog> result{};
    if (!CheckOpen(error)) {
        return result;
    }
    sqlite::Statement stmt{m_db,
                           "SELECT id, source_type, source_name, source_version, imported_at, records_created, "
                           "records_updated, records_unchanged, disagreements_found FROM import_log "
                           "ORDER BY id DESC LIMIT ?1",
                           error};
    stmt.BindInt(1, limit > 0 ? static_cast<sint64>(limit) : -1);
    while (stmt.Step(error)) {
        result.push_back(ImportLog{
            .id = stmt.Int(0),
            .sourceType = stmt.Text(1),
            .sourceName = stmt.Text(2),
            .sourceVersion = stmt.OptionalText(3),
            .importedAt = stmt.Text(4),
            .recordsCreated = static_cast<uint64>(stmt.Int(5)),
            .recordsUpdated = static_cast<uint64>(stmt.Int(6)),
            .recordsUnchanged = static_cast<uint64>(stmt.Int(7)),
            .disagreementsFound = static_cast<uint64>(stmt.Int(8)),
        });
    }
    if (error) {
        result.clear();
    }
    return result;
}

// -----------------------------------------------------------------------------
// Statistics

std::optional<CatalogStats> CatalogDB::Stats(std::error_code &error) {
    if (!CheckOpen(error)) {
        return std::nullopt;
    }
    sqlite::Statement stmt{m_db,
                           "SELECT (SELECT COUNT(*) FROM platforms), (SELECT COUNT(*) FROM companies), "
                           "(SELECT COUNT(*) FROM works), (SELECT COUNT(*) FROM releases), "
                           "(SELECT COUNT(*) FROM media), (SELECT COUNT(*) FROM overrides), "
                           "(SELECT COUNT(*) FROM disagreements WHERE resolved = 0), "
                           "(SELECT COUNT(*) FROM import_log)",
                           error};
    if (!stmt.Step(error)) {
        return std::nullopt;
    }
    return CatalogStats{
        .platforms = static_cast<uint64>(stmt.Int(0)),
        .companies = static_cast<uint64>(stmt.Int(1)),
        .works = static_cast<uint64>(stmt.Int(2)),
        .releases = static_cast<uint64>(stmt.Int(3)),
        .media = static_cast<uint64>(stmt.Int(4)),
        .overrides = static_cast<uint64>(stmt.Int(5)),
        .unresolvedDisagreements = static_cast<uint64>(stmt.Int(6)),
        .importLogs = static_cast<uint64>(stmt.Int(7)),
    };
}

} // namespace romcat::catalog
