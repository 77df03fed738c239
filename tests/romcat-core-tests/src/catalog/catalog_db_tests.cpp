#include <catch2/catch_test_macros.hpp>

#include <romcat/catalog/catalog_db.hpp>

#include "../test_fixtures.hpp"

#include <sqlite3.h>

using namespace romcat;

namespace catalog_db {

static bool HasColumn(const std::filesystem::path &path, const char *table, const char *column) {
    sqlite3 *db = nullptr;
    REQUIRE(sqlite3_open(path.string().c_str(), &db) == SQLITE_OK);
    sqlite3_stmt *stmt = nullptr;
    const std::string sql = std::string{"SELECT COUNT(*) FROM pragma_table_info('"} + table + "') WHERE name = '" +
                            column + "'";
    REQUIRE(sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK);
    REQUIRE(sqlite3_step(stmt) == SQLITE_ROW);
    const bool found = sqlite3_column_int(stmt, 0) != 0;
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return found;
}

TEST_CASE("Catalog databases are created, reopened and versioned", "[catalog][catalog_db][schema]") {
    test::TempDir dir{};
    const auto path = dir.path / "catalog.db";
    std::error_code error{};

    SECTION("new database") {
        catalog::CatalogDB db{};
        REQUIRE(db.Open(path, error));
        CHECK(db.IsOpen());
        CHECK(db.SchemaVersion() == catalog::kSchemaVersion);

        REQUIRE(db.InsertWork("Tetris", error));
        db.Close();
        CHECK_FALSE(db.IsOpen());
        CHECK(db.SchemaVersion() == 0);

        REQUIRE(db.Open(path, error));
        auto work = db.FindWorkByTitle("Tetris", error);
        REQUIRE(work);
        CHECK(work->title == "Tetris");
    }

    SECTION("newer schema is rejected") {
        test::ExecRaw(path, "CREATE TABLE schema_version (version INTEGER NOT NULL, applied_at TEXT);"
                      "INSERT INTO schema_version (version) VALUES (99);");

        catalog::CatalogDB db{};
        CHECK_FALSE(db.Open(path, error));
        CHECK(error == catalog::CatalogError::SchemaTooNew);
        CHECK_FALSE(db.IsOpen());
    }

    SECTION("version 1 schema is migrated") {
        test::ExecRaw(path, "CREATE TABLE schema_version (version INTEGER NOT NULL, applied_at TEXT);"
                      "INSERT INTO schema_version (version) VALUES (1);"
                      "CREATE TABLE releases (id INTEGER PRIMARY KEY AUTOINCREMENT, work_id INTEGER NOT NULL, "
                      "platform_id TEXT NOT NULL, region TEXT NOT NULL, title TEXT NOT NULL);");
        REQUIRE_FALSE(HasColumn(path, "releases", "enrichment_not_found"));

        {
            catalog::CatalogDB db{};
            REQUIRE(db.Open(path, error));
            CHECK(db.SchemaVersion() == 2);
        }
        CHECK(HasColumn(path, "releases", "enrichment_not_found"));

        // Reopening does not migrate again
        catalog::CatalogDB db{};
        REQUIRE(db.Open(path, error));
        CHECK(db.SchemaVersion() == 2);
    }

    SECTION("operations on a closed store") {
        catalog::CatalogDB db{};
        CHECK_FALSE(db.InsertWork("Tetris", error));
        CHECK(error == catalog::CatalogError::NotOpen);
        CHECK_FALSE(db.Stats(error));
        CHECK(error == catalog::CatalogError::NotOpen);
    }
}

TEST_CASE_METHOD(test::CatalogFixture, "Platforms and companies are stored with their lists",
                 "[catalog][catalog_db][platforms]") {
    std::error_code error{};

    SECTION("platforms") {
        catalog::Platform snes{
            .id = "snes",
            .displayName = "Super Nintendo Entertainment System",
            .shortName = "SNES",
            .manufacturer = "Nintendo",
            .generation = 4,
            .mediaType = catalog::MediaType::Cartridge,
            .releaseYear = 1990,
            .headerFormat = media::HeaderFormat::SNESCopier,
            .regions = {{.region = "japan", .releaseDate = "1990-11-21"}, {.region = "usa"}},
            .relationships = {{.platformId = "nes", .type = catalog::PlatformRelationship::Successor}},
        };
        REQUIRE(db.UpsertPlatform(snes, error));

        auto loaded = db.GetPlatform("snes", error);
        REQUIRE(loaded);
        CHECK(loaded->displayName == snes.displayName);
        CHECK(loaded->generation == 4u);
        CHECK(loaded->releaseYear == 1990u);
        CHECK(loaded->headerFormat == media::HeaderFormat::SNESCopier);
        REQUIRE(loaded->regions.size() == 2);
        REQUIRE(loaded->relationships.size() == 1);
        CHECK(loaded->relationships[0].type == catalog::PlatformRelationship::Successor);

        // Upserting replaces the lists
        snes.regions = {{.region = "europe"}};
        snes.relationships.clear();
        REQUIRE(db.UpsertPlatform(snes, error));
        loaded = db.GetPlatform("snes", error);
        REQUIRE(loaded);
        REQUIRE(loaded->regions.size() == 1);
        CHECK(loaded->regions[0].region == "europe");
        CHECK(loaded->relationships.empty());

        CHECK(db.ListPlatforms(error).size() == 3);
        CHECK_FALSE(db.GetPlatform("n64", error));
        CHECK_FALSE(error);
    }

    SECTION("companies are found by name or alias") {
        REQUIRE(db.UpsertCompany({.id = "nintendo", .name = "Nintendo", .country = "Japan",
                                  .aliases = {"Nintendo Co., Ltd.", "Nintendo of America"}},
                                 error));

        CHECK(db.FindCompanyByAlias("nintendo", error) == "nintendo");
        CHECK(db.FindCompanyByAlias("  NINTENDO OF AMERICA ", error) == "nintendo");
        CHECK_FALSE(db.FindCompanyByAlias("Sega", error));
        CHECK_FALSE(error);

        auto company = db.GetCompany("nintendo", error);
        REQUIRE(company);
        CHECK(company->aliases.size() == 2);
    }
}

TEST_CASE_METHOD(test::CatalogFixture, "Works, releases and media are linked", "[catalog][catalog_db][entities]") {
    std::error_code error{};

    const EntityID workId = AddWork("Super Mario Bros.");
    const EntityID releaseId = AddRelease(workId, "nes", "usa", "Super Mario Bros.");

    SECTION("releases need an existing work and platform") {
        const auto before = Stats();
        CHECK_FALSE(db.InsertRelease({.workId = 9999, .platformId = "nes", .region = "usa", .title = "X"}, error));
        CHECK(error == catalog::CatalogError::MissingWork);
        CHECK_FALSE(db.InsertRelease({.workId = workId, .platformId = "n64", .region = "usa", .title = "X"}, error));
        CHECK(error == catalog::CatalogError::MissingPlatform);
        CHECK(Stats().releases == before.releases);
    }

    SECTION("media need an existing release") {
        CHECK_FALSE(db.InsertMedia({.releaseId = 9999, .datName = "Orphan"}, error));
        CHECK(error == catalog::CatalogError::MissingRelease);
        CHECK(Stats().media == 0);
    }

    SECTION("releases are found by natural key, title and serial") {
        auto release = db.FindRelease(workId, "nes", "usa", error);
        REQUIRE(release);
        CHECK(release->id == releaseId);
        CHECK_FALSE(db.FindRelease(workId, "nes", "japan", error));

        release->serial = "NES-SM-USA";
        REQUIRE(db.UpdateRelease(*release, error));
        CHECK(db.FindReleasesBySerial("nes-sm-usa", error).size() == 1);

        CHECK(db.SearchReleases("mario", error).size() == 1);
        CHECK(db.SearchReleases("50%", error).empty());
        CHECK(db.ReleasesForWork(workId, error).size() == 1);
        CHECK(db.ReleasesForPlatform("nes", error).size() == 1);
        CHECK(db.ReleasesForPlatform("psx", error).empty());
    }

    SECTION("media are found by hash in any case and by dat-name") {
        const EntityID mediaId = AddMedia(releaseId, "Super Mario Bros. (World)",
                                          "EA343F4E445A9050D4B4FBAC2C77D0693B1D0922");

        auto bySHA1 = db.FindMediaBySHA1("ea343f4e445a9050d4b4fbac2c77d0693b1d0922", error);
        REQUIRE(bySHA1.size() == 1);
        CHECK(bySHA1[0].id == mediaId);
        CHECK(bySHA1[0].sha1 == "ea343f4e445a9050d4b4fbac2c77d0693b1d0922");
        CHECK(db.FindMediaBySHA1("EA343F4E445A9050D4B4FBAC2C77D0693B1D0922", error).size() == 1);

        auto byName = db.FindMediaByDatName("Super Mario Bros. (World)", error);
        REQUIRE(byName);
        CHECK(byName->id == mediaId);
        CHECK_FALSE(db.FindMediaByDatName("Super Mario Bros. (Japan)", error));

        CHECK(db.MediaForRelease(releaseId, error).size() == 1);
        CHECK(db.ListMediaWithDatName("nes", error).size() == 1);
        CHECK(db.ListMediaWithDatName("psx", error).empty());
        CHECK(db.ListMediaWithDatName(std::nullopt, error).size() == 1);
    }

    SECTION("works with releases cannot be deleted") {
        CHECK(db.CountReleasesForWork(workId, error) == 1u);
        CHECK_FALSE(db.DeleteWork(workId, error));
        CHECK(error);

        REQUIRE(db.DeleteRelease(releaseId, error));
        REQUIRE(db.DeleteWork(workId, error));
        CHECK_FALSE(db.GetWork(workId, error));
        CHECK_FALSE(db.DeleteWork(workId, error));
        CHECK(error == catalog::CatalogError::NotFound);
    }

    SECTION("releases and media can be moved") {
        const EntityID otherWork = AddWork("Super Mario Bros");
        const EntityID otherRelease = AddRelease(otherWork, "nes", "japan", "Super Mario Bros");
        AddMedia(otherRelease, "Super Mario Bros (Japan)");
        AddMedia(otherRelease, "Super Mario Bros (Japan) (Rev 1)");

        CHECK(db.MoveMedia(otherRelease, releaseId, error) == 2u);
        CHECK(db.MediaForRelease(releaseId, error).size() == 2);
        CHECK_FALSE(db.MoveMedia(releaseId, 9999, error));
        CHECK(error == catalog::CatalogError::MissingRelease);

        REQUIRE(db.ReassignRelease(otherRelease, workId, error));
        CHECK(db.ReleasesForWork(workId, error).size() == 2);
        CHECK_FALSE(db.ReassignRelease(otherRelease, 9999, error));
        CHECK(error == catalog::CatalogError::MissingWork);
    }

    SECTION("single fields are written by name") {
        const EntityID mediaId = AddMedia(releaseId, "Super Mario Bros. (World)");

        REQUIRE(db.SetField(catalog::EntityType::Release, releaseId, "genre", "Platformer", error));
        CHECK(db.GetRelease(releaseId, error)->genre == "Platformer");

        REQUIRE(db.SetField(catalog::EntityType::Media, mediaId, "status", "BAD", error));
        CHECK(db.GetMedia(mediaId, error)->status == catalog::MediaStatus::Bad);

        CHECK_FALSE(db.SetField(catalog::EntityType::Release, releaseId, "id", "5", error));
        CHECK(error == catalog::CatalogError::UnknownField);
        CHECK_FALSE(db.SetField(catalog::EntityType::Work, workId, "title", "X", error));
        CHECK(error == catalog::CatalogError::UnknownField);
        CHECK_FALSE(db.SetField(catalog::EntityType::Media, 9999, "revision", "Rev 1", error));
        CHECK(error == catalog::CatalogError::NotFound);

        CHECK(catalog::CatalogDB::IsWritableField(catalog::EntityType::Media, "disc_label"));
        CHECK_FALSE(catalog::CatalogDB::IsWritableField(catalog::EntityType::Media, "sha1"));
    }
}

TEST_CASE_METHOD(test::CatalogFixture, "Disagreements are listed and resolved", "[catalog][catalog_db][disagreements]") {
    std::error_code error{};

    const EntityID workId = AddWork("Metroid");
    const EntityID releaseId = AddRelease(workId, "nes", "usa", "Metroid");

    auto add = [&](std::string field, catalog::EntityType type) {
        auto id = db.InsertDisagreement({.entityType = type,
                                         .entityId = releaseId,
                                         .field = std::move(field),
                                         .sourceA = "dat-import",
                                         .valueA = "a",
                                         .sourceB = "no-intro",
                                         .valueB = "b"},
                                        error);
        REQUIRE(id);
        return *id;
    };
    const EntityID first = add("release_date", catalog::EntityType::Release);
    add("genre", catalog::EntityType::Release);
    add("revision", catalog::EntityType::Media);

    CHECK(db.ListUnresolvedDisagreements({}, error).size() == 3);
    CHECK(db.ListUnresolvedDisagreements({.entityType = catalog::EntityType::Release}, error).size() == 2);
    CHECK(db.ListUnresolvedDisagreements({.field = "genre"}, error).size() == 1);
    CHECK(db.ListUnresolvedDisagreements({.entityId = releaseId, .limit = 1}, error).size() == 1);

    REQUIRE(db.ResolveDisagreement(first, "kept dat-import", error));
    CHECK(db.ListUnresolvedDisagreements({}, error).size() == 2);
    CHECK(Stats().unresolvedDisagreements == 2);

    CHECK_FALSE(db.ResolveDisagreement(first, "again", error));
    CHECK(error == catalog::CatalogError::NotFound);
    CHECK_FALSE(db.ResolveDisagreement(9999, "missing", error));
    CHECK(error == catalog::CatalogError::NotFound);
}

TEST_CASE_METHOD(test::CatalogFixture, "Import logs are listed newest first", "[catalog][catalog_db][import_log]") {
    std::error_code error{};

    REQUIRE(db.InsertImportLog({.sourceType = "dat", .sourceName = "first", .recordsCreated = 10}, error));
    REQUIRE(db.InsertImportLog(
        {.sourceType = "dat", .sourceName = "second", .sourceVersion = "2024-01-01", .recordsUpdated = 3}, error));

    auto logs = db.ListImportLogs(0, error);
    REQUIRE(logs.size() == 2);
    CHECK(logs[0].sourceName == "second");
    CHECK(logs[0].sourceVersion == "2024-01-01");
    CHECK(logs[0].recordsUpdated == 3);
    CHECK_FALSE(logs[0].importedAt.empty());
    CHECK(logs[1].recordsCreated == 10);

    CHECK(db.ListImportLogs(1, error).size() == 1);
    CHECK(Stats().importLogs == 2);
}

TEST_CASE_METHOD(test::CatalogFixture, "Transactions roll back unless committed", "[catalog][catalog_db][tx]") {
    std::error_code error{};

    SECTION("rollback on destruction") {
        {
            auto tx = db.BeginTransaction(error);
            REQUIRE(tx.IsActive());
            AddWork("Discarded");
        }
        CHECK(Stats().works == 0);
    }

    SECTION("commit") {
        {
            auto tx = db.BeginTransaction(error);
            AddWork("Kept");
            REQUIRE(tx.Commit(error));
            CHECK_FALSE(tx.IsActive());
        }
        CHECK(Stats().works == 1);
    }

    SECTION("nested rollback keeps the outer changes") {
        {
            auto outer = db.BeginTransaction(error);
            AddWork("Outer");
            {
                auto inner = db.BeginTransaction(error);
                REQUIRE(inner.IsActive());
                AddWork("Inner");
            }
            REQUIRE(outer.Commit(error));
        }
        CHECK(Stats().works == 1);
        CHECK(db.FindWorkByTitle("Outer", error));
        CHECK_FALSE(db.FindWorkByTitle("Inner", error));
    }

    SECTION("outer rollback discards committed inner changes") {
        {
            auto outer = db.BeginTransaction(error);
            auto inner = db.BeginTransaction(error);
            AddWork("Inner");
            REQUIRE(inner.Commit(error));
        }
        CHECK(Stats().works == 0);
    }
}

TEST_CASE_METHOD(test::CatalogFixture, "Statistics count every entity", "[catalog][catalog_db][stats]") {
    std::error_code error{};

    const EntityID workId = AddWork("Tetris");
    const EntityID releaseId = AddRelease(workId, "nes", "usa", "Tetris");
    AddMedia(releaseId, "Tetris (USA)");
    REQUIRE(db.UpsertCompany({.id = "nintendo", .name = "Nintendo"}, error));
    REQUIRE(db.UpsertOverride({.entityType = catalog::EntityType::Media,
                               .datNamePattern = "Tetris*",
                               .field = "revision",
                               .value = "Rev 1",
                               .reason = "test"},
                              error));

    const auto stats = Stats();
    CHECK(stats.platforms == 2);
    CHECK(stats.companies == 1);
    CHECK(stats.works == 1);
    CHECK(stats.releases == 1);
    CHECK(stats.media == 1);
    CHECK(stats.overrides == 1);
    CHECK(stats.unresolvedDisagreements == 0);
    CHECK(stats.importLogs == 0);

    // Upserting the same override replaces it
    REQUIRE(db.UpsertOverride({.entityType = catalog::EntityType::Media,
                               .datNamePattern = "Tetris*",
                               .field = "revision",
                               .value = "Rev 2",
                               .reason = "test"},
                              error));
    const auto overrides = db.ListOverrides(error);
    REQUIRE(overrides.size() == 1);
    CHECK(overrides[0].value == "Rev 2");
}

} // namespace catalog_db
