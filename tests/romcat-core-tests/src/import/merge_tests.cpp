#include <catch2/catch_test_macros.hpp>

#include <romcat/import/merge.hpp>

#include "../test_fixtures.hpp"

using namespace romcat;

namespace merge {

TEST_CASE_METHOD(test::CatalogFixture, "Field checks record disagreements", "[import][merge]") {
    std::error_code error{};

    const EntityID workId = AddWork("Super Mario Bros.");
    const EntityID releaseId = AddRelease(workId, "nes", "usa", "Super Mario Bros.");

    auto unresolved = [&] { return db.ListUnresolvedDisagreements({}, error); };

    SECTION("missing existing value") {
        CHECK_FALSE(import::CheckField(db, catalog::EntityType::Release, releaseId, "release_date", "a", std::nullopt,
                                       "b", "X", error));
        CHECK_FALSE(error);
        CHECK(unresolved().empty());
    }

    SECTION("missing proposed value") {
        CHECK_FALSE(import::CheckField(db, catalog::EntityType::Release, releaseId, "release_date", "a", "X", "b",
                                       std::nullopt, error));
        CHECK(unresolved().empty());
    }

    SECTION("equal values") {
        CHECK_FALSE(import::CheckField(db, catalog::EntityType::Release, releaseId, "release_date", "a",
                                       "1985-10-18", "b", "1985-10-18", error));
        CHECK(unresolved().empty());
    }

    SECTION("conflicting values") {
        CHECK(import::CheckField(db, catalog::EntityType::Release, releaseId, "release_date", "dat-import",
                                 "1985-10-18", "no-intro", "1985-09-13", error));
        CHECK_FALSE(error);

        const auto rows = unresolved();
        REQUIRE(rows.size() == 1);
        CHECK(rows[0].entityType == catalog::EntityType::Release);
        CHECK(rows[0].entityId == releaseId);
        CHECK(rows[0].field == "release_date");
        CHECK(rows[0].sourceA == "dat-import");
        CHECK(rows[0].valueA == "1985-10-18");
        CHECK(rows[0].sourceB == "no-intro");
        CHECK(rows[0].valueB == "1985-09-13");
        CHECK_FALSE(rows[0].resolved);
    }
}

TEST_CASE_METHOD(test::CatalogFixture, "Release fields are merged without overwriting", "[import][merge]") {
    std::error_code error{};

    const EntityID workId = AddWork("Metroid");
    const EntityID releaseId = AddRelease(workId, "nes", "usa", "Metroid");
    {
        auto release = db.GetRelease(releaseId, error);
        REQUIRE(release);
        release->releaseDate = "1986-08-06";
        REQUIRE(db.UpdateRelease(*release, error));
    }

    const import::ReleaseFields fields{
        .title = "Metroid",
        .releaseDate = "1987-08-15",
        .genre = "Action",
        .players = "1",
    };
    auto disagreements =
        import::MergeReleaseFields(db, releaseId, import::kDatImportSource, "no-intro", fields, error);
    REQUIRE(disagreements);
    CHECK(*disagreements == 1);

    auto release = db.GetRelease(releaseId, error);
    REQUIRE(release);
    CHECK(release->title == "Metroid");
    CHECK(release->releaseDate == "1986-08-06");
    CHECK(release->genre == "Action");
    CHECK(release->players == "1");

    const auto rows = db.ListUnresolvedDisagreements({.field = "release_date"}, error);
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].sourceA == "dat-import");
    CHECK(rows[0].valueB == "1987-08-15");

    SECTION("merging the same facts again agrees on everything but the date") {
        auto again = import::MergeReleaseFields(db, releaseId, import::kDatImportSource, "no-intro", fields, error);
        REQUIRE(again);
        CHECK(*again == 1);
    }

    SECTION("missing release") {
        CHECK_FALSE(import::MergeReleaseFields(db, 9999, import::kDatImportSource, "no-intro", fields, error));
        CHECK(error == catalog::CatalogError::NotFound);
    }
}

TEST_CASE_METHOD(test::FileCatalogFixture, "A failed release merge records nothing", "[import][merge]") {
    std::error_code error{};

    const EntityID workId = AddWork("Metroid");
    auto releaseId = db.InsertRelease(
        {
            .workId = workId,
            .platformId = "nes",
            .region = "usa",
            .title = "Metroid",
            .releaseDate = "1987-08-15",
        },
        error);
    REQUIRE(releaseId);

    // The disagreement is written before the release update fails
    ExecRaw("CREATE TRIGGER reject_release_update BEFORE UPDATE ON releases "
            "BEGIN SELECT RAISE(ABORT, 'releases cannot be updated'); END;");

    const import::ReleaseFields fields{
        .releaseDate = "1986-08-06",
        .genre = "Action",
    };
    auto count = import::MergeReleaseFields(db, *releaseId, import::kDatImportSource, "No-Intro", fields, error);
    CHECK_FALSE(count);
    CHECK(error);

    error.clear();
    CHECK(db.ListUnresolvedDisagreements({}, error).empty());
    auto release = db.GetRelease(*releaseId, error);
    REQUIRE(release);
    CHECK(release->releaseDate == "1987-08-15");
    CHECK_FALSE(release->genre);
}

} // namespace merge
