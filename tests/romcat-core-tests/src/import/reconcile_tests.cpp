#include <catch2/catch_test_macros.hpp>

#include <romcat/import/reconcile.hpp>

#include "../test_fixtures.hpp"

using namespace romcat;

namespace reconcile {

TEST_CASE_METHOD(test::CatalogFixture, "Works with equivalent titles are merged", "[import][reconcile]") {
    std::error_code error{};

    const EntityID first = AddWork("Super Mario Bros");
    const EntityID second = AddWork("Super Mario Bros.");
    const EntityID firstRelease = AddRelease(first, "nes", "usa", "Super Mario Bros");
    const EntityID secondRelease = AddRelease(second, "nes", "japan", "Super Mario Bros.");

    const import::ReconcileStats expected{
        .groupsFound = 1,
        .worksMerged = 1,
        .worksDeleted = 1,
        .releasesReassigned = 1,
        .releasesMerged = 0,
        .mediaMoved = 0,
    };

    SECTION("dry run") {
        auto result = import::ReconcileWorks(db, {.dryRun = true}, error);
        REQUIRE(result);
        CHECK(result->stats == expected);
        REQUIRE(result->details.size() == 1);
        CHECK(result->details[0].survivorId == first);
        CHECK(result->details[0].absorbedIds == std::vector<EntityID>{second});
        CHECK(result->details[0].totalReleases == 2);

        // Nothing changed
        CHECK(Stats().works == 2);
        CHECK(db.GetRelease(secondRelease, error)->workId == second);
    }

    SECTION("real run") {
        auto dryRun = import::ReconcileWorks(db, {.dryRun = true}, error);
        auto result = import::ReconcileWorks(db, {}, error);
        REQUIRE(dryRun);
        REQUIRE(result);
        CHECK(result->stats == expected);
        CHECK(result->stats == dryRun->stats);

        CHECK(Stats().works == 1);
        CHECK_FALSE(db.GetWork(second, error));
        const auto releases = db.ReleasesForWork(first, error);
        REQUIRE(releases.size() == 2);
        CHECK(releases[0].id == firstRelease);
        CHECK(releases[1].id == secondRelease);

        // A second run finds nothing to do
        auto again = import::ReconcileWorks(db, {}, error);
        REQUIRE(again);
        CHECK(again->stats == import::ReconcileStats{});
    }

    SECTION("platform filter") {
        auto result = import::ReconcileWorks(db, {.platformIds = {"psx"}}, error);
        REQUIRE(result);
        CHECK(result->stats.groupsFound == 0);
        CHECK(Stats().works == 2);
    }
}

TEST_CASE_METHOD(test::CatalogFixture, "The work with the most releases survives", "[import][reconcile]") {
    std::error_code error{};

    const EntityID small = AddWork("Legend of Zelda, The");
    const EntityID large = AddWork("The Legend of Zelda");
    AddRelease(small, "nes", "europe", "Legend of Zelda, The");
    AddRelease(large, "nes", "usa", "The Legend of Zelda");
    AddRelease(large, "nes", "japan", "The Legend of Zelda");

    auto result = import::ReconcileWorks(db, {}, error);
    REQUIRE(result);
    REQUIRE(result->details.size() == 1);
    CHECK(result->details[0].survivorId == large);
    CHECK(result->details[0].survivorTitle == "The Legend of Zelda");
    CHECK(result->details[0].absorbedTitles == std::vector<std::string>{"Legend of Zelda, The"});
    CHECK(db.ReleasesForWork(large, error).size() == 3);
    CHECK_FALSE(db.GetWork(small, error));
}

TEST_CASE_METHOD(test::CatalogFixture, "Colliding releases are folded together", "[import][reconcile]") {
    std::error_code error{};

    const EntityID first = AddWork("Tetris");
    const EntityID second = AddWork("TETRIS");
    const EntityID keptRelease = AddRelease(first, "nes", "usa", "Tetris");
    const EntityID foldedRelease = AddRelease(second, "nes", "usa", "TETRIS");
    AddMedia(keptRelease, "Tetris (USA)");
    AddMedia(foldedRelease, "TETRIS (USA) (Rev 1)");
    AddMedia(foldedRelease, "TETRIS (USA) (Rev 2)");

    REQUIRE(db.InsertDisagreement({.entityType = catalog::EntityType::Release,
                                   .entityId = foldedRelease,
                                   .field = "genre",
                                   .sourceA = "dat-import",
                                   .valueA = "Puzzle",
                                   .sourceB = "enrichment",
                                   .valueB = "Strategy"},
                                  error));

    auto result = import::ReconcileWorks(db, {}, error);
    REQUIRE(result);
    CHECK(result->stats.groupsFound == 1);
    CHECK(result->stats.worksMerged == 1);
    CHECK(result->stats.releasesReassigned == 0);
    CHECK(result->stats.releasesMerged == 1);
    CHECK(result->stats.mediaMoved == 2);

    CHECK_FALSE(db.GetRelease(foldedRelease, error));
    CHECK(db.MediaForRelease(keptRelease, error).size() == 3);

    const auto disagreements = db.ListUnresolvedDisagreements({}, error);
    REQUIRE(disagreements.size() == 1);
    CHECK(disagreements[0].entityId == keptRelease);

    const auto stats = Stats();
    CHECK(stats.works == 1);
    CHECK(stats.releases == 1);
    CHECK(stats.media == 3);
}

TEST_CASE_METHOD(test::CatalogFixture, "Works on different platforms are reconciled per platform",
                 "[import][reconcile]") {
    std::error_code error{};

    const EntityID nesWork = AddWork("Contra");
    const EntityID psxWork = AddWork("Contra!");
    AddRelease(nesWork, "nes", "usa", "Contra");
    AddRelease(psxWork, "psx", "usa", "Contra!");

    auto result = import::ReconcileWorks(db, {}, error);
    REQUIRE(result);
    CHECK(result->stats.groupsFound == 0);
    CHECK(Stats().works == 2);
}

TEST_CASE_METHOD(test::CatalogFixture, "Titles outside ASCII are compared by their characters",
                 "[import][reconcile]") {
    std::error_code error{};

    const EntityID dragonQuest = AddWork("ドラゴンクエスト");
    const EntityID finalFantasy = AddWork("ファイナルファンタジー");
    const EntityID dragonQuestRelease = AddRelease(dragonQuest, "nes", "japan", "ドラゴンクエスト");
    const EntityID finalFantasyRelease = AddRelease(finalFantasy, "nes", "japan", "ファイナルファンタジー");

    SECTION("distinct titles stay apart") {
        auto result = import::ReconcileWorks(db, {}, error);
        REQUIRE(result);
        CHECK(result->stats == import::ReconcileStats{});
        CHECK(Stats().works == 2);
        CHECK(db.GetRelease(dragonQuestRelease, error)->workId == dragonQuest);
        CHECK(db.GetRelease(finalFantasyRelease, error)->workId == finalFantasy);
    }

    SECTION("equal titles are merged") {
        const EntityID duplicate = AddWork("ドラゴンクエスト！");
        AddRelease(duplicate, "nes", "usa", "ドラゴンクエスト");

        auto result = import::ReconcileWorks(db, {}, error);
        REQUIRE(result);
        CHECK(result->stats.groupsFound == 1);
        CHECK(result->stats.worksMerged == 1);
        CHECK(db.ReleasesForWork(dragonQuest, error).size() == 2);
        CHECK(Stats().works == 2);
    }
}

TEST_CASE_METHOD(test::CatalogFixture, "Titles without comparable characters are never grouped",
                 "[import][reconcile]") {
    std::error_code error{};

    const EntityID first = AddWork("???");
    const EntityID second = AddWork("!!!");
    AddRelease(first, "nes", "usa", "???");
    AddRelease(second, "nes", "usa", "!!!");

    auto result = import::ReconcileWorks(db, {}, error);
    REQUIRE(result);
    CHECK(result->stats.groupsFound == 0);
    CHECK(Stats().works == 2);
    CHECK(Stats().releases == 2);
}

TEST_CASE_METHOD(test::FileCatalogFixture, "A failed reconciliation leaves the catalog untouched",
                 "[import][reconcile]") {
    std::error_code error{};

    const EntityID first = AddWork("Tetris");
    const EntityID second = AddWork("TETRIS");
    const EntityID firstRelease = AddRelease(first, "nes", "usa", "Tetris");
    const EntityID secondRelease = AddRelease(second, "nes", "japan", "TETRIS");

    // Releases are reassigned before works are deleted, so the failure happens halfway through the batch
    ExecRaw("CREATE TRIGGER reject_work_delete BEFORE DELETE ON works "
            "BEGIN SELECT RAISE(ABORT, 'works cannot be deleted'); END;");

    auto result = import::ReconcileWorks(db, {}, error);
    CHECK_FALSE(result);
    CHECK(error);

    error.clear();
    CHECK(db.GetRelease(firstRelease, error)->workId == first);
    CHECK(db.GetRelease(secondRelease, error)->workId == second);
    CHECK(db.GetWork(second, error));

    const auto stats = Stats();
    CHECK(stats.works == 2);
    CHECK(stats.releases == 2);
}

} // namespace reconcile
