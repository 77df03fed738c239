#include <catch2/catch_test_macros.hpp>

#include <romcat/import/scan.hpp>

#include "../test_fixtures.hpp"

#include <atomic>
#include <string>
#include <vector>

using namespace romcat;

namespace scan {

static FileDigests DigestsOf(const std::vector<uint8> &data, const media::PaddingSpec &padding = {}) {
    std::error_code error{};
    const auto digests = media::HashBuffer(data, padding, error);
    REQUIRE(digests);
    return *digests;
}

static db::ReferenceRecord RecordFor(std::string name, const FileDigests &digests) {
    return {
        .name = std::move(name),
        .primaryHash = ToString(digests.sha1),
        .secondaryHash = ToString(digests.crc32),
        .md5 = ToString(digests.md5),
        .expectedLength = digests.dataSize,
    };
}

struct ScanFixture : test::CatalogFixture {
    ScanFixture()
        : catalogData(test::MakeData(2048, 1))
        , indexedData(test::MakeData(2048, 2))
        , uncatalogedData(test::MakeData(2048, 3))
        , trimmedData(test::MakeData(3000, 4))
        , unknownData(test::MakeData(3000, 5)) {

        const EntityID work = AddWork("Excitebike");
        const EntityID release = AddRelease(work, "nes", "usa", "Excitebike");
        catalogMediaId = AddMedia(release, "Excitebike (USA)", ToString(DigestsOf(catalogData).sha1));
        indexedMediaId = AddMedia(release, "Excitebike (USA) (Rev 1)");

        index = db::HashIndex{{
            RecordFor("Excitebike (USA) (Rev 1)", DigestsOf(indexedData)),
            RecordFor("Excitebike (Japan)", DigestsOf(uncatalogedData)),
            RecordFor("Excitebike (Europe)", DigestsOf(trimmedData, {.appendSize = 1096, .fillByte = 0x00})),
        }};
    }

    std::vector<uint8> catalogData;
    std::vector<uint8> indexedData;
    std::vector<uint8> uncatalogedData;
    std::vector<uint8> trimmedData;
    std::vector<uint8> unknownData;

    EntityID catalogMediaId = kInvalidEntityID;
    EntityID indexedMediaId = kInvalidEntityID;
    db::HashIndex index;
    test::TempDir dir;
};

TEST_CASE_METHOD(ScanFixture, "Files are classified against the catalog and the index", "[import][scan]") {
    std::error_code error{};

    SECTION("catalog media matched by SHA-1") {
        const auto path = dir.WriteFile("a.nes", catalogData);
        auto file = import::ClassifyFile(path, index, db, {}, error);
        REQUIRE(file);
        const auto *matched = std::get_if<import::ScanMatched>(&file->classification);
        REQUIRE(matched != nullptr);
        CHECK(matched->mediaId == catalogMediaId);
        CHECK(file->headerSkip == 0);
        CHECK(file->digests.dataSize == 2048);
    }

    SECTION("reference record resolved through its name") {
        const auto path = dir.WriteFile("b.nes", indexedData);
        auto file = import::ClassifyFile(path, index, db, {}, error);
        REQUIRE(file);
        const auto *matched = std::get_if<import::ScanMatched>(&file->classification);
        REQUIRE(matched != nullptr);
        CHECK(matched->mediaId == indexedMediaId);
    }

    SECTION("reference record missing from the catalog") {
        const auto path = dir.WriteFile("c.nes", uncatalogedData);
        auto file = import::ClassifyFile(path, index, db, {}, error);
        REQUIRE(file);
        const auto *unmatched = std::get_if<import::ScanUnmatched>(&file->classification);
        REQUIRE(unmatched != nullptr);
        REQUIRE(unmatched->record != nullptr);
        CHECK(unmatched->record->name == "Excitebike (Japan)");
    }

    SECTION("trimmed dump") {
        const auto path = dir.WriteFile("d.nes", trimmedData);
        auto file = import::ClassifyFile(path, index, db, {}, error);
        REQUIRE(file);
        const auto *needsRepair = std::get_if<import::ScanNeedsRepair>(&file->classification);
        REQUIRE(needsRepair != nullptr);
        REQUIRE(needsRepair->repair.record != nullptr);
        CHECK(needsRepair->repair.record->name == "Excitebike (Europe)");
        CHECK(needsRepair->repair.padding == media::PaddingSpec{.appendSize = 1096, .fillByte = 0x00});
        CHECK(needsRepair->repair.bytesAdded == 1096);
    }

    SECTION("trimmed dump without repair") {
        const auto path = dir.WriteFile("d.nes", trimmedData);
        auto file = import::ClassifyFile(path, index, db, {.tryRepair = false}, error);
        REQUIRE(file);
        const auto *unmatched = std::get_if<import::ScanUnmatched>(&file->classification);
        REQUIRE(unmatched != nullptr);
        CHECK(unmatched->record == nullptr);
    }

    SECTION("unknown file") {
        const auto path = dir.WriteFile("e.nes", unknownData);
        auto file = import::ClassifyFile(path, index, db, {}, error);
        REQUIRE(file);
        const auto *unmatched = std::get_if<import::ScanUnmatched>(&file->classification);
        REQUIRE(unmatched != nullptr);
        CHECK(unmatched->record == nullptr);
    }

    SECTION("missing file") {
        auto file = import::ClassifyFile(dir.path / "missing.nes", index, db, {}, error);
        CHECK_FALSE(file);
        CHECK(error);
    }
}

TEST_CASE_METHOD(ScanFixture, "Headers are skipped before hashing", "[import][scan]") {
    std::error_code error{};

    std::vector<uint8> headered{'N', 'E', 'S', 0x1A, 0x02, 0x01, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};
    headered.insert(headered.end(), catalogData.begin(), catalogData.end());
    const auto path = dir.WriteFile("headered.nes", headered);

    SECTION("with the platform's header format") {
        auto file = import::ClassifyFile(path, index, db, {.headerFormat = media::HeaderFormat::INES}, error);
        REQUIRE(file);
        CHECK(file->headerSkip == 16);
        const auto *matched = std::get_if<import::ScanMatched>(&file->classification);
        REQUIRE(matched != nullptr);
        CHECK(matched->mediaId == catalogMediaId);
    }

    SECTION("without a header format") {
        auto file = import::ClassifyFile(path, index, db, {.tryRepair = false}, error);
        REQUIRE(file);
        CHECK(file->headerSkip == 0);
        CHECK(std::holds_alternative<import::ScanUnmatched>(file->classification));
    }
}

namespace {

    struct RecordingListener : import::IScanListener {
        void OnFile(size_t current, size_t total, const std::filesystem::path &path) override {
            files.push_back(path.filename().string());
            if (cancel != nullptr && current == cancelAt) {
                cancel->store(true);
            }
        }

        void OnMatch(const import::ClassifiedFile &file, std::string_view title) override {
            matches.emplace_back(title);
        }

        void OnNoMatch(const import::ClassifiedFile &file) override {
            ++noMatches;
        }

        void OnRepairable(const import::ClassifiedFile &file, const repair::RepairMatch &repair) override {
            repairs.push_back(repair.method);
        }

        void OnError(const std::filesystem::path &path, std::error_code error) override {
            errors.push_back(path.filename().string());
        }

        void OnComplete(const import::ScanStats &stats) override {
            ++completions;
        }

        std::vector<std::string> files;
        std::vector<std::string> matches;
        std::vector<std::string> repairs;
        std::vector<std::string> errors;
        uint32 noMatches = 0;
        uint32 completions = 0;

        std::atomic_bool *cancel = nullptr;
        size_t cancelAt = 0;
    };

} // namespace

TEST_CASE_METHOD(ScanFixture, "Batches of files are scanned", "[import][scan]") {
    const std::vector<std::filesystem::path> paths{
        dir.WriteFile("1.nes", catalogData),
        dir.path / "2-missing.nes",
        dir.WriteFile("3.nes", trimmedData),
        dir.WriteFile("4.nes", unknownData),
        dir.WriteFile("5.nes", indexedData),
    };
    RecordingListener listener{};

    SECTION("errors do not stop the scan") {
        const auto stats = import::ScanFiles(paths, index, db, {}, &listener, nullptr);
        CHECK(stats.files == 5);
        CHECK(stats.matched == 2);
        CHECK(stats.repairable == 1);
        CHECK(stats.unmatched == 1);
        CHECK(stats.errors == 1);
        CHECK_FALSE(stats.cancelled);

        CHECK(listener.files == std::vector<std::string>{"1.nes", "2-missing.nes", "3.nes", "4.nes", "5.nes"});
        CHECK(listener.matches == std::vector<std::string>{"Excitebike (USA)", "Excitebike (USA) (Rev 1)"});
        CHECK(listener.repairs == std::vector<std::string>{"append 1096 bytes of 0x00"});
        CHECK(listener.errors == std::vector<std::string>{"2-missing.nes"});
        CHECK(listener.noMatches == 1);
        CHECK(listener.completions == 1);
    }

    SECTION("no listener") {
        const auto stats = import::ScanFiles(paths, index, db, {}, nullptr, nullptr);
        CHECK(stats.files == 5);
        CHECK(stats.errors == 1);
    }

    SECTION("cancelled before starting") {
        std::atomic_bool cancel{true};
        const auto stats = import::ScanFiles(paths, index, db, {}, &listener, &cancel);
        CHECK(stats.cancelled);
        CHECK(stats.files == 0);
        CHECK(listener.files.empty());
        CHECK(listener.completions == 1);
    }

    SECTION("cancelled during the scan") {
        std::atomic_bool cancel{false};
        listener.cancel = &cancel;
        listener.cancelAt = 2;
        const auto stats = import::ScanFiles(paths, index, db, {}, &listener, &cancel);
        CHECK(stats.cancelled);
        CHECK(stats.files == 3);
        CHECK(stats.matched == 1);
        CHECK(stats.errors == 1);
        CHECK(stats.repairable == 1);
    }
}

TEST_CASE_METHOD(ScanFixture, "Matches without a dat-name are reported by file name", "[import][scan]") {
    std::error_code error{};

    const auto data = test::MakeData(1536, 6);
    const EntityID work = AddWork("Gyromite");
    const EntityID release = AddRelease(work, "nes", "usa", "Gyromite");
    REQUIRE(db.InsertMedia({.releaseId = release, .sha1 = ToString(DigestsOf(data).sha1)}, error));

    const std::vector<std::filesystem::path> paths{dir.WriteFile("gyromite.nes", data)};
    RecordingListener listener{};
    const auto stats = import::ScanFiles(paths, index, db, {}, &listener, nullptr);
    CHECK(stats.matched == 1);
    CHECK(stats.errors == 0);
    CHECK(listener.matches == std::vector<std::string>{"gyromite.nes"});
}

TEST_CASE("Scan files are collected from a directory", "[import][scan]") {
    test::TempDir dir{};
    std::error_code error{};

    dir.WriteText("b.nes", "b");
    dir.WriteText("a.NES", "a");
    dir.WriteText("readme.txt", "readme");
    dir.WriteText("sub/c.nes", "c");
    dir.WriteText("sub/deeper/d.fds", "d");

    auto names = [&](const std::vector<std::filesystem::path> &files) {
        std::vector<std::string> result{};
        for (const auto &file : files) {
            result.push_back(file.lexically_relative(dir.path).generic_string());
        }
        return result;
    };

    SECTION("recursive with extensions") {
        const auto files = import::CollectScanFiles(dir.path, {.extensions = {".nes", ".fds"}}, error);
        CHECK_FALSE(error);
        CHECK(names(files) == std::vector<std::string>{"a.NES", "b.nes", "sub/c.nes", "sub/deeper/d.fds"});
    }

    SECTION("top level only") {
        const auto files =
            import::CollectScanFiles(dir.path, {.extensions = {".nes"}, .recursive = false}, error);
        CHECK_FALSE(error);
        CHECK(names(files) == std::vector<std::string>{"a.NES", "b.nes"});
    }

    SECTION("every file") {
        const auto files = import::CollectScanFiles(dir.path, {}, error);
        CHECK_FALSE(error);
        CHECK(files.size() == 5);
    }

    SECTION("missing directory") {
        const auto files = import::CollectScanFiles(dir.path / "missing", {}, error);
        CHECK(error);
        CHECK(files.empty());
    }
}

} // namespace scan
