#include <catch2/catch_test_macros.hpp>

#include <romcat/db/hash_index.hpp>

using namespace romcat;

namespace hash_index {

static db::ReferenceRecord MakeRecord(std::string name, std::string sha1, std::string crc32,
                                      std::optional<uint64> length = std::nullopt) {
    return {
        .name = std::move(name),
        .primaryHash = std::move(sha1),
        .secondaryHash = std::move(crc32),
        .expectedLength = length,
    };
}

TEST_CASE("Hash index looks up records by primary hash", "[db][hash_index]") {
    const db::HashIndex index{{
        MakeRecord("Alpha (USA)", "0123456789abcdef0123456789abcdef01234567", "deadbeef"),
        MakeRecord("Beta (Europe)", "89ABCDEF0123456789ABCDEF0123456789ABCDEF", "cafebabe"),
    }};

    SECTION("exact hash") {
        const auto *record = index.LookupPrimary("0123456789abcdef0123456789abcdef01234567");
        REQUIRE(record != nullptr);
        CHECK(record->name == "Alpha (USA)");
    }

    SECTION("any letter case") {
        const auto *upper = index.LookupPrimary("0123456789ABCDEF0123456789ABCDEF01234567");
        REQUIRE(upper != nullptr);
        CHECK(upper->name == "Alpha (USA)");

        const auto *lower = index.LookupPrimary("89abcdef0123456789abcdef0123456789abcdef");
        REQUIRE(lower != nullptr);
        CHECK(lower->name == "Beta (Europe)");
    }

    SECTION("absent hash") {
        CHECK(index.LookupPrimary("ffffffffffffffffffffffffffffffffffffffff") == nullptr);
        CHECK(index.LookupPrimary("") == nullptr);
    }

    SECTION("secondary hash") {
        const auto *record = index.LookupSecondary("CAFEBABE");
        REQUIRE(record != nullptr);
        CHECK(record->name == "Beta (Europe)");
        CHECK(index.LookupSecondary("00000000") == nullptr);
    }

    CHECK(index.Size() == 2);
    CHECK(index.PrimaryCount() == 2);
    CHECK(index.SecondaryCount() == 2);
}

TEST_CASE("Hash index keeps the first record for duplicate keys", "[db][hash_index]") {
    const db::HashIndex index{{
        MakeRecord("First", "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa", "11111111"),
        MakeRecord("Second", "AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA", "11111111"),
    }};

    const auto *byPrimary = index.LookupPrimary("aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa");
    REQUIRE(byPrimary != nullptr);
    CHECK(byPrimary->name == "First");

    const auto *bySecondary = index.LookupSecondary("11111111");
    REQUIRE(bySecondary != nullptr);
    CHECK(bySecondary->name == "First");

    CHECK(index.Size() == 2);
    CHECK(index.PrimaryCount() == 1);
}

TEST_CASE("Hash index looks up serials regardless of formatting", "[db][hash_index]") {
    db::ReferenceRecord record{.name = "Ridge Racer (Japan)", .serial = "SLPS-00001, SLPS 00002"};
    const db::HashIndex index{{record}};

    CHECK(index.SerialCount() == 2);
    REQUIRE(index.LookupSerial("slps00001") != nullptr);
    REQUIRE(index.LookupSerial("SLPS-00002") != nullptr);
    CHECK(index.LookupSerial("SLPS-00003") == nullptr);

    CHECK(db::NormalizeSerial("slus-00 123") == "SLUS00123");
}

TEST_CASE("Hash index matches file digests", "[db][hash_index]") {
    FileDigests digests{.crc32 = 0x12345678, .dataSize = 1024};
    digests.sha1.fill(0xAB);

    SECTION("by SHA-1") {
        const db::HashIndex index{{MakeRecord("Match", ToString(digests.sha1), "ffffffff", 4096)}};
        const auto *record = index.LookupDigests(digests);
        REQUIRE(record != nullptr);
        CHECK(record->name == "Match");
    }

    SECTION("by CRC32 with matching size") {
        const db::HashIndex index{{MakeRecord("Match", "", "12345678", 1024)}};
        CHECK(index.LookupDigests(digests) != nullptr);
    }

    SECTION("by CRC32 with unknown size") {
        const db::HashIndex index{{MakeRecord("Match", "", "12345678")}};
        CHECK(index.LookupDigests(digests) != nullptr);
    }

    SECTION("CRC32 with a different size is rejected") {
        const db::HashIndex index{{MakeRecord("Other", "", "12345678", 2048)}};
        CHECK(index.LookupDigests(digests) == nullptr);
    }
}

TEST_CASE("Hash index reports expected lengths", "[db][hash_index]") {
    const db::HashIndex index{{
        MakeRecord("A", "a1", "00000001", 4096),
        MakeRecord("B", "b1", "00000002", 1024),
        MakeRecord("C", "c1", "00000003", 4096),
        MakeRecord("D", "d1", "00000004"),
    }};

    CHECK(index.ExpectedLengths() == std::vector<uint64>{1024, 4096});
    CHECK(index.CandidatesBySize(4096).size() == 2);
    CHECK(index.CandidatesBySize(1024).size() == 1);
    CHECK(index.CandidatesBySize(2048).empty());
    CHECK(index.UnsizedCount() == 1);
}

} // namespace hash_index
