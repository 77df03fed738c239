#include <catch2/catch_test_macros.hpp>

#include <romcat/media/hasher.hpp>

#include "../test_fixtures.hpp"

#include <sstream>
#include <string_view>

using namespace romcat;

namespace hasher {

static std::span<const uint8> Bytes(std::string_view str) {
    return {reinterpret_cast<const uint8 *>(str.data()), str.size()};
}

TEST_CASE("Hasher computes CRC32, SHA-1 and MD5", "[media][hasher]") {
    std::error_code error{};

    SECTION("empty input") {
        auto digests = media::HashBuffer({}, {}, error);
        REQUIRE(digests);
        CHECK(ToString(digests->crc32) == "00000000");
        CHECK(ToString(digests->sha1) == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
        CHECK(ToString(digests->md5) == "d41d8cd98f00b204e9800998ecf8427e");
        CHECK(digests->dataSize == 0);
    }

    SECTION("\"abc\"") {
        auto digests = media::HashBuffer(Bytes("abc"), {}, error);
        REQUIRE(digests);
        CHECK(ToString(digests->crc32) == "352441c2");
        CHECK(ToString(digests->sha1) == "a9993e364706816aba3e25717850c26c9cd0d89d");
        CHECK(ToString(digests->md5) == "900150983cd24fb0d6963f7d28e17f72");
        CHECK(digests->dataSize == 3);
    }

    SECTION("\"123456789\"") {
        auto digests = media::HashBuffer(Bytes("123456789"), {}, error);
        REQUIRE(digests);
        CHECK(digests->crc32 == 0xCBF43926);
    }

    SECTION("incremental updates") {
        media::Hasher hasher{};
        REQUIRE(hasher.Update(Bytes("a"), error));
        REQUIRE(hasher.Update(Bytes("bc"), error));
        auto digests = hasher.Finish(error);
        REQUIRE(digests);
        CHECK(ToString(digests->sha1) == "a9993e364706816aba3e25717850c26c9cd0d89d");

        CHECK_FALSE(hasher.Update(Bytes("d"), error));
        CHECK(error);
        CHECK_FALSE(hasher.Finish(error));
    }
}

TEST_CASE("Padding hashes the same as explicit bytes", "[media][hasher]") {
    const auto data = test::MakeData(3000, 7);
    std::error_code error{};

    for (uint64 padSize : {uint64{1}, uint64{4095}, uint64{65536}, uint64{65537}, uint64{128 * 1024}}) {
        for (uint8 fill : {uint8{0x00}, uint8{0xFF}}) {
            std::vector<uint8> appended = data;
            appended.insert(appended.end(), padSize, fill);
            std::vector<uint8> prepended(padSize, fill);
            prepended.insert(prepended.end(), data.begin(), data.end());

            const auto explicitAppend = media::HashBuffer(appended, {}, error);
            const auto explicitPrepend = media::HashBuffer(prepended, {}, error);
            REQUIRE(explicitAppend);
            REQUIRE(explicitPrepend);

            std::istringstream in1{std::string(data.begin(), data.end())};
            const auto streamedAppend =
                media::HashStream(in1, 0, {.appendSize = padSize, .fillByte = fill}, 4096, error);
            REQUIRE(streamedAppend);

            std::istringstream in2{std::string(data.begin(), data.end())};
            const auto streamedPrepend =
                media::HashStream(in2, 0, {.prependSize = padSize, .fillByte = fill}, 4096, error);
            REQUIRE(streamedPrepend);

            CHECK(streamedAppend->crc32 == explicitAppend->crc32);
            CHECK(streamedAppend->sha1 == explicitAppend->sha1);
            CHECK(streamedAppend->md5 == explicitAppend->md5);
            CHECK(streamedAppend->dataSize == data.size() + padSize);

            CHECK(streamedPrepend->crc32 == explicitPrepend->crc32);
            CHECK(streamedPrepend->sha1 == explicitPrepend->sha1);
            CHECK(streamedPrepend->md5 == explicitPrepend->md5);
        }
    }
}

TEST_CASE("Hashing files", "[media][hasher]") {
    test::TempDir dir{};
    std::error_code error{};

    const auto data = test::MakeData(200 * 1024, 3);
    const auto path = dir.WriteFile("game.bin", data);

    SECTION("whole file in small chunks matches the buffer hash") {
        auto fromFile = media::HashFile(path, 0, {}, 1000, error);
        auto fromBuffer = media::HashBuffer(data, {}, error);
        REQUIRE(fromFile);
        REQUIRE(fromBuffer);
        CHECK(fromFile->sha1 == fromBuffer->sha1);
        CHECK(fromFile->dataSize == data.size());
    }

    SECTION("header bytes are skipped") {
        auto fromFile = media::HashFile(path, 16, {}, media::kDefaultChunkSize, error);
        auto fromBuffer = media::HashBuffer(std::span{data}.subspan(16), {}, error);
        REQUIRE(fromFile);
        REQUIRE(fromBuffer);
        CHECK(fromFile->md5 == fromBuffer->md5);
        CHECK(fromFile->dataSize == data.size() - 16);
    }

    SECTION("missing file") {
        auto digests = media::HashFile(dir.path / "missing.bin", 0, {}, media::kDefaultChunkSize, error);
        CHECK_FALSE(digests);
        CHECK(error);
    }
}

TEST_CASE("Padding specs report their size", "[media][hasher]") {
    const media::PaddingSpec none{};
    CHECK(none.IsEmpty());
    CHECK(none.TotalSize() == 0);

    const media::PaddingSpec both{.prependSize = 10, .appendSize = 20, .fillByte = 0xFF};
    CHECK_FALSE(both.IsEmpty());
    CHECK(both.TotalSize() == 30);
}

} // namespace hasher
