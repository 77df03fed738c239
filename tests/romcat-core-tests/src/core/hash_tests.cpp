#include <catch2/catch_test_macros.hpp>

#include <romcat/core/hash.hpp>

using namespace romcat;

namespace hash {

TEST_CASE("Digests are formatted as lowercase hex", "[core][hash]") {
    CHECK(ToString(uint32{0}) == "00000000");
    CHECK(ToString(uint32{0xCBF43926}) == "cbf43926");

    SHA1Hash sha1{};
    for (size_t i = 0; i < sha1.size(); ++i) {
        sha1[i] = static_cast<uint8>(i * 0x11);
    }
    CHECK(ToString(sha1) == "00112233445566778899aabbccddeeff00112233");

    MD5Hash md5{};
    md5.fill(0xAB);
    CHECK(ToString(md5) == "abababababababababababababababab");
}

} // namespace hash
