#include <catch2/catch_test_macros.hpp>

#include <romcat/core/configuration.hpp>

#include "../test_fixtures.hpp"

using namespace romcat;

namespace configuration {

TEST_CASE("Configuration defaults", "[core][configuration]") {
    const Configuration config{};
    CHECK(config.hashing.chunkSize == 64_KiB);
    CHECK(config.scan.extensions.empty());
    CHECK(config.scan.recursive);
    CHECK(config.importer.sourceName == "dat");
}

TEST_CASE("Configuration files are loaded", "[core][configuration]") {
    test::TempDir dir{};
    Configuration config{};

    SECTION("all tables") {
        const auto path = dir.WriteText("romcat.toml", R"(
ConfigVersion = 1

[Catalog]
DefinitionsPath = "catalog"
DatabasePath = "/var/lib/romcat/catalog.db"

[Hashing]
ChunkSize = 131072

[Scan]
Extensions = ["NES", ".sfc", "bin"]
Recursive = false

[Import]
SourceName = "no-intro"
)");

        const auto result = LoadConfiguration(path, config);
        INFO(result.string());
        REQUIRE(result);
        CHECK(config.catalog.definitionsPath.string() == (dir.path / "catalog").string());
        CHECK(config.catalog.databasePath.string() == "/var/lib/romcat/catalog.db");
        CHECK(config.hashing.chunkSize == 128_KiB);
        CHECK(config.scan.extensions == std::vector<std::string>{".nes", ".sfc", ".bin"});
        CHECK_FALSE(config.scan.recursive);
        CHECK(config.importer.sourceName == "no-intro");
    }

    SECTION("missing keys keep their values") {
        config.importer.sourceName = "redump";
        const auto path = dir.WriteText("romcat.toml", "[Hashing]\nChunkSize = 1\n");

        REQUIRE(LoadConfiguration(path, config));
        CHECK(config.importer.sourceName == "redump");
        // Chunk sizes are clamped
        CHECK(config.hashing.chunkSize == 4_KiB);
    }

    SECTION("newer configuration versions are rejected") {
        const auto path = dir.WriteText("romcat.toml", "ConfigVersion = 2\n");
        const auto result = LoadConfiguration(path, config);
        CHECK(result.type == ConfigLoadResult::Type::UnsupportedConfigVersion);
        CHECK(result.string() == "Unsupported configuration version: 2");
    }

    SECTION("malformed files") {
        const auto path = dir.WriteText("romcat.toml", "[Scan\nRecursive = true\n");
        CHECK(LoadConfiguration(path, config).type == ConfigLoadResult::Type::TOMLParseError);
    }

    SECTION("missing files") {
        const auto result = LoadConfiguration(dir.path / "missing.toml", config);
        CHECK(result.type == ConfigLoadResult::Type::FilesystemError);
    }
}

} // namespace configuration
