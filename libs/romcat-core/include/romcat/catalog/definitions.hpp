#pragma once

/**
@file
@brief Loading of human-curated catalog definitions.

Curated definitions live in a directory with the following layout:

```
<definitions>/
  platforms/
    nes.toml        one platform per file
    snes.toml
  companies/
    nintendo.toml   one company per file
  overrides/
    psx.toml        an [[override]] array per file
```

Files are read in file name order. Missing subdirectories yield empty lists.
*/

#include "catalog_types.hpp"

#include <romcat/core/types.hpp>

#include <fmt/format.h>
#include <toml++/toml.hpp>

#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace romcat::catalog {

class CatalogDB;

/// @brief The complete set of curated definitions.
struct Definitions {
    std::vector<Platform> platforms;
    std::vector<Company> companies;
    std::vector<Override> overrides;
};

/// @brief The result of `LoadDefinitions`.
struct DefinitionsLoadResult {
    enum class Type { Success, FilesystemError, TOMLParseError, InvalidDefinition };

    static DefinitionsLoadResult Success() {
        return {.type = Type::Success};
    }

    static DefinitionsLoadResult FilesystemError(std::filesystem::path path, std::error_code error) {
        return {.type = Type::FilesystemError, .path = std::move(path), .value = error};
    }

    static DefinitionsLoadResult TOMLParseError(std::filesystem::path path, toml::parse_error error) {
        return {.type = Type::TOMLParseError, .path = std::move(path), .value = error};
    }

    static DefinitionsLoadResult InvalidDefinition(std::filesystem::path path, std::string message) {
        return {.type = Type::InvalidDefinition, .path = std::move(path), .value = std::move(message)};
    }

    explicit operator bool() const {
        return type == Type::Success;
    }

    std::string string() const {
        switch (type) {
        case Type::Success: return "Success";
        case Type::FilesystemError:
            return fmt::format("Filesystem error in {}: {}", path.string(), std::get<std::error_code>(value).message());
        case Type::TOMLParseError: //
        {
            auto &error = std::get<toml::parse_error>(value);
            std::ostringstream ss{};
            ss << error.source();
            return fmt::format("TOML parse error: {} (at {})", error.description(), ss.str());
        }
        case Type::InvalidDefinition:
            return fmt::format("Invalid definition in {}: {}", path.string(), std::get<std::string>(value));
        default: return "Unspecified error";
        }
    }

    Type type;
    std::filesystem::path path; ///< The offending file or directory
    std::variant<std::monostate, std::error_code, toml::parse_error, std::string> value;
};

/// @brief Loads every curated definition from a directory.
///
/// Loading stops at the first file that cannot be read or parsed; `defs` is left unchanged in that case.
///
/// @param[in] dir the definitions root directory
/// @param[out] defs receives the loaded definitions
/// @return the result of the operation
DefinitionsLoadResult LoadDefinitions(const std::filesystem::path &dir, Definitions &defs);

/// @brief Parses a platform definition from a TOML table.
DefinitionsLoadResult ParsePlatform(const toml::table &table, const std::filesystem::path &path, Platform &platform);

/// @brief Parses a company definition from a TOML table.
DefinitionsLoadResult ParseCompany(const toml::table &table, const std::filesystem::path &path, Company &company);

/// @brief Parses an `[[override]]` entry from a TOML table.
DefinitionsLoadResult ParseOverride(const toml::table &table, const std::filesystem::path &path, Override &ovr);

/// @brief Number of definitions written by `SeedCatalog`.
struct SeedStats {
    uint64 platforms = 0;
    uint64 companies = 0;
    uint64 overrides = 0;
};

/// @brief Upserts every definition into the catalog in a single transaction.
///
/// Platforms and companies are upserted by ID. Overrides replace any override with the same target and field, so
/// seeding the same definitions twice leaves the catalog unchanged.
///
/// @param[in] db the catalog store
/// @param[in] defs the definitions to write
/// @param[out] error receives the error if any write failed
/// @return the number of definitions written, or `std::nullopt` on failure
std::optional<SeedStats> SeedCatalog(CatalogDB &db, const Definitions &defs, std::error_code &error);

} // namespace romcat::catalog
