#include <romcat/catalog/definitions.hpp>

#include <romcat/catalog/catalog_db.hpp>

#include <romcat/util/dev_log.hpp>

#include <algorithm>

namespace romcat::catalog {

namespace grp {

    struct defs {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Definitions";
    };

} // namespace grp

namespace fs = std::filesystem;

template <typename T>
static void Parse(const toml::table &table, const char *name, T &value) {
    if (auto opt = table[name].value<T>()) {
        value = *opt;
    }
}

template <typename T>
static void Parse(const toml::table &table, const char *name, std::optional<T> &value) {
    if (auto opt = table[name].value<T>()) {
        value = *opt;
    }
}

static void Parse(const toml::table &table, const char *name, std::optional<uint32> &value) {
    if (auto opt = table[name].value<sint64>(); opt && *opt >= 0) {
        value = static_cast<uint32>(*opt);
    }
}

// Lists the .toml files in a directory sorted by file name. A missing directory is not an error.
static bool ListDefinitionFiles(const fs::path &dir, std::vector<fs::path> &files, std::error_code &error) {
    files.clear();
    error.clear();
    if (!fs::exists(dir, error)) {
        return !error;
    }
    if (!fs::is_directory(dir, error)) {
        if (!error) {
            error = std::make_error_code(std::errc::not_a_directory);
        }
        return false;
    }

    for (fs::directory_iterator it{dir, error}, end{}; !error && it != end; it.increment(error)) {
        const fs::directory_entry &entry = *it;
        std::error_code entryError{};
        if (entry.path().extension() == ".toml" && entry.is_regular_file(entryError)) {
            files.push_back(entry.path());
        }
    }
    if (error) {
        return false;
    }

    std::sort(files.begin(), files.end(),
              [](const fs::path &lhs, const fs::path &rhs) { return lhs.filename() < rhs.filename(); });
    return true;
}

DefinitionsLoadResult ParsePlatform(const toml::table &table, const fs::path &path, Platform &platform) {
    platform = {};

    Parse(table, "id", platform.id);
    Parse(table, "display_name", platform.displayName);
    Parse(table, "short_name", platform.shortName);
    Parse(table, "manufacturer", platform.manufacturer);
    Parse(table, "generation", platform.generation);
    Parse(table, "release_year", platform.releaseYear);
    Parse(table, "description", platform.description);

    if (platform.id.empty()) {
        return DefinitionsLoadResult::InvalidDefinition(path, "platform has no id");
    }
    if (platform.displayName.empty()) {
        return DefinitionsLoadResult::InvalidDefinition(path,
                                                        fmt::format("platform {} has no display_name", platform.id));
    }
    if (platform.shortName.empty()) {
        platform.shortName = platform.displayName;
    }

    if (auto opt = table["media_type"].value<std::string>()) {
        auto mediaType = ParseMediaType(*opt);
        if (!mediaType) {
            return DefinitionsLoadResult::InvalidDefinition(path, fmt::format("unknown media_type \"{}\"", *opt));
        }
        platform.mediaType = *mediaType;
    }

    if (auto opt = table["header_format"].value<std::string>()) {
        auto headerFormat = media::ParseHeaderFormat(*opt);
        if (!headerFormat) {
            return DefinitionsLoadResult::InvalidDefinition(path, fmt::format("unknown header_format \"{}\"", *opt));
        }
        platform.headerFormat = *headerFormat;
    }

    if (const toml::array *regions = table["regions"].as_array()) {
        for (const toml::node &node : *regions) {
            const toml::table *tblRegion = node.as_table();
            if (tblRegion == nullptr) {
                return DefinitionsLoadResult::InvalidDefinition(path, "regions entries must be tables");
            }
            PlatformRegion region{};
            Parse(*tblRegion, "region", region.region);
            Parse(*tblRegion, "release_date", region.releaseDate);
            if (region.region.empty()) {
                return DefinitionsLoadResult::InvalidDefinition(path, "region entry has no region");
            }
            platform.regions.push_back(std::move(region));
        }
    }

    if (const toml::array *relationships = table["relationships"].as_array()) {
        for (const toml::node &node : *relationships) {
            const toml::table *tblRel = node.as_table();
            if (tblRel == nullptr) {
                return DefinitionsLoadResult::InvalidDefinition(path, "relationships entries must be tables");
            }
            PlatformRelation rel{};
            Parse(*tblRel, "platform", rel.platformId);
            const std::string typeStr = (*tblRel)["type"].value_or(std::string{});
            auto type = ParsePlatformRelationship(typeStr);
            if (rel.platformId.empty() || !type) {
                return DefinitionsLoadResult::InvalidDefinition(
                    path, fmt::format("invalid relationship to \"{}\" of type \"{}\"", rel.platformId, typeStr));
            }
            rel.type = *type;
            platform.relationships.push_back(std::move(rel));
        }
    }

    return DefinitionsLoadResult::Success();
}

DefinitionsLoadResult ParseCompany(const toml::table &table, const fs::path &path, Company &company) {
    company = {};

    Parse(table, "id", company.id);
    Parse(table, "name", company.name);
    Parse(table, "country", company.country);

    if (company.id.empty()) {
        return DefinitionsLoadResult::InvalidDefinition(path, "company has no id");
    }
    if (company.name.empty()) {
        company.name = company.id;
    }

    if (const toml::array *aliases = table["aliases"].as_array()) {
        for (const toml::node &node : *aliases) {
            if (auto alias = node.value<std::string>()) {
                company.aliases.push_back(std::move(*alias));
            }
        }
    }

    return DefinitionsLoadResult::Success();
}

DefinitionsLoadResult ParseOverride(const toml::table &table, const fs::path &path, Override &ovr) {
    ovr = {};

    const std::string entityTypeStr = table["entity_type"].value_or(std::string{});
    auto entityType = ParseEntityType(entityTypeStr);
    if (!entityType || *entityType == EntityType::Work) {
        return DefinitionsLoadResult::InvalidDefinition(
            path, fmt::format("override has invalid entity_type \"{}\"", entityTypeStr));
    }
    ovr.entityType = *entityType;

    Parse(table, "entity_id", ovr.entityId);
    Parse(table, "platform_id", ovr.platformId);
    Parse(table, "dat_name_pattern", ovr.datNamePattern);
    Parse(table, "field", ovr.field);
    Parse(table, "value", ovr.value);
    Parse(table, "reason", ovr.reason);

    if (!ovr.entityId && !ovr.datNamePattern) {
        return DefinitionsLoadResult::InvalidDefinition(path,
                                                        "override needs either entity_id or dat_name_pattern");
    }
    if (!CatalogDB::IsWritableField(ovr.entityType, ovr.field)) {
        return DefinitionsLoadResult::InvalidDefinition(
            path, fmt::format("override targets unknown {} field \"{}\"", ToString(ovr.entityType), ovr.field));
    }
    if (!table.contains("value")) {
        return DefinitionsLoadResult::InvalidDefinition(path, "override has no value");
    }

    return DefinitionsLoadResult::Success();
}

DefinitionsLoadResult LoadDefinitions(const fs::path &dir, Definitions &defs) {
    Definitions result{};
    std::vector<fs::path> files{};
    std::error_code error{};

    // Platforms
    const fs::path platformsDir = dir / "platforms";
    if (!ListDefinitionFiles(platformsDir, files, error)) {
        return DefinitionsLoadResult::FilesystemError(platformsDir, error);
    }
    for (const fs::path &file : files) {
        auto parseResult = toml::parse_file(file.string());
        if (parseResult.failed()) {
            return DefinitionsLoadResult::TOMLParseError(file, parseResult.error());
        }
        Platform platform{};
        if (auto res = ParsePlatform(parseResult.table(), file, platform); !res) {
            return res;
        }
        result.platforms.push_back(std::move(platform));
    }

    // Companies
    const fs::path companiesDir = dir / "companies";
    if (!ListDefinitionFiles(companiesDir, files, error)) {
        return DefinitionsLoadResult::FilesystemError(companiesDir, error);
    }
    for (const fs::path &file : files) {
        auto parseResult = toml::parse_file(file.string());
        if (parseResult.failed()) {
            return DefinitionsLoadResult::TOMLParseError(file, parseResult.error());
        }
        Company company{};
        if (auto res = ParseCompany(parseResult.table(), file, company); !res) {
            return res;
        }
        result.companies.push_back(std::move(company));
    }

    // Overrides
    const fs::path overridesDir = dir / "overrides";
    if (!ListDefinitionFiles(overridesDir, files, error)) {
        return DefinitionsLoadResult::FilesystemError(overridesDir, error);
    }
    for (const fs::path &file : files) {
        auto parseResult = toml::parse_file(file.string());
        if (parseResult.failed()) {
            return DefinitionsLoadResult::TOMLParseError(file, parseResult.error());
        }
        const toml::array *entries = parseResult.table()["override"].as_array();
        if (entries == nullptr) {
            continue;
        }
        for (const toml::node &node : *entries) {
            const toml::table *tblOverride = node.as_table();
            if (tblOverride == nullptr) {
                return DefinitionsLoadResult::InvalidDefinition(file, "override entries must be tables");
            }
            Override ovr{};
            if (auto res = ParseOverride(*tblOverride, file, ovr); !res) {
                return res;
            }
            result.overrides.push_back(std::move(ovr));
        }
    }

    devlog::info<grp::defs>("Loaded {} platforms, {} companies and {} overrides from {}", result.platforms.size(),
                            result.companies.size(), result.overrides.size(), dir.string());
    defs = std::move(result);
    return DefinitionsLoadResult::Success();
}

std::optional<SeedStats> SeedCatalog(CatalogDB &db, const Definitions &defs, std::error_code &error) {
    auto tx = db.BeginTransaction(error);
    if (!tx.IsActive()) {
        return std::nullopt;
    }

    SeedStats stats{};
    for (const Platform &platform : defs.platforms) {
        if (!db.UpsertPlatform(platform, error)) {
            devlog::error<grp::defs>("Could not write platform {}: {}", platform.id, error.message());
            return std::nullopt;
        }
        ++stats.platforms;
    }
    for (const Company &company : defs.companies) {
        if (!db.UpsertCompany(company, error)) {
            devlog::error<grp::defs>("Could not write company {}: {}", company.id, error.message());
            return std::nullopt;
        }
        ++stats.companies;
    }
    for (const Override &ovr : defs.overrides) {
        if (!db.UpsertOverride(ovr, error)) {
            devlog::error<grp::defs>("Could not write override of {}: {}", ovr.field, error.message());
            return std::nullopt;
        }
        ++stats.overrides;
    }

    if (!tx.Commit(error)) {
        return std::nullopt;
    }
    return stats;
}

} // namespace romcat::catalog
