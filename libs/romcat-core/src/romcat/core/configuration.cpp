#include <romcat/core/configuration.hpp>

#include <romcat/util/dev_log.hpp>
#include <romcat/util/string_ops.hpp>

#include <algorithm>

namespace romcat {

namespace grp {

    struct config {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Config";
    };

} // namespace grp

template <typename T>
static void Parse(toml::node_view<toml::node> &node, const char *name, T &value) {
    if (auto opt = node[name].value<T>()) {
        value = *opt;
    }
}

static void Parse(toml::node_view<toml::node> &node, const char *name, std::filesystem::path &value,
                  const std::filesystem::path &baseDir) {
    if (auto opt = node[name].value<std::string>()) {
        std::filesystem::path parsed{*opt};
        value = parsed.is_relative() ? baseDir / parsed : parsed;
    }
}

static void Parse(toml::node_view<toml::node> &node, const char *name, std::vector<std::string> &value) {
    if (toml::array *arr = node[name].as_array()) {
        value.clear();
        for (toml::node &item : *arr) {
            if (auto opt = item.value<std::string>()) {
                std::string ext = util::ToLower(*opt);
                if (!ext.empty() && ext.front() != '.') {
                    ext.insert(ext.begin(), '.');
                }
                value.push_back(std::move(ext));
            }
        }
    }
}

ConfigLoadResult LoadConfiguration(const std::filesystem::path &path, Configuration &config) {
    std::error_code err{};
    if (!std::filesystem::is_regular_file(path, err)) {
        if (!err) {
            err = std::make_error_code(std::errc::no_such_file_or_directory);
        }
        return ConfigLoadResult::FilesystemError(err);
    }

    auto parseResult = toml::parse_file(path.string());
    if (parseResult.failed()) {
        return ConfigLoadResult::TOMLParseError(parseResult.error());
    }
    auto &data = parseResult.table();

    int configVersion = 0;
    if (auto opt = data["ConfigVersion"].value<int>()) {
        configVersion = *opt;
    }
    if (configVersion > kConfigVersion) {
        return ConfigLoadResult::UnsupportedConfigVersion(configVersion);
    }

    const std::filesystem::path baseDir = path.parent_path();

    if (auto tblCatalog = data["Catalog"]) {
        Parse(tblCatalog, "DefinitionsPath", config.catalog.definitionsPath, baseDir);
        Parse(tblCatalog, "DatabasePath", config.catalog.databasePath, baseDir);
    }

    if (auto tblHashing = data["Hashing"]) {
        sint64 chunkSize = config.hashing.chunkSize;
        Parse(tblHashing, "ChunkSize", chunkSize);
        // Keep chunks between 4 KiB and 16 MiB
        config.hashing.chunkSize = static_cast<uint32>(std::clamp<sint64>(chunkSize, 4_KiB, 16_MiB));
    }

    if (auto tblScan = data["Scan"]) {
        Parse(tblScan, "Extensions", config.scan.extensions);
        Parse(tblScan, "Recursive", config.scan.recursive);
    }

    if (auto tblImport = data["Import"]) {
        Parse(tblImport, "SourceName", config.importer.sourceName);
    }

    devlog::debug<grp::config>("Loaded configuration from {}", path.string());
    return ConfigLoadResult::Success();
}

} // namespace romcat
