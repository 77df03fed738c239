#pragma once

/**
@file
@brief Defines `romcat::Configuration` for configuring the library and `LoadConfiguration` to read it from a file.
*/

#include <romcat/core/types.hpp>

#include <romcat/util/size_ops.hpp>

#include <fmt/format.h>
#include <toml++/toml.hpp>

#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace romcat {

/// @brief Library configuration.
///
/// The configuration is resolved once by the host application and passed explicitly to the components that need it.
/// Nothing in the library reads configuration from global state.
struct Configuration {
    /// @brief Catalog storage locations.
    struct Catalog {
        /// @brief Root directory of the curated definitions (`platforms/`, `companies/` and `overrides/`).
        std::filesystem::path definitionsPath;

        /// @brief Path to the SQLite catalog database.
        std::filesystem::path databasePath;
    } catalog;

    /// @brief File hashing parameters.
    struct Hashing {
        /// @brief Size of the buffer used to stream file contents and padding into the hash functions.
        uint32 chunkSize = 64_KiB;
    } hashing;

    /// @brief File scanning parameters.
    struct Scan {
        /// @brief File extensions (lowercase, with the leading dot) considered when collecting files from a directory.
        ///
        /// An empty list accepts every regular file.
        std::vector<std::string> extensions{};

        /// @brief Whether to descend into subdirectories.
        bool recursive = true;
    } scan;

    /// @brief Reference import parameters.
    struct Importer {
        /// @brief Source name recorded in disagreements and import logs when the caller does not supply one.
        std::string sourceName = "dat";
    } importer;
};

/// @brief Current version of the configuration file format.
inline constexpr int kConfigVersion = 1;

/// @brief The result of `LoadConfiguration`.
struct ConfigLoadResult {
    enum class Type { Success, FilesystemError, TOMLParseError, UnsupportedConfigVersion };

    static ConfigLoadResult Success() {
        return {.type = Type::Success};
    }

    static ConfigLoadResult FilesystemError(std::error_code error) {
        return {.type = Type::FilesystemError, .value = error};
    }

    static ConfigLoadResult TOMLParseError(toml::parse_error error) {
        return {.type = Type::TOMLParseError, .value = error};
    }

    static ConfigLoadResult UnsupportedConfigVersion(int version) {
        return {.type = Type::UnsupportedConfigVersion, .value = version};
    }

    explicit operator bool() const {
        return type == Type::Success;
    }

    std::string string() const {
        switch (type) {
        case Type::Success: return "Success";
        case Type::FilesystemError:
            return fmt::format("Filesystem error: {}", std::get<std::error_code>(value).message());
        case Type::TOMLParseError: //
        {
            auto &error = std::get<toml::parse_error>(value);
            std::ostringstream ss{};
            ss << error.source();
            return fmt::format("TOML parse error: {} (at {})", error.description(), ss.str());
        }
        case Type::UnsupportedConfigVersion:
            return fmt::format("Unsupported configuration version: {}", std::get<int>(value));
        default: return "Unspecified error";
        }
    }

    Type type;
    std::variant<std::monostate, std::error_code, toml::parse_error, int> value;
};

/// @brief Loads a configuration file into `config`.
///
/// Keys missing from the file keep the values already in `config`. Relative paths in the `[Catalog]` table are resolved
/// against the directory containing the configuration file.
///
/// @param[in] path the path to the TOML configuration file
/// @param[out] config the configuration to update
/// @return the result of the operation
ConfigLoadResult LoadConfiguration(const std::filesystem::path &path, Configuration &config);

} // namespace romcat
