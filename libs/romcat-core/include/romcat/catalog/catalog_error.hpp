#pragma once

/**
@file
@brief Error codes reported by the catalog store.

Catalog operations report failures through `std::error_code` out-parameters. Errors detected by the library use the
`CatalogError` enumeration; errors reported by SQLite carry the SQLite result code in the `SQLiteCategory()`.
*/

#include <system_error>

namespace romcat::catalog {

/// @brief Errors detected by the catalog store itself.
enum class CatalogError {
    Success = 0,

    NotOpen,         ///< The store has no open database
    SchemaTooNew,    ///< The database was written by a newer schema version
    MissingWork,     ///< A release refers to a work that does not exist
    MissingPlatform, ///< A release refers to a platform that does not exist
    MissingRelease,  ///< A media refers to a release that does not exist
    NotFound,        ///< The targeted entity does not exist
    UnknownField,    ///< An override or update names a field that cannot be written
    InvalidValue,    ///< A field value could not be converted to the field's type
};

/// @brief The error category of `CatalogError` values.
const std::error_category &CatalogCategory() noexcept;

/// @brief The error category of SQLite result codes.
const std::error_category &SQLiteCategory() noexcept;

/// @brief Builds an error code from a `CatalogError`.
std::error_code make_error_code(CatalogError error) noexcept;

/// @brief Builds an error code from an SQLite result code.
std::error_code MakeSQLiteError(int resultCode) noexcept;

} // namespace romcat::catalog

template <>
struct std::is_error_code_enum<romcat::catalog::CatalogError> : std::true_type {};
