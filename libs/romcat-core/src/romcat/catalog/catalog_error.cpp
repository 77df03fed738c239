#include <romcat/catalog/catalog_error.hpp>

#include <sqlite3.h>

#include <string>

namespace romcat::catalog {

namespace {

    class CatalogErrorCategory final : public std::error_category {
    public:
        const char *name() const noexcept override {
            return "catalog";
        }

        std::string message(int ev) const override {
            switch (static_cast<CatalogError>(ev)) {
            case CatalogError::Success: return "Success";
            case CatalogError::NotOpen: return "Catalog database is not open";
            case CatalogError::SchemaTooNew: return "Catalog database schema is newer than supported";
            case CatalogError::MissingWork: return "Referenced work does not exist";
            case CatalogError::MissingPlatform: return "Referenced platform does not exist";
            case CatalogError::MissingRelease: return "Referenced release does not exist";
            case CatalogError::NotFound: return "Entity not found";
            case CatalogError::UnknownField: return "Unknown or protected field";
            case CatalogError::InvalidValue: return "Invalid field value";
            }
            return "Unknown catalog error";
        }
    };

    class SQLiteErrorCategory final : public std::error_category {
    public:
        const char *name() const noexcept override {
            return "sqlite";
        }

        std::string message(int ev) const override {
            return sqlite3_errstr(ev);
        }
    };

} // namespace

const std::error_category &CatalogCategory() noexcept {
    static const CatalogErrorCategory category{};
    return category;
}

const std::error_category &SQLiteCategory() noexcept {
    static const SQLiteErrorCategory category{};
    return category;
}

std::error_code make_error_code(CatalogError error) noexcept {
    return {static_cast<int>(error), CatalogCategory()};
}

std::error_code MakeSQLiteError(int resultCode) noexcept {
    return {resultCode, SQLiteCategory()};
}

} // namespace romcat::catalog
