#include "sqlite_statement.hpp"

#include <romcat/catalog/catalog_error.hpp>

#include <romcat/util/dev_log.hpp>

namespace romcat::catalog::sqlite {

namespace grp {

    struct sqlite {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "SQLite";
    };

} // namespace grp

Statement::Statement(sqlite3 *db, std::string_view sql, std::error_code &error) {
    error.clear();
    if (db == nullptr) {
        error = CatalogError::NotOpen;
        m_pendingError = error;
        return;
    }
    const int rc = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &m_stmt, nullptr);
    if (rc != SQLITE_OK) {
        devlog::error<grp::sqlite>("Failed to prepare statement: {} ({})", sqlite3_errmsg(db), sql);
        error = MakeSQLiteError(rc);
        m_pendingError = error;
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
    }
}

Statement::~Statement() {
    if (m_stmt != nullptr) {
        sqlite3_finalize(m_stmt);
    }
}

void Statement::CheckBind(int rc) {
    if (rc != SQLITE_OK && !m_pendingError) {
        m_pendingError = MakeSQLiteError(rc);
    }
}

void Statement::BindText(int index, std::string_view value) {
    if (m_stmt == nullptr) {
        return;
    }
    // A null data pointer would bind NULL instead of an empty string
    const char *data = value.empty() ? "" : value.data();
    CheckBind(sqlite3_bind_text(m_stmt, index, data, static_cast<int>(value.size()), SQLITE_TRANSIENT));
}

void Statement::BindOptionalText(int index, const std::optional<std::string> &value) {
    if (value) {
        BindText(index, *value);
    } else {
        BindNull(index);
    }
}

void Statement::BindInt(int index, sint64 value) {
    if (m_stmt == nullptr) {
        return;
    }
    CheckBind(sqlite3_bind_int64(m_stmt, index, value));
}

void Statement::BindOptionalInt(int index, std::optional<sint64> value) {
    if (value) {
        BindInt(index, *value);
    } else {
        BindNull(index);
    }
}

void Statement::BindOptionalReal(int index, std::optional<double> value) {
    if (m_stmt == nullptr) {
        return;
    }
    if (value) {
        CheckBind(sqlite3_bind_double(m_stmt, index, *value));
    } else {
        BindNull(index);
    }
}

void Statement::BindNull(int index) {
    if (m_stmt == nullptr) {
        return;
    }
    CheckBind(sqlite3_bind_null(m_stmt, index));
}

bool Statement::Step(std::error_code &error) {
    error.clear();
    if (m_pendingError) {
        error = m_pendingError;
        return false;
    }
    const int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc != SQLITE_DONE) {
        sqlite3 *db = sqlite3_db_handle(m_stmt);
        devlog::debug<grp::sqlite>("Statement failed: {}", sqlite3_errmsg(db));
        error = MakeSQLiteError(sqlite3_extended_errcode(db));
    }
    return false;
}

bool Statement::Execute(std::error_code &error) {
    while (Step(error)) {
    }
    return !error;
}

void Statement::Reset() {
    if (m_stmt == nullptr) {
        return;
    }
    sqlite3_reset(m_stmt);
    sqlite3_clear_bindings(m_stmt);
    m_pendingError.clear();
}

std::string Statement::Text(int column) const {
    const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(m_stmt, column));
    if (text == nullptr) {
        return {};
    }
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(m_stmt, column)));
}

std::optional<std::string> Statement::OptionalText(int column) const {
    if (sqlite3_column_type(m_stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return Text(column);
}

sint64 Statement::Int(int column) const {
    return sqlite3_column_int64(m_stmt, column);
}

std::optional<sint64> Statement::OptionalInt(int column) const {
    if (sqlite3_column_type(m_stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return Int(column);
}

std::optional<double> Statement::OptionalReal(int column) const {
    if (sqlite3_column_type(m_stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_double(m_stmt, column);
}

bool Exec(sqlite3 *db, const char *sql, std::error_code &error) {
    error.clear();
    if (db == nullptr) {
        error = CatalogError::NotOpen;
        return false;
    }
    char *message = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &message);
    if (rc != SQLITE_OK) {
        devlog::error<grp::sqlite>("Failed to execute SQL: {}", message != nullptr ? message : sqlite3_errstr(rc));
        sqlite3_free(message);
        error = MakeSQLiteError(sqlite3_extended_errcode(db));
        return false;
    }
    return true;
}

} // namespace romcat::catalog::sqlite
