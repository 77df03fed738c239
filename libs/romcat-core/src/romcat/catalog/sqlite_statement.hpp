#pragma once

/**
@file
@brief RAII wrapper around prepared SQLite statements.
*/

#include <romcat/core/types.hpp>

#include <sqlite3.h>

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace romcat::catalog::sqlite {

/// @brief A prepared statement.
///
/// Bind errors are remembered and reported by the next `Step()` or `Execute()`. Parameter indices start at 1, column
/// indices start at 0, as in the SQLite API.
class Statement {
public:
    /// @brief Prepares a statement.
    /// @param[in] db the database connection
    /// @param[in] sql the SQL text of a single statement
    /// @param[out] error receives the error if the statement could not be prepared
    Statement(sqlite3 *db, std::string_view sql, std::error_code &error);
    ~Statement();

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    bool IsValid() const {
        return m_stmt != nullptr;
    }

    void BindText(int index, std::string_view value);
    void BindOptionalText(int index, const std::optional<std::string> &value);
    void BindInt(int index, sint64 value);
    void BindOptionalInt(int index, std::optional<sint64> value);
    void BindOptionalReal(int index, std::optional<double> value);
    void BindNull(int index);

    /// @brief Advances to the next result row.
    /// @param[out] error receives the error if the statement failed
    /// @return `true` if a row is available; `false` when done or on error
    bool Step(std::error_code &error);

    /// @brief Runs the statement to completion, discarding any result rows.
    /// @param[out] error receives the error if the statement failed
    /// @return `true` if the statement completed
    bool Execute(std::error_code &error);

    /// @brief Resets the statement so it can run again with new bindings.
    void Reset();

    std::string Text(int column) const;
    std::optional<std::string> OptionalText(int column) const;
    sint64 Int(int column) const;
    std::optional<sint64> OptionalInt(int column) const;
    std::optional<double> OptionalReal(int column) const;

private:
    sqlite3_stmt *m_stmt = nullptr;
    std::error_code m_pendingError{};

    void CheckBind(int rc);
};

/// @brief Executes one or more SQL statements that produce no results.
/// @param[in] db the database connection
/// @param[in] sql the SQL text
/// @param[out] error receives the error if any statement failed
/// @return `true` if every statement succeeded
bool Exec(sqlite3 *db, const char *sql, std::error_code &error);

} // namespace romcat::catalog::sqlite
