#pragma once
// Builds small SQLite artifacts for table tests.

#include <filesystem>
#include <stdexcept>
#include <string>

#include <sqlite3.h>

namespace test_utils
{

/// Creates @p file and runs @p sql in it. Throws on any SQLite error.
inline void make_sqlite_db(const std::filesystem::path &file, const std::string &sql)
{
    sqlite3 *db = nullptr;
    if (sqlite3_open(file.c_str(), &db) != SQLITE_OK)
    {
        std::string msg = db ? sqlite3_errmsg(db) : "sqlite3_open failed";
        sqlite3_close(db);
        throw std::runtime_error(msg);
    }
    char *err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK)
    {
        std::string msg = err ? err : "sqlite3_exec failed";
        sqlite3_free(err);
        sqlite3_close(db);
        throw std::runtime_error(msg);
    }
    sqlite3_close(db);
}

/// Table `runs(id INTEGER, name TEXT, score REAL)` with three rows.
inline void make_runs_db(const std::filesystem::path &file)
{
    make_sqlite_db(file, "CREATE TABLE runs(id INTEGER, name TEXT, score REAL);"
                         "INSERT INTO runs VALUES(1, 'alpha', 0.5);"
                         "INSERT INTO runs VALUES(2, 'beta', 1.5);"
                         "INSERT INTO runs VALUES(3, 'gamma', NULL);");
}

} // namespace test_utils
