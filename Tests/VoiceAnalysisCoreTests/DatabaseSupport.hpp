/**
 * @file DatabaseSupport.hpp
 * @brief Direct SQL access to a test database from a second connection
 */

#pragma once

#include <catch2/catch_test_macros.hpp>

#include <sqlite3.h>

#include <filesystem>
#include <string>

namespace va::test {

/// Run `sql` against the database at `path` on its own connection.
inline void exec_sql(const std::filesystem::path& path, const std::string& sql) {
    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.string().c_str(), &db) == SQLITE_OK);
    sqlite3_busy_timeout(db, 5000);

    char* err = nullptr;
    const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    const std::string msg = err ? err : "";
    sqlite3_free(err);
    sqlite3_close(db);
    INFO(msg);
    REQUIRE(rc == SQLITE_OK);
}

/// Makes every attempt to mark a row's audio path as committed fail.
inline void block_path_commits(const std::filesystem::path& path) {
    exec_sql(path,
             "CREATE TRIGGER block_path_commit BEFORE UPDATE OF PATH_RESOLVED "
             "ON AudioAnalysis WHEN NEW.PATH_RESOLVED = 1 "
             "BEGIN SELECT RAISE(ABORT, 'path commit blocked'); END;");
}

inline void allow_path_commits(const std::filesystem::path& path) {
    exec_sql(path, "DROP TRIGGER block_path_commit;");
}

}  // namespace va::test
