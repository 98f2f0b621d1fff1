// Builds a demo database for row-streamer:
//   rs-make-db [--db=database/bulk.db] [--table=large_table] [--rows=10000]
#include "row_streamer/errors.hpp"
#include "row_streamer/path_utils.hpp"
#include "row_streamer/store_config.hpp"

#include <sqlite3.h>
#include <exception>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

bool exec(sqlite3* db, const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::cerr << "[make-db] " << sql << ": " << (err ? err : "unknown error") << "\n";
    sqlite3_free(err);
    return false;
  }
  return true;
}

}

int main(int argc, char** argv) {
  std::string url = "database/bulk.db";
  std::string table = "large_table";
  std::uint64_t rows = 10000;

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    try {
      if (a.rfind("--db=", 0) == 0)         url = a.substr(5);
      else if (a.rfind("--table=", 0) == 0) table = a.substr(8);
      else if (a.rfind("--rows=", 0) == 0)  rows = std::stoull(a.substr(7));
      else if (a == "-h" || a == "--help") {
        std::cout << "Usage: rs-make-db [--db=PATH|URL] [--table=NAME] [--rows=N]\n";
        return 0;
      } else {
        std::cerr << "[make-db] unknown argument: " << a << "\n";
        return 2;
      }
    } catch (const std::exception& e) {
      std::cerr << "[make-db] bad value for " << a << ": " << e.what() << "\n";
      return 2;
    }
  }

  std::string path, quoted;
  try {
    path = rs::sqlite_path_from_url(url);
    quoted = rs::quote_identifier(table);
  } catch (const rs::InvalidArgument& e) {
    std::cerr << "[make-db] " << e.what() << "\n";
    return 2;
  }

  const auto parent = std::filesystem::path(path).parent_path();
  std::string err;
  if (!parent.empty() && !rs::ensure_dir(parent, &err)) {
    std::cerr << "[make-db] " << err << "\n";
    return 1;
  }

  sqlite3* db = nullptr;
  if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
    std::cerr << "[make-db] cannot open " << path << ": " << (db ? sqlite3_errmsg(db) : "out of memory") << "\n";
    sqlite3_close(db);
    return 1;
  }

  bool ok = exec(db, "DROP TABLE IF EXISTS " + quoted) &&
            exec(db, "CREATE TABLE " + quoted +
                     " (id INTEGER PRIMARY KEY, name TEXT NOT NULL, email TEXT,"
                     " score REAL, note TEXT)") &&
            exec(db, "BEGIN");

  sqlite3_stmt* stmt = nullptr;
  if (ok && sqlite3_prepare_v2(db, ("INSERT INTO " + quoted + " VALUES (?, ?, ?, ?, ?)").c_str(),
                               -1, &stmt, nullptr) != SQLITE_OK) {
    std::cerr << "[make-db] prepare failed: " << sqlite3_errmsg(db) << "\n";
    ok = false;
  }

  for (std::uint64_t i = 1; ok && i <= rows; ++i) {
    const std::string name  = "user_" + std::to_string(i);
    const std::string email = name + "@example.com";
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(i));
    sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, email.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 4, static_cast<double>(i % 1000) / 10.0);
    const std::string note  = "row \"" + std::to_string(i) + "\"";
    if (i % 7 == 0) sqlite3_bind_null(stmt, 5);
    else sqlite3_bind_text(stmt, 5, note.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
      std::cerr << "[make-db] insert failed at row " << i << ": " << sqlite3_errmsg(db) << "\n";
      ok = false;
    }
    sqlite3_reset(stmt);
  }
  sqlite3_finalize(stmt);

  ok = ok && exec(db, "COMMIT");
  sqlite3_close(db);

  if (!ok) return 1;
  std::cout << "[make-db] wrote " << rows << " rows to " << path << " (" << table << ")\n";
  return 0;
}
