#include "row_streamer/chunk_json.hpp"
#include "row_streamer/errors.hpp"
#include "row_streamer/row_source.hpp"
#include "row_streamer/sqlite_row_source.hpp"
#include "row_streamer/store_config.hpp"

#include <sqlite3.h>
#include <simdjson.h>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <variant>
#include <unistd.h>

namespace fs = std::filesystem;

static int failed = 0;

static void check(bool cond, const std::string& what) {
  if (cond) { std::cout << "[PASS] " << what << "\n"; }
  else      { std::cerr << "[FAIL] " << what << "\n"; ++failed; }
}

// large_table(id INTEGER, name TEXT, score REAL, note TEXT) with `rows` rows;
// note is NULL on every 4th row.
static bool make_db(const fs::path& path, int rows) {
  sqlite3* db = nullptr;
  if (sqlite3_open(path.string().c_str(), &db) != SQLITE_OK) { sqlite3_close(db); return false; }
  bool ok = sqlite3_exec(db,
    "CREATE TABLE large_table (id INTEGER PRIMARY KEY, name TEXT, score REAL, note TEXT);"
    "BEGIN;", nullptr, nullptr, nullptr) == SQLITE_OK;
  sqlite3_stmt* stmt = nullptr;
  ok = ok && sqlite3_prepare_v2(db, "INSERT INTO large_table VALUES (?, ?, ?, ?)", -1, &stmt, nullptr) == SQLITE_OK;
  for (int i = 1; ok && i <= rows; ++i) {
    const std::string name = "name-" + std::to_string(i);
    sqlite3_bind_int(stmt, 1, i);
    sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 3, i * 0.25);
    if (i % 4 == 0) sqlite3_bind_null(stmt, 4);
    else sqlite3_bind_text(stmt, 4, "caf\xC3\xA9", -1, SQLITE_STATIC);
    ok = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_reset(stmt);
  }
  sqlite3_finalize(stmt);
  ok = ok && sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr) == SQLITE_OK;
  sqlite3_close(db);
  return ok;
}

// blob_table(id INTEGER, payload BLOB, label TEXT): raw bytes and a TEXT
// value that is not valid UTF-8.
static bool add_blob_table(const fs::path& path) {
  sqlite3* db = nullptr;
  if (sqlite3_open(path.string().c_str(), &db) != SQLITE_OK) { sqlite3_close(db); return false; }
  const bool ok = sqlite3_exec(db,
    "CREATE TABLE blob_table (id INTEGER PRIMARY KEY, payload BLOB, label TEXT);"
    "INSERT INTO blob_table VALUES (1, X'80FF00', CAST(X'41C3' AS TEXT));"
    "INSERT INTO blob_table VALUES (2, X'', 'plain');",
    nullptr, nullptr, nullptr) == SQLITE_OK;
  sqlite3_close(db);
  return ok;
}

static void blob_rows_serialize_as_json(const fs::path& db) {
  rs::StoreConfig cfg;
  cfg.url = db.string();
  cfg.table = "blob_table";
  auto rows = rs::open_row_source(cfg)->fetch(0, 10);
  check(rows.size() == 2, "blob_table has 2 rows");
  if (rows.size() != 2) return;

  check(std::get<std::string>(rows[0].at(1)) == std::string("\x80\xFF\x00", 3), "BLOB maps to its raw bytes");
  check(std::get<std::string>(rows[1].at(1)).empty(), "empty BLOB maps to an empty string");

  for (auto style : {rs::JsonStyle::Compact, rs::JsonStyle::Pretty}) {
    const std::string doc = rs::ChunkJsonWriter::to_json(rows, style);
    simdjson::dom::parser p;
    simdjson::dom::array arr;
    std::string_view payload, label;
    const bool parsed = p.parse(doc).get_array().get(arr) == simdjson::SUCCESS &&
                        arr.at(0)["payload"].get_string().get(payload) == simdjson::SUCCESS &&
                        arr.at(0)["label"].get_string().get(label) == simdjson::SUCCESS;
    check(parsed, std::string("BLOB chunk is valid JSON (") +
                  (style == rs::JsonStyle::Compact ? "compact" : "pretty") + ")");
    check(parsed && payload == std::string_view("\xEF\xBF\xBD\xEF\xBF\xBD\x00", 7),
          "non-UTF-8 bytes arrive as U+FFFD, NUL survives");
    check(parsed && label == "A\xEF\xBF\xBD", "truncated UTF-8 text is repaired");
  }
}

static void url_parsing() {
  check(rs::sqlite_path_from_url("sqlite:///database/bulk.db") == "database/bulk.db", "sqlite:/// is relative");
  check(rs::sqlite_path_from_url("sqlite:////var/lib/bulk.db") == "/var/lib/bulk.db", "sqlite://// is absolute");
  check(rs::sqlite_path_from_url("data/x.db") == "data/x.db", "plain path passes through");
  check(rs::sqlite_path_from_url("sqlite://") == ":memory:", "bare sqlite:// is in-memory");

  bool threw = false;
  try { (void)rs::sqlite_path_from_url("postgresql://user@host/db"); } catch (const rs::InvalidArgument&) { threw = true; }
  check(threw, "non-sqlite scheme rejected");

  check(rs::quote_identifier("large_table") == "\"large_table\"", "identifier quoted");
  check(rs::quote_identifier("we\"ird") == "\"we\"\"ird\"", "embedded quote doubled");
}

static void fetch_and_count(const fs::path& db) {
  rs::StoreConfig cfg;
  cfg.url = "sqlite:///" + db.string(); // db is absolute, so this is sqlite:////...
  auto src = rs::open_row_source(cfg);

  check(src->count() == 250, "count() sees 250 rows");
  check(src->count() == src->count(), "count() is stable on an unchanged table");

  auto first = src->fetch(0, 100);
  check(first.size() == 100, "fetch(0, 100) returns 100 rows");
  if (!first.empty()) {
    const rs::Row& r = first.front();
    check(r.size() == 4 && r.colname(0) == "id" && r.colname(3) == "note", "column names in table order");
    check(std::get<std::int64_t>(r.at(0)) == 1, "INTEGER maps to int64");
    check(std::get<std::string>(r.at(1)) == "name-1", "TEXT maps to string");
    check(std::get<double>(r.at(2)) == 0.25, "REAL maps to double");
    check(std::get<std::string>(r.at(3)) == "caf\xC3\xA9", "UTF-8 text passes through");
    check(first[3].find("note") && rs::is_null(*first[3].find("note")), "NULL maps to null");
    check(first[3].find("missing") == nullptr, "absent column differs from NULL");
  }

  auto tail = src->fetch(200, 100);
  check(tail.size() == 50 && std::get<std::int64_t>(tail.front().at(0)) == 201, "fetch(200, 100) is the 50-row tail");
  check(src->fetch(250, 100).empty(), "offset at the end is empty");
  check(src->fetch(10'000, 5).empty(), "offset past the end is empty");

  bool threw = false;
  try { (void)src->fetch(0, 0); } catch (const rs::InvalidArgument&) { threw = true; }
  check(threw, "zero limit rejected");
}

static void unavailable_storage(const fs::path& dir) {
  rs::StoreConfig cfg;
  cfg.url = (dir / "does-not-exist.db").string();
  bool threw = false;
  try { (void)rs::open_row_source(cfg); } catch (const rs::StorageUnavailable&) { threw = true; }
  check(threw, "missing database file raises StorageUnavailable");

  cfg.url = (dir / "bulk.db").string();
  cfg.table = "no_such_table";
  auto src = rs::open_row_source(cfg);
  threw = false;
  try { (void)src->fetch(0, 10); } catch (const rs::StorageUnavailable&) { threw = true; }
  check(threw, "query on a missing table raises StorageUnavailable");
  threw = false;
  try { (void)src->count(); } catch (const rs::StorageUnavailable&) { threw = true; }
  check(threw, "count on a missing table raises StorageUnavailable");
}

int main() {
  const fs::path dir = fs::temp_directory_path() / ("rs-sqlite-" + std::to_string(::getpid()));
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir);
  const fs::path db = fs::absolute(dir / "bulk.db");
  if (!make_db(db, 250)) { std::cerr << "[ERR] could not build fixture db at " << db << "\n"; return 2; }

  if (!add_blob_table(db)) { std::cerr << "[ERR] could not add blob_table to " << db << "\n"; return 2; }

  url_parsing();
  fetch_and_count(db);
  blob_rows_serialize_as_json(db);
  unavailable_storage(dir);

  fs::remove_all(dir, ec);
  if (failed) { std::cerr << "[FAIL] sqlite_row_source: " << failed << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] sqlite_row_source\n";
  return 0;
}
