#include "row_streamer/sqlite_row_source.hpp"
#include "row_streamer/errors.hpp"

#include <sqlite3.h>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace rs {

namespace {

// Finalizes on every exit path, including a throw out of the step loop.
struct StmtGuard {
  sqlite3_stmt* stmt{nullptr};
  ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

Value column_value(sqlite3_stmt* stmt, int i) {
  switch (sqlite3_column_type(stmt, i)) {
    case SQLITE_INTEGER:
      return static_cast<std::int64_t>(sqlite3_column_int64(stmt, i));
    case SQLITE_FLOAT:
      return sqlite3_column_double(stmt, i);
    case SQLITE_TEXT:
    case SQLITE_BLOB: {
      const auto* p = sqlite3_column_blob(stmt, i);
      const int n = sqlite3_column_bytes(stmt, i);
      if (!p || n <= 0) return std::string{};
      return std::string(static_cast<const char*>(p), static_cast<std::size_t>(n));
    }
    case SQLITE_NULL:
    default:
      return std::monostate{};
  }
}

}

struct SqliteRowSource::Impl {
  sqlite3* db{nullptr};
  std::string path;
  std::string table_sql; // already quoted

  [[noreturn]] void fail(const std::string& what) const {
    std::string msg = what + " (" + path + ")";
    if (db) { msg += ": "; msg += sqlite3_errmsg(db); }
    throw StorageUnavailable(msg);
  }

  void prepare(const std::string& sql, StmtGuard& g) const {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
      fail("prepare failed for `" + sql + "`");
    }
  }
};

SqliteRowSource::SqliteRowSource(const StoreConfig& cfg) : p_(new Impl) {
  try {
    p_->path = sqlite_path_from_url(cfg.url);
    p_->table_sql = quote_identifier(cfg.table);
  } catch (...) {
    delete p_;
    throw;
  }

  const int rc = sqlite3_open_v2(p_->path.c_str(), &p_->db,
                                 SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = "cannot open database " + p_->path;
    if (p_->db) { msg += ": "; msg += sqlite3_errmsg(p_->db); sqlite3_close(p_->db); }
    delete p_;
    throw StorageUnavailable(msg);
  }
  sqlite3_busy_timeout(p_->db, cfg.busy_timeout_ms);
}

SqliteRowSource::~SqliteRowSource() {
  if (p_->db) sqlite3_close(p_->db);
  delete p_;
}

std::vector<Row> SqliteRowSource::fetch(std::uint64_t offset, std::uint64_t limit) {
  constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<sqlite3_int64>::max());
  if (limit == 0) throw InvalidArgument("fetch limit must be positive");
  if (offset > kMax || limit > kMax) throw InvalidArgument("fetch window exceeds 64-bit range");

  StmtGuard g;
  p_->prepare("SELECT * FROM " + p_->table_sql + " LIMIT ? OFFSET ?", g);
  sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(limit));
  sqlite3_bind_int64(g.stmt, 2, static_cast<sqlite3_int64>(offset));

  const int ncols = sqlite3_column_count(g.stmt);
  auto names = std::make_shared<ColumnNames>();
  names->reserve(static_cast<std::size_t>(ncols));
  for (int i = 0; i < ncols; ++i) {
    const char* n = sqlite3_column_name(g.stmt, i);
    names->emplace_back(n ? n : "");
  }
  std::shared_ptr<const ColumnNames> shared_names = std::move(names);

  std::vector<Row> rows;
  rows.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(limit, 4096)));
  while (true) {
    const int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) p_->fail("query failed");

    std::vector<Value> values;
    values.reserve(static_cast<std::size_t>(ncols));
    for (int i = 0; i < ncols; ++i) values.push_back(column_value(g.stmt, i));
    rows.emplace_back(shared_names, std::move(values));
  }
  return rows;
}

std::uint64_t SqliteRowSource::count() {
  StmtGuard g;
  p_->prepare("SELECT COUNT(*) FROM " + p_->table_sql, g);
  if (sqlite3_step(g.stmt) != SQLITE_ROW) p_->fail("count failed");
  const sqlite3_int64 n = sqlite3_column_int64(g.stmt, 0);
  return n < 0 ? 0 : static_cast<std::uint64_t>(n);
}

}
