#pragma once
#include <string>
#include <string_view>

namespace rs {

// Where the rows live. Built once in main() and handed around by const
// reference; nothing mutates it after startup.
struct StoreConfig {
  // sqlite:///relative.db | sqlite:////abs/path.db | plain filesystem path
  std::string url   = "sqlite:///database/bulk.db";
  std::string table = "large_table";
  int busy_timeout_ms = 5000;
};

// Resolve `url` to the path handed to sqlite3_open_v2.
// Throws InvalidArgument for schemes other than sqlite.
std::string sqlite_path_from_url(std::string_view url);

// Double-quoted SQL identifier ("a""b" for a"b). Throws InvalidArgument on empty.
std::string quote_identifier(std::string_view name);

}
