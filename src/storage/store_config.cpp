#include "row_streamer/store_config.hpp"
#include "row_streamer/errors.hpp"
#include "row_streamer/row_source.hpp"
#include "row_streamer/sqlite_row_source.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace rs {

std::string sqlite_path_from_url(std::string_view url) {
  constexpr std::string_view kScheme = "sqlite://";
  if (url.rfind(kScheme, 0) == 0) {
    std::string_view rest = url.substr(kScheme.size());
    // sqlite:// alone is an in-memory database
    if (rest.empty()) return ":memory:";
    if (rest.front() != '/') throw InvalidArgument("malformed sqlite url (expected sqlite:///path): " + std::string(url));
    // sqlite:///rel.db -> "rel.db", sqlite:////abs.db -> "/abs.db"
    rest.remove_prefix(1);
    if (rest.empty()) throw InvalidArgument("sqlite url has no database path: " + std::string(url));
    return std::string(rest);
  }
  if (url.find("://") != std::string_view::npos) {
    throw InvalidArgument("unsupported connection scheme: " + std::string(url));
  }
  if (url.empty()) throw InvalidArgument("empty connection string");
  return std::string(url);
}

std::string quote_identifier(std::string_view name) {
  if (name.empty()) throw InvalidArgument("empty table name");
  std::string out;
  out.reserve(name.size() + 2);
  out += '"';
  for (char c : name) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

std::shared_ptr<RowSource> open_row_source(const StoreConfig& cfg) {
  return std::make_shared<SqliteRowSource>(cfg);
}

}
