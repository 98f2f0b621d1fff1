#pragma once
#include "row_streamer/row_source.hpp"

namespace rs {

// Read-only SQLite connection over one table.
class SqliteRowSource : public RowSource {
public:
  // Opens the database read-only; throws StorageUnavailable if that fails.
  explicit SqliteRowSource(const StoreConfig& cfg);
  ~SqliteRowSource() override;

  SqliteRowSource(const SqliteRowSource&) = delete;
  SqliteRowSource& operator=(const SqliteRowSource&) = delete;

  std::vector<Row> fetch(std::uint64_t offset, std::uint64_t limit) override;
  std::uint64_t count() override;

private:
  struct Impl; Impl* p_;
};

}
