#pragma once
#include "row_streamer/row.hpp"
#include "row_streamer/store_config.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace rs {

// Tabular data store seen as "N rows starting at M".
// Implementations throw StorageUnavailable on connection or query failure.
class RowSource {
public:
  virtual ~RowSource() = default;

  // Up to `limit` rows starting at `offset`, in the table's natural order.
  // Short only at table end; empty when offset is past the end.
  virtual std::vector<Row> fetch(std::uint64_t offset, std::uint64_t limit) = 0;

  // Best-effort snapshot; not consistent with concurrent fetches.
  virtual std::uint64_t count() = 0;
};

// Open a connection for one stream / one request. The connection is released
// when the last owner drops the pointer.
std::shared_ptr<RowSource> open_row_source(const StoreConfig& cfg);

}
