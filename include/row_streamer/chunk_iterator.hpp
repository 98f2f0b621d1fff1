#pragma once
#include "row_streamer/row.hpp"
#include "row_streamer/row_source.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace rs {

// Lazy, finite, forward-only sequence of chunks. Not restartable.
// next() propagates StorageUnavailable from the RowSource.
class ChunkIterator {
public:
  virtual ~ChunkIterator() = default;

  // Next chunk, or nullopt once exhausted (and on every call after that).
  virtual std::optional<Chunk> next() = 0;

  // Index the next produced chunk will carry.
  std::uint64_t next_index() const noexcept { return next_index_; }

protected:
  std::uint64_t next_index_{1};
};

// Whole-table scan: offset 0, +chunk_size per chunk, ends after a short or
// empty fetch. Never yields an empty chunk.
class SequentialChunkIterator : public ChunkIterator {
public:
  // max_rows == 0 means no cap.
  SequentialChunkIterator(std::shared_ptr<RowSource> source,
                          std::uint64_t chunk_size,
                          std::uint64_t max_rows = 0);

  std::optional<Chunk> next() override;

  std::uint64_t offset() const noexcept { return offset_; }

private:
  std::shared_ptr<RowSource> source_;
  std::uint64_t chunk_size_;
  std::uint64_t max_rows_;
  std::uint64_t offset_{0};
  bool done_{false};
};

// Exactly one chunk at offset (page-1)*chunk_size. The chunk may have zero
// rows when the page lies past the end of the table.
class PaginatedChunkIterator : public ChunkIterator {
public:
  PaginatedChunkIterator(std::shared_ptr<RowSource> source,
                         std::int64_t page,
                         std::int64_t chunk_size);

  std::optional<Chunk> next() override;

  std::uint64_t offset() const noexcept { return offset_; }
  std::uint64_t limit() const noexcept { return limit_; }

private:
  std::shared_ptr<RowSource> source_;
  std::uint64_t offset_{0};
  std::uint64_t limit_{0};
  bool done_{false};
};

}
