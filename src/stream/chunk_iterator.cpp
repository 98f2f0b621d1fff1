#include "row_streamer/chunk_iterator.hpp"
#include "row_streamer/errors.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

namespace rs {

SequentialChunkIterator::SequentialChunkIterator(std::shared_ptr<RowSource> source,
                                                 std::uint64_t chunk_size,
                                                 std::uint64_t max_rows)
  : source_(std::move(source)), chunk_size_(chunk_size), max_rows_(max_rows) {
  if (!source_) throw InvalidArgument("sequential iterator needs a row source");
  if (chunk_size_ == 0) throw InvalidArgument("chunk_size must be greater than 0");
}

std::optional<Chunk> SequentialChunkIterator::next() {
  if (done_) return std::nullopt;

  std::uint64_t limit = chunk_size_;
  if (max_rows_ != 0) {
    if (offset_ >= max_rows_) { done_ = true; return std::nullopt; }
    limit = std::min(limit, max_rows_ - offset_);
  }

  Chunk c;
  c.requested_size = static_cast<std::size_t>(limit);
  try {
    c.rows = source_->fetch(offset_, limit);
  } catch (...) {
    done_ = true; // no retry after a storage error
    throw;
  }

  if (c.rows.size() < limit) done_ = true;
  if (c.rows.empty()) return std::nullopt;

  offset_ += c.rows.size();
  c.index = next_index_++;
  return c;
}

PaginatedChunkIterator::PaginatedChunkIterator(std::shared_ptr<RowSource> source,
                                               std::int64_t page,
                                               std::int64_t chunk_size)
  : source_(std::move(source)) {
  if (!source_) throw InvalidArgument("paginated iterator needs a row source");
  if (page < 1 || chunk_size < 1) {
    throw InvalidArgument("Page and chunk_size must be greater than 0");
  }
  // the whole window [offset, offset + limit) has to fit a signed 64-bit bind
  constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  const auto p = static_cast<std::uint64_t>(page);
  const auto n = static_cast<std::uint64_t>(chunk_size);
  if (n > kMax / p) {
    throw InvalidArgument("page * chunk_size overflows: page=" + std::to_string(page) +
                          " chunk_size=" + std::to_string(chunk_size));
  }
  offset_ = (p - 1) * n;
  limit_  = n;
}

std::optional<Chunk> PaginatedChunkIterator::next() {
  if (done_) return std::nullopt;
  done_ = true;

  Chunk c;
  c.requested_size = static_cast<std::size_t>(limit_);
  c.rows = source_->fetch(offset_, limit_);
  c.index = next_index_++;
  return c;
}

}
