#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace rs {

// Scalar cell value. monostate is SQL NULL.
using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

inline bool is_null(const Value& v) noexcept { return std::holds_alternative<std::monostate>(v); }

using ColumnNames = std::vector<std::string>;

// One table row: values in column order, column names shared by every row of
// the same fetch. A column that is absent (find() == nullptr) is distinct from
// a column that is present and NULL.
class Row {
public:
  Row() = default;
  Row(std::shared_ptr<const ColumnNames> columns, std::vector<Value> values)
      : columns_(std::move(columns)), values_(std::move(values)) {}

  std::size_t size() const noexcept { return values_.size(); }

  const Value& at(std::size_t i) const { return values_.at(i); }

  std::string_view colname(std::size_t i) const {
    return (columns_ && i < columns_->size()) ? std::string_view((*columns_)[i]) : std::string_view{};
  }

  const Value* find(std::string_view column) const {
    if (!columns_) return nullptr;
    for (std::size_t i = 0; i < columns_->size() && i < values_.size(); ++i) {
      if ((*columns_)[i] == column) return &values_[i];
    }
    return nullptr;
  }

  const std::shared_ptr<const ColumnNames>& columns() const noexcept { return columns_; }
  const std::vector<Value>& values() const noexcept { return values_; }

private:
  std::shared_ptr<const ColumnNames> columns_;
  std::vector<Value> values_;
};

// A bounded batch produced by one fetch. `index` is 1-based within a stream;
// rows.size() <= requested_size.
struct Chunk {
  std::uint64_t index = 0;
  std::size_t requested_size = 0;
  std::vector<Row> rows;
};

}
