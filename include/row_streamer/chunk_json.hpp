#pragma once
#include "row_streamer/row.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace rs {

enum class JsonStyle {
  Compact, // one line: [{"id": 1, "name": "a"}, ...]  (response body)
  Pretty   // 4-space indented  (persisted chunk files)
};

class ChunkJsonWriter {
public:
  // Serialize rows as a JSON array of objects; column order is preserved,
  // NULL becomes null, non-finite doubles become null.
  static std::string to_json(const std::vector<Row>& rows, JsonStyle style);

  // {"<key>": "<text>"}
  static std::string message(std::string_view key, std::string_view text);

  // {"total_records": N}
  static std::string total_records(std::uint64_t n);

  // Append `s` as a quoted JSON string. Valid UTF-8 passes through untouched;
  // bytes that are not part of a well-formed sequence become \ufffd.
  static void append_string(std::string& out, std::string_view s);
};

}
