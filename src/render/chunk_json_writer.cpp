#include "row_streamer/chunk_json.hpp"

#include <cmath> // std::isfinite
#include <cstdio>
#include <string>
#include <type_traits>
#include <variant>

namespace rs {

// Length of the well-formed UTF-8 sequence starting at s[i], or 0 if it is
// not one (stray continuation byte, overlong form, surrogate, > U+10FFFF, cut off).
static size_t utf8_seq_len(std::string_view s, size_t i) {
  const auto b0 = static_cast<unsigned char>(s[i]);
  size_t n;
  unsigned char lo = 0x80, hi = 0xBF;
  if (b0 >= 0xC2 && b0 <= 0xDF)      n = 2;
  else if (b0 == 0xE0)               { n = 3; lo = 0xA0; }
  else if (b0 == 0xED)               { n = 3; hi = 0x9F; }
  else if (b0 >= 0xE1 && b0 <= 0xEF) n = 3;
  else if (b0 == 0xF0)               { n = 4; lo = 0x90; }
  else if (b0 == 0xF4)               { n = 4; hi = 0x8F; }
  else if (b0 >= 0xF1 && b0 <= 0xF3) n = 4;
  else return 0;
  if (s.size() - i < n) return 0;
  const auto b1 = static_cast<unsigned char>(s[i + 1]);
  if (b1 < lo || b1 > hi) return 0;
  for (size_t k = 2; k < n; ++k) {
    const auto b = static_cast<unsigned char>(s[i + k]);
    if (b < 0x80 || b > 0xBF) return 0;
  }
  return n;
}

void ChunkJsonWriter::append_string(std::string& o, std::string_view s) {
  static constexpr char hex[] = "0123456789abcdef";
  o += '"';
  for (size_t i = 0; i < s.size(); ++i) {
    const char ch = s[i];
    const auto c = static_cast<unsigned char>(ch);
    if (c >= 0x80) {
      // valid UTF-8 passes through; each bad byte becomes U+FFFD
      const size_t n = utf8_seq_len(s, i);
      if (n == 0) { o += "\\ufffd"; continue; }
      o.append(s.data() + i, n);
      i += n - 1;
      continue;
    }
    switch (c) {
      case '\\': o += "\\\\"; break;
      case '"':  o += "\\\""; break;
      case '\n': o += "\\n";  break;
      case '\r': o += "\\r";  break;
      case '\t': o += "\\t";  break;
      case '\b': o += "\\b";  break;
      case '\f': o += "\\f";  break;
      default:
        if (c < 0x20) {
          o += "\\u00"; o += hex[c >> 4]; o += hex[c & 0xF];
        } else {
          o += ch;
        }
        break;
    }
  }
  o += '"';
}

static void append_value(std::string& o, const Value& v) {
  std::visit([&](const auto& x) {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, std::monostate>) {
      o += "null";
    } else if constexpr (std::is_same_v<T, bool>) {
      o += x ? "true" : "false";
    } else if constexpr (std::is_same_v<T, std::int64_t>) {
      o += std::to_string(x);
    } else if constexpr (std::is_same_v<T, double>) {
      if (!std::isfinite(x)) { o += "null"; return; }
      char tmp[64];
      int n = std::snprintf(tmp, sizeof(tmp), "%.17g", x);
      o.append(tmp, (n > 0) ? static_cast<size_t>(n) : 0);
    } else {
      ChunkJsonWriter::append_string(o, x);
    }
  }, v);
}

static void indent(std::string& o, int level) { o.append(static_cast<size_t>(level) * 4, ' '); }

std::string ChunkJsonWriter::to_json(const std::vector<Row>& rows, JsonStyle style) {
  std::string o;
  if (rows.empty()) return "[]";

  const bool pretty = (style == JsonStyle::Pretty);
  o.reserve(rows.size() * 64);
  o += '[';
  for (size_t r = 0; r < rows.size(); ++r) {
    const Row& row = rows[r];
    if (r) o += pretty ? "," : ", ";
    if (pretty) { o += '\n'; indent(o, 1); }

    if (row.size() == 0) { o += "{}"; continue; }
    o += '{';
    for (size_t i = 0; i < row.size(); ++i) {
      if (i) o += pretty ? "," : ", ";
      if (pretty) { o += '\n'; indent(o, 2); }
      append_string(o, row.colname(i));
      o += ": ";
      append_value(o, row.at(i));
    }
    if (pretty) { o += '\n'; indent(o, 1); }
    o += '}';
  }
  if (pretty) o += '\n';
  o += ']';
  return o;
}

std::string ChunkJsonWriter::message(std::string_view key, std::string_view text) {
  std::string o = "{";
  append_string(o, key);
  o += ": ";
  append_string(o, text);
  o += '}';
  return o;
}

std::string ChunkJsonWriter::total_records(std::uint64_t n) {
  return "{\"total_records\": " + std::to_string(n) + "}";
}

}
