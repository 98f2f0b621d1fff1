#include "row_streamer/path_utils.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <sstream>
#include <iomanip>
#include <system_error>
#include <unistd.h>
#if defined(RS_USE_OPENSSL)
  #include <openssl/evp.h>
#endif

namespace rs {

bool ensure_dir(const std::filesystem::path& dir, std::string* err_out) {
  std::error_code ec;
  if (std::filesystem::is_directory(dir, ec)) return true;
  std::filesystem::create_directories(dir, ec);
  // another writer may have created it between the two calls
  std::error_code dir_ec;
  if (std::filesystem::is_directory(dir, dir_ec)) return true;
  if (err_out) {
    *err_out = "cannot create directory " + dir.string() +
               (ec ? " (" + ec.message() + ")" : std::string(" (not a directory)"));
  }
  return false;
}

std::string chunk_file_name(std::string_view stem, std::uint64_t index) {
  std::string s(stem);
  s += '_';
  s += std::to_string(index);
  s += ".json";
  return s;
}

std::string hex_hash_prefix(std::string_view data, int len) {
#ifdef RS_USE_OPENSSL
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  EVP_Digest(data.data(), data.size(), md, &md_len, EVP_sha256(), nullptr);
  std::ostringstream o;
  for (unsigned int i = 0; i < static_cast<unsigned int>((len+1)/2) && i < md_len; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
  auto s = o.str();
  if ((int)s.size() > len) s.resize(len);
  return s;
#else
  // Fallback (non-crypto)
  size_t h = std::hash<std::string_view>{}(data);
  std::ostringstream o; o << std::hex << std::setw(16) << std::setfill('0') << h;
  auto s = o.str(); if ((int)s.size() > len) s.resize(len); return s;
#endif
}

std::string make_request_id(int len) {
  static std::atomic<std::uint64_t> counter{0};
  const auto now = std::chrono::system_clock::now().time_since_epoch().count();
  std::ostringstream key;
  key << ::getpid() << '-' << now << '-' << counter.fetch_add(1);
  return hex_hash_prefix(key.str(), len);
}

}
