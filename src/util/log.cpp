#include "row_streamer/log.hpp"
#include <iostream>
#include <mutex>

namespace rs {

static std::mutex& log_mu() {
  static std::mutex mu;
  return mu;
}

void log_out(std::string_view line) {
  std::lock_guard<std::mutex> lk(log_mu());
  std::cout << line << "\n" << std::flush;
}

void log_err(std::string_view line) {
  std::lock_guard<std::mutex> lk(log_mu());
  std::cerr << line << "\n";
}

}
