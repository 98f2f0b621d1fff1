#pragma once
#include "row_streamer/chunk_persister.hpp"
#include "row_streamer/store_config.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace rs {

// Tiny wrapper around cpp-httplib; serves
//   GET /bulk-data            whole table, one JSON array per line
//   GET /bulk-data-paginated  ?page=1&chunk_size=100, one chunk
//   GET /count-records        {"total_records": N}
class HttpServer {
public:
  struct Config {
    std::string host = "127.0.0.1";
    int port = 8000;                             // 0 = pick a free port
    std::filesystem::path work_dir = ".";        // chunks/ and chunks_paginated/ live here
    std::uint64_t chunk_size = 1000;             // /bulk-data batch size
    std::uint64_t max_rows = 0;                  // /bulk-data cap, 0 = whole table
    std::int64_t default_page = 1;
    std::int64_t default_page_size = 100;
    bool namespace_requests = false;             // <folder>/<request-id>/chunk_N.json
    ChunkPersister::Config persist;
  };

  HttpServer(Config cfg, const StoreConfig& store);
  ~HttpServer();

  // Non-blocking bind; returns false on bind error.
  bool start();

  // Blocking run (binds first if needed); returns when server stops.
  int run();

  // Stop if running.
  void stop();

  // Port actually bound (useful with port 0); -1 before start().
  int port() const noexcept;

  // Wait for chunk files still being written.
  void drain_persistence();

private:
  struct Impl;
  Impl* p_;
};

}
