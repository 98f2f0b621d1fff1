#pragma once
#include "row_streamer/row.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace rs {

// Writes chunks to disk on a small worker pool so the thread feeding the HTTP
// response never waits on the filesystem. Failures are logged and counted,
// never thrown back to the caller of persist().
class ChunkPersister {
public:
  struct Config {
    std::size_t threads        = 2;
    std::size_t queue_capacity = 16; // pending jobs before persist() waits
  };

  struct Result {
    std::uint64_t chunk_index = 0;
    std::filesystem::path path;
    bool ok = false;
    std::string error;
  };
  using Completion = std::function<void(const Result&)>;

  ChunkPersister();                 // uses default Config{}
  explicit ChunkPersister(Config cfg);
  ~ChunkPersister();                // finishes queued jobs, joins workers

  ChunkPersister(const ChunkPersister&) = delete;
  ChunkPersister& operator=(const ChunkPersister&) = delete;

  // Queue `chunk` for <output_folder>/<stem>_<index>.json. Returns as soon as
  // the job is accepted, not when it is written; blocks only while the queue
  // is full. Returns false after shutdown().
  bool persist(Chunk chunk,
               std::filesystem::path output_folder,
               std::string stem,
               Completion on_done = {});

  // Block until every accepted job has finished.
  void drain();

  // Stop accepting work, finish what is queued, join workers.
  void shutdown();

  std::uint64_t written() const noexcept;
  std::uint64_t failed() const noexcept;

  // Synchronous write (pretty JSON, temp file + rename). Creates the folder if
  // needed. Returns the final path; throws WriteFailure.
  static std::filesystem::path write_chunk_file(const std::vector<Row>& rows,
                                                const std::filesystem::path& output_folder,
                                                const std::string& file_name);

private:
  struct Impl; Impl* p_;
};

}
