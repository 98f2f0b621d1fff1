#pragma once
#include "row_streamer/chunk_iterator.hpp"
#include "row_streamer/chunk_persister.hpp"
#include "row_streamer/metrics.hpp"

#include <chrono>
#include <exception>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace rs {

// Where the emitter writes response bytes. write() returning false means the
// peer is gone; done() ends the body cleanly.
class ChunkSink {
public:
  virtual ~ChunkSink() = default;
  virtual bool write(std::string_view data) = 0;
  virtual void done() = 0;
};

// Drives one ChunkIterator: every chunk is dispatched to the persister, then
// written to the sink as one compact JSON line, in index order.
//
//   Idle -> Streaming -> Draining -> Closed
//           Streaming -> Failed   -> Closed   (StorageUnavailable)
//
// A failed stream never calls done(), so the client sees a truncated body.
class StreamEmitter {
public:
  enum class State { Idle, Streaming, Draining, Failed, Closed };

  struct Config {
    std::string label = "bulk-data";        // log tag for this stream
    std::filesystem::path output_folder = "chunks";
    std::string file_stem = "chunk";        // chunk_<index>.json
    // Emit {"message": "No more data available"} instead of an empty array
    // (and skip persisting) when a chunk comes back with zero rows.
    bool empty_chunk_message = false;
  };

  StreamEmitter(std::unique_ptr<ChunkIterator> it, ChunkPersister& persister, Config cfg);
  ~StreamEmitter();

  StreamEmitter(const StreamEmitter&) = delete;
  StreamEmitter& operator=(const StreamEmitter&) = delete;

  // One step: fetch, persist-dispatch, write. Returns true while there is more
  // to do; false once the stream reached Closed.
  bool pump(ChunkSink& sink);

  // pump() until Closed.
  void run(ChunkSink& sink);

  State state() const noexcept { return state_; }

  // True unless the stream failed or the sink rejected a write.
  bool healthy() const noexcept { return !failed_ && !disconnected_; }
  bool failed() const noexcept { return failed_; }
  bool disconnected() const noexcept { return disconnected_; }

  std::uint64_t chunks_sent() const noexcept { return chunks_sent_; }
  StreamStats stats() const;

private:
  void close();
  void fail_fetch(const char* what, const std::exception& e);

  std::unique_ptr<ChunkIterator> it_;
  ChunkPersister& persister_;
  Config cfg_;
  std::shared_ptr<StreamMetrics> metrics_;
  State state_{State::Idle};
  bool failed_{false};
  bool disconnected_{false};
  std::uint64_t chunks_sent_{0};
  std::chrono::steady_clock::time_point t0_{};
  double wall_ms_{0.0};
};

const char* to_string(StreamEmitter::State s) noexcept;

}
