#include "row_streamer/stream_emitter.hpp"
#include "row_streamer/chunk_json.hpp"
#include "row_streamer/errors.hpp"
#include "row_streamer/log.hpp"

#include <exception>
#include <sstream>
#include <utility>

namespace rs {

const char* to_string(StreamEmitter::State s) noexcept {
  switch (s) {
    case StreamEmitter::State::Idle:      return "idle";
    case StreamEmitter::State::Streaming: return "streaming";
    case StreamEmitter::State::Draining:  return "draining";
    case StreamEmitter::State::Failed:    return "failed";
    case StreamEmitter::State::Closed:    return "closed";
  }
  return "unknown";
}

StreamEmitter::StreamEmitter(std::unique_ptr<ChunkIterator> it, ChunkPersister& persister, Config cfg)
  : it_(std::move(it)),
    persister_(persister),
    cfg_(std::move(cfg)),
    metrics_(std::make_shared<StreamMetrics>()) {
  if (!it_) throw InvalidArgument("stream emitter needs a chunk iterator");
}

StreamEmitter::~StreamEmitter() = default;

bool StreamEmitter::pump(ChunkSink& sink) {
  if (state_ == State::Closed) return false;
  if (state_ == State::Idle) {
    state_ = State::Streaming;
    t0_ = std::chrono::steady_clock::now();
    log_out("[stream] " + cfg_.label + " started");
  }

  std::optional<Chunk> chunk;
  metrics_->start_stage("fetch");
  try {
    chunk = it_->next();
  } catch (const StorageUnavailable& e) {
    fail_fetch("storage failure", e);
    return false;
  } catch (const std::exception& e) {
    // nothing may escape into the content provider; the response is cut short instead
    fail_fetch("fetch error", e);
    return false;
  }
  metrics_->end_stage("fetch");

  if (!chunk) {
    state_ = State::Draining;
    sink.done();
    close();
    return false;
  }

  metrics_->start_stage("serialize");
  std::string body;
  const bool empty = chunk->rows.empty();
  if (empty && cfg_.empty_chunk_message) {
    body = ChunkJsonWriter::message("message", "No more data available");
  } else {
    body = ChunkJsonWriter::to_json(chunk->rows, JsonStyle::Compact);
  }
  body += '\n';
  metrics_->end_stage("serialize");

  const std::uint64_t index = chunk->index;
  const std::uint64_t nrows = chunk->rows.size();

  // dispatch before the bytes go out; the write itself finishes later.
  // A full persist queue blocks this thread until a worker frees a slot.
  if (!(empty && cfg_.empty_chunk_message)) {
    std::shared_ptr<StreamMetrics> m = metrics_;
    const bool queued = persister_.persist(std::move(*chunk), cfg_.output_folder, cfg_.file_stem,
      [m](const ChunkPersister::Result& r) {
        if (r.ok) m->add_persist_ok(); else m->add_persist_failed();
      });
    if (!queued) {
      metrics_->add_persist_failed();
      log_err("[stream] " + cfg_.label + " persister is shut down; chunk " +
              std::to_string(index) + " not saved");
    }
  }

  metrics_->start_stage("emit");
  const bool ok = sink.write(body);
  metrics_->end_stage("emit");
  if (!ok) {
    disconnected_ = true;
    log_err("[stream] " + cfg_.label + " client went away at chunk " + std::to_string(index));
    close();
    return false;
  }

  metrics_->add_chunk(nrows, body.size());
  ++chunks_sent_;
  log_out("[stream] " + cfg_.label + " sent chunk " + std::to_string(index) +
          " (" + std::to_string(nrows) + " rows)");
  return true;
}

void StreamEmitter::fail_fetch(const char* what, const std::exception& e) {
  metrics_->end_stage("fetch");
  state_ = State::Failed;
  failed_ = true;
  log_err("[stream] " + cfg_.label + " " + what + " after " +
          std::to_string(chunks_sent_) + " chunk(s): " + e.what());
  close();
}

void StreamEmitter::run(ChunkSink& sink) {
  while (pump(sink)) {}
}

StreamStats StreamEmitter::stats() const {
  double wall = wall_ms_;
  if (state_ != State::Closed && state_ != State::Idle) {
    wall = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0_).count();
  }
  return metrics_->snapshot(wall);
}

void StreamEmitter::close() {
  const State ended_in = state_;
  // drops the iterator and with it the RowSource connection
  it_.reset();
  wall_ms_ = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0_).count();
  state_ = State::Closed;

  const StreamStats s = metrics_->snapshot(wall_ms_);
  std::ostringstream o;
  o << "[stream] " << cfg_.label << " closed (" << to_string(ended_in)
    << (disconnected_ ? ", client disconnected" : "") << "): chunks=" << s.chunks
    << " rows=" << s.rows << " bytes=" << s.bytes << " wall_ms=" << s.wall_ms;
  for (const auto& st : s.stages) o << " " << st.name << "_ms=" << st.duration_ms;
  if (ended_in == State::Draining && !disconnected_) {
    log_out(o.str());
    log_out("[stream] " + cfg_.label + ": all data has been sent");
  } else {
    log_err(o.str());
  }
}

}
