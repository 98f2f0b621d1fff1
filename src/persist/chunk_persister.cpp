#include "row_streamer/chunk_persister.hpp"
#include "row_streamer/chunk_json.hpp"
#include "row_streamer/errors.hpp"
#include "row_streamer/log.hpp"
#include "row_streamer/path_utils.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <fstream>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace rs {

namespace {

struct Job {
  Chunk chunk;
  std::filesystem::path folder;
  std::string stem;
  ChunkPersister::Completion on_done;
};

std::atomic<std::uint64_t> g_tmp_seq{0};

}

std::filesystem::path ChunkPersister::write_chunk_file(const std::vector<Row>& rows,
                                                       const std::filesystem::path& output_folder,
                                                       const std::string& file_name) {
  std::string err;
  if (!ensure_dir(output_folder, &err)) throw WriteFailure(err);

  const std::filesystem::path final_path = output_folder / file_name;
  const std::filesystem::path tmp_path =
      output_folder / (file_name + ".tmp." + std::to_string(g_tmp_seq.fetch_add(1)));

  const std::string body = ChunkJsonWriter::to_json(rows, JsonStyle::Pretty);
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) throw WriteFailure("cannot open " + tmp_path.string() + " for writing");
    out.write(body.data(), static_cast<std::streamsize>(body.size()));
    out.close();
    if (!out) {
      std::error_code ec;
      std::filesystem::remove(tmp_path, ec);
      throw WriteFailure("short write to " + tmp_path.string());
    }
  }

  // rename replaces an existing file atomically: last writer wins
  std::error_code ec;
  std::filesystem::rename(tmp_path, final_path, ec);
  if (ec) {
    std::error_code rm_ec;
    std::filesystem::remove(tmp_path, rm_ec);
    throw WriteFailure("rename to " + final_path.string() + " failed: " + ec.message());
  }
  return final_path;
}

struct ChunkPersister::Impl {
  Config cfg;
  std::mutex mu;
  std::condition_variable not_empty;  // workers wait here
  std::condition_variable not_full;   // producers wait here
  std::condition_variable idle;       // drain() waits here
  std::deque<Job> queue;
  std::size_t in_flight{0};
  bool stopping{false};
  std::vector<std::thread> workers;
  std::atomic<std::uint64_t> written{0};
  std::atomic<std::uint64_t> failed{0};

  explicit Impl(Config c) : cfg(c) {
    cfg.threads = std::max<std::size_t>(1, cfg.threads);
    cfg.queue_capacity = std::max<std::size_t>(1, cfg.queue_capacity);
  }

  void run_job(Job& job) {
    Result r;
    r.chunk_index = job.chunk.index;
    try {
      r.path = write_chunk_file(job.chunk.rows, job.folder, chunk_file_name(job.stem, job.chunk.index));
      r.ok = true;
      written.fetch_add(1, std::memory_order_relaxed);
      std::error_code ec;
      const auto shown = std::filesystem::absolute(r.path, ec);
      log_out("[persist] saved chunk " + std::to_string(r.chunk_index) + " -> " +
              (ec ? r.path.string() : shown.string()));
    } catch (const std::exception& e) {
      // WriteFailure, or a filesystem error; either way one chunk fails, not the worker
      r.ok = false;
      r.error = e.what();
      failed.fetch_add(1, std::memory_order_relaxed);
      log_err("[persist] chunk " + std::to_string(r.chunk_index) + " failed: " + r.error);
    }

    if (job.on_done) {
      try {
        job.on_done(r);
      } catch (const std::exception& e) {
        log_err(std::string("[persist] completion callback threw: ") + e.what());
      }
    }
  }

  void worker_loop() {
    while (true) {
      Job job;
      {
        std::unique_lock<std::mutex> lk(mu);
        not_empty.wait(lk, [this] { return stopping || !queue.empty(); });
        if (queue.empty()) return; // stopping and nothing left
        job = std::move(queue.front());
        queue.pop_front();
        ++in_flight;
      }
      not_full.notify_one();

      run_job(job);

      {
        std::lock_guard<std::mutex> lk(mu);
        --in_flight;
        if (queue.empty() && in_flight == 0) idle.notify_all();
      }
    }
  }
};

ChunkPersister::ChunkPersister() : ChunkPersister(Config{}) {}

ChunkPersister::ChunkPersister(Config cfg) : p_(new Impl(cfg)) {
  p_->workers.reserve(p_->cfg.threads);
  for (std::size_t i = 0; i < p_->cfg.threads; ++i) {
    p_->workers.emplace_back([this] { p_->worker_loop(); });
  }
}

ChunkPersister::~ChunkPersister() {
  shutdown();
  delete p_;
}

bool ChunkPersister::persist(Chunk chunk,
                             std::filesystem::path output_folder,
                             std::string stem,
                             Completion on_done) {
  {
    std::unique_lock<std::mutex> lk(p_->mu);
    p_->not_full.wait(lk, [this] {
      return p_->stopping || p_->queue.size() < p_->cfg.queue_capacity;
    });
    if (p_->stopping) return false;
    p_->queue.push_back(Job{std::move(chunk), std::move(output_folder), std::move(stem), std::move(on_done)});
  }
  p_->not_empty.notify_one();
  return true;
}

void ChunkPersister::drain() {
  std::unique_lock<std::mutex> lk(p_->mu);
  p_->idle.wait(lk, [this] { return p_->queue.empty() && p_->in_flight == 0; });
}

void ChunkPersister::shutdown() {
  {
    std::lock_guard<std::mutex> lk(p_->mu);
    if (p_->stopping && p_->workers.empty()) return;
    p_->stopping = true;
  }
  p_->not_empty.notify_all();
  p_->not_full.notify_all();
  for (auto& t : p_->workers) {
    if (t.joinable()) t.join();
  }
  p_->workers.clear();
}

std::uint64_t ChunkPersister::written() const noexcept { return p_->written.load(std::memory_order_relaxed); }
std::uint64_t ChunkPersister::failed() const noexcept { return p_->failed.load(std::memory_order_relaxed); }

}
