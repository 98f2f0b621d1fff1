#include "row_streamer/chunk_persister.hpp"
#include "row_streamer/errors.hpp"
#include "row_streamer/path_utils.hpp"
#include "memory_row_source.hpp"

#include <simdjson.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

static int failed = 0;

static void check(bool cond, const std::string& what) {
  if (cond) { std::cout << "[PASS] " << what << "\n"; }
  else      { std::cerr << "[FAIL] " << what << "\n"; ++failed; }
}

static fs::path scratch_dir(const char* name) {
  fs::path p = fs::temp_directory_path() / ("rs-persist-" + std::to_string(::getpid())) / name;
  std::error_code ec;
  fs::remove_all(p, ec);
  return p;
}

static rs::Chunk make_chunk(MemoryRowSource& src, std::uint64_t index, std::uint64_t offset, std::uint64_t n) {
  rs::Chunk c;
  c.index = index;
  c.requested_size = n;
  c.rows = src.fetch(offset, n);
  return c;
}

// ids of the rows in a persisted file, in file order; empty on parse error
static std::vector<std::int64_t> ids_in(const fs::path& f) {
  std::vector<std::int64_t> ids;
  simdjson::dom::parser p;
  simdjson::dom::element root;
  if (p.load(f.string()).get(root) != simdjson::SUCCESS) return ids;
  simdjson::dom::array arr;
  if (root.get_array().get(arr) != simdjson::SUCCESS) return ids;
  for (simdjson::dom::element row : arr) {
    std::int64_t id = 0;
    if (row["id"].get_int64().get(id) == simdjson::SUCCESS) ids.push_back(id);
  }
  return ids;
}

static void writes_files_and_creates_folder() {
  MemoryRowSource src(25);
  const fs::path out = scratch_dir("basic") / "nested" / "chunks";

  std::mutex mu;
  std::vector<rs::ChunkPersister::Result> results;
  {
    rs::ChunkPersister persister({/*threads=*/2, /*queue_capacity=*/4});
    for (std::uint64_t i = 0; i < 3; ++i) {
      bool queued = persister.persist(make_chunk(src, i + 1, i * 10, 10), out, "chunk",
        [&](const rs::ChunkPersister::Result& r) {
          std::lock_guard<std::mutex> lk(mu);
          results.push_back(r);
        });
      check(queued, "chunk " + std::to_string(i + 1) + " accepted");
    }
    persister.drain();
    check(persister.written() == 3 && persister.failed() == 0, "three files written, none failed");
  }

  check(fs::is_directory(out), "missing output folder is created");
  check(fs::exists(out / "chunk_1.json") && fs::exists(out / "chunk_2.json") && fs::exists(out / "chunk_3.json"),
        "files are named chunk_<index>.json");

  auto first = ids_in(out / "chunk_1.json");
  auto last  = ids_in(out / "chunk_3.json");
  check(first.size() == 10 && first.front() == 1 && first.back() == 10, "chunk_1.json holds ids 1..10");
  check(last.size() == 5 && last.front() == 21 && last.back() == 25, "chunk_3.json holds the 5-row tail");

  bool leftovers = false;
  for (auto& e : fs::directory_iterator(out)) {
    if (e.path().filename().string().find(".tmp.") != std::string::npos) leftovers = true;
  }
  check(!leftovers, "no temporary files left behind");

  bool all_ok = results.size() == 3;
  for (auto& r : results) all_ok &= r.ok && fs::exists(r.path);
  check(all_ok, "completion reports success with the final path");
}

static void failure_is_contained() {
  MemoryRowSource src(10);
  const fs::path base = scratch_dir("failure");
  fs::create_directories(base);
  const fs::path blocker = base / "not_a_dir";
  { std::ofstream f(blocker); f << "x"; }

  std::atomic<int> bad{0};
  rs::ChunkPersister persister({1, 2});
  bool queued = persister.persist(make_chunk(src, 1, 0, 5), blocker, "chunk",
    [&](const rs::ChunkPersister::Result& r) { if (!r.ok && !r.error.empty()) ++bad; });
  persister.drain();
  check(queued && persister.failed() == 1 && bad == 1, "write into a regular file fails and is reported");

  const fs::path good = base / "good";
  (void)persister.persist(make_chunk(src, 2, 5, 5), good, "chunk");
  persister.drain();
  check(persister.written() == 1 && fs::exists(good / "chunk_2.json"), "persister keeps working after a failure");

  bool threw = false;
  try {
    rs::ChunkPersister::write_chunk_file({}, blocker / "sub", "chunk_1.json");
  } catch (const rs::WriteFailure&) {
    threw = true;
  }
  check(threw, "synchronous write throws WriteFailure");
}

static void unusable_paths_fail_one_chunk() {
  MemoryRowSource src(10);
  const fs::path base = scratch_dir("badpath");
  fs::create_directories(base);
  const fs::path loop = base / "loop";
  std::error_code ec;
  fs::create_directory_symlink(loop, loop, ec); // loop -> loop
  check(!ec, "symlink loop fixture created");

  std::string err;
  check(!rs::ensure_dir(loop / "a" / "out", &err) && !err.empty(),
        "ensure_dir reports a symlink loop instead of throwing");

  const fs::path too_long = base / std::string(4096, 'n') / "out";

  std::atomic<int> bad{0};
  rs::ChunkPersister persister({1, 2});
  auto count_bad = [&](const rs::ChunkPersister::Result& r) { if (!r.ok) ++bad; };
  (void)persister.persist(make_chunk(src, 1, 0, 5), loop / "a" / "out", "chunk", count_bad);
  (void)persister.persist(make_chunk(src, 2, 5, 5), too_long, "chunk", count_bad);
  persister.drain();
  check(persister.failed() == 2 && bad == 2, "symlink loop and overlong name count as failed writes");

  (void)persister.persist(make_chunk(src, 3, 0, 5), base / "ok", "chunk");
  persister.drain();
  check(persister.written() == 1 && fs::exists(base / "ok" / "chunk_3.json"),
        "worker survives unusable paths");
}

static void bounded_queue_still_delivers_everything() {
  MemoryRowSource src(200);
  const fs::path out = scratch_dir("bounded");
  rs::ChunkPersister persister({1, 1});
  for (std::uint64_t i = 0; i < 20; ++i) {
    (void)persister.persist(make_chunk(src, i + 1, i * 10, 10), out, "chunk");
  }
  persister.drain();
  check(persister.written() == 20, "queue of one still writes all 20 chunks");
}

static void last_writer_wins() {
  MemoryRowSource src(50);
  const fs::path out = scratch_dir("overwrite");
  rs::ChunkPersister persister;
  (void)persister.persist(make_chunk(src, 1, 0, 3), out, "chunk_paginated");
  persister.drain();
  (void)persister.persist(make_chunk(src, 1, 40, 3), out, "chunk_paginated");
  persister.drain();
  auto ids = ids_in(out / "chunk_paginated_1.json");
  check(ids.size() == 3 && ids.front() == 41, "same index overwrites: last writer wins");
}

static void rejects_after_shutdown() {
  MemoryRowSource src(5);
  rs::ChunkPersister persister;
  persister.shutdown();
  check(!persister.persist(make_chunk(src, 1, 0, 5), scratch_dir("closed"), "chunk"),
        "persist after shutdown is refused");
}

static void naming() {
  check(rs::chunk_file_name("chunk", 3) == "chunk_3.json", "sequential file name");
  check(rs::chunk_file_name("chunk_paginated", 1) == "chunk_paginated_1.json", "paginated file name");
  const std::string a = rs::make_request_id(), b = rs::make_request_id();
  check(a.size() == 12 && b.size() == 12 && a != b, "request ids are 12 hex chars and distinct");
  check(rs::hex_hash_prefix("same", 8) == rs::hex_hash_prefix("same", 8), "hash prefix is stable");

  const fs::path d = scratch_dir("ensure") / "a" / "b";
  check(rs::ensure_dir(d) && rs::ensure_dir(d), "ensure_dir is idempotent");
}

int main() {
  naming();
  writes_files_and_creates_folder();
  failure_is_contained();
  unusable_paths_fail_one_chunk();
  bounded_queue_still_delivers_everything();
  last_writer_wins();
  rejects_after_shutdown();

  std::error_code ec;
  fs::remove_all(fs::temp_directory_path() / ("rs-persist-" + std::to_string(::getpid())), ec);

  if (failed) { std::cerr << "[FAIL] chunk_persister: " << failed << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] chunk_persister\n";
  return 0;
}
