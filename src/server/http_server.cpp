#include "row_streamer/http_server.hpp"
#include "row_streamer/chunk_iterator.hpp"
#include "row_streamer/chunk_json.hpp"
#include "row_streamer/errors.hpp"
#include "row_streamer/log.hpp"
#include "row_streamer/path_utils.hpp"
#include "row_streamer/row_source.hpp"
#include "row_streamer/stream_emitter.hpp"

#include <httplib.h>
#include <charconv>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

namespace rs {

namespace {

constexpr const char* kJson = "application/json";

// Adapts httplib's chunked DataSink to the emitter.
class DataSinkAdapter : public ChunkSink {
public:
  explicit DataSinkAdapter(httplib::DataSink& sink) : sink_(sink) {}
  bool write(std::string_view data) override { return sink_.write(data.data(), data.size()); }
  void done() override { sink_.done(); }

private:
  httplib::DataSink& sink_;
};

void reply_error(httplib::Response& res, int status, const std::string& detail) {
  res.status = status;
  res.set_content(ChunkJsonWriter::message("detail", detail), kJson);
}

// Integer query parameter; `defv` when absent. Throws InvalidArgument when
// the value is not a base-10 integer.
std::int64_t int_param(const httplib::Request& req, const char* name, std::int64_t defv) {
  if (!req.has_param(name)) return defv;
  const std::string v = req.get_param_value(name);
  std::int64_t out = 0;
  const char* b = v.data();
  const char* e = v.data() + v.size();
  auto [ptr, ec] = std::from_chars(b, e, out);
  if (v.empty() || ec != std::errc() || ptr != e) {
    throw InvalidArgument(std::string(name) + " must be an integer, got '" + v + "'");
  }
  return out;
}

}

struct HttpServer::Impl {
  Config cfg;
  const StoreConfig store;
  ChunkPersister persister;
  httplib::Server svr;
  int bound_port{-1};

  Impl(Config c, const StoreConfig& s)
    : cfg(std::move(c)), store(s), persister(cfg.persist) {}

  std::filesystem::path output_folder(const char* name) const {
    std::filesystem::path p = cfg.work_dir / name;
    if (cfg.namespace_requests) p /= make_request_id();
    return p;
  }

  // Hand the emitter to httplib; it is pumped once per provider call and
  // released with the response, which drops the RowSource connection.
  static void start_stream(httplib::Response& res, std::shared_ptr<StreamEmitter> emitter) {
    res.set_chunked_content_provider(
      kJson,
      [emitter](size_t /*offset*/, httplib::DataSink& sink) {
        DataSinkAdapter out(sink);
        emitter->pump(out);
        // false aborts the connection without the terminating chunk
        return emitter->healthy();
      },
      [emitter](bool success) {
        if (!success && emitter->state() != StreamEmitter::State::Closed) {
          log_err("[http] stream aborted by peer after " +
                  std::to_string(emitter->chunks_sent()) + " chunk(s)");
        }
      });
  }

  void bulk_data(httplib::Response& res) {
    std::shared_ptr<RowSource> src;
    try {
      src = open_row_source(store);
    } catch (const StorageUnavailable& e) {
      log_err(std::string("[http] /bulk-data: ") + e.what());
      reply_error(res, 503, e.what());
      return;
    }

    StreamEmitter::Config ec;
    ec.label = "bulk-data";
    ec.output_folder = output_folder("chunks");
    ec.file_stem = "chunk";
    auto it = std::make_unique<SequentialChunkIterator>(std::move(src), cfg.chunk_size, cfg.max_rows);
    start_stream(res, std::make_shared<StreamEmitter>(std::move(it), persister, std::move(ec)));
  }

  void bulk_data_paginated(const httplib::Request& req, httplib::Response& res) {
    std::int64_t page = 0, chunk_size = 0;
    try {
      page = int_param(req, "page", cfg.default_page);
      chunk_size = int_param(req, "chunk_size", cfg.default_page_size);
    } catch (const InvalidArgument& e) {
      reply_error(res, 400, e.what());
      return;
    }
    // validated before any storage access
    if (page < 1 || chunk_size < 1) {
      reply_error(res, 400, "Page and chunk_size must be greater than 0");
      return;
    }

    std::shared_ptr<RowSource> src;
    try {
      src = open_row_source(store);
    } catch (const StorageUnavailable& e) {
      log_err(std::string("[http] /bulk-data-paginated: ") + e.what());
      reply_error(res, 503, e.what());
      return;
    }

    std::unique_ptr<ChunkIterator> it;
    try {
      it = std::make_unique<PaginatedChunkIterator>(std::move(src), page, chunk_size);
    } catch (const InvalidArgument& e) {
      reply_error(res, 400, e.what());
      return;
    }

    StreamEmitter::Config ec;
    ec.label = "bulk-data-paginated page=" + std::to_string(page) +
               " chunk_size=" + std::to_string(chunk_size);
    ec.output_folder = output_folder("chunks_paginated");
    ec.file_stem = "chunk_paginated";
    ec.empty_chunk_message = true;
    start_stream(res, std::make_shared<StreamEmitter>(std::move(it), persister, std::move(ec)));
  }

  void count_records(httplib::Response& res) {
    try {
      auto src = open_row_source(store);
      res.set_content(ChunkJsonWriter::total_records(src->count()), kJson);
    } catch (const StorageUnavailable& e) {
      log_err(std::string("[http] /count-records: ") + e.what());
      reply_error(res, 503, e.what());
    }
  }

  void routes() {
    svr.Get("/bulk-data", [this](const httplib::Request&, httplib::Response& res) {
      bulk_data(res);
    });

    svr.Get("/bulk-data-paginated", [this](const httplib::Request& req, httplib::Response& res) {
      bulk_data_paginated(req, res);
    });

    svr.Get("/count-records", [this](const httplib::Request&, httplib::Response& res) {
      count_records(res);
    });

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
      log_out("[http] " + req.method + " " + req.target + " -> " + std::to_string(res.status));
    });
  }
};

HttpServer::HttpServer(Config cfg, const StoreConfig& store)
  : p_(new Impl(std::move(cfg), store)) { p_->routes(); }

HttpServer::~HttpServer() {
  stop();
  delete p_;
}

bool HttpServer::start() {
  if (p_->bound_port > 0) return true;
  if (p_->cfg.port == 0) {
    p_->bound_port = p_->svr.bind_to_any_port(p_->cfg.host);
  } else if (p_->svr.bind_to_port(p_->cfg.host, p_->cfg.port)) {
    p_->bound_port = p_->cfg.port;
  }
  return p_->bound_port > 0;
}

int HttpServer::run() {
  if (!start()) return -1;
  log_out("[http] listening on " + p_->cfg.host + ":" + std::to_string(p_->bound_port));
  return p_->svr.listen_after_bind() ? 0 : -1;
}

void HttpServer::stop() {
  if (p_->svr.is_running()) p_->svr.stop();
}

int HttpServer::port() const noexcept { return p_->bound_port; }

void HttpServer::drain_persistence() { p_->persister.drain(); }

}
