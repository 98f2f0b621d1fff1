#include "row_streamer/errors.hpp"
#include "row_streamer/http_server.hpp"
#include "row_streamer/store_config.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

namespace {

struct Cli {
  std::string host = "127.0.0.1";
  int port = 8000;
  std::string db;                  // empty -> $DATABASE_URL or StoreConfig default
  std::string table = "large_table";
  std::string work_dir = ".";
  unsigned long long chunk_size = 1000;
  unsigned long long max_rows = 0;
  int persist_threads = 2;
  int persist_queue = 16;
  bool namespace_requests = false;
};

void usage() {
  std::cout <<
    "Usage: row-streamer [--host=ADDR] [--port=N] [--db=URL] [--table=NAME]\n"
    "                    [--work-dir=DIR] [--chunk-size=N] [--max-rows=N]\n"
    "                    [--persist-threads=N] [--persist-queue=N] [--namespace-requests]\n"
    "\n"
    "  --db accepts sqlite:///relative.db, sqlite:////abs/path.db or a plain path;\n"
    "  falls back to $DATABASE_URL, then sqlite:///database/bulk.db.\n";
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_i = [&](const char* pfx, int* out){
      if (a.rfind(pfx, 0) == 0) { *out = std::stoi(a.substr(std::string(pfx).size())); return true; }
      return false;
    };
    auto eat_u = [&](const char* pfx, unsigned long long* out){
      if (a.rfind(pfx, 0) == 0) { *out = std::stoull(a.substr(std::string(pfx).size())); return true; }
      return false;
    };
    if (eat("--host=", &c.host)) continue;
    if (eat_i("--port=", &c.port)) continue;
    if (eat("--db=", &c.db)) continue;
    if (eat("--table=", &c.table)) continue;
    if (eat("--work-dir=", &c.work_dir)) continue;
    if (eat_u("--chunk-size=", &c.chunk_size)) continue;
    if (eat_u("--max-rows=", &c.max_rows)) continue;
    if (eat_i("--persist-threads=", &c.persist_threads)) continue;
    if (eat_i("--persist-queue=", &c.persist_queue)) continue;
    if (a == "--namespace-requests") { c.namespace_requests = true; continue; }
    if (a == "-h" || a == "--help") { usage(); std::exit(0); }
    std::cerr << "[main] unknown argument: " << a << "\n";
    usage();
    std::exit(2);
  }
  return c;
}

}

int main(int argc, char** argv) {
  Cli cli;
  try {
    cli = parse_cli(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "[main] bad numeric argument: " << e.what() << "\n";
    return 2;
  }

  if (cli.chunk_size == 0) { std::cerr << "[main] --chunk-size must be greater than 0\n"; return 2; }
  if (cli.persist_threads < 1 || cli.persist_queue < 1) {
    std::cerr << "[main] --persist-threads and --persist-queue must be greater than 0\n";
    return 2;
  }

  // Built once; every component gets it by const reference.
  rs::StoreConfig store;
  if (!cli.db.empty()) {
    store.url = cli.db;
  } else if (const char* env = std::getenv("DATABASE_URL"); env && *env) {
    store.url = env;
  }
  store.table = cli.table;

  try {
    (void)rs::sqlite_path_from_url(store.url);
    (void)rs::quote_identifier(store.table);
  } catch (const rs::InvalidArgument& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 2;
  }

  rs::HttpServer::Config cfg;
  cfg.host = cli.host;
  cfg.port = cli.port;
  cfg.work_dir = cli.work_dir;
  cfg.chunk_size = cli.chunk_size;
  cfg.max_rows = cli.max_rows;
  cfg.namespace_requests = cli.namespace_requests;
  cfg.persist.threads = static_cast<std::size_t>(cli.persist_threads);
  cfg.persist.queue_capacity = static_cast<std::size_t>(cli.persist_queue);

  std::cout << "[main] store=" << store.url << " table=" << store.table
            << " work_dir=" << cfg.work_dir.string()
            << " chunk_size=" << cfg.chunk_size << "\n";

  rs::HttpServer server(cfg, store);
  int rc = server.run();
  if (rc != 0) {
    std::cerr << "Server failed to start on " << cfg.host << ":" << cfg.port << "\n";
    return rc;
  }
  return 0;
}
