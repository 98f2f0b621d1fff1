#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace rs {

// mkdir -p; true if `dir` exists afterwards. Idempotent.
bool ensure_dir(const std::filesystem::path& dir, std::string* err_out = nullptr);

// "<stem>_<index>.json", e.g. chunk_3.json, chunk_paginated_1.json
std::string chunk_file_name(std::string_view stem, std::uint64_t index);

// Hash helper (stable) used for request ids.
std::string hex_hash_prefix(std::string_view data, int len);

// Process-unique id for namespacing one request's output folder.
std::string make_request_id(int len = 12);

}
