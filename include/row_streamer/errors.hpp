#pragma once
#include <stdexcept>
#include <string>

namespace rs {

// Root of everything the streamer throws on purpose.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Non-positive page / chunk size, bad connection string, offset overflow.
// Always raised before any bytes go out.
class InvalidArgument : public Error {
public:
  explicit InvalidArgument(const std::string& what) : Error(what) {}
};

// Connection or query failure in a RowSource. Terminal for the stream.
class StorageUnavailable : public Error {
public:
  explicit StorageUnavailable(const std::string& what) : Error(what) {}
};

// One chunk file could not be written. Never escalates past the persister.
class WriteFailure : public Error {
public:
  explicit WriteFailure(const std::string& what) : Error(what) {}
};

}
