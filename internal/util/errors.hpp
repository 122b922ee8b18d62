#pragma once

#include <stdexcept>
#include <string>

namespace localdeck::util {

/*
  Central error types.

  These get translated later to gRPC status codes (grpc_error.cpp) and to
  HTTP status codes for the trigger endpoint (trigger_contract.cpp).
*/

// Requested content is not in the ContentStore.
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Card id has no usable mapping and no fallback hint was supplied.
class UnknownCard : public std::runtime_error {
 public:
  explicit UnknownCard(const std::string& msg) : std::runtime_error(msg) {
  }
};

// External source could not deliver audio (network, removed video, tool failure).
class SourceUnavailable : public std::runtime_error {
 public:
  explicit SourceUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Fallback hint cannot be parsed into a supported source.
class UnsupportedSource : public std::runtime_error {
 public:
  explicit UnsupportedSource(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Durable storage failed (disk full, I/O error, database failure).
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Caller abandoned its wait.
class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace localdeck::util
