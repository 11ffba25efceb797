#pragma once

#include <stdexcept>
#include <string>

namespace pprl {

// A raw identifier that cannot be normalized (empty, control bytes, invalid
// UTF-8). Callers decide whether to skip or reject the record.
class InvalidInputError : public std::invalid_argument {
 public:
  explicit InvalidInputError(const std::string& what)
      : std::invalid_argument(what) {}
};

// The dataset does not fit into the agreed padding bound. Raised before any
// share is generated.
class CapacityExceededError : public std::length_error {
 public:
  explicit CapacityExceededError(const std::string& what)
      : std::length_error(what) {}
};

// Transport failure, desynchronisation or disagreement between parties. The
// whole run is void; nothing computed so far may be released.
class ProtocolAbortError : public std::runtime_error {
 public:
  explicit ProtocolAbortError(const std::string& what)
      : std::runtime_error(what) {}
};

};  // namespace pprl
