#pragma once
#include "types.hpp"
#include <stdexcept>
#include <string>

namespace uiscope {

class CaptureError : public std::runtime_error {
public:
  CaptureError(ErrorKind kind, const std::string &msg)
      : std::runtime_error(msg), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

// Provider runtime or connection could not be established; fatal to one
// window.
class ConnectionUnavailable : public CaptureError {
public:
  explicit ConnectionUnavailable(const std::string &msg)
      : CaptureError(ErrorKind::ConnectionUnavailable, msg) {}
};

// The element vanished between fetch and read.
class ElementStale : public CaptureError {
public:
  explicit ElementStale(const std::string &msg)
      : CaptureError(ErrorKind::ElementStale, msg) {}
};

class FetchTimeout : public CaptureError {
public:
  explicit FetchTimeout(const std::string &msg)
      : CaptureError(ErrorKind::FetchTimeout, msg) {}
};

// The provider refused the requested cache scope.
class FetchRejected : public CaptureError {
public:
  explicit FetchRejected(const std::string &msg)
      : CaptureError(ErrorKind::FetchRejected, msg) {}
};

// Caller-contract violation; the only error that fails a whole capture.
class InvalidInput : public CaptureError {
public:
  explicit InvalidInput(const std::string &msg)
      : CaptureError(ErrorKind::InvalidInput, msg) {}
};

inline bool is_recoverable(ErrorKind k) {
  return k == ErrorKind::ElementStale || k == ErrorKind::FetchTimeout;
}

// Runs f, repeating immediately on stale/timeout failures until
// max_attempts calls have been made. Other errors propagate at once.
template <typename F>
auto retry_recoverable(int max_attempts, F &&f) -> decltype(f()) {
  for (int attempt = 1;; ++attempt) {
    try {
      return f();
    } catch (const CaptureError &e) {
      if (!is_recoverable(e.kind()) || attempt >= max_attempts)
        throw;
    }
  }
}

} // namespace uiscope
