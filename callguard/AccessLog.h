#ifndef GUARD_CALLGUARD_ACCESS_LOG_H
#define GUARD_CALLGUARD_ACCESS_LOG_H

#include <chrono>
#include <ctime>
#include <string>
#include <folly/Range.h>

#include "CallGuard.h"

namespace folly {
  class SocketAddress;
}

/**
 * Access log line of one guard API request:
 *
 *   peer - - [date] "METHOD uri" status bytes request-id command result ms
 *
 * where command is the path below /guard/v1/ and result is the reflect
 * name of the typed error, OK on success, or "aborted" when the client
 * went away before the response was complete.
 */
class AccessLogFormatter {
 public:
  void onRequest(const folly::SocketAddress &peer,
                 folly::StringPiece method, folly::StringPiece uri,
                 time_t startTime);

  void onHeaders(unsigned status, folly::StringPiece requestId,
                 folly::StringPiece result);

  void onBody(size_t bytes) { bytes_ += bytes; }

  std::string finish(folly::StringPiece override = folly::StringPiece());

 private:
  std::string prefix_;
  std::string command_;
  std::string requestId_;
  std::string result_;
  unsigned status_ = 0;
  size_t bytes_ = 0;
  std::chrono::steady_clock::time_point began_;
};

#endif // GUARD_CALLGUARD_ACCESS_LOG_H
