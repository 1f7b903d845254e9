#include "AccessLog.h"

#include <atomic>
#include <memory>
#include <system_error>
#include <sys/signal.h>

#include <glog/logging.h>
#include <folly/Format.h>
#include <folly/SocketAddress.h>
#include <folly/portability/GFlags.h>
#include <folly/logging/AsyncFileWriter.h>
#include <folly/io/async/AsyncSignalHandler.h>
#include <folly/synchronization/HazptrHolder.h>
#include <proxygen/httpserver/Filters.h>
#include <proxygen/httpserver/RequestHandlerFactory.h>

using folly::StringPiece;
using proxygen::RequestHandler;
using proxygen::RequestHandlerFactory;
using proxygen::HTTPMessage;

DEFINE_string(access_log, "/tmp/callguard.log",
              "Guard API access log, reopened on SIGHUP; empty disables it");

/* Swapped by the rotator, writers hold it under a hazard pointer */
class AccessLogWriter : public folly::AsyncFileWriter
                      , public folly::hazptr_obj_base<AccessLogWriter>
{
 public:
  using folly::AsyncFileWriter::AsyncFileWriter;
};
static std::atomic<AccessLogWriter*> accessLog;

static void writeAccessLog(std::string line) {
  folly::hazptr_holder h;
  if (auto log = h.get_protected(accessLog))
    log->writeMessage(std::move(line));
}

void AccessLogFormatter::onRequest(const folly::SocketAddress &peer,
                                   StringPiece method, StringPiece uri,
                                   time_t startTime)
{
  char date[32];
  struct tm tm;
  gmtime_r(&startTime, &tm);
  strftime(date, sizeof(date), "%d/%b/%Y:%H:%M:%S %z", &tm);

  prefix_ = folly::sformat("{} - - [{}] \"{} {}\"", peer.describe(), date,
                           method, uri);
  began_ = std::chrono::steady_clock::now();

  StringPiece path = uri.split_step('?');
  command_ = path.removePrefix("/guard/v1/") && !path.empty() ? path.str() : "-";
}

void AccessLogFormatter::onHeaders(unsigned status, StringPiece requestId,
                                   StringPiece result)
{
  status_ = status;
  requestId_ = requestId.empty() ? "-" : requestId.str();
  result_ = result.empty() ? "-" : result.str();
}

std::string AccessLogFormatter::finish(StringPiece override) {
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - began_);
  StringPiece result = override.empty() ? StringPiece(result_) : override;
  if (result.empty())
    result = "-";
  return folly::sformat("{} {} {} {} {} {} {}ms\n", prefix_, status_, bytes_,
                        requestId_.empty() ? "-" : requestId_, command_,
                        result, elapsed.count());
}

class AccessLogHandler final : public proxygen::Filter {
 public:
  explicit AccessLogHandler(RequestHandler* upstream)
    : Filter(upstream)
  {}

  void onRequest(std::unique_ptr<HTTPMessage> msg) noexcept override {
    log_.onRequest(msg->getClientAddress(), msg->getMethodString(), msg->getURL(),
                   proxygen::toTimeT(msg->getStartTime()));
    Filter::onRequest(std::move(msg));
  }

  void sendHeaders(HTTPMessage& msg) noexcept override {
    const auto& headers = msg.getHeaders();
    log_.onHeaders(msg.getStatusCode(),
                   headers.getSingleOrEmpty("X-RequestID"),
                   headers.getSingleOrEmpty("X-Guard-Result"));
    Filter::sendHeaders(msg);
  }

  void sendBody(std::unique_ptr<folly::IOBuf> body) noexcept override {
    log_.onBody(body->computeChainDataLength());
    Filter::sendBody(std::move(body));
  }

  void requestComplete() noexcept override {
    writeAccessLog(log_.finish());
    Filter::requestComplete();
  }

  void onError(proxygen::ProxygenError err) noexcept override {
    writeAccessLog(log_.finish("aborted"));
    Filter::onError(err);
  }

 private:
  AccessLogFormatter log_;
};

class AccessLogHandlerFactory : public RequestHandlerFactory {
 public:
  void onServerStart(folly::EventBase* /*evb*/) noexcept override {
  }

  void onServerStop() noexcept override {
  }

  RequestHandler* onRequest(RequestHandler *upstream, HTTPMessage* /*msg*/) noexcept override {
    if (!accessLog.load())
      return upstream;
    return new AccessLogHandler(upstream);
  }
};

class AccessLogRotator : public folly::AsyncSignalHandler {
 public:
  explicit AccessLogRotator(folly::EventBase *evb)
    : folly::AsyncSignalHandler(evb)
  {
    reopen();
    registerSignalHandler(SIGHUP);
  }

  ~AccessLogRotator() override {
    install(nullptr);
  }

  void signalReceived(int /*signum*/) noexcept override {
    LOG(INFO) << "SIGHUP received, reopening access log";
    reopen();
  }

 private:
  void reopen() noexcept
  try {
    if (FLAGS_access_log.empty()) {
      LOG_FIRST_N(WARNING, 1) << "No --access_log given, access log disabled";
      return;
    }
    install(std::make_unique<AccessLogWriter>(FLAGS_access_log));
    LOG(INFO) << "Access log " << FLAGS_access_log << " opened";
  } catch (const std::system_error& e) {
    // Keep writing to the previous file
    LOG(ERROR) << "Could not open access log " << FLAGS_access_log
               << ": " << e.what();
  }

  static void install(std::unique_ptr<AccessLogWriter> recruit) {
    if (auto veteran = accessLog.exchange(recruit.release())) {
      veteran->flush();
      veteran->retire();
    }
  }
};

std::shared_ptr<AccessLogRotator> makeAccessLogRotator(folly::EventBase *evb)
{
  return std::make_shared<AccessLogRotator>(evb);
}

std::unique_ptr<RequestHandlerFactory> makeAccessLogHandlerFactory()
{
  return std::make_unique<AccessLogHandlerFactory>();
}
