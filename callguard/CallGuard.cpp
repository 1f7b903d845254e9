#include <folly/init/Init.h>
#include <folly/Memory.h>
#include <folly/json.h>
#include <folly/executors/CPUThreadPoolExecutor.h>
#include <folly/io/async/EventBaseManager.h>
#include <folly/portability/GFlags.h>
#include <folly/ssl/Init.h>
#include <folly/system/HardwareConcurrency.h>
#include <glog/logging.h>
#include <proxygen/httpserver/HTTPServer.h>

#include <evidence/EvidenceAssembler.h>
#include <evidence/EvidenceJournal.h>
#include "CallGuard.h"
#include "AccessLog.h"
#include "Control.h"
#include "SessionManager.h"

using proxygen::HTTPServer;
using proxygen::HTTPServerOptions;
using proxygen::RequestHandlerChain;

DEFINE_uint32(http_port, 13000, "Port to listen on with HTTP protocol");
DEFINE_uint32(http_idle_timeout, 60, "A timeout to close inactive sessions");
DEFINE_string(http_if1, "localhost", "IP/Hostname to bind HTTP to");
DEFINE_string(http_if2, "", "Additional address to bind HTTP to");
DEFINE_string(http_if3, "", "Additional address to bind HTTP to");
DEFINE_int32(threads, 0,
             "Number of threads to listen on. Numbers <= 0 "
             "will use the number of cores on this machine.");
DEFINE_int32(workers, 0,
             "Number of threads running session commands. Numbers <= 0 "
             "will use four per listening thread.");
DEFINE_string(signing_key, "",
              "PEM file with the P-256 evidence signing key; "
              "an ephemeral key is generated when empty");

/** Outbound events go to the log; payloads carry masked values only. */
class LogEventSink : public EventSink {
 public:
  void onEvent(const SessionEvent& event) override {
    if (std::holds_alternative<StateChanged>(event.payload) ||
        std::holds_alternative<EvidenceReady>(event.payload)) {
      LOG(INFO) << "Event " << folly::toJson(toJson(event));
    } else {
      VLOG(1) << "Event " << folly::toJson(toJson(event));
    }
  }
};

int main(int argc, char* argv[]) {
  folly::Init init(&argc, &argv);
  folly::ssl::init();
  google::InstallFailureSignalHandler();
  setlocale(LC_ALL, "C");

  CHECK(FLAGS_http_port < 65536);
  if (FLAGS_threads <= 0) {
    FLAGS_threads = folly::hardware_concurrency();
    CHECK(FLAGS_threads > 0);
  }
  if (FLAGS_workers <= 0)
    FLAGS_workers = 4 * FLAGS_threads;

  if (FLAGS_signing_key.empty()) {
    LOG(WARNING) << "No --signing_key given, evidence is signed with an ephemeral key";
    generateSigningKey();
  } else if (!loadSigningKey(FLAGS_signing_key)) {
    LOG(FATAL) << "Failed to load signing key from " << FLAGS_signing_key;
  }

  auto assembler = std::make_shared<EvidenceAssembler>(getKeyManager(),
                                                       makeEvidenceStore());
  auto sessions = std::make_shared<SessionManager>(std::move(assembler), nullptr,
                                                   std::make_shared<LogEventSink>());
  startControlSocket(sessions);

  auto workers = std::make_shared<folly::CPUThreadPoolExecutor>(
      static_cast<size_t>(FLAGS_workers));

  std::vector<HTTPServer::IPConfig> IPs;
  for (std::string intf : {FLAGS_http_if1, FLAGS_http_if2, FLAGS_http_if3}) {
    if (!intf.empty()) {
      uint16_t port = FLAGS_http_port;
      IPs.emplace_back(folly::SocketAddress{intf, port, true},
                       HTTPServer::Protocol::HTTP);
    }
  }

  HTTPServerOptions options;
  options.threads = static_cast<size_t>(FLAGS_threads);
  options.idleTimeout = std::chrono::seconds(FLAGS_http_idle_timeout);
  options.shutdownOn = {SIGINT, SIGTERM};
  options.enableContentCompression = false;
  options.h2cEnabled = false;
  // Increase the default flow control to 1MB/10MB
  options.initialReceiveWindow = uint32_t(1 << 20);
  options.receiveStreamWindowSize = uint32_t(1 << 20);
  options.receiveSessionWindowSize = 10 * (1 << 20);
  options.handlerFactories = RequestHandlerChain()
    .addThen(makeAccessLogHandlerFactory())
    .addThen(makeGuardApiFactory(sessions, workers))
    .addThen(makeHttpNotFound())
    .build();

  HTTPServer server(std::move(options));
  LOG(INFO) << "Starting HTTP server on port " << FLAGS_http_port;
  server.bind(IPs);

  LOG(INFO) << "Serving requests";
  folly::EventBase* evb = folly::EventBaseManager::get()->getEventBase();
  auto logRotator = makeAccessLogRotator(evb);
  server.start();

  workers->join();
  LOG(INFO) << "Stopped with " << sessions->stats().live << " live sessions";
  return EXIT_SUCCESS;
}
