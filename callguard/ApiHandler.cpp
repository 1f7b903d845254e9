#include "CallGuard.h"
#include "SessionApiTypes.h"
#include "SessionManager.h"

#include <folly/Range.h>
#include <folly/String.h>
#include <folly/Conv.h>
#include <folly/dynamic.h>
#include <folly/Executor.h>
#include <folly/io/async/EventBase.h>
#include <folly/io/async/EventBaseManager.h>
#include <folly/portability/GFlags.h>
#include <glog/logging.h>
#include <proxygen/httpserver/RequestHandler.h>
#include <proxygen/httpserver/RequestHandlerFactory.h>
#include <proxygen/httpserver/ResponseBuilder.h>
#include <proxygen/httpserver/filters/DirectResponseHandler.h>

#include <uuid.h>
#include <memory>

using namespace proxygen;
using folly::StringPiece;

DEFINE_uint32(guard_api_body_limit, 65536,
              "Maximum size of a session-control message");

enum class Command {
  START, FRAGMENT, HANDOFF, TERMINATE, END, SUBMIT, REVIEW
};

static const struct {
  const char* path;
  Command command;
} routes[] = {
  { "/guard/v1/start", Command::START },
  { "/guard/v1/fragment", Command::FRAGMENT },
  { "/guard/v1/handoff", Command::HANDOFF },
  { "/guard/v1/terminate", Command::TERMINATE },
  { "/guard/v1/end", Command::END },
  { "/guard/v1/submit", Command::SUBMIT },
  { "/guard/v1/review", Command::REVIEW },
};

struct GuardApiHeaderVisitor {
  GuardError error;
  std::string requestId;
  int64_t contentLength = -1;
  bool jsonInput = false;

  void visit(HTTPHeaderCode code, StringPiece name, StringPiece value);
  GuardError finalize();

  void operator()(HTTPHeaderCode code, StringPiece name, StringPiece value) {
    visit(code, name, value);
  }
};

void GuardApiHeaderVisitor::visit(HTTPHeaderCode code, StringPiece name,
                                  StringPiece value) {
  StringPiece token;

  switch (code) {
  case HTTP_HEADER_CONTENT_LENGTH:
    if (auto maybe = folly::tryTo<uint32_t>(value))
      contentLength = maybe.value();
    else
      contentLength = 0;
    break;
  case HTTP_HEADER_CONTENT_TYPE:
    token = value;
    token = token.split_step(";");
    token = folly::trimWhitespace(token);
    if (token == "application/json")
      jsonInput = true;
    break;
  case HTTP_HEADER_OTHER:
    token = name;
    if (token.equals("X-RequestID", folly::AsciiCaseInsensitive()))
      requestId = value.str();
    break;
  default:
    // ignore
    break;
  }
}

GuardError GuardApiHeaderVisitor::finalize() {
  if (!jsonInput) {
    error = GUARD_SVC_UNSUPPORTED_REQUEST_BODY_TYPE;
    error.putVariable("application/json");
  } else if (contentLength == -1) {
    error = GUARD_SVC_MISSING_BODY_LENGTH;
  } else if (contentLength >= FLAGS_guard_api_body_limit) {
    error = GUARD_SVC_FAILED_TO_PARSE_MSG_BODY;
    error.putVariable("invalid message body length specified");
  }
  return std::move(error);
}

template<class M>
static folly::Expected<std::string, GuardError>
runCommand(SessionManager& sessions, std::string body) {
  using Ops = GuardApiType<M>;
  return Ops::fromJson(std::move(body))
    .then([&](M req) {
      return sessions.handle(req);
    })
    .then([](CommandResult res) {
      return Ops::toBody(res);
    });
}

/* Runs on a worker thread, must not touch the handler */
static folly::Expected<std::string, GuardError>
handleRequest(SessionManager& sessions, Command command, std::string body)
try {
  switch (command) {
  case Command::START:
    return runCommand<StartRequest>(sessions, std::move(body));
  case Command::FRAGMENT:
    return runCommand<FragmentRequest>(sessions, std::move(body));
  case Command::HANDOFF:
    return runCommand<HandoffRequest>(sessions, std::move(body));
  case Command::TERMINATE:
    return runCommand<TerminateRequest>(sessions, std::move(body));
  case Command::END:
    return runCommand<EndCallRequest>(sessions, std::move(body));
  case Command::SUBMIT:
    return runCommand<SubmitRequest>(sessions, std::move(body));
  case Command::REVIEW:
    return runCommand<ReviewRequest>(sessions, std::move(body));
  }
  return folly::makeUnexpected(GuardError(GUARD_SVC_RESOURCE_NOT_FOUND));
} catch (const std::exception& e) {
  LOG(ERROR) << "Command failed: " << e.what();
  return folly::makeUnexpected(GuardError(GUARD_POL_INTERNAL_ERROR));
}

class GuardApiHandler final : public RequestHandler {
 public:
  GuardApiHandler(std::shared_ptr<SessionManager> sessions,
                  std::shared_ptr<folly::Executor> workers)
    : sessions_(std::move(sessions))
    , workers_(std::move(workers))
    , alive_(std::make_shared<bool>(true))
  {}

  void onRequest(std::unique_ptr<HTTPMessage> req) noexcept override {
    const StringPiece path = req->getPathAsStringPiece();
    GuardApiHeaderVisitor hVisitor;

    // Find or generate RequestId
    req->getHeaders().forEachWithCode(std::ref(hVisitor));
    if (hVisitor.requestId.empty()) {
      generateRequestId();
    } else {
      requestId_ = std::move(hVisitor.requestId);
    }

    if (req->getMethod() != HTTPMethod::POST) {
      error_ = GUARD_POL_METHOD_NOT_ALLOWED;
      return;
    }

    error_ = GUARD_SVC_RESOURCE_NOT_FOUND;
    for (const auto& route : routes) {
      if (path == route.path) {
        command_ = route.command;
        error_ = GuardError();
        break;
      }
    }
    if (error_)
      return;

    error_ = hVisitor.finalize();
    if (!error_)
      body_.reserve(hVisitor.contentLength);
  }

  void onBody(std::unique_ptr<folly::IOBuf> pkt) noexcept override {
    if (error_)
      return;
    body_ += StringPiece(pkt->coalesce());
    if (body_.size() >= FLAGS_guard_api_body_limit) {
      error_ = GUARD_SVC_FAILED_TO_PARSE_MSG_BODY;
      error_.putVariable("message body exceeds length limit");
      body_.clear();
    }
  }

  void generateRequestId() {
    uuid_t randomId;
    uuid_generate_random(randomId);
    requestId_.resize(37);
    uuid_unparse(randomId, requestId_.data());
    requestId_.resize(36);
  }

  void onEOM() noexcept override {
    if (error_) {
      sendError();
      return;
    }

    // Commands block on collaborators, keep them off the IO thread
    folly::EventBase *evb = folly::EventBaseManager::get()->getExistingEventBase();
    workers_->add([this, evb, alive = alive_, sessions = sessions_,
                   command = command_, body = std::move(body_)]() mutable {
      auto response = handleRequest(*sessions, command, std::move(body));
      evb->runInEventBaseThread([this, alive, response = std::move(response)]() mutable {
        if (!*alive)
          return;
        if (response.hasError()) {
          error_ = std::move(response).error();
          sendError();
        } else {
          body_ = std::move(response).value();
          sendResponse(200, "OK");
        }
      });
    });
  }

  void sendError() {
    body_ = error_.toBody();
    sendResponse(error_.http_status(), error_.reflect());
  }

  void sendResponse(int status, const char* result) {
    ResponseBuilder(downstream_)
      .status(status, HTTPMessage::getDefaultReason(status))
      .header("X-RequestID", requestId_)
      .header("X-Guard-Result", result)
      .header(HTTP_HEADER_CONTENT_TYPE, "application/json")
      .body(std::move(body_))
      .sendWithEOM();
  }

  void onUpgrade(UpgradeProtocol proto) noexcept override {
    // handler doesn't support upgrades
  }

  void requestComplete() noexcept override {
    *alive_ = false;
    delete this;
  }

  void onError(ProxygenError err) noexcept override {
    *alive_ = false;
    delete this;
  }

 private:
  std::shared_ptr<SessionManager> sessions_;
  std::shared_ptr<folly::Executor> workers_;
  /* Cleared on the event base thread when the handler goes away */
  std::shared_ptr<bool> alive_;

  std::string requestId_;
  Command command_ = Command::START;
  GuardError error_;
  std::string body_;
};

class GuardApiFactory : public RequestHandlerFactory {
 public:
  GuardApiFactory(std::shared_ptr<SessionManager> sessions,
                  std::shared_ptr<folly::Executor> workers)
    : sessions_(std::move(sessions))
    , workers_(std::move(workers))
  {}

  void onServerStart(folly::EventBase* /*evb*/) noexcept override {
  }

  void onServerStop() noexcept override {
  }

  RequestHandler* onRequest(RequestHandler *upstream, HTTPMessage *msg) noexcept override {
    const StringPiece path = msg->getPathAsStringPiece();
    if (path.startsWith("/guard/v1/")) {
      return new GuardApiHandler(sessions_, workers_);
    } else {
      return upstream;
    }
  }

 private:
  std::shared_ptr<SessionManager> sessions_;
  std::shared_ptr<folly::Executor> workers_;
};

std::unique_ptr<RequestHandlerFactory>
makeGuardApiFactory(std::shared_ptr<SessionManager> sessions,
                    std::shared_ptr<folly::Executor> workers)
{
  return std::make_unique<GuardApiFactory>(std::move(sessions), std::move(workers));
}

class HttpNotFound : public RequestHandlerFactory {
 public:
  void onServerStart(folly::EventBase* /*evb*/) noexcept override {
  }

  void onServerStop() noexcept override {
  }

  RequestHandler* onRequest(RequestHandler *upstream, HTTPMessage *msg) noexcept override {
    return new DirectResponseHandler(404, "Not Found", "");
  }
};

std::unique_ptr<RequestHandlerFactory> makeHttpNotFound()
{
  return std::make_unique<HttpNotFound>();
}
