#ifndef GUARD_CALLGUARD_CALL_GUARD_H
#define GUARD_CALLGUARD_CALL_GUARD_H

#include <memory>

class AccessLogRotator;
class SessionManager;
namespace folly {
  class EventBase;
  class Executor;
}
namespace proxygen {
  class RequestHandlerFactory;
}

std::unique_ptr<proxygen::RequestHandlerFactory>
makeGuardApiFactory(std::shared_ptr<SessionManager> sessions,
                    std::shared_ptr<folly::Executor> workers);

std::unique_ptr<proxygen::RequestHandlerFactory>
makeHttpNotFound();

std::unique_ptr<proxygen::RequestHandlerFactory>
makeAccessLogHandlerFactory();

std::shared_ptr<AccessLogRotator>
makeAccessLogRotator(folly::EventBase *evb);

#endif // GUARD_CALLGUARD_CALL_GUARD_H
