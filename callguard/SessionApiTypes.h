#ifndef GUARD_CALLGUARD_SESSION_API_TYPES_H
#define GUARD_CALLGUARD_SESSION_API_TYPES_H

#include <string>
#include <folly/Expected.h>
#include <folly/Optional.h>
#include <folly/Range.h>
#include <folly/dynamic.h>

#include <session/GuardError.h>
#include <session/SessionTypes.h>
#include <session/PersonaOrchestrator.h>
#include <evidence/EvidencePackage.h>

struct StartRequest {
  std::string sessionId;
  std::string phoneId;
  folly::Optional<CallDirection> direction;
  uint64_t firstSequence = 1;
  std::string audioRef;
};

struct FragmentRequest {
  std::string sessionId;
  folly::Optional<Speaker> speaker;
  std::string text;
  uint64_t sequence = 0;
  int64_t timestamp = 0;
};

struct HandoffRequest {
  std::string sessionId;
  std::string personaName;
  folly::Optional<PersonaId> persona;
};

struct TerminateRequest {
  std::string sessionId;
};

struct EndCallRequest {
  std::string sessionId;
  std::string reason;
};

struct SubmitRequest {
  std::string sessionId;
};

struct ReviewRequest {
  std::string packageId;
  folly::Optional<SubmissionStatus> status;
  std::string notes;
};

/** Outcome of one accepted command and the events it produced. */
struct CommandResult {
  folly::dynamic result = folly::dynamic::object;
  EventList events;
};

/**
 * JSON codec of one session-control message. Bodies are accepted either
 * flat or wrapped in an object keyed by the message name.
 */
template<class M>
struct GuardApiType {
  static const char* name() noexcept;
  static GuardError validate(const M &msg);
  static folly::Expected<M, GuardError> fromJson(const folly::dynamic& json);
  static folly::dynamic toJson(const CommandResult &res);
  static std::string toBody(const CommandResult &res);
};

#endif // GUARD_CALLGUARD_SESSION_API_TYPES_H
