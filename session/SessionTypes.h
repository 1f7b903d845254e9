#ifndef GUARD_SESSION_SESSION_TYPES_H
#define GUARD_SESSION_SESSION_TYPES_H

#include <cstdint>
#include <string>
#include <vector>
#include <variant>
#include <folly/Optional.h>
#include <folly/Range.h>

#include "GuardError.h"

namespace folly {
  struct dynamic;
}

enum class CallState : uint8_t {
  IDLE = 0,
  CONNECTING,
  MONITORING,
  THREAT_DETECTED,
  AI_HANDOFF,
  ENDED,
  REPORTED,
};

enum class ThreatLevel : uint8_t {
  SAFE = 0,
  LOW,
  MEDIUM,
  HIGH,
  CRITICAL,
};

enum class CallDirection : uint8_t {
  INBOUND = 0,
  OUTBOUND,
};

enum class Speaker : uint8_t {
  CALLER = 0,
  USER,
  PERSONA,
};

enum class EntityType : uint8_t {
  PAYMENT_HANDLE = 0,
  PHONE_NUMBER,
  BANK_ACCOUNT,
  NATIONAL_ID,
  TAX_ID,
  CARD_NUMBER,
  ONE_TIME_CODE,
  BANK_ROUTING_CODE,
  PERSON_NAME,
  LOCATION,
  MONETARY_AMOUNT,
  EMAIL,
};
constexpr size_t kEntityTypeCount = 12;

const char* toString(CallState state) noexcept;
const char* toString(ThreatLevel level) noexcept;
const char* toString(CallDirection dir) noexcept;
const char* toString(Speaker speaker) noexcept;
const char* toString(EntityType type) noexcept;

folly::Optional<CallDirection> parseCallDirection(folly::StringPiece s);
folly::Optional<Speaker> parseSpeaker(folly::StringPiece s);
folly::Optional<EntityType> parseEntityType(folly::StringPiece s);

/** Types whose clear value may only live inside an evidence package. */
bool isHighSensitivity(EntityType type) noexcept;

struct SourcePosition {
  uint64_t sequence = 0;
  uint32_t offset = 0;
  uint32_t length = 0;
};

/** Entity as shown to users and logs: masked value only. */
struct EntityView {
  EntityType type;
  std::string masked;
  double confidence;
  SourcePosition position;
  bool verified;
};

struct ExtractedEntity {
  EntityType type;
  std::string original;
  std::string masked;
  double confidence = 0;
  SourcePosition position;
  bool verified = false;

  EntityView view() const;
};

folly::dynamic toJson(const EntityView& entity);
/** Full form with the clear value, for signed evidence only. */
folly::dynamic toEvidenceJson(const ExtractedEntity& entity);

struct TranscriptEntry {
  uint64_t sequence = 0;
  Speaker speaker = Speaker::CALLER;
  std::string text;
  double score = 0;
  int64_t timestamp = 0;
};

folly::dynamic toJson(const TranscriptEntry& entry);

/** Per-fragment breakdown behind a running-score update. */
struct ScoreSignal {
  double keywordPressure = 0;
  double urgency = 0;
  double financialRequest = 0;
  double impersonation = 0;
  double behavioral = 0;
  folly::Optional<double> classifier;
  double entityBoost = 0;
  double fused = 0;
};

folly::dynamic toJson(const ScoreSignal& signal);

struct StateChanged {
  CallState from;
  CallState to;
};

struct ScoreUpdated {
  uint64_t sequence;
  double score;
  ThreatLevel level;
  ScoreSignal signal;
  const char* action;
};

/** Greetings carry no intent and no delay. */
struct PersonaReply {
  std::string text;
  uint32_t turn;
  const char* stage;
  const char* intent;
  uint32_t delayMs;
};

struct EntitiesExtracted {
  uint64_t sequence;
  std::vector<EntityView> entities;
  /** Dropped candidates as GUARD_MALFORMED_ENTITY, type and offset only. */
  std::vector<GuardError> malformed;
};

struct EvidenceReady {
  std::string packageId;
};

struct SessionEvent {
  std::string sessionId;
  std::variant<StateChanged, ScoreUpdated, PersonaReply,
               EntitiesExtracted, EvidenceReady> payload;

  const char* kind() const noexcept;
};

using EventList = std::vector<SessionEvent>;

folly::dynamic toJson(const SessionEvent& event);

/** Receives session events in per-session order. */
class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual void onEvent(const SessionEvent& event) = 0;
};

#endif // GUARD_SESSION_SESSION_TYPES_H
