#include "SessionTypes.h"

#include <folly/dynamic.h>

using folly::dynamic;
using folly::StringPiece;

static const char* callStateName[] = {
  "idle", "connecting", "monitoring", "threat_detected",
  "ai_handoff", "ended", "reported",
};

static const char* threatLevelName[] = {
  "safe", "low", "medium", "high", "critical",
};

static const char* directionName[] = {
  "inbound", "outbound",
};

static const char* speakerName[] = {
  "caller", "user", "persona",
};

static const char* entityTypeName[kEntityTypeCount] = {
  "payment-handle", "phone-number", "bank-account", "national-id",
  "tax-id", "card-number", "one-time-code", "bank-routing-code",
  "person-name", "location", "monetary-amount", "email",
};

const char* toString(CallState state) noexcept {
  return callStateName[static_cast<size_t>(state)];
}

const char* toString(ThreatLevel level) noexcept {
  return threatLevelName[static_cast<size_t>(level)];
}

const char* toString(CallDirection dir) noexcept {
  return directionName[static_cast<size_t>(dir)];
}

const char* toString(Speaker speaker) noexcept {
  return speakerName[static_cast<size_t>(speaker)];
}

const char* toString(EntityType type) noexcept {
  return entityTypeName[static_cast<size_t>(type)];
}

template<class E, size_t N>
static folly::Optional<E> lookupName(const char* (&names)[N], StringPiece s) {
  for (size_t i = 0; i < N; ++i) {
    if (s == names[i])
      return static_cast<E>(i);
  }
  return folly::none;
}

folly::Optional<CallDirection> parseCallDirection(StringPiece s) {
  return lookupName<CallDirection>(directionName, s);
}

folly::Optional<Speaker> parseSpeaker(StringPiece s) {
  return lookupName<Speaker>(speakerName, s);
}

folly::Optional<EntityType> parseEntityType(StringPiece s) {
  return lookupName<EntityType>(entityTypeName, s);
}

bool isHighSensitivity(EntityType type) noexcept {
  switch (type) {
  case EntityType::NATIONAL_ID:
  case EntityType::CARD_NUMBER:
  case EntityType::ONE_TIME_CODE:
    return true;
  default:
    return false;
  }
}

EntityView ExtractedEntity::view() const {
  return EntityView{type, masked, confidence, position, verified};
}

static dynamic positionJson(const SourcePosition& pos) {
  return dynamic::object
    ("sequence", pos.sequence)
    ("offset", pos.offset)
    ("length", pos.length);
}

dynamic toJson(const EntityView& entity) {
  return dynamic::object
    ("type", toString(entity.type))
    ("value", entity.masked)
    ("confidence", entity.confidence)
    ("position", positionJson(entity.position))
    ("verified", entity.verified);
}

dynamic toEvidenceJson(const ExtractedEntity& entity) {
  return dynamic::object
    ("type", toString(entity.type))
    ("original", entity.original)
    ("masked", entity.masked)
    ("confidence", entity.confidence)
    ("position", positionJson(entity.position))
    ("verified", entity.verified);
}

dynamic toJson(const TranscriptEntry& entry) {
  return dynamic::object
    ("sequence", entry.sequence)
    ("speaker", toString(entry.speaker))
    ("text", entry.text)
    ("score", entry.score)
    ("timestamp", entry.timestamp);
}

dynamic toJson(const ScoreSignal& signal) {
  dynamic d = dynamic::object
    ("keyword_pressure", signal.keywordPressure)
    ("urgency", signal.urgency)
    ("financial_request", signal.financialRequest)
    ("impersonation", signal.impersonation)
    ("behavioral", signal.behavioral)
    ("entity_boost", signal.entityBoost)
    ("fused", signal.fused);
  d["classifier"] = signal.classifier ? dynamic(*signal.classifier) : dynamic();
  return d;
}

const char* SessionEvent::kind() const noexcept {
  static const char* names[] = {
    "state_changed", "score_updated", "persona_reply",
    "entities_extracted", "evidence_ready",
  };
  return names[payload.index()];
}

dynamic toJson(const SessionEvent& event) {
  dynamic d = dynamic::object
    ("event", event.kind())
    ("session_id", event.sessionId);

  if (auto *e = std::get_if<StateChanged>(&event.payload)) {
    d["from"] = toString(e->from);
    d["to"] = toString(e->to);
  } else if (auto *e = std::get_if<ScoreUpdated>(&event.payload)) {
    d["sequence"] = e->sequence;
    d["score"] = e->score;
    d["level"] = toString(e->level);
    d["action"] = e->action;
    d["signal"] = toJson(e->signal);
  } else if (auto *e = std::get_if<PersonaReply>(&event.payload)) {
    d["text"] = e->text;
    d["turn"] = e->turn;
    d["stage"] = e->stage;
    d["intent"] = e->intent ? dynamic(e->intent) : dynamic();
    d["delay_ms"] = e->delayMs;
  } else if (auto *e = std::get_if<EntitiesExtracted>(&event.payload)) {
    dynamic list = dynamic::array;
    for (const EntityView& entity : e->entities)
      list.push_back(toJson(entity));
    d["sequence"] = e->sequence;
    d["entities"] = std::move(list);
    dynamic dropped = dynamic::array;
    for (const GuardError& err : e->malformed)
      dropped.push_back(dynamic::object
                        ("error", err.reflect())
                        ("message", err.describe()));
    d["malformed"] = std::move(dropped);
  } else if (auto *e = std::get_if<EvidenceReady>(&event.payload)) {
    d["package_id"] = e->packageId;
  }
  return d;
}
