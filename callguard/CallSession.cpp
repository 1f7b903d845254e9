#include "CallSession.h"

#include <glog/logging.h>
#include <folly/Conv.h>
#include <folly/dynamic.h>
#include <folly/hash/Hash.h>

#include <session/EntityExtractor.h>

using folly::dynamic;
using folly::StringPiece;

CallSession::CallSession(std::string sessionId, std::string phoneId,
                         CallDirection direction, int64_t startedAt,
                         uint64_t firstSequence)
  : sessionId_(std::move(sessionId))
  , phoneId_(std::move(phoneId))
  , direction_(direction)
  , startedAt_(startedAt)
  , nextSequence_(firstSequence)
{
}

CallSession::~CallSession() = default;

void CallSession::emit(EventList& out, decltype(SessionEvent::payload) payload) const {
  out.push_back(SessionEvent{sessionId_, std::move(payload)});
}

void CallSession::moveTo(CallState to, EventList& out) {
  VLOG(1) << "Session " << sessionId_ << ": " << toString(state_)
          << " -> " << toString(to);
  emit(out, StateChanged{state_, to});
  state_ = to;
}

GuardError CallSession::invalid(const char* command) const {
  GuardError err = GUARD_INVALID_TRANSITION;
  err.putVariable(command);
  err.putVariable(toString(state_));
  return err;
}

folly::Expected<folly::Unit, GuardError> CallSession::open(EventList& out) {
  if (state_ != CallState::IDLE)
    return folly::makeUnexpected(invalid("start"));
  moveTo(CallState::CONNECTING, out);
  return folly::unit;
}

void CallSession::remember(std::vector<ExtractedEntity> entities) {
  for (ExtractedEntity& e : entities) {
    bool seen = false;
    for (const ExtractedEntity& known : entities_) {
      if (known.type == e.type && known.original == e.original) {
        seen = true;
        break;
      }
    }
    if (!seen)
      entities_.push_back(std::move(e));
  }
}

folly::Expected<folly::Unit, GuardError>
CallSession::ingest(const Fragment& fragment, folly::Optional<double> classifier,
                    EventList& out)
{
  if (state_ == CallState::IDLE || ended())
    return folly::makeUnexpected(invalid("transcript_fragment"));

  if (fragment.sequence != nextSequence_) {
    GuardError err = GUARD_INVALID_SEQUENCE;
    err.putVariable(folly::to<std::string>(fragment.sequence));
    err.putVariable(folly::to<std::string>(nextSequence_));
    return folly::makeUnexpected(std::move(err));
  }

  // While engaged, the persona runs the extractor on the caller's turn
  Extraction extraction;
  folly::Optional<PersonaTurn> turn;
  if (persona_ && fragment.speaker == Speaker::CALLER) {
    turn = persona_->respond(fragment.text, fragment.sequence);
    extraction = std::move(turn->extraction);
  } else {
    extraction = extractEntities(fragment.text, fragment.sequence);
  }

  if (!extraction.entities.empty() || !extraction.malformed.empty()) {
    EntitiesExtracted found{fragment.sequence, {}, {}};
    for (const ExtractedEntity& e : extraction.entities)
      found.entities.push_back(e.view());
    for (const MalformedEntity& bad : extraction.malformed) {
      found.malformed.push_back(toError(bad));
      VLOG(1) << "Session " << sessionId_ << ": "
              << found.malformed.back().describe();
    }
    emit(out, std::move(found));
  }

  ThreatScorer::Update update =
    scorer_.consume(fragment.text, extraction.entities, classifier);
  emit(out, ScoreUpdated{fragment.sequence, update.score, update.level,
                         update.signal, update.action});

  transcript_.push_back(TranscriptEntry{fragment.sequence, fragment.speaker,
                                        fragment.text, update.score,
                                        fragment.timestamp});
  remember(std::move(extraction.entities));
  ++nextSequence_;

  if (state_ == CallState::CONNECTING)
    moveTo(CallState::MONITORING, out);

  if (update.level < ThreatLevel::HIGH) {
    armed_ = true;
    if (state_ == CallState::THREAT_DETECTED)
      moveTo(CallState::MONITORING, out);
  } else if (armed_ && state_ == CallState::MONITORING) {
    armed_ = false;
    threatSeen_ = true;
    LOG(INFO) << "Session " << sessionId_ << ": threat detected, score "
              << update.score << " (" << toString(update.level) << ")";
    moveTo(CallState::THREAT_DETECTED, out);
  }

  if (turn) {
    transcript_.push_back(TranscriptEntry{fragment.sequence, Speaker::PERSONA,
                                          turn->reply, update.score,
                                          fragment.timestamp});
    emit(out, PersonaReply{std::move(turn->reply), turn->turn,
                           toString(turn->stage), toString(turn->intent),
                           turn->delayMs});
  }
  return folly::unit;
}

folly::Expected<folly::Unit, GuardError>
CallSession::handoff(PersonaId persona, EventList& out) {
  if (state_ != CallState::THREAT_DETECTED)
    return folly::makeUnexpected(invalid("handoff_request"));

  persona_ = std::make_unique<PersonaOrchestrator>(
      persona, folly::hash::fnv64(sessionId_));
  personaName_ = toString(persona);
  engaged_ = true;
  moveTo(CallState::AI_HANDOFF, out);

  std::string greeting = persona_->greet();
  int64_t at = transcript_.empty() ? startedAt_ : transcript_.back().timestamp;
  transcript_.push_back(TranscriptEntry{nextSequence_ - 1, Speaker::PERSONA,
                                        greeting, scorer_.score(), at});
  emit(out, PersonaReply{std::move(greeting), 0,
                         toString(persona_->stage()), nullptr, 0});
  return folly::unit;
}

folly::Expected<folly::Unit, GuardError> CallSession::terminate(EventList& out) {
  if (state_ != CallState::AI_HANDOFF)
    return folly::makeUnexpected(invalid("handoff_terminate"));
  persona_.reset();
  moveTo(CallState::MONITORING, out);
  return folly::unit;
}

std::string CallSession::decideOutcome() const {
  if (engaged_)
    return "scam_engaged";
  if (threatSeen_)
    return "scam_suspected";
  return "completed";
}

bool CallSession::end(StringPiece reason, int64_t now, EventList& out) {
  if (ended())
    return false;
  persona_.reset();
  endedAt_ = now;
  endReason_ = reason.str();
  outcome_ = decideOutcome();
  moveTo(CallState::ENDED, out);
  return true;
}

EvidenceInput CallSession::evidenceInput() const {
  EvidenceInput input;
  SessionRecord& record = input.session;
  record.sessionId = sessionId_;
  record.phoneId = phoneId_;
  record.direction = direction_;
  record.outcome = outcome_;
  record.endReason = endReason_;
  record.peakScore = scorer_.peak();
  record.peakLevel = levelForScore(scorer_.peak());
  record.persona = personaName_;
  record.startedAt = startedAt_;
  record.endedAt = endedAt_;

  input.audioRef = audioRef_.empty() ? "audio:" + sessionId_ : audioRef_;
  input.transcript = transcript_;
  input.entities = entities_;
  return input;
}

void CallSession::attachPackage(EvidencePackage pkg, EventList& out) {
  std::string packageId = pkg.packageId();
  package_ = std::move(pkg);
  emit(out, EvidenceReady{std::move(packageId)});
}

EvidencePackage CallSession::releasePackage() {
  EvidencePackage pkg = std::move(*package_);
  package_.reset();
  return pkg;
}

folly::Expected<CustodyEntry, GuardError> CallSession::prepareSubmit(int64_t now) const {
  if (state_ == CallState::REPORTED ||
      (package_ && package_->status() != SubmissionStatus::PENDING)) {
    GuardError err = GUARD_DUPLICATE_ASSEMBLY;
    err.putVariable(sessionId_);
    return folly::makeUnexpected(std::move(err));
  }
  if (state_ != CallState::ENDED)
    return folly::makeUnexpected(invalid("submit_evidence"));
  if (!package_) {
    GuardError err = GUARD_ASSEMBLY_FAILED;
    err.putVariable("submit");
    err.putVariable("no evidence package");
    return folly::makeUnexpected(std::move(err));
  }
  return package_->prepareTransition(SubmissionStatus::SUBMITTED, "client",
                                     "submitted for adjudication", now);
}

void CallSession::commitSubmit(CustodyEntry entry, EventList& out) {
  package_->commitTransition(SubmissionStatus::SUBMITTED, std::move(entry));
  moveTo(CallState::REPORTED, out);
}

dynamic CallSession::summary() const {
  dynamic d = dynamic::object
    ("session_id", sessionId_)
    ("phone_id", phoneId_)
    ("direction", toString(direction_))
    ("state", toString(state_))
    ("score", scorer_.score())
    ("level", toString(scorer_.level()))
    ("peak_score", scorer_.peak())
    ("fragments", transcript_.size())
    ("entities", entities_.size())
    ("next_sequence", nextSequence_);
  d["persona"] = persona_ ? dynamic(personaName_) : dynamic();
  d["package_id"] = package_ ? dynamic(package_->packageId()) : dynamic();
  if (!outcome_.empty())
    d["outcome"] = outcome_;
  return d;
}
