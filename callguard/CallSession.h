#ifndef GUARD_CALLGUARD_CALL_SESSION_H
#define GUARD_CALLGUARD_CALL_SESSION_H

#include <memory>
#include <string>
#include <vector>
#include <folly/Expected.h>
#include <folly/Optional.h>
#include <folly/Range.h>

#include <session/GuardError.h>
#include <session/SessionTypes.h>
#include <session/ThreatScorer.h>
#include <session/PersonaOrchestrator.h>
#include <evidence/EvidencePackage.h>

struct Fragment {
  uint64_t sequence = 0;
  Speaker speaker = Speaker::CALLER;
  std::string text;
  int64_t timestamp = 0;
};

/**
 * Lifecycle of one monitored call.
 *
 * Not thread-safe: every call must happen under the owner's per-session
 * serialization boundary. Methods append the events they produce to
 * `out` in emission order and leave the state untouched on error.
 */
class CallSession {
 public:
  CallSession(std::string sessionId, std::string phoneId,
              CallDirection direction, int64_t startedAt,
              uint64_t firstSequence = 1);
  ~CallSession();

  /** Reference of the retained recording, defaults to "audio:<session id>". */
  void setAudioRef(std::string ref) { audioRef_ = std::move(ref); }

  /** Idle -> Connecting. */
  folly::Expected<folly::Unit, GuardError> open(EventList& out);

  /**
   * Score one fragment, then evaluate transitions. The sequence must
   * be exactly the next one; reordering is the caller's business.
   */
  folly::Expected<folly::Unit, GuardError>
  ingest(const Fragment& fragment, folly::Optional<double> classifier,
         EventList& out);

  /** ThreatDetected -> AiHandoff, the persona greets the caller. */
  folly::Expected<folly::Unit, GuardError> handoff(PersonaId persona, EventList& out);
  /** AiHandoff -> Monitoring, persona memory is discarded. */
  folly::Expected<folly::Unit, GuardError> terminate(EventList& out);

  /** Any state -> Ended. False when already ended. */
  bool end(folly::StringPiece reason, int64_t now, EventList& out);
  /** Frozen record for evidence assembly; only valid once ended. */
  EvidenceInput evidenceInput() const;
  void attachPackage(EvidencePackage pkg, EventList& out);
  /** Hand the package over once the session is Reported. */
  EvidencePackage releasePackage();

  /** Validate submission and build the custody entry for it. */
  folly::Expected<CustodyEntry, GuardError> prepareSubmit(int64_t now) const;
  /** Ended -> Reported once the submission is persisted. */
  void commitSubmit(CustodyEntry entry, EventList& out);

  const std::string& sessionId() const noexcept { return sessionId_; }
  const std::string& phoneId() const noexcept { return phoneId_; }
  CallState state() const noexcept { return state_; }
  uint64_t expectedSequence() const noexcept { return nextSequence_; }
  double score() const noexcept { return scorer_.score(); }
  ThreatLevel level() const noexcept { return scorer_.level(); }
  bool personaActive() const noexcept { return persona_ != nullptr; }
  const std::vector<TranscriptEntry>& transcript() const noexcept { return transcript_; }
  const std::vector<ExtractedEntity>& entities() const noexcept { return entities_; }
  const std::string& outcome() const noexcept { return outcome_; }
  int64_t endedAt() const noexcept { return endedAt_; }
  bool ended() const noexcept {
    return state_ == CallState::ENDED || state_ == CallState::REPORTED;
  }

  const EvidencePackage* package() const noexcept { return package_.get_pointer(); }
  EvidencePackage* package() noexcept { return package_.get_pointer(); }

  /** Ids, state and scores; no transcript text or entity values. */
  folly::dynamic summary() const;

 private:
  void moveTo(CallState to, EventList& out);
  void emit(EventList& out, decltype(SessionEvent::payload) payload) const;
  GuardError invalid(const char* command) const;
  void remember(std::vector<ExtractedEntity> entities);
  std::string decideOutcome() const;

  std::string sessionId_;
  std::string phoneId_;
  CallDirection direction_;
  int64_t startedAt_;
  int64_t endedAt_ = 0;
  std::string endReason_;
  std::string audioRef_;
  std::string outcome_;

  CallState state_ = CallState::IDLE;
  uint64_t nextSequence_;
  ThreatScorer scorer_;
  bool armed_ = true;
  bool threatSeen_ = false;
  bool engaged_ = false;

  std::unique_ptr<PersonaOrchestrator> persona_;
  std::string personaName_;

  std::vector<TranscriptEntry> transcript_;
  std::vector<ExtractedEntity> entities_;
  folly::Optional<EvidencePackage> package_;
};

#endif // GUARD_CALLGUARD_CALL_SESSION_H
