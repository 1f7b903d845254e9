#ifndef GUARD_SESSION_PERSONA_ORCHESTRATOR_H
#define GUARD_SESSION_PERSONA_ORCHESTRATOR_H

#include <string>
#include <vector>
#include <utility>
#include <folly/Optional.h>
#include <folly/Range.h>

#include "SessionTypes.h"
#include "EntityExtractor.h"

enum class PersonaId : uint8_t {
  CONFUSED_SENIOR = 0,
  CAUTIOUS_PROFESSIONAL,
  TRUSTING_HOMEMAKER,
};
constexpr size_t kPersonaCount = 3;

enum class CallerIntent : uint8_t {
  IDENTITY_PROBE = 0,
  FINANCIAL,
  THREAT,
  URGENCY,
  TECH,
  VERIFICATION,
  PRIZE,
  GENERAL,
};
constexpr size_t kCallerIntentCount = 8;

enum class EngagementStage : uint8_t {
  INITIAL = 0,
  BUILDING_TRUST,
  EXTRACTING,
  TERMINATING,
};

const char* toString(PersonaId persona) noexcept;
const char* toString(CallerIntent intent) noexcept;
const char* toString(EngagementStage stage) noexcept;
folly::Optional<PersonaId> parsePersonaId(folly::StringPiece s);

CallerIntent classifyIntent(folly::StringPiece utterance);
EngagementStage stageForTurns(uint32_t replies) noexcept;

struct PersonaTurn {
  std::string reply;
  CallerIntent intent;
  EngagementStage stage;
  uint32_t turn;
  uint32_t delayMs;
  Extraction extraction;
};

/**
 * Scripted stand-in that keeps a suspected caller talking.
 * Replies are chosen deterministically from the session seed and turn
 * index, and always pass admissible() before they are returned.
 */
class PersonaOrchestrator {
 public:
  using Memory = std::vector<std::pair<Speaker, std::string>>;

  PersonaOrchestrator(PersonaId persona, uint64_t seed);

  /** Opening line spoken right after the hand-off. */
  std::string greet();
  /** Extract from one caller utterance, then answer it. */
  PersonaTurn respond(folly::StringPiece utterance, uint64_t sequence);

  PersonaId persona() const noexcept { return persona_; }
  uint32_t turns() const noexcept { return turns_; }
  EngagementStage stage() const noexcept { return stageForTurns(turns_); }
  const Memory& memory() const noexcept { return memory_; }

  /**
   * False for replies that would reveal the stand-in or leak digits:
   * no claim of being automated, no run of four or more digits.
   */
  static bool admissible(folly::StringPiece reply);

 private:
  const char* choose(const std::vector<const char*>& lines) const;
  uint32_t delayMs() const;

  PersonaId persona_;
  uint64_t seed_;
  uint32_t turns_ = 0;
  Memory memory_;
};

#endif // GUARD_SESSION_PERSONA_ORCHESTRATOR_H
