#ifndef GUARD_SESSION_THREAT_SCORER_H
#define GUARD_SESSION_THREAT_SCORER_H

#include <array>
#include <vector>
#include <folly/Optional.h>
#include <folly/Range.h>

#include "SessionTypes.h"

enum class ThreatCategory : uint8_t {
  URGENCY = 0,
  IMPERSONATION,
  FINANCIAL,
  COERCION,
  REMOTE_ACCESS,
  VERIFICATION,
  PRIZE,
  SECRECY,
  CREDENTIAL,
};
constexpr size_t kThreatCategoryCount = 9;

const char* toString(ThreatCategory category) noexcept;

/** Whole-word phrase hits per category in one fragment. */
struct LexicalHits {
  std::array<uint32_t, kThreatCategoryCount> hits{};
  uint32_t words = 0;
  uint32_t distinctWords = 0;

  uint32_t operator[](ThreatCategory c) const noexcept {
    return hits[static_cast<size_t>(c)];
  }
};

LexicalHits scanLexicon(folly::StringPiece text);

ThreatLevel levelForScore(double score) noexcept;
const char* recommendedAction(ThreatLevel level) noexcept;

/**
 * Running threat estimate of one call. Each fragment is fused from
 * lexical, behavioral and optional classifier signals, then folded
 * into the running score with a fast rise and a slow decay.
 */
class ThreatScorer {
 public:
  struct Update {
    ScoreSignal signal;
    double score;
    ThreatLevel level;
    const char* action;
  };

  Update consume(folly::StringPiece text,
                 const std::vector<ExtractedEntity>& entities,
                 folly::Optional<double> classifier);

  double score() const noexcept { return running_; }
  ThreatLevel level() const noexcept { return levelForScore(running_); }
  double peak() const noexcept { return peak_; }
  uint64_t fragments() const noexcept { return turn_; }

 private:
  double behavioral(const LexicalHits& lex) const;

  double running_ = 0;
  double peak_ = 0;
  uint64_t turn_ = 0;
  folly::Optional<uint64_t> lastAuthorityTurn_;
};

#endif // GUARD_SESSION_THREAT_SCORER_H
