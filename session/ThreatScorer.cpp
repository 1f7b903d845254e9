#include "ThreatScorer.h"

#include <algorithm>
#include <cmath>
#include <cctype>
#include <folly/portability/GFlags.h>
#include <folly/container/F14Set.h>
#include <folly/String.h>

using folly::StringPiece;

DEFINE_double(score_rise_rate, 0.75,
              "Smoothing factor applied when a fragment scores above the running score");
DEFINE_double(score_decay_rate, 0.3,
              "Smoothing factor applied when a fragment scores below the running score");
DEFINE_uint32(escalation_window, 4,
              "Fragments an authority claim stays relevant for behavioral patterns");
DEFINE_double(lexical_weight, 0.4, "Fusion weight of the keyword signal");
DEFINE_double(behavioral_weight, 0.4, "Fusion weight of the behavioral signal");
DEFINE_double(classifier_weight, 0.2, "Fusion weight of the external classifier");
DEFINE_double(sensitive_entity_boost, 0.15,
              "Added to a fragment score that carries a high-sensitivity entity");

namespace {

struct Category {
  double weight;
  std::vector<const char*> phrases;
};

const Category& category(ThreatCategory c) {
  static const Category table[kThreatCategoryCount] = {
    /* urgency */ {0.35, {
      "urgent", "urgently", "immediately", "right now", "act now", "hurry",
      "quickly", "last chance", "today only", "emergency", "within 24 hours",
      "limited time", "as soon as possible", "fast",
    }},
    /* impersonation */ {0.45, {
      "bank", "rbi", "police", "cyber crime", "cyber cell", "income tax",
      "customs", "cbi", "enforcement directorate", "officer", "inspector",
      "government", "customer care", "calling from", "head office", "trai",
    }},
    /* financial */ {0.5, {
      "transfer", "send money", "pay", "payment", "share", "processing fee",
      "deposit", "upi", "ifsc", "refund", "charges", "wallet",
    }},
    /* coercion */ {0.35, {
      "blocked", "frozen", "suspended", "arrest", "arrested", "warrant",
      "legal action", "court", "fir", "jail", "penalty", "case against",
      "disconnected", "deactivated",
    }},
    /* remote access */ {0.4, {
      "anydesk", "teamviewer", "quicksupport", "quick support", "screen share",
      "screen sharing", "remote access", "install", "download", "click the link",
      "click on the link",
    }},
    /* verification */ {0.3, {
      "kyc", "aadhaar", "pan card", "verify your identity", "verification",
      "update your details", "document verification", "re verify",
    }},
    /* prize */ {0.3, {
      "you have won", "lottery", "lucky draw", "prize", "cash prize",
      "free gift", "congratulations", "reward", "cashback",
    }},
    /* secrecy */ {0.35, {
      "dont tell anyone", "do not tell anyone", "keep it secret", "confidential",
      "dont tell your family", "do not tell your family", "dont call the bank",
      "do not contact the bank", "dont disconnect", "do not disconnect",
      "stay on the line",
    }},
    /* credential */ {0.5, {
      "otp", "one time password", "pin", "cvv", "password", "card number",
      "card details", "verification code", "code", "account number", "expiry date",
    }},
  };
  return table[static_cast<size_t>(c)];
}

/** Lowercase, drop apostrophes, fold everything else to single spaces. */
std::string normalize(StringPiece text) {
  std::string out = " ";
  out.reserve(text.size() + 2);
  for (char c : text) {
    if (c == '\'')
      continue;
    char l = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    if ((l >= 'a' && l <= 'z') || (l >= '0' && l <= '9')) {
      out += l;
    } else if (out.back() != ' ') {
      out += ' ';
    }
  }
  if (out.back() != ' ')
    out += ' ';
  return out;
}

uint32_t countPhrase(const std::string& haystack, const char* phrase) {
  std::string needle = " ";
  needle += phrase;
  needle += ' ';
  uint32_t count = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size() - 1))
    ++count;
  return count;
}

double categoryScore(uint32_t hits) {
  return std::min(1.0, 0.5 * hits);
}

} // anonymous namespace

const char* toString(ThreatCategory c) noexcept {
  static const char* names[kThreatCategoryCount] = {
    "urgency", "impersonation", "financial", "coercion", "remote_access",
    "verification", "prize", "secrecy", "credential",
  };
  return names[static_cast<size_t>(c)];
}

LexicalHits scanLexicon(StringPiece text) {
  LexicalHits lex;
  std::string norm = normalize(text);

  for (size_t c = 0; c < kThreatCategoryCount; ++c) {
    for (const char* phrase : category(static_cast<ThreatCategory>(c)).phrases)
      lex.hits[c] += countPhrase(norm, phrase);
  }

  folly::F14FastSet<StringPiece> distinct;
  std::vector<StringPiece> words;
  folly::split(' ', folly::trimWhitespace(norm), words, true);
  distinct.insert(words.begin(), words.end());
  lex.words = static_cast<uint32_t>(words.size());
  lex.distinctWords = static_cast<uint32_t>(distinct.size());
  return lex;
}

ThreatLevel levelForScore(double score) noexcept {
  if (score >= 0.85)
    return ThreatLevel::CRITICAL;
  if (score >= 0.6)
    return ThreatLevel::HIGH;
  if (score >= 0.3)
    return ThreatLevel::MEDIUM;
  if (score >= 0.1)
    return ThreatLevel::LOW;
  return ThreatLevel::SAFE;
}

const char* recommendedAction(ThreatLevel level) noexcept {
  switch (level) {
  case ThreatLevel::CRITICAL:
    return "handoff_to_ai";
  case ThreatLevel::HIGH:
    return "alert_user";
  case ThreatLevel::MEDIUM:
    return "increase_monitoring";
  case ThreatLevel::LOW:
  case ThreatLevel::SAFE:
    return "continue_monitoring";
  }
  return "continue_monitoring";
}

double ThreatScorer::behavioral(const LexicalHits& lex) const {
  bool authority = lastAuthorityTurn_ &&
                   turn_ - *lastAuthorityTurn_ <= FLAGS_escalation_window;
  double score = 0;

  if (authority && lex[ThreatCategory::CREDENTIAL])
    score = std::max(score, 1.0);
  if (authority && lex[ThreatCategory::REMOTE_ACCESS])
    score = std::max(score, 0.7);
  if (authority && lex[ThreatCategory::COERCION])
    score = std::max(score, 0.6);
  if (lex[ThreatCategory::URGENCY] &&
      (lex[ThreatCategory::FINANCIAL] || lex[ThreatCategory::CREDENTIAL]))
    score = std::max(score, 0.6);
  if (lex[ThreatCategory::SECRECY])
    score = std::max(score, 0.5);

  // Scripted callers repeat the same demand
  if (lex.words >= 10 && lex.distinctWords * 2 < lex.words)
    score = std::min(1.0, score + 0.1);
  return score;
}

ThreatScorer::Update ThreatScorer::consume(
    StringPiece text, const std::vector<ExtractedEntity>& entities,
    folly::Optional<double> classifier)
{
  LexicalHits lex = scanLexicon(text);
  ScoreSignal signal;

  ++turn_;
  if (lex[ThreatCategory::IMPERSONATION])
    lastAuthorityTurn_ = turn_;

  double lexical = 0;
  size_t categories = 0;
  for (size_t c = 0; c < kThreatCategoryCount; ++c) {
    if (!lex.hits[c])
      continue;
    lexical += category(static_cast<ThreatCategory>(c)).weight *
               categoryScore(lex.hits[c]);
    ++categories;
  }
  if (categories > 1)
    lexical += 0.1 * (categories - 1);

  signal.keywordPressure = std::min(1.0, lexical);
  signal.urgency = categoryScore(lex[ThreatCategory::URGENCY]);
  signal.impersonation = categoryScore(lex[ThreatCategory::IMPERSONATION]);
  signal.financialRequest = categoryScore(std::max(
      lex[ThreatCategory::FINANCIAL], lex[ThreatCategory::CREDENTIAL]));
  signal.behavioral = behavioral(lex);
  // A NaN or infinite verdict counts as no verdict
  if (classifier && std::isfinite(*classifier))
    signal.classifier = std::max(0.0, std::min(1.0, *classifier));

  double weights = FLAGS_lexical_weight + FLAGS_behavioral_weight;
  double fused = FLAGS_lexical_weight * signal.keywordPressure +
                 FLAGS_behavioral_weight * signal.behavioral;
  if (signal.classifier) {
    weights += FLAGS_classifier_weight;
    fused += FLAGS_classifier_weight * *signal.classifier;
  }
  fused = weights > 0 ? fused / weights : 0;

  bool sensitive = std::any_of(entities.begin(), entities.end(),
                               [](const ExtractedEntity& e) {
    return isHighSensitivity(e.type);
  });
  if (sensitive)
    signal.entityBoost = FLAGS_sensitive_entity_boost;
  signal.fused = std::min(1.0, fused + signal.entityBoost);

  double rate = signal.fused > running_ ? FLAGS_score_rise_rate
                                        : FLAGS_score_decay_rate;
  running_ += rate * (signal.fused - running_);
  running_ = std::max(0.0, std::min(1.0, running_));
  peak_ = std::max(peak_, running_);

  ThreatLevel lvl = levelForScore(running_);
  return Update{signal, running_, lvl, recommendedAction(lvl)};
}
