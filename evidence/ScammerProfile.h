#ifndef GUARD_EVIDENCE_SCAMMER_PROFILE_H
#define GUARD_EVIDENCE_SCAMMER_PROFILE_H

#include <set>
#include <string>
#include <vector>
#include <folly/Optional.h>
#include <folly/Range.h>
#include <folly/Synchronized.h>
#include <folly/container/F14Map.h>

#include "EvidencePackage.h"

/** Identifiers that link calls to the same operator. Values are normalized. */
struct IdentifierSet {
  std::set<std::string> paymentHandles;
  std::set<std::string> phoneNumbers;
  std::set<std::string> bankAccounts;
  std::set<std::string> emails;

  bool empty() const noexcept;
  size_t size() const noexcept;
  /** Index keys of the form "<entity type>:<value>". */
  std::vector<std::string> keys() const;
  void merge(const IdentifierSet& other);
};

/**
 * Normalized form used for correlation, none for types that do not
 * correlate. Phone numbers keep their last ten digits, handles and
 * emails are lowercased, account numbers keep digits only.
 */
folly::Optional<std::string> normalizeIdentifier(EntityType type,
                                                 folly::StringPiece value);

/**
 * Correlation set of a package: the calling number plus identifiers
 * spoken by the caller. Entities from the user's turns are left out.
 */
IdentifierSet correlationIdentifiers(const EvidencePackage& pkg);

/** Calls that ended as "completed" never raised a threat and are not profiled. */
bool isProfiled(const SessionRecord& session) noexcept;

struct ScammerProfile {
  std::string profileId;
  IdentifierSet identifiers;
  double peakScore = 0;
  double riskScore = 0;
  ThreatLevel riskLevel = ThreatLevel::SAFE;
  uint32_t callCount = 0;
  uint32_t reportedCount = 0;
  int64_t firstSeen = 0;
  int64_t lastSeen = 0;
  std::vector<std::string> packages;
};

/** Masked identifiers, counters and risk. */
folly::dynamic toJson(const ScammerProfile& profile);

/**
 * Correlates packages into profiles. A package sharing any identifier
 * with known profiles joins them; when it bridges several profiles they
 * are merged into the oldest one.
 */
class ProfileIndex {
 public:
  /**
   * Record one call. Returns the profile id, none for benign calls and
   * calls without identifiers.
   */
  folly::Optional<std::string> ingest(const EvidencePackage& pkg);
  /** Count a submitted report against the profile holding packageId. */
  bool markReported(const std::string& packageId);
  /** Forget profiles last seen before the cutoff; returns how many. */
  size_t expire(int64_t before);

  folly::Optional<ScammerProfile> find(EntityType type,
                                       folly::StringPiece value) const;
  folly::Optional<ScammerProfile> get(const std::string& profileId) const;
  size_t size() const;

 private:
  struct State {
    uint64_t nextId = 0;
    folly::F14NodeMap<std::string, ScammerProfile> profiles;
    folly::F14FastMap<std::string, std::string> byIdentifier;
    folly::F14FastMap<std::string, std::string> byPackage;
  };

  static void rescore(ScammerProfile& profile);

  folly::Synchronized<State> state_;
};

#endif // GUARD_EVIDENCE_SCAMMER_PROFILE_H
