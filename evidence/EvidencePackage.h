#ifndef GUARD_EVIDENCE_EVIDENCE_PACKAGE_H
#define GUARD_EVIDENCE_EVIDENCE_PACKAGE_H

#include <string>
#include <vector>
#include <folly/Expected.h>
#include <folly/Optional.h>
#include <folly/Range.h>

#include <session/SessionTypes.h>
#include <session/GuardError.h>

namespace folly {
  struct dynamic;
}

enum class SubmissionStatus : uint8_t {
  PENDING = 0,
  SUBMITTED,
  UNDER_REVIEW,
  ACKNOWLEDGED,
  RESOLVED,
  REJECTED,
};

const char* toString(SubmissionStatus status) noexcept;
folly::Optional<SubmissionStatus> parseSubmissionStatus(folly::StringPiece s);
/** Forward-only single step: pending, submitted, under_review, verdict. */
bool isAdjacent(SubmissionStatus from, SubmissionStatus to) noexcept;
bool isTerminal(SubmissionStatus status) noexcept;

struct CustodyEntry {
  std::string action;
  std::string actor;
  int64_t timestamp = 0;
  std::string notes;
};

folly::dynamic toJson(const CustodyEntry& entry);

/** Call metadata frozen at the terminal transition. */
struct SessionRecord {
  std::string sessionId;
  std::string phoneId;
  CallDirection direction = CallDirection::INBOUND;
  std::string outcome;
  std::string endReason;
  double peakScore = 0;
  ThreatLevel peakLevel = ThreatLevel::SAFE;
  std::string persona;
  int64_t startedAt = 0;
  int64_t endedAt = 0;
};

folly::dynamic toJson(const SessionRecord& record);

struct EvidenceInput {
  SessionRecord session;
  std::string audioRef;
  std::vector<TranscriptEntry> transcript;
  std::vector<ExtractedEntity> entities;
};

struct PackageHashes {
  std::string audio;
  std::string transcript;
  std::string entities;
  std::string package;
};

std::string sha256Hex(folly::ByteRange data);
/** Compact JSON with sorted object keys. */
std::string canonicalJson(const folly::dynamic& value);

std::string hashAudio(folly::StringPiece audioRef);
std::string hashTranscript(const std::vector<TranscriptEntry>& transcript);
/** Order-insensitive: entities are sorted before hashing. */
std::string hashEntities(const std::vector<ExtractedEntity>& entities);
PackageHashes computeHashes(const EvidenceInput& input,
                            folly::StringPiece packageId, int64_t createdAt);

/**
 * Signed evidence of one call. Contents, hashes and signature never
 * change after construction; only custody entries and the submission
 * status move forward.
 */
class EvidencePackage {
 public:
  EvidencePackage(std::string packageId, int64_t createdAt,
                  EvidenceInput input, PackageHashes hashes,
                  std::string signature, std::string keyId);

  const std::string& packageId() const noexcept { return packageId_; }
  const std::string& sessionId() const noexcept { return input_.session.sessionId; }
  int64_t createdAt() const noexcept { return createdAt_; }
  const EvidenceInput& input() const noexcept { return input_; }
  const PackageHashes& hashes() const noexcept { return hashes_; }
  const std::string& signature() const noexcept { return signature_; }
  const std::string& keyId() const noexcept { return keyId_; }
  SubmissionStatus status() const noexcept { return status_; }
  const std::vector<CustodyEntry>& custody() const noexcept { return custody_; }

  /** Validate a status move and build the custody entry it appends. */
  folly::Expected<CustodyEntry, GuardError>
  prepareTransition(SubmissionStatus to, folly::StringPiece actor,
                    folly::StringPiece notes, int64_t now) const;
  /** Apply a move accepted by prepareTransition. */
  void commitTransition(SubmissionStatus to, CustodyEntry entry);

  /** Full form including clear entity values. */
  folly::dynamic toJson() const;
  /** Ids, status, hashes and counts only. */
  folly::dynamic summary() const;

 private:
  std::string packageId_;
  int64_t createdAt_;
  EvidenceInput input_;
  PackageHashes hashes_;
  std::string signature_;
  std::string keyId_;
  SubmissionStatus status_ = SubmissionStatus::PENDING;
  std::vector<CustodyEntry> custody_;
};

#endif // GUARD_EVIDENCE_EVIDENCE_PACKAGE_H
