#include "EvidencePackage.h"

#include <array>
#include <algorithm>
#include <tuple>
#include <folly/dynamic.h>
#include <folly/json.h>
#include <folly/String.h>
#include <folly/ssl/OpenSSLHash.h>

using folly::dynamic;
using folly::StringPiece;
using folly::ssl::OpenSSLHash;

static const char* submissionStatusName[] = {
  "pending", "submitted", "under_review", "acknowledged", "resolved", "rejected",
};

const char* toString(SubmissionStatus status) noexcept {
  return submissionStatusName[static_cast<size_t>(status)];
}

folly::Optional<SubmissionStatus> parseSubmissionStatus(StringPiece s) {
  for (size_t i = 0; i < sizeof(submissionStatusName) / sizeof(char*); ++i) {
    if (s == submissionStatusName[i])
      return static_cast<SubmissionStatus>(i);
  }
  return folly::none;
}

bool isAdjacent(SubmissionStatus from, SubmissionStatus to) noexcept {
  switch (from) {
  case SubmissionStatus::PENDING:
    return to == SubmissionStatus::SUBMITTED;
  case SubmissionStatus::SUBMITTED:
    return to == SubmissionStatus::UNDER_REVIEW;
  case SubmissionStatus::UNDER_REVIEW:
    return to == SubmissionStatus::ACKNOWLEDGED ||
           to == SubmissionStatus::RESOLVED ||
           to == SubmissionStatus::REJECTED;
  case SubmissionStatus::ACKNOWLEDGED:
  case SubmissionStatus::RESOLVED:
  case SubmissionStatus::REJECTED:
    return false;
  }
  return false;
}

bool isTerminal(SubmissionStatus status) noexcept {
  return status == SubmissionStatus::ACKNOWLEDGED ||
         status == SubmissionStatus::RESOLVED ||
         status == SubmissionStatus::REJECTED;
}

dynamic toJson(const CustodyEntry& entry) {
  return dynamic::object
    ("action", entry.action)
    ("actor", entry.actor)
    ("timestamp", entry.timestamp)
    ("notes", entry.notes);
}

dynamic toJson(const SessionRecord& record) {
  return dynamic::object
    ("session_id", record.sessionId)
    ("phone_id", record.phoneId)
    ("direction", toString(record.direction))
    ("outcome", record.outcome)
    ("end_reason", record.endReason)
    ("peak_score", record.peakScore)
    ("peak_level", toString(record.peakLevel))
    ("persona", record.persona)
    ("started_at", record.startedAt)
    ("ended_at", record.endedAt);
}

std::string sha256Hex(folly::ByteRange data) {
  std::array<uint8_t, 32> digest;
  OpenSSLHash::sha256(folly::range(digest), data);
  return folly::hexlify(folly::ByteRange(folly::range(digest)));
}

std::string canonicalJson(const dynamic& value) {
  folly::json::serialization_opts opts;
  opts.sort_keys = true;
  return folly::json::serialize(value, opts);
}

static std::string hashJson(const dynamic& value) {
  std::string text = canonicalJson(value);
  return sha256Hex(folly::StringPiece(text));
}

std::string hashAudio(StringPiece audioRef) {
  return sha256Hex(audioRef);
}

std::string hashTranscript(const std::vector<TranscriptEntry>& transcript) {
  dynamic list = dynamic::array;
  for (const TranscriptEntry& entry : transcript)
    list.push_back(toJson(entry));
  return hashJson(list);
}

std::string hashEntities(const std::vector<ExtractedEntity>& entities) {
  std::vector<const ExtractedEntity*> sorted;
  for (const ExtractedEntity& e : entities)
    sorted.push_back(&e);
  std::sort(sorted.begin(), sorted.end(),
            [](const ExtractedEntity* a, const ExtractedEntity* b) {
    return std::make_tuple(a->position.sequence, a->position.offset, a->type, StringPiece(a->original)) <
           std::make_tuple(b->position.sequence, b->position.offset, b->type, StringPiece(b->original));
  });

  dynamic list = dynamic::array;
  for (const ExtractedEntity* e : sorted)
    list.push_back(toEvidenceJson(*e));
  return hashJson(list);
}

PackageHashes computeHashes(const EvidenceInput& input,
                            StringPiece packageId, int64_t createdAt)
{
  PackageHashes hashes;
  hashes.audio = hashAudio(input.audioRef);
  hashes.transcript = hashTranscript(input.transcript);
  hashes.entities = hashEntities(input.entities);
  hashes.package = hashJson(dynamic::object
    ("package_id", packageId)
    ("created_at", createdAt)
    ("session", toJson(input.session))
    ("audio_hash", hashes.audio)
    ("transcript_hash", hashes.transcript)
    ("entities_hash", hashes.entities));
  return hashes;
}

EvidencePackage::EvidencePackage(std::string packageId, int64_t createdAt,
                                 EvidenceInput input, PackageHashes hashes,
                                 std::string signature, std::string keyId)
  : packageId_(std::move(packageId))
  , createdAt_(createdAt)
  , input_(std::move(input))
  , hashes_(std::move(hashes))
  , signature_(std::move(signature))
  , keyId_(std::move(keyId))
{
  custody_.push_back(CustodyEntry{"created", "system", createdAt_,
                                  "ES256 key " + keyId_});
}

folly::Expected<CustodyEntry, GuardError>
EvidencePackage::prepareTransition(SubmissionStatus to, StringPiece actor,
                                   StringPiece notes, int64_t now) const
{
  if (!isAdjacent(status_, to)) {
    GuardError err = GUARD_INVALID_TRANSITION;
    err.putVariable(std::string("status:") + toString(to));
    err.putVariable(toString(status_));
    return folly::makeUnexpected(std::move(err));
  }
  return CustodyEntry{std::string("status:") + toString(to), actor.str(),
                      now, notes.str()};
}

void EvidencePackage::commitTransition(SubmissionStatus to, CustodyEntry entry) {
  status_ = to;
  custody_.push_back(std::move(entry));
}

dynamic EvidencePackage::toJson() const {
  dynamic transcript = dynamic::array;
  for (const TranscriptEntry& entry : input_.transcript)
    transcript.push_back(::toJson(entry));

  dynamic entities = dynamic::array;
  for (const ExtractedEntity& e : input_.entities)
    entities.push_back(toEvidenceJson(e));

  dynamic custody = dynamic::array;
  for (const CustodyEntry& entry : custody_)
    custody.push_back(::toJson(entry));

  return dynamic::object
    ("package_id", packageId_)
    ("created_at", createdAt_)
    ("session", ::toJson(input_.session))
    ("audio_ref", input_.audioRef)
    ("transcript", std::move(transcript))
    ("entities", std::move(entities))
    ("hashes", dynamic::object
      ("audio", hashes_.audio)
      ("transcript", hashes_.transcript)
      ("entities", hashes_.entities)
      ("package", hashes_.package))
    ("signature", dynamic::object
      ("alg", "ES256")
      ("key_id", keyId_)
      ("value", signature_))
    ("status", ::toString(status_))
    ("custody", std::move(custody));
}

dynamic EvidencePackage::summary() const {
  return dynamic::object
    ("package_id", packageId_)
    ("session_id", sessionId())
    ("status", ::toString(status_))
    ("package_hash", hashes_.package)
    ("transcript_entries", input_.transcript.size())
    ("entity_count", input_.entities.size())
    ("custody_entries", custody_.size());
}
