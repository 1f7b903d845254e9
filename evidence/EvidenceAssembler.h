#ifndef GUARD_EVIDENCE_EVIDENCE_ASSEMBLER_H
#define GUARD_EVIDENCE_EVIDENCE_ASSEMBLER_H

#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <folly/Expected.h>
#include <folly/Synchronized.h>
#include <folly/container/F14Map.h>
#include <folly/dynamic.h>
#include <folly/futures/Future.h>

#include "EvidencePackage.h"
#include "SigningKey.h"

/** Key-management collaborator. */
class KeyManager {
 public:
  struct Signature {
    std::string value;
    std::string keyId;
  };

  virtual ~KeyManager() = default;
  /** Sign the hex package hash. */
  virtual folly::SemiFuture<Signature> sign(std::string packageHash) = 0;
};

/** Signs with whatever key is currently installed in a global slot. */
class LocalKeyManager : public KeyManager {
 public:
  explicit LocalKeyManager(std::atomic<SigningKey::Data*> &global)
    : global_(global)
  {}

  folly::SemiFuture<Signature> sign(std::string packageHash) override;

 private:
  std::atomic<SigningKey::Data*> &global_;
};

/** Persistence collaborator. Every call must be idempotent. */
class EvidenceStore {
 public:
  virtual ~EvidenceStore() = default;
  virtual folly::SemiFuture<folly::Unit> save(const EvidencePackage& pkg) = 0;
  virtual folly::SemiFuture<folly::Unit>
  appendCustody(const std::string& packageId, const CustodyEntry& entry) = 0;
  virtual folly::SemiFuture<folly::Unit>
  updateStatus(const std::string& packageId, SubmissionStatus status) = 0;
};

/**
 * Process-local store. Once it holds more than its capacity, packages
 * that reached a final review status are dropped oldest first.
 */
class MemoryEvidenceStore : public EvidenceStore {
 public:
  MemoryEvidenceStore();
  explicit MemoryEvidenceStore(size_t capacity);

  folly::SemiFuture<folly::Unit> save(const EvidencePackage& pkg) override;
  folly::SemiFuture<folly::Unit>
  appendCustody(const std::string& packageId, const CustodyEntry& entry) override;
  folly::SemiFuture<folly::Unit>
  updateStatus(const std::string& packageId, SubmissionStatus status) override;

  /** Stored package document, custody and status applied. */
  folly::Optional<folly::dynamic> find(const std::string& packageId) const;
  size_t size() const;

 private:
  struct State {
    folly::F14NodeMap<std::string, folly::dynamic> packages;
    std::deque<std::string> settled;
  };

  void trim(State& state) const;

  size_t capacity_;
  folly::Synchronized<State> state_;
};

/**
 * Turns the frozen record of an ended call into a signed package and
 * hands it to the store. Collaborator calls are bounded by a timeout and
 * retried with capped jittered backoff. The calls block the calling
 * thread, so callers must not hold a session lock.
 */
class EvidenceAssembler {
 public:
  EvidenceAssembler(std::shared_ptr<KeyManager> keys,
                    std::shared_ptr<EvidenceStore> store);

  folly::Expected<EvidencePackage, GuardError> assemble(EvidenceInput input);

  /** Persist a status move already accepted by the package. */
  folly::Expected<folly::Unit, GuardError>
  recordTransition(const std::string& packageId, SubmissionStatus status,
                   const CustodyEntry& entry);

  /** GRD-<unix seconds>-<6 digit counter>, safe under concurrent use. */
  static std::string nextPackageId(int64_t now);

 private:
  std::shared_ptr<KeyManager> keys_;
  std::shared_ptr<EvidenceStore> store_;
};

/** Recompute every hash and check the signature with the given key. */
bool verifyPackage(const EvidencePackage& pkg, const SigningKey& key);

/** Document handed to reviewers: masked intelligence, integrity, custody. */
folly::dynamic exportForSubmission(const EvidencePackage& pkg);

#endif // GUARD_EVIDENCE_EVIDENCE_ASSEMBLER_H
