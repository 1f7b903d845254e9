#ifndef GUARD_EVIDENCE_EVIDENCE_JOURNAL_H
#define GUARD_EVIDENCE_EVIDENCE_JOURNAL_H

#include <mutex>
#include <memory>
#include <string>
#include <folly/File.h>
#include <folly/Range.h>

#include "EvidenceAssembler.h"

/**
 * Append-only evidence store writing one JSON object per line:
 *   {"op":"save","package":{...}}
 *   {"op":"custody","package_id":...,"entry":{...}}
 *   {"op":"status","package_id":...,"status":...}
 * Replaying the lines in order rebuilds every package document.
 *
 * Each line is written and synced before the returned future
 * completes; a failed write fails the future.
 */
class EvidenceJournal : public EvidenceStore {
 public:
  /** Open path for appending, throws std::system_error. */
  explicit EvidenceJournal(const std::string& path);
  /** Append to an already open file. */
  explicit EvidenceJournal(folly::File file);

  folly::SemiFuture<folly::Unit> save(const EvidencePackage& pkg) override;
  folly::SemiFuture<folly::Unit>
  appendCustody(const std::string& packageId, const CustodyEntry& entry) override;
  folly::SemiFuture<folly::Unit>
  updateStatus(const std::string& packageId, SubmissionStatus status) override;

 private:
  void append(const folly::dynamic& record);

  std::mutex lock_;
  folly::File file_;
};

/** Store selected by --evidence_journal: journal if set, memory otherwise. */
std::shared_ptr<EvidenceStore> makeEvidenceStore();

#endif // GUARD_EVIDENCE_EVIDENCE_JOURNAL_H
