#include "EvidenceJournal.h"

#include <fcntl.h>
#include <glog/logging.h>
#include <folly/Exception.h>
#include <folly/FileUtil.h>
#include <folly/json.h>
#include <folly/portability/GFlags.h>

using folly::dynamic;

DEFINE_string(evidence_journal, "",
              "Append evidence packages to this JSON-lines file");

EvidenceJournal::EvidenceJournal(const std::string& path)
  : file_(path, O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0640)
{
  LOG(INFO) << "Evidence journal opened at " << path;
}

EvidenceJournal::EvidenceJournal(folly::File file)
  : file_(std::move(file))
{
}

void EvidenceJournal::append(const dynamic& record) {
  std::string line = canonicalJson(record);
  line.push_back('\n');

  std::lock_guard<std::mutex> guard(lock_);
  ssize_t written = folly::writeFull(file_.fd(), line.data(), line.size());
  if (written < 0)
    folly::throwSystemError("evidence journal write");
  if (static_cast<size_t>(written) != line.size())
    throw std::runtime_error("evidence journal short write");
  folly::checkUnixError(folly::fdatasyncNoInt(file_.fd()),
                        "evidence journal sync");
}

folly::SemiFuture<folly::Unit> EvidenceJournal::save(const EvidencePackage& pkg) {
  return folly::makeSemiFutureWith([&] {
    append(dynamic::object("op", "save")("package", pkg.toJson()));
  });
}

folly::SemiFuture<folly::Unit>
EvidenceJournal::appendCustody(const std::string& packageId,
                               const CustodyEntry& entry)
{
  return folly::makeSemiFutureWith([&] {
    append(dynamic::object
           ("op", "custody")
           ("package_id", packageId)
           ("entry", toJson(entry)));
  });
}

folly::SemiFuture<folly::Unit>
EvidenceJournal::updateStatus(const std::string& packageId,
                              SubmissionStatus status)
{
  return folly::makeSemiFutureWith([&] {
    append(dynamic::object
           ("op", "status")
           ("package_id", packageId)
           ("status", toString(status)));
  });
}

std::shared_ptr<EvidenceStore> makeEvidenceStore() {
  if (FLAGS_evidence_journal.empty()) {
    LOG(WARNING) << "No --evidence_journal given, evidence is kept in memory";
    return std::make_shared<MemoryEvidenceStore>();
  }
  return std::make_shared<EvidenceJournal>(FLAGS_evidence_journal);
}
