#include "EvidenceAssembler.h"

#include <chrono>
#include <glog/logging.h>
#include <folly/Format.h>
#include <folly/Random.h>
#include <folly/executors/InlineExecutor.h>
#include <folly/futures/Retrying.h>
#include <folly/portability/GFlags.h>

using folly::dynamic;
using folly::StringPiece;

DEFINE_uint32(signing_attempts, 3, "Attempts to sign a package before giving up");
DEFINE_uint32(persistence_attempts, 5, "Attempts to persist a package before giving up");
DEFINE_uint32(retry_backoff_ms, 50, "Initial backoff between collaborator retries");
DEFINE_uint32(collaborator_timeout_ms, 2000,
              "Bound on a single signing or persistence call");
DEFINE_uint32(memory_store_capacity, 10000,
              "Packages kept by the in-memory store before settled ones are dropped");

folly::SemiFuture<KeyManager::Signature>
LocalKeyManager::sign(std::string packageHash) {
  return folly::makeSemiFutureWith([&] {
    SigningKey key(global_);
    if (!key)
      throw std::runtime_error("no signing key installed");
    return Signature{key.sign(packageHash), key.keyId()};
  });
}

MemoryEvidenceStore::MemoryEvidenceStore()
  : MemoryEvidenceStore(FLAGS_memory_store_capacity)
{
}

MemoryEvidenceStore::MemoryEvidenceStore(size_t capacity)
  : capacity_(capacity)
{
}

void MemoryEvidenceStore::trim(State& state) const {
  while (state.packages.size() > capacity_ && !state.settled.empty()) {
    state.packages.erase(state.settled.front());
    state.settled.pop_front();
  }
}

folly::SemiFuture<folly::Unit> MemoryEvidenceStore::save(const EvidencePackage& pkg) {
  auto state = state_.wlock();
  state->packages.insert_or_assign(pkg.packageId(), pkg.toJson());
  trim(*state);
  return folly::makeSemiFuture();
}

folly::SemiFuture<folly::Unit>
MemoryEvidenceStore::appendCustody(const std::string& packageId,
                                   const CustodyEntry& entry)
{
  return folly::makeSemiFutureWith([&] {
    auto state = state_.wlock();
    auto it = state->packages.find(packageId);
    if (it == state->packages.end())
      throw std::out_of_range("unknown package " + packageId);
    dynamic& custody = it->second["custody"];
    // Retried calls must not duplicate the entry
    if (custody.empty() || custody[custody.size() - 1] != toJson(entry))
      custody.push_back(toJson(entry));
  });
}

folly::SemiFuture<folly::Unit>
MemoryEvidenceStore::updateStatus(const std::string& packageId,
                                  SubmissionStatus status)
{
  return folly::makeSemiFutureWith([&] {
    auto state = state_.wlock();
    auto it = state->packages.find(packageId);
    if (it == state->packages.end())
      throw std::out_of_range("unknown package " + packageId);
    dynamic& current = it->second["status"];
    auto before = parseSubmissionStatus(current.asString());
    current = toString(status);
    if (isTerminal(status) && !(before && isTerminal(*before))) {
      state->settled.push_back(packageId);
      trim(*state);
    }
  });
}

folly::Optional<dynamic> MemoryEvidenceStore::find(const std::string& packageId) const {
  auto state = state_.rlock();
  auto it = state->packages.find(packageId);
  if (it == state->packages.end())
    return folly::none;
  return it->second;
}

size_t MemoryEvidenceStore::size() const {
  return state_.rlock()->packages.size();
}

static int64_t unixNow() {
  using namespace std::chrono;
  return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

template<class T, class Call>
static folly::Try<T> withRetry(const char* what, uint32_t attempts, Call&& call) {
  auto backoff = std::chrono::milliseconds(FLAGS_retry_backoff_ms);
  auto timeout = std::chrono::milliseconds(FLAGS_collaborator_timeout_ms);

  auto policy = folly::futures::retryingPolicyCappedJitteredExponentialBackoff(
      std::max<uint32_t>(attempts, 1), backoff, backoff * 16, 0.2,
      folly::ThreadLocalPRNG(),
      [what](size_t n, const folly::exception_wrapper& ew) {
        LOG(WARNING) << what << " attempt " << n << " failed: " << ew.what();
        return true;
      });

  auto inlineExecutor = folly::getKeepAliveToken(folly::InlineExecutor::instance());
  return folly::futures::retrying(std::move(policy), [&](size_t) {
    return call().via(inlineExecutor).within(timeout);
  }).semi().getTry();
}

static GuardError failedStep(const char* step, const folly::exception_wrapper& ew) {
  GuardError err = GUARD_ASSEMBLY_FAILED;
  err.putVariable(step);
  err.putVariable(ew.get_exception<folly::FutureTimeout>()
                  ? std::string("collaborator timed out")
                  : ew.what().toStdString());
  return err;
}

EvidenceAssembler::EvidenceAssembler(std::shared_ptr<KeyManager> keys,
                                     std::shared_ptr<EvidenceStore> store)
  : keys_(std::move(keys))
  , store_(std::move(store))
{
}

std::string EvidenceAssembler::nextPackageId(int64_t now) {
  static std::atomic<uint32_t> counter{0};
  uint32_t n = counter.fetch_add(1, std::memory_order_relaxed) % 1000000;
  return folly::sformat("GRD-{}-{:06d}", now, n);
}

folly::Expected<EvidencePackage, GuardError>
EvidenceAssembler::assemble(EvidenceInput input) {
  int64_t now = unixNow();
  std::string packageId = nextPackageId(now);
  PackageHashes hashes = computeHashes(input, packageId, now);

  auto signature = withRetry<KeyManager::Signature>(
      "sign", FLAGS_signing_attempts,
      [&] { return keys_->sign(hashes.package); });
  if (signature.hasException()) {
    LOG(ERROR) << "Signing " << packageId << " failed: "
               << signature.exception().what();
    return folly::makeUnexpected(failedStep("sign", signature.exception()));
  }

  EvidencePackage pkg(packageId, now, std::move(input), std::move(hashes),
                      signature->value, signature->keyId);

  auto saved = withRetry<folly::Unit>(
      "persist", FLAGS_persistence_attempts,
      [&] { return store_->save(pkg); });
  if (saved.hasException()) {
    LOG(ERROR) << "Persisting " << packageId << " failed: "
               << saved.exception().what();
    return folly::makeUnexpected(failedStep("persist", saved.exception()));
  }

  LOG(INFO) << "Evidence " << packageId << " assembled for session "
            << pkg.sessionId() << " (" << pkg.input().transcript.size()
            << " fragments, " << pkg.input().entities.size() << " entities)";
  return std::move(pkg);
}

folly::Expected<folly::Unit, GuardError>
EvidenceAssembler::recordTransition(const std::string& packageId,
                                    SubmissionStatus status,
                                    const CustodyEntry& entry)
{
  auto persisted = withRetry<folly::Unit>(
      "status", FLAGS_persistence_attempts, [&] {
    return store_->appendCustody(packageId, entry)
      .deferValue([this, packageId, status](folly::Unit) {
        return store_->updateStatus(packageId, status);
      });
  });

  if (persisted.hasException()) {
    LOG(ERROR) << "Recording " << toString(status) << " for " << packageId
               << " failed: " << persisted.exception().what();
    GuardError err = GUARD_EXTERNAL_TIMEOUT;
    err.putVariable("evidence store");
    return folly::makeUnexpected(std::move(err));
  }
  return folly::unit;
}

bool verifyPackage(const EvidencePackage& pkg, const SigningKey& key) {
  PackageHashes fresh = computeHashes(pkg.input(), pkg.packageId(), pkg.createdAt());
  const PackageHashes& sealed = pkg.hashes();

  if (fresh.audio != sealed.audio || fresh.transcript != sealed.transcript ||
      fresh.entities != sealed.entities || fresh.package != sealed.package)
    return false;
  if (!key || key.keyId() != pkg.keyId())
    return false;
  return key.verify(sealed.package, pkg.signature());
}

dynamic exportForSubmission(const EvidencePackage& pkg) {
  const SessionRecord& session = pkg.input().session;

  dynamic intelligence = dynamic::array;
  for (const ExtractedEntity& e : pkg.input().entities)
    intelligence.push_back(toJson(e.view()));

  dynamic custody = dynamic::array;
  for (const CustodyEntry& entry : pkg.custody())
    custody.push_back(toJson(entry));

  return dynamic::object
    ("case_reference", pkg.packageId())
    ("session_id", session.sessionId)
    ("reported_number", session.phoneId)
    ("direction", toString(session.direction))
    ("call_window", dynamic::object
      ("started_at", session.startedAt)
      ("ended_at", session.endedAt))
    ("threat_assessment", dynamic::object
      ("peak_score", session.peakScore)
      ("peak_level", toString(session.peakLevel))
      ("outcome", session.outcome)
      ("persona", session.persona))
    ("intelligence", std::move(intelligence))
    ("transcript_entries", pkg.input().transcript.size())
    ("integrity", dynamic::object
      ("audio_hash", pkg.hashes().audio)
      ("transcript_hash", pkg.hashes().transcript)
      ("entities_hash", pkg.hashes().entities)
      ("package_hash", pkg.hashes().package)
      ("signature", pkg.signature())
      ("algorithm", "ES256")
      ("key_id", pkg.keyId()))
    ("status", toString(pkg.status()))
    ("custody", std::move(custody));
}
