#include <evidence/EvidenceAssembler.h>
#include <evidence/EvidenceJournal.h>
#include <session/EntityExtractor.h>

#include <thread>
#include <set>
#include <folly/portability/GTest.h>
#include <folly/portability/GMock.h>
#include <folly/portability/GFlags.h>
#include <folly/json.h>
#include <folly/File.h>
#include <folly/FileUtil.h>
#include <folly/String.h>
#include <folly/portability/Fcntl.h>
#include <folly/portability/Unistd.h>

using namespace testing;
using folly::dynamic;

DECLARE_uint32(signing_attempts);
DECLARE_uint32(persistence_attempts);
DECLARE_uint32(retry_backoff_ms);
DECLARE_uint32(collaborator_timeout_ms);

static EvidenceInput sampleInput() {
  EvidenceInput input;
  input.session.sessionId = "call-7";
  input.session.phoneId = "+919876543210";
  input.session.outcome = "scam_engaged";
  input.session.peakScore = 0.9;
  input.session.peakLevel = ThreatLevel::CRITICAL;
  input.session.startedAt = 1700000000;
  input.session.endedAt = 1700000300;
  input.audioRef = "s3://calls/call-7.opus";

  const char* text = "read me the otp 482913 now";
  input.transcript.push_back(TranscriptEntry{1, Speaker::CALLER, text, 0.9, 1700000010});
  input.entities = extractEntities(text, 1).entities;
  return input;
}

class EvidenceAssemblerTest : public Test {
 protected:
  void SetUp() override {
    FLAGS_retry_backoff_ms = 1;
    SigningKey::commit(SigningKey::generate(), key_);
  }

  void TearDown() override {
    SigningKey::commit(nullptr, key_);
  }

  std::shared_ptr<KeyManager> keys() {
    return std::make_shared<LocalKeyManager>(key_);
  }

  gflags::FlagSaver flags_;
  std::atomic<SigningKey::Data*> key_{nullptr};
};

/** Fails the first `failures` saves, then behaves. */
class FlakyStore : public MemoryEvidenceStore {
 public:
  explicit FlakyStore(int failures) : failures_(failures) {}

  folly::SemiFuture<folly::Unit> save(const EvidencePackage& pkg) override {
    if (++attempts <= failures_)
      return folly::makeSemiFuture<folly::Unit>(std::runtime_error("disk busy"));
    return MemoryEvidenceStore::save(pkg);
  }

  int attempts = 0;

 private:
  int failures_;
};

/** Never answers. */
class HangingStore : public MemoryEvidenceStore {
 public:
  folly::SemiFuture<folly::Unit> save(const EvidencePackage&) override {
    pending_.emplace_back();
    return pending_.back().getSemiFuture();
  }

 private:
  std::vector<folly::Promise<folly::Unit>> pending_;
};

TEST_F(EvidenceAssemblerTest, SignsAndVerifies) {
  auto store = std::make_shared<MemoryEvidenceStore>();
  EvidenceAssembler assembler(keys(), store);

  auto pkg = assembler.assemble(sampleInput());
  ASSERT_TRUE(pkg.hasValue()) << pkg.error().describe();
  EXPECT_THAT(pkg->packageId(), StartsWith("GRD-"));
  EXPECT_EQ(pkg->status(), SubmissionStatus::PENDING);
  ASSERT_THAT(pkg->custody(), SizeIs(1));
  EXPECT_EQ(pkg->custody()[0].actor, "system");

  SigningKey key(key_);
  EXPECT_EQ(pkg->keyId(), key.keyId());
  EXPECT_THAT(pkg->keyId(), SizeIs(16));
  EXPECT_TRUE(verifyPackage(*pkg, key));

  auto stored = store->find(pkg->packageId());
  ASSERT_TRUE(stored.hasValue());
  EXPECT_EQ((*stored)["hashes"]["package"].asString(), pkg->hashes().package);
}

TEST_F(EvidenceAssemblerTest, DetectsTampering) {
  EvidenceAssembler assembler(keys(), std::make_shared<MemoryEvidenceStore>());
  auto pkg = assembler.assemble(sampleInput()).value();
  SigningKey key(key_);

  EvidenceInput forged = pkg.input();
  forged.transcript[0].text = "read me the otp 000000 now";
  EvidencePackage copy(pkg.packageId(), pkg.createdAt(), forged, pkg.hashes(),
                       pkg.signature(), pkg.keyId());
  EXPECT_FALSE(verifyPackage(copy, key));

  // rehashed forgery still fails on the signature
  EvidencePackage rehashed(pkg.packageId(), pkg.createdAt(), forged,
                           computeHashes(forged, pkg.packageId(), pkg.createdAt()),
                           pkg.signature(), pkg.keyId());
  EXPECT_FALSE(verifyPackage(rehashed, key));

  SigningKey other(SigningKey::generate());
  EXPECT_FALSE(verifyPackage(pkg, other));
}

TEST_F(EvidenceAssemblerTest, RawSignatures) {
  SigningKey key(key_);
  std::string sig = key.sign("package-hash");
  EXPECT_TRUE(key.verify("package-hash", sig));
  EXPECT_FALSE(key.verify("package-hash2", sig));

  std::string flipped = sig;
  flipped[0] = flipped[0] == 'A' ? 'B' : 'A';
  EXPECT_FALSE(key.verify("package-hash", flipped));
  EXPECT_FALSE(key.verify("package-hash", sig.substr(0, sig.size() - 4)));
  EXPECT_FALSE(key.verify("package-hash", ""));
}

TEST_F(EvidenceAssemblerTest, RetriesTransientStoreFailures) {
  FLAGS_persistence_attempts = 5;
  auto store = std::make_shared<FlakyStore>(2);
  EvidenceAssembler assembler(keys(), store);

  auto pkg = assembler.assemble(sampleInput());
  ASSERT_TRUE(pkg.hasValue()) << pkg.error().describe();
  EXPECT_EQ(store->attempts, 3);
  EXPECT_EQ(store->size(), 1);
}

TEST_F(EvidenceAssemblerTest, GivesUpAfterBoundedAttempts) {
  FLAGS_persistence_attempts = 3;
  auto store = std::make_shared<FlakyStore>(100);
  EvidenceAssembler assembler(keys(), store);

  auto pkg = assembler.assemble(sampleInput());
  ASSERT_FALSE(pkg.hasValue());
  EXPECT_TRUE(pkg.error().is(GUARD_ASSEMBLY_FAILED));
  EXPECT_EQ(store->attempts, 3);
  EXPECT_EQ(store->size(), 0);
}

TEST_F(EvidenceAssemblerTest, HangingStoreTimesOut) {
  FLAGS_persistence_attempts = 2;
  FLAGS_collaborator_timeout_ms = 20;
  EvidenceAssembler assembler(keys(), std::make_shared<HangingStore>());

  auto pkg = assembler.assemble(sampleInput());
  ASSERT_FALSE(pkg.hasValue());
  EXPECT_TRUE(pkg.error().is(GUARD_ASSEMBLY_FAILED));
  EXPECT_THAT(pkg.error().describe(), HasSubstr("persist"));
}

TEST_F(EvidenceAssemblerTest, MissingKeyFailsSigning) {
  FLAGS_signing_attempts = 2;
  SigningKey::commit(nullptr, key_);
  EvidenceAssembler assembler(keys(), std::make_shared<MemoryEvidenceStore>());

  auto pkg = assembler.assemble(sampleInput());
  ASSERT_FALSE(pkg.hasValue());
  EXPECT_TRUE(pkg.error().is(GUARD_ASSEMBLY_FAILED));
  EXPECT_THAT(pkg.error().describe(), HasSubstr("sign"));
}

TEST_F(EvidenceAssemblerTest, RecordsTransitions) {
  auto store = std::make_shared<MemoryEvidenceStore>();
  EvidenceAssembler assembler(keys(), store);
  auto pkg = assembler.assemble(sampleInput()).value();

  auto entry = pkg.prepareTransition(SubmissionStatus::SUBMITTED, "client", "", 1700000400);
  ASSERT_TRUE(entry.hasValue());
  ASSERT_TRUE(assembler.recordTransition(pkg.packageId(), SubmissionStatus::SUBMITTED,
                                         *entry).hasValue());

  dynamic stored = store->find(pkg.packageId()).value();
  EXPECT_EQ(stored["status"].asString(), "submitted");
  ASSERT_EQ(stored["custody"].size(), 2);
  EXPECT_EQ(stored["custody"][1]["action"].asString(), "status:submitted");

  FLAGS_persistence_attempts = 1;
  auto missing = assembler.recordTransition("GRD-0-000000", SubmissionStatus::SUBMITTED,
                                            *entry);
  ASSERT_FALSE(missing.hasValue());
  EXPECT_TRUE(missing.error().is(GUARD_EXTERNAL_TIMEOUT));
}

TEST_F(EvidenceAssemblerTest, ExportCarriesMaskedValuesOnly) {
  EvidenceAssembler assembler(keys(), std::make_shared<MemoryEvidenceStore>());
  auto pkg = assembler.assemble(sampleInput()).value();

  dynamic doc = exportForSubmission(pkg);
  std::string text = folly::toJson(doc);
  EXPECT_THAT(text, Not(HasSubstr("482913")));
  EXPECT_EQ(doc["case_reference"].asString(), pkg.packageId());
  EXPECT_EQ(doc["reported_number"].asString(), "+919876543210");
  ASSERT_EQ(doc["intelligence"].size(), 1);
  EXPECT_EQ(doc["intelligence"][0]["type"].asString(), "one-time-code");
  EXPECT_EQ(doc["intelligence"][0]["value"].asString(), "XXXX13");
  EXPECT_EQ(doc["integrity"]["algorithm"].asString(), "ES256");
  EXPECT_EQ(doc["integrity"]["package_hash"].asString(), pkg.hashes().package);
  EXPECT_EQ(doc["custody"].size(), 1);
}

TEST(EvidenceAssembler, PackageIdsAreUnique) {
  std::vector<std::vector<std::string>> ids(4);
  std::vector<std::thread> workers;
  for (auto& out : ids) {
    workers.emplace_back([&out] {
      for (int i = 0; i < 1000; ++i)
        out.push_back(EvidenceAssembler::nextPackageId(1700000000));
    });
  }
  for (auto& t : workers)
    t.join();

  std::set<std::string> seen;
  for (auto& out : ids)
    seen.insert(out.begin(), out.end());
  EXPECT_EQ(seen.size(), 4000);
  EXPECT_THAT(*seen.begin(), MatchesRegex("GRD-1700000000-[0-9]{6}"));
}

static std::string journalPath(const char* name) {
  std::string path = testing::TempDir() + name;
  ::unlink(path.c_str());
  return path;
}

static std::vector<std::string> journalLines(const std::string& path) {
  std::string text;
  EXPECT_TRUE(folly::readFile(path.c_str(), text));
  std::vector<std::string> lines;
  folly::split('\n', text, lines, true);
  return lines;
}

TEST_F(EvidenceAssemblerTest, JournalLines) {
  std::string path = journalPath("evidence-lines.jsonl");
  auto journal = std::make_shared<EvidenceJournal>(path);
  EvidenceAssembler assembler(keys(), journal);

  auto pkg = assembler.assemble(sampleInput()).value();
  auto entry = pkg.prepareTransition(SubmissionStatus::SUBMITTED, "client", "", 1);
  ASSERT_TRUE(assembler.recordTransition(pkg.packageId(), SubmissionStatus::SUBMITTED,
                                         *entry).hasValue());

  // synced before the calls return
  std::vector<std::string> lines = journalLines(path);
  ASSERT_THAT(lines, SizeIs(3));

  dynamic save = folly::parseJson(lines[0]);
  EXPECT_EQ(save["op"].asString(), "save");
  EXPECT_EQ(save["package"]["package_id"].asString(), pkg.packageId());
  EXPECT_EQ(folly::parseJson(lines[1])["op"].asString(), "custody");
  dynamic status = folly::parseJson(lines[2]);
  EXPECT_EQ(status["op"].asString(), "status");
  EXPECT_EQ(status["status"].asString(), "submitted");
}

TEST_F(EvidenceAssemblerTest, UnwritableJournalFailsAssembly) {
  FLAGS_persistence_attempts = 2;
  std::string path = journalPath("evidence-readonly.jsonl");
  ASSERT_TRUE(folly::writeFile(std::string(), path.c_str()));
  auto journal = std::make_shared<EvidenceJournal>(folly::File(path, O_RDONLY));
  EvidenceAssembler assembler(keys(), journal);

  auto pkg = assembler.assemble(sampleInput());
  ASSERT_FALSE(pkg.hasValue());
  EXPECT_TRUE(pkg.error().is(GUARD_ASSEMBLY_FAILED));
  EXPECT_THAT(pkg.error().describe(), HasSubstr("persist"));
  EXPECT_THAT(journalLines(path), IsEmpty());
}

TEST(MemoryEvidenceStore, DropsSettledPackagesOverCapacity) {
  auto input = sampleInput();
  auto make = [&](const char* id) {
    PackageHashes hashes = computeHashes(input, id, 1);
    return EvidencePackage(id, 1, input, std::move(hashes), "sig", "key");
  };

  MemoryEvidenceStore store(2);
  store.save(make("GRD-1-000001")).get();
  store.save(make("GRD-1-000002")).get();
  store.updateStatus("GRD-1-000001", SubmissionStatus::RESOLVED).get();
  EXPECT_EQ(store.size(), 2);

  // unsettled packages are never dropped
  store.save(make("GRD-1-000003")).get();
  EXPECT_EQ(store.size(), 2);
  EXPECT_FALSE(store.find("GRD-1-000001").hasValue());
  store.save(make("GRD-1-000004")).get();
  EXPECT_EQ(store.size(), 3);
  EXPECT_TRUE(store.find("GRD-1-000002").hasValue());
}
