#include <callguard/SessionManager.h>

#include <limits>
#include <thread>
#include <set>
#include <folly/portability/GTest.h>
#include <folly/portability/GMock.h>
#include <folly/portability/GFlags.h>
#include <folly/Synchronized.h>
#include <folly/synchronization/Baton.h>

using namespace testing;
using folly::dynamic;

DECLARE_uint32(classifier_timeout_ms);
DECLARE_uint32(retry_backoff_ms);
DECLARE_uint32(archive_retention_s);

/** Records every published event. */
class RecordingSink : public EventSink {
 public:
  void onEvent(const SessionEvent& event) override {
    events_.wlock()->push_back(event);
  }

  std::vector<std::string> kinds(const std::string& sessionId) const {
    std::vector<std::string> out;
    for (const SessionEvent& e : *events_.rlock()) {
      if (e.sessionId == sessionId)
        out.push_back(e.kind());
    }
    return out;
  }

 private:
  folly::Synchronized<EventList> events_;
};

/** Answers only after the test releases it, or never. */
class GatedClassifier : public Classifier {
 public:
  folly::SemiFuture<double> classify(std::string, std::string) override {
    auto pending = promises_.wlock();
    pending->emplace_back();
    auto answer = pending->back().getSemiFuture();
    called.post();
    return answer;
  }

  folly::Baton<> called;

 private:
  folly::Synchronized<std::vector<folly::Promise<double>>> promises_;
};

class FixedClassifier : public Classifier {
 public:
  explicit FixedClassifier(double verdict) : verdict_(verdict) {}
  folly::SemiFuture<double> classify(std::string, std::string) override {
    return folly::makeSemiFuture(verdict_);
  }

 private:
  double verdict_;
};

class SessionManagerTest : public Test {
 protected:
  void SetUp() override {
    FLAGS_retry_backoff_ms = 1;
    SigningKey::commit(SigningKey::generate(), key_);
    store_ = std::make_shared<MemoryEvidenceStore>();
    sink_ = std::make_shared<RecordingSink>();
    manager_ = make(nullptr);
  }

  void TearDown() override {
    manager_.reset();
    SigningKey::commit(nullptr, key_);
  }

  std::unique_ptr<SessionManager> make(std::shared_ptr<Classifier> classifier) {
    auto assembler = std::make_shared<EvidenceAssembler>(
        std::make_shared<LocalKeyManager>(key_), store_);
    return std::make_unique<SessionManager>(assembler, std::move(classifier), sink_);
  }

  SessionManager::Result start(const std::string& id,
                               const char* phone = "+919876543210") {
    return manager_->handle(StartRequest{id, phone, CallDirection::INBOUND, 1, ""});
  }

  SessionManager::Result say(const std::string& id, uint64_t seq, const char* text,
                             Speaker speaker = Speaker::CALLER) {
    return manager_->handle(FragmentRequest{id, speaker, text, seq, 1700000000});
  }

  /** Two caller turns that raise a threat, ready for sequence 3. */
  void escalate(const std::string& id) {
    ASSERT_TRUE(say(id, 1, "this is the bank, your account is blocked").hasValue());
    auto threat = say(id, 2, "please share the OTP sent to your phone");
    ASSERT_TRUE(threat.hasValue());
    ASSERT_EQ(threat->result["state"].asString(), "threat_detected");
  }

  SessionManager::Result end(const std::string& id) {
    return manager_->handle(EndCallRequest{id, "hangup"});
  }

  gflags::FlagSaver flags_;
  std::atomic<SigningKey::Data*> key_{nullptr};
  std::shared_ptr<MemoryEvidenceStore> store_;
  std::shared_ptr<RecordingSink> sink_;
  std::unique_ptr<SessionManager> manager_;
};

TEST_F(SessionManagerTest, SafeCallYieldsOnePendingPackage) {
  ASSERT_TRUE(start("s1").hasValue());
  ASSERT_TRUE(say("s1", 1, "hi mom, just calling to say I reached home").hasValue());
  ASSERT_TRUE(say("s1", 2, "dinner at eight is fine").hasValue());

  auto ended = end("s1");
  ASSERT_TRUE(ended.hasValue()) << ended.error().describe();
  EXPECT_EQ(ended->result["state"].asString(), "ended");
  EXPECT_EQ(ended->result["outcome"].asString(), "completed");
  std::string packageId = ended->result["package_id"].asString();
  EXPECT_THAT(packageId, StartsWith("GRD-"));

  dynamic stored = store_->find(packageId).value();
  EXPECT_EQ(stored["status"].asString(), "pending");
  EXPECT_EQ(stored["custody"].size(), 1);
  EXPECT_EQ(store_->size(), 1);

  auto submitted = manager_->handle(SubmitRequest{"s1"});
  ASSERT_TRUE(submitted.hasValue()) << submitted.error().describe();
  EXPECT_EQ(submitted->result["status"].asString(), "submitted");

  auto again = manager_->handle(SubmitRequest{"s1"});
  ASSERT_FALSE(again.hasValue());
  EXPECT_TRUE(again.error().is(GUARD_DUPLICATE_ASSEMBLY));
  EXPECT_EQ(store_->find(packageId).value()["custody"].size(), 2);

  SessionManager::Stats stats = manager_->stats();
  EXPECT_EQ(stats.started, 1);
  EXPECT_EQ(stats.fragments, 2);
  EXPECT_EQ(stats.packages, 1);
  EXPECT_EQ(stats.live, 0);
  EXPECT_EQ(stats.archived, 1);
  // nothing suspicious, nothing profiled
  EXPECT_EQ(manager_->profiles().size(), 0);
}

TEST_F(SessionManagerTest, SessionIdsAreUnique) {
  ASSERT_TRUE(start("s1").hasValue());
  auto dup = start("s1");
  ASSERT_FALSE(dup.hasValue());
  EXPECT_TRUE(dup.error().is(GUARD_DUPLICATE_SESSION));

  auto unknown = say("nobody", 1, "hello");
  ASSERT_FALSE(unknown.hasValue());
  EXPECT_TRUE(unknown.error().is(GUARD_UNKNOWN_SESSION));
  EXPECT_EQ(unknown.error().http_status(), 404);

  ASSERT_TRUE(end("s1").hasValue());
  ASSERT_TRUE(manager_->handle(SubmitRequest{"s1"}).hasValue());
  // archived ids stay taken
  EXPECT_FALSE(start("s1").hasValue());
  EXPECT_EQ(manager_->stats().rejected, 3);
}

TEST_F(SessionManagerTest, ReordersWithinWindow) {
  ASSERT_TRUE(start("s1").hasValue());

  auto third = say("s1", 3, "your account is blocked");
  ASSERT_TRUE(third.hasValue());
  EXPECT_TRUE(third->result["buffered"].asBool());
  EXPECT_EQ(third->result["expected"].asInt(), 1);
  EXPECT_THAT(third->events, IsEmpty());

  ASSERT_TRUE(say("s1", 2, "this is the bank").hasValue());
  auto dup = say("s1", 3, "your account is blocked");
  ASSERT_FALSE(dup.hasValue());
  EXPECT_TRUE(dup.error().is(GUARD_INVALID_SEQUENCE));

  auto far = say("s1", 20, "too far ahead");
  ASSERT_FALSE(far.hasValue());
  EXPECT_TRUE(far.error().is(GUARD_INVALID_SEQUENCE));

  auto first = say("s1", 1, "hello");
  ASSERT_TRUE(first.hasValue());
  EXPECT_EQ(first->result["next_sequence"].asInt(), 4);
  EXPECT_EQ(first->result["buffered"].asInt(), 0);

  std::vector<uint64_t> order;
  for (const SessionEvent& e : first->events) {
    if (auto *update = std::get_if<ScoreUpdated>(&e.payload))
      order.push_back(update->sequence);
  }
  EXPECT_THAT(order, ElementsAre(1, 2, 3));

  auto stale = say("s1", 2, "this is the bank");
  ASSERT_FALSE(stale.hasValue());
  EXPECT_TRUE(stale.error().is(GUARD_INVALID_SEQUENCE));
  EXPECT_EQ(manager_->stats().buffered, 2);
}

TEST_F(SessionManagerTest, EndDropsBufferedFragments) {
  ASSERT_TRUE(start("s1").hasValue());
  ASSERT_TRUE(say("s1", 1, "hello").hasValue());
  ASSERT_TRUE(say("s1", 3, "the otp is 482913").hasValue());

  auto ended = end("s1");
  ASSERT_TRUE(ended.hasValue());
  EXPECT_EQ(ended->result["fragments"].asInt(), 1);
  EXPECT_EQ(ended->result["entities"].asInt(), 0);

  auto late = say("s1", 2, "anyone there?");
  ASSERT_FALSE(late.hasValue());
  EXPECT_TRUE(late.error().is(GUARD_INVALID_TRANSITION));

  auto twice = end("s1");
  ASSERT_TRUE(twice.hasValue());
  EXPECT_TRUE(twice->result["duplicate"].asBool());
  EXPECT_THAT(twice->events, IsEmpty());
}

TEST_F(SessionManagerTest, ScamCallEngagesPersona) {
  ASSERT_TRUE(start("s1").hasValue());
  ASSERT_TRUE(say("s1", 1, "this is the bank, your account is blocked").hasValue());
  auto threat = say("s1", 2, "please share the OTP sent to your phone");
  ASSERT_TRUE(threat.hasValue());
  EXPECT_EQ(threat->result["state"].asString(), "threat_detected");

  auto handoff = manager_->handle(HandoffRequest{"s1", "confused_senior",
                                                 PersonaId::CONFUSED_SENIOR});
  ASSERT_TRUE(handoff.hasValue());
  EXPECT_EQ(handoff->result["state"].asString(), "ai_handoff");
  EXPECT_EQ(handoff->result["persona"].asString(), "confused_senior");

  auto turn = say("s1", 3, "the otp is 482913");
  ASSERT_TRUE(turn.hasValue());
  std::vector<std::string> kinds;
  for (const SessionEvent& e : turn->events)
    kinds.push_back(e.kind());
  EXPECT_THAT(kinds, Contains("persona_reply"));
  EXPECT_THAT(kinds, Contains("entities_extracted"));

  auto again = manager_->handle(HandoffRequest{"s1", "confused_senior",
                                               PersonaId::CONFUSED_SENIOR});
  ASSERT_FALSE(again.hasValue());
  EXPECT_TRUE(again.error().is(GUARD_INVALID_TRANSITION));

  auto ended = end("s1");
  ASSERT_TRUE(ended.hasValue());
  EXPECT_EQ(ended->result["outcome"].asString(), "scam_engaged");

  SessionManager::Stats stats = manager_->stats();
  EXPECT_EQ(stats.threats, 1);
  EXPECT_EQ(stats.handoffs, 1);
}

TEST_F(SessionManagerTest, SinkSeesEventsInCommandOrder) {
  ASSERT_TRUE(start("s1").hasValue());
  ASSERT_TRUE(say("s1", 1, "hello").hasValue());
  ASSERT_TRUE(end("s1").hasValue());
  ASSERT_TRUE(manager_->handle(SubmitRequest{"s1"}).hasValue());

  EXPECT_THAT(sink_->kinds("s1"),
              ElementsAre("state_changed", "score_updated", "state_changed",
                          "state_changed", "evidence_ready", "state_changed"));
}

TEST_F(SessionManagerTest, ReviewMovesForwardOnly) {
  ASSERT_TRUE(start("s1").hasValue());
  auto ended = end("s1");
  ASSERT_TRUE(ended.hasValue());
  std::string packageId = ended->result["package_id"].asString();

  auto early = manager_->handle(ReviewRequest{packageId, SubmissionStatus::UNDER_REVIEW, ""});
  ASSERT_FALSE(early.hasValue());
  EXPECT_TRUE(early.error().is(GUARD_INVALID_TRANSITION));

  ASSERT_TRUE(manager_->handle(SubmitRequest{"s1"}).hasValue());

  auto self = manager_->handle(ReviewRequest{packageId, SubmissionStatus::SUBMITTED, ""});
  ASSERT_FALSE(self.hasValue());
  EXPECT_TRUE(self.error().is(GUARD_INVALID_TRANSITION));

  auto review = manager_->handle(ReviewRequest{packageId, SubmissionStatus::UNDER_REVIEW,
                                               "assigned"});
  ASSERT_TRUE(review.hasValue()) << review.error().describe();
  EXPECT_EQ(review->result["status"].asString(), "under_review");

  auto verdict = manager_->handle(ReviewRequest{packageId, SubmissionStatus::ACKNOWLEDGED,
                                                "confirmed fraud"});
  ASSERT_TRUE(verdict.hasValue());

  auto after = manager_->handle(ReviewRequest{packageId, SubmissionStatus::RESOLVED, ""});
  ASSERT_FALSE(after.hasValue());
  EXPECT_TRUE(after.error().is(GUARD_INVALID_TRANSITION));

  // a settled package keeps only its final status
  SessionManager::Stats stats = manager_->stats();
  EXPECT_EQ(stats.archived, 0);
  EXPECT_EQ(stats.settled, 1);
  EXPECT_EQ(stats.live, 0);

  dynamic stored = store_->find(packageId).value();
  EXPECT_EQ(stored["status"].asString(), "acknowledged");
  ASSERT_EQ(stored["custody"].size(), 4);
  EXPECT_EQ(stored["custody"][3]["actor"].asString(), "reviewer");
  EXPECT_EQ(stored["custody"][3]["notes"].asString(), "confirmed fraud");

  auto unknown = manager_->handle(ReviewRequest{"GRD-0-000000",
                                                SubmissionStatus::UNDER_REVIEW, ""});
  ASSERT_FALSE(unknown.hasValue());
  EXPECT_TRUE(unknown.error().is(GUARD_UNKNOWN_PACKAGE));
}

TEST_F(SessionManagerTest, MissingKeyFailsAssemblyUntilRetried) {
  SigningKey::commit(nullptr, key_);
  ASSERT_TRUE(start("s1").hasValue());
  auto ended = end("s1");
  ASSERT_FALSE(ended.hasValue());
  EXPECT_TRUE(ended.error().is(GUARD_ASSEMBLY_FAILED));
  EXPECT_EQ(manager_->stats().assemblyFailures, 1);

  SigningKey::commit(SigningKey::generate(), key_);
  auto submitted = manager_->handle(SubmitRequest{"s1"});
  ASSERT_TRUE(submitted.hasValue()) << submitted.error().describe();
  EXPECT_EQ(submitted->result["status"].asString(), "submitted");
  EXPECT_EQ(store_->size(), 1);
}

TEST_F(SessionManagerTest, ClassifierVerdictIsFused) {
  manager_ = make(std::make_shared<FixedClassifier>(1.0));
  ASSERT_TRUE(start("s1").hasValue());
  auto up = say("s1", 1, "hello");
  ASSERT_TRUE(up.hasValue());
  auto *update = std::get_if<ScoreUpdated>(&up->events[0].payload);
  ASSERT_NE(update, nullptr);
  ASSERT_TRUE(update->signal.classifier.hasValue());
  EXPECT_DOUBLE_EQ(*update->signal.classifier, 1.0);
  EXPECT_GT(update->score, 0);
}

TEST_F(SessionManagerTest, SlowClassifierTimesOut) {
  FLAGS_classifier_timeout_ms = 20;
  manager_ = make(std::make_shared<GatedClassifier>());
  ASSERT_TRUE(start("s1").hasValue());

  auto up = say("s1", 1, "hello");
  ASSERT_TRUE(up.hasValue());
  auto *update = std::get_if<ScoreUpdated>(&up->events[0].payload);
  ASSERT_NE(update, nullptr);
  EXPECT_FALSE(update->signal.classifier.hasValue());
  EXPECT_EQ(manager_->stats().classifierMisses, 1);
}

TEST_F(SessionManagerTest, EndCancelsClassifierInFlight) {
  FLAGS_classifier_timeout_ms = 60000;
  auto classifier = std::make_shared<GatedClassifier>();
  manager_ = make(classifier);
  ASSERT_TRUE(start("s1").hasValue());

  SessionManager::Result inflight;
  std::thread speaker([&] { inflight = say("s1", 1, "hello"); });
  classifier->called.wait();

  auto ended = end("s1");
  speaker.join();

  ASSERT_TRUE(ended.hasValue()) << ended.error().describe();
  // the fragment in flight is applied, just without a verdict
  EXPECT_EQ(ended->result["fragments"].asInt(), 1);
  ASSERT_TRUE(inflight.hasValue());
  EXPECT_EQ(manager_->stats().classifierMisses, 1);
  EXPECT_THAT(sink_->kinds("s1"),
              ElementsAre("state_changed", "score_updated", "state_changed",
                          "state_changed", "evidence_ready"));
}

TEST_F(SessionManagerTest, ParallelSessions) {
  const int kSessions = 8;
  std::vector<std::thread> threads;
  folly::Synchronized<std::set<std::string>> packages;
  for (int i = 0; i < kSessions; ++i) {
    threads.emplace_back([&, i] {
      std::string id = "par-" + std::to_string(i);
      ASSERT_TRUE(start(id).hasValue());
      for (uint64_t seq = 1; seq <= 5; ++seq)
        ASSERT_TRUE(say(id, seq, "this is the bank, your account is blocked").hasValue());
      auto ended = end(id);
      ASSERT_TRUE(ended.hasValue());
      packages.wlock()->insert(ended->result["package_id"].asString());
    });
  }
  for (auto& t : threads)
    t.join();

  EXPECT_EQ(packages.rlock()->size(), kSessions);
  SessionManager::Stats stats = manager_->stats();
  EXPECT_EQ(stats.fragments, kSessions * 5);
  EXPECT_EQ(stats.packages, kSessions);
  EXPECT_EQ(manager_->sessions().size(), kSessions);
}

TEST_F(SessionManagerTest, SharedHandleCorrelatesCalls) {
  ASSERT_TRUE(start("a", "+919811111111").hasValue());
  escalate("a");
  ASSERT_TRUE(say("a", 3, "send it to rahul.k@ybl quickly").hasValue());
  ASSERT_TRUE(end("a").hasValue());

  ASSERT_TRUE(start("b", "+919822222222").hasValue());
  escalate("b");
  ASSERT_TRUE(say("b", 3, "send it to rahul.k@ybl quickly").hasValue());
  ASSERT_TRUE(end("b").hasValue());
  ASSERT_TRUE(manager_->handle(SubmitRequest{"b"}).hasValue());

  auto profile = manager_->profiles().find(EntityType::PAYMENT_HANDLE, "rahul.k@ybl");
  ASSERT_TRUE(profile.hasValue());
  EXPECT_EQ(profile->callCount, 2);
  EXPECT_EQ(profile->reportedCount, 1);
  EXPECT_EQ(profile->identifiers.phoneNumbers.size(), 2);
}

TEST_F(SessionManagerTest, VictimIdentifiersDoNotLinkCallers) {
  const char* callers[][3] = {
    { "a", "+919811111111", "send it to rahul.k@ybl quickly" },
    { "b", "+919822222222", "send it to priya.s@ybl quickly" },
  };
  for (const auto& c : callers) {
    ASSERT_TRUE(start(c[0], c[1]).hasValue());
    escalate(c[0]);
    ASSERT_TRUE(say(c[0], 3, "my account number is 123456789012",
                    Speaker::USER).hasValue());
    ASSERT_TRUE(say(c[0], 4, c[2]).hasValue());
    auto ended = end(c[0]);
    ASSERT_TRUE(ended.hasValue());
    EXPECT_EQ(ended->result["outcome"].asString(), "scam_suspected");
  }

  EXPECT_EQ(manager_->profiles().size(), 2);
  EXPECT_EQ(manager_->profiles().find(EntityType::PAYMENT_HANDLE,
                                      "rahul.k@ybl")->callCount, 1);
  EXPECT_EQ(manager_->profiles().find(EntityType::PAYMENT_HANDLE,
                                      "priya.s@ybl")->callCount, 1);
  EXPECT_FALSE(manager_->profiles().find(EntityType::BANK_ACCOUNT,
                                         "123456789012").hasValue());
}

TEST_F(SessionManagerTest, UnsubmittedSessionsExpire) {
  FLAGS_archive_retention_s = 0;
  ASSERT_TRUE(start("old").hasValue());
  auto ended = end("old");
  ASSERT_TRUE(ended.hasValue());
  std::string packageId = ended->result["package_id"].asString();
  EXPECT_EQ(manager_->stats().live, 1);

  // the next start sweeps
  ASSERT_TRUE(start("new").hasValue());
  SessionManager::Stats stats = manager_->stats();
  EXPECT_EQ(stats.live, 1);
  EXPECT_EQ(stats.expired, 1);
  EXPECT_EQ(manager_->sessions().size(), 1);

  auto submit = manager_->handle(SubmitRequest{"old"});
  ASSERT_FALSE(submit.hasValue());
  EXPECT_TRUE(submit.error().is(GUARD_UNKNOWN_SESSION));
  auto review = manager_->handle(ReviewRequest{packageId,
                                               SubmissionStatus::UNDER_REVIEW, ""});
  ASSERT_FALSE(review.hasValue());
  EXPECT_TRUE(review.error().is(GUARD_UNKNOWN_PACKAGE));

  // expired ids stay taken, live ones are untouched
  auto reuse = start("old");
  ASSERT_FALSE(reuse.hasValue());
  EXPECT_TRUE(reuse.error().is(GUARD_DUPLICATE_SESSION));
  EXPECT_TRUE(say("new", 1, "hello").hasValue());
}

TEST_F(SessionManagerTest, ReportedSessionRejectsLateCommands) {
  ASSERT_TRUE(start("s1").hasValue());
  ASSERT_TRUE(end("s1").hasValue());
  ASSERT_TRUE(manager_->handle(SubmitRequest{"s1"}).hasValue());

  auto late = say("s1", 1, "hello?");
  ASSERT_FALSE(late.hasValue());
  EXPECT_TRUE(late.error().is(GUARD_INVALID_TRANSITION));
  EXPECT_THAT(late.error().describe(), HasSubstr("reported"));

  auto again = end("s1");
  ASSERT_TRUE(again.hasValue());
  EXPECT_TRUE(again->result["duplicate"].asBool());
}

TEST_F(SessionManagerTest, NonFiniteVerdictIsAMiss) {
  manager_ = make(std::make_shared<FixedClassifier>(
      std::numeric_limits<double>::quiet_NaN()));
  ASSERT_TRUE(start("s1").hasValue());
  auto up = say("s1", 1, "hello");
  ASSERT_TRUE(up.hasValue());
  auto *update = std::get_if<ScoreUpdated>(&up->events[0].payload);
  ASSERT_NE(update, nullptr);
  EXPECT_FALSE(update->signal.classifier.hasValue());
  EXPECT_EQ(update->level, ThreatLevel::SAFE);
  EXPECT_EQ(manager_->stats().classifierMisses, 1);
}
