#ifndef GUARD_CALLGUARD_SESSION_MANAGER_H
#define GUARD_CALLGUARD_SESSION_MANAGER_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <folly/Expected.h>
#include <folly/Synchronized.h>
#include <folly/container/F14Map.h>
#include <folly/dynamic.h>
#include <folly/futures/Future.h>

#include <evidence/EvidenceAssembler.h>
#include <evidence/ScammerProfile.h>
#include "CallSession.h"
#include "SessionApiTypes.h"

/** Semantic classification collaborator. */
class Classifier {
 public:
  virtual ~Classifier() = default;
  /** Scam probability of one fragment in [0, 1]. */
  virtual folly::SemiFuture<double> classify(std::string sessionId,
                                             std::string text) = 0;
};

/**
 * Registry of live calls and the serialization boundary around each.
 *
 * Commands for different sessions run in parallel. Commands for one
 * session run one step at a time under that session's lock; the lock
 * is released while a classifier, signing or persistence call is in
 * flight and the session is marked busy, so later commands for the
 * same session queue behind it.
 *
 * Every method blocks the calling thread until the command completes.
 *
 * A submitted session gives up its body: only the signed package stays
 * until a reviewer settles it, and only the ids stay after that.
 * Ended sessions that are never submitted expire after
 * --archive_retention_s.
 */
class SessionManager {
 public:
  struct Stats {
    uint64_t started = 0;
    uint64_t fragments = 0;
    uint64_t buffered = 0;
    uint64_t threats = 0;
    uint64_t handoffs = 0;
    uint64_t packages = 0;
    uint64_t assemblyFailures = 0;
    uint64_t classifierMisses = 0;
    uint64_t rejected = 0;
    uint64_t expired = 0;
    uint64_t settled = 0;
    size_t live = 0;
    /** Submitted packages awaiting a review verdict. */
    size_t archived = 0;
  };

  using Result = folly::Expected<CommandResult, GuardError>;

  SessionManager(std::shared_ptr<EvidenceAssembler> assembler,
                 std::shared_ptr<Classifier> classifier = nullptr,
                 std::shared_ptr<EventSink> sink = nullptr);
  ~SessionManager();

  Result handle(const StartRequest& req);
  Result handle(const FragmentRequest& req);
  Result handle(const HandoffRequest& req);
  Result handle(const TerminateRequest& req);
  Result handle(const EndCallRequest& req);
  Result handle(const SubmitRequest& req);
  Result handle(const ReviewRequest& req);

  /** Summary of every live session. */
  folly::dynamic sessions() const;
  Stats stats() const;
  const ProfileIndex& profiles() const noexcept { return profiles_; }

  /** Drop expired sessions and profiles; throttled unless forced. */
  void sweep(int64_t now, bool force = false);

 private:
  struct Gate;
  struct Slot;
  struct Filed;
  struct Registry {
    folly::F14NodeMap<std::string, std::shared_ptr<Slot>> live;
    /* Pending packages of live sessions */
    folly::F14FastMap<std::string, std::string> byPackage;
    folly::F14NodeMap<std::string, std::shared_ptr<Filed>> filed;
    /* Session ids no longer live: true once reported, false if expired */
    folly::F14FastMap<std::string, bool> closed;
    folly::F14FastMap<std::string, SubmissionStatus> settled;
    int64_t lastSweep = 0;
  };

  std::shared_ptr<Slot> find(const std::string& sessionId) const;
  /** Answer for a command naming a session that is no longer live. */
  Result missing(const char* command, const std::string& sessionId);
  folly::Optional<double> classify(Slot& slot, const std::string& text);
  Result reject(GuardError err);
  void publish(const EventList& events);
  /** Move the package of a reported session out and close the session. */
  void file(Slot& slot);
  /** Assemble evidence for an ended session; slot lock must be held. */
  folly::Expected<folly::Unit, GuardError>
  assemble(const std::shared_ptr<Slot>& slot, std::unique_lock<std::mutex>& lk,
           EventList& events);

  std::shared_ptr<EvidenceAssembler> assembler_;
  std::shared_ptr<Classifier> classifier_;
  std::shared_ptr<EventSink> sink_;
  ProfileIndex profiles_;
  folly::Synchronized<Registry> registry_;

  std::atomic<uint64_t> started_{0};
  std::atomic<uint64_t> fragments_{0};
  std::atomic<uint64_t> buffered_{0};
  std::atomic<uint64_t> threats_{0};
  std::atomic<uint64_t> handoffs_{0};
  std::atomic<uint64_t> packages_{0};
  std::atomic<uint64_t> assemblyFailures_{0};
  std::atomic<uint64_t> classifierMisses_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> expired_{0};
  std::atomic<uint64_t> settled_{0};
};

#endif // GUARD_CALLGUARD_SESSION_MANAGER_H
