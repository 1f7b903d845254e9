#include "SessionManager.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <map>
#include <glog/logging.h>
#include <folly/CancellationToken.h>
#include <folly/Conv.h>
#include <folly/executors/InlineExecutor.h>
#include <folly/portability/GFlags.h>

using folly::dynamic;
using folly::StringPiece;

DEFINE_uint32(classifier_timeout_ms, 800,
              "Bound on one semantic classifier call; late verdicts are dropped");
DEFINE_uint32(reorder_window, 8,
              "How far ahead of the expected sequence a fragment may be buffered");
DEFINE_uint32(archive_retention_s, 86400,
              "How long an ended session waits for submission before it expires");
DEFINE_uint32(profile_retention_days, 180,
              "Forget scammer profiles not seen for this many days; 0 keeps them");

struct SessionManager::Gate {
  std::mutex lock;
  std::condition_variable idle;
  /* Lock released while a collaborator call is in flight */
  bool busy = false;

  void waitIdle(std::unique_lock<std::mutex>& lk) {
    idle.wait(lk, [this] { return !busy; });
  }
};

struct SessionManager::Slot : Gate {
  Slot(std::string sessionId, std::string phoneId, CallDirection direction,
       int64_t startedAt, uint64_t firstSequence)
    : session(std::move(sessionId), std::move(phoneId), direction,
              startedAt, firstSequence)
  {}

  bool ending = false;
  folly::CancellationSource cancel;
  CallSession session;
  std::map<uint64_t, Fragment> pending;
};

struct SessionManager::Filed : Gate {
  explicit Filed(EvidencePackage pkg)
    : package(std::move(pkg))
  {}

  EvidencePackage package;
};

static int64_t unixNow() {
  using namespace std::chrono;
  return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

static GuardError unknownSession(const std::string& sessionId) {
  GuardError err = GUARD_UNKNOWN_SESSION;
  err.putVariable(sessionId);
  return err;
}

static GuardError invalidIn(const char* command, CallState state) {
  GuardError err = GUARD_INVALID_TRANSITION;
  err.putVariable(command);
  err.putVariable(toString(state));
  return err;
}

static GuardError invalidMove(SubmissionStatus to, SubmissionStatus from) {
  GuardError err = GUARD_INVALID_TRANSITION;
  err.putVariable(std::string("status:") + toString(to));
  err.putVariable(toString(from));
  return err;
}

SessionManager::SessionManager(std::shared_ptr<EvidenceAssembler> assembler,
                               std::shared_ptr<Classifier> classifier,
                               std::shared_ptr<EventSink> sink)
  : assembler_(std::move(assembler))
  , classifier_(std::move(classifier))
  , sink_(std::move(sink))
{
}

SessionManager::~SessionManager() = default;

std::shared_ptr<SessionManager::Slot>
SessionManager::find(const std::string& sessionId) const {
  auto registry = registry_.rlock();
  auto it = registry->live.find(sessionId);
  if (it != registry->live.end())
    return it->second;
  return nullptr;
}

SessionManager::Result
SessionManager::missing(const char* command, const std::string& sessionId) {
  bool reported = false;
  {
    auto registry = registry_.rlock();
    auto it = registry->closed.find(sessionId);
    reported = it != registry->closed.end() && it->second;
  }

  // Expired and never seen look the same to the client
  if (!reported)
    return reject(unknownSession(sessionId));
  if (StringPiece(command) == "submit_evidence") {
    GuardError err = GUARD_DUPLICATE_ASSEMBLY;
    err.putVariable(sessionId);
    return reject(std::move(err));
  }
  if (StringPiece(command) == "end_call") {
    CommandResult res;
    res.result = dynamic::object
      ("session_id", sessionId)
      ("duplicate", true);
    return res;
  }
  return reject(invalidIn(command, CallState::REPORTED));
}

SessionManager::Result SessionManager::reject(GuardError err) {
  ++rejected_;
  VLOG(1) << "Rejected: " << err.describe();
  return folly::makeUnexpected(std::move(err));
}

void SessionManager::publish(const EventList& events) {
  if (!sink_)
    return;
  for (const SessionEvent& event : events)
    sink_->onEvent(event);
}

void SessionManager::file(Slot& slot) {
  const std::string& sessionId = slot.session.sessionId();
  auto filed = std::make_shared<Filed>(slot.session.releasePackage());
  std::string packageId = filed->package.packageId();

  auto registry = registry_.wlock();
  registry->live.erase(sessionId);
  registry->byPackage.erase(packageId);
  registry->closed[sessionId] = true;
  registry->filed.emplace(std::move(packageId), std::move(filed));
}

void SessionManager::sweep(int64_t now, bool force) {
  std::vector<std::shared_ptr<Slot>> live;
  {
    auto registry = registry_.wlock();
    int64_t interval = std::min<int64_t>(60, FLAGS_archive_retention_s);
    if (!force && now - registry->lastSweep < interval)
      return;
    registry->lastSweep = now;
    for (const auto& entry : registry->live)
      live.push_back(entry.second);
  }

  size_t expired = 0;
  for (const auto& slot : live) {
    std::unique_lock<std::mutex> lk(slot->lock, std::try_to_lock);
    if (!lk.owns_lock() || slot->busy)
      continue;
    const CallSession& session = slot->session;
    if (!session.ended() || session.endedAt() + FLAGS_archive_retention_s > now)
      continue;

    auto registry = registry_.wlock();
    registry->live.erase(session.sessionId());
    registry->closed[session.sessionId()] = false;
    if (session.package())
      registry->byPackage.erase(session.package()->packageId());
    ++expired;
  }

  size_t forgotten = 0;
  if (FLAGS_profile_retention_days > 0)
    forgotten = profiles_.expire(now - int64_t(FLAGS_profile_retention_days) * 86400);

  expired_ += expired;
  LOG_IF(INFO, expired || forgotten)
    << "Sweep: " << expired << " unsubmitted sessions expired, "
    << forgotten << " profiles forgotten";
}

folly::Optional<double>
SessionManager::classify(Slot& slot, const std::string& text) {
  folly::CancellationToken token = slot.cancel.getToken();
  if (token.isCancellationRequested())
    return folly::none;

  // First of answer, timeout or cancellation wins
  struct Race {
    folly::Promise<double> promise;
    std::atomic<bool> done{false};

    void settle(folly::Try<double>&& t) {
      if (!done.exchange(true))
        promise.setTry(std::move(t));
    }
  };
  auto race = std::make_shared<Race>();
  auto answer = race->promise.getSemiFuture();

  auto call = folly::makeSemiFutureWith([&] {
      return classifier_->classify(slot.session.sessionId(), text);
    })
    .via(folly::getKeepAliveToken(folly::InlineExecutor::instance()))
    .within(std::chrono::milliseconds(FLAGS_classifier_timeout_ms))
    .thenTry([race](folly::Try<double>&& t) { race->settle(std::move(t)); });

  folly::CancellationCallback onCancel(token, [race] {
    race->settle(folly::Try<double>(
        folly::make_exception_wrapper<std::runtime_error>("call is ending")));
  });

  folly::Try<double> verdict = std::move(answer).getTry();
  if (verdict.hasException()) {
    ++classifierMisses_;
    LOG_EVERY_N(WARNING, 100) << "Classifier verdict dropped for session "
                              << slot.session.sessionId() << ": "
                              << verdict.exception().what();
    return folly::none;
  }
  if (!std::isfinite(verdict.value())) {
    ++classifierMisses_;
    LOG_EVERY_N(WARNING, 100) << "Classifier returned " << verdict.value()
                              << " for session " << slot.session.sessionId();
    return folly::none;
  }
  return verdict.value();
}

folly::Expected<folly::Unit, GuardError>
SessionManager::assemble(const std::shared_ptr<Slot>& slot,
                         std::unique_lock<std::mutex>& lk, EventList& events)
{
  EvidenceInput input = slot->session.evidenceInput();
  slot->busy = true;
  lk.unlock();
  auto pkg = assembler_->assemble(std::move(input));
  lk.lock();
  slot->busy = false;

  if (pkg.hasError()) {
    ++assemblyFailures_;
    LOG(ERROR) << "Session " << slot->session.sessionId() << ": "
               << pkg.error().describe();
    return folly::makeUnexpected(std::move(pkg).error());
  }

  auto profile = profiles_.ingest(*pkg);
  std::string packageId = pkg->packageId();
  slot->session.attachPackage(std::move(pkg).value(), events);
  registry_.wlock()->byPackage[packageId] = slot->session.sessionId();
  ++packages_;

  LOG(INFO) << "Session " << slot->session.sessionId() << ": evidence "
            << packageId << " ready" << (profile ? ", profile " + *profile : "");
  return folly::unit;
}

SessionManager::Result SessionManager::handle(const StartRequest& req) {
  sweep(unixNow());

  auto slot = std::make_shared<Slot>(req.sessionId, req.phoneId, *req.direction,
                                     unixNow(), req.firstSequence);
  if (!req.audioRef.empty())
    slot->session.setAudioRef(req.audioRef);

  CommandResult res;
  std::lock_guard<std::mutex> guard(slot->lock);
  {
    auto registry = registry_.wlock();
    if (registry->live.count(req.sessionId) || registry->closed.count(req.sessionId)) {
      GuardError err = GUARD_DUPLICATE_SESSION;
      err.putVariable(req.sessionId);
      return reject(std::move(err));
    }
    registry->live.emplace(req.sessionId, slot);
  }

  auto opened = slot->session.open(res.events);
  if (opened.hasError())
    return reject(std::move(opened).error());

  ++started_;
  LOG(INFO) << "Session " << req.sessionId << " started ("
            << toString(*req.direction) << ")";
  publish(res.events);
  res.result = slot->session.summary();
  return res;
}

SessionManager::Result SessionManager::handle(const FragmentRequest& req) {
  auto slot = find(req.sessionId);
  if (!slot)
    return missing("transcript_fragment", req.sessionId);

  std::unique_lock<std::mutex> lk(slot->lock);
  slot->waitIdle(lk);
  CallSession& session = slot->session;

  if (slot->ending || session.ended())
    return reject(invalidIn("transcript_fragment",
                            slot->ending ? CallState::ENDED : session.state()));

  uint64_t expected = session.expectedSequence();
  if (req.sequence < expected || slot->pending.count(req.sequence) ||
      req.sequence > expected + FLAGS_reorder_window) {
    GuardError err = GUARD_INVALID_SEQUENCE;
    err.putVariable(folly::to<std::string>(req.sequence));
    err.putVariable(folly::to<std::string>(expected));
    return reject(std::move(err));
  }

  Fragment fragment{req.sequence, *req.speaker, req.text,
                    req.timestamp ? req.timestamp : unixNow()};
  CommandResult res;

  if (req.sequence > expected) {
    slot->pending.emplace(req.sequence, std::move(fragment));
    ++buffered_;
    res.result = dynamic::object
      ("buffered", true)
      ("sequence", req.sequence)
      ("expected", expected);
    return res;
  }

  folly::Optional<Fragment> next = std::move(fragment);
  folly::Optional<GuardError> failure;
  while (next) {
    Fragment current = std::move(*next);
    next.reset();

    folly::Optional<double> verdict;
    if (classifier_) {
      slot->busy = true;
      lk.unlock();
      verdict = classify(*slot, current.text);
      lk.lock();
      slot->busy = false;
    }

    size_t first = res.events.size();
    auto applied = session.ingest(current, verdict, res.events);
    if (applied.hasError()) {
      failure = std::move(applied).error();
      break;
    }
    ++fragments_;
    for (size_t i = first; i < res.events.size(); ++i) {
      auto *change = std::get_if<StateChanged>(&res.events[i].payload);
      if (change && change->to == CallState::THREAT_DETECTED)
        ++threats_;
    }

    // A pending end_call takes over once the in-flight fragment is applied
    if (slot->ending)
      break;
    auto it = slot->pending.find(session.expectedSequence());
    if (it != slot->pending.end()) {
      next = std::move(it->second);
      slot->pending.erase(it);
    }
  }

  publish(res.events);
  slot->idle.notify_all();
  if (failure)
    return reject(std::move(*failure));

  res.result = dynamic::object
    ("state", toString(session.state()))
    ("score", session.score())
    ("level", toString(session.level()))
    ("next_sequence", session.expectedSequence())
    ("buffered", slot->pending.size());
  return res;
}

SessionManager::Result SessionManager::handle(const HandoffRequest& req) {
  auto slot = find(req.sessionId);
  if (!slot)
    return missing("handoff_request", req.sessionId);

  std::unique_lock<std::mutex> lk(slot->lock);
  slot->waitIdle(lk);
  if (slot->ending)
    return reject(invalidIn("handoff_request", CallState::ENDED));

  CommandResult res;
  auto engaged = slot->session.handoff(*req.persona, res.events);
  if (engaged.hasError())
    return reject(std::move(engaged).error());

  ++handoffs_;
  LOG(INFO) << "Session " << req.sessionId << ": handed off to "
            << toString(*req.persona);
  publish(res.events);
  res.result = slot->session.summary();
  return res;
}

SessionManager::Result SessionManager::handle(const TerminateRequest& req) {
  auto slot = find(req.sessionId);
  if (!slot)
    return missing("handoff_terminate", req.sessionId);

  std::unique_lock<std::mutex> lk(slot->lock);
  slot->waitIdle(lk);
  if (slot->ending)
    return reject(invalidIn("handoff_terminate", CallState::ENDED));

  CommandResult res;
  auto released = slot->session.terminate(res.events);
  if (released.hasError())
    return reject(std::move(released).error());

  publish(res.events);
  res.result = slot->session.summary();
  return res;
}

SessionManager::Result SessionManager::handle(const EndCallRequest& req) {
  auto slot = find(req.sessionId);
  if (!slot)
    return missing("end_call", req.sessionId);

  std::unique_lock<std::mutex> lk(slot->lock);
  CommandResult res;
  if (slot->ending || slot->session.ended()) {
    res.result = dynamic::object
      ("session_id", req.sessionId)
      ("duplicate", true);
    return res;
  }

  slot->ending = true;
  slot->cancel.requestCancellation();
  slot->waitIdle(lk);

  LOG_IF(WARNING, !slot->pending.empty())
    << "Session " << req.sessionId << ": " << slot->pending.size()
    << " buffered fragments dropped at end of call";
  slot->pending.clear();

  CallSession& session = slot->session;
  session.end(req.reason, unixNow(), res.events);
  LOG(INFO) << "Session " << req.sessionId << " ended (" << req.reason
            << "), outcome " << session.outcome() << ", "
            << session.transcript().size() << " transcript entries";

  auto assembled = assemble(slot, lk, res.events);
  publish(res.events);
  slot->idle.notify_all();
  if (assembled.hasError())
    return reject(std::move(assembled).error());

  res.result = session.summary();
  return res;
}

SessionManager::Result SessionManager::handle(const SubmitRequest& req) {
  auto slot = find(req.sessionId);
  if (!slot)
    return missing("submit_evidence", req.sessionId);

  std::unique_lock<std::mutex> lk(slot->lock);
  slot->waitIdle(lk);
  CallSession& session = slot->session;
  CommandResult res;

  // A failed assembly is retried on submission
  if (session.state() == CallState::ENDED && !session.package()) {
    auto assembled = assemble(slot, lk, res.events);
    publish(res.events);
    slot->idle.notify_all();
    if (assembled.hasError())
      return reject(std::move(assembled).error());
  }

  auto entry = session.prepareSubmit(unixNow());
  if (entry.hasError())
    return reject(std::move(entry).error());

  std::string packageId = session.package()->packageId();
  slot->busy = true;
  lk.unlock();
  auto recorded = assembler_->recordTransition(packageId, SubmissionStatus::SUBMITTED,
                                               *entry);
  lk.lock();
  slot->busy = false;
  slot->idle.notify_all();
  if (recorded.hasError())
    return reject(std::move(recorded).error());

  size_t first = res.events.size();
  session.commitSubmit(std::move(*entry), res.events);
  profiles_.markReported(packageId);
  res.result = session.package()->summary();
  file(*slot);
  LOG(INFO) << "Session " << req.sessionId << ": evidence " << packageId
            << " submitted";

  publish(EventList(res.events.begin() + first, res.events.end()));
  return res;
}

SessionManager::Result SessionManager::handle(const ReviewRequest& req) {
  SubmissionStatus to = *req.status;
  std::shared_ptr<Filed> filed;
  folly::Optional<SubmissionStatus> known;
  {
    auto registry = registry_.rlock();
    auto it = registry->filed.find(req.packageId);
    if (it != registry->filed.end()) {
      filed = it->second;
    } else if (registry->byPackage.count(req.packageId)) {
      known = SubmissionStatus::PENDING;
    } else {
      auto done = registry->settled.find(req.packageId);
      if (done != registry->settled.end())
        known = done->second;
    }
  }

  if (!filed) {
    if (known)
      return reject(invalidMove(to, *known));
    GuardError err = GUARD_UNKNOWN_PACKAGE;
    err.putVariable(req.packageId);
    return reject(std::move(err));
  }

  std::unique_lock<std::mutex> lk(filed->lock);
  filed->waitIdle(lk);
  EvidencePackage& pkg = filed->package;

  // Submission belongs to the client, reviewers start at under_review
  if (to == SubmissionStatus::PENDING || to == SubmissionStatus::SUBMITTED)
    return reject(invalidMove(to, pkg.status()));

  auto entry = pkg.prepareTransition(to, "reviewer", req.notes, unixNow());
  if (entry.hasError())
    return reject(std::move(entry).error());

  filed->busy = true;
  lk.unlock();
  auto recorded = assembler_->recordTransition(req.packageId, to, *entry);
  lk.lock();
  filed->busy = false;
  filed->idle.notify_all();
  if (recorded.hasError())
    return reject(std::move(recorded).error());

  pkg.commitTransition(to, std::move(*entry));
  LOG(INFO) << "Evidence " << req.packageId << " moved to " << toString(to);

  CommandResult res;
  res.result = pkg.summary();
  if (isTerminal(to)) {
    auto registry = registry_.wlock();
    registry->filed.erase(req.packageId);
    registry->settled[req.packageId] = to;
    ++settled_;
  }
  return res;
}

dynamic SessionManager::sessions() const {
  std::vector<std::shared_ptr<Slot>> live;
  {
    auto registry = registry_.rlock();
    for (const auto& entry : registry->live)
      live.push_back(entry.second);
  }

  dynamic list = dynamic::array;
  for (const auto& slot : live) {
    std::lock_guard<std::mutex> guard(slot->lock);
    list.push_back(slot->session.summary());
  }
  return list;
}

SessionManager::Stats SessionManager::stats() const {
  Stats s;
  s.started = started_.load();
  s.fragments = fragments_.load();
  s.buffered = buffered_.load();
  s.threats = threats_.load();
  s.handoffs = handoffs_.load();
  s.packages = packages_.load();
  s.assemblyFailures = assemblyFailures_.load();
  s.classifierMisses = classifierMisses_.load();
  s.rejected = rejected_.load();
  s.expired = expired_.load();
  s.settled = settled_.load();
  auto registry = registry_.rlock();
  s.live = registry->live.size();
  s.archived = registry->filed.size();
  return s;
}
