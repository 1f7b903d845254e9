#include <sys/types.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <atomic>
#include <thread>
#include <systemd/sd-daemon.h>
#include <systemd/sd-journal.h>
#include <glog/logging.h>
#include <folly/dynamic.h>
#include <folly/json.h>
#include <folly/FileUtil.h>
#include <folly/Format.h>
#include <folly/portability/Unistd.h>
#include <folly/system/ThreadId.h>
#include <folly/synchronization/Hazptr.h>

#include <evidence/EvidenceAssembler.h>
#include <evidence/SigningKey.h>
#include "Control.h"
#include "SessionManager.h"

using folly::StringPiece;

static std::atomic<SigningKey::Data*> currentKey;

SigningKey SigningKey::get() noexcept { return { currentKey }; }

static StringPiece osBasename(StringPiece path) {
  auto idx = path.rfind('/');
  if (idx == StringPiece::npos) {
    return path;
  }
  return path.subpiece(idx + 1);
}

bool loadSigningKey(const std::string &path) {
  std::string pem;
  std::unique_ptr<SigningKey::Data> data;

  try {
    if (!folly::readFile(path.c_str(), pem))
      throw std::runtime_error("could not read key file");
    data = SigningKey::fromPEM(pem);
  } catch (std::exception& e) {
    LOG(ERROR) << osBasename(path) << ": " << e.what();
    return false;
  }

  SigningKey::commit(std::move(data), currentKey);
  folly::hazptr_cleanup();
  LOG(INFO) << "Signing key " << SigningKey::get().keyId() << " installed";
  return true;
}

void generateSigningKey() {
  SigningKey::commit(SigningKey::generate(), currentKey);
  folly::hazptr_cleanup();
  LOG(INFO) << "Signing key " << SigningKey::get().keyId() << " generated";
}

std::shared_ptr<KeyManager> getKeyManager() {
  return std::make_shared<LocalKeyManager>(currentKey);
}

/** Mirrors log lines to the requester's stderr while a command runs. */
class PeerLogSink : public google::LogSink {
 public:
  explicit PeerLogSink(int fd)
    : fd_(fd)
  {
    google::AddLogSink(this);
  }

  ~PeerLogSink() override {
    google::RemoveLogSink(this);
  }

  void send(google::LogSeverity severity, const char* /*full_filename*/,
            const char* base_filename, int line,
            const struct ::tm* tm_time,
            const char* message, size_t message_len) override
  {
    std::string buf = ToString(severity, base_filename, line,
                               tm_time, message, message_len);
    buf += '\n';
    // The requester may have gone away, nothing to report to
    if (folly::writeFull(fd_, buf.data(), buf.size()) < 0)
      return;
  }

 private:
  int fd_;
};

static int journalPriority(google::LogSeverity severity) {
  switch (severity) {
  case google::GLOG_INFO:
    return LOG_INFO;
  case google::GLOG_WARNING:
    return LOG_WARNING;
  case google::GLOG_ERROR:
    return LOG_ERR;
  default:
    return LOG_CRIT;
  }
}

class JournaldSink : public google::LogSink {
 public:
  void send(google::LogSeverity severity, const char* full_filename,
            const char* /*base_filename*/, int line,
            const struct ::tm* /*tm_time*/,
            const char* message, size_t message_len) override
  {
    sd_journal_send("MESSAGE=%.*s", int(message_len), message,
                    "PRIORITY=%i", journalPriority(severity),
                    "SYSLOG_IDENTIFIER=callguard",
                    "TID=%i", int(folly::getOSThreadID()),
                    "CODE_FILE=%s", full_filename,
                    "CODE_LINE=%d", line,
                    NULL);
  }
};

/* File descriptors passed with one datagram, closed with it */
class PassedFds {
 public:
  PassedFds() = default;
  PassedFds(const PassedFds&) = delete;
  PassedFds& operator=(const PassedFds&) = delete;
  ~PassedFds() { reset(); }

  void reset() {
    for (int fd : fds_)
      close(fd);
    fds_.clear();
  }

  void assign(const int *fds, size_t count) {
    reset();
    fds_.assign(fds, fds + count);
  }

  /** Map a message argument to a descriptor, negative when absent. */
  int at(const folly::dynamic& index) const {
    int64_t i = index.asInt();
    if (i < 0)
      return -1;
    if (static_cast<size_t>(i) >= fds_.size())
      throw std::out_of_range(folly::sformat("fd index {} not passed", i));
    return fds_[i];
  }

  size_t size() const { return fds_.size(); }

 private:
  std::vector<int> fds_;
};

struct ControlRequest {
  std::string cmd;
  int stdinFd = -1;
  int stdoutFd = -1;

  static std::string procPath(int fd) {
    return folly::sformat("/proc/self/fd/{}", fd);
  }
};

class ControlThread {
 public:
  ControlThread(int sockFd, std::shared_ptr<SessionManager> sessions)
    : sock_(sockFd)
    , pktbuf_(1500, '\0')
    , sessions_(std::move(sessions))
  {}

  void operator()();

 private:
  ssize_t awaitMessage();
  char dispatch(const ControlRequest& req) const;
  void reply(char status) const;

  bool dumpSessions(const ControlRequest& req) const;
  bool logStats() const;

  int sock_;
  std::string pktbuf_;
  struct sockaddr_un peer_;
  socklen_t peerLen_ = 0;
  alignas(struct cmsghdr) char cbuf_[256];
  PassedFds fds_;
  std::shared_ptr<SessionManager> sessions_;
};

ssize_t ControlThread::awaitMessage()
{
  struct iovec iov;
  struct msghdr io = {};

  iov.iov_base = &pktbuf_[0];
  iov.iov_len = pktbuf_.size();
  io.msg_iov = &iov;
  io.msg_iovlen = 1;
  io.msg_name = &peer_;
  io.msg_namelen = sizeof(peer_);
  io.msg_control = cbuf_;
  io.msg_controllen = sizeof(cbuf_);

  fds_.reset();
  ssize_t ret = recvmsg(sock_, &io, MSG_CMSG_CLOEXEC);
  if (ret < 0) {
    PLOG(WARNING) << "recvmsg";
    return ret;
  }

  for (struct cmsghdr *c = CMSG_FIRSTHDR(&io); c != NULL; c = CMSG_NXTHDR(&io, c)) {
    if (c->cmsg_level == SOL_SOCKET && c->cmsg_type == SCM_RIGHTS) {
      size_t count = (c->cmsg_len - CMSG_LEN(0)) / sizeof(int);
      fds_.assign(reinterpret_cast<const int*>(CMSG_DATA(c)), count);
      break;
    }
  }

  if (io.msg_namelen <= 0) {
    LOG(WARNING) << "Control message without a reply address dropped";
    return -1;
  }
  peerLen_ = io.msg_namelen;
  return ret;
}

void ControlThread::reply(char status) const {
  if (sendto(sock_, &status, 1, 0,
             reinterpret_cast<const struct sockaddr*>(&peer_), peerLen_) < 0)
    PLOG(WARNING) << "sendto";
}

bool ControlThread::dumpSessions(const ControlRequest& req) const
{
  if (req.stdoutFd < 0) {
    LOG(ERROR) << "sessions: no stdout passed";
    return false;
  }

  std::string out = folly::toPrettyJson(sessions_->sessions());
  out += '\n';
  if (folly::writeFull(req.stdoutFd, out.data(), out.size()) < 0) {
    PLOG(ERROR) << "sessions: write";
    return false;
  }
  return true;
}

bool ControlThread::logStats() const {
  SessionManager::Stats s = sessions_->stats();
  LOG(INFO) << "Sessions: " << s.live << " live, " << s.started << " started, "
            << s.expired << " expired unsubmitted";
  LOG(INFO) << "Submitted: " << s.archived << " awaiting review, " << s.settled
            << " settled";
  LOG(INFO) << "Fragments: " << s.fragments << " applied, " << s.buffered
            << " buffered, " << s.classifierMisses << " classifier misses";
  LOG(INFO) << "Threats: " << s.threats << " detected, " << s.handoffs
            << " handed off";
  LOG(INFO) << "Evidence: " << s.packages << " packages, " << s.assemblyFailures
            << " assembly failures";
  LOG(INFO) << "Profiles: " << sessions_->profiles().size();
  LOG(INFO) << "Rejected commands: " << s.rejected;
  return true;
}

char ControlThread::dispatch(const ControlRequest& req) const {
  bool ok = false;

  if (req.cmd == "key") {
    if (req.stdinFd < 0)
      LOG(ERROR) << "key: no stdin passed";
    else
      ok = loadSigningKey(ControlRequest::procPath(req.stdinFd));
  } else if (req.cmd == "sessions") {
    ok = dumpSessions(req);
  } else if (req.cmd == "stats") {
    ok = logStats();
  } else {
    LOG(WARNING) << "Unrecognized control command '" << req.cmd
                 << "' (" << fds_.size() << " fds)";
  }
  return ok ? 'S' : 'F';
}

void ControlThread::operator()() {
  while (true) {
    ssize_t bytes = awaitMessage();
    if (bytes < 0) {
      usleep(100000);
      continue;
    }

    char status = 'F';
    try {
      folly::dynamic msg = folly::parseJson(StringPiece(pktbuf_.data(), bytes));
      ControlRequest req;
      req.cmd = msg["cmd"].asString();
      req.stdinFd = fds_.at(msg.getDefault("stdin", -1));
      req.stdoutFd = fds_.at(msg.getDefault("stdout", -1));
      int stderrFd = fds_.at(msg.getDefault("stderr", -1));

      std::unique_ptr<PeerLogSink> sink;
      if (stderrFd >= 0)
        sink = std::make_unique<PeerLogSink>(stderrFd);
      status = dispatch(req);
    } catch (const std::exception& e) {
      LOG(ERROR) << "Bad control message: " << e.what();
    }

    reply(status);
    fds_.reset();
  }
}

void startControlSocket(std::shared_ptr<SessionManager> sessions) {
  static JournaldSink journalSink;
  if (sd_listen_fds(0) != 1) {
    LOG(WARNING) << "launched without systemd, control socket disabled";
    return;
  }

  // Replace default log sinks with systemd
  google::AddLogSink(&journalSink);
  for (int i = 0; i < google::NUM_SEVERITIES; ++i) {
    google::SetLogDestination(i, "");     // "" turns off logging to a logfile
  }
  google::SetStderrLogging(google::FATAL);

  int sockFd = SD_LISTEN_FDS_START + 0;
  std::thread(ControlThread(sockFd, std::move(sessions))).detach();
}
