#include "SessionApiTypes.h"

#include <algorithm>
#include <cstring>
#include <folly/Conv.h>
#include <folly/json.h>
#include <folly/DynamicConverter.h>
#include <folly/portability/GFlags.h>

using folly::dynamic;
using folly::StringPiece;

DEFINE_string(default_persona, "confused_senior",
              "Persona engaged when a hand-off names none");

template<class Message>
struct FromJsonVisitor {
  Message msg;
  const char* param = nullptr;
  const dynamic& unwrap(const dynamic &d);
  void visit(const dynamic &d);

  template<class T>
  bool optional(const dynamic &d, const char* name, T& out) {
    auto *value = d.get_ptr(name);
    if (!value || value->isNull())
      return false;
    param = name;
    out = folly::convertTo<T>(*value);
    return true;
  }
};

template<class M>
const dynamic& FromJsonVisitor<M>::unwrap(const dynamic &d) {
  param = GuardApiType<M>::name();
  if (auto *inner = d.get_ptr(param))
    return *inner;
  return d;
}

template<class M> folly::Expected<M, GuardError>
GuardApiType<M>::fromJson(const dynamic &d) {
  FromJsonVisitor<M> visitor;
  GuardError err;

  try {
    if (d.isString()) {
      dynamic json = folly::parseJson(d.stringPiece());
      visitor.visit(visitor.unwrap(json));
    } else {
      visitor.visit(visitor.unwrap(d));
    }
    if ((err = validate(visitor.msg)))
      return folly::makeUnexpected(std::move(err));
    return std::move(visitor.msg);
  } catch (const folly::json::parse_error& e) {
    err = GUARD_SVC_FAILED_TO_PARSE_MSG_BODY;
    err.putVariable("invalid JSON body");
  } catch (const std::out_of_range &ex) {
    err = GUARD_SVC_MISSING_INFORMATION;
    err.putVariable(visitor.param);
  } catch (const folly::TypeError &ex) {
    err = GUARD_SVC_INVALID_PARAMETER_VALUE;
    err.putVariable(visitor.param);
    err.putVariable(ex.what());
  } catch (const folly::ConversionError &ex) {
    err = GUARD_SVC_INVALID_PARAMETER_VALUE;
    err.putVariable(visitor.param);
    err.putVariable(ex.what());
  }
  return folly::makeUnexpected(std::move(err));
}

template<class M> dynamic
GuardApiType<M>::toJson(const CommandResult &res) {
  dynamic events = dynamic::array;
  for (const SessionEvent& event : res.events)
    events.push_back(::toJson(event));
  return dynamic::object
    ("result", res.result)
    ("events", std::move(events));
}

template<class M> std::string
GuardApiType<M>::toBody(const CommandResult &res) {
  return folly::toJson(toJson(res));
}

static bool validateId(const std::string &id) {
  auto pred = [](char c) {
    return isalnum(static_cast<unsigned char>(c)) || (c != '\0' && strchr("._:-", c));
  };
  return !id.empty() && id.size() <= 128 &&
         std::all_of(id.begin(), id.end(), pred);
}

static bool validateTN(const std::string &tn) {
  static const char* acceptedChars = "0123456789*#+.-() ";
  auto pred = [](char c) { return c != '\0' && strchr(acceptedChars, c); };
  return !tn.empty() && std::all_of(tn.begin(), tn.end(), pred);
}

static GuardError invalidParameter(const char* param, const char* why) {
  GuardError err = GUARD_SVC_INVALID_PARAMETER_VALUE;
  err.putVariable(param);
  err.putVariable(why);
  return err;
}

static GuardError validateSessionId(const std::string &id) {
  if (!validateId(id))
    return invalidParameter("session_id", "1 to 128 characters of [A-Za-z0-9._:-]");
  return {};
}

/* start */

template<> const char* GuardApiType<StartRequest>::name() noexcept {
  return "start";
}

template<> void FromJsonVisitor<StartRequest>::visit(const dynamic &d) {
  param = "session_id";
  msg.sessionId = folly::convertTo<std::string>(d[param]);
  param = "phone_id";
  msg.phoneId = folly::convertTo<std::string>(d[param]);
  param = "direction";
  msg.direction = parseCallDirection(d[param].asString());
  optional(d, "first_sequence", msg.firstSequence);
  optional(d, "audio_ref", msg.audioRef);
}

template<> GuardError
GuardApiType<StartRequest>::validate(const StartRequest &m) {
  if (auto err = validateSessionId(m.sessionId))
    return err;
  if (!validateTN(m.phoneId))
    return invalidParameter("phone_id", "Only [0-9*#+.-() ] characters allowed for TN");
  if (!m.direction)
    return invalidParameter("direction", "Must be 'inbound' or 'outbound'");
  return {};
}

/* transcript_fragment */

template<> const char* GuardApiType<FragmentRequest>::name() noexcept {
  return "transcript_fragment";
}

template<> void FromJsonVisitor<FragmentRequest>::visit(const dynamic &d) {
  param = "session_id";
  msg.sessionId = folly::convertTo<std::string>(d[param]);
  param = "speaker";
  msg.speaker = parseSpeaker(d[param].asString());
  param = "text";
  msg.text = folly::convertTo<std::string>(d[param]);
  param = "sequence_number";
  msg.sequence = folly::convertTo<uint64_t>(d[param]);
  optional(d, "timestamp", msg.timestamp);
}

template<> GuardError
GuardApiType<FragmentRequest>::validate(const FragmentRequest &m) {
  if (auto err = validateSessionId(m.sessionId))
    return err;
  if (!m.speaker || *m.speaker == Speaker::PERSONA)
    return invalidParameter("speaker", "Must be 'caller' or 'user'");
  if (m.text.empty())
    return invalidParameter("text", "Must not be empty");
  if (m.timestamp < 0)
    return invalidParameter("timestamp", "Must not be negative");
  return {};
}

/* handoff_request */

template<> const char* GuardApiType<HandoffRequest>::name() noexcept {
  return "handoff_request";
}

template<> void FromJsonVisitor<HandoffRequest>::visit(const dynamic &d) {
  param = "session_id";
  msg.sessionId = folly::convertTo<std::string>(d[param]);
  if (!optional(d, "persona_id", msg.personaName) || msg.personaName.empty())
    msg.personaName = FLAGS_default_persona;
  msg.persona = parsePersonaId(msg.personaName);
}

template<> GuardError
GuardApiType<HandoffRequest>::validate(const HandoffRequest &m) {
  if (auto err = validateSessionId(m.sessionId))
    return err;
  if (!m.persona) {
    GuardError err = GUARD_UNKNOWN_PERSONA;
    err.putVariable(m.personaName);
    return err;
  }
  return {};
}

/* handoff_terminate */

template<> const char* GuardApiType<TerminateRequest>::name() noexcept {
  return "handoff_terminate";
}

template<> void FromJsonVisitor<TerminateRequest>::visit(const dynamic &d) {
  param = "session_id";
  msg.sessionId = folly::convertTo<std::string>(d[param]);
}

template<> GuardError
GuardApiType<TerminateRequest>::validate(const TerminateRequest &m) {
  return validateSessionId(m.sessionId);
}

/* end_call */

template<> const char* GuardApiType<EndCallRequest>::name() noexcept {
  return "end_call";
}

template<> void FromJsonVisitor<EndCallRequest>::visit(const dynamic &d) {
  param = "session_id";
  msg.sessionId = folly::convertTo<std::string>(d[param]);
  if (!optional(d, "reason", msg.reason) || msg.reason.empty())
    msg.reason = "hangup";
}

template<> GuardError
GuardApiType<EndCallRequest>::validate(const EndCallRequest &m) {
  return validateSessionId(m.sessionId);
}

/* submit_evidence */

template<> const char* GuardApiType<SubmitRequest>::name() noexcept {
  return "submit_evidence";
}

template<> void FromJsonVisitor<SubmitRequest>::visit(const dynamic &d) {
  param = "session_id";
  msg.sessionId = folly::convertTo<std::string>(d[param]);
}

template<> GuardError
GuardApiType<SubmitRequest>::validate(const SubmitRequest &m) {
  return validateSessionId(m.sessionId);
}

/* review_status_update */

template<> const char* GuardApiType<ReviewRequest>::name() noexcept {
  return "review_status_update";
}

template<> void FromJsonVisitor<ReviewRequest>::visit(const dynamic &d) {
  param = "package_id";
  msg.packageId = folly::convertTo<std::string>(d[param]);
  param = "new_status";
  msg.status = parseSubmissionStatus(d[param].asString());
  optional(d, "notes", msg.notes);
}

template<> GuardError
GuardApiType<ReviewRequest>::validate(const ReviewRequest &m) {
  if (!validateId(m.packageId))
    return invalidParameter("package_id", "1 to 128 characters of [A-Za-z0-9._:-]");
  if (!m.status)
    return invalidParameter("new_status", "Not a submission status");
  if (m.notes.size() > 4096)
    return invalidParameter("notes", "At most 4096 characters");
  return {};
}

template struct GuardApiType<StartRequest>;
template struct GuardApiType<FragmentRequest>;
template struct GuardApiType<HandoffRequest>;
template struct GuardApiType<TerminateRequest>;
template struct GuardApiType<EndCallRequest>;
template struct GuardApiType<SubmitRequest>;
template struct GuardApiType<ReviewRequest>;
