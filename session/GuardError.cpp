#include "GuardError.h"

#include <folly/lang/Assume.h>
#include <folly/dynamic.h>
#include <folly/json.h>
#include <folly/String.h>

using folly::dynamic;
using folly::StringPiece;

struct GuardErrorClass {
  GuardErrorCode code;
  const char *id;
  const char *reflect;
  const char *text;
  int http_status;
};

static const GuardErrorClass guardError[] = {
  { GUARD_INVALID_TRANSITION, "SES4090", "GUARD_INVALID_TRANSITION",
    "Command '%1' is not valid in state '%2'", 409 },
  { GUARD_UNKNOWN_SESSION, "SES4040", "GUARD_UNKNOWN_SESSION",
    "Session '%1' does not exist", 404 },
  { GUARD_EXTERNAL_TIMEOUT, "EXT5040", "GUARD_EXTERNAL_TIMEOUT",
    "Collaborator '%1' did not answer in time", 504 },
  { GUARD_MALFORMED_ENTITY, "SES4220", "GUARD_MALFORMED_ENTITY",
    "Candidate '%1' at %2 failed validation: %3", 422 },
  { GUARD_DUPLICATE_ASSEMBLY, "EVD4091", "GUARD_DUPLICATE_ASSEMBLY",
    "Evidence for session '%1' was already produced", 409 },
  { GUARD_ASSEMBLY_FAILED, "EVD5020", "GUARD_ASSEMBLY_FAILED",
    "Evidence assembly failed at step '%1': %2", 502 },
  { GUARD_DUPLICATE_SESSION, "SES4092", "GUARD_DUPLICATE_SESSION",
    "Session '%1' already exists", 409 },
  { GUARD_UNKNOWN_PACKAGE, "EVD4040", "GUARD_UNKNOWN_PACKAGE",
    "Evidence package '%1' does not exist", 404 },
  { GUARD_INVALID_SEQUENCE, "SES4093", "GUARD_INVALID_SEQUENCE",
    "Fragment %1 rejected, expected sequence %2", 409 },
  { GUARD_UNKNOWN_PERSONA, "SES4001", "GUARD_UNKNOWN_PERSONA",
    "Persona '%1' is not in the catalogue", 400 },
  { GUARD_SVC_MISSING_INFORMATION, "SVC4001", "GUARD_SVC_MISSING_INFORMATION",
    "Missing mandatory parameter '%1'", 400 },
  { GUARD_SVC_INVALID_PARAMETER_VALUE, "SVC4005", "GUARD_SVC_INVALID_PARAMETER_VALUE",
    "Invalid '%1' parameter value: %2", 400 },
  { GUARD_SVC_FAILED_TO_PARSE_MSG_BODY, "SVC4006", "GUARD_SVC_FAILED_TO_PARSE_MSG_BODY",
    "Failed to parse received message body: %1", 400 },
  { GUARD_SVC_UNSUPPORTED_REQUEST_BODY_TYPE, "SVC4004", "GUARD_SVC_UNSUPPORTED_REQUEST_BODY_TYPE",
    "Unsupported request body type, expected '%1'", 415 },
  { GUARD_SVC_RESOURCE_NOT_FOUND, "SVC4003", "GUARD_SVC_RESOURCE_NOT_FOUND",
    "Requested resource was not found", 404 },
  { GUARD_SVC_MISSING_BODY_LENGTH, "SVC4007", "GUARD_SVC_MISSING_BODY_LENGTH",
    "Missing mandatory Content-Length header", 411 },
  { GUARD_POL_METHOD_NOT_ALLOWED, "POL4050", "GUARD_POL_METHOD_NOT_ALLOWED",
    "Method not allowed", 405 },
  { GUARD_POL_INTERNAL_ERROR, "POL5000", "GUARD_POL_INTERNAL_ERROR",
    "Internal Server Error. Please try again later", 500 },
};
static_assert(sizeof(guardError) / sizeof(guardError[0]) == GUARD_ERROR_MAX,
              "error table must cover every GuardErrorCode");

GuardError::GuardError(GuardErrorCode code) noexcept
  : kind_(&guardError[code])
{
}

bool GuardError::is(GuardErrorCode code) const noexcept {
  return kind_ && kind_->code == code;
}

int GuardError::http_status() const noexcept {
  return kind_->http_status;
}

const char* GuardError::reflect() const noexcept {
  return kind_->reflect;
}

const char* GuardError::id() const noexcept {
  return kind_->id;
}

GuardError& GuardError::putVariable(StringPiece value) {
  if (!vars_.empty())
    vars_ += '\t';
  vars_.append(value.data(), value.size());
  return *this;
}

std::string GuardError::describe() const {
  std::vector<StringPiece> vars;
  if (!vars_.empty())
    folly::split('\t', vars_, vars);

  std::string text = kind_->text;
  for (size_t i = 0; i < vars.size(); ++i) {
    std::string mark = "%" + std::to_string(i + 1);
    auto pos = text.find(mark);
    if (pos != std::string::npos)
      text.replace(pos, mark.size(), vars[i].str());
  }
  return text;
}

dynamic GuardError::toJson() const {
  dynamic vars = dynamic::array;
  if (!vars_.empty()) {
    folly::splitTo<StringPiece>('\t', vars_, std::back_inserter(vars));
  }

  dynamic body = dynamic::object
    ("messageId", kind_->id)
    ("text", kind_->text)
    ("variables", std::move(vars));

  StringPiece type = StringPiece(kind_->id, 3);
  dynamic exception;

  if (type == "POL") {
    exception = dynamic::object("policyException", std::move(body));
  } else if (type == "SVC" || type == "SES" || type == "EVD" || type == "EXT") {
    exception = dynamic::object("serviceException", std::move(body));
  } else {
    folly::assume_unreachable();
  }

  return exception;
}

std::string GuardError::toBody() const {
  return folly::toJson(dynamic::object("requestError", toJson()));
}
