#ifndef GUARD_SESSION_GUARD_ERROR_H
#define GUARD_SESSION_GUARD_ERROR_H

#include <string>
#include <folly/FBString.h>
#include <folly/Range.h>

namespace folly {
  struct dynamic;
}

enum GuardErrorCode {
  GUARD_INVALID_TRANSITION = 0,
  GUARD_UNKNOWN_SESSION,
  GUARD_EXTERNAL_TIMEOUT,
  GUARD_MALFORMED_ENTITY,
  GUARD_DUPLICATE_ASSEMBLY,
  GUARD_ASSEMBLY_FAILED,
  GUARD_DUPLICATE_SESSION,
  GUARD_UNKNOWN_PACKAGE,
  GUARD_INVALID_SEQUENCE,
  GUARD_UNKNOWN_PERSONA,
  GUARD_SVC_MISSING_INFORMATION,
  GUARD_SVC_INVALID_PARAMETER_VALUE,
  GUARD_SVC_FAILED_TO_PARSE_MSG_BODY,
  GUARD_SVC_UNSUPPORTED_REQUEST_BODY_TYPE,
  GUARD_SVC_RESOURCE_NOT_FOUND,
  GUARD_SVC_MISSING_BODY_LENGTH,
  GUARD_POL_METHOD_NOT_ALLOWED,
  GUARD_POL_INTERNAL_ERROR,
  GUARD_ERROR_MAX,
};

class GuardErrorClass;
class GuardError {
 public:
  GuardError() noexcept = default;
  /* implicit */ GuardError(GuardErrorCode code) noexcept;

  GuardError& putVariable(folly::StringPiece value);
  folly::dynamic toJson() const;
  std::string toBody() const;
  std::string describe() const;

  operator bool() const noexcept { return kind_ != nullptr; }
  bool is(GuardErrorCode code) const noexcept;
  const char* reflect() const noexcept;
  const char* id() const noexcept;
  int http_status() const noexcept;

 private:
  const GuardErrorClass *kind_ = nullptr;
  folly::fbstring vars_;
};

#endif // GUARD_SESSION_GUARD_ERROR_H
