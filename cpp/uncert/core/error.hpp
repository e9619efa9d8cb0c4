#pragma once
/*
================================================================================
Fragment 1.2: Core Error Codes + Exception
FILE: cpp/uncert/core/error.hpp

Purpose:
  - One exception type for every value-construction or operation failure,
    carrying a stable code so callers can catch by category.
  - File/line/function of the throw site for auditability.

Notes:
  - Advisory conditions (floor-division of an uncertainty, center-only
    comparison) are NOT errors. See core/advisory.hpp.
================================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace uncert {

// Keep these values stable once public.
enum class ErrorCode : int {
  kTypeMismatch       = 1,
  kShapeMismatch      = 2,
  kConversionMismatch = 3,
  kDomain             = 4,
  kInvalidArgument    = 5,
  kOutOfRange         = 6,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kTypeMismatch:       return "TypeMismatch";
    case ErrorCode::kShapeMismatch:      return "ShapeMismatch";
    case ErrorCode::kConversionMismatch: return "ConversionMismatch";
    case ErrorCode::kDomain:             return "Domain";
    case ErrorCode::kInvalidArgument:    return "InvalidArgument";
    case ErrorCode::kOutOfRange:         return "OutOfRange";
    default:                             return "Unknown";
  }
}

// Throw site captured by UNCERT_THROW / UNCERT_ENSURE.
struct ThrowSite {
  const char* file = "";
  int line = 0;
  const char* function = "";
};

class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code, std::string message, ThrowSite site)
      : std::runtime_error(describe(code, message, site)),
        code_(code),
        message_(std::move(message)),
        site_(site) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const ThrowSite& site() const noexcept { return site_; }
  int line() const noexcept { return site_.line; }

 private:
  // "[uncert::Error code=Name(n)] msg @ file:line (func)"
  static std::string describe(ErrorCode code, const std::string& msg, const ThrowSite& site) {
    std::ostringstream oss;
    oss << "[uncert::Error code=" << to_string(code) << "(" << static_cast<int>(code) << ")] "
        << msg;
    if (site.file && *site.file) {
      oss << " @ " << site.file << ":" << site.line;
      if (site.function && *site.function) oss << " (" << site.function << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  ThrowSite site_;
};

[[noreturn]] inline void throw_error(ErrorCode code, std::string message, ThrowSite site) {
  throw Error(code, std::move(message), site);
}

inline void ensure(bool ok, ErrorCode code, const char* message, ThrowSite site) {
  if (ok) return;
  throw_error(code, message ? message : "<empty error message>", site);
}

}  // namespace uncert

#define UNCERT_SITE ::uncert::ThrowSite{__FILE__, __LINE__, __func__}
#define UNCERT_THROW(CODE, MSG) ::uncert::throw_error((CODE), (MSG), UNCERT_SITE)
#define UNCERT_ENSURE(EXPR, CODE, MSG) ::uncert::ensure((EXPR), (CODE), (MSG), UNCERT_SITE)
