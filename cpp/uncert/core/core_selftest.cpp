/*
  Fragment 1.7 - Core Selftest (Errors, Logging, Advisories, Settings)

  Checks:
    1) Error carries its code and renders a stable what() line.
    2) Log level filtering and sink capture; sinks may log re-entrantly.
    3) Advisories reach the log sink tagged with their kind, subject to
       the level filter.
    4) Settings validation rejects unreadable separators.

  Non-zero return code indicates failure.
*/

#include <string>
#include <vector>

#include "uncert/core/advisory.hpp"
#include "uncert/core/error.hpp"
#include "uncert/core/logging.hpp"
#include "uncert/core/selftest.hpp"
#include "uncert/core/settings.hpp"

namespace uncert {
namespace {

using selftest::Harness;
using selftest::LogCapture;

void test_error_what(Harness& t) {
  const Error e(ErrorCode::kDomain, "boom", ThrowSite{"values.cpp", 12, "fn"});
  t.expect_eq_str(e.what(), "[uncert::Error code=Domain(4)] boom @ values.cpp:12 (fn)",
                  "what() carries code, message and location");
  t.expect_true(e.code() == ErrorCode::kDomain, "code() preserved");
  t.expect_eq_str(e.message(), "boom", "message() is the bare message");
  t.expect_eq_int(e.line(), 12, "line() preserved");
  t.expect_eq_str(e.site().function, "fn", "site() keeps the function name");

  const Error bare(ErrorCode::kOutOfRange, "past the end", ThrowSite{});
  t.expect_eq_str(bare.what(), "[uncert::Error code=OutOfRange(6)] past the end",
                  "what() without a throw site");

  t.expect_eq_str(to_string(ErrorCode::kTypeMismatch), "TypeMismatch", "TypeMismatch name");
  t.expect_eq_str(to_string(ErrorCode::kShapeMismatch), "ShapeMismatch", "ShapeMismatch name");
  t.expect_eq_str(to_string(ErrorCode::kConversionMismatch), "ConversionMismatch",
                  "ConversionMismatch name");
  t.expect_eq_str(to_string(ErrorCode::kOutOfRange), "OutOfRange", "OutOfRange name");

  t.expect_throws_code([] { UNCERT_ENSURE(1 + 1 == 3, ErrorCode::kInvalidArgument, "math"); },
                       ErrorCode::kInvalidArgument, "UNCERT_ENSURE throws on a false condition");
  t.expect_no_throw([] { UNCERT_ENSURE(true, ErrorCode::kInvalidArgument, "fine"); },
                    "UNCERT_ENSURE is silent on a true condition");
}

void test_logging(Harness& t) {
  LogCapture cap;
  set_log_level(LogLevel::INFO);

  log(LogLevel::DEBUG, "below threshold");
  log(LogLevel::INFO, "hello");
  log(LogLevel::ERROR, "bad");
  t.expect_eq_int(static_cast<long long>(cap.records().size()), 2, "DEBUG is filtered at INFO");
  t.expect_eq_str(cap.records().front().msg, "hello", "sink receives the message text");

  set_log_level(LogLevel::ERROR);
  cap.clear();
  log(LogLevel::WARN, "quiet");
  t.expect_true(cap.records().empty(), "WARN is filtered at ERROR");
  t.expect_true(get_log_level() == LogLevel::ERROR, "get_log_level reflects set_log_level");
  set_log_level(LogLevel::INFO);

  t.expect_eq_str(level_tag(LogLevel::WARN), "WARN", "level tag");
}

void test_reentrant_sink(Harness& t) {
  std::vector<std::string> seen;
  set_log_sink([&seen](LogLevel, const std::string& msg) {
    seen.push_back(msg);
    if (msg == "outer") log(LogLevel::INFO, "inner");
  });
  log(LogLevel::INFO, "outer");
  set_log_sink(nullptr);

  t.expect_eq_int(static_cast<long long>(seen.size()), 2, "a sink may log from inside the sink");
  t.expect_true(seen.size() == 2 && seen[0] == "outer" && seen[1] == "inner",
                "nested record follows the outer one");
}

void test_advisory(Harness& t) {
  LogCapture cap;
  advise(Advisory::kFloorDivision, "x");
  t.expect_eq_int(static_cast<long long>(cap.records().size()), 1, "one advisory record");
  t.expect_true(cap.records().front().level == LogLevel::WARN, "advisories log at WARN");
  t.expect_eq_str(cap.records().front().msg, "[advisory:floor-division] x", "advisory tag format");

  advise(Advisory::kCenterComparison, "y");
  t.expect_eq_int(static_cast<long long>(cap.count_containing("advisory:center-comparison")), 1,
                  "center-comparison tag");

  // Advisories obey the level filter; ERROR silences them.
  cap.clear();
  set_log_level(LogLevel::ERROR);
  advise(Advisory::kFloorDivision, "hidden");
  t.expect_true(cap.records().empty(), "advisories are silenced at ERROR");
  set_log_level(LogLevel::INFO);
  advise(Advisory::kFloorDivision, "shown");
  t.expect_eq_int(static_cast<long long>(cap.records().size()), 1,
                  "advisories return once the level is lowered");
}

void test_settings(Harness& t) {
  t.expect_no_throw([] { Settings::defaults().validate_or_throw(); }, "defaults are valid");

  const Settings d = Settings::defaults();
  t.expect_eq_str(d.format.plus_minus, " \xC2\xB1 ", "default plus-minus separator");
  t.expect_true(d.rounding.extra_digit_for_leading_one && d.rounding.carry_correction,
                "default rounding rules enabled");

  Settings s = Settings::defaults();
  s.format.plus_minus.clear();
  t.expect_throws_code([&s] { s.validate_or_throw(); }, ErrorCode::kInvalidArgument,
                       "empty plus-minus rejected");

  s = Settings::defaults();
  s.format.element_separator.clear();
  t.expect_throws_code([&s] { s.validate_or_throw(); }, ErrorCode::kInvalidArgument,
                       "empty element separator rejected");

  s = Settings::defaults();
  s.rounding.extra_digit_for_leading_one = false;
  t.expect_no_throw([&s] { s.validate_or_throw(); }, "rounding switches need no validation");
}

}  // namespace
}  // namespace uncert

int main() {
  using namespace uncert;
  selftest::Harness t("core");

  test_error_what(t);
  test_logging(t);
  test_reentrant_sink(t);
  test_advisory(t);
  test_settings(t);

  return t.finish();
}
