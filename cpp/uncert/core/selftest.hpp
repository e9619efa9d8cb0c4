#pragma once
/*
================================================================================
Fragment 1.6: Core Selftest Harness
FILE: cpp/uncert/core/selftest.hpp

Purpose:
  - Framework-free checks shared by the *_selftest executables.
  - Each check prints "[ OK ]" or "[FAIL]" on stderr; finish() returns the
    process exit code (non-zero when anything failed).

Expected use:
    uncert::selftest::Harness t("measurement");
    t.expect_eq_str(m.to_string(), "30 ± 4", "addition literal");
    return t.finish();
================================================================================
*/

#include <algorithm>
#include <cstddef>
#include <cmath>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "uncert/core/error.hpp"
#include "uncert/core/logging.hpp"

namespace uncert::selftest {

// Relative/absolute closeness.
inline bool near(double a, double b, double rel = 1e-12, double abs = 1e-12) noexcept {
  const double da = std::fabs(a - b);
  if (da <= abs) return true;
  const double sc = std::max({std::fabs(a), std::fabs(b), abs});
  return da / sc <= rel;
}

class Harness {
 public:
  explicit Harness(std::string suite) : suite_(std::move(suite)) {}

  void fail(std::string_view msg) {
    ++fail_count_;
    std::cerr << "[FAIL] " << suite_ << ": " << msg << "\n";
  }

  void pass(std::string_view msg) {
    std::cerr << "[ OK ] " << suite_ << ": " << msg << "\n";
  }

  void expect_true(bool v, std::string_view msg) {
    if (!v) fail(msg);
    else pass(msg);
  }

  void expect_eq_str(const std::string& got, const std::string& want, std::string_view msg) {
    if (got != want) {
      fail(msg);
      std::cerr << "  got:  " << got << "\n";
      std::cerr << "  want: " << want << "\n";
    } else {
      pass(msg);
    }
  }

  void expect_eq_int(long long got, long long want, std::string_view msg) {
    if (got != want) {
      fail(msg);
      std::cerr << "  got " << got << ", want " << want << "\n";
    } else {
      pass(msg);
    }
  }

  void expect_near(double got, double want, std::string_view msg, double rel = 1e-12) {
    if (!near(got, want, rel)) {
      fail(msg);
      std::cerr.precision(17);
      std::cerr << "  got " << got << ", want " << want << "\n";
    } else {
      pass(msg);
    }
  }

  // Runs fn and expects an uncert::Error with the given code.
  template <typename Fn>
  void expect_throws_code(Fn&& fn, ErrorCode code, std::string_view msg) {
    try {
      fn();
    } catch (const Error& e) {
      if (e.code() == code) {
        pass(msg);
      } else {
        fail(msg);
        std::cerr << "  wrong code: " << e.what() << "\n";
      }
      return;
    } catch (const std::exception& e) {
      fail(msg);
      std::cerr << "  unexpected exception: " << e.what() << "\n";
      return;
    }
    fail(msg);
    std::cerr << "  expected " << to_string(code) << ", nothing thrown\n";
  }

  // Runs fn and fails the check (instead of aborting the suite) if it throws.
  template <typename Fn>
  void expect_no_throw(Fn&& fn, std::string_view msg) {
    try {
      fn();
      pass(msg);
    } catch (const std::exception& e) {
      fail(msg);
      std::cerr << "  threw: " << e.what() << "\n";
    }
  }

  int failures() const noexcept { return fail_count_; }

  int finish() const {
    if (fail_count_ == 0) {
      std::cerr << "[PASS] " << suite_ << "\n";
      return 0;
    }
    std::cerr << "[FAILED] " << suite_ << ": " << fail_count_ << " check(s)\n";
    return 1;
  }

 private:
  std::string suite_;
  int fail_count_ = 0;
};

// Routes log records into memory for the lifetime of the object.
class LogCapture {
 public:
  struct Record {
    LogLevel level;
    std::string msg;
  };

  LogCapture() {
    set_log_sink([this](LogLevel lvl, const std::string& msg) { records_.push_back({lvl, msg}); });
  }
  ~LogCapture() { set_log_sink(nullptr); }

  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  const std::vector<Record>& records() const noexcept { return records_; }
  void clear() noexcept { records_.clear(); }

  std::size_t count_containing(std::string_view needle) const {
    std::size_t n = 0;
    for (const auto& r : records_) {
      if (r.msg.find(needle) != std::string::npos) ++n;
    }
    return n;
  }

 private:
  std::vector<Record> records_;
};

}  // namespace uncert::selftest
