#include "uncert/core/advisory.hpp"

#include "uncert/core/logging.hpp"

namespace uncert {

const char* to_string(Advisory a) noexcept {
  switch (a) {
    case Advisory::kFloorDivision:    return "floor-division";
    case Advisory::kCenterComparison: return "center-comparison";
    default:                          return "unknown";
  }
}

void advise(Advisory kind, const std::string& msg) {
  log(LogLevel::WARN, std::string("[advisory:") + to_string(kind) + "] " + msg);
}

} // namespace uncert
