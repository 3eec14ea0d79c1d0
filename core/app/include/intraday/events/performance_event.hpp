#pragma once

#include "intraday/domain/timestamp.hpp"

#include <map>
#include <string>

namespace intraday {

enum class PerformanceReportKind {
  Daily,
  Final,
};

inline const char* toString(PerformanceReportKind kind) {
  switch (kind) {
    case PerformanceReportKind::Daily: return "DAILY";
    case PerformanceReportKind::Final: return "FINAL";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// PerformanceEvent
// -----------------------------------------------------------------------------
// Flat metrics map emitted by PerformanceTracker at each day boundary and
// once at run end. Integer counters are carried as doubles so the whole map
// has one value type.
// -----------------------------------------------------------------------------
struct PerformanceEvent {
  PerformanceReportKind kind{PerformanceReportKind::Daily};
  std::map<std::string, double> metrics;
  Timestamp timestamp{};
};

}  // namespace intraday
