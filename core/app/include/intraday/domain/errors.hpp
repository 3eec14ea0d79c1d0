#pragma once

#include <stdexcept>
#include <string>

namespace intraday {

// -----------------------------------------------------------------------------
// ConfigurationError
// -----------------------------------------------------------------------------
//
// @brief  Raised when a configuration value makes an operation undefined
//         (e.g. percent-risk sizing with a zero stop-loss percent) or when
//         the configuration file names a section the engine does not know.
//
// @details
// Missing keys and unreadable files are NOT configuration errors: they fall
// back to documented defaults (see ConfigLoader). This exception is reserved
// for values that would otherwise produce an unbounded or meaningless result.
// -----------------------------------------------------------------------------
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& what)
      : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// DataError
// -----------------------------------------------------------------------------
//
// @brief  Raised when an inbound market/portfolio reading cannot be used for
//         a computation (e.g. a non-positive portfolio value in the daily
//         loss check).
//
// @details
// IntradayStrategy catches DataError per event, logs it, and skips that event.
// -----------------------------------------------------------------------------
class DataError : public std::runtime_error {
 public:
  explicit DataError(const std::string& what) : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// StateTransitionError
// -----------------------------------------------------------------------------
//
// @brief  Raised by PositionTracker on an illegal FLAT/OPEN transition
//         (opening an open position, closing a flat one).
//
// @details
// Indicates a programming error in the caller, hence std::logic_error.
// -----------------------------------------------------------------------------
class StateTransitionError : public std::logic_error {
 public:
  explicit StateTransitionError(const std::string& what)
      : std::logic_error(what) {}
};

}  // namespace intraday
