#pragma once

#include "routegroup/composition-error.hpp"

namespace routegroup {

// Capability notified of every fatal composition error, right before it is thrown.
// It is injected into groups (and the few free functions that may fail) so that the policy
// applied on misconfiguration (log, halt the process, record in tests) is chosen by the caller.
class FatalErrorReporter {
 public:
  FatalErrorReporter() noexcept = default;

  FatalErrorReporter(const FatalErrorReporter&) = delete;
  FatalErrorReporter& operator=(const FatalErrorReporter&) = delete;

  virtual ~FatalErrorReporter() = default;

  // Called exactly once per fatal error. Implementations may terminate the process.
  virtual void report(const CompositionError& error) = 0;
};

// Logs the error at critical level. The error is then thrown to the caller.
class LoggingFatalErrorReporter : public FatalErrorReporter {
 public:
  void report(const CompositionError& error) override;
};

// Logs the error at critical level, flushes the logger and terminates the process with EXIT_FAILURE.
// Use it to refuse to start a server whose routes are misconfigured.
class TerminatingFatalErrorReporter : public FatalErrorReporter {
 public:
  [[noreturn]] void report(const CompositionError& error) override;
};

// Process-wide LoggingFatalErrorReporter used when none is injected. It is stateless.
FatalErrorReporter& DefaultFatalErrorReporter() noexcept;

// Reports 'error' to 'reporter' then throws it.
[[noreturn]] void ReportAndThrow(FatalErrorReporter& reporter, const CompositionError& error);

}  // namespace routegroup
