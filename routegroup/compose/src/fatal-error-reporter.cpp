#include "routegroup/fatal-error-reporter.hpp"

#include <cstdlib>

#include "routegroup/composition-error.hpp"
#include "routegroup/log.hpp"

namespace routegroup {

void LoggingFatalErrorReporter::report(const CompositionError& error) {
  log::critical("Route composition failed - {}", error.what());
}

void TerminatingFatalErrorReporter::report(const CompositionError& error) {
  log::critical("Route composition failed - {}, exiting", error.what());
  if (auto logger = log::default_logger(); logger) {
    logger->flush();
  }
  std::exit(EXIT_FAILURE);
}

FatalErrorReporter& DefaultFatalErrorReporter() noexcept {
  static LoggingFatalErrorReporter gReporter;
  return gReporter;
}

void ReportAndThrow(FatalErrorReporter& reporter, const CompositionError& error) {
  reporter.report(error);
  throw error;
}

}  // namespace routegroup
