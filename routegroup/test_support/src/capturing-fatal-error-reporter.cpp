#include "routegroup/capturing-fatal-error-reporter.hpp"

#include <algorithm>
#include <cstddef>

#include "routegroup/composition-error.hpp"

namespace routegroup::test {

void CapturingFatalErrorReporter::report(const CompositionError& error) {
  _codes.push_back(error.code());
  _messages.emplace_back(error.what());
}

std::size_t CapturingFatalErrorReporter::count(CompositionError::Code code) const noexcept {
  return static_cast<std::size_t>(std::ranges::count(_codes, code));
}

void CapturingFatalErrorReporter::clear() noexcept {
  _codes.clear();
  _messages.clear();
}

}  // namespace routegroup::test
