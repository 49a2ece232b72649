#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "routegroup/composition-error.hpp"
#include "routegroup/fatal-error-reporter.hpp"
#include "routegroup/vector.hpp"

namespace routegroup::test {

// Records reported errors instead of logging them.
class CapturingFatalErrorReporter : public FatalErrorReporter {
 public:
  void report(const CompositionError& error) override;

  [[nodiscard]] std::size_t count() const noexcept { return _codes.size(); }

  [[nodiscard]] std::size_t count(CompositionError::Code code) const noexcept;

  [[nodiscard]] bool empty() const noexcept { return _codes.empty(); }

  // Precondition: !empty()
  [[nodiscard]] CompositionError::Code lastCode() const noexcept { return _codes.back(); }

  // Precondition: !empty()
  [[nodiscard]] std::string_view lastMessage() const noexcept { return _messages.back(); }

  void clear() noexcept;

 private:
  vector<CompositionError::Code> _codes;
  vector<std::string> _messages;
};

}  // namespace routegroup::test
