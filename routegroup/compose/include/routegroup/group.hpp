#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <utility>

#include "routegroup/composition-error.hpp"
#include "routegroup/fatal-error-reporter.hpp"
#include "routegroup/flat-dispatch-table.hpp"
#include "routegroup/handler-unit.hpp"
#include "routegroup/middleware.hpp"
#include "routegroup/registration-item.hpp"
#include "routegroup/server-collaborator.hpp"
#include "routegroup/vector.hpp"

namespace routegroup {

// Builder of routes sharing the same middleware.
//
// A Group holds an ordered list of HandlerUnits and an ordered list of Middleware. Its whole middleware
// list is applied to every unit it owns when it is composed, whatever the registration order of units
// and middleware: the first attached middleware is the outermost wrapper.
//
// Groups nest: registering a group into another one first composes it, then appends its wrapped units.
// The subgroup's middleware is therefore never visible to the parent's other units, while the parent's
// middleware wraps the subgroup's units like any other of its own.
//
//   Group api;
//   api.use(Authenticate).add(Define("/api/users", ListUsers));
//
//   Group root;
//   root.use(AccessLog).add(Define("/health", Health), std::move(api));
//   ServeMux mux = Compile(root);
//
// Lifecycle: Building -> Composed, after which the group does not accept any registration.
// A Composed group registered as rvalue into another group gives its units away and becomes Consumed:
// composing or registering it again fails with GroupAlreadyComposed instead of silently adding no route.
// Any fatal error (see CompositionError) is reported to the group's FatalErrorReporter then thrown,
// and leaves the group Broken: every further operation on it fails again with the same error code.
//
// A Group is a build-time object, it is not thread safe.
class Group {
 public:
  enum class State : std::uint8_t { Building, Composed, Consumed, Broken };

  // Creates an empty group reporting fatal errors to the DefaultFatalErrorReporter.
  Group() noexcept : Group(DefaultFatalErrorReporter()) {}

  // Creates an empty group reporting fatal errors to 'reporter', which must outlive the group.
  explicit Group(FatalErrorReporter& reporter) noexcept : _pReporter(&reporter) {}

  // Registers units, path/handler pairs and subgroups, in order.
  // All items are validated before any subgroup is touched, and nothing is appended if one of them is invalid.
  // Subgroups are then composed in order: if one of them fails to compose, the subgroups before it are left
  // composed (but not consumed) and nothing is appended either.
  template <class... Items>
  Group& add(Items&&... items) {
    if constexpr (sizeof...(Items) == 0) {
      return add(std::span<RegistrationItem>{});
    } else {
      RegistrationItem registrationItems[] = {RegistrationItem(std::forward<Items>(items))...};
      return add(std::span<RegistrationItem>(registrationItems));
    }
  }

  Group& add(std::span<RegistrationItem> items);

  // Attaches middleware, in order. At least one middleware should be given, and none of them may be empty.
  template <MiddlewareLike... Mws>
  Group& use(Mws&&... middlewares) {
    if constexpr (sizeof...(Mws) == 0) {
      return use(MiddlewareRange{});
    } else {
      const Middleware all[] = {Middleware(std::forward<Mws>(middlewares))...};
      return use(MiddlewareRange(all));
    }
  }

  Group& use(MiddlewareRange middlewares);

  // Applies the group's middleware to all its units and returns the resulting table.
  // The middleware is spent: composing an already composed group returns the same table.
  // Fails with GroupAlreadyComposed if the group has been consumed by another group.
  const FlatDispatchTable& compose();

  // Composes the group and installs the result into 'server'.
  // If 'server' rejects a unit (see Install), the units before it stay bound.
  ServerCollaborator& compile(ServerCollaborator& server);

  [[nodiscard]] State state() const noexcept { return _state; }

  // Units in registration order. They are wrapped once the group is composed.
  [[nodiscard]] HandlerUnitRange units() const noexcept { return {_units.data(), _units.size()}; }

  // Attached middleware in registration order. Empty once the group is composed.
  [[nodiscard]] MiddlewareRange middleware() const noexcept { return {_middleware.data(), _middleware.size()}; }

  [[nodiscard]] FatalErrorReporter& reporter() const noexcept { return *_pReporter; }

 private:
  // Reports and throws a new error, leaving the group Broken.
  [[noreturn]] void fail(CompositionError::Code code, std::string_view details);

  // Throws if the group cannot accept 'operation' anymore.
  void checkBuilding(std::string_view operation);

  void checkNotBroken(std::string_view operation);

  // Checks 'item' without any side effect on it.
  void validate(RegistrationItem& item, std::size_t pos, std::span<RegistrationItem> items);

  // Appends the units of an already validated item to 'out'. Cannot fail.
  static void collect(RegistrationItem& item, FlatDispatchTable& out);

  FatalErrorReporter* _pReporter;
  vector<Middleware> _middleware;
  FlatDispatchTable _units;
  State _state{State::Building};
  CompositionError::Code _brokenCode{};
};

}  // namespace routegroup
