#include "routegroup/group.hpp"

#include <cstddef>
#include <span>
#include <string_view>
#include <utility>
#include <variant>

#include <fmt/format.h>

#include "routegroup/composition-error.hpp"
#include "routegroup/fatal-error-reporter.hpp"
#include "routegroup/flat-dispatch-table.hpp"
#include "routegroup/handler-unit.hpp"
#include "routegroup/install.hpp"
#include "routegroup/log.hpp"
#include "routegroup/middleware.hpp"
#include "routegroup/registration-item.hpp"
#include "routegroup/server-collaborator.hpp"

namespace routegroup {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

constexpr std::string_view StateName(Group::State state) {
  switch (state) {
    case Group::State::Building:
      return "building";
    case Group::State::Composed:
      return "composed";
    case Group::State::Consumed:
      return "consumed";
    case Group::State::Broken:
      return "broken";
    default:
      return "unknown";
  }
}

}  // namespace

Group& Group::add(std::span<RegistrationItem> items) {
  checkBuilding("register routes");

  FlatDispatchTable resolved;
  try {
    for (std::size_t pos = 0; pos < items.size(); ++pos) {
      validate(items[pos], pos, items);
    }
    for (RegistrationItem& item : items) {
      item.visit(Overloaded{[](const RegistrationItem::GroupRef& groupRef) { groupRef.pGroup->compose(); },
                            [](const auto&) {}});
    }
  } catch (const CompositionError& err) {
    // Already reported, by this group or by a subgroup.
    _state = State::Broken;
    _brokenCode = err.code();
    throw;
  }

  for (RegistrationItem& item : items) {
    collect(item, resolved);
  }

  _units.reserve(_units.size() + resolved.size());
  for (HandlerUnit& unit : resolved) {
    _units.push_back(std::move(unit));
  }
  log::debug("Registered {} item(s), group now holds {} unit(s)", items.size(), _units.size());
  return *this;
}

void Group::validate(RegistrationItem& item, std::size_t pos, std::span<RegistrationItem> items) {
  item.visit(Overloaded{
      [this, pos](const HandlerUnit& unit) {
        // A moved-from unit may have lost its handler and its path.
        if (!unit.handler()) {
          fail(CompositionError::Code::InvalidHandler,
               fmt::format("item #{} is a unit with an empty request handler for route '{}'", pos, unit.path()));
        }
        if (unit.path().empty()) {
          fail(CompositionError::Code::InvalidHandler, fmt::format("item #{} is a unit with an empty path", pos));
        }
      },
      [this, pos](const RegistrationItem::PathHandler& pathHandler) {
        if (!pathHandler.handler) {
          fail(CompositionError::Code::InvalidHandler,
               fmt::format("item #{} pairs route '{}' with an empty request handler", pos, pathHandler.path));
        }
        if (pathHandler.path.empty()) {
          fail(CompositionError::Code::InvalidHandler, fmt::format("item #{} pairs an empty path", pos));
        }
      },
      [this, pos, items](const RegistrationItem::GroupRef& groupRef) {
        const Group& subGroup = *groupRef.pGroup;
        if (&subGroup == this) {
          fail(CompositionError::Code::UnrecognizedRegistrationType,
               fmt::format("item #{} is the group itself, a group cannot be registered into itself", pos));
        }
        if (subGroup._state == State::Consumed) {
          fail(CompositionError::Code::GroupAlreadyComposed,
               fmt::format("item #{} is a group whose units were already moved into another group", pos));
        }
        // A moved group gives its units away, it cannot appear twice in the same call.
        for (std::size_t prevPos = 0; prevPos < pos; ++prevPos) {
          items[prevPos].visit(Overloaded{
              [this, pos, prevPos, &groupRef](const RegistrationItem::GroupRef& prevRef) {
                if (prevRef.pGroup == groupRef.pGroup && (prevRef.consume || groupRef.consume)) {
                  fail(CompositionError::Code::GroupAlreadyComposed,
                       fmt::format("item #{} registers the same group as item #{} and one of them is moved", pos,
                                   prevPos));
                }
              },
              [](const auto&) {}});
        }
      },
      [this, pos](const RegistrationItem::Unrecognized& unrecognized) {
        if (unrecognized.typeName.empty()) {
          fail(CompositionError::Code::UnrecognizedRegistrationType, fmt::format("item #{} is empty", pos));
        }
        fail(CompositionError::Code::UnrecognizedRegistrationType,
             fmt::format("item #{} of type {} ({}) is neither a HandlerUnit, a Group nor a path/handler pair", pos,
                         unrecognized.typeName, unrecognized.contents));
      }});
}

void Group::collect(RegistrationItem& item, FlatDispatchTable& out) {
  item.visit(Overloaded{[&out](HandlerUnit& unit) { out.push_back(std::move(unit)); },
                        [&out](RegistrationItem::PathHandler& pathHandler) {
                          out.emplace_back(pathHandler.path, std::move(pathHandler.handler));
                        },
                        [&out](const RegistrationItem::GroupRef& groupRef) {
                          Group& subGroup = *groupRef.pGroup;
                          if (groupRef.consume) {
                            for (HandlerUnit& unit : subGroup._units) {
                              out.push_back(std::move(unit));
                            }
                            subGroup._units.clear();
                            subGroup._state = State::Consumed;
                          } else {
                            for (const HandlerUnit& unit : subGroup._units) {
                              out.push_back(unit);
                            }
                          }
                        },
                        [](const RegistrationItem::Unrecognized&) {}});
}

Group& Group::use(MiddlewareRange middlewares) {
  checkBuilding("attach middleware");

  if (middlewares.empty()) {
    fail(CompositionError::Code::InvalidMiddleware, "no middleware given");
  }
  for (std::size_t pos = 0; pos < middlewares.size(); ++pos) {
    if (!middlewares[pos]) {
      fail(CompositionError::Code::InvalidMiddleware, fmt::format("middleware #{} is empty", pos));
    }
  }

  _middleware.reserve(_middleware.size() + middlewares.size());
  for (const Middleware& mw : middlewares) {
    _middleware.push_back(mw);
  }
  log::debug("Attached {} middleware, group now holds {} middleware", middlewares.size(), _middleware.size());
  return *this;
}

const FlatDispatchTable& Group::compose() {
  checkNotBroken("compose");
  if (_state == State::Consumed) {
    ReportAndThrow(*_pReporter, CompositionError(CompositionError::Code::GroupAlreadyComposed,
                                                 "cannot compose, group units were moved into another group"));
  }
  if (_state == State::Composed) {
    return _units;
  }

  // Wrap into a scratch table so that the group is never left half composed.
  FlatDispatchTable wrapped;
  wrapped.reserve(_units.size());
  try {
    for (std::size_t pos = 0; pos < _units.size(); ++pos) {
      const HandlerUnit& unit = _units[pos];
      if (!unit._handler) {
        fail(CompositionError::Code::NilHandlerInChain,
             fmt::format("unit #{} for route '{}' has an empty request handler", pos, unit._path));
      }
      wrapped.push_back(unit);
      wrapped.back()._handler = ApplyMiddleware(middleware(), unit._handler, unit._path, *_pReporter);
    }
  } catch (const CompositionError& err) {
    _state = State::Broken;
    _brokenCode = err.code();
    throw;
  }

  log::debug("Composed {} unit(s) with {} middleware", wrapped.size(), _middleware.size());

  _units = std::move(wrapped);
  _middleware.clear();
  _state = State::Composed;
  return _units;
}

ServerCollaborator& Group::compile(ServerCollaborator& server) {
  const FlatDispatchTable& table = compose();
  return Install(HandlerUnitRange(table.data(), table.size()), server);
}

void Group::fail(CompositionError::Code code, std::string_view details) {
  _state = State::Broken;
  _brokenCode = code;
  ReportAndThrow(*_pReporter, CompositionError(code, details));
}

void Group::checkNotBroken(std::string_view operation) {
  if (_state == State::Broken) {
    ReportAndThrow(*_pReporter,
                   CompositionError(_brokenCode, fmt::format("cannot {}, group is broken by an earlier error", operation)));
  }
}

void Group::checkBuilding(std::string_view operation) {
  checkNotBroken(operation);
  if (_state != State::Building) {
    // The composed table stays valid, so the group is not marked Broken.
    ReportAndThrow(*_pReporter, CompositionError(CompositionError::Code::GroupAlreadyComposed,
                                                 fmt::format("cannot {}, group is {}", operation, StateName(_state))));
  }
}

}  // namespace routegroup
