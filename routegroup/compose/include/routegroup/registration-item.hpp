#pragma once

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/core.h>

#include "routegroup/handler-unit.hpp"
#include "routegroup/request-handler.hpp"
#include "routegroup/type-name.hpp"

namespace routegroup {

class Group;

namespace detail {

template <class T>
struct IsPair : std::false_type {};

template <class F, class S>
struct IsPair<std::pair<F, S>> : std::true_type {};

}  // namespace detail

// A std::pair of a path and a request handler, the loose form of a HandlerUnit.
template <class T>
concept PathHandlerPairing = detail::IsPair<std::remove_cvref_t<T>>::value &&
                             std::convertible_to<decltype(std::declval<T>().first), std::string_view> &&
                             std::convertible_to<decltype(std::declval<T>().second), RequestHandler>;

// One argument of Group::add, as a closed sum type.
//
// Recognized items are HandlerUnits, Groups and path/handler pairings. Any other value is captured
// as an Unrecognized item (with its type name and, when printable, its contents) so that the group
// can fail with a meaningful UnrecognizedRegistrationType error.
//
// Groups are referenced, not copied: a RegistrationItem is meant to live only during the Group::add call.
// A group passed as lvalue is composed in place; a group passed as rvalue has its composed units moved out.
class RegistrationItem {
 public:
  enum class Kind : std::uint8_t { Unrecognized, Unit, Group, PathHandler };

  // An empty typeName denotes an empty (default constructed or moved-from) item.
  struct Unrecognized {
    std::string typeName;
    std::string contents;
  };

  struct GroupRef {
    routegroup::Group* pGroup;
    bool consume;
  };

  struct PathHandler {
    std::string path;
    RequestHandler handler;
  };

  // Empty item, unrecognized.
  RegistrationItem() noexcept;

  RegistrationItem(HandlerUnit unit) noexcept : _value(std::in_place_type<HandlerUnit>, std::move(unit)) {}

  RegistrationItem(routegroup::Group& group) noexcept : _value(GroupRef{&group, false}) {}

  RegistrationItem(routegroup::Group&& group) noexcept : _value(GroupRef{&group, true}) {}

  RegistrationItem(const routegroup::Group&) = delete;

  template <PathHandlerPairing P>
  RegistrationItem(P&& pairing)
      : _value(PathHandler{std::string(std::string_view(std::forward<P>(pairing).first)),
                           RequestHandler(std::forward<P>(pairing).second)}) {}

  template <class T>
    requires(!std::same_as<std::remove_cvref_t<T>, RegistrationItem> &&
             !std::same_as<std::remove_cvref_t<T>, routegroup::Group> && !std::convertible_to<T, HandlerUnit> &&
             !PathHandlerPairing<T>)
  RegistrationItem(T&& value) : _value(Unrecognized{TypeName<std::remove_cvref_t<T>>(), DescribeContents(value)}) {}

  // A moved-from item becomes an empty, unrecognized one.
  RegistrationItem(RegistrationItem&& other) noexcept;
  RegistrationItem& operator=(RegistrationItem&& other) noexcept;

  RegistrationItem(const RegistrationItem&) = delete;
  RegistrationItem& operator=(const RegistrationItem&) = delete;

  ~RegistrationItem();

  [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(_value.index()); }

  template <class Visitor>
  decltype(auto) visit(Visitor&& visitor) {
    return std::visit(std::forward<Visitor>(visitor), _value);
  }

 private:
  template <class T>
  static std::string DescribeContents(const T& value) {
    if constexpr (fmt::is_formattable<std::remove_cvref_t<T>>::value) {
      return fmt::format("{}", value);
    } else {
      return "<not printable>";
    }
  }

  // Alternatives are in the order of Kind.
  std::variant<Unrecognized, HandlerUnit, GroupRef, PathHandler> _value;
};

}  // namespace routegroup
