#include "routegroup/registration-item.hpp"

#include <utility>

namespace routegroup {

RegistrationItem::RegistrationItem() noexcept = default;

RegistrationItem::RegistrationItem(RegistrationItem&& other) noexcept : _value(std::move(other._value)) {
  other._value = Unrecognized{};
}

RegistrationItem& RegistrationItem::operator=(RegistrationItem&& other) noexcept {
  if (this != &other) {
    _value = std::move(other._value);
    other._value = Unrecognized{};
  }
  return *this;
}

RegistrationItem::~RegistrationItem() = default;

}  // namespace routegroup
