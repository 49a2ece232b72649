#include "routegroup/http-header.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string_view>

#include "routegroup/string-equal-ignore-case.hpp"

namespace routegroup::http {

std::optional<std::string_view> Headers::get(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(_fields, [name](const Header& field) { return CaseInsensitiveEqual(field.name, name); });
  if (it == _fields.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

void Headers::set(std::string_view name, std::string_view value) {
  auto it = std::ranges::find_if(_fields, [name](const Header& field) { return CaseInsensitiveEqual(field.name, name); });
  if (it == _fields.end()) {
    append(name, value);
    return;
  }
  it->value.assign(value);
  const auto firstPos = static_cast<std::size_t>(it - _fields.begin());
  auto last = std::remove_if(_fields.begin() + static_cast<std::ptrdiff_t>(firstPos) + 1, _fields.end(),
                             [name](const Header& field) { return CaseInsensitiveEqual(field.name, name); });
  _fields.erase(last, _fields.end());
}

void Headers::append(std::string_view name, std::string_view value) {
  _fields.push_back(Header{std::string(name), std::string(value)});
}

std::size_t Headers::erase(std::string_view name) {
  const auto sizeBefore = _fields.size();
  auto last = std::remove_if(_fields.begin(), _fields.end(),
                             [name](const Header& field) { return CaseInsensitiveEqual(field.name, name); });
  _fields.erase(last, _fields.end());
  return sizeBefore - _fields.size();
}

}  // namespace routegroup::http
