#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "routegroup/vector.hpp"

namespace routegroup::http {

struct Header {
  std::string name;
  std::string value;
};

using HeadersRange = std::span<const Header>;

// Ordered list of header fields, with case-insensitive name lookup.
// Duplicate names are allowed (see append), set replaces the first occurrence and drops the others.
class Headers {
 public:
  // Returns the value of the first header named 'name', or std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

  void set(std::string_view name, std::string_view value);

  void append(std::string_view name, std::string_view value);

  // Removes every header named 'name'. Returns the number of removed fields.
  std::size_t erase(std::string_view name);

  [[nodiscard]] HeadersRange fields() const noexcept { return {_fields.data(), _fields.size()}; }

  [[nodiscard]] std::size_t size() const noexcept { return _fields.size(); }

  [[nodiscard]] bool empty() const noexcept { return _fields.empty(); }

 private:
  vector<Header> _fields;
};

}  // namespace routegroup::http
