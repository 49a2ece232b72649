#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "routegroup/http-constants.hpp"
#include "routegroup/http-header.hpp"

namespace routegroup {

// In-memory HTTP request handed to request handlers.
// It carries what handlers and middleware typically look at: target path, method token, headers and body.
class HttpRequest {
 public:
  HttpRequest() = default;

  explicit HttpRequest(std::string_view path, std::string_view method = http::GET);

  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  [[nodiscard]] std::string_view method() const noexcept { return _method; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Returns the value of the given header (case-insensitive lookup) or std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept {
    return _headers.get(key);
  }

  // Like headerValue() but returns an empty string_view when the header is absent.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept {
    return headerValue(key).value_or(std::string_view{});
  }

  [[nodiscard]] http::HeadersRange headers() const noexcept { return _headers.fields(); }

  HttpRequest& path(std::string_view path) & {
    _path.assign(path);
    return *this;
  }

  HttpRequest&& path(std::string_view path) && { return std::move(this->path(path)); }

  HttpRequest& method(std::string_view method) & {
    _method.assign(method);
    return *this;
  }

  HttpRequest&& method(std::string_view method) && { return std::move(this->method(method)); }

  // Sets (or replaces) the header named 'key'.
  HttpRequest& header(std::string_view key, std::string_view value) & {
    _headers.set(key, value);
    return *this;
  }

  HttpRequest&& header(std::string_view key, std::string_view value) && { return std::move(header(key, value)); }

  HttpRequest& body(std::string_view body) & {
    _body.assign(body);
    return *this;
  }

  HttpRequest&& body(std::string_view body) && { return std::move(this->body(body)); }

 private:
  std::string _path{"/"};
  std::string _method{http::GET};
  std::string _body;
  http::Headers _headers;
};

}  // namespace routegroup
