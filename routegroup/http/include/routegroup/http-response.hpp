#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "routegroup/http-constants.hpp"
#include "routegroup/http-header.hpp"
#include "routegroup/http-status-code.hpp"

namespace routegroup {

// In-memory HTTP response produced by request handlers and amended by middleware.
//
// All setters come in two flavors:
//   - lvalue overloads returning HttpResponse& for in-place modification,
//   - rvalue overloads returning HttpResponse&& for fluent construction of temporaries:
//       return HttpResponse(http::StatusCodeCreated).header("X-Id", "42").body("created");
class HttpResponse {
 public:
  // Creates a response with the given status code. If reason is empty, the canonical reason phrase is used.
  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK, std::string_view reason = {});

  // Creates a 200 response with the given body and content type.
  explicit HttpResponse(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain);

  [[nodiscard]] http::StatusCode status() const noexcept { return _statusCode; }

  [[nodiscard]] std::string_view reason() const noexcept { return _reason; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Returns the value of the first header named 'key' (case-insensitive), or std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept {
    return _headers.get(key);
  }

  // To distinguish between missing and present-but-empty header values, use headerValue().
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept {
    return headerValue(key).value_or(std::string_view{});
  }

  [[nodiscard]] http::HeadersRange headers() const noexcept { return _headers.fields(); }

  HttpResponse& status(http::StatusCode statusCode) & {
    setStatusCode(statusCode);
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode) && { return std::move(status(statusCode)); }

  HttpResponse& reason(std::string_view reason) & {
    _reason.assign(reason);
    return *this;
  }

  HttpResponse&& reason(std::string_view reason) && { return std::move(this->reason(reason)); }

  // Sets the header 'key' to 'value', replacing any previous value(s).
  HttpResponse& header(std::string_view key, std::string_view value) & {
    _headers.set(key, value);
    return *this;
  }

  HttpResponse&& header(std::string_view key, std::string_view value) && { return std::move(header(key, value)); }

  // Appends a header field, keeping the existing ones with the same name.
  HttpResponse& addHeader(std::string_view key, std::string_view value) & {
    _headers.append(key, value);
    return *this;
  }

  HttpResponse&& addHeader(std::string_view key, std::string_view value) && {
    return std::move(addHeader(key, value));
  }

  // Replaces the body. The Content-Type header is set to 'contentType' if the body is not empty,
  // and removed otherwise.
  HttpResponse& body(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain) & {
    setBodyInternal(body, contentType);
    return *this;
  }

  HttpResponse&& body(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain) && {
    return std::move(this->body(body, contentType));
  }

  // Appends data to the body. The Content-Type header is only set if none is present yet.
  HttpResponse& appendBody(std::string_view data) & {
    _body.append(data);
    ensureContentType();
    return *this;
  }

  HttpResponse&& appendBody(std::string_view data) && { return std::move(appendBody(data)); }

  // Inserts data at the beginning of the body. The Content-Type header is only set if none is present yet.
  HttpResponse& prependBody(std::string_view data) & {
    _body.insert(0, data);
    ensureContentType();
    return *this;
  }

  HttpResponse&& prependBody(std::string_view data) && { return std::move(prependBody(data)); }

 private:
  void setStatusCode(http::StatusCode statusCode);

  void setBodyInternal(std::string_view body, std::string_view contentType);

  void ensureContentType();

  http::StatusCode _statusCode;
  std::string _reason;
  std::string _body;
  http::Headers _headers;
};

}  // namespace routegroup
