#pragma once

#include <string_view>

#include "routegroup/http-status-code.hpp"

namespace routegroup::http {

// Header names are kept in their canonical form. Lookups are case-insensitive.

// Methods
inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view POST = "POST";
inline constexpr std::string_view DELETE = "DELETE";

// Standard Header Field Names
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Authorization = "Authorization";

// Reason phrases
inline constexpr std::string_view ReasonOK = "OK";
inline constexpr std::string_view ReasonCreated = "Created";
inline constexpr std::string_view ReasonUnauthorized = "Unauthorized";
inline constexpr std::string_view ReasonForbidden = "Forbidden";
inline constexpr std::string_view ReasonNotFound = "Not Found";

// Content type
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";

// Return the canonical reason phrase for a subset of status codes we care about.
constexpr std::string_view ReasonPhraseFor(http::StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeCreated:
      return ReasonCreated;
    case StatusCodeUnauthorized:
      return ReasonUnauthorized;
    case StatusCodeForbidden:
      return ReasonForbidden;
    case StatusCodeNotFound:
      return ReasonNotFound;
    default:
      return {};
  }
}

}  // namespace routegroup::http
