#include "routegroup/http-response.hpp"

#include <stdexcept>
#include <string_view>

#include "routegroup/http-constants.hpp"
#include "routegroup/http-status-code.hpp"

namespace routegroup {

HttpResponse::HttpResponse(http::StatusCode code, std::string_view reason) : _statusCode(code), _reason(reason) {
  if (code < 100 || code > 999) {
    throw std::invalid_argument("HTTP status code should be in the range [100, 999]");
  }
  if (_reason.empty()) {
    _reason.assign(http::ReasonPhraseFor(code));
  }
}

HttpResponse::HttpResponse(std::string_view body, std::string_view contentType) : HttpResponse(http::StatusCodeOK) {
  setBodyInternal(body, contentType);
}

void HttpResponse::setStatusCode(http::StatusCode statusCode) {
  if (statusCode < 100 || statusCode > 999) {
    throw std::invalid_argument("HTTP status code should be in the range [100, 999]");
  }
  const auto previousCanonicalReason = http::ReasonPhraseFor(_statusCode);
  _statusCode = statusCode;
  // keep user-provided reasons, only refresh canonical ones
  if (_reason.empty() || _reason == previousCanonicalReason) {
    _reason.assign(http::ReasonPhraseFor(statusCode));
  }
}

void HttpResponse::setBodyInternal(std::string_view body, std::string_view contentType) {
  _body.assign(body);
  if (_body.empty()) {
    _headers.erase(http::ContentType);
  } else if (!contentType.empty()) {
    _headers.set(http::ContentType, contentType);
  }
}

void HttpResponse::ensureContentType() {
  if (!_body.empty() && !_headers.get(http::ContentType)) {
    _headers.set(http::ContentType, http::ContentTypeTextPlain);
  }
}

}  // namespace routegroup
