#include "routegroup/serve-mux.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "routegroup/group.hpp"
#include "routegroup/http-request.hpp"
#include "routegroup/http-response.hpp"
#include "routegroup/http-status-code.hpp"
#include "routegroup/log.hpp"
#include "routegroup/request-handler.hpp"
#include "routegroup/serve-mux-config.hpp"

namespace routegroup {

ServeMux::ServeMux(ServeMuxConfig config) : _config(std::move(config)) { _config.validate(); }

void ServeMux::bind(std::string_view path, RequestHandler handler) {
  if (path.empty()) {
    throw std::invalid_argument("Cannot bind an empty path");
  }
  if (!handler) {
    throw std::invalid_argument("Cannot bind an empty request handler");
  }
  auto it = _handlers.find(path);
  if (it == _handlers.end()) {
    _handlers.emplace(std::string(path), std::move(handler));
    return;
  }
  if (_config.duplicatePathPolicy == ServeMuxConfig::DuplicatePathPolicy::Reject) {
    throw std::invalid_argument(std::string("Path '").append(path).append("' is already bound"));
  }
  log::warn("Path '{}' is already bound, overwriting its handler", path);
  it->second = std::move(handler);
}

HttpResponse ServeMux::dispatch(const HttpRequest& request) const {
  auto it = _handlers.find(request.path());
  if (it == _handlers.end()) {
    log::debug("No handler bound for path '{}'", request.path());
    return HttpResponse(http::StatusCodeNotFound).body(_config.notFoundBody);
  }
  return it->second(request);
}

bool ServeMux::contains(std::string_view path) const noexcept { return _handlers.contains(path); }

ServeMux Compile(Group& group, ServeMuxConfig config) {
  ServeMux mux(std::move(config));
  group.compile(mux);
  log::info("Compiled {} route(s)", mux.size());
  return mux;
}

}  // namespace routegroup
