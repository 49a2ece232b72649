#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "routegroup/group.hpp"
#include "routegroup/http-request.hpp"
#include "routegroup/http-response.hpp"
#include "routegroup/request-handler.hpp"
#include "routegroup/serve-mux-config.hpp"
#include "routegroup/server-collaborator.hpp"

namespace routegroup {

// In-memory server collaborator dispatching requests on their exact path.
//
//   Group group;
//   group.use(AccessLog).add(Define("/hello", Hello));
//   ServeMux mux = Compile(group);
//   HttpResponse resp = mux.dispatch(HttpRequest("/hello"));
class ServeMux : public ServerCollaborator {
 public:
  // Throws std::invalid_argument if 'config' is invalid.
  explicit ServeMux(ServeMuxConfig config = {});

  // Binds 'handler' to 'path'.
  // Throws std::invalid_argument if the path or the handler is empty, or if the path is already bound
  // and the duplicate path policy is Reject.
  void bind(std::string_view path, RequestHandler handler) override;

  // Calls the handler bound to the request path, or returns the 404 response.
  [[nodiscard]] HttpResponse dispatch(const HttpRequest& request) const;

  [[nodiscard]] bool contains(std::string_view path) const noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return _handlers.size(); }

  [[nodiscard]] const ServeMuxConfig& config() const noexcept { return _config; }

 private:
  struct StringHash {
    using is_transparent = void;

    std::size_t operator()(std::string_view str) const noexcept { return std::hash<std::string_view>{}(str); }
  };

  ServeMuxConfig _config;
  std::unordered_map<std::string, RequestHandler, StringHash, std::equal_to<>> _handlers;
};

// Composes 'group' and installs it into a new ServeMux configured with 'config'.
// Throws CompositionError if the group cannot be composed, and std::invalid_argument if 'config' rejects
// one of its routes (for instance a duplicated path with the Reject policy).
[[nodiscard]] ServeMux Compile(Group& group, ServeMuxConfig config = {});

}  // namespace routegroup
