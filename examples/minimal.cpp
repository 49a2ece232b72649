#include <routegroup/routegroup.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

using namespace routegroup;

namespace {

Middleware ServerHeader(std::string_view name) {
  return [name = std::string(name)](RequestHandler next) -> RequestHandler {
    return [name, next = std::move(next)](const HttpRequest &req) {
      HttpResponse resp = next(req);
      resp.header("Server", name);
      return resp;
    };
  };
}

Middleware RequireToken(std::string_view token) {
  return [token = std::string(token)](RequestHandler next) -> RequestHandler {
    return [token, next = std::move(next)](const HttpRequest &req) {
      if (req.headerValueOrEmpty(http::Authorization) != token) {
        return HttpResponse(http::StatusCodeUnauthorized).body("missing or invalid token");
      }
      return next(req);
    };
  };
}

void Print(const ServeMux &mux, const HttpRequest &req) {
  HttpResponse resp = mux.dispatch(req);
  std::cout << req.method() << ' ' << req.path() << " -> " << resp.status() << ' ' << resp.reason() << '\n';
  for (const auto &[headerKey, headerValue] : resp.headers()) {
    std::cout << "  " << headerKey << ": " << headerValue << '\n';
  }
  std::cout << "  " << resp.body() << '\n';
}

}  // namespace

int main(int argc, char **argv) {
  std::string_view token = argc > 1 ? std::string_view(argv[1]) : std::string_view("secret");

  // Stop right away if the routes are misconfigured.
  TerminatingFatalErrorReporter reporter;

  try {
    Group admin(reporter);
    admin.use(RequireToken(token)).add(Define("/admin/stats", [](const HttpRequest &) {
      return HttpResponse(R"({"routes":3})", http::ContentTypeApplicationJson);
    }));

    Group root(reporter);
    root.use(ServerHeader("routegroup-minimal"))
        .add(Define("/hello",
                    [](const HttpRequest &req) {
                      return HttpResponse("Hello from routegroup! You requested " + std::string(req.path()));
                    }),
             std::pair{"/health", [](const HttpRequest &) { return HttpResponse("ok"); }}, std::move(admin));

    ServeMux mux = Compile(root);

    Print(mux, HttpRequest("/hello"));
    Print(mux, HttpRequest("/health"));
    Print(mux, HttpRequest("/admin/stats"));
    Print(mux, HttpRequest("/admin/stats").header(http::Authorization, token));
    Print(mux, HttpRequest("/missing"));
  } catch (const std::exception &e) {
    std::cerr << "Example encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
