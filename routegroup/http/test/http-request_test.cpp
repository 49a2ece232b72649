#include "routegroup/http-request.hpp"

#include <gtest/gtest.h>

#include "routegroup/http-constants.hpp"

namespace routegroup {

TEST(HttpRequestTest, Defaults) {
  HttpRequest req;
  EXPECT_EQ(req.path(), "/");
  EXPECT_EQ(req.method(), http::GET);
  EXPECT_TRUE(req.body().empty());
  EXPECT_TRUE(req.headers().empty());
}

TEST(HttpRequestTest, FluentConstruction) {
  const auto req = HttpRequest("/api/users", http::POST).header("Authorization", "Bearer abc").body("{}");
  EXPECT_EQ(req.path(), "/api/users");
  EXPECT_EQ(req.method(), http::POST);
  EXPECT_EQ(req.headerValueOrEmpty("authorization"), "Bearer abc");
  EXPECT_EQ(req.body(), "{}");
}

TEST(HttpRequestTest, HeaderOverride) {
  HttpRequest req("/x");
  req.header("X-A", "1").header("x-a", "2");
  ASSERT_EQ(req.headers().size(), 1U);
  EXPECT_EQ(req.headerValueOrEmpty("X-A"), "2");
  EXPECT_FALSE(req.headerValue("X-B").has_value());

  req.path("/y").method(http::DELETE);
  EXPECT_EQ(req.path(), "/y");
  EXPECT_EQ(req.method(), http::DELETE);
}

}  // namespace routegroup
