#include "routegroup/http-response.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string_view>

#include "routegroup/http-constants.hpp"
#include "routegroup/http-status-code.hpp"

namespace routegroup {

TEST(HttpResponseTest, DefaultIsOkWithCanonicalReason) {
  HttpResponse resp;
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.reason(), http::ReasonOK);
  EXPECT_TRUE(resp.body().empty());
  EXPECT_TRUE(resp.headers().empty());
}

TEST(HttpResponseTest, BodyConstructorSetsContentType) {
  HttpResponse resp("hello");
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "hello");
  EXPECT_EQ(resp.headerValueOrEmpty(http::ContentType), http::ContentTypeTextPlain);

  HttpResponse json(R"({"a":1})", http::ContentTypeApplicationJson);
  EXPECT_EQ(json.headerValueOrEmpty("content-type"), http::ContentTypeApplicationJson);
}

TEST(HttpResponseTest, InvalidStatusCodeThrows) {
  EXPECT_THROW(HttpResponse(static_cast<http::StatusCode>(42)), std::invalid_argument);
  HttpResponse resp;
  EXPECT_THROW(resp.status(static_cast<http::StatusCode>(1000)), std::invalid_argument);
}

TEST(HttpResponseTest, StatusRefreshesCanonicalReasonOnly) {
  HttpResponse resp;
  resp.status(http::StatusCodeNotFound);
  EXPECT_EQ(resp.reason(), http::ReasonNotFound);

  resp.reason("Gone Fishing").status(http::StatusCodeForbidden);
  EXPECT_EQ(resp.status(), http::StatusCodeForbidden);
  EXPECT_EQ(resp.reason(), "Gone Fishing");
}

TEST(HttpResponseTest, HeaderReplacesAddHeaderAppends) {
  HttpResponse resp;
  resp.addHeader("X-Trace", "a").addHeader("x-trace", "b");
  EXPECT_EQ(resp.headers().size(), 2U);
  EXPECT_EQ(resp.headerValueOrEmpty("X-Trace"), "a");

  resp.header("X-TRACE", "c");
  ASSERT_EQ(resp.headers().size(), 1U);
  EXPECT_EQ(resp.headers()[0].name, "X-Trace");
  EXPECT_EQ(resp.headerValueOrEmpty("x-trace"), "c");
}

TEST(HttpResponseTest, MissingVersusEmptyHeader) {
  HttpResponse resp;
  resp.header("X-Empty", "");
  ASSERT_TRUE(resp.headerValue("X-Empty").has_value());
  EXPECT_TRUE(resp.headerValue("X-Empty")->empty());
  EXPECT_FALSE(resp.headerValue("X-Missing").has_value());
  EXPECT_EQ(resp.headerValueOrEmpty("X-Missing"), std::string_view{});
}

TEST(HttpResponseTest, AppendAndPrependBody) {
  HttpResponse resp;
  resp.appendBody("World").prependBody("Hello, ").appendBody("!");
  EXPECT_EQ(resp.body(), "Hello, World!");
  EXPECT_EQ(resp.headerValueOrEmpty(http::ContentType), http::ContentTypeTextPlain);
}

TEST(HttpResponseTest, PrependKeepsExistingContentType) {
  HttpResponse resp("<p>x</p>", http::ContentTypeTextHtml);
  resp.prependBody("<!doctype html>");
  EXPECT_EQ(resp.body(), "<!doctype html><p>x</p>");
  EXPECT_EQ(resp.headerValueOrEmpty(http::ContentType), http::ContentTypeTextHtml);
}

TEST(HttpResponseTest, EmptyBodyRemovesContentType) {
  HttpResponse resp("data");
  resp.body("");
  EXPECT_TRUE(resp.body().empty());
  EXPECT_FALSE(resp.headerValue(http::ContentType).has_value());
}

TEST(HttpResponseTest, FluentTemporary) {
  const auto resp = HttpResponse(http::StatusCodeCreated).header("X-Id", "42").body("created");
  EXPECT_EQ(resp.status(), http::StatusCodeCreated);
  EXPECT_EQ(resp.reason(), http::ReasonCreated);
  EXPECT_EQ(resp.headerValueOrEmpty("X-Id"), "42");
  EXPECT_EQ(resp.body(), "created");
}

TEST(HttpResponseTest, ReasonPhrases) {
  EXPECT_EQ(HttpResponse(http::StatusCodeUnauthorized).reason(), http::ReasonUnauthorized);
  EXPECT_EQ(HttpResponse(http::StatusCodeForbidden).reason(), http::ReasonForbidden);
  EXPECT_TRUE(HttpResponse(static_cast<http::StatusCode>(418)).reason().empty());
  EXPECT_EQ(HttpResponse(static_cast<http::StatusCode>(418), "I'm a teapot").reason(), "I'm a teapot");
}

}  // namespace routegroup
