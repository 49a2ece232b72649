#include "routegroup/handler-unit.hpp"

#include <gtest/gtest.h>

#include <string_view>

#include "routegroup/capturing-fatal-error-reporter.hpp"
#include "routegroup/composition-error.hpp"
#include "routegroup/http-request.hpp"
#include "routegroup/http-response.hpp"
#include "routegroup/request-handler.hpp"
#include "routegroup/test-handlers.hpp"

namespace routegroup {

using HelloFn = HttpResponse (*)(const HttpRequest&);

TEST(HandlerUnitTest, DefineKeepsPathAndHandler) {
  HandlerUnit unit = Define("/hello", test::Hello);
  EXPECT_EQ(unit.path(), "/hello");
  ASSERT_NE(unit.handler().target<HelloFn>(), nullptr);
  EXPECT_EQ(*unit.handler().target<HelloFn>(), &test::Hello);
  EXPECT_EQ(unit(HttpRequest("/hello")).body(), "Hello from /hello");
}

TEST(HandlerUnitTest, EmptyHandlerIsReportedThenThrown) {
  test::CapturingFatalErrorReporter reporter;
  try {
    HandlerUnit unit("/broken", RequestHandler{}, reporter);
    FAIL() << "expected CompositionError";
  } catch (const CompositionError& err) {
    EXPECT_EQ(err.code(), CompositionError::Code::InvalidHandler);
  }
  ASSERT_EQ(reporter.count(), 1U);
  EXPECT_EQ(reporter.lastCode(), CompositionError::Code::InvalidHandler);
  EXPECT_NE(reporter.lastMessage().find("/broken"), std::string_view::npos);
}

TEST(HandlerUnitTest, EmptyPathIsInvalidHandler) {
  test::CapturingFatalErrorReporter reporter;
  EXPECT_THROW(HandlerUnit("", test::Respond("x"), reporter), CompositionError);
  ASSERT_EQ(reporter.count(), 1U);
  EXPECT_EQ(reporter.lastCode(), CompositionError::Code::InvalidHandler);
}

TEST(HandlerUnitTest, WrapReturnsNewUnitAndLeavesOriginalUntouched) {
  HandlerUnit unit = Define("/test", test::Respond("X"));
  HandlerUnit wrapped = unit.wrap(test::SetHeader("X-Test", "1"), test::PrefixBody("Prefix-"));

  EXPECT_EQ(wrapped.path(), "/test");
  HttpResponse resp = wrapped(HttpRequest("/test"));
  EXPECT_EQ(resp.body(), "Prefix-X");
  EXPECT_EQ(resp.headerValueOrEmpty("X-Test"), "1");

  HttpResponse original = unit(HttpRequest("/test"));
  EXPECT_EQ(original.body(), "X");
  EXPECT_FALSE(original.headerValue("X-Test"));
}

TEST(HandlerUnitTest, WrapWithNoMiddlewareKeepsHandler) {
  HandlerUnit unit = Define("/hello", test::Hello);
  HandlerUnit same = unit.wrap(MiddlewareRange{});
  ASSERT_NE(same.handler().target<HelloFn>(), nullptr);
  EXPECT_EQ(*same.handler().target<HelloFn>(), &test::Hello);
}

TEST(HandlerUnitTest, WrapWithFaultyMiddlewareFails) {
  test::CapturingFatalErrorReporter reporter;
  HandlerUnit unit = Define("/test", test::Respond("X"));
  const Middleware middlewares[] = {test::ReturnsEmptyHandler()};
  EXPECT_THROW((void)unit.wrap(MiddlewareRange(middlewares), reporter), CompositionError);
  ASSERT_EQ(reporter.count(), 1U);
  EXPECT_EQ(reporter.lastCode(), CompositionError::Code::MiddlewareProducedNil);
}

}  // namespace routegroup
