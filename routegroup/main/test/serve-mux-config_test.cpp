#include "routegroup/serve-mux-config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace routegroup {

TEST(ServeMuxConfigTest, Defaults) {
  ServeMuxConfig config;
  EXPECT_EQ(config.duplicatePathPolicy, ServeMuxConfig::DuplicatePathPolicy::Overwrite);
  EXPECT_EQ(config.notFoundBody, "404 page not found");
  EXPECT_NO_THROW(config.validate());
}

TEST(ServeMuxConfigTest, ChainedSetters) {
  ServeMuxConfig config;
  config.withDuplicatePathPolicy(ServeMuxConfig::DuplicatePathPolicy::Reject).withNotFoundBody("nope");
  EXPECT_EQ(config.duplicatePathPolicy, ServeMuxConfig::DuplicatePathPolicy::Reject);
  EXPECT_EQ(config.notFoundBody, "nope");
}

TEST(ServeMuxConfigTest, EmptyNotFoundBodyIsInvalid) {
  ServeMuxConfig config;
  config.withNotFoundBody("");
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

}  // namespace routegroup
