#include "routegroup/type-name.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace routegroup {

namespace {
struct LocalWidget {};
}  // namespace

TEST(TypeNameTest, FundamentalTypes) {
  EXPECT_EQ(TypeName<int>(), "int");
  EXPECT_EQ(TypeName<double>(), "double");
}

TEST(TypeNameTest, NamespacedTypes) {
  EXPECT_EQ(TypeName<LocalWidget>(), "routegroup::(anonymous namespace)::LocalWidget");
  EXPECT_NE(TypeName<std::vector<int>>().find("std::vector<int"), std::string::npos);
}

}  // namespace routegroup
