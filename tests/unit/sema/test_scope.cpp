// tests/unit/sema/test_scope.cpp - Unit tests for scope frames
//
#include <gtest/gtest.h>

#include "spawn_dsl/sema/scope.hpp"

using namespace spawn_dsl;

TEST(SemaScope, DefineRejectsDuplicatesInSameFrame)
{
  Scope scope;
  EXPECT_TRUE(scope.define(Binding{"a", nullptr, SourceRange(0, 1)}));
  EXPECT_FALSE(scope.define(Binding{"a", nullptr, SourceRange(5, 6)}));
  EXPECT_EQ(scope.size(), 1U);

  // The first binding is kept.
  const Binding * b = scope.lookup_local("a");
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(b->range, SourceRange(0, 1));
}

TEST(SemaScope, LookupWalksEnclosingFrames)
{
  Scope outer;
  ASSERT_TRUE(outer.define(Binding{"p", nullptr, SourceRange(0, 1)}));

  Scope inner(&outer);
  EXPECT_EQ(inner.lookup_local("p"), nullptr);
  EXPECT_NE(inner.lookup("p"), nullptr);

  // Shadowing in the inner frame is allowed.
  EXPECT_TRUE(inner.define(Binding{"p", nullptr, SourceRange(10, 11)}));
  EXPECT_EQ(inner.lookup("p")->range, SourceRange(10, 11));
  EXPECT_EQ(outer.lookup("p")->range, SourceRange(0, 1));
}

TEST(SemaScope, StackKeepsRootFrame)
{
  ScopeStack stack;
  EXPECT_EQ(stack.depth(), 1U);

  stack.pop();
  EXPECT_EQ(stack.depth(), 1U);

  {
    const ScopeGuard guard(stack);
    EXPECT_EQ(stack.depth(), 2U);
    ASSERT_TRUE(stack.current().define(Binding{"x", nullptr, SourceRange(0, 1)}));
  }
  EXPECT_EQ(stack.depth(), 1U);
  EXPECT_EQ(stack.current().lookup("x"), nullptr);
}
