// tests/unit/sema/test_scope_resolver.cpp - Unit tests for scope resolution
//
// Checks the Resolved / ExternalOpaque / Error tag on every reference, and
// the diagnostics for duplicate bindings and non-local insertion targets.
//
#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "spawn_dsl/ast/ast.hpp"
#include "spawn_dsl/basic/casting.hpp"
#include "spawn_dsl/test_support/parse_helpers.hpp"

using namespace spawn_dsl;
using test_support::resolve;

namespace
{

const EntityForm * entity_at(gsl::span<Item *> items, size_t i) { return cast<EntityForm>(items[i]); }

/// Captures also include callee names (`Follow` in `Follow(a)`), so look up by name.
const NameRef * capture(const OpaqueExpr * expr, std::string_view name)
{
  for (const NameRef * ref : expr->captures) {
    if (ref->name == name) {
      return ref;
    }
  }
  return nullptr;
}

}  // namespace

// ============================================================================
// Visibility
// ============================================================================

TEST(SemaScopeResolver, CaptureResolvesToEarlierSibling)
{
  auto unit = resolve("a (Node); (Follow(a), Other(b))");
  ASSERT_TRUE(unit->diags.empty());

  const EntityForm * a = entity_at(unit->program->items, 0);
  const EntityForm * user = entity_at(unit->program->items, 1);

  const NameRef * ref_a = capture(user->components[0], "a");
  ASSERT_NE(ref_a, nullptr);
  EXPECT_EQ(ref_a->resolution, Resolution::Resolved);
  EXPECT_EQ(ref_a->binding, a);

  const NameRef * ref_b = capture(user->components[1], "b");
  ASSERT_NE(ref_b, nullptr);
  EXPECT_EQ(ref_b->resolution, Resolution::ExternalOpaque);
  EXPECT_EQ(ref_b->binding, nullptr);
}

TEST(SemaScopeResolver, NoForwardReferences)
{
  auto unit = resolve("(Follow(b)); b ()");
  ASSERT_TRUE(unit->diags.empty());

  const NameRef * ref = capture(entity_at(unit->program->items, 0)->components[0], "b");
  ASSERT_NE(ref, nullptr);
  EXPECT_EQ(ref->resolution, Resolution::ExternalOpaque);
}

TEST(SemaScopeResolver, NameNotVisibleInsideOwnDefinition)
{
  auto unit = resolve("a (Follow(a)).[ (Use(a)) ]");
  ASSERT_TRUE(unit->diags.empty());

  const EntityForm * a = entity_at(unit->program->items, 0);
  EXPECT_EQ(capture(a->components[0], "a")->resolution, Resolution::ExternalOpaque);

  const EntityForm * child = entity_at(a->groups[0]->items, 0);
  EXPECT_EQ(capture(child->components[0], "a")->resolution, Resolution::ExternalOpaque);
}

TEST(SemaScopeResolver, OuterBindingsVisibleInGroups)
{
  auto unit = resolve("p (); x ().[ (Use(p)) ]");
  ASSERT_TRUE(unit->diags.empty());

  const EntityForm * p = entity_at(unit->program->items, 0);
  const EntityForm * x = entity_at(unit->program->items, 1);
  const NameRef * ref = capture(entity_at(x->groups[0]->items, 0)->components[0], "p");
  ASSERT_NE(ref, nullptr);
  EXPECT_EQ(ref->resolution, Resolution::Resolved);
  EXPECT_EQ(ref->binding, p);
}

TEST(SemaScopeResolver, SiblingGroupsAreIsolated)
{
  auto unit = resolve("x ().[ y (); { y.show(); } ].[ z (); { y.show(); } ]");
  ASSERT_TRUE(unit->diags.empty());

  const EntityForm * x = entity_at(unit->program->items, 0);
  const EntityForm * y = entity_at(x->groups[0]->items, 0);

  const auto * first_block = cast<InjectedCodeBlock>(x->groups[0]->items[1]);
  ASSERT_EQ(first_block->body->captures.size(), 1U);
  EXPECT_EQ(first_block->body->captures[0]->resolution, Resolution::Resolved);
  EXPECT_EQ(first_block->body->captures[0]->binding, y);

  const auto * second_block = cast<InjectedCodeBlock>(x->groups[1]->items[1]);
  ASSERT_EQ(second_block->body->captures.size(), 1U);
  EXPECT_EQ(second_block->body->captures[0]->resolution, Resolution::ExternalOpaque);
}

TEST(SemaScopeResolver, GroupBindingsDoNotLeakOut)
{
  auto unit = resolve("x ().[ y () ]; (Use(y))");
  ASSERT_TRUE(unit->diags.empty());

  const NameRef * ref = capture(entity_at(unit->program->items, 1)->components[0], "y");
  ASSERT_NE(ref, nullptr);
  EXPECT_EQ(ref->resolution, Resolution::ExternalOpaque);
}

TEST(SemaScopeResolver, FlowBodiesAreFrames)
{
  auto unit = resolve(
    "if (c) { a () } else { a () }\n"
    "for (auto i : v) { b () }\n"
    "(Use(a), Use(b))");
  ASSERT_TRUE(unit->diags.empty());

  const EntityForm * user = entity_at(unit->program->items, 2);
  EXPECT_EQ(capture(user->components[0], "a")->resolution, Resolution::ExternalOpaque);
  EXPECT_EQ(capture(user->components[1], "b")->resolution, Resolution::ExternalOpaque);
}

TEST(SemaScopeResolver, ExtensionArgumentsResolve)
{
  auto unit = resolve("a (); b ().observe(a).{ link(a, self); }");
  ASSERT_TRUE(unit->diags.empty());

  const EntityForm * a = entity_at(unit->program->items, 0);
  const EntityForm * b = entity_at(unit->program->items, 1);

  const auto * call = cast<MethodCallExt>(b->extensions[0]);
  EXPECT_EQ(call->args[0]->captures[0]->binding, a);

  const auto * block = cast<CodeBlockExt>(b->extensions[1]);
  ASSERT_EQ(block->body->captures.size(), 3U);  // link, a, self
  EXPECT_EQ(block->body->captures[0]->resolution, Resolution::ExternalOpaque);
  EXPECT_EQ(block->body->captures[1]->binding, a);
  EXPECT_EQ(block->body->captures[2]->resolution, Resolution::ExternalOpaque);
}

// ============================================================================
// Parent references
// ============================================================================

TEST(SemaScopeResolver, ParentResolvesToEarlierEntity)
{
  auto unit = resolve("p (); p > (Child)");
  ASSERT_TRUE(unit->diags.empty());

  const EntityForm * child = entity_at(unit->program->items, 1);
  EXPECT_EQ(child->parent_ref->resolution, Resolution::Resolved);
  EXPECT_EQ(child->parent_ref->binding, entity_at(unit->program->items, 0));
}

TEST(SemaScopeResolver, UnboundParentIsExternalWithWarning)
{
  auto unit = resolve("window > (Child)");

  EXPECT_FALSE(unit->diags.has_errors());
  ASSERT_EQ(unit->diags.size(), 1U);
  const auto & d = unit->diags.all()[0];
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.code, "W0100");
  EXPECT_EQ(d.message, "parent 'window' is not bound in this scope");

  const EntityForm * child = entity_at(unit->program->items, 0);
  EXPECT_EQ(child->parent_ref->resolution, Resolution::ExternalOpaque);
  EXPECT_FALSE(child->invalid);
}

TEST(SemaScopeResolver, UnboundParentWarningCanBeDisabled)
{
  ResolverOptions options;
  options.warn_unresolved_parent = false;
  auto unit = resolve("window > (Child)", options);
  EXPECT_TRUE(unit->diags.empty());
}

// ============================================================================
// Insertion targets
// ============================================================================

TEST(SemaScopeResolver, InsertionIntoVisibleEntity)
{
  auto unit = resolve("a (); x ().[ a + (Marker) ]");
  ASSERT_TRUE(unit->diags.empty());

  const EntityForm * x = entity_at(unit->program->items, 1);
  const EntityForm * ins = entity_at(x->groups[0]->items, 0);
  EXPECT_EQ(ins->insertion_target->resolution, Resolution::Resolved);
  EXPECT_EQ(ins->insertion_target->binding, entity_at(unit->program->items, 0));
  EXPECT_FALSE(ins->invalid);
}

TEST(SemaScopeResolver, InsertionIntoUnboundNameIsError)
{
  auto unit = resolve("x ().[ y () ]; y + (Marker); ok ()");

  EXPECT_EQ(unit->diags.count(DiagCategory::InsertionTargetNotLocal), 1U);
  const auto & d = unit->diags.all()[0];
  EXPECT_EQ(d.code, "E0101");
  EXPECT_EQ(d.message, "cannot insert into 'y': no entity with this name is visible here");

  const EntityForm * ins = entity_at(unit->program->items, 1);
  EXPECT_EQ(ins->insertion_target->resolution, Resolution::Error);
  EXPECT_EQ(ins->insertion_target->error, RefError::InsertionTargetNotLocal);
  EXPECT_TRUE(ins->invalid);

  EXPECT_FALSE(entity_at(unit->program->items, 2)->invalid);
}

TEST(SemaScopeResolver, InsertionNeverBinds)
{
  auto unit = resolve("a (); a + (X); a + (Y)");
  EXPECT_TRUE(unit->diags.empty());
}

// ============================================================================
// Duplicate bindings
// ============================================================================

TEST(SemaScopeResolver, DuplicateInSameFrame)
{
  auto unit = resolve("a (); b (); a ()");

  ASSERT_EQ(unit->diags.size(), 1U);
  const auto & d = unit->diags.all()[0];
  EXPECT_EQ(d.code, "E0100");
  EXPECT_EQ(d.message, "duplicate binding 'a'");
  ASSERT_EQ(d.labels.size(), 2U);
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "use 'a + (...)' to add components to it");

  EXPECT_FALSE(entity_at(unit->program->items, 0)->invalid);
  EXPECT_TRUE(entity_at(unit->program->items, 2)->invalid);

  // Later references see the first binding.
  auto unit2 = resolve("a (); a (); (Use(a))");
  const NameRef * ref = capture(entity_at(unit2->program->items, 2)->components[0], "a");
  ASSERT_NE(ref, nullptr);
  EXPECT_EQ(ref->binding, entity_at(unit2->program->items, 0));
}

TEST(SemaScopeResolver, ShadowingInNestedFrameIsAllowed)
{
  auto unit = resolve("a ().[ a () ]; x ().[ a () ].[ a () ]");
  EXPECT_TRUE(unit->diags.empty());
}

// ============================================================================
// Reserved names
// ============================================================================

TEST(SemaScopeResolver, ChildNamedLikeGroupParentIsRejected)
{
  auto unit = resolve("x ().[ parent (A); ok (B) ]");

  ASSERT_EQ(unit->diags.size(), 1U);
  const auto & d = unit->diags.all()[0];
  EXPECT_EQ(d.code, "E0102");
  EXPECT_EQ(d.message, "'parent' is declared by the generated code");
  EXPECT_EQ(unit->diags.count(DiagCategory::ReservedName), 1U);

  const EntityForm * x = entity_at(unit->program->items, 0);
  EXPECT_FALSE(x->invalid);
  EXPECT_TRUE(entity_at(x->groups[0]->items, 0)->invalid);
  EXPECT_FALSE(entity_at(x->groups[0]->items, 1)->invalid);
}

TEST(SemaScopeResolver, EntityNamedLikeSpawnerIsRejectedAndNotBound)
{
  auto unit = resolve("spawner (A); (Use(spawner)); self (); entity ()");

  EXPECT_EQ(unit->diags.count(DiagCategory::ReservedName), 3U);
  EXPECT_TRUE(entity_at(unit->program->items, 0)->invalid);
  EXPECT_FALSE(entity_at(unit->program->items, 1)->invalid);

  const NameRef * ref = capture(entity_at(unit->program->items, 1)->components[0], "spawner");
  ASSERT_NE(ref, nullptr);
  EXPECT_EQ(ref->resolution, Resolution::ExternalOpaque);
}

TEST(SemaScopeResolver, ReservedNamesFollowOptions)
{
  ResolverOptions options;
  options.reserved_names = {"cmds", "up"};

  auto unit = resolve("parent (); x ().[ up () ]; cmds ()", options);
  EXPECT_EQ(unit->diags.count(DiagCategory::ReservedName), 2U);
  EXPECT_FALSE(entity_at(unit->program->items, 0)->invalid);
}

TEST(SemaScopeResolver, ResolveReturnsFalseOnErrors)
{
  auto ok = test_support::parse("a (); b ()");
  EXPECT_TRUE(ok->resolve());

  auto bad = test_support::parse("a (); a ()");
  EXPECT_FALSE(bad->resolve());

  // Warnings do not fail resolution.
  auto warn = test_support::parse("p > ()");
  EXPECT_TRUE(warn->resolve());
}
