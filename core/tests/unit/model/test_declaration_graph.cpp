// tests/unit/model/test_declaration_graph.cpp - Unit tests for DeclarationGraph
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "declref/model/declaration_graph.hpp"

using namespace declref;

TEST(ModelDeclarationGraph, AddRootAndMembers)
{
  DeclarationGraph graph;
  const ModuleId module(0);

  const DeclId shape = graph.add_root("Shape", DeclKind::Class, module);
  const DeclId area = graph.add_member(shape, "area", DeclKind::Function);
  const DeclId width = graph.add_member(shape, "width", DeclKind::Variable);

  ASSERT_TRUE(shape.is_valid());
  ASSERT_TRUE(area.is_valid());
  EXPECT_EQ(graph.size(), 3U);

  const DeclNode * root = graph.get(shape);
  ASSERT_NE(root, nullptr);
  EXPECT_EQ(root->name, "Shape");
  EXPECT_EQ(root->kind, DeclKind::Class);
  EXPECT_TRUE(root->is_root());
  EXPECT_EQ(root->module, module);

  const DeclNode * member = graph.get(area);
  ASSERT_NE(member, nullptr);
  EXPECT_FALSE(member->is_root());
  EXPECT_EQ(member->parent, shape);
  EXPECT_EQ(member->module, module);

  const auto children = graph.children(shape);
  ASSERT_EQ(children.size(), 2U);
  EXPECT_EQ(children[0], area);
  EXPECT_EQ(children[1], width);
}

TEST(ModelDeclarationGraph, RejectsInvalidOwners)
{
  DeclarationGraph graph;

  EXPECT_FALSE(graph.add_root("Orphan", DeclKind::Class, ModuleId::invalid()).is_valid());
  EXPECT_FALSE(graph.add_member(DeclId(7), "x", DeclKind::Variable).is_valid());
  EXPECT_FALSE(graph.add_member(DeclId::invalid(), "x", DeclKind::Variable).is_valid());
  EXPECT_TRUE(graph.empty());
}

TEST(ModelDeclarationGraph, UnknownHandles)
{
  DeclarationGraph graph;
  graph.add_root("A", DeclKind::Class, ModuleId(0));

  EXPECT_EQ(graph.get(DeclId(99)), nullptr);
  EXPECT_FALSE(graph.contains(DeclId::invalid()));
  EXPECT_TRUE(graph.children(DeclId(99)).empty());
  EXPECT_TRUE(graph.children_named(DeclId(99), "x").empty());
  EXPECT_FALSE(graph.root_of(DeclId(99)).is_valid());
  EXPECT_EQ(graph.qualified_name(DeclId(99)), "");
}

TEST(ModelDeclarationGraph, ChildrenNamedKeepsOrderAndDuplicates)
{
  DeclarationGraph graph;
  const DeclId widget = graph.add_root("Widget", DeclKind::Class, ModuleId(0));
  const DeclId draw1 = graph.add_member(widget, "draw", DeclKind::Function);
  graph.add_member(widget, "size", DeclKind::Variable);
  const DeclId draw2 = graph.add_member(widget, "draw", DeclKind::Function);
  graph.add_member(widget, "Draw", DeclKind::Function);

  EXPECT_EQ(graph.children_named(widget, "draw"), (std::vector<DeclId>{draw1, draw2}));
  EXPECT_TRUE(graph.children_named(widget, "resize").empty());
  EXPECT_EQ(graph.children_named(widget, "Draw").size(), 1U);
}

TEST(ModelDeclarationGraph, QualifiedNameAndRoot)
{
  DeclarationGraph graph;
  const DeclId outer = graph.add_root("Outer", DeclKind::Namespace, ModuleId(2));
  const DeclId inner = graph.add_member(outer, "Inner", DeclKind::Class);
  const DeclId leaf = graph.add_member(inner, "leaf", DeclKind::Function);

  EXPECT_EQ(graph.qualified_name(leaf), "Outer.Inner.leaf");
  EXPECT_EQ(graph.qualified_name(outer), "Outer");
  EXPECT_EQ(graph.root_of(leaf), outer);
  EXPECT_EQ(graph.root_of(outer), outer);
  EXPECT_EQ(graph.get(leaf)->module, ModuleId(2));
}

TEST(ModelDeclarationGraph, MembersReachOwningExport)
{
  DeclarationGraph graph;
  const DeclId shape = graph.add_root("Shape", DeclKind::Class, ModuleId(0));
  const DeclId app = graph.add_root("App", DeclKind::Class, ModuleId(0), "default");
  const DeclId render = graph.add_member(app, "render", DeclKind::Function);
  const DeclId inner = graph.add_member(render, "Options", DeclKind::Interface);

  EXPECT_EQ(graph.owning_export(shape), "Shape");
  EXPECT_EQ(graph.owning_export(app), "default");
  EXPECT_EQ(graph.owning_export(inner), "default");
  EXPECT_EQ(graph.get(app)->name, "App");
  EXPECT_TRUE(graph.get(render)->owner.empty());
  EXPECT_EQ(graph.owning_export(DeclId(42)), "");
}

TEST(ModelDeclarationGraph, HandlesSurviveGrowth)
{
  DeclarationGraph graph;
  const DeclId root = graph.add_root("Big", DeclKind::Namespace, ModuleId(0));
  std::vector<DeclId> members;
  for (int i = 0; i < 200; ++i) {
    members.push_back(graph.add_member(root, "m" + std::to_string(i), DeclKind::Variable));
  }

  ASSERT_EQ(graph.children(root).size(), 200U);
  EXPECT_EQ(graph.get(members[150])->name, "m150");
  EXPECT_EQ(graph.get(members[150])->parent, root);
}

TEST(ModelDeclKind, SpellingsRoundTrip)
{
  for (const DeclKind kind :
       {DeclKind::Class, DeclKind::Interface, DeclKind::Enum, DeclKind::Function,
        DeclKind::Variable, DeclKind::TypeAlias, DeclKind::Namespace}) {
    const auto parsed = decl_kind_from_string(to_string(kind));
    ASSERT_TRUE(parsed.has_value()) << to_string(kind);
    EXPECT_EQ(*parsed, kind);
  }

  EXPECT_EQ(to_string(DeclKind::TypeAlias), "type");
  EXPECT_FALSE(decl_kind_from_string("Class").has_value());
  EXPECT_FALSE(decl_kind_from_string("typealias").has_value());
  EXPECT_FALSE(decl_kind_from_string("").has_value());
}
