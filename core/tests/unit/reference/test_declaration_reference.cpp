// tests/unit/reference/test_declaration_reference.cpp - Reference display form
//
#include <gtest/gtest.h>

#include "declref/reference/declaration_reference.hpp"
#include "declref/test_support/reference_helpers.hpp"

using namespace declref;
using namespace declref::test_support;

TEST(ReferenceDisplay, MembersAndSelectors)
{
  EXPECT_EQ(to_string(ref({member("Shape", "class"), member("area")})), "Shape:class.area");
  EXPECT_EQ(to_string(ref({member("Button")})), "Button");
  EXPECT_EQ(
    to_string(ref({member_with("draw", SelectorKind::Index, "2")})), "draw:2");
}

TEST(ReferenceDisplay, Qualifiers)
{
  EXPECT_EQ(to_string(ref_in("widgets", {member("Button")})), "widgets#Button");

  DeclarationReference with_path = ref_in("other-pkg", {member("Button")});
  with_path.import_path = "lib/index";
  EXPECT_EQ(to_string(with_path), "other-pkg/lib/index#Button");

  DeclarationReference empty_path = ref({member("Button")});
  empty_path.import_path = "";
  EXPECT_EQ(to_string(empty_path), "Button");

  EXPECT_EQ(to_string(ref_in("widgets", {})), "widgets#");
}

TEST(ReferenceDisplay, SymbolAndMissingIdentifier)
{
  EXPECT_EQ(
    to_string(ref({member("List"), symbol_member("Symbol.iterator")})), "List.[Symbol.iterator]");
  EXPECT_EQ(to_string(MemberReference{}), "");
}
