// tests/unit/io/test_reference_batch.cpp - Unit tests for reference batch loading
//
#include <gtest/gtest.h>

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

#include "declref/io/reference_batch.hpp"
#include "declref/test_support/reference_helpers.hpp"

using namespace declref;
using namespace declref::test_support;
using nlohmann::json;

TEST(IoReferenceBatch, ParsesReferences)
{
  const json root = json::parse(R"({ "references": [
    { "text": "widgets#Shape:class.area",
      "packageName": "widgets",
      "members": [ { "identifier": "Shape", "selector": { "kind": "system", "value": "class" } },
                   { "identifier": "area" } ] },
    { "importPath": "lib/index",
      "members": [ { "symbol": "Symbol.iterator" } ] },
    { "members": [ { "identifier": "draw", "selector": { "kind": "index", "value": "2" } } ] }
  ] })");

  const auto result = parse_reference_batch(root, "docs.json");
  ASSERT_TRUE(result.success) << result.error;
  ASSERT_EQ(result.entries.size(), 3U);

  const auto & first = result.entries[0];
  EXPECT_EQ(first.text, "widgets#Shape:class.area");
  EXPECT_EQ(first.index, 0U);
  EXPECT_EQ(first.source, std::filesystem::path("docs.json"));
  EXPECT_EQ(first.reference.package_name, std::string("widgets"));
  ASSERT_EQ(first.reference.member_references.size(), 2U);
  const auto & shape = first.reference.member_references[0];
  ASSERT_TRUE(shape.identifier.has_value());
  EXPECT_EQ(shape.identifier->identifier, "Shape");
  ASSERT_TRUE(shape.selector.has_value());
  EXPECT_EQ(shape.selector->kind, SelectorKind::System);
  EXPECT_EQ(shape.selector->text, "class");
  EXPECT_FALSE(first.reference.member_references[1].selector.has_value());

  const auto & second = result.entries[1];
  EXPECT_FALSE(second.reference.package_name.has_value());
  EXPECT_EQ(second.reference.import_path, std::string("lib/index"));
  ASSERT_EQ(second.reference.member_references.size(), 1U);
  EXPECT_FALSE(second.reference.member_references[0].identifier.has_value());
  ASSERT_TRUE(second.reference.member_references[0].symbol.has_value());
  EXPECT_EQ(second.reference.member_references[0].symbol->symbol_reference, "Symbol.iterator");

  const auto & third = result.entries[2];
  EXPECT_EQ(third.index, 2U);
  EXPECT_EQ(third.reference.member_references[0].selector->kind, SelectorKind::Index);
}

TEST(IoReferenceBatch, TextDefaultsToDisplayForm)
{
  const json root = json::parse(R"({ "references": [
    { "packageName": "widgets", "members": [ { "identifier": "Shape", "selector": { "value": "class" } } ] }
  ] })");

  const auto result = parse_reference_batch(root);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.entries[0].text, "widgets#Shape:class");
  EXPECT_EQ(
    result.entries[0].reference.member_references[0].selector->kind, SelectorKind::System);
  EXPECT_TRUE(result.entries[0].source.empty());
}

TEST(IoReferenceBatch, EmptyAndIdentifierlessMembersAreKept)
{
  // Structural problems are the resolver's to report, not the loader's
  const json root =
    json::parse(R"({ "references": [ { "packageName": "widgets" }, { "members": [ {} ] } ] })");

  const auto result = parse_reference_batch(root);
  ASSERT_TRUE(result.success) << result.error;
  ASSERT_EQ(result.entries.size(), 2U);
  EXPECT_TRUE(result.entries[0].reference.member_references.empty());
  ASSERT_EQ(result.entries[1].reference.member_references.size(), 1U);
  EXPECT_FALSE(result.entries[1].reference.member_references[0].identifier.has_value());
}

TEST(IoReferenceBatch, RejectsMalformedBatches)
{
  struct Case
  {
    const char * text;
    const char * error;
  };
  const Case cases[] = {
    {R"({})", "reference batch must have a 'references' list"},
    {R"({"references": {}})", "reference batch must have a 'references' list"},
    {R"({"references": [ 3 ]})", "reference 0: reference must be a map"},
    {R"({"references": [ {}, {"packageName": 1} ]})",
     "reference 1: 'packageName' must be a string"},
    {R"({"references": [ {"members": {}} ]})", "reference 0: 'members' must be a list"},
    {R"({"references": [ {"members": [ {"identifier": 4} ]} ]})",
     "reference 0: 'identifier' must be a string"},
    {R"({"references": [ {"members": [ {"identifier": "a", "selector": {"kind": "system"}} ]} ]})",
     "reference 0: selector has no 'value'"},
    {R"({"references": [ {"members": [ {"identifier": "a", "selector": {"kind": "overload", "value": "1"}} ]} ]})",
     "reference 0: selector kind must be 'system', 'index' or 'label'"},
  };

  for (const auto & c : cases) {
    const auto result = parse_reference_batch(json::parse(c.text));
    EXPECT_FALSE(result.success) << c.text;
    EXPECT_EQ(result.error, c.error) << c.text;
  }
}

TEST(IoReferenceBatch, LoadFromFile)
{
  const auto dir = make_temp_dir("declref_reference_batch");
  write_file(
    dir / "docs.json", R"({ "references": [ { "members": [ { "identifier": "Button" } ] } ] })");
  write_file(dir / "broken.json", "{ \"references\": [");

  const auto ok = load_reference_batch(dir / "docs.json");
  ASSERT_TRUE(ok.success) << ok.error;
  ASSERT_EQ(ok.entries.size(), 1U);
  EXPECT_EQ(ok.entries[0].text, "Button");
  EXPECT_EQ(ok.entries[0].source, dir / "docs.json");

  const auto broken = load_reference_batch(dir / "broken.json");
  EXPECT_FALSE(broken.success);
  EXPECT_NE(broken.error.find("failed to parse JSON"), std::string::npos);

  const auto missing = load_reference_batch(dir / "missing.json");
  EXPECT_FALSE(missing.success);
  EXPECT_NE(missing.error.find("reference batch not found"), std::string::npos);

  std::filesystem::remove_all(dir);
}
