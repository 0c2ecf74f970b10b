// tests/unit/io/test_api_model_loader.cpp - Unit tests for API model loading
//
#include <gtest/gtest.h>

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

#include "declref/io/api_model_loader.hpp"
#include "declref/test_support/reference_helpers.hpp"

using namespace declref;
using namespace declref::test_support;
using nlohmann::json;

namespace
{

const char * k_widgets_model = R"({
  "package": "widgets",
  "entryModule": "index",
  "modules": [
    { "name": "index",
      "exports": [
        { "name": "Shape",
          "declarations": [
            { "kind": "interface", "members": [ { "name": "area", "kind": "variable" } ] },
            { "kind": "class",
              "members": [ { "name": "area", "kind": "function" },
                           { "name": "Inner", "kind": "namespace",
                             "members": [ { "name": "deep", "kind": "type" } ] } ] } ] },
        { "name": "Legacy", "reexport": { "module": "./legacy", "name": "OldLegacy" } },
        { "name": "default", "localName": "App", "declarations": [ { "kind": "class" } ] }
      ] },
    { "name": "legacy",
      "exports": [ { "name": "OldLegacy", "declarations": [ { "kind": "function" } ] } ] }
  ]
})";

ModelLoadResult parse(const char * text) { return parse_api_model(json::parse(text)); }

}  // namespace

TEST(IoApiModelLoader, LoadsModulesExportsAndMembers)
{
  const auto result = parse(k_widgets_model);
  ASSERT_TRUE(result.success) << result.error;

  const ApiModel & model = result.model;
  EXPECT_EQ(model.package.name, "widgets");
  EXPECT_EQ(model.symbols.module_count(), 2U);
  EXPECT_EQ(model.symbols.module_name(model.package.entry_module), "index");

  const Entity * shape = model.symbols.try_get_export(model.package.entry_module, "Shape");
  ASSERT_NE(shape, nullptr);
  const auto & local = std::get<LocalEntity>(*shape);
  ASSERT_EQ(local.declarations.size(), 2U);
  EXPECT_EQ(model.decls.get(local.declarations[0])->kind, DeclKind::Interface);
  EXPECT_EQ(model.decls.get(local.declarations[1])->kind, DeclKind::Class);

  const auto deep = model.decls.children_named(local.declarations[1], "Inner");
  ASSERT_EQ(deep.size(), 1U);
  const auto leaf = model.decls.children_named(deep[0], "deep");
  ASSERT_EQ(leaf.size(), 1U);
  EXPECT_EQ(model.decls.get(leaf[0])->kind, DeclKind::TypeAlias);
  EXPECT_EQ(model.decls.qualified_name(leaf[0]), "Shape.Inner.deep");
}

TEST(IoApiModelLoader, ReexportsAndLocalNames)
{
  const auto result = parse(k_widgets_model);
  ASSERT_TRUE(result.success) << result.error;
  const ModuleId index = result.model.package.entry_module;

  const Entity * legacy = result.model.symbols.try_get_export(index, "Legacy");
  ASSERT_NE(legacy, nullptr);
  const auto & imported = std::get<ImportedEntity>(*legacy);
  EXPECT_EQ(imported.local_name, "Legacy");
  EXPECT_EQ(imported.module_specifier, "./legacy");
  EXPECT_EQ(imported.export_name, "OldLegacy");

  const Entity * app = result.model.symbols.try_get_export(index, "default");
  ASSERT_NE(app, nullptr);
  EXPECT_EQ(local_name_of(*app), "App");
  const DeclId app_decl = std::get<LocalEntity>(*app).declarations[0];
  EXPECT_EQ(result.model.decls.get(app_decl)->name, "App");
  EXPECT_EQ(result.model.decls.owning_export(app_decl), "default");
}

TEST(IoApiModelLoader, SingleModuleIsEntryByDefault)
{
  const auto result = parse(R"({
    "package": "solo",
    "modules": [ { "name": "main", "exports": [ { "name": "f", "declarations": [ { "kind": "function" } ] } ] } ]
  })");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.model.symbols.module_name(result.model.package.entry_module), "main");
}

TEST(IoApiModelLoader, RejectsMalformedModels)
{
  struct Case
  {
    const char * text;
    const char * error;
  };
  const Case cases[] = {
    {R"([])", "API model must be a map"},
    {R"({"modules": []})", "API model has no 'package' name"},
    {R"({"package": "p"})", "modules must be a list"},
    {R"({"package": "p", "modules": [ {"name": "a"}, {"name": "a"} ]})", "duplicate module 'a'"},
    {R"({"package": "p", "modules": [ {"name": "a"}, {"name": "b"} ]})",
     "API model has no 'entryModule'"},
    {R"({"package": "p", "entryModule": "x", "modules": [ {"name": "a"} ]})",
     "entry module 'x' is not a module of the package"},
    {R"({"package": "p", "modules": [ {"name": "a", "exports": [
        {"name": "E", "declarations": [ {"kind": "struct"} ]} ]} ]})",
     "unknown declaration kind 'struct' for 'E'"},
    {R"({"package": "p", "modules": [ {"name": "a", "exports": [
        {"name": "E", "declarations": [ {"kind": "class", "members": [ {"name": "m", "kind": "Class"} ]} ]} ]} ]})",
     "unknown declaration kind 'Class' for 'E.m'"},
    {R"({"package": "p", "modules": [ {"name": "a", "exports": [
        {"name": "E", "declarations": []} ]} ]})",
     "export 'E' must have at least one declaration"},
    {R"({"package": "p", "modules": [ {"name": "a", "exports": [
        {"name": "E"} ]} ]})",
     "export 'E' must have exactly one of 'declarations' or 'reexport'"},
    {R"({"package": "p", "modules": [ {"name": "a", "exports": [
        {"name": "E", "declarations": [ {"kind": "class"} ]},
        {"name": "E", "declarations": [ {"kind": "enum"} ]} ]} ]})",
     "module 'a' exports 'E' more than once"},
    {R"({"package": "p", "modules": [ {"name": "a", "exports": [
        {"name": "E", "reexport": {"name": "E"}} ]} ]})",
     "'reexport' of 'E' must name a 'module'"},
  };

  for (const auto & c : cases) {
    const auto result = parse(c.text);
    EXPECT_FALSE(result.success) << c.text;
    EXPECT_EQ(result.error, c.error) << c.text;
  }
}

TEST(IoApiModelLoader, LoadFromFile)
{
  const auto dir = make_temp_dir("declref_model_loader");
  write_file(dir / "widgets.api.json", k_widgets_model);
  write_file(dir / "broken.api.json", "{ \"package\": ");

  const auto ok = load_api_model(dir / "widgets.api.json");
  ASSERT_TRUE(ok.success) << ok.error;
  EXPECT_EQ(ok.model.package.name, "widgets");

  const auto broken = load_api_model(dir / "broken.api.json");
  EXPECT_FALSE(broken.success);
  EXPECT_NE(broken.error.find("failed to parse JSON"), std::string::npos);

  const auto missing = load_api_model(dir / "missing.api.json");
  EXPECT_FALSE(missing.success);
  EXPECT_NE(missing.error.find("API model not found"), std::string::npos);

  std::filesystem::remove_all(dir);
}

TEST(IoApiModelLoader, DeclarationToJson)
{
  const auto result = parse(k_widgets_model);
  ASSERT_TRUE(result.success) << result.error;
  const Entity * shape =
    result.model.symbols.try_get_export(result.model.package.entry_module, "Shape");
  ASSERT_NE(shape, nullptr);
  const DeclId shape_class = std::get<LocalEntity>(*shape).declarations[1];

  const json j = to_json(result.model.decls, shape_class);
  EXPECT_EQ(j["name"], "Shape");
  EXPECT_EQ(j["kind"], "class");
  EXPECT_EQ(j["qualifiedName"], "Shape");
  EXPECT_EQ(j["export"], "Shape");
  ASSERT_TRUE(j["members"].is_array());
  ASSERT_EQ(j["members"].size(), 2U);
  EXPECT_EQ(j["members"][1]["qualifiedName"], "Shape.Inner");
  EXPECT_EQ(j["members"][1]["export"], "Shape");
  EXPECT_EQ(j["members"][1]["members"][0]["kind"], "type");
  EXPECT_FALSE(j["members"][0].contains("members"));

  EXPECT_TRUE(to_json(result.model.decls, DeclId(999)).is_null());
}
