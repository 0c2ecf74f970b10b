// declref/io/api_model_loader.cpp - API model JSON loading
//
#include "declref/io/api_model_loader.hpp"

#include <fstream>
#include <optional>
#include <string_view>
#include <utility>

#include "declref/model/decl_kind.hpp"

namespace declref
{

namespace
{

using nlohmann::json;

/// Read an optional string field; false if present with the wrong type
bool read_string(const json & obj, const char * key, std::optional<std::string> & out)
{
  if (!obj.contains(key)) {
    return true;
  }
  if (!obj[key].is_string()) {
    return false;
  }
  out = obj[key].get<std::string>();
  return true;
}

std::optional<DeclKind> read_kind(const json & decl, const std::string & where, std::string & error)
{
  if (!decl.contains("kind") || !decl["kind"].is_string()) {
    error = "declaration of '" + where + "' has no 'kind'";
    return std::nullopt;
  }
  const std::string text = decl["kind"].get<std::string>();
  const std::optional<DeclKind> kind = decl_kind_from_string(text);
  if (!kind) {
    error = "unknown declaration kind '" + text + "' for '" + where + "'";
  }
  return kind;
}

bool parse_members(
  const json & decl, DeclId parent, const std::string & where, DeclarationGraph & decls,
  std::string & error)
{
  if (!decl.contains("members")) {
    return true;
  }
  if (!decl["members"].is_array()) {
    error = "'members' of '" + where + "' must be a list";
    return false;
  }

  for (const auto & member : decl["members"]) {
    if (!member.is_object()) {
      error = "member entry of '" + where + "' must be a map";
      return false;
    }
    std::optional<std::string> name;
    if (!read_string(member, "name", name) || !name || name->empty()) {
      error = "member of '" + where + "' has no 'name'";
      return false;
    }

    const std::string member_where = where + "." + *name;
    const std::optional<DeclKind> kind = read_kind(member, member_where, error);
    if (!kind) {
      return false;
    }

    const DeclId id = decls.add_member(parent, *name, *kind);
    if (!parse_members(member, id, member_where, decls, error)) {
      return false;
    }
  }
  return true;
}

/// Parse one export entry into `model`
bool parse_export(const json & entry, ModuleId module, ApiModel & model, std::string & error)
{
  const std::string module_name(model.symbols.module_name(module));

  if (!entry.is_object()) {
    error = "export entry of module '" + module_name + "' must be a map";
    return false;
  }

  std::optional<std::string> name;
  if (!read_string(entry, "name", name) || !name || name->empty()) {
    error = "export of module '" + module_name + "' has no 'name'";
    return false;
  }

  std::optional<std::string> local_name;
  if (!read_string(entry, "localName", local_name)) {
    error = "'localName' of export '" + *name + "' must be a string";
    return false;
  }

  const bool has_decls = entry.contains("declarations");
  const bool has_reexport = entry.contains("reexport");
  if (has_decls == has_reexport) {
    error = "export '" + *name + "' must have exactly one of 'declarations' or 'reexport'";
    return false;
  }

  Entity entity;
  if (has_reexport) {
    const json & target = entry["reexport"];
    std::optional<std::string> specifier;
    std::optional<std::string> target_name;
    if (
      !target.is_object() || !read_string(target, "module", specifier) || !specifier ||
      !read_string(target, "name", target_name)) {
      error = "'reexport' of '" + *name + "' must name a 'module'";
      return false;
    }
    entity = ImportedEntity{local_name.value_or(*name), *specifier, target_name.value_or(*name)};
  } else {
    const json & list = entry["declarations"];
    if (!list.is_array() || list.empty()) {
      error = "export '" + *name + "' must have at least one declaration";
      return false;
    }

    LocalEntity local;
    local.local_name = local_name.value_or(*name);
    for (const auto & decl : list) {
      if (!decl.is_object()) {
        error = "declaration of '" + *name + "' must be a map";
        return false;
      }
      const std::optional<DeclKind> kind = read_kind(decl, *name, error);
      if (!kind) {
        return false;
      }
      const DeclId id = model.decls.add_root(local.local_name, *kind, module, *name);
      if (!parse_members(decl, id, local.local_name, model.decls, error)) {
        return false;
      }
      local.declarations.push_back(id);
    }
    entity = std::move(local);
  }

  if (!model.symbols.define_export(module, *name, std::move(entity))) {
    error = "module '" + module_name + "' exports '" + *name + "' more than once";
    return false;
  }
  return true;
}

}  // namespace

ModelLoadResult parse_api_model(const json & root)
{
  if (!root.is_object()) {
    return ModelLoadResult::fail("API model must be a map");
  }

  ApiModel model;

  std::optional<std::string> package;
  if (!read_string(root, "package", package) || !package || package->empty()) {
    return ModelLoadResult::fail("API model has no 'package' name");
  }
  model.package.name = *package;

  if (!root.contains("modules") || !root["modules"].is_array()) {
    return ModelLoadResult::fail("modules must be a list");
  }

  std::string error;
  for (const auto & module_node : root["modules"]) {
    std::optional<std::string> module_name;
    if (
      !module_node.is_object() || !read_string(module_node, "name", module_name) ||
      !module_name) {
      return ModelLoadResult::fail("module entry must be a map with a 'name'");
    }
    if (model.symbols.find_module(*module_name)) {
      return ModelLoadResult::fail("duplicate module '" + *module_name + "'");
    }

    const ModuleId module = model.symbols.add_module(*module_name);

    if (!module_node.contains("exports")) {
      continue;
    }
    if (!module_node["exports"].is_array()) {
      return ModelLoadResult::fail("exports of module '" + *module_name + "' must be a list");
    }
    for (const auto & entry : module_node["exports"]) {
      if (!parse_export(entry, module, model, error)) {
        return ModelLoadResult::fail(error);
      }
    }
  }

  // Entry module: explicit, or the only module
  std::optional<std::string> entry;
  if (!read_string(root, "entryModule", entry)) {
    return ModelLoadResult::fail("entryModule must be a string");
  }
  if (entry) {
    const std::optional<ModuleId> id = model.symbols.find_module(*entry);
    if (!id) {
      return ModelLoadResult::fail("entry module '" + *entry + "' is not a module of the package");
    }
    model.package.entry_module = *id;
  } else if (model.symbols.module_count() == 1) {
    model.package.entry_module = ModuleId(0);
  } else {
    return ModelLoadResult::fail("API model has no 'entryModule'");
  }

  return ModelLoadResult::ok(std::move(model));
}

ModelLoadResult load_api_model(const std::filesystem::path & model_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(model_path)) {
    return ModelLoadResult::fail("API model not found: " + model_path.string());
  }

  std::ifstream in(model_path);
  if (!in.is_open()) {
    return ModelLoadResult::fail("failed to open API model: " + model_path.string());
  }

  json root;
  try {
    root = json::parse(in);
  } catch (const json::exception & e) {
    return ModelLoadResult::fail("failed to parse JSON: " + std::string(e.what()));
  }

  return parse_api_model(root);
}

json to_json(const DeclarationGraph & decls, DeclId id)
{
  const DeclNode * node = decls.get(id);
  if (node == nullptr) {
    return nullptr;
  }

  json j{
    {"name", node->name},
    {"kind", std::string(to_string(node->kind))},
    {"qualifiedName", decls.qualified_name(id)},
    {"export", std::string(decls.owning_export(id))}};

  json members = json::array();
  for (const DeclId child : decls.children(id)) {
    members.push_back(to_json(decls, child));
  }
  if (!members.empty()) {
    j["members"] = std::move(members);
  }
  return j;
}

}  // namespace declref
