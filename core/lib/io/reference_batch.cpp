// declref/io/reference_batch.cpp - Reference batch JSON loading
//
#include "declref/io/reference_batch.hpp"

#include <fstream>
#include <optional>
#include <utility>

namespace declref
{

namespace
{

using nlohmann::json;

std::optional<SelectorKind> selector_kind_from_string(const std::string & text)
{
  if (text == "system") return SelectorKind::System;
  if (text == "index") return SelectorKind::Index;
  if (text == "label") return SelectorKind::Label;
  return std::nullopt;
}

bool parse_selector(const json & node, Selector & out, std::string & error)
{
  if (!node.is_object()) {
    error = "selector must be a map";
    return false;
  }
  if (!node.contains("value") || !node["value"].is_string()) {
    error = "selector has no 'value'";
    return false;
  }
  out.text = node["value"].get<std::string>();

  // Kind defaults to system, the only family the resolver understands
  out.kind = SelectorKind::System;
  if (node.contains("kind")) {
    const std::optional<SelectorKind> kind =
      node["kind"].is_string() ? selector_kind_from_string(node["kind"].get<std::string>())
                               : std::nullopt;
    if (!kind) {
      error = "selector kind must be 'system', 'index' or 'label'";
      return false;
    }
    out.kind = *kind;
  }
  return true;
}

bool parse_member(const json & node, MemberReference & out, std::string & error)
{
  if (!node.is_object()) {
    error = "member reference must be a map";
    return false;
  }

  if (node.contains("identifier")) {
    if (!node["identifier"].is_string()) {
      error = "'identifier' must be a string";
      return false;
    }
    out.identifier = MemberIdentifier{node["identifier"].get<std::string>()};
  }

  if (node.contains("symbol")) {
    if (!node["symbol"].is_string()) {
      error = "'symbol' must be a string";
      return false;
    }
    out.symbol = MemberSymbol{node["symbol"].get<std::string>()};
  }

  if (node.contains("selector")) {
    Selector selector;
    if (!parse_selector(node["selector"], selector, error)) {
      return false;
    }
    out.selector = std::move(selector);
  }
  return true;
}

}  // namespace

bool parse_reference(const json & node, DeclarationReference & out, std::string & error)
{
  if (!node.is_object()) {
    error = "reference must be a map";
    return false;
  }

  if (node.contains("packageName")) {
    if (!node["packageName"].is_string()) {
      error = "'packageName' must be a string";
      return false;
    }
    out.package_name = node["packageName"].get<std::string>();
  }

  if (node.contains("importPath")) {
    if (!node["importPath"].is_string()) {
      error = "'importPath' must be a string";
      return false;
    }
    out.import_path = node["importPath"].get<std::string>();
  }

  if (node.contains("members")) {
    if (!node["members"].is_array()) {
      error = "'members' must be a list";
      return false;
    }
    for (const auto & member_node : node["members"]) {
      MemberReference member;
      if (!parse_member(member_node, member, error)) {
        return false;
      }
      out.member_references.push_back(std::move(member));
    }
  }
  return true;
}

BatchLoadResult parse_reference_batch(const json & root, const std::filesystem::path & source)
{
  if (!root.is_object() || !root.contains("references") || !root["references"].is_array()) {
    return BatchLoadResult::fail("reference batch must have a 'references' list");
  }

  std::vector<ReferenceEntry> entries;
  size_t index = 0;
  for (const auto & node : root["references"]) {
    ReferenceEntry entry;
    std::string error;
    if (!parse_reference(node, entry.reference, error)) {
      return BatchLoadResult::fail("reference " + std::to_string(index) + ": " + error);
    }
    if (node.contains("text") && node["text"].is_string()) {
      entry.text = node["text"].get<std::string>();
    } else {
      entry.text = to_string(entry.reference);
    }
    entry.source = source;
    entry.index = index++;
    entries.push_back(std::move(entry));
  }

  return BatchLoadResult::ok(std::move(entries));
}

BatchLoadResult load_reference_batch(const std::filesystem::path & batch_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(batch_path)) {
    return BatchLoadResult::fail("reference batch not found: " + batch_path.string());
  }

  std::ifstream in(batch_path);
  if (!in.is_open()) {
    return BatchLoadResult::fail("failed to open reference batch: " + batch_path.string());
  }

  json root;
  try {
    root = json::parse(in);
  } catch (const json::exception & e) {
    return BatchLoadResult::fail("failed to parse JSON: " + std::string(e.what()));
  }

  return parse_reference_batch(root, batch_path);
}

}  // namespace declref
