// declref/test_support/reference_helpers.hpp - helpers for unit/integration tests
//
// Builders for structured references and small in-memory models, plus
// scratch-directory helpers for loader tests.
//
#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "declref/model/api_model.hpp"
#include "declref/reference/declaration_reference.hpp"

namespace declref::test_support
{

/// `name` or `name:kind`
[[nodiscard]] inline MemberReference member(std::string name, std::string_view kind = {})
{
  if (kind.empty()) {
    return MemberReference::named(std::move(name));
  }
  return MemberReference::named(
    std::move(name), Selector{SelectorKind::System, std::string(kind)});
}

/// Member carrying a selector of an arbitrary family
[[nodiscard]] inline MemberReference member_with(
  std::string name, SelectorKind family, std::string text)
{
  return MemberReference::named(std::move(name), Selector{family, std::move(text)});
}

[[nodiscard]] inline MemberReference symbol_member(std::string symbol)
{
  MemberReference m;
  m.symbol = MemberSymbol{std::move(symbol)};
  return m;
}

/// Reference into the working package (no package qualifier)
[[nodiscard]] inline DeclarationReference ref(std::vector<MemberReference> members)
{
  DeclarationReference r;
  r.member_references = std::move(members);
  return r;
}

/// Package-qualified reference
[[nodiscard]] inline DeclarationReference ref_in(
  std::string package, std::vector<MemberReference> members)
{
  DeclarationReference r = ref(std::move(members));
  r.package_name = std::move(package);
  return r;
}

/**
 * Start an in-memory model with one entry module.
 *
 * Exports are added through model.symbols / model.decls directly.
 */
[[nodiscard]] inline ApiModel make_model(std::string package, std::string_view entry = "index")
{
  ApiModel model;
  model.package.name = std::move(package);
  model.package.entry_module = model.symbols.add_module(entry);
  return model;
}

/// Export `name` from the entry module, bound to the given declarations
inline bool export_local(ApiModel & model, const std::string & name, std::vector<DeclId> decls)
{
  return model.symbols.define_export(
    model.package.entry_module, name, LocalEntity{name, std::move(decls)});
}

// ============================================================================
// Scratch files
// ============================================================================

[[nodiscard]] inline std::filesystem::path make_temp_dir(std::string_view prefix)
{
  const auto base = std::filesystem::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::filesystem::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  std::filesystem::create_directories(dir);
  return dir;
}

inline void write_file(const std::filesystem::path & p, std::string_view content)
{
  std::filesystem::create_directories(p.parent_path());
  std::ofstream out(p);
  out << content;
}

}  // namespace declref::test_support
