// declref/resolver/reference_resolver.cpp - Declaration reference resolution
//
#include "declref/resolver/reference_resolver.hpp"

#include <fmt/core.h>

#include "declref/model/decl_kind.hpp"

namespace declref
{

namespace
{

ResolverFailure make_failure(
  FailureKind kind, std::string reason, std::optional<size_t> member_index = std::nullopt)
{
  return ResolverFailure{kind, std::move(reason), member_index, {}};
}

std::string quoted(std::string_view text) { return "\"" + std::string(text) + "\""; }

/// Name a member reference stands for, or why it has none
ResolveResultOf<std::string> member_identifier(const MemberReference & member, size_t index)
{
  if (member.symbol) {
    return make_failure(
      FailureKind::UnsupportedSymbolSelector, "ECMAScript symbol selectors are not supported",
      index);
  }
  if (!member.identifier) {
    return make_failure(
      FailureKind::MissingMemberIdentifier,
      "The member identifier is missing in the root member reference", index);
  }
  return member.identifier->identifier;
}

}  // namespace

std::string failure_code(FailureKind kind)
{
  return fmt::format("R{:04}", static_cast<unsigned>(kind) + 1U);
}

// ============================================================================
// ReferenceResolver
// ============================================================================

ReferenceResolver::ReferenceResolver(
  const SymbolTable & symbols, const DeclarationGraph & decls, WorkingPackage package)
: symbols_(symbols), decls_(decls), package_(std::move(package))
{
}

ReferenceResolver::ReferenceResolver(const ApiModel & model)
: ReferenceResolver(model.symbols, model.decls, model.package)
{
}

ResolveResult ReferenceResolver::resolve(const DeclarationReference & ref) const
{
  // Is it referring to the working package?
  if (ref.package_name && *ref.package_name != package_.name) {
    return make_failure(
      FailureKind::UnsupportedExternalPackage, "External package references are not supported");
  }

  // Is it a path-based import?
  if (ref.import_path && !ref.import_path->empty()) {
    return make_failure(FailureKind::UnsupportedImportPath, "Import paths are not supported");
  }

  const ModuleId entry_module = symbols_.root_module_of(package_);

  if (ref.member_references.empty()) {
    return make_failure(FailureKind::EmptyReference, "Package references are not supported");
  }

  const MemberReference & root_member = ref.member_references.front();

  auto export_name = member_identifier(root_member, 0);
  if (export_name.has_failure()) {
    return std::move(export_name).failure();
  }

  const Entity * root_entity = symbols_.try_get_export(entry_module, export_name.value());
  if (root_entity == nullptr) {
    return make_failure(
      FailureKind::UnknownExport,
      "The package " + quoted(package_.name) + " does not have an export " +
        quoted(export_name.value()),
      0);
  }

  const auto * local = std::get_if<LocalEntity>(root_entity);
  if (local == nullptr) {
    return make_failure(
      FailureKind::UnsupportedReexport, "Reexported declarations are not supported", 0);
  }

  ResolveResult current =
    select_declaration(local->declarations, root_member, local->local_name, 0);
  if (current.has_failure()) {
    return current;
  }

  for (size_t index = 1; index < ref.member_references.size(); ++index) {
    const MemberReference & member = ref.member_references[index];

    auto member_name = member_identifier(member, index);
    if (member_name.has_failure()) {
      return std::move(member_name).failure();
    }

    const std::vector<DeclId> matching = decls_.children_named(*current, member_name.value());
    if (matching.empty()) {
      return make_failure(
        FailureKind::NoMatchingMember,
        "No member was found with name " + quoted(member_name.value()), index);
    }

    ResolveResult selected = select_declaration(matching, member, member_name.value(), index);
    if (selected.has_failure()) {
      return selected;
    }

    current = std::move(selected);
  }

  return current;
}

ResolveResult ReferenceResolver::select_declaration(
  gsl::span<const DeclId> candidates, const MemberReference & member, std::string_view name,
  size_t member_index) const
{
  if (!member.selector) {
    if (candidates.size() == 1) {
      return candidates[0];
    }
    ResolverFailure failure = make_failure(
      FailureKind::AmbiguousReference,
      "The reference is ambiguous because " + quoted(name) +
        " has more than one declaration; you need to add a TSDoc member reference selector",
      member_index);
    failure.candidates.assign(candidates.begin(), candidates.end());
    return failure;
  }

  const std::string & selector_name = member.selector->text;

  if (member.selector->kind != SelectorKind::System) {
    return make_failure(
      FailureKind::UnsupportedSelectorFamily,
      "The selector " + quoted(selector_name) + " is not a supported selector type",
      member_index);
  }

  const std::optional<DeclKind> selected_kind = decl_kind_from_string(selector_name);
  if (!selected_kind) {
    return make_failure(
      FailureKind::UnsupportedSelectorValue,
      "Unsupported system selector " + quoted(selector_name), member_index);
  }

  std::vector<DeclId> matches;
  for (const DeclId id : candidates) {
    const DeclNode * node = decls_.get(id);
    if (node != nullptr && node->kind == *selected_kind) {
      matches.push_back(id);
    }
  }

  if (matches.empty()) {
    ResolverFailure failure = make_failure(
      FailureKind::NoDeclarationForSelector,
      "A declaration for " + quoted(name) + " was not found that matches the TSDoc selector " +
        quoted(selector_name),
      member_index);
    failure.candidates.assign(candidates.begin(), candidates.end());
    return failure;
  }
  if (matches.size() > 1) {
    ResolverFailure failure = make_failure(
      FailureKind::AmbiguousSelectorMatch,
      "More than one declaration " + quoted(name) + " matches the TSDoc selector " +
        quoted(selector_name),
      member_index);
    failure.candidates = std::move(matches);
    return failure;
  }
  return matches.front();
}

}  // namespace declref
