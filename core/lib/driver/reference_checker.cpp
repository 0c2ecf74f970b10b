// declref/driver/reference_checker.cpp - Batch reference checking driver
//
#include "declref/driver/reference_checker.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include "declref/io/api_model_loader.hpp"
#include "declref/model/decl_kind.hpp"

namespace declref
{

namespace
{

constexpr const char * k_load_error_code = "R0100";

Origin origin_of(const ReferenceEntry & entry)
{
  Origin origin;
  origin.file = entry.source.empty() ? std::string("<input>") : entry.source.string();
  origin.entry = entry.index;
  return origin;
}

Origin origin_of(const std::filesystem::path & file) { return Origin{file.string(), std::nullopt}; }

/// Kinds of the candidates, in candidate order
std::vector<DeclKind> candidate_kinds(const ApiModel & model, const ResolverFailure & failure)
{
  std::vector<DeclKind> kinds;
  for (const DeclId id : failure.candidates) {
    if (const DeclNode * node = model.decls.get(id)) {
      kinds.push_back(node->kind);
    }
  }
  return kinds;
}

std::string join_kinds(const std::vector<DeclKind> & kinds)
{
  std::string out;
  for (const DeclKind kind : kinds) {
    if (!out.empty()) {
      out += ", ";
    }
    out += std::string(to_string(kind));
  }
  return out;
}

/**
 * Rewrite the reference with a kind selector on the failing member.
 *
 * Only offered for a kind that exactly one candidate has.
 */
std::optional<std::string> suggest_selector(
  const ReferenceEntry & entry, size_t member_index, const std::vector<DeclKind> & kinds)
{
  for (const DeclKind kind : kinds) {
    if (std::count(kinds.begin(), kinds.end(), kind) != 1) {
      continue;
    }
    DeclarationReference fixed = entry.reference;
    if (member_index >= fixed.member_references.size()) {
      return std::nullopt;
    }
    fixed.member_references[member_index].selector =
      Selector{SelectorKind::System, std::string(to_string(kind))};
    return to_string(fixed);
  }
  return std::nullopt;
}

}  // namespace

// ============================================================================
// Checking
// ============================================================================

CheckResult ReferenceChecker::check(
  const ApiModel & model, const std::vector<ReferenceEntry> & entries,
  const CheckOptions & options)
{
  CheckResult result;
  const Severity severity = options.severity_override.value_or(options.unresolved_severity);
  const ReferenceResolver resolver(model);

  result.references.reserve(entries.size());
  for (const auto & entry : entries) {
    const ResolveResult resolved = resolver.resolve(entry.reference);

    CheckedReference checked;
    checked.text = entry.text;
    if (resolved.has_value()) {
      checked.target = resolved.value();
      ++result.resolved_count;
    } else {
      checked.failure = resolved.failure().kind;
      ++result.failed_count;
      report_failure(model, entry, resolved.failure(), severity, result.diagnostics);
    }
    result.references.push_back(std::move(checked));
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

CheckResult ReferenceChecker::check_files(
  const std::filesystem::path & model_path,
  const std::vector<std::filesystem::path> & batch_paths, const CheckOptions & options)
{
  CheckResult result;

  ModelLoadResult loaded = load_api_model(model_path);
  if (!loaded.success) {
    result.diagnostics.report_error(origin_of(model_path), loaded.error)
      .with_code(k_load_error_code);
    result.success = false;
    return result;
  }

  DiagnosticBag load_diags;
  std::vector<ReferenceEntry> entries;
  for (const auto & path : batch_paths) {
    BatchLoadResult batch = load_reference_batch(path);
    if (!batch.success) {
      load_diags.report_error(origin_of(path), batch.error).with_code(k_load_error_code);
      continue;
    }
    std::move(batch.entries.begin(), batch.entries.end(), std::back_inserter(entries));
  }

  result = check(loaded.model, entries, options);
  result.diagnostics.merge(std::move(load_diags));
  result.success = !result.diagnostics.has_errors();
  result.model = std::move(loaded.model);
  return result;
}

CheckResult ReferenceChecker::check_project(
  const ProjectConfig & config, const CheckOptions & options)
{
  CheckOptions effective = options;
  effective.unresolved_severity = config.checker.unresolved_severity;

  std::vector<std::filesystem::path> batch_paths;
  batch_paths.reserve(config.references.size());
  for (const auto & p : config.references) {
    batch_paths.push_back(config.resolve_path(p));
  }

  CheckResult result = check_files(config.resolve_path(config.model), batch_paths, effective);

  const bool package_mismatch = result.model && config.package.name &&
                                *config.package.name != result.model->package.name;
  if (package_mismatch) {
    result.diagnostics
      .report_error(
        origin_of(config.project_root / k_project_config_file_name),
        "package '" + *config.package.name + "' does not match the API model package '" +
          result.model->package.name + "'")
      .with_code(k_load_error_code);
    result.success = false;
  }
  return result;
}

// ============================================================================
// Reporting
// ============================================================================

void ReferenceChecker::report_failure(
  const ApiModel & model, const ReferenceEntry & entry, const ResolverFailure & failure,
  Severity severity, DiagnosticBag & diags)
{
  auto builder =
    diags.report(severity, origin_of(entry), failure.reason, "in '" + entry.text + "'");
  builder.with_code(failure_code(failure.kind));

  const auto & members = entry.reference.member_references;
  if (failure.member_index && *failure.member_index < members.size()) {
    builder.with_note(
      "while resolving '" + to_string(members[*failure.member_index]) + "' (member " +
      std::to_string(*failure.member_index + 1) + " of " + std::to_string(members.size()) + ")");
  }

  const std::vector<DeclKind> kinds = candidate_kinds(model, failure);

  switch (failure.kind) {
    case FailureKind::AmbiguousReference: {
      builder.with_note("candidates: " + join_kinds(kinds));
      if (const auto fixed = suggest_selector(entry, failure.member_index.value_or(0), kinds)) {
        builder.with_fixit(entry.text, *fixed);
        builder.with_help("add a kind selector to choose one of the declarations");
      } else {
        builder.with_help("the declarations share a kind; rename one of them to reference it");
      }
      break;
    }
    case FailureKind::NoDeclarationForSelector:
      builder.with_note("declared kinds: " + join_kinds(kinds));
      break;
    case FailureKind::AmbiguousSelectorMatch:
      for (const DeclId id : failure.candidates) {
        builder.with_secondary_label({}, "matches " + model.decls.qualified_name(id));
      }
      builder.with_help("declarations of the same kind cannot be told apart by a kind selector");
      break;
    case FailureKind::UnsupportedSelectorValue:
      builder.with_help(
        "supported selectors are class, enum, function, interface, namespace, type, variable");
      break;
    case FailureKind::UnsupportedReexport:
      builder.with_help("reference the declaration in the package that declares it");
      break;
    default:
      break;
  }
}

}  // namespace declref
