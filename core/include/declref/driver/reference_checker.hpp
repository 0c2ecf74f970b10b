// declref/driver/reference_checker.hpp - Batch reference checking driver
//
// Resolves every reference of one or more batches against an API model and
// turns failures into diagnostics. Used by the CLI and by tools that embed
// the checker.
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "declref/basic/diagnostic.hpp"
#include "declref/io/reference_batch.hpp"
#include "declref/model/api_model.hpp"
#include "declref/project/project_config.hpp"
#include "declref/resolver/reference_resolver.hpp"

namespace declref
{

// ============================================================================
// Check Options
// ============================================================================

struct CheckOptions
{
  /// Severity of the diagnostic reported for an unresolved reference
  Severity unresolved_severity = Severity::Error;

  /// Overrides the severity configured in declref.yaml when set
  std::optional<Severity> severity_override;
};

// ============================================================================
// Check Result
// ============================================================================

/**
 * Outcome of one reference of the batch.
 */
struct CheckedReference
{
  /// Text of the reference
  std::string text;

  /// Resolved declaration (invalid if resolution failed)
  DeclId target;

  /// Failure kind if resolution failed
  std::optional<FailureKind> failure;
};

struct CheckResult
{
  /// Whether checking succeeded (no error diagnostics)
  bool success = false;

  /// Collected diagnostics (unresolved references, load failures)
  DiagnosticBag diagnostics;

  /// One entry per checked reference, in input order
  std::vector<CheckedReference> references;

  size_t resolved_count = 0;
  size_t failed_count = 0;

  /// Model the references were resolved against (file and project checks)
  std::optional<ApiModel> model;
};

// ============================================================================
// ReferenceChecker
// ============================================================================

/**
 * Driver that resolves batches of references.
 *
 * A failing reference never stops the batch: every entry is resolved and
 * every failure becomes one diagnostic.
 */
class ReferenceChecker
{
public:
  /**
   * Check a batch against an already loaded model.
   *
   * @param model API model of the working package
   * @param entries References to check
   * @param options Check options
   * @return CheckResult with per-reference outcomes and diagnostics
   */
  [[nodiscard]] static CheckResult check(
    const ApiModel & model, const std::vector<ReferenceEntry> & entries,
    const CheckOptions & options);

  /**
   * Load the model and batches named by a project configuration, then check.
   *
   * Load failures are reported as diagnostics on the result.
   *
   * @param config Project configuration (from declref.yaml)
   * @param options Check options (may override config settings)
   */
  [[nodiscard]] static CheckResult check_project(
    const ProjectConfig & config, const CheckOptions & options);

  /**
   * Load a model file and batch files, then check.
   */
  [[nodiscard]] static CheckResult check_files(
    const std::filesystem::path & model_path,
    const std::vector<std::filesystem::path> & batch_paths, const CheckOptions & options);

private:
  /// Report one failure as a diagnostic
  static void report_failure(
    const ApiModel & model, const ReferenceEntry & entry, const ResolverFailure & failure,
    Severity severity, DiagnosticBag & diags);
};

}  // namespace declref
