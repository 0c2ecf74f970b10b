// declref/resolver/reference_resolver.hpp - Declaration reference resolution
//
// Resolves a structured declaration reference against the export table and
// declaration graph of the working package.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "declref/model/api_model.hpp"
#include "declref/model/declaration_graph.hpp"
#include "declref/model/symbol_table.hpp"
#include "declref/reference/declaration_reference.hpp"

namespace declref
{

// ============================================================================
// Failure Types
// ============================================================================

/**
 * Why a reference could not be resolved.
 */
enum class FailureKind : uint8_t {
  UnsupportedExternalPackage,  ///< names a package other than the working one
  UnsupportedImportPath,       ///< has a file-path qualifier
  EmptyReference,              ///< has no member references
  UnknownExport,               ///< first member is not exported by the entry module
  UnsupportedReexport,         ///< first member is a re-export
  UnsupportedSymbolSelector,   ///< member is symbol-keyed
  MissingMemberIdentifier,     ///< member has no identifier
  NoMatchingMember,            ///< no child with the requested name
  AmbiguousReference,          ///< several candidates, no selector
  UnsupportedSelectorFamily,   ///< selector is not a system selector
  UnsupportedSelectorValue,    ///< system selector names no known kind
  NoDeclarationForSelector,    ///< no candidate of the selected kind
  AmbiguousSelectorMatch,      ///< several candidates of the selected kind
};

[[nodiscard]] constexpr std::string_view to_string(FailureKind kind) noexcept
{
  switch (kind) {
    case FailureKind::UnsupportedExternalPackage:
      return "UnsupportedExternalPackage";
    case FailureKind::UnsupportedImportPath:
      return "UnsupportedImportPath";
    case FailureKind::EmptyReference:
      return "EmptyReference";
    case FailureKind::UnknownExport:
      return "UnknownExport";
    case FailureKind::UnsupportedReexport:
      return "UnsupportedReexport";
    case FailureKind::UnsupportedSymbolSelector:
      return "UnsupportedSymbolSelector";
    case FailureKind::MissingMemberIdentifier:
      return "MissingMemberIdentifier";
    case FailureKind::NoMatchingMember:
      return "NoMatchingMember";
    case FailureKind::AmbiguousReference:
      return "AmbiguousReference";
    case FailureKind::UnsupportedSelectorFamily:
      return "UnsupportedSelectorFamily";
    case FailureKind::UnsupportedSelectorValue:
      return "UnsupportedSelectorValue";
    case FailureKind::NoDeclarationForSelector:
      return "NoDeclarationForSelector";
    case FailureKind::AmbiguousSelectorMatch:
      return "AmbiguousSelectorMatch";
  }
  return "";
}

/// Diagnostic code for a failure kind ("R0001" .. "R0013")
[[nodiscard]] std::string failure_code(FailureKind kind);

/**
 * A failed resolution.
 *
 * Describes why a reference could not be resolved. Callers normally turn it
 * into a diagnostic and go on with the next reference.
 */
struct ResolverFailure
{
  FailureKind kind;

  /// Human-readable explanation
  std::string reason;

  /// Index of the member reference being resolved when the failure occurred
  std::optional<size_t> member_index;

  /// Declarations that were in play for the ambiguity and selector failures
  std::vector<DeclId> candidates;
};

// ============================================================================
// Result Type (C++17 compatible)
// ============================================================================

/**
 * Holds either a success value T or a ResolverFailure.
 */
template <typename T>
class ResolveResultOf
{
public:
  using ValueType = T;
  using ErrorType = ResolverFailure;

  // Construct with success value
  ResolveResultOf(T value) : data_(std::move(value)) {}

  // Construct with failure
  ResolveResultOf(ResolverFailure failure) : data_(std::move(failure)) {}

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] bool has_failure() const { return std::holds_alternative<ErrorType>(data_); }

  explicit operator bool() const { return has_value(); }

  // Get the value (undefined behavior if has_failure())
  [[nodiscard]] const T & value() const & { return std::get<T>(data_); }
  T && value() && { return std::get<T>(std::move(data_)); }

  // Get the failure (undefined behavior if has_value())
  [[nodiscard]] const ErrorType & failure() const & { return std::get<ErrorType>(data_); }
  ErrorType && failure() && { return std::get<ErrorType>(std::move(data_)); }

  const T & operator*() const & { return value(); }

private:
  std::variant<T, ErrorType> data_;
};

/// Outcome of resolving a whole reference
using ResolveResult = ResolveResultOf<DeclId>;

// ============================================================================
// ReferenceResolver
// ============================================================================

/**
 * Resolves declaration references by walking the working package's export
 * table and declaration graph.
 *
 * Resolution is a pure function of (model, reference): the resolver keeps
 * no mutable state, so one instance may serve many threads at once and
 * repeated calls give identical results.
 *
 * Algorithm:
 * 1. Reject other packages and import paths
 * 2. Look up the first member in the entry module's exports
 * 3. Reject re-exports
 * 4. Narrow the export's declarations to one (select_declaration)
 * 5. For each further member, narrow the current declaration's
 *    children with that name
 *
 * The first failing step ends resolution; later members are not looked at.
 */
class ReferenceResolver
{
public:
  ReferenceResolver(
    const SymbolTable & symbols, const DeclarationGraph & decls, WorkingPackage package);

  explicit ReferenceResolver(const ApiModel & model);

  /**
   * Resolve a reference.
   *
   * @param ref The reference to resolve
   * @return The single declaration referenced, or why there is none
   */
  [[nodiscard]] ResolveResult resolve(const DeclarationReference & ref) const;

  [[nodiscard]] const WorkingPackage & working_package() const noexcept { return package_; }

private:
  /**
   * Narrow a non-empty candidate list to one declaration.
   *
   * Without a selector the list must hold exactly one candidate. With a
   * system selector, exactly one candidate must have the selected kind.
   *
   * @param candidates Declarations sharing `name`
   * @param member The member reference supplying the selector
   * @param name Name used in failure messages
   * @param member_index Position of `member` in the reference
   */
  [[nodiscard]] ResolveResult select_declaration(
    gsl::span<const DeclId> candidates, const MemberReference & member, std::string_view name,
    size_t member_index) const;

  const SymbolTable & symbols_;
  const DeclarationGraph & decls_;
  WorkingPackage package_;
};

}  // namespace declref
