// declref/model/decl_kind.hpp - Declaration kind enumeration
//
// The syntactic kinds a declaration node can have, and their textual
// forms as they appear in API model files and in kind selectors.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace declref
{

// ============================================================================
// DeclKind
// ============================================================================

/**
 * Kind of a syntactic declaration.
 *
 * Fixed when the declaration node is created.
 */
enum class DeclKind : uint8_t {
  Class,      ///< class Foo {}
  Interface,  ///< interface Foo {}
  Enum,       ///< enum Foo {}
  Function,   ///< function foo() / method
  Variable,   ///< const / let / var / property
  TypeAlias,  ///< type Foo = ...
  Namespace,  ///< namespace Foo {} / module
};

// ============================================================================
// to_string() / parse Helper Functions
// ============================================================================

/// Model-file spelling of a declaration kind ("class", "type", ...)
[[nodiscard]] constexpr std::string_view to_string(DeclKind kind) noexcept
{
  switch (kind) {
    case DeclKind::Class:
      return "class";
    case DeclKind::Interface:
      return "interface";
    case DeclKind::Enum:
      return "enum";
    case DeclKind::Function:
      return "function";
    case DeclKind::Variable:
      return "variable";
    case DeclKind::TypeAlias:
      return "type";
    case DeclKind::Namespace:
      return "namespace";
  }
  return "";
}

/**
 * Map a kind spelling to its DeclKind.
 *
 * Accepts exactly the spellings produced by to_string(DeclKind), which are
 * also the recognized system selector values. Matching is case-sensitive.
 *
 * @return the kind, or std::nullopt for an unrecognized spelling
 */
[[nodiscard]] constexpr std::optional<DeclKind> decl_kind_from_string(
  std::string_view text) noexcept
{
  if (text == "class") return DeclKind::Class;
  if (text == "enum") return DeclKind::Enum;
  if (text == "function") return DeclKind::Function;
  if (text == "interface") return DeclKind::Interface;
  if (text == "namespace") return DeclKind::Namespace;
  if (text == "type") return DeclKind::TypeAlias;
  if (text == "variable") return DeclKind::Variable;
  return std::nullopt;
}

}  // namespace declref
