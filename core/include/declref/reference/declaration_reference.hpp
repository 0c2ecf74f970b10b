// declref/reference/declaration_reference.hpp - Structured declaration reference
//
// A reference such as `widgets#Shape:class.area` after it has been parsed
// by its producer: optional package and import path qualifiers followed by
// a dotted sequence of member references.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace declref
{

// ============================================================================
// Selector
// ============================================================================

/**
 * Family of a member selector.
 */
enum class SelectorKind : uint8_t {
  System,  ///< :class, :enum, ... (declaration kind)
  Index,   ///< :1, :2 (overload index)
  Label,   ///< :LABEL (user-declared label)
};

[[nodiscard]] constexpr std::string_view to_string(SelectorKind kind) noexcept
{
  switch (kind) {
    case SelectorKind::System:
      return "system";
    case SelectorKind::Index:
      return "index";
    case SelectorKind::Label:
      return "label";
  }
  return "";
}

/**
 * Disambiguation tag attached to a member reference.
 */
struct Selector
{
  SelectorKind kind = SelectorKind::System;

  /// Raw selector text without the leading ':'
  std::string text;
};

// ============================================================================
// Member Reference
// ============================================================================

/// Plain member name, e.g. `area` in `Shape.area`
struct MemberIdentifier
{
  std::string identifier;
};

/// Symbol-keyed member name, e.g. `[Symbol.iterator]`
struct MemberSymbol
{
  /// Text of the symbol reference inside the brackets
  std::string symbol_reference;
};

/**
 * One step of the dotted path.
 *
 * Well-formed references carry either an identifier or a symbol.
 */
struct MemberReference
{
  std::optional<MemberIdentifier> identifier;
  std::optional<MemberSymbol> symbol;
  std::optional<Selector> selector;

  /// Convenience constructor for the common `name` / `name:selector` case
  [[nodiscard]] static MemberReference named(
    std::string name, std::optional<Selector> selector = std::nullopt)
  {
    MemberReference m;
    m.identifier = MemberIdentifier{std::move(name)};
    m.selector = std::move(selector);
    return m;
  }
};

// ============================================================================
// Declaration Reference
// ============================================================================

struct DeclarationReference
{
  std::optional<std::string> package_name;
  std::optional<std::string> import_path;
  std::vector<MemberReference> member_references;
};

/**
 * Render a reference in its canonical textual form.
 *
 * Examples: `widgets#Shape:class.area`, `other-pkg/lib/index#Button`,
 * `List.[Symbol.iterator]`. Used for messages only.
 */
[[nodiscard]] std::string to_string(const DeclarationReference & ref);

/// Render one member reference, e.g. `Shape:class`
[[nodiscard]] std::string to_string(const MemberReference & member);

}  // namespace declref
