// declref/model/declaration_graph.hpp - Declaration node arena
//
// Stores every declaration of an analyzed package in one flat arena.
// Parent/child relations are DeclId links, so nodes never own each other.
//
#pragma once

#include <gsl/span>
#include <string>
#include <string_view>
#include <vector>

#include "declref/model/decl_kind.hpp"
#include "declref/model/handles.hpp"

namespace declref
{

// ============================================================================
// DeclNode
// ============================================================================

/**
 * One syntactic declaration.
 *
 * Several nodes may share a name under the same parent (overloads and
 * merged declarations); each is a separate node.
 */
struct DeclNode
{
  std::string name;
  DeclKind kind = DeclKind::Variable;

  /// Enclosing declaration (invalid for declarations bound to an export)
  DeclId parent;

  /// Module whose export owns this declaration tree
  ModuleId module;

  /// Export name of `module` whose entity lists this node (roots only)
  std::string owner;

  /// Members in declaration order
  std::vector<DeclId> children;

  [[nodiscard]] bool is_root() const noexcept { return !parent.is_valid(); }
};

// ============================================================================
// DeclarationGraph
// ============================================================================

/**
 * Arena of declaration nodes.
 *
 * Built once per analysis run, then only read. All const member functions
 * are safe to call concurrently.
 */
class DeclarationGraph
{
public:
  DeclarationGraph() = default;

  DeclarationGraph(const DeclarationGraph &) = delete;
  DeclarationGraph & operator=(const DeclarationGraph &) = delete;
  DeclarationGraph(DeclarationGraph &&) = default;
  DeclarationGraph & operator=(DeclarationGraph &&) = default;

  // ===========================================================================
  // Building
  // ===========================================================================

  /**
   * Add a declaration bound directly to an export of `module`.
   *
   * `owner` is the export name; empty means the export is named after the
   * declaration, as for `export class Shape`.
   *
   * @return Handle of the new node, invalid if `module` is invalid
   */
  DeclId add_root(std::string name, DeclKind kind, ModuleId module, std::string owner = {});

  /**
   * Add a member declaration under `parent`.
   *
   * The node is appended to the parent's children and inherits its module.
   *
   * @return Handle of the new node, invalid if `parent` is not in this graph
   */
  DeclId add_member(DeclId parent, std::string name, DeclKind kind);

  // ===========================================================================
  // Queries
  // ===========================================================================

  /// Get a node by handle (nullptr if the handle is not in this graph)
  [[nodiscard]] const DeclNode * get(DeclId id) const noexcept;

  /// Check whether a handle belongs to this graph
  [[nodiscard]] bool contains(DeclId id) const noexcept { return get(id) != nullptr; }

  /// All members of a node, in declaration order
  [[nodiscard]] gsl::span<const DeclId> children(DeclId id) const noexcept;

  /**
   * Members of a node whose name equals `name` exactly, in declaration order.
   *
   * Empty if there is no such member or the handle is unknown.
   */
  [[nodiscard]] std::vector<DeclId> children_named(DeclId id, std::string_view name) const;

  /// Walk parent links up to the declaration bound to the export
  [[nodiscard]] DeclId root_of(DeclId id) const noexcept;

  /// Export name owning the tree of `id` ("" if the handle is unknown)
  [[nodiscard]] std::string_view owning_export(DeclId id) const noexcept;

  /// Dotted path from the root declaration, e.g. "Shape.area"
  [[nodiscard]] std::string qualified_name(DeclId id) const;

  [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }
  [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

private:
  std::vector<DeclNode> nodes_;  // indexed by DeclId::value()
};

}  // namespace declref
