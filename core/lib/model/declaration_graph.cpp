// declref/model/declaration_graph.cpp - Declaration node arena implementation
//
#include "declref/model/declaration_graph.hpp"

#include <utility>

namespace declref
{

// ============================================================================
// Building
// ============================================================================

DeclId DeclarationGraph::add_root(
  std::string name, DeclKind kind, ModuleId module, std::string owner)
{
  if (!module.is_valid()) {
    return DeclId::invalid();
  }

  const DeclId id(static_cast<uint32_t>(nodes_.size()));
  DeclNode node;
  node.owner = owner.empty() ? name : std::move(owner);
  node.name = std::move(name);
  node.kind = kind;
  node.module = module;
  nodes_.push_back(std::move(node));
  return id;
}

DeclId DeclarationGraph::add_member(DeclId parent, std::string name, DeclKind kind)
{
  if (!contains(parent)) {
    return DeclId::invalid();
  }

  const DeclId id(static_cast<uint32_t>(nodes_.size()));
  DeclNode node;
  node.name = std::move(name);
  node.kind = kind;
  node.parent = parent;
  node.module = nodes_[parent.value()].module;
  nodes_.push_back(std::move(node));

  // Index again: push_back may have reallocated
  nodes_[parent.value()].children.push_back(id);
  return id;
}

// ============================================================================
// Queries
// ============================================================================

const DeclNode * DeclarationGraph::get(DeclId id) const noexcept
{
  if (!id.is_valid() || id.value() >= nodes_.size()) {
    return nullptr;
  }
  return &nodes_[id.value()];
}

gsl::span<const DeclId> DeclarationGraph::children(DeclId id) const noexcept
{
  const DeclNode * node = get(id);
  if (node == nullptr) {
    return {};
  }
  return {node->children.data(), node->children.size()};
}

std::vector<DeclId> DeclarationGraph::children_named(DeclId id, std::string_view name) const
{
  std::vector<DeclId> result;
  for (const DeclId child : children(id)) {
    if (nodes_[child.value()].name == name) {
      result.push_back(child);
    }
  }
  return result;
}

DeclId DeclarationGraph::root_of(DeclId id) const noexcept
{
  const DeclNode * node = get(id);
  if (node == nullptr) {
    return DeclId::invalid();
  }
  while (!node->is_root()) {
    id = node->parent;
    node = &nodes_[id.value()];
  }
  return id;
}

std::string_view DeclarationGraph::owning_export(DeclId id) const noexcept
{
  const DeclNode * root = get(root_of(id));
  return root != nullptr ? std::string_view(root->owner) : std::string_view();
}

std::string DeclarationGraph::qualified_name(DeclId id) const
{
  std::vector<const DeclNode *> chain;
  for (const DeclNode * node = get(id); node != nullptr; node = get(node->parent)) {
    chain.push_back(node);
  }

  std::string result;
  for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
    if (!result.empty()) {
      result += '.';
    }
    result += (*it)->name;
  }
  return result;
}

}  // namespace declref
