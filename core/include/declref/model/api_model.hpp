// declref/model/api_model.hpp - Analyzed package handed to the resolver
//
// Bundles the declaration graph, the export table and the identity of the
// working package for one analysis run.
//
#pragma once

#include "declref/model/declaration_graph.hpp"
#include "declref/model/symbol_table.hpp"

namespace declref
{

/**
 * Everything the resolver reads for one analysis run.
 *
 * Owns the declaration arena and the export table. Movable, not copyable;
 * never mutated once construction has finished.
 */
struct ApiModel
{
  WorkingPackage package;
  SymbolTable symbols;
  DeclarationGraph decls;
};

}  // namespace declref
