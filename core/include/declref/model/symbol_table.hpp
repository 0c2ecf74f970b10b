// declref/model/symbol_table.hpp - Per-module export index
//
// Maps (module, export name) to the Entity the name is bound to.
//
#pragma once

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "declref/model/entity.hpp"
#include "declref/model/handles.hpp"

namespace declref
{

// ============================================================================
// Transparent Hash/Equal for string_view keys
// ============================================================================

/// Transparent hash functor for string_view heterogeneous lookup
struct StringViewHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct StringViewEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

// ============================================================================
// Working Package
// ============================================================================

/**
 * The package being analyzed.
 *
 * References may only name this package; its entry module is where the
 * first member of a reference is looked up.
 */
struct WorkingPackage
{
  std::string name;
  ModuleId entry_module;
};

// ============================================================================
// Export
// ============================================================================

/**
 * One exported name of a module.
 */
struct Export
{
  std::string name;
  Entity entity;
};

// ============================================================================
// SymbolTable
// ============================================================================

/**
 * Export table of all modules of an analyzed package.
 *
 * Holds exactly one Entity per (module, name) pair. Built once, then only
 * read; all const member functions are safe to call concurrently.
 */
class SymbolTable
{
public:
  SymbolTable() = default;

  SymbolTable(const SymbolTable &) = delete;
  SymbolTable & operator=(const SymbolTable &) = delete;
  SymbolTable(SymbolTable &&) = default;
  SymbolTable & operator=(SymbolTable &&) = default;

  // ===========================================================================
  // Modules
  // ===========================================================================

  /**
   * Add a module.
   *
   * If a module with the same name already exists, returns its handle.
   */
  ModuleId add_module(std::string_view name);

  /// Find a module by name
  [[nodiscard]] std::optional<ModuleId> find_module(std::string_view name) const;

  /// Name of a module (empty for an unknown handle)
  [[nodiscard]] std::string_view module_name(ModuleId module) const noexcept;

  [[nodiscard]] bool has_module(ModuleId module) const noexcept;

  [[nodiscard]] size_t module_count() const noexcept { return modules_.size(); }

  /**
   * Entry module of the working package.
   *
   * @return The package's entry module, invalid if it is not in this table
   */
  [[nodiscard]] ModuleId root_module_of(const WorkingPackage & package) const noexcept;

  // ===========================================================================
  // Exports
  // ===========================================================================

  /**
   * Bind an exported name in a module.
   *
   * @return true if defined, false if the module is unknown, the name is
   *         already exported by it, or a local entity has no declarations
   */
  bool define_export(ModuleId module, std::string_view name, Entity entity);

  /**
   * Look up an exported name.
   *
   * @return Pointer to the entity if found, nullptr otherwise
   */
  [[nodiscard]] const Entity * try_get_export(ModuleId module, std::string_view name) const;

  /// All exports of a module, in definition order
  [[nodiscard]] const std::deque<Export> * exports_of(ModuleId module) const noexcept;

private:
  struct ModuleExports
  {
    std::string name;
    std::deque<Export> exports;  // stable addresses for the index keys
    std::unordered_map<std::string_view, const Export *, StringViewHash, StringViewEqual> index;
  };

  [[nodiscard]] const ModuleExports * get_module(ModuleId module) const noexcept;

  std::vector<std::unique_ptr<ModuleExports>> modules_;  // indexed by ModuleId::value()
};

}  // namespace declref
