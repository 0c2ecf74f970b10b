// declref/model/symbol_table.cpp - Export index implementation
//
#include "declref/model/symbol_table.hpp"

#include <utility>
#include <variant>

namespace declref
{

// ============================================================================
// Modules
// ============================================================================

ModuleId SymbolTable::add_module(std::string_view name)
{
  if (const auto existing = find_module(name)) {
    return *existing;
  }

  auto info = std::make_unique<ModuleExports>();
  info->name = std::string(name);
  modules_.push_back(std::move(info));
  return ModuleId(static_cast<uint32_t>(modules_.size() - 1));
}

std::optional<ModuleId> SymbolTable::find_module(std::string_view name) const
{
  for (size_t i = 0; i < modules_.size(); ++i) {
    if (modules_[i]->name == name) {
      return ModuleId(static_cast<uint32_t>(i));
    }
  }
  return std::nullopt;
}

std::string_view SymbolTable::module_name(ModuleId module) const noexcept
{
  const ModuleExports * info = get_module(module);
  return info != nullptr ? std::string_view(info->name) : std::string_view();
}

bool SymbolTable::has_module(ModuleId module) const noexcept
{
  return get_module(module) != nullptr;
}

ModuleId SymbolTable::root_module_of(const WorkingPackage & package) const noexcept
{
  return has_module(package.entry_module) ? package.entry_module : ModuleId::invalid();
}

// ============================================================================
// Exports
// ============================================================================

bool SymbolTable::define_export(ModuleId module, std::string_view name, Entity entity)
{
  if (!has_module(module)) {
    return false;
  }
  if (const auto * local = std::get_if<LocalEntity>(&entity);
      local != nullptr && local->declarations.empty()) {
    return false;
  }

  ModuleExports & info = *modules_[module.value()];
  if (info.index.find(name) != info.index.end()) {
    return false;
  }

  info.exports.push_back(Export{std::string(name), std::move(entity)});
  const Export & added = info.exports.back();
  info.index.emplace(std::string_view(added.name), &added);
  return true;
}

const Entity * SymbolTable::try_get_export(ModuleId module, std::string_view name) const
{
  const ModuleExports * info = get_module(module);
  if (info == nullptr) {
    return nullptr;
  }
  auto it = info->index.find(name);
  return it != info->index.end() ? &it->second->entity : nullptr;
}

const std::deque<Export> * SymbolTable::exports_of(ModuleId module) const noexcept
{
  const ModuleExports * info = get_module(module);
  return info != nullptr ? &info->exports : nullptr;
}

const SymbolTable::ModuleExports * SymbolTable::get_module(ModuleId module) const noexcept
{
  if (!module.is_valid() || module.value() >= modules_.size()) {
    return nullptr;
  }
  return modules_[module.value()].get();
}

}  // namespace declref
