// declref/model/entity.hpp - What an exported name is bound to
//
#pragma once

#include <string>
#include <variant>
#include <vector>

#include "declref/model/handles.hpp"

namespace declref
{

/**
 * A name declared in the exporting module itself.
 *
 * Holds one declaration per overload or merged declaration, in
 * declaration order. All of them carry `local_name`.
 */
struct LocalEntity
{
  std::string local_name;
  std::vector<DeclId> declarations;
};

/**
 * A name re-exported from another module.
 *
 * The target is opaque to resolution: re-exports are never followed.
 */
struct ImportedEntity
{
  std::string local_name;

  /// Module specifier as written in the export statement, e.g. "./legacy"
  std::string module_specifier;

  /// Name exported by the target module ("default", "*" or an identifier)
  std::string export_name;
};

/// Entity bound to an exported name
using Entity = std::variant<LocalEntity, ImportedEntity>;

/// Name the entity is known by inside its module
[[nodiscard]] inline const std::string & local_name_of(const Entity & entity)
{
  return std::visit(
    [](const auto & e) -> const std::string & { return e.local_name; }, entity);
}

[[nodiscard]] inline bool is_local(const Entity & entity) noexcept
{
  return std::holds_alternative<LocalEntity>(entity);
}

}  // namespace declref
