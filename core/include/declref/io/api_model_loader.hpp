// declref/io/api_model_loader.hpp - Load an analyzed package from JSON
//
// The export table and declaration graph are produced by an external
// analyzer and handed over as a JSON document:
//
//   {
//     "package": "widgets",
//     "entryModule": "index",
//     "modules": [
//       { "name": "index",
//         "exports": [
//           { "name": "Shape",
//             "declarations": [ { "kind": "interface" },
//                               { "kind": "class",
//                                 "members": [ { "name": "area", "kind": "function" } ] } ] },
//           { "name": "Legacy", "reexport": { "module": "./legacy", "name": "Legacy" } } ] } ]
//   }
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

#include "declref/model/api_model.hpp"

namespace declref
{

// ============================================================================
// Loading Result
// ============================================================================

/**
 * Result of loading an API model.
 */
struct ModelLoadResult
{
  /// Loaded model (only valid if success == true)
  ApiModel model;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ModelLoadResult ok(ApiModel m)
  {
    ModelLoadResult r;
    r.model = std::move(m);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static ModelLoadResult fail(std::string msg)
  {
    ModelLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Loading API
// ============================================================================

/**
 * Build an API model from an already-parsed JSON document.
 *
 * Rejects unknown declaration kinds, exports without declarations,
 * duplicate exports within a module and an unknown entry module.
 */
[[nodiscard]] ModelLoadResult parse_api_model(const nlohmann::json & root);

/**
 * Load an API model from a JSON file.
 *
 * @param model_path Path to the model file (e.g. widgets.api.json)
 */
[[nodiscard]] ModelLoadResult load_api_model(const std::filesystem::path & model_path);

/**
 * Serialize a declaration and its members to JSON.
 *
 * Produces the member shape accepted by parse_api_model, plus the
 * declaration's qualified name.
 */
[[nodiscard]] nlohmann::json to_json(const DeclarationGraph & decls, DeclId id);

}  // namespace declref
