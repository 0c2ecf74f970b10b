// declref/io/reference_batch.hpp - Load batches of parsed references from JSON
//
// References arrive already parsed by their producer (e.g. a doc comment
// parser). A batch file lists them with the text they were parsed from:
//
//   { "references": [
//       { "text": "widgets#Shape:class",
//         "packageName": "widgets",
//         "members": [ { "identifier": "Shape",
//                        "selector": { "kind": "system", "value": "class" } } ] } ] }
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "declref/reference/declaration_reference.hpp"

namespace declref
{

/**
 * One reference of a batch, with where it came from.
 */
struct ReferenceEntry
{
  DeclarationReference reference;

  /// Text the reference was parsed from (canonical form when absent)
  std::string text;

  /// Batch file the entry was read from (empty for in-memory batches)
  std::filesystem::path source;

  /// Position of the entry in its batch
  size_t index = 0;
};

/**
 * Result of loading a reference batch.
 */
struct BatchLoadResult
{
  std::vector<ReferenceEntry> entries;
  bool success = false;
  std::string error;

  static BatchLoadResult ok(std::vector<ReferenceEntry> e)
  {
    BatchLoadResult r;
    r.entries = std::move(e);
    r.success = true;
    return r;
  }

  static BatchLoadResult fail(std::string msg)
  {
    BatchLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Read one reference object.
 *
 * @param node JSON object with optional "packageName", "importPath" and a
 *             "members" list
 * @param error Set when the object is malformed
 * @return true on success
 */
bool parse_reference(const nlohmann::json & node, DeclarationReference & out, std::string & error);

/**
 * Read a batch document.
 *
 * @param root Batch document ({"references": [...]})
 * @param source Recorded as ReferenceEntry::source
 */
[[nodiscard]] BatchLoadResult parse_reference_batch(
  const nlohmann::json & root, const std::filesystem::path & source = {});

/// Load a batch document from a JSON file
[[nodiscard]] BatchLoadResult load_reference_batch(const std::filesystem::path & batch_path);

}  // namespace declref
