// json_model/document/navigator.hpp - Reading and writing along key paths
//
// Walks a JSON document along a KeyPath, reading existing nodes or creating
// intermediate objects while writing.
//
#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "json_model/basic/result.hpp"
#include "json_model/document/key_path.hpp"

namespace json_model
{

/**
 * A node on the walked path is not an object although more components
 * remain to be resolved beneath it.
 */
struct StructuralError
{
  /// Path walked up to and including the offending node ("" for the root)
  std::string path_so_far;

  std::string reason;
};

/**
 * Read the node at `path`.
 *
 * Returns a pointer into `root`:
 * - nullptr when a component is missing (value absent)
 * - the null node itself when a null is met at any depth
 * - the addressed node otherwise
 *
 * Fails when a non-object node is met while components remain.
 */
[[nodiscard]] Result<const nlohmann::json *, StructuralError> read_at_path(
  const nlohmann::json & root, const KeyPath & path);

/// What write_at_path() does when the final component already exists.
enum class WriteMode {
  Overwrite,      ///< Replace the existing node
  FailIfPresent,  ///< Report a StructuralError and leave `root` untouched
};

/**
 * Store `value` at `path`, creating intermediate objects as needed.
 *
 * Fails without modifying `root` when an existing node on the prefix is
 * not an object, or when `mode` is FailIfPresent and a node already
 * exists at `path`.
 */
[[nodiscard]] Status<StructuralError> write_at_path(
  nlohmann::json & root, const KeyPath & path, nlohmann::json value,
  WriteMode mode = WriteMode::Overwrite);

}  // namespace json_model
