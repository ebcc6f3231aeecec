// json_model/config/model_config.hpp - Declarative model types (models.yaml)
//
// Parses and validates models.yaml files describing model types, their
// key paths and transformers. Used by the jmodel tool and by applications
// that do not hand-write ModelType classes.
//
#pragma once

#include <array>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace json_model
{

// ============================================================================
// Configuration Structures
// ============================================================================

/// Names accepted in a property's `transformer` field.
inline constexpr const char * k_transformer_json = "json";
inline constexpr const char * k_transformer_string = "string";
inline constexpr const char * k_transformer_integer = "integer";
inline constexpr const char * k_transformer_number = "number";
inline constexpr const char * k_transformer_boolean = "boolean";
inline constexpr const char * k_transformer_model_prefix = "model:";
inline constexpr const char * k_transformer_models_prefix = "models:";

/**
 * One property of a model type.
 */
struct PropertyConfig
{
  std::string key;

  /// Dotted key path; empty means the property is not document-backed
  std::string path;

  /// Transformer name; empty or "json" passes the node through
  std::string transformer;

  /// Construction fails when the property is missing or null
  bool required = false;
};

/**
 * Polymorphic selection: the string found at `path` picks the concrete
 * model type.
 */
struct DiscriminatorConfig
{
  std::string path;
  std::map<std::string, std::string> cases;

  /// Used when the value is missing or matches no case
  std::optional<std::string> default_model;
};

struct ModelTypeConfig
{
  std::string name;
  std::vector<PropertyConfig> properties;
  std::optional<DiscriminatorConfig> discriminator;
};

/**
 * Complete configuration (models.yaml).
 */
struct ModelConfig
{
  std::vector<ModelTypeConfig> models;

  [[nodiscard]] const ModelTypeConfig * find(const std::string & name) const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ModelConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ModelConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ModelConfigLoadResult ok(ModelConfig cfg)
  {
    ModelConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ModelConfigLoadResult fail(std::string msg)
  {
    ModelConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Parse model declarations from YAML text.
 *
 * @param yaml_text Contents of a models.yaml file
 * @return ModelConfigLoadResult with the configuration or an error message
 */
[[nodiscard]] ModelConfigLoadResult parse_model_config(const std::string & yaml_text);

/**
 * Load model declarations from a file.
 */
[[nodiscard]] ModelConfigLoadResult load_model_config(const std::filesystem::path & config_path);

/**
 * Default name of the model configuration file.
 */
inline constexpr const char * k_model_config_file_name = "models.yaml";

/// Names find_model_config() accepts, in order of preference.
inline constexpr std::array<const char *, 2> k_model_config_file_names = {
  k_model_config_file_name, "models.yml"};

/**
 * Find the model declarations governing `start_dir` (a directory or a
 * file inside one): the first regular file named in
 * k_model_config_file_names found in it or its nearest ancestor.
 *
 * @return Path to the file if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_model_config(
  const std::filesystem::path & start_dir);

}  // namespace json_model
