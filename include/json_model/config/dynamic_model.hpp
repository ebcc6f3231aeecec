// json_model/config/dynamic_model.hpp - Model types built from models.yaml
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

#include "json_model/basic/result.hpp"
#include "json_model/config/model_config.hpp"
#include "json_model/model/model.hpp"

namespace json_model
{

class ModelRegistry;

// ============================================================================
// DynamicModelType
// ============================================================================

/**
 * ModelType described by a ModelTypeConfig.
 *
 * Instances are owned by a ModelRegistry, which also resolves the model
 * names referenced by transformers and discriminators.
 */
class DynamicModelType final : public ModelType
{
public:
  DynamicModelType(ModelTypeConfig config, const ModelRegistry & registry);

  [[nodiscard]] std::string name() const override { return config_.name; }
  [[nodiscard]] std::vector<std::string> property_keys() const override;
  [[nodiscard]] KeyPathTable key_paths_by_property_key() const override;
  [[nodiscard]] TransformerPtr transformer_for_property(
    const std::string & property_key) const override;
  [[nodiscard]] const ModelType * type_for_document(
    const nlohmann::json & document) const override;
  [[nodiscard]] Result<std::unique_ptr<Model>> construct(ValueMapping values) const override;

  [[nodiscard]] const ModelTypeConfig & config() const noexcept { return config_; }

private:
  friend class ModelRegistry;

  /// Create transformers once every type of the registry exists.
  [[nodiscard]] bool bind_transformers(std::string & error);

  ModelTypeConfig config_;
  const ModelRegistry & registry_;
  std::unordered_map<std::string, TransformerPtr> transformers_;
};

// ============================================================================
// DynamicModel
// ============================================================================

class DynamicModel final : public Model
{
public:
  DynamicModel(const DynamicModelType & type, ValueMapping values);

  [[nodiscard]] const ModelType & model_type() const override { return type_; }
  [[nodiscard]] ValueMapping to_value_mapping() const override { return values_; }

  [[nodiscard]] const ValueMapping & values() const noexcept { return values_; }

  /**
   * Decoded values rendered as JSON, keyed by property key (nested models
   * are rendered recursively). For diagnostics; not the encoded document.
   */
  [[nodiscard]] nlohmann::json to_display_json() const;

private:
  const DynamicModelType & type_;
  ValueMapping values_;
};

/// Render a decoded value for display.
[[nodiscard]] nlohmann::json value_to_display_json(const Value & value);

// ============================================================================
// ModelRegistry
// ============================================================================

/**
 * Owns the DynamicModelTypes built from one configuration.
 */
class ModelRegistry
{
public:
  ModelRegistry() = default;

  ModelRegistry(const ModelRegistry &) = delete;
  ModelRegistry & operator=(const ModelRegistry &) = delete;

  /**
   * Build every model type of `config`.
   *
   * @return the registry, or an error message when a referenced model is
   *         missing
   */
  [[nodiscard]] static Result<std::unique_ptr<ModelRegistry>, std::string> from_config(
    const ModelConfig & config);

  /// Type named `name`, or nullptr.
  [[nodiscard]] const DynamicModelType * find(const std::string & name) const;

  /// Names of all types, in configuration order.
  [[nodiscard]] std::vector<std::string> names() const;

private:
  std::vector<std::unique_ptr<DynamicModelType>> types_;
  std::unordered_map<std::string, const DynamicModelType *> by_name_;
};

}  // namespace json_model
