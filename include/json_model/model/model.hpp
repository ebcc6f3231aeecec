// json_model/model/model.hpp - Model and model type interfaces
//
// The conversion engine knows models only through these two interfaces:
// a ModelType describes a kind of model (its properties, their key paths
// and transformers) and constructs instances; a Model decomposes itself
// back into a ValueMapping.
//
#pragma once

#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "json_model/basic/result.hpp"
#include "json_model/document/key_path.hpp"
#include "json_model/model/value.hpp"

namespace json_model
{

class Model;
class ResolvedMapping;
class ValueTransformer;

using TransformerPtr = std::shared_ptr<const ValueTransformer>;

// ============================================================================
// ModelType
// ============================================================================

class ModelType
{
public:
  ModelType() = default;
  virtual ~ModelType() = default;

  ModelType(const ModelType &) = delete;
  ModelType & operator=(const ModelType &) = delete;

  /// Name used in error messages and logs.
  [[nodiscard]] virtual std::string name() const = 0;

  /// Every property of the type, in declaration order. Keys are unique.
  [[nodiscard]] virtual std::vector<std::string> property_keys() const = 0;

  /// Property key -> dotted key path. Properties not listed are unmapped.
  [[nodiscard]] virtual KeyPathTable key_paths_by_property_key() const = 0;

  /// Transformer declared for one specific property, or nullptr.
  [[nodiscard]] virtual TransformerPtr transformer_for_property(
    const std::string & /*property_key*/) const
  {
    return nullptr;
  }

  /**
   * Type-level fallback consulted for properties without a specific
   * transformer, or nullptr.
   */
  [[nodiscard]] virtual TransformerPtr default_transformer(
    const std::string & /*property_key*/) const
  {
    return nullptr;
  }

  /**
   * Concrete type to decode `document` as.
   *
   * Returns nullptr when no type fits. Only consulted by
   * JsonAdapter::model_of_type().
   */
  [[nodiscard]] virtual const ModelType * type_for_document(
    const nlohmann::json & /*document*/) const
  {
    return this;
  }

  /**
   * Build a model from decoded values. Properties missing from `values`
   * keep their defaults.
   */
  [[nodiscard]] virtual Result<std::unique_ptr<Model>> construct(ValueMapping values) const = 0;

  /**
   * Key paths and transformers of every property, resolved on first use
   * and shared afterwards. Thread safe.
   */
  [[nodiscard]] std::shared_ptr<const ResolvedMapping> resolved_mapping() const;

private:
  mutable std::once_flag mapping_once_;
  mutable std::shared_ptr<const ResolvedMapping> mapping_;
};

// ============================================================================
// Model
// ============================================================================

class Model
{
public:
  virtual ~Model() = default;

  [[nodiscard]] virtual const ModelType & model_type() const = 0;

  /// Current property values. Must not fail.
  [[nodiscard]] virtual ValueMapping to_value_mapping() const = 0;
};

}  // namespace json_model
