// json_model/adapter/json_adapter.hpp - Document <-> model conversion engine
//
// Decodes JSON documents into models and encodes models back into
// documents, following the key paths and transformers declared by the
// model type.
//
#pragma once

#include <memory>
#include <nlohmann/json.hpp>

#include "json_model/adapter/resolved_mapping.hpp"
#include "json_model/basic/result.hpp"
#include "json_model/model/model.hpp"

namespace json_model
{

/**
 * Conversion engine for one model type.
 *
 * Holds only the type and its resolved mapping; both are immutable, so a
 * single adapter may be used from several threads at once.
 */
class JsonAdapter
{
public:
  /// `type` must outlive the adapter.
  explicit JsonAdapter(const ModelType & type);

  [[nodiscard]] const ModelType & model_type() const noexcept { return type_; }

  /**
   * Decode `document` as the adapter's type.
   *
   * Fails with InvalidDocument when the root (or a node on a property's key
   * path) is not an object, with TransformFailed when a transformer rejects
   * a value, and with the model's own error when construction fails.
   */
  [[nodiscard]] Result<std::unique_ptr<Model>> decode(const nlohmann::json & document) const;

  /**
   * Encode `model` into a new document.
   *
   * `model` should be of the adapter's type; properties unknown to the type
   * are skipped.
   */
  [[nodiscard]] Result<nlohmann::json> encode(const Model & model) const;

  // ==========================================================================
  // One-shot entry points
  // ==========================================================================

  /**
   * Decode `document`, letting `type` pick the concrete type first
   * (ModelType::type_for_document). Fails with NoTargetType when it picks
   * none.
   */
  [[nodiscard]] static Result<std::unique_ptr<Model>> model_of_type(
    const ModelType & type, const nlohmann::json & document);

  /// Encode `model` using its own type.
  [[nodiscard]] static Result<nlohmann::json> json_from_model(const Model & model);

private:
  const ModelType & type_;
  std::shared_ptr<const ResolvedMapping> mapping_;
};

}  // namespace json_model
