// json_model/adapter/resolved_mapping.hpp - Per-type resolved property table
#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "json_model/document/key_path.hpp"
#include "json_model/model/model.hpp"

namespace json_model
{

/**
 * A document-backed property with its split key path and transformer
 * (nullptr when the value passes through unchanged).
 */
struct PropertyMapping
{
  std::string property_key;
  KeyPath key_path;
  TransformerPtr transformer;
};

/**
 * Key paths and transformers of one model type, resolved once.
 *
 * Immutable after build(); shared between all conversions of the type.
 */
class ResolvedMapping
{
public:
  /// Resolve every property of `type`. Unmapped properties are left out.
  [[nodiscard]] static std::shared_ptr<const ResolvedMapping> build(const ModelType & type);

  /// Document-backed properties in the type's declaration order.
  [[nodiscard]] const std::vector<PropertyMapping> & properties() const noexcept
  {
    return properties_;
  }

  /// Mapping of `property_key`, or nullptr when it is unmapped or unknown.
  [[nodiscard]] const PropertyMapping * find(const std::string & property_key) const;

private:
  std::vector<PropertyMapping> properties_;
  std::unordered_map<std::string, size_t> index_;
};

}  // namespace json_model
