// json_model/transform/transformer_resolver.hpp - Transformer lookup
#pragma once

#include <string>

#include "json_model/model/model.hpp"

namespace json_model
{

/**
 * Transformer for `property_key` of `type`: the property-specific one if
 * declared, else the type-level default, else nullptr (pass through).
 * Never fails.
 */
[[nodiscard]] TransformerPtr resolve_transformer(
  const ModelType & type, const std::string & property_key);

}  // namespace json_model
