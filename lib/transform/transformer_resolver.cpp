// json_model/transform/transformer_resolver.cpp - Transformer lookup
#include "json_model/transform/transformer_resolver.hpp"

#include "json_model/transform/value_transformer.hpp"

namespace json_model
{

TransformerPtr resolve_transformer(const ModelType & type, const std::string & property_key)
{
  if (auto specific = type.transformer_for_property(property_key)) {
    return specific;
  }
  return type.default_transformer(property_key);
}

}  // namespace json_model
