// json_model/adapter/resolved_mapping.cpp - Resolved property table
#include "json_model/adapter/resolved_mapping.hpp"

#include <utility>

#include "json_model/basic/logging.hpp"
#include "json_model/transform/transformer_resolver.hpp"
#include "json_model/transform/value_transformer.hpp"

namespace json_model
{

std::shared_ptr<const ResolvedMapping> ResolvedMapping::build(const ModelType & type)
{
  auto mapping = std::make_shared<ResolvedMapping>();
  const KeyPathTable table = type.key_paths_by_property_key();

  for (const auto & key : type.property_keys()) {
    auto path = resolve_key_path(table, key);
    if (!path) {
      continue;
    }
    mapping->index_.emplace(key, mapping->properties_.size());
    mapping->properties_.push_back(
      PropertyMapping{key, std::move(*path), resolve_transformer(type, key)});
  }

  get_logger()->debug(
    "Resolved mapping for '{}': {} document-backed properties", type.name(),
    mapping->properties_.size());
  return mapping;
}

const PropertyMapping * ResolvedMapping::find(const std::string & property_key) const
{
  const auto it = index_.find(property_key);
  if (it == index_.end()) {
    return nullptr;
  }
  return &properties_[it->second];
}

// ============================================================================
// ModelType
// ============================================================================

std::shared_ptr<const ResolvedMapping> ModelType::resolved_mapping() const
{
  std::call_once(mapping_once_, [this] { mapping_ = ResolvedMapping::build(*this); });
  return mapping_;
}

}  // namespace json_model
