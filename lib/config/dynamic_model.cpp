// json_model/config/dynamic_model.cpp - Model types built from models.yaml
#include "json_model/config/dynamic_model.hpp"

#include <cstdint>
#include <utility>

#include "json_model/adapter/json_adapter.hpp"
#include "json_model/document/navigator.hpp"
#include "json_model/transform/value_transformer.hpp"

namespace json_model
{

namespace
{

bool starts_with(const std::string & s, const char * prefix) { return s.rfind(prefix, 0) == 0; }

}  // namespace

// ============================================================================
// DynamicModelType
// ============================================================================

DynamicModelType::DynamicModelType(ModelTypeConfig config, const ModelRegistry & registry)
: config_(std::move(config)), registry_(registry)
{
}

std::vector<std::string> DynamicModelType::property_keys() const
{
  std::vector<std::string> keys;
  keys.reserve(config_.properties.size());
  for (const auto & prop : config_.properties) {
    keys.push_back(prop.key);
  }
  return keys;
}

KeyPathTable DynamicModelType::key_paths_by_property_key() const
{
  KeyPathTable table;
  for (const auto & prop : config_.properties) {
    if (!prop.path.empty()) {
      table.emplace(prop.key, prop.path);
    }
  }
  return table;
}

TransformerPtr DynamicModelType::transformer_for_property(const std::string & property_key) const
{
  const auto it = transformers_.find(property_key);
  if (it == transformers_.end()) {
    return nullptr;
  }
  return it->second;
}

const ModelType * DynamicModelType::type_for_document(const nlohmann::json & document) const
{
  if (!config_.discriminator) {
    return this;
  }

  const auto & disc = *config_.discriminator;
  const auto fallback = [&]() -> const ModelType * {
    return disc.default_model ? registry_.find(*disc.default_model) : nullptr;
  };

  const auto path = KeyPath::parse(disc.path);
  if (!path) {
    return fallback();
  }
  const auto read = read_at_path(document, *path);
  if (!read.success() || *read.value == nullptr || !(*read.value)->is_string()) {
    return fallback();
  }

  const auto it = disc.cases.find((*read.value)->get<std::string>());
  if (it == disc.cases.end()) {
    return fallback();
  }
  return registry_.find(it->second);
}

Result<std::unique_ptr<Model>> DynamicModelType::construct(ValueMapping values) const
{
  using ModelResult = Result<std::unique_ptr<Model>>;

  for (const auto & prop : config_.properties) {
    if (!prop.required) {
      continue;
    }
    const auto it = values.find(prop.key);
    if (it == values.end() || is_null_value(it->second)) {
      Error err = make_construction_error(
        config_.name + " is missing required property '" + prop.key + "'");
      err.property_key = prop.key;
      return ModelResult::fail(std::move(err));
    }
  }

  return ModelResult::ok(std::make_unique<DynamicModel>(*this, std::move(values)));
}

bool DynamicModelType::bind_transformers(std::string & error)
{
  for (const auto & prop : config_.properties) {
    const std::string & name = prop.transformer;
    TransformerPtr transformer;

    if (name == k_transformer_string) {
      transformer = make_typed_transformer<std::string>();
    } else if (name == k_transformer_integer) {
      transformer = make_typed_transformer<std::int64_t>();
    } else if (name == k_transformer_number) {
      transformer = make_typed_transformer<double>();
    } else if (name == k_transformer_boolean) {
      transformer = make_typed_transformer<bool>();
    } else if (starts_with(name, k_transformer_model_prefix)) {
      const auto target = name.substr(std::string(k_transformer_model_prefix).size());
      const auto * type = registry_.find(target);
      if (type == nullptr) {
        error = "unknown model '" + target + "' referenced by " + config_.name + "." + prop.key;
        return false;
      }
      transformer = make_model_transformer(*type);
    } else if (starts_with(name, k_transformer_models_prefix)) {
      const auto target = name.substr(std::string(k_transformer_models_prefix).size());
      const auto * type = registry_.find(target);
      if (type == nullptr) {
        error = "unknown model '" + target + "' referenced by " + config_.name + "." + prop.key;
        return false;
      }
      transformer = make_model_array_transformer(*type);
    } else if (!name.empty() && name != k_transformer_json) {
      error = "unknown transformer '" + name + "' for " + config_.name + "." + prop.key;
      return false;
    }

    if (transformer) {
      transformers_.emplace(prop.key, std::move(transformer));
    }
  }
  return true;
}

// ============================================================================
// DynamicModel
// ============================================================================

DynamicModel::DynamicModel(const DynamicModelType & type, ValueMapping values)
: type_(type), values_(std::move(values))
{
}

nlohmann::json DynamicModel::to_display_json() const
{
  nlohmann::json out = nlohmann::json::object();
  for (const auto & [key, value] : values_) {
    out[key] = value_to_display_json(value);
  }
  return out;
}

nlohmann::json value_to_display_json(const Value & value)
{
  if (is_null_value(value)) {
    return nullptr;
  }
  if (const auto * node = value_as_json(value)) {
    return *node;
  }
  if (const auto * s = value_as<std::string>(value)) {
    return *s;
  }
  if (const auto * i = value_as<std::int64_t>(value)) {
    return *i;
  }
  if (const auto * d = value_as<double>(value)) {
    return *d;
  }
  if (const auto * b = value_as<bool>(value)) {
    return *b;
  }
  if (const auto * model = value_as<ModelPtr>(value)) {
    if (const auto * dynamic = dynamic_cast<const DynamicModel *>(model->get())) {
      return dynamic->to_display_json();
    }
    return nlohmann::json{{"model", (*model)->model_type().name()}};
  }
  if (const auto * models = value_as<ModelList>(value)) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto & model : *models) {
      out.push_back(value_to_display_json(Value(model)));
    }
    return out;
  }
  return std::string("<") + value.type().name() + ">";
}

// ============================================================================
// ModelRegistry
// ============================================================================

Result<std::unique_ptr<ModelRegistry>, std::string> ModelRegistry::from_config(
  const ModelConfig & config)
{
  using RegistryResult = Result<std::unique_ptr<ModelRegistry>, std::string>;

  auto registry = std::make_unique<ModelRegistry>();
  for (const auto & model : config.models) {
    if (registry->by_name_.count(model.name) != 0) {
      return RegistryResult::fail("duplicate model '" + model.name + "'");
    }
    auto type = std::make_unique<DynamicModelType>(model, *registry);
    registry->by_name_.emplace(model.name, type.get());
    registry->types_.push_back(std::move(type));
  }

  for (auto & type : registry->types_) {
    std::string error;
    if (!type->bind_transformers(error)) {
      return RegistryResult::fail(std::move(error));
    }
  }

  return RegistryResult::ok(std::move(registry));
}

const DynamicModelType * ModelRegistry::find(const std::string & name) const
{
  const auto it = by_name_.find(name);
  if (it == by_name_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<std::string> ModelRegistry::names() const
{
  std::vector<std::string> out;
  out.reserve(types_.size());
  for (const auto & type : types_) {
    out.push_back(type->name());
  }
  return out;
}

}  // namespace json_model
