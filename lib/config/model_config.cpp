// json_model/config/model_config.cpp - models.yaml loading
//
#include "json_model/config/model_config.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_set>

#include "json_model/document/key_path.hpp"

namespace json_model
{

const ModelTypeConfig * ModelConfig::find(const std::string & name) const
{
  for (const auto & m : models) {
    if (m.name == name) {
      return &m;
    }
  }
  return nullptr;
}

namespace
{

bool starts_with(const std::string & s, const char * prefix)
{
  return s.rfind(prefix, 0) == 0;
}

/// Model name referenced by a "model:" / "models:" transformer, if any
std::optional<std::string> referenced_model(const std::string & transformer)
{
  if (starts_with(transformer, k_transformer_model_prefix)) {
    return transformer.substr(std::string(k_transformer_model_prefix).size());
  }
  if (starts_with(transformer, k_transformer_models_prefix)) {
    return transformer.substr(std::string(k_transformer_models_prefix).size());
  }
  return std::nullopt;
}

bool is_known_transformer(const std::string & name)
{
  if (
    name.empty() || name == k_transformer_json || name == k_transformer_string ||
    name == k_transformer_integer || name == k_transformer_number ||
    name == k_transformer_boolean) {
    return true;
  }
  const auto ref = referenced_model(name);
  return ref && !ref->empty();
}

/// Parse a single property entry
std::optional<PropertyConfig> parse_property(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "property entry must be a map";
    return std::nullopt;
  }

  PropertyConfig prop;

  if (!node["key"]) {
    error = "property must have a 'key'";
    return std::nullopt;
  }
  prop.key = node["key"].as<std::string>();

  if (node["path"] && !node["path"].IsNull()) {
    prop.path = node["path"].as<std::string>();
  }

  if (node["transformer"]) {
    prop.transformer = node["transformer"].as<std::string>();
    if (!is_known_transformer(prop.transformer)) {
      error = "unknown transformer '" + prop.transformer + "' for property '" + prop.key + "'";
      return std::nullopt;
    }
  }

  if (node["required"]) {
    prop.required = node["required"].as<bool>();
  }

  return prop;
}

std::optional<DiscriminatorConfig> parse_discriminator(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "discriminator must be a map";
    return std::nullopt;
  }

  DiscriminatorConfig disc;

  if (node["path"]) {
    disc.path = node["path"].as<std::string>();
  }
  if (!KeyPath::parse(disc.path)) {
    error = "discriminator must have a non-empty 'path'";
    return std::nullopt;
  }

  if (node["cases"]) {
    if (!node["cases"].IsMap()) {
      error = "discriminator.cases must be a map";
      return std::nullopt;
    }
    for (const auto & entry : node["cases"]) {
      disc.cases.emplace(entry.first.as<std::string>(), entry.second.as<std::string>());
    }
  }

  if (node["default"]) {
    disc.default_model = node["default"].as<std::string>();
  }

  return disc;
}

std::optional<ModelTypeConfig> parse_model(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "model entry must be a map";
    return std::nullopt;
  }

  ModelTypeConfig model;

  if (!node["name"]) {
    error = "model must have a 'name'";
    return std::nullopt;
  }
  model.name = node["name"].as<std::string>();

  if (node["properties"]) {
    if (!node["properties"].IsSequence()) {
      error = "properties of model '" + model.name + "' must be a list";
      return std::nullopt;
    }

    std::unordered_set<std::string> seen;
    for (const auto & prop_node : node["properties"]) {
      std::string prop_error;
      auto prop = parse_property(prop_node, prop_error);
      if (!prop) {
        error = "invalid property in model '" + model.name + "': " + prop_error;
        return std::nullopt;
      }
      if (!seen.insert(prop->key).second) {
        error = "duplicate property '" + prop->key + "' in model '" + model.name + "'";
        return std::nullopt;
      }
      model.properties.push_back(std::move(*prop));
    }
  }

  if (node["discriminator"]) {
    std::string disc_error;
    auto disc = parse_discriminator(node["discriminator"], disc_error);
    if (!disc) {
      error = "invalid discriminator in model '" + model.name + "': " + disc_error;
      return std::nullopt;
    }
    model.discriminator = std::move(*disc);
  }

  return model;
}

/// Check that every model name referenced by the configuration exists
std::optional<std::string> check_references(const ModelConfig & config)
{
  const auto exists = [&config](const std::string & name) { return config.find(name) != nullptr; };

  for (const auto & model : config.models) {
    for (const auto & prop : model.properties) {
      const auto ref = referenced_model(prop.transformer);
      if (ref && !exists(*ref)) {
        return "property '" + prop.key + "' of model '" + model.name +
               "' references unknown model '" + *ref + "'";
      }
    }

    if (model.discriminator) {
      for (const auto & [value, target] : model.discriminator->cases) {
        if (!exists(target)) {
          return "discriminator case '" + value + "' of model '" + model.name +
                 "' references unknown model '" + target + "'";
        }
      }
      const auto & fallback = model.discriminator->default_model;
      if (fallback && !exists(*fallback)) {
        return "discriminator default of model '" + model.name + "' references unknown model '" +
               *fallback + "'";
      }
    }
  }
  return std::nullopt;
}

}  // namespace

ModelConfigLoadResult parse_model_config(const std::string & yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ModelConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  if (!root["models"]) {
    return ModelConfigLoadResult::fail("missing 'models' section");
  }
  if (!root["models"].IsSequence()) {
    return ModelConfigLoadResult::fail("models must be a list");
  }

  ModelConfig config;
  std::unordered_set<std::string> names;

  try {
    for (const auto & model_node : root["models"]) {
      std::string model_error;
      auto model = parse_model(model_node, model_error);
      if (!model) {
        return ModelConfigLoadResult::fail("invalid model: " + model_error);
      }
      if (!names.insert(model->name).second) {
        return ModelConfigLoadResult::fail("duplicate model '" + model->name + "'");
      }
      config.models.push_back(std::move(*model));
    }
  } catch (const YAML::Exception & e) {
    // Scalar conversions (e.g. a non-boolean 'required') throw.
    return ModelConfigLoadResult::fail("invalid value: " + std::string(e.what()));
  }

  if (auto ref_error = check_references(config)) {
    return ModelConfigLoadResult::fail(*ref_error);
  }

  return ModelConfigLoadResult::ok(std::move(config));
}

ModelConfigLoadResult load_model_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ModelConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  std::ifstream file(config_path);
  if (!file.is_open()) {
    return ModelConfigLoadResult::fail("failed to open file: " + config_path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse_model_config(buffer.str());
}

std::optional<std::filesystem::path> find_model_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path dir = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }
  if (fs::is_regular_file(dir, ec)) {
    dir = dir.parent_path();
  }

  // Nearest directory wins; within one directory the names are tried in order.
  for (;; dir = dir.parent_path()) {
    for (const char * name : k_model_config_file_names) {
      fs::path candidate = dir / name;
      if (fs::is_regular_file(candidate, ec)) {
        return candidate;
      }
    }
    if (dir == dir.parent_path()) {
      return std::nullopt;
    }
  }
}

}  // namespace json_model
