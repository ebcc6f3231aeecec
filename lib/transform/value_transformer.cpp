// json_model/transform/value_transformer.cpp - Transformer implementations
#include "json_model/transform/value_transformer.hpp"

#include <utility>

#include "json_model/adapter/json_adapter.hpp"

namespace json_model
{

Result<nlohmann::json> ValueTransformer::encode(const Value & /*value*/) const
{
  return Result<nlohmann::json>::fail(
    make_transform_error("transformer does not support reverse transformation"));
}

namespace
{

// ============================================================================
// Function-backed transformers
// ============================================================================

class FunctionTransformer final : public ValueTransformer
{
public:
  FunctionTransformer(DecodeFunction decode, EncodeFunction encode)
  : decode_(std::move(decode)), encode_(std::move(encode))
  {
  }

  [[nodiscard]] Result<Value> decode(const nlohmann::json & node) const override
  {
    return decode_(node);
  }

  [[nodiscard]] bool is_reversible() const noexcept override { return static_cast<bool>(encode_); }

  [[nodiscard]] Result<nlohmann::json> encode(const Value & value) const override
  {
    if (!encode_) {
      return ValueTransformer::encode(value);
    }
    return encode_(value);
  }

private:
  DecodeFunction decode_;
  EncodeFunction encode_;
};

// ============================================================================
// Nested model transformers
// ============================================================================

Result<ModelPtr> decode_nested(const ModelType & type, const nlohmann::json & node)
{
  auto decoded = JsonAdapter::model_of_type(type, node);
  if (!decoded.success()) {
    return Result<ModelPtr>::fail(std::move(*decoded.error));
  }
  return Result<ModelPtr>::ok(ModelPtr(std::move(*decoded.value)));
}

class ModelTransformer final : public ValueTransformer
{
public:
  explicit ModelTransformer(const ModelType & type) : type_(type) {}

  [[nodiscard]] Result<Value> decode(const nlohmann::json & node) const override
  {
    if (node.is_null()) {
      return Result<Value>::ok(Value{});
    }
    auto nested = decode_nested(type_, node);
    if (!nested.success()) {
      return Result<Value>::fail(std::move(*nested.error));
    }
    return Result<Value>::ok(Value(std::move(*nested.value)));
  }

  [[nodiscard]] bool is_reversible() const noexcept override { return true; }

  [[nodiscard]] Result<nlohmann::json> encode(const Value & value) const override
  {
    if (is_null_value(value)) {
      return Result<nlohmann::json>::ok(nullptr);
    }
    const ModelPtr * model = value_as<ModelPtr>(value);
    if (model == nullptr || !*model) {
      return Result<nlohmann::json>::fail(
        make_transform_error("expected a " + type_.name() + " model value"));
    }
    return JsonAdapter::json_from_model(**model);
  }

private:
  const ModelType & type_;
};

class ModelArrayTransformer final : public ValueTransformer
{
public:
  explicit ModelArrayTransformer(const ModelType & type) : type_(type) {}

  [[nodiscard]] Result<Value> decode(const nlohmann::json & node) const override
  {
    if (node.is_null()) {
      return Result<Value>::ok(Value{});
    }
    if (!node.is_array()) {
      return Result<Value>::fail(make_transform_error(
        "expected an array of " + type_.name() + " objects",
        std::string("found ") + node.type_name()));
    }

    ModelList models;
    models.reserve(node.size());
    for (const auto & element : node) {
      auto nested = decode_nested(type_, element);
      if (!nested.success()) {
        return Result<Value>::fail(std::move(*nested.error));
      }
      models.push_back(std::move(*nested.value));
    }
    return Result<Value>::ok(Value(std::move(models)));
  }

  [[nodiscard]] bool is_reversible() const noexcept override { return true; }

  [[nodiscard]] Result<nlohmann::json> encode(const Value & value) const override
  {
    if (is_null_value(value)) {
      return Result<nlohmann::json>::ok(nullptr);
    }
    const ModelList * models = value_as<ModelList>(value);
    if (models == nullptr) {
      return Result<nlohmann::json>::fail(
        make_transform_error("expected a list of " + type_.name() + " models"));
    }

    nlohmann::json out = nlohmann::json::array();
    for (const auto & model : *models) {
      if (!model) {
        out.push_back(nullptr);
        continue;
      }
      auto encoded = JsonAdapter::json_from_model(*model);
      if (!encoded.success()) {
        return encoded;
      }
      out.push_back(std::move(*encoded.value));
    }
    return Result<nlohmann::json>::ok(std::move(out));
  }

private:
  const ModelType & type_;
};

}  // namespace

TransformerPtr make_transformer(DecodeFunction decode)
{
  return std::make_shared<FunctionTransformer>(std::move(decode), EncodeFunction{});
}

TransformerPtr make_reversible_transformer(DecodeFunction decode, EncodeFunction encode)
{
  return std::make_shared<FunctionTransformer>(std::move(decode), std::move(encode));
}

TransformerPtr make_model_transformer(const ModelType & type)
{
  return std::make_shared<ModelTransformer>(type);
}

TransformerPtr make_model_array_transformer(const ModelType & type)
{
  return std::make_shared<ModelArrayTransformer>(type);
}

}  // namespace json_model
