// json_model/test_support/sample_models.hpp - model fixtures for unit/integration tests
//
// Person is a hand-written model type with typed fields. RecordType is a
// configurable model type whose instances simply keep their ValueMapping,
// so tests can declare arbitrary key paths, transformers and hooks.
//
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "json_model/model/model.hpp"
#include "json_model/transform/value_transformer.hpp"

namespace json_model::test_support
{

// ============================================================================
// Person
// ============================================================================

class PersonType;

struct Person final : public Model
{
  std::string name;
  std::string city;
  std::optional<int64_t> age;

  /// Not document-backed
  std::string nickname = "none";

  [[nodiscard]] const ModelType & model_type() const override;

  [[nodiscard]] ValueMapping to_value_mapping() const override
  {
    ValueMapping values;
    values["name"] = name;
    values["city"] = city;
    if (age) {
      values["age"] = *age;
    }
    values["nickname"] = nickname;
    return values;
  }

  bool operator==(const Person & other) const
  {
    return name == other.name && city == other.city && age == other.age &&
           nickname == other.nickname;
  }
};

class PersonType final : public ModelType
{
public:
  [[nodiscard]] std::string name() const override { return "Person"; }

  [[nodiscard]] std::vector<std::string> property_keys() const override
  {
    return {"name", "city", "age", "nickname"};
  }

  [[nodiscard]] KeyPathTable key_paths_by_property_key() const override
  {
    return {{"name", "name"}, {"city", "address.city"}, {"age", "age"}};
  }

  [[nodiscard]] TransformerPtr transformer_for_property(const std::string & key) const override
  {
    if (key == "name" || key == "city") {
      return string_transformer_;
    }
    if (key == "age") {
      return age_transformer_;
    }
    return nullptr;
  }

  [[nodiscard]] Result<std::unique_ptr<Model>> construct(ValueMapping values) const override
  {
    auto person = std::make_unique<Person>();
    if (const auto * v = find_value<std::string>(values, "name")) {
      person->name = *v;
    }
    if (const auto * v = find_value<std::string>(values, "city")) {
      person->city = *v;
    }
    if (const auto * v = find_value<int64_t>(values, "age")) {
      person->age = *v;
    }
    if (const auto * v = find_value<std::string>(values, "nickname")) {
      person->nickname = *v;
    }
    return Result<std::unique_ptr<Model>>::ok(std::move(person));
  }

private:
  TransformerPtr string_transformer_ = make_typed_transformer<std::string>();
  TransformerPtr age_transformer_ = make_typed_transformer<int64_t>();
};

[[nodiscard]] inline const PersonType & person_type()
{
  static const PersonType type;
  return type;
}

inline const ModelType & Person::model_type() const { return person_type(); }

// ============================================================================
// RecordType
// ============================================================================

class RecordType;

/// Model that keeps its decoded values verbatim.
class Record final : public Model
{
public:
  Record(const RecordType & type, ValueMapping values);

  [[nodiscard]] const ModelType & model_type() const override;
  [[nodiscard]] ValueMapping to_value_mapping() const override { return values_; }

  [[nodiscard]] const ValueMapping & values() const noexcept { return values_; }
  [[nodiscard]] bool has(const std::string & key) const { return values_.count(key) != 0; }

private:
  const RecordType & type_;
  ValueMapping values_;
};

/**
 * Model type configured through chained setters. Configure it completely
 * before the first conversion: the resolved mapping is cached.
 */
class RecordType final : public ModelType
{
public:
  using ConstructHook = std::function<Result<std::unique_ptr<Model>>(ValueMapping)>;
  using DefaultTransformerHook = std::function<TransformerPtr(const std::string &)>;
  using SelectHook = std::function<const ModelType *(const nlohmann::json &)>;

  explicit RecordType(std::string name) : name_(std::move(name)) {}

  /// Declare a property; an empty path leaves it unmapped.
  RecordType & property(std::string key, std::string path = "", TransformerPtr transformer = nullptr)
  {
    keys_.push_back(key);
    if (!path.empty()) {
      paths_.emplace(key, std::move(path));
    }
    if (transformer) {
      transformers_.emplace(std::move(key), std::move(transformer));
    }
    return *this;
  }

  RecordType & with_default_transformer(DefaultTransformerHook hook)
  {
    default_hook_ = std::move(hook);
    return *this;
  }

  RecordType & with_constructor(ConstructHook hook)
  {
    construct_hook_ = std::move(hook);
    return *this;
  }

  RecordType & with_selector(SelectHook hook)
  {
    select_hook_ = std::move(hook);
    return *this;
  }

  [[nodiscard]] std::string name() const override { return name_; }
  [[nodiscard]] std::vector<std::string> property_keys() const override { return keys_; }
  [[nodiscard]] KeyPathTable key_paths_by_property_key() const override { return paths_; }

  [[nodiscard]] TransformerPtr transformer_for_property(const std::string & key) const override
  {
    const auto it = transformers_.find(key);
    return it == transformers_.end() ? nullptr : it->second;
  }

  [[nodiscard]] TransformerPtr default_transformer(const std::string & key) const override
  {
    return default_hook_ ? default_hook_(key) : nullptr;
  }

  [[nodiscard]] const ModelType * type_for_document(const nlohmann::json & document) const override
  {
    return select_hook_ ? select_hook_(document) : this;
  }

  [[nodiscard]] Result<std::unique_ptr<Model>> construct(ValueMapping values) const override
  {
    ++construct_calls;
    if (construct_hook_) {
      return construct_hook_(std::move(values));
    }
    return Result<std::unique_ptr<Model>>::ok(std::make_unique<Record>(*this, std::move(values)));
  }

  /// Number of construct() invocations.
  mutable std::atomic<int> construct_calls{0};

private:
  std::string name_;
  std::vector<std::string> keys_;
  KeyPathTable paths_;
  std::unordered_map<std::string, TransformerPtr> transformers_;
  DefaultTransformerHook default_hook_;
  ConstructHook construct_hook_;
  SelectHook select_hook_;
};

inline Record::Record(const RecordType & type, ValueMapping values)
: type_(type), values_(std::move(values))
{
}

inline const ModelType & Record::model_type() const { return type_; }

// ============================================================================
// Transformer fixtures
// ============================================================================

/// Reversible transformer that rejects every input with `message`.
[[nodiscard]] inline TransformerPtr make_failing_transformer(const std::string & message)
{
  return make_reversible_transformer(
    [message](const nlohmann::json &) {
      return Result<Value>::fail(make_transform_error(message));
    },
    [message](const Value &) {
      return Result<nlohmann::json>::fail(make_transform_error(message));
    });
}

/// Reversible transformer that throws std::runtime_error(message).
[[nodiscard]] inline TransformerPtr make_throwing_transformer(const std::string & message)
{
  return make_reversible_transformer(
    [message](const nlohmann::json &) -> Result<Value> { throw std::runtime_error(message); },
    [message](const Value &) -> Result<nlohmann::json> { throw std::runtime_error(message); });
}

/// Forward-only transformer mapping null to `sentinel` and anything else to itself.
[[nodiscard]] inline TransformerPtr make_null_sentinel_transformer(std::string sentinel)
{
  return make_transformer([sentinel](const nlohmann::json & node) {
    if (node.is_null()) {
      return Result<Value>::ok(Value(sentinel));
    }
    return Result<Value>::ok(Value(node));
  });
}

}  // namespace json_model::test_support
