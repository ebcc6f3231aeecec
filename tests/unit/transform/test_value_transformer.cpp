// test_value_transformer.cpp - Unit tests for the predefined transformers
//
#include <gtest/gtest.h>

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "json_model/test_support/sample_models.hpp"
#include "json_model/transform/value_transformer.hpp"

using nlohmann::json;

namespace json_model
{

namespace
{

enum class Color { Red, Green, Unknown };

NLOHMANN_JSON_SERIALIZE_ENUM(
  Color, {{Color::Unknown, nullptr}, {Color::Red, "red"}, {Color::Green, "green"}})

}  // namespace

// ============================================================================
// Typed transformer
// ============================================================================

TEST(TypedTransformerTest, DecodesMatchingType)
{
  const auto t = make_typed_transformer<std::string>();
  const auto r = t->decode("Ada");
  ASSERT_TRUE(r.success());
  ASSERT_NE(value_as<std::string>(*r.value), nullptr);
  EXPECT_EQ(*value_as<std::string>(*r.value), "Ada");
}

TEST(TypedTransformerTest, NullDecodesToNoValue)
{
  const auto t = make_typed_transformer<int64_t>();
  const auto r = t->decode(nullptr);
  ASSERT_TRUE(r.success());
  EXPECT_TRUE(is_null_value(*r.value));
}

TEST(TypedTransformerTest, TypeMismatchIsReportedFailure)
{
  const auto t = make_typed_transformer<std::string>();
  const auto r = t->decode(42);
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, ErrorKind::TransformFailed);
  EXPECT_EQ(r.error->domain, k_transformer_error_domain);
  EXPECT_NE(r.error->message.find("number"), std::string::npos);
}

TEST(TypedTransformerTest, EncodesBack)
{
  const auto t = make_typed_transformer<int64_t>();
  ASSERT_TRUE(t->is_reversible());

  const auto r = t->encode(Value(int64_t{36}));
  ASSERT_TRUE(r.success());
  EXPECT_EQ(*r.value, 36);

  const auto null_r = t->encode(Value{});
  ASSERT_TRUE(null_r.success());
  EXPECT_TRUE(null_r.value->is_null());
}

TEST(TypedTransformerTest, EncodeRejectsOtherPayload)
{
  const auto t = make_typed_transformer<int64_t>();
  const auto r = t->encode(Value(std::string("36")));
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, ErrorKind::TransformFailed);
}

TEST(TypedTransformerTest, FractionalNumberIsNotAnInteger)
{
  const auto t = make_typed_transformer<int64_t>();
  const auto r = t->decode(json::parse("3.7"));
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, ErrorKind::TransformFailed);
  EXPECT_EQ(r.error->failure_reason, "expected an integer");
}

TEST(TypedTransformerTest, IntegerOutOfRange)
{
  const auto wide = make_typed_transformer<int64_t>();
  const auto too_big = wide->decode(json::parse("18446744073709551615"));
  ASSERT_FALSE(too_big.success());
  EXPECT_EQ(too_big.error->failure_reason, "integer out of range");

  const auto narrow = make_typed_transformer<uint8_t>();
  EXPECT_FALSE(narrow->decode(json(256)).success());
  EXPECT_FALSE(narrow->decode(json(-1)).success());
  const auto fits = narrow->decode(json(255));
  ASSERT_TRUE(fits.success());
  EXPECT_EQ(*value_as<uint8_t>(*fits.value), 255);

  const auto unsigned_max = make_typed_transformer<uint64_t>();
  const auto r = unsigned_max->decode(json::parse("18446744073709551615"));
  ASSERT_TRUE(r.success());
  EXPECT_EQ(*value_as<uint64_t>(*r.value), UINT64_MAX);
}

TEST(TypedTransformerTest, NoCrossTypeCoercion)
{
  EXPECT_FALSE(make_typed_transformer<bool>()->decode(1).success());
  EXPECT_FALSE(make_typed_transformer<double>()->decode("2.5").success());
  EXPECT_FALSE(make_typed_transformer<std::string>()->decode(true).success());

  const auto r = make_typed_transformer<double>()->decode(2);
  ASSERT_TRUE(r.success());
  EXPECT_DOUBLE_EQ(*value_as<double>(*r.value), 2.0);
}

TEST(TypedTransformerTest, SerializedEnum)
{
  const auto t = make_typed_transformer<Color>();

  const auto r = t->decode("green");
  ASSERT_TRUE(r.success());
  ASSERT_NE(value_as<Color>(*r.value), nullptr);
  EXPECT_EQ(*value_as<Color>(*r.value), Color::Green);

  const auto back = t->encode(Value(Color::Red));
  ASSERT_TRUE(back.success());
  EXPECT_EQ(*back.value, "red");
}

// ============================================================================
// Function-backed transformers
// ============================================================================

TEST(FunctionTransformerTest, ForwardOnlyIsNotReversible)
{
  const auto t = make_transformer(
    [](const json & node) { return Result<Value>::ok(Value(node.dump())); });

  EXPECT_FALSE(t->is_reversible());
  const auto r = t->decode(json{{"a", 1}});
  ASSERT_TRUE(r.success());
  EXPECT_EQ(*value_as<std::string>(*r.value), R"({"a":1})");

  const auto back = t->encode(Value(std::string("x")));
  EXPECT_FALSE(back.success());
}

TEST(FunctionTransformerTest, ReversibleRunsBothDirections)
{
  const auto t = make_reversible_transformer(
    [](const json & node) { return Result<Value>::ok(Value(node.get<int64_t>() * 100)); },
    [](const Value & v) {
      return Result<json>::ok(json(*std::any_cast<int64_t>(&v) / 100));
    });

  ASSERT_TRUE(t->is_reversible());
  const auto r = t->decode(3);
  ASSERT_TRUE(r.success());
  EXPECT_EQ(*value_as<int64_t>(*r.value), 300);

  const auto back = t->encode(*r.value);
  ASSERT_TRUE(back.success());
  EXPECT_EQ(*back.value, 3);
}

TEST(FunctionTransformerTest, SeesNullAsIs)
{
  const auto t = test_support::make_null_sentinel_transformer("<none>");
  const auto r = t->decode(nullptr);
  ASSERT_TRUE(r.success());
  EXPECT_EQ(*value_as<std::string>(*r.value), "<none>");
}

// ============================================================================
// Nested model transformers
// ============================================================================

TEST(ModelTransformerTest, DecodesNestedObject)
{
  const auto t = make_model_transformer(test_support::person_type());
  const auto r = t->decode(json::parse(R"({"name": "Ada", "address": {"city": "London"}})"));
  ASSERT_TRUE(r.success()) << r.error->describe();

  const auto * model = value_as<ModelPtr>(*r.value);
  ASSERT_NE(model, nullptr);
  const auto * person = dynamic_cast<const test_support::Person *>(model->get());
  ASSERT_NE(person, nullptr);
  EXPECT_EQ(person->name, "Ada");
  EXPECT_EQ(person->city, "London");

  const auto back = t->encode(*r.value);
  ASSERT_TRUE(back.success());
  EXPECT_EQ(*back.value, json::parse(R"({"name": "Ada", "address": {"city": "London"}})"));
}

TEST(ModelTransformerTest, NonObjectFails)
{
  const auto t = make_model_transformer(test_support::person_type());
  const auto r = t->decode("Ada");
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, ErrorKind::InvalidDocument);
}

TEST(ModelArrayTransformerTest, DecodesEachElement)
{
  const auto t = make_model_array_transformer(test_support::person_type());
  const json input = json::parse(R"([{"name": "Ada"}, {"name": "Grace", "age": 85}])");

  const auto r = t->decode(input);
  ASSERT_TRUE(r.success()) << r.error->describe();
  const auto * models = value_as<ModelList>(*r.value);
  ASSERT_NE(models, nullptr);
  ASSERT_EQ(models->size(), 2u);

  const auto back = t->encode(*r.value);
  ASSERT_TRUE(back.success());
  ASSERT_EQ(back.value->size(), 2u);
  EXPECT_EQ((*back.value)[1]["name"], "Grace");
  EXPECT_EQ((*back.value)[1]["age"], 85);
}

TEST(ModelArrayTransformerTest, ElementFailureFailsWhole)
{
  const auto t = make_model_array_transformer(test_support::person_type());
  const auto r = t->decode(json::parse(R"([{"name": "Ada"}, {"name": 7}])"));
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, ErrorKind::TransformFailed);
  ASSERT_TRUE(r.error->property_key.has_value());
  EXPECT_EQ(*r.error->property_key, "name");
}

TEST(ModelArrayTransformerTest, NonArrayFails)
{
  const auto t = make_model_array_transformer(test_support::person_type());
  const auto r = t->decode(json::object());
  ASSERT_FALSE(r.success());
  EXPECT_NE(r.error->failure_reason.find("object"), std::string::npos);
}

}  // namespace json_model
