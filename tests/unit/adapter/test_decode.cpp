// test_decode.cpp - Unit tests for JsonAdapter::decode
//
#include <gtest/gtest.h>

#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "json_model/adapter/json_adapter.hpp"
#include "json_model/test_support/sample_models.hpp"

using nlohmann::json;

namespace json_model
{

using test_support::Person;
using test_support::Record;
using test_support::RecordType;

namespace
{

const Person & as_person(const std::unique_ptr<Model> & model)
{
  return dynamic_cast<const Person &>(*model);
}

const Record & as_record(const std::unique_ptr<Model> & model)
{
  return dynamic_cast<const Record &>(*model);
}

}  // namespace

// ============================================================================
// Successful decoding
// ============================================================================

TEST(DecodeTest, PersonFromNestedDocument)
{
  const json doc = json::parse(R"({"name": "Ada", "address": {"city": "London"}, "age": 36})");

  const auto r = JsonAdapter(test_support::person_type()).decode(doc);
  ASSERT_TRUE(r.success()) << r.error->describe();

  const Person & person = as_person(*r.value);
  EXPECT_EQ(person.name, "Ada");
  EXPECT_EQ(person.city, "London");
  ASSERT_TRUE(person.age.has_value());
  EXPECT_EQ(*person.age, 36);
  EXPECT_EQ(person.nickname, "none");
}

TEST(DecodeTest, MissingPropertiesKeepDefaults)
{
  const auto r = JsonAdapter(test_support::person_type()).decode(json::parse(R"({"name": "Ada"})"));
  ASSERT_TRUE(r.success()) << r.error->describe();

  const Person & person = as_person(*r.value);
  EXPECT_EQ(person.name, "Ada");
  EXPECT_EQ(person.city, "");
  EXPECT_FALSE(person.age.has_value());
}

TEST(DecodeTest, UnmappedPropertyIsNeverPopulated)
{
  RecordType type("Thing");
  type.property("id", "id").property("note");

  const auto r = JsonAdapter(type).decode(json::parse(R"({"id": 1, "note": "ignored"})"));
  ASSERT_TRUE(r.success()) << r.error->describe();
  EXPECT_TRUE(as_record(*r.value).has("id"));
  EXPECT_FALSE(as_record(*r.value).has("note"));
}

TEST(DecodeTest, PassThroughKeepsDocumentNode)
{
  RecordType type("Thing");
  type.property("tags", "meta.tags");

  const auto r = JsonAdapter(type).decode(json::parse(R"({"meta": {"tags": ["a", "b"]}})"));
  ASSERT_TRUE(r.success()) << r.error->describe();

  const auto & values = as_record(*r.value).values();
  const json * tags = value_as_json(values.at("tags"));
  ASSERT_NE(tags, nullptr);
  EXPECT_EQ(*tags, json::array({"a", "b"}));
}

TEST(DecodeTest, ExplicitNullIsPresentAndEmpty)
{
  RecordType type("Thing");
  type.property("city", "address.city");

  const auto r = JsonAdapter(type).decode(json::parse(R"({"address": {"city": null}})"));
  ASSERT_TRUE(r.success()) << r.error->describe();

  const auto & record = as_record(*r.value);
  ASSERT_TRUE(record.has("city"));
  EXPECT_TRUE(is_null_value(record.values().at("city")));
}

TEST(DecodeTest, NullIntermediateReachesTransformer)
{
  RecordType type("Thing");
  type.property("city", "address.city", test_support::make_null_sentinel_transformer("<none>"));

  const auto r = JsonAdapter(type).decode(json::parse(R"({"address": null})"));
  ASSERT_TRUE(r.success()) << r.error->describe();

  const auto * city = value_as<std::string>(as_record(*r.value).values().at("city"));
  ASSERT_NE(city, nullptr);
  EXPECT_EQ(*city, "<none>");
}

TEST(DecodeTest, AbsentValueSkipsTransformer)
{
  RecordType type("Thing");
  type.property("city", "address.city", test_support::make_null_sentinel_transformer("<none>"));

  const auto r = JsonAdapter(type).decode(json::object());
  ASSERT_TRUE(r.success()) << r.error->describe();
  EXPECT_FALSE(as_record(*r.value).has("city"));
}

// ============================================================================
// Document errors
// ============================================================================

TEST(DecodeTest, NonObjectRootIsInvalidDocument)
{
  for (const json & doc : {json::array({1}), json("text"), json(nullptr), json(5)}) {
    const auto r = JsonAdapter(test_support::person_type()).decode(doc);
    ASSERT_FALSE(r.success()) << doc.dump();
    EXPECT_EQ(r.error->kind, ErrorKind::InvalidDocument);
    EXPECT_EQ(r.error->domain, k_adapter_error_domain);
  }
}

TEST(DecodeTest, ScalarIntermediateIsInvalidDocument)
{
  const json doc = json::parse(R"({"name": "Ada", "address": "10 Downing St"})");

  const auto r = JsonAdapter(test_support::person_type()).decode(doc);
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, ErrorKind::InvalidDocument);
  ASSERT_TRUE(r.error->property_key.has_value());
  EXPECT_EQ(*r.error->property_key, "city");
  ASSERT_TRUE(r.error->key_path.has_value());
  EXPECT_EQ(*r.error->key_path, "address.city");
  EXPECT_NE(r.error->failure_reason.find("address.city"), std::string::npos);
}

// ============================================================================
// Transformer errors
// ============================================================================

TEST(DecodeTest, TransformFailureStopsBeforeConstruction)
{
  RecordType type("Thing");
  type.property("id", "id").property(
    "when", "when", test_support::make_failing_transformer("not a date"));

  const auto r = JsonAdapter(type).decode(json::parse(R"({"id": 1, "when": 42})"));
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, ErrorKind::TransformFailed);
  ASSERT_TRUE(r.error->property_key.has_value());
  EXPECT_EQ(*r.error->property_key, "when");
  ASSERT_NE(r.error->cause, nullptr);
  EXPECT_EQ(r.error->cause->message, "not a date");
  EXPECT_EQ(type.construct_calls.load(), 0);
}

TEST(DecodeTest, TypedTransformerMismatch)
{
  const auto r =
    JsonAdapter(test_support::person_type()).decode(json::parse(R"({"name": "Ada", "age": "old"})"));
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, ErrorKind::TransformFailed);
  ASSERT_NE(r.error->cause, nullptr);
  EXPECT_EQ(r.error->cause->domain, k_transformer_error_domain);
}

TEST(DecodeTest, ThrowingTransformerIsContained)
{
  RecordType type("Thing");
  type.property("id", "id", test_support::make_throwing_transformer("boom"));

  const auto r = JsonAdapter(type).decode(json::parse(R"({"id": 1})"));
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, ErrorKind::TransformFailed);
  ASSERT_NE(r.error->cause, nullptr);
  EXPECT_EQ(r.error->cause->kind, ErrorKind::ExceptionThrown);
  EXPECT_EQ(r.error->cause->failure_reason, "boom");
}

// ============================================================================
// Construction errors
// ============================================================================

TEST(DecodeTest, ConstructorErrorIsSurfacedVerbatim)
{
  RecordType type("Thing");
  type.property("id", "id").with_constructor([](ValueMapping) {
    return Result<std::unique_ptr<Model>>::fail(
      ErrorBuilder(ErrorKind::ConstructionFailed, "id out of range")
        .with_domain("app.validation")
        .with_property("id"));
  });

  const auto r = JsonAdapter(type).decode(json::parse(R"({"id": -1})"));
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->domain, "app.validation");
  EXPECT_EQ(r.error->message, "id out of range");
  EXPECT_EQ(r.error->cause, nullptr);
}

TEST(DecodeTest, ReturnedExceptionKindIsNotRewrapped)
{
  RecordType type("Thing");
  type.property("id", "id").with_constructor([](ValueMapping) {
    return Result<std::unique_ptr<Model>>::fail(
      ErrorBuilder(ErrorKind::ExceptionThrown, "legacy failure").with_domain("app.legacy"));
  });

  const auto r = JsonAdapter(type).decode(json::parse(R"({"id": 1})"));
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, ErrorKind::ExceptionThrown);
  EXPECT_EQ(r.error->domain, "app.legacy");
  EXPECT_EQ(r.error->message, "legacy failure");
  EXPECT_EQ(r.error->cause, nullptr);
}

TEST(DecodeTest, ThrowingConstructorIsConstructionFailed)
{
  RecordType type("Thing");
  type.property("id", "id").with_constructor(
    [](ValueMapping) -> Result<std::unique_ptr<Model>> { throw std::invalid_argument("bad id"); });

  const auto r = JsonAdapter(type).decode(json::parse(R"({"id": 1})"));
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, ErrorKind::ConstructionFailed);
  EXPECT_EQ(r.error->failure_reason, "bad id");
  ASSERT_NE(r.error->cause, nullptr);
  EXPECT_EQ(r.error->cause->kind, ErrorKind::ExceptionThrown);
}

TEST(DecodeTest, ConstructorReturningNothingFails)
{
  RecordType type("Thing");
  type.property("id", "id").with_constructor([](ValueMapping) {
    return Result<std::unique_ptr<Model>>::ok(nullptr);
  });

  const auto r = JsonAdapter(type).decode(json::parse(R"({"id": 1})"));
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, ErrorKind::ConstructionFailed);
}

}  // namespace json_model
