// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <geminimcp/schema.hpp>
#include <gtest/gtest.h>

#include <limits>

using namespace geminimcp;

namespace
{

ObjectSchema sample_schema()
{
    return SchemaBuilder()
        .property("prompt", ValueType::String, "Prompt")
        .required()
        .property("temperature", ValueType::Number, "Temperature")
        .range(0.0, 2.0)
        .default_value(0.7)
        .property("maxTokens", ValueType::Integer, "Max tokens")
        .range(1.0, std::nullopt)
        .property("mode", ValueType::String, "Mode")
        .one_of({"fast", "slow"})
        .default_value("fast")
        .property("stream", ValueType::Boolean, "Stream")
        .build();
}

const ValidationFailure& failure_of(const ValidationOutcome& outcome)
{
    return std::get<ValidationFailure>(outcome);
}

} // namespace

// =============================================================================
// Schema Builder / Serialization Tests
// =============================================================================

TEST(SchemaTest, SerializesToJsonSchema)
{
    json j = sample_schema();

    EXPECT_EQ(j["type"], "object");
    EXPECT_EQ(j["properties"]["prompt"]["type"], "string");
    EXPECT_EQ(j["properties"]["temperature"]["minimum"], 0.0);
    EXPECT_EQ(j["properties"]["temperature"]["maximum"], 2.0);
    EXPECT_EQ(j["properties"]["temperature"]["default"], 0.7);
    EXPECT_EQ(j["properties"]["mode"]["enum"], json::array({"fast", "slow"}));
    EXPECT_EQ(j["required"], json::array({"prompt"}));
}

TEST(SchemaTest, ExactlyOneOfBecomesOneOf)
{
    json j = SchemaBuilder()
                 .property("a", ValueType::String, "A")
                 .property("b", ValueType::String, "B")
                 .exactly_one_of({"a", "b"})
                 .build();

    ASSERT_TRUE(j.contains("oneOf"));
    ASSERT_EQ(j["oneOf"].size(), 2u);
    EXPECT_EQ(j["oneOf"][0]["required"], json::array({"a"}));
    EXPECT_EQ(j["oneOf"][1]["required"], json::array({"b"}));
}

TEST(SchemaTest, BuilderRequiresAProperty)
{
    EXPECT_THROW(SchemaBuilder().required(), std::logic_error);
}

// =============================================================================
// Validation Tests
// =============================================================================

TEST(SchemaValidationTest, AppliesDefaults)
{
    auto outcome = validate(sample_schema(), json{{"prompt", "hi"}});
    ASSERT_TRUE(std::holds_alternative<json>(outcome));

    const auto& args = std::get<json>(outcome);
    EXPECT_EQ(args["prompt"], "hi");
    EXPECT_EQ(args["temperature"], 0.7);
    EXPECT_EQ(args["mode"], "fast");
    EXPECT_FALSE(args.contains("maxTokens"));
}

TEST(SchemaValidationTest, NullArgumentsActAsEmpty)
{
    auto outcome = validate(sample_schema(), nullptr);
    const auto& failure = failure_of(outcome);
    EXPECT_EQ(failure.kind, ValidationErrorKind::MissingRequired);
    EXPECT_EQ(failure.field, "prompt");
    EXPECT_EQ(failure.message, "Missing required argument: prompt");
}

TEST(SchemaValidationTest, NullRequiredValueIsMissing)
{
    auto outcome = validate(sample_schema(), json{{"prompt", nullptr}});
    EXPECT_EQ(failure_of(outcome).kind, ValidationErrorKind::MissingRequired);
}

TEST(SchemaValidationTest, NullOptionalValueTakesDefault)
{
    auto outcome = validate(sample_schema(), json{{"prompt", "p"}, {"temperature", nullptr}, {"stream", nullptr}});
    const auto& args = std::get<json>(outcome);
    EXPECT_EQ(args["temperature"], 0.7);
    EXPECT_FALSE(args.contains("stream"));
}

TEST(SchemaValidationTest, RejectsNonObject)
{
    auto outcome = validate(sample_schema(), json::array());
    EXPECT_EQ(failure_of(outcome).kind, ValidationErrorKind::NotAnObject);
}

TEST(SchemaValidationTest, TypeMismatch)
{
    auto outcome = validate(sample_schema(), json{{"prompt", 42}});
    const auto& failure = failure_of(outcome);
    EXPECT_EQ(failure.kind, ValidationErrorKind::TypeMismatch);
    EXPECT_EQ(failure.message, "Argument 'prompt' must be of type string");
}

TEST(SchemaValidationTest, IntegerAcceptsIntegralFloat)
{
    auto outcome = validate(sample_schema(), json{{"prompt", "p"}, {"maxTokens", 100.0}});
    const auto& args = std::get<json>(outcome);
    EXPECT_TRUE(args["maxTokens"].is_number_integer());
    EXPECT_EQ(args["maxTokens"], 100);

    auto fractional = validate(sample_schema(), json{{"prompt", "p"}, {"maxTokens", 1.5}});
    EXPECT_EQ(failure_of(fractional).kind, ValidationErrorKind::TypeMismatch);
}

TEST(SchemaValidationTest, BooleanIsNotANumber)
{
    auto outcome = validate(sample_schema(), json{{"prompt", "p"}, {"temperature", true}});
    EXPECT_EQ(failure_of(outcome).kind, ValidationErrorKind::TypeMismatch);
}

TEST(SchemaValidationTest, EnumViolation)
{
    auto outcome = validate(sample_schema(), json{{"prompt", "p"}, {"mode", "medium"}});
    const auto& failure = failure_of(outcome);
    EXPECT_EQ(failure.kind, ValidationErrorKind::NotInEnum);
    EXPECT_EQ(failure.message, "Argument 'mode' must be one of: fast, slow");
}

TEST(SchemaValidationTest, RangeViolation)
{
    auto high = validate(sample_schema(), json{{"prompt", "p"}, {"temperature", 2.5}});
    EXPECT_EQ(failure_of(high).kind, ValidationErrorKind::OutOfRange);
    EXPECT_EQ(failure_of(high).message, "Argument 'temperature' must be between 0 and 2");

    auto low = validate(sample_schema(), json{{"prompt", "p"}, {"maxTokens", 0}});
    EXPECT_EQ(failure_of(low).message, "Argument 'maxTokens' must be >= 1");

    auto edge = validate(sample_schema(), json{{"prompt", "p"}, {"temperature", 2}});
    EXPECT_TRUE(std::holds_alternative<json>(edge));
}

TEST(SchemaValidationTest, IntegerBeyondSignedRange)
{
    auto huge = validate(sample_schema(), json::parse(R"({"prompt":"p","maxTokens":18446744073709551615})"));
    ASSERT_TRUE(std::holds_alternative<ValidationFailure>(huge));
    EXPECT_EQ(failure_of(huge).kind, ValidationErrorKind::OutOfRange);
    EXPECT_EQ(failure_of(huge).field, "maxTokens");

    auto largest = validate(sample_schema(), json::parse(R"({"prompt":"p","maxTokens":9223372036854775807})"));
    ASSERT_TRUE(std::holds_alternative<json>(largest));
    EXPECT_EQ(std::get<json>(largest)["maxTokens"].get<int64_t>(), std::numeric_limits<int64_t>::max());
}

TEST(SchemaValidationTest, ExactlyOneOf)
{
    auto schema = SchemaBuilder()
                      .property("imageRef", ValueType::String, "URL")
                      .property("imageData", ValueType::String, "Data")
                      .exactly_one_of({"imageRef", "imageData"})
                      .build();

    auto neither = validate(schema, json::object());
    EXPECT_EQ(failure_of(neither).kind, ValidationErrorKind::ExactlyOneOf);
    EXPECT_EQ(failure_of(neither).message, "Exactly one of imageRef, imageData must be provided");

    auto both = validate(schema, json{{"imageRef", "u"}, {"imageData", "d"}});
    EXPECT_EQ(failure_of(both).kind, ValidationErrorKind::ExactlyOneOf);

    EXPECT_TRUE(std::holds_alternative<json>(validate(schema, json{{"imageData", "d"}})));
}

TEST(SchemaValidationTest, ValidatesArrayItems)
{
    auto item = SchemaBuilder()
                    .property("category", ValueType::String, "Category")
                    .required()
                    .one_of({"A", "B"})
                    .build();
    auto schema = SchemaBuilder().property("list", ValueType::Array, "List").items(item).build();

    EXPECT_TRUE(std::holds_alternative<json>(validate(schema, json{{"list", {{{"category", "A"}}}}})));

    auto bad = validate(schema, json{{"list", {{{"category", "A"}}, {{"category", "C"}}}}});
    EXPECT_EQ(failure_of(bad).kind, ValidationErrorKind::NotInEnum);
    EXPECT_EQ(failure_of(bad).field, "list[1].category");

    auto missing = validate(schema, json{{"list", {json::object()}}});
    EXPECT_EQ(failure_of(missing).field, "list[0].category");
}

TEST(SchemaValidationTest, FailureSerializesReasonAndField)
{
    json j = ValidationFailure{ValidationErrorKind::MissingRequired, "prompt", "Missing required argument: prompt"};
    EXPECT_EQ(j["reason"], "missing_required");
    EXPECT_EQ(j["field"], "prompt");
}

TEST(SchemaValidationTest, UnknownPropertiesPassThrough)
{
    auto outcome = validate(sample_schema(), json{{"prompt", "p"}, {"extra", 1}});
    EXPECT_EQ(std::get<json>(outcome)["extra"], 1);
}
