// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file schema.hpp
/// @brief Tool input schemas as data, and validation against them
///
/// A schema serializes to the JSON Schema subset advertised in `tools/list`
/// and validates incoming `arguments` before any handler runs.

#include <geminimcp/types.hpp>

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace geminimcp
{

// =============================================================================
// Schema Types
// =============================================================================

/// JSON value type accepted by a property
enum class ValueType
{
    String,
    Number,
    Integer,
    Boolean,
    Object,
    Array
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    ValueType,
    {
        {ValueType::String, "string"},
        {ValueType::Number, "number"},
        {ValueType::Integer, "integer"},
        {ValueType::Boolean, "boolean"},
        {ValueType::Object, "object"},
        {ValueType::Array, "array"},
    }
)

struct ObjectSchema;

/// Describes a single input property
struct PropertySchema
{
    std::string name;
    ValueType type = ValueType::String;
    std::string description;
    std::vector<json> enum_values;
    std::optional<json> default_value;
    std::optional<double> minimum;
    std::optional<double> maximum;
    /// Element schema when `type` is Array and elements are objects
    std::shared_ptr<const ObjectSchema> items;
};

/// Schema of an argument object
struct ObjectSchema
{
    std::vector<PropertySchema> properties;
    std::vector<std::string> required;
    /// Each group must have exactly one member present
    std::vector<std::vector<std::string>> exactly_one_of;

    const PropertySchema* find(const std::string& name) const;
};

void to_json(json& j, const PropertySchema& p);
void to_json(json& j, const ObjectSchema& s);

// =============================================================================
// Fluent Construction
// =============================================================================

/// Builds an ObjectSchema one property at a time
///
/// Example:
/// @code
/// auto schema = SchemaBuilder()
///     .property("prompt", ValueType::String, "Prompt text").required()
///     .property("temperature", ValueType::Number, "Sampling temperature")
///         .range(0, 2).default_value(0.7)
///     .build();
/// @endcode
class SchemaBuilder
{
  public:
    /// Add a property; later modifiers apply to it
    SchemaBuilder& property(std::string name, ValueType type, std::string description);

    /// Mark last property as required
    SchemaBuilder& required();

    /// Add enum constraint to last property
    SchemaBuilder& one_of(std::vector<json> values);

    /// Default applied to last property when absent
    SchemaBuilder& default_value(json value);

    /// Inclusive numeric bounds for last property
    SchemaBuilder& range(std::optional<double> minimum, std::optional<double> maximum);

    /// Element schema for an array property
    SchemaBuilder& items(ObjectSchema item_schema);

    /// Require exactly one of the named properties
    SchemaBuilder& exactly_one_of(std::vector<std::string> names);

    ObjectSchema build() const
    {
        return schema_;
    }

  private:
    PropertySchema& last();

    ObjectSchema schema_;
};

// =============================================================================
// Validation
// =============================================================================

/// Why a set of arguments was rejected
enum class ValidationErrorKind
{
    NotAnObject,
    MissingRequired,
    TypeMismatch,
    NotInEnum,
    OutOfRange,
    ExactlyOneOf
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    ValidationErrorKind,
    {
        {ValidationErrorKind::NotAnObject, "not_an_object"},
        {ValidationErrorKind::MissingRequired, "missing_required"},
        {ValidationErrorKind::TypeMismatch, "type_mismatch"},
        {ValidationErrorKind::NotInEnum, "not_in_enum"},
        {ValidationErrorKind::OutOfRange, "out_of_range"},
        {ValidationErrorKind::ExactlyOneOf, "exactly_one_of"},
    }
)

/// A typed validation failure
struct ValidationFailure
{
    ValidationErrorKind kind;
    /// Dotted path of the offending property (empty for the whole object)
    std::string field;
    std::string message;
};

inline void to_json(json& j, const ValidationFailure& f)
{
    j = json{{"reason", f.kind}, {"field", f.field}};
}

/// Outcome of validation: the arguments with defaults applied, or the failure
using ValidationOutcome = std::variant<json, ValidationFailure>;

/// Validate `arguments` (null is treated as an empty object)
ValidationOutcome validate(const ObjectSchema& schema, const json& arguments);

} // namespace geminimcp
