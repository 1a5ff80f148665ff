// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <geminimcp/schema.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace geminimcp
{

// =============================================================================
// Serialization
// =============================================================================

const PropertySchema* ObjectSchema::find(const std::string& name) const
{
    for (const auto& p : properties)
        if (p.name == name)
            return &p;
    return nullptr;
}

void to_json(json& j, const PropertySchema& p)
{
    j = json{{"type", p.type}, {"description", p.description}};
    if (!p.enum_values.empty())
        j["enum"] = p.enum_values;
    if (p.default_value)
        j["default"] = *p.default_value;
    if (p.minimum)
        j["minimum"] = *p.minimum;
    if (p.maximum)
        j["maximum"] = *p.maximum;
    if (p.items)
        j["items"] = *p.items;
}

void to_json(json& j, const ObjectSchema& s)
{
    json props = json::object();
    for (const auto& p : s.properties)
        props[p.name] = p;

    j = json{{"type", "object"}, {"properties", props}};
    if (!s.required.empty())
        j["required"] = s.required;
    if (!s.exactly_one_of.empty())
    {
        // "exactly one of" is oneOf over single-property required clauses
        json one_of = json::array();
        for (const auto& group : s.exactly_one_of)
            for (const auto& name : group)
                one_of.push_back({{"required", json::array({name})}});
        j["oneOf"] = one_of;
    }
}

// =============================================================================
// SchemaBuilder
// =============================================================================

SchemaBuilder& SchemaBuilder::property(std::string name, ValueType type, std::string description)
{
    PropertySchema p;
    p.name = std::move(name);
    p.type = type;
    p.description = std::move(description);
    schema_.properties.push_back(std::move(p));
    return *this;
}

SchemaBuilder& SchemaBuilder::required()
{
    schema_.required.push_back(last().name);
    return *this;
}

SchemaBuilder& SchemaBuilder::one_of(std::vector<json> values)
{
    last().enum_values = std::move(values);
    return *this;
}

SchemaBuilder& SchemaBuilder::default_value(json value)
{
    last().default_value = std::move(value);
    return *this;
}

SchemaBuilder& SchemaBuilder::range(std::optional<double> minimum, std::optional<double> maximum)
{
    last().minimum = minimum;
    last().maximum = maximum;
    return *this;
}

SchemaBuilder& SchemaBuilder::items(ObjectSchema item_schema)
{
    last().items = std::make_shared<const ObjectSchema>(std::move(item_schema));
    return *this;
}

SchemaBuilder& SchemaBuilder::exactly_one_of(std::vector<std::string> names)
{
    schema_.exactly_one_of.push_back(std::move(names));
    return *this;
}

PropertySchema& SchemaBuilder::last()
{
    if (schema_.properties.empty())
        throw std::logic_error("SchemaBuilder: no property to modify");
    return schema_.properties.back();
}

// =============================================================================
// Validation
// =============================================================================

namespace
{

std::string format_number(double value)
{
    std::ostringstream oss;
    if (std::floor(value) == value && std::fabs(value) < 1e15)
        oss << static_cast<long long>(value);
    else
        oss << value;
    return oss.str();
}

std::string join(const std::vector<std::string>& names)
{
    std::string out;
    for (const auto& n : names)
    {
        if (!out.empty())
            out += ", ";
        out += n;
    }
    return out;
}

bool is_present(const json& args, const std::string& name)
{
    auto it = args.find(name);
    return it != args.end() && !it->is_null();
}

ValidationOutcome fail(ValidationErrorKind kind, std::string field, std::string message)
{
    return ValidationOutcome{
        std::in_place_type<ValidationFailure>,
        ValidationFailure{kind, std::move(field), std::move(message)}
    };
}

/// Type check; integral floats are normalized for Integer properties
bool check_type(ValueType type, json& value)
{
    switch (type)
    {
    case ValueType::String:
        return value.is_string();
    case ValueType::Number:
        return value.is_number();
    case ValueType::Integer:
        if (value.is_number_integer())
            return true;
        if (value.is_number_float())
        {
            double d = value.get<double>();
            if (std::floor(d) != d || std::fabs(d) > 9.0e15)
                return false;
            value = static_cast<int64_t>(d);
            return true;
        }
        return false;
    case ValueType::Boolean:
        return value.is_boolean();
    case ValueType::Object:
        return value.is_object();
    case ValueType::Array:
        return value.is_array();
    }
    return false;
}

ValidationOutcome validate_object(const ObjectSchema& schema, const json& arguments, const std::string& path);

std::string qualify(const std::string& path, const std::string& name)
{
    return path.empty() ? name : path + "." + name;
}

/// Validates one present property in place
std::optional<ValidationFailure> validate_property(const PropertySchema& p, json& value, const std::string& field)
{
    if (!check_type(p.type, value))
    {
        json type_name = p.type;
        return ValidationFailure{
            ValidationErrorKind::TypeMismatch,
            field,
            "Argument '" + field + "' must be of type " + type_name.get<std::string>()
        };
    }

    // Handlers read integers as int64_t
    if (p.type == ValueType::Integer && value.is_number_unsigned() &&
        value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
    {
        return ValidationFailure{
            ValidationErrorKind::OutOfRange, field, "Argument '" + field + "' is outside the 64-bit integer range"
        };
    }

    if (!p.enum_values.empty())
    {
        bool allowed = false;
        for (const auto& candidate : p.enum_values)
            if (candidate == value)
                allowed = true;
        if (!allowed)
        {
            std::vector<std::string> names;
            for (const auto& candidate : p.enum_values)
                names.push_back(candidate.is_string() ? candidate.get<std::string>() : candidate.dump());
            return ValidationFailure{
                ValidationErrorKind::NotInEnum,
                field,
                "Argument '" + field + "' must be one of: " + join(names)
            };
        }
    }

    if (value.is_number() && (p.minimum || p.maximum))
    {
        double d = value.get<double>();
        if ((p.minimum && d < *p.minimum) || (p.maximum && d > *p.maximum))
        {
            std::string bounds;
            if (p.minimum && p.maximum)
                bounds = "between " + format_number(*p.minimum) + " and " + format_number(*p.maximum);
            else if (p.minimum)
                bounds = ">= " + format_number(*p.minimum);
            else
                bounds = "<= " + format_number(*p.maximum);
            return ValidationFailure{
                ValidationErrorKind::OutOfRange, field, "Argument '" + field + "' must be " + bounds
            };
        }
    }

    if (p.type == ValueType::Array && p.items)
    {
        for (size_t i = 0; i < value.size(); ++i)
        {
            auto element_path = field + "[" + std::to_string(i) + "]";
            auto outcome = validate_object(*p.items, value[i], element_path);
            if (auto* failure = std::get_if<ValidationFailure>(&outcome))
                return *failure;
            value[i] = std::get<json>(std::move(outcome));
        }
    }

    return std::nullopt;
}

ValidationOutcome validate_object(const ObjectSchema& schema, const json& arguments, const std::string& path)
{
    json args = arguments.is_null() ? json::object() : arguments;
    if (!args.is_object())
    {
        std::string what = path.empty() ? "Tool arguments" : "Argument '" + path + "'";
        return fail(ValidationErrorKind::NotAnObject, path, what + " must be an object");
    }

    for (const auto& name : schema.required)
    {
        if (!is_present(args, name))
        {
            auto field = qualify(path, name);
            return fail(ValidationErrorKind::MissingRequired, field, "Missing required argument: " + field);
        }
    }

    for (const auto& group : schema.exactly_one_of)
    {
        size_t count = 0;
        for (const auto& name : group)
            if (is_present(args, name))
                ++count;
        if (count != 1)
        {
            return fail(
                ValidationErrorKind::ExactlyOneOf,
                path,
                "Exactly one of " + join(group) + " must be provided"
            );
        }
    }

    for (const auto& p : schema.properties)
    {
        auto it = args.find(p.name);
        if (it == args.end() || it->is_null())
        {
            if (p.default_value)
                args[p.name] = *p.default_value;
            else if (it != args.end())
                args.erase(it);
            continue;
        }

        if (auto failure = validate_property(p, *it, qualify(path, p.name)))
            return ValidationOutcome{std::in_place_type<ValidationFailure>, std::move(*failure)};
    }

    return ValidationOutcome{std::in_place_type<json>, std::move(args)};
}

} // namespace

ValidationOutcome validate(const ObjectSchema& schema, const json& arguments)
{
    return validate_object(schema, arguments, "");
}

} // namespace geminimcp
