#include <toolpipe/protocol/schema.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>

namespace toolpipe {

namespace {

Error SchemaError(const std::string& message) {
    return Error::Make(ErrorCategory::ArgumentValidation, "InputSchema", message);
}

std::string DescribeJsonType(const nlohmann::json& value) {
    if (value.is_number_integer()) return "integer";
    if (value.is_number()) return "number";
    return value.type_name();
}

} // anonymous namespace

const char* FieldTypeName(FieldType type) {
    switch (type) {
        case FieldType::String:  return "string";
        case FieldType::Number:  return "number";
        case FieldType::Integer: return "integer";
        case FieldType::Boolean: return "boolean";
        case FieldType::Array:   return "array";
        case FieldType::Object:  return "object";
    }
    return "string";
}

std::optional<FieldType> ParseFieldType(std::string_view name) {
    if (name == "string") return FieldType::String;
    if (name == "number") return FieldType::Number;
    if (name == "integer") return FieldType::Integer;
    if (name == "boolean") return FieldType::Boolean;
    if (name == "array") return FieldType::Array;
    if (name == "object") return FieldType::Object;
    return std::nullopt;
}

bool ValueMatches(FieldType type, const nlohmann::json& value) {
    switch (type) {
        case FieldType::String:  return value.is_string();
        case FieldType::Number:  return value.is_number();
        case FieldType::Integer:
            // Handlers read integers as std::int64_t; anything outside that
            // range is rejected here.
            if (value.is_number_unsigned()) {
                return value.get<std::uint64_t>() <=
                       static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
            }
            if (value.is_number_integer()) return true;
            // 3.0 is an integer as far as JSON Schema is concerned.
            if (value.is_number_float()) {
                constexpr double kTwoPow63 = 9223372036854775808.0;
                const auto d = value.get<double>();
                return std::isfinite(d) && std::floor(d) == d &&
                       d >= -kTwoPow63 && d < kTwoPow63;
            }
            return false;
        case FieldType::Boolean: return value.is_boolean();
        case FieldType::Array:   return value.is_array();
        case FieldType::Object:  return value.is_object();
    }
    return false;
}

// ---------------------------------------------------------------------------
// InputSchema
// ---------------------------------------------------------------------------
InputSchema::InputSchema(std::vector<FieldSpec> fields)
    : fields_(std::move(fields)) {}

InputSchema& InputSchema::Required(std::string name, FieldType type,
                                   std::string description) {
    fields_.push_back({std::move(name), type, true, std::move(description)});
    return *this;
}

InputSchema& InputSchema::Optional(std::string name, FieldType type,
                                   std::string description) {
    fields_.push_back({std::move(name), type, false, std::move(description)});
    return *this;
}

const FieldSpec* InputSchema::Find(std::string_view name) const {
    for (const auto& field : fields_) {
        if (field.name == name) return &field;
    }
    return nullptr;
}

nlohmann::json InputSchema::ToJson() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();
    for (const auto& field : fields_) {
        nlohmann::json prop = {{"type", FieldTypeName(field.type)}};
        if (!field.description.empty()) {
            prop["description"] = field.description;
        }
        properties[field.name] = std::move(prop);
        if (field.required) {
            required.push_back(field.name);
        }
    }
    return {{"type", "object"},
            {"properties", std::move(properties)},
            {"required", std::move(required)}};
}

Result<InputSchema, Error> InputSchema::FromJson(const nlohmann::json& schema) {
    using R = Result<InputSchema, Error>;
    if (!schema.is_object()) {
        return R::Err(SchemaError("input schema must be an object"));
    }
    if (schema.contains("type") && schema["type"] != "object") {
        return R::Err(SchemaError("input schema type must be 'object'"));
    }

    std::vector<FieldSpec> fields;
    if (schema.contains("properties")) {
        const auto& properties = schema["properties"];
        if (!properties.is_object()) {
            return R::Err(SchemaError("'properties' must be an object"));
        }
        for (const auto& [name, prop] : properties.items()) {
            if (!prop.is_object() || !prop.contains("type") ||
                !prop["type"].is_string()) {
                return R::Err(SchemaError("property '" + name +
                                          "' has no type"));
            }
            auto type = ParseFieldType(prop["type"].get<std::string>());
            if (!type) {
                return R::Err(SchemaError("property '" + name +
                                          "' has unsupported type '" +
                                          prop["type"].get<std::string>() + "'"));
            }
            FieldSpec field;
            field.name = name;
            field.type = *type;
            field.required = false;
            if (prop.contains("description") && prop["description"].is_string()) {
                field.description = prop["description"].get<std::string>();
            }
            fields.push_back(std::move(field));
        }
    }

    if (schema.contains("required")) {
        const auto& required = schema["required"];
        if (!required.is_array()) {
            return R::Err(SchemaError("'required' must be an array"));
        }
        for (const auto& entry : required) {
            if (!entry.is_string()) {
                return R::Err(SchemaError("'required' entries must be strings"));
            }
            const auto name = entry.get<std::string>();
            auto it = std::find_if(fields.begin(), fields.end(),
                                   [&](const FieldSpec& f) { return f.name == name; });
            if (it == fields.end()) {
                return R::Err(SchemaError("required field '" + name +
                                          "' is not a declared property"));
            }
            it->required = true;
        }
    }

    return R::Ok(InputSchema(std::move(fields)));
}

Result<void, Error> InputSchema::Validate(const nlohmann::json& arguments) const {
    if (!arguments.is_object()) {
        return Result<void, Error>::Err(SchemaError(
            "arguments must be an object, got " + DescribeJsonType(arguments)));
    }

    std::vector<std::string> problems;
    for (const auto& field : fields_) {
        if (field.required && !arguments.contains(field.name)) {
            problems.push_back("missing required field '" + field.name + "'");
        }
    }
    for (const auto& [name, value] : arguments.items()) {
        const auto* field = Find(name);
        if (field == nullptr) {
            problems.push_back("unexpected field '" + name + "'");
        } else if (!ValueMatches(field->type, value)) {
            problems.push_back("field '" + name + "' must be " +
                               FieldTypeName(field->type) + ", got " +
                               DescribeJsonType(value));
        }
    }

    if (problems.empty()) {
        return Result<void, Error>::Ok();
    }
    std::ostringstream oss;
    for (std::size_t i = 0; i < problems.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << problems[i];
    }
    return Result<void, Error>::Err(SchemaError(oss.str()));
}

bool InputSchema::operator==(const InputSchema& other) const {
    if (fields_.size() != other.fields_.size()) return false;
    for (const auto& field : fields_) {
        const auto* theirs = other.Find(field.name);
        if (theirs == nullptr || *theirs != field) return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// ToolDescriptor
// ---------------------------------------------------------------------------
nlohmann::json ToolDescriptorToJson(const ToolDescriptor& descriptor) {
    return {{"name", descriptor.name},
            {"description", descriptor.description},
            {"inputSchema", descriptor.input_schema.ToJson()}};
}

Result<ToolDescriptor, Error> ToolDescriptorFromJson(const nlohmann::json& json) {
    using R = Result<ToolDescriptor, Error>;
    if (!json.is_object() || !json.contains("name") || !json["name"].is_string()) {
        return R::Err(SchemaError("tool descriptor needs a string 'name'"));
    }

    ToolDescriptor descriptor;
    descriptor.name = json["name"].get<std::string>();
    if (json.contains("description") && json["description"].is_string()) {
        descriptor.description = json["description"].get<std::string>();
    }
    if (json.contains("inputSchema")) {
        auto schema = InputSchema::FromJson(json["inputSchema"]);
        if (schema.IsErr()) {
            auto error = std::move(schema).Error();
            error.message = "tool '" + descriptor.name + "': " + error.message;
            return R::Err(std::move(error));
        }
        descriptor.input_schema = std::move(schema).Value();
    }
    return R::Ok(std::move(descriptor));
}

} // namespace toolpipe
