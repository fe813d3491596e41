#pragma once

#include <toolpipe/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolpipe {

// ---------------------------------------------------------------------------
// FieldType: the value types an input schema field can declare.
//
// "number" accepts any numeric value, "integer" only whole numbers.
// ---------------------------------------------------------------------------
enum class FieldType {
    String,
    Number,
    Integer,
    Boolean,
    Array,
    Object,
};

const char* FieldTypeName(FieldType type);
std::optional<FieldType> ParseFieldType(std::string_view name);

[[nodiscard]] bool ValueMatches(FieldType type, const nlohmann::json& value);

struct FieldSpec {
    std::string name;
    FieldType type = FieldType::String;
    bool required = true;
    std::string description;

    bool operator==(const FieldSpec& other) const {
        return name == other.name && type == other.type &&
               required == other.required && description == other.description;
    }
    bool operator!=(const FieldSpec& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// InputSchema: structural description of a tool's accepted arguments:
// field name -> {type, required}.
//
// On the wire it is a JSON Schema object:
//   {"type":"object","properties":{...},"required":[...]}
// Field order is not significant; equality compares fields by name.
// ---------------------------------------------------------------------------
class InputSchema {
public:
    InputSchema() = default;
    explicit InputSchema(std::vector<FieldSpec> fields);

    InputSchema& Required(std::string name, FieldType type,
                          std::string description = "");
    InputSchema& Optional(std::string name, FieldType type,
                          std::string description = "");

    [[nodiscard]] const std::vector<FieldSpec>& Fields() const noexcept {
        return fields_;
    }

    [[nodiscard]] const FieldSpec* Find(std::string_view name) const;

    [[nodiscard]] nlohmann::json ToJson() const;
    static Result<InputSchema, Error> FromJson(const nlohmann::json& schema);

    // Arguments must be an object; every required field present, every
    // present field declared and of the declared type. All problems are
    // reported in one ArgumentValidation error.
    [[nodiscard]] Result<void, Error> Validate(const nlohmann::json& arguments) const;

    bool operator==(const InputSchema& other) const;
    bool operator!=(const InputSchema& other) const { return !(*this == other); }

private:
    std::vector<FieldSpec> fields_;
};

// ---------------------------------------------------------------------------
// ToolDescriptor: what a server advertises for one tool.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    InputSchema input_schema;

    bool operator==(const ToolDescriptor& other) const {
        return name == other.name && description == other.description &&
               input_schema == other.input_schema;
    }
    bool operator!=(const ToolDescriptor& other) const { return !(*this == other); }
};

nlohmann::json ToolDescriptorToJson(const ToolDescriptor& descriptor);
Result<ToolDescriptor, Error> ToolDescriptorFromJson(const nlohmann::json& json);

} // namespace toolpipe
