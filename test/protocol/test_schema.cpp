#include <catch2/catch_test_macros.hpp>

#include <toolpipe/protocol/schema.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <string>

using namespace toolpipe;
using json = nlohmann::json;

namespace {

InputSchema EchoSchema() {
    return InputSchema().Required("text", FieldType::String, "Text to echo");
}

} // anonymous namespace

// ===========================================================================
// FieldType
// ===========================================================================

TEST_CASE("FieldType: names parse back to the same type", "[protocol][schema]") {
    for (auto type : {FieldType::String, FieldType::Number, FieldType::Integer,
                      FieldType::Boolean, FieldType::Array, FieldType::Object}) {
        auto parsed = ParseFieldType(FieldTypeName(type));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == type);
    }
    CHECK_FALSE(ParseFieldType("null").has_value());
}

TEST_CASE("ValueMatches: integer accepts whole floats only", "[protocol][schema]") {
    CHECK(ValueMatches(FieldType::Integer, json(3)));
    CHECK(ValueMatches(FieldType::Integer, json(3.0)));
    CHECK_FALSE(ValueMatches(FieldType::Integer, json(3.5)));
    CHECK_FALSE(ValueMatches(FieldType::Integer, json("3")));
}

TEST_CASE("ValueMatches: integer must fit in 64 signed bits", "[protocol][schema]") {
    CHECK(ValueMatches(FieldType::Integer, json(std::numeric_limits<std::int64_t>::max())));
    CHECK(ValueMatches(FieldType::Integer, json(std::numeric_limits<std::int64_t>::min())));
    CHECK(ValueMatches(FieldType::Integer, json(-9223372036854775808.0)));
    CHECK(ValueMatches(FieldType::Integer, json(1e18)));

    CHECK_FALSE(ValueMatches(FieldType::Integer, json(std::uint64_t{9223372036854775808ULL})));
    CHECK_FALSE(ValueMatches(FieldType::Integer, json(9223372036854775808.0)));
    CHECK_FALSE(ValueMatches(FieldType::Integer, json(1e300)));
    CHECK_FALSE(ValueMatches(FieldType::Integer, json(-1e300)));

    auto schema = InputSchema().Required("limit", FieldType::Integer);
    auto parsed = json::parse(R"({"limit": 1e300})");
    auto result = schema.Validate(parsed);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::ArgumentValidation);
}

TEST_CASE("ValueMatches: number accepts integers and floats", "[protocol][schema]") {
    CHECK(ValueMatches(FieldType::Number, json(1)));
    CHECK(ValueMatches(FieldType::Number, json(1.25)));
    CHECK_FALSE(ValueMatches(FieldType::Number, json(true)));
}

// ===========================================================================
// Validate
// ===========================================================================

TEST_CASE("InputSchema: valid arguments pass", "[protocol][schema]") {
    auto schema = InputSchema()
                      .Required("table_name", FieldType::String)
                      .Optional("limit", FieldType::Integer);

    CHECK(schema.Validate(json{{"table_name", "users"}}).IsOk());
    CHECK(schema.Validate(json{{"table_name", "users"}, {"limit", 5}}).IsOk());
}

TEST_CASE("InputSchema: missing required field is rejected", "[protocol][schema]") {
    auto result = EchoSchema().Validate(json::object());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::ArgumentValidation);
    CHECK(result.Error().message == "missing required field 'text'");
}

TEST_CASE("InputSchema: wrong type is rejected", "[protocol][schema]") {
    auto result = EchoSchema().Validate(json{{"text", 42}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "field 'text' must be string, got integer");
}

TEST_CASE("InputSchema: undeclared field is rejected", "[protocol][schema]") {
    auto result = EchoSchema().Validate(json{{"text", "hi"}, {"loud", true}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "unexpected field 'loud'");
}

TEST_CASE("InputSchema: all problems are reported together", "[protocol][schema]") {
    auto schema = InputSchema()
                      .Required("a", FieldType::String)
                      .Required("b", FieldType::Boolean);
    auto result = schema.Validate(json{{"b", "yes"}, {"c", 1}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message ==
          "missing required field 'a'; field 'b' must be boolean, got string; "
          "unexpected field 'c'");
}

TEST_CASE("InputSchema: non-object arguments are rejected", "[protocol][schema]") {
    auto result = EchoSchema().Validate(json::array({"hi"}));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "arguments must be an object, got array");
}

TEST_CASE("InputSchema: empty schema accepts only an empty object", "[protocol][schema]") {
    InputSchema empty;
    CHECK(empty.Validate(json::object()).IsOk());
    CHECK(empty.Validate(json{{"x", 1}}).IsErr());
}

// ===========================================================================
// Wire form
// ===========================================================================

TEST_CASE("InputSchema: ToJson emits a JSON Schema object", "[protocol][schema]") {
    auto schema = InputSchema()
                      .Required("table_name", FieldType::String, "Name of the table")
                      .Optional("columns", FieldType::String);

    auto j = schema.ToJson();
    CHECK(j["type"] == "object");
    CHECK(j["properties"]["table_name"]["type"] == "string");
    CHECK(j["properties"]["table_name"]["description"] == "Name of the table");
    CHECK_FALSE(j["properties"]["columns"].contains("description"));
    CHECK(j["required"] == json::array({"table_name"}));
}

TEST_CASE("InputSchema: FromJson restores the schema", "[protocol][schema]") {
    auto original = InputSchema()
                        .Required("data", FieldType::Object)
                        .Optional("dry_run", FieldType::Boolean, "Only validate");

    auto parsed = InputSchema::FromJson(original.ToJson());
    REQUIRE(parsed.IsOk());
    CHECK(parsed.Value() == original);
}

TEST_CASE("InputSchema: FromJson rejects malformed schemas", "[protocol][schema]") {
    CHECK(InputSchema::FromJson(json("object")).IsErr());
    CHECK(InputSchema::FromJson(json{{"type", "array"}}).IsErr());
    CHECK(InputSchema::FromJson(
              json{{"type", "object"}, {"properties", {{"x", {{"type", "date"}}}}}})
              .IsErr());
    CHECK(InputSchema::FromJson(
              json{{"type", "object"}, {"properties", json::object()},
                   {"required", {"ghost"}}})
              .IsErr());
}

TEST_CASE("InputSchema: equality ignores field order", "[protocol][schema]") {
    auto a = InputSchema().Required("x", FieldType::String).Optional("y", FieldType::Integer);
    auto b = InputSchema().Optional("y", FieldType::Integer).Required("x", FieldType::String);
    CHECK(a == b);

    auto c = InputSchema().Required("x", FieldType::String).Required("y", FieldType::Integer);
    CHECK(a != c);
}

TEST_CASE("ToolDescriptor: JSON uses the inputSchema key", "[protocol][schema]") {
    ToolDescriptor echo{"echo", "Echo text back", EchoSchema()};

    auto j = ToolDescriptorToJson(echo);
    CHECK(j["name"] == "echo");
    CHECK(j["description"] == "Echo text back");
    REQUIRE(j.contains("inputSchema"));

    auto back = ToolDescriptorFromJson(j);
    REQUIRE(back.IsOk());
    CHECK(back.Value() == echo);
}

TEST_CASE("ToolDescriptor: name is mandatory", "[protocol][schema]") {
    auto result = ToolDescriptorFromJson(json{{"description", "nameless"}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::ArgumentValidation);
}
