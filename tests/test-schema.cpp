//  Tests pjson_schema: JSON Schema conversion, shape matching and partial projection.

#include "content.h"
#include "error.h"
#include "schema.h"

#include "testing.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

using json = nlohmann::ordered_json;

static const char * PERSON_SCHEMA = R"({
    "type": "object",
    "description": "A person",
    "properties": {
        "name": {"type": "string"},
        "age": {"type": "integer"},
        "address": {"$ref": "#/$defs/address"},
        "nickname": {"type": ["string", "null"]}
    },
    "required": ["name", "age"],
    "$defs": {
        "address": {
            "type": "object",
            "properties": {"city": {"type": "string"}},
            "required": ["city"]
        }
    }
})";

static pjson_schema person_schema() {
    return pjson_schema_from_json(json::parse(PERSON_SCHEMA));
}

// Compares JSON documents regardless of key order.
static void assert_same_json(const std::string & expected, const std::string & actual) {
    if (nlohmann::json::parse(expected) != nlohmann::json::parse(actual)) {
        throw std::runtime_error("Test failed:\nExpected: " + expected + "\nActual: " + actual);
    }
}

static void test_from_json() {
    printf("[%s]\n", __func__);

    auto schema = person_schema();
    assert_equals<std::string>("object", pjson_schema_kind_name(schema.kind));
    assert_equals("A person", schema.description);
    assert_equals<size_t>(4, schema.properties.size());
    assert_equals("name", schema.properties[0].name);
    assert_equals("nickname", schema.properties[3].name);

    assert_true(schema.find_property("name")->required, "name is required");
    assert_true(!schema.find_property("address")->required, "address is optional");
    assert_true(schema.find_property("age")->schema.integer, "age is an integer");
    assert_equals("address", schema.find_property("address")->schema.ref);
    assert_equals<std::string>("union", pjson_schema_kind_name(schema.find_property("nickname")->schema.kind));
    assert_equals<size_t>(2, schema.find_property("nickname")->schema.variants.size());

    assert_true(schema.find_definition("address") != nullptr, "address definition");
    assert_true(schema.find_definition("missing") == nullptr, "missing definition");

    auto legacy = pjson_schema_from_json(json::parse(R"({
        "definitions": {"tag": {"type": "string"}},
        "type": "array",
        "items": {"$ref": "#/definitions/tag"}
    })"));
    assert_equals<std::string>("array", pjson_schema_kind_name(legacy.kind));
    assert_equals("tag", legacy.items[0].ref);

    auto untyped = pjson_schema_from_json(json::parse(R"({"properties": {"a": {}}})"));
    assert_equals<std::string>("object", pjson_schema_kind_name(untyped.kind));
    assert_equals<std::string>("any", pjson_schema_kind_name(untyped.properties[0].schema.kind));

    auto one_of = pjson_schema_from_json(json::parse(R"({"oneOf": [{"type": "number"}, {"type": "boolean"}]})"));
    assert_equals<size_t>(2, one_of.variants.size());

    assert_throws<pjson_error>([]() { pjson_schema_from_json(json::parse(R"({"$ref": "https://example.com/schema"})")); }, "remote $ref");
    assert_throws<pjson_error>([]() { pjson_schema_from_json(json::parse(R"({"type": "date"})")); }, "unknown type");
    assert_throws<pjson_error>([]() { pjson_schema_from_json(json::parse("42")); }, "not an object");
}

static void test_to_json() {
    printf("[%s]\n", __func__);

    assert_same_json(R"({
        "type": "object",
        "description": "A person",
        "properties": {
            "name": {"type": "string"},
            "age": {"type": "integer"},
            "address": {"$ref": "#/$defs/address"},
            "nickname": {"anyOf": [{"type": "string"}, {"type": "null"}]}
        },
        "required": ["name", "age"],
        "additionalProperties": false,
        "$defs": {
            "address": {
                "type": "object",
                "properties": {"city": {"type": "string"}},
                "required": ["city"],
                "additionalProperties": false
            }
        }
    })", pjson_schema_to_json_string(person_schema(), false));

    auto book = pjson_schema_object({
        {"title", pjson_schema_string(), true},
        {"pages", pjson_schema_integer(), true},
        {"tags", pjson_schema_array(pjson_schema_string()), false},
    }, "Represents a book");
    const auto j = pjson_schema_to_json(book);
    assert_equals(R"(["title","pages"])", j.at("required").dump());
    assert_equals(R"(["title","pages","tags"])", [&]() {
        json keys = json::array();
        for (const auto & item : j.at("properties").items()) {
            keys.push_back(item.key());
        }
        return keys.dump();
    }());

    const auto instruction = pjson_schema_instruction(book);
    assert_true(instruction.rfind("Respond with valid JSON matching this schema:\n{", 0) == 0, "instruction prefix");
    assert_true(instruction.find("\"description\": \"Represents a book\"") != std::string::npos, "pretty-printed schema");

    assert_equals("{}", pjson_schema_to_json_string(pjson_schema(), false));
}

static void test_matches() {
    printf("[%s]\n", __func__);

    auto schema = person_schema();
    auto matches = [&](const std::string & text) {
        return pjson_schema_matches(schema, pjson_content_parse(text));
    };

    assert_true(matches(R"({"name": "A", "age": 3, "address": {"city": "P"}})"), "full");
    assert_true(matches(R"({"name": "A", "age": 3})"), "optional fields missing");
    assert_true(matches(R"({"name": "A", "age": 3, "nickname": null})"), "nullable field");
    assert_true(matches(R"({"name": "A", "age": 3, "nickname": "B", "extra": [1]})"), "extra field");
    assert_true(!matches(R"({"name": "A", "age": 3.5})"), "fractional integer");
    assert_true(!matches(R"({"name": "A"})"), "missing required field");
    assert_true(!matches(R"({"name": "A", "age": 3, "address": {}})"), "nested required field");
    assert_true(!matches(R"({"name": "A", "age": 3, "nickname": 5})"), "wrong union member");
    assert_true(!matches(R"([{"name": "A", "age": 3}])"), "not an object");

    auto list = pjson_schema_array(pjson_schema_number());
    assert_true(pjson_schema_matches(list, pjson_content_parse("[1, 2.5]")), "numbers");
    assert_true(!pjson_schema_matches(list, pjson_content_parse(R"([1, "2"])")), "mixed");
    assert_true(pjson_schema_matches(pjson_schema(), pjson_content_parse(R"({"anything": [true]})")), "any");
}

static void test_project() {
    printf("[%s]\n", __func__);

    auto schema = person_schema();
    auto project = [&](const std::string & text) {
        return pjson_schema_project(schema, pjson_content_parse(text)).dump();
    };

    assert_equals(R"({"name":"Al","age":null,"address":null,"nickname":null})", project(R"({"name": "Al"})"));
    assert_equals(R"({"name":"Al","age":null,"address":{"city":"P"},"nickname":null})",
        project(R"({"extra": true, "address": {"zip": 1, "city": "P"}, "age": "x", "name": "Al"})"));
    assert_equals(R"({"name":null,"age":3,"address":null,"nickname":"Bob"})", project(R"({"age": 3, "nickname": "Bob"})"));
    assert_equals("null", project("[1]"));

    auto list = pjson_schema_array(pjson_schema_object({{"id", pjson_schema_integer(), true}}));
    assert_equals(R"([{"id":1},{"id":null}])", pjson_schema_project(list, pjson_content_parse(R"([{"id": 1, "x": 0}, {}])")).dump());

    assert_throws<pjson_error>([]() { pjson_schema_project(pjson_schema_ref("missing"), pjson_content()); }, "unknown reference");

    pjson_schema cyclic = pjson_schema_ref("a");
    cyclic.definitions.push_back({"a", pjson_schema_ref("b")});
    cyclic.definitions.push_back({"b", pjson_schema_ref("a")});
    assert_throws<pjson_error>([&]() { pjson_schema_project(cyclic, pjson_content()); }, "reference cycle");
}

static void test_is_complete() {
    printf("[%s]\n", __func__);

    auto schema = person_schema();
    auto is_complete = [&](const std::string & text) {
        return pjson_schema_is_complete(schema, pjson_schema_project(schema, pjson_content_parse(text)));
    };

    assert_true(!is_complete(R"({"name": "Al"})"), "age missing");
    assert_true(is_complete(R"({"name": "Al", "age": 3})"), "required fields present");
    assert_true(!is_complete(R"({"name": "Al", "age": 3, "address": {"zip": 1}})"), "nested field missing");
    assert_true(is_complete(R"({"name": "Al", "age": 3, "address": {"city": "P"}})"), "nested field present");
}

int main() {
    test_from_json();
    test_to_json();
    test_matches();
    test_project();
    test_is_complete();
    std::cout << "All tests passed.\n";
    return 0;
}
