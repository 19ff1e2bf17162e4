#pragma once

#include "content.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

enum pjson_schema_kind {
    PJSON_SCHEMA_KIND_ANY,
    PJSON_SCHEMA_KIND_NULL,
    PJSON_SCHEMA_KIND_OBJECT,
    PJSON_SCHEMA_KIND_ARRAY,
    PJSON_SCHEMA_KIND_STRING,
    PJSON_SCHEMA_KIND_NUMBER,
    PJSON_SCHEMA_KIND_BOOLEAN,
    PJSON_SCHEMA_KIND_UNION,
    PJSON_SCHEMA_KIND_REFERENCE,
};

struct pjson_schema_property;
struct pjson_schema_definition;

// Structural shape of a value. Constraints such as ranges, patterns or enums are not modelled.
struct pjson_schema {
    pjson_schema_kind kind = PJSON_SCHEMA_KIND_ANY;
    std::string description;

    bool integer = false;                          // NUMBER
    std::vector<pjson_schema_property> properties; // OBJECT, in declaration order
    std::vector<pjson_schema> items;               // ARRAY, a single element schema
    std::vector<pjson_schema> variants;            // UNION
    std::string ref;                               // REFERENCE, a name in the root's definitions

    std::vector<pjson_schema_definition> definitions; // only set on a root schema

    const pjson_schema_property * find_property(const std::string & name) const;
    const pjson_schema * find_definition(const std::string & name) const;
};

struct pjson_schema_property {
    std::string  name;
    pjson_schema schema;
    bool         required = true;
};

struct pjson_schema_definition {
    std::string  name;
    pjson_schema schema;
};

pjson_schema pjson_schema_object(std::vector<pjson_schema_property> properties, const std::string & description = "");
pjson_schema pjson_schema_array(pjson_schema items);
pjson_schema pjson_schema_string();
pjson_schema pjson_schema_number();
pjson_schema pjson_schema_integer();
pjson_schema pjson_schema_boolean();
pjson_schema pjson_schema_null();
pjson_schema pjson_schema_union(std::vector<pjson_schema> variants);
pjson_schema pjson_schema_ref(const std::string & name);

// JSON Schema conversion. Reads type, properties, required, items, anyOf/oneOf,
// $ref into $defs/definitions and description; other keywords are ignored.
// Throws pjson_error on an unsupported $ref or malformed schema.
pjson_schema           pjson_schema_from_json(const nlohmann::ordered_json & j);
nlohmann::ordered_json pjson_schema_to_json(const pjson_schema & schema);
std::string            pjson_schema_to_json_string(const pjson_schema & schema, bool pretty = true);

// Prompt text asking a model to answer with JSON of this shape.
std::string pjson_schema_instruction(const pjson_schema & schema);

// Whether the content has the structural shape of the schema. Optional properties may be null.
bool pjson_schema_matches(const pjson_schema & schema, const pjson_content & content);

// Partial projection: an object schema yields every declared property in declaration order,
// null when absent or of the wrong shape. Array elements are projected one by one.
pjson_content pjson_schema_project(const pjson_schema & schema, const pjson_content & content);

// Whether a projected value is fully populated: all required properties non-null, recursively.
bool pjson_schema_is_complete(const pjson_schema & schema, const pjson_content & content);

const char * pjson_schema_kind_name(pjson_schema_kind kind);
