#include "schema.h"

#include "common.h"

#include <cmath>
#include <unordered_set>

using json = nlohmann::ordered_json;

// Reference chains longer than this are treated as cycles.
static const int MAX_REF_HOPS = 32;

const pjson_schema_property * pjson_schema::find_property(const std::string & name) const {
    for (const auto & prop : properties) {
        if (prop.name == name) {
            return &prop;
        }
    }
    return nullptr;
}

const pjson_schema * pjson_schema::find_definition(const std::string & name) const {
    for (const auto & def : definitions) {
        if (def.name == name) {
            return &def.schema;
        }
    }
    return nullptr;
}

static pjson_schema schema_of_kind(pjson_schema_kind kind) {
    pjson_schema res;
    res.kind = kind;
    return res;
}

pjson_schema pjson_schema_object(std::vector<pjson_schema_property> properties, const std::string & description) {
    auto res = schema_of_kind(PJSON_SCHEMA_KIND_OBJECT);
    res.properties  = std::move(properties);
    res.description = description;
    return res;
}

pjson_schema pjson_schema_array(pjson_schema items) {
    auto res = schema_of_kind(PJSON_SCHEMA_KIND_ARRAY);
    res.items.push_back(std::move(items));
    return res;
}

pjson_schema pjson_schema_string()  { return schema_of_kind(PJSON_SCHEMA_KIND_STRING); }
pjson_schema pjson_schema_number()  { return schema_of_kind(PJSON_SCHEMA_KIND_NUMBER); }
pjson_schema pjson_schema_boolean() { return schema_of_kind(PJSON_SCHEMA_KIND_BOOLEAN); }
pjson_schema pjson_schema_null()    { return schema_of_kind(PJSON_SCHEMA_KIND_NULL); }

pjson_schema pjson_schema_integer() {
    auto res = schema_of_kind(PJSON_SCHEMA_KIND_NUMBER);
    res.integer = true;
    return res;
}

pjson_schema pjson_schema_union(std::vector<pjson_schema> variants) {
    auto res = schema_of_kind(PJSON_SCHEMA_KIND_UNION);
    res.variants = std::move(variants);
    return res;
}

pjson_schema pjson_schema_ref(const std::string & name) {
    auto res = schema_of_kind(PJSON_SCHEMA_KIND_REFERENCE);
    res.ref = name;
    return res;
}

//
// JSON Schema conversion
//

static const std::vector<std::string> REF_PREFIXES = {
    "#/$defs/",
    "#/definitions/",
};

static pjson_schema_kind kind_from_type_name(const std::string & type, bool & integer) {
    integer = false;
    if (type == "object")  return PJSON_SCHEMA_KIND_OBJECT;
    if (type == "array")   return PJSON_SCHEMA_KIND_ARRAY;
    if (type == "string")  return PJSON_SCHEMA_KIND_STRING;
    if (type == "number")  return PJSON_SCHEMA_KIND_NUMBER;
    if (type == "boolean") return PJSON_SCHEMA_KIND_BOOLEAN;
    if (type == "null")    return PJSON_SCHEMA_KIND_NULL;
    if (type == "integer") {
        integer = true;
        return PJSON_SCHEMA_KIND_NUMBER;
    }
    throw pjson_error("Unsupported schema type: " + type);
}

static pjson_schema schema_from_json(const json & j, std::vector<pjson_schema_definition> & definitions) {
    if (j.is_boolean()) {
        return pjson_schema();
    }
    if (!j.is_object()) {
        throw pjson_error("Schema must be an object, got: " + j.dump());
    }

    for (const char * defs_key : {"$defs", "definitions"}) {
        if (!j.contains(defs_key)) {
            continue;
        }
        for (const auto & def : j.at(defs_key).items()) {
            pjson_schema_definition definition;
            definition.name   = def.key();
            definition.schema = schema_from_json(def.value(), definitions);
            definitions.push_back(std::move(definition));
        }
    }

    pjson_schema res;
    if (j.contains("description") && j.at("description").is_string()) {
        res.description = j.at("description").get<std::string>();
    }

    if (j.contains("$ref")) {
        const auto ref = j.at("$ref").get<std::string>();
        for (const auto & prefix : REF_PREFIXES) {
            if (string_starts_with(ref, prefix)) {
                res.kind = PJSON_SCHEMA_KIND_REFERENCE;
                res.ref  = ref.substr(prefix.size());
                return res;
            }
        }
        throw pjson_error("Unsupported $ref: " + ref);
    }

    for (const char * union_key : {"anyOf", "oneOf"}) {
        if (j.contains(union_key)) {
            res.kind = PJSON_SCHEMA_KIND_UNION;
            for (const auto & variant : j.at(union_key)) {
                res.variants.push_back(schema_from_json(variant, definitions));
            }
            return res;
        }
    }

    if (j.contains("type") && j.at("type").is_array()) {
        // {"type": ["string", "null"]} is a union of the listed types sharing the other keywords
        json single = j;
        single.erase("$defs");
        single.erase("definitions");
        single.erase("description");
        res.kind = PJSON_SCHEMA_KIND_UNION;
        for (const auto & type : j.at("type")) {
            single["type"] = type;
            res.variants.push_back(schema_from_json(single, definitions));
        }
        if (res.variants.size() == 1) {
            auto only = std::move(res.variants[0]);
            only.description = res.description;
            return only;
        }
        return res;
    }

    if (j.contains("type")) {
        res.kind = kind_from_type_name(j.at("type").get<std::string>(), res.integer);
    } else if (j.contains("properties")) {
        res.kind = PJSON_SCHEMA_KIND_OBJECT;
    } else if (j.contains("items")) {
        res.kind = PJSON_SCHEMA_KIND_ARRAY;
    } else {
        res.kind = PJSON_SCHEMA_KIND_ANY;
    }

    if (res.kind == PJSON_SCHEMA_KIND_OBJECT) {
        std::unordered_set<std::string> required;
        if (j.contains("required")) {
            for (const auto & name : j.at("required")) {
                required.insert(name.get<std::string>());
            }
        }
        if (j.contains("properties")) {
            for (const auto & prop : j.at("properties").items()) {
                pjson_schema_property property;
                property.name     = prop.key();
                property.schema   = schema_from_json(prop.value(), definitions);
                property.required = required.find(prop.key()) != required.end();
                res.properties.push_back(std::move(property));
            }
        }
    } else if (res.kind == PJSON_SCHEMA_KIND_ARRAY) {
        if (j.contains("items") && j.at("items").is_object()) {
            res.items.push_back(schema_from_json(j.at("items"), definitions));
        } else {
            res.items.push_back(pjson_schema());
        }
    }

    return res;
}

pjson_schema pjson_schema_from_json(const json & j) {
    std::vector<pjson_schema_definition> definitions;
    try {
        auto res = schema_from_json(j, definitions);
        res.definitions = std::move(definitions);
        return res;
    } catch (const json::exception & e) {
        throw pjson_error(std::string("Malformed schema: ") + e.what());
    }
}

static json schema_to_json(const pjson_schema & schema) {
    json res = json::object();
    switch (schema.kind) {
        case PJSON_SCHEMA_KIND_ANY:
            break;
        case PJSON_SCHEMA_KIND_NULL:
            res["type"] = "null";
            break;
        case PJSON_SCHEMA_KIND_OBJECT: {
            res["type"] = "object";
            json properties = json::object();
            json required = json::array();
            for (const auto & prop : schema.properties) {
                properties[prop.name] = schema_to_json(prop.schema);
                if (prop.required) {
                    required.push_back(prop.name);
                }
            }
            res["properties"] = properties;
            res["required"] = required;
            res["additionalProperties"] = false;
            break;
        }
        case PJSON_SCHEMA_KIND_ARRAY:
            res["type"] = "array";
            res["items"] = schema.items.empty() ? json::object() : schema_to_json(schema.items[0]);
            break;
        case PJSON_SCHEMA_KIND_STRING:
            res["type"] = "string";
            break;
        case PJSON_SCHEMA_KIND_NUMBER:
            res["type"] = schema.integer ? "integer" : "number";
            break;
        case PJSON_SCHEMA_KIND_BOOLEAN:
            res["type"] = "boolean";
            break;
        case PJSON_SCHEMA_KIND_UNION: {
            json variants = json::array();
            for (const auto & variant : schema.variants) {
                variants.push_back(schema_to_json(variant));
            }
            res["anyOf"] = variants;
            break;
        }
        case PJSON_SCHEMA_KIND_REFERENCE:
            res["$ref"] = REF_PREFIXES[0] + schema.ref;
            break;
    }
    if (!schema.description.empty()) {
        res["description"] = schema.description;
    }
    return res;
}

json pjson_schema_to_json(const pjson_schema & schema) {
    json res = schema_to_json(schema);
    if (!schema.definitions.empty()) {
        json defs = json::object();
        for (const auto & def : schema.definitions) {
            defs[def.name] = schema_to_json(def.schema);
        }
        res["$defs"] = defs;
    }
    return res;
}

std::string pjson_schema_to_json_string(const pjson_schema & schema, bool pretty) {
    return pjson_schema_to_json(schema).dump(pretty ? 2 : -1);
}

std::string pjson_schema_instruction(const pjson_schema & schema) {
    return "Respond with valid JSON matching this schema:\n" + pjson_schema_to_json_string(schema, true);
}

//
// Matching and projection
//

static const pjson_schema & resolve(const pjson_schema & root, const pjson_schema & schema) {
    const pjson_schema * cur = &schema;
    for (int hops = 0; cur->kind == PJSON_SCHEMA_KIND_REFERENCE; hops++) {
        if (hops >= MAX_REF_HOPS) {
            throw pjson_error("Schema reference cycle through: " + schema.ref);
        }
        const auto * target = root.find_definition(cur->ref);
        if (!target) {
            throw pjson_error("Unknown schema reference: " + cur->ref);
        }
        cur = target;
    }
    return *cur;
}

static bool is_integral(double v) {
    return std::isfinite(v) && std::trunc(v) == v;
}

static bool matches(const pjson_schema & root, const pjson_schema & schema_ref, const pjson_content & content) {
    const auto & schema = resolve(root, schema_ref);
    switch (schema.kind) {
        case PJSON_SCHEMA_KIND_ANY:
            return true;
        case PJSON_SCHEMA_KIND_NULL:
            return content.is_null();
        case PJSON_SCHEMA_KIND_STRING:
            return content.is_string();
        case PJSON_SCHEMA_KIND_BOOLEAN:
            return content.is_boolean();
        case PJSON_SCHEMA_KIND_NUMBER:
            return content.is_number() && (!schema.integer || is_integral(content.as_number()));
        case PJSON_SCHEMA_KIND_ARRAY:
            if (!content.is_array()) {
                return false;
            }
            for (const auto & elem : content.elements()) {
                if (!schema.items.empty() && !matches(root, schema.items[0], elem)) {
                    return false;
                }
            }
            return true;
        case PJSON_SCHEMA_KIND_OBJECT:
            if (!content.is_object()) {
                return false;
            }
            for (const auto & prop : schema.properties) {
                const auto * value = content.find(prop.name);
                if (!value || value->is_null()) {
                    if (prop.required && !(value && matches(root, prop.schema, *value))) {
                        return false;
                    }
                    continue;
                }
                if (!matches(root, prop.schema, *value)) {
                    return false;
                }
            }
            return true;
        case PJSON_SCHEMA_KIND_UNION:
            for (const auto & variant : schema.variants) {
                if (matches(root, variant, content)) {
                    return true;
                }
            }
            return false;
        case PJSON_SCHEMA_KIND_REFERENCE:
            break;
    }
    return false;
}

bool pjson_schema_matches(const pjson_schema & schema, const pjson_content & content) {
    return matches(schema, schema, content);
}

static pjson_content project(const pjson_schema & root, const pjson_schema & schema_ref, const pjson_content & content) {
    const auto & schema = resolve(root, schema_ref);
    switch (schema.kind) {
        case PJSON_SCHEMA_KIND_ANY:
            return content;
        case PJSON_SCHEMA_KIND_NULL:
            return pjson_content();
        case PJSON_SCHEMA_KIND_STRING:
        case PJSON_SCHEMA_KIND_BOOLEAN:
        case PJSON_SCHEMA_KIND_NUMBER:
            return matches(root, schema, content) ? content : pjson_content();
        case PJSON_SCHEMA_KIND_ARRAY: {
            if (!content.is_array()) {
                return pjson_content();
            }
            pjson_content::array_t elements;
            elements.reserve(content.size());
            for (const auto & elem : content.elements()) {
                elements.push_back(schema.items.empty() ? elem : project(root, schema.items[0], elem));
            }
            return pjson_content::array(std::move(elements));
        }
        case PJSON_SCHEMA_KIND_OBJECT: {
            if (!content.is_object()) {
                return pjson_content();
            }
            std::vector<pjson_content::member_t> members;
            members.reserve(schema.properties.size());
            for (const auto & prop : schema.properties) {
                const auto * value = content.find(prop.name);
                members.emplace_back(prop.name, value ? project(root, prop.schema, *value) : pjson_content());
            }
            return pjson_content::object(std::move(members));
        }
        case PJSON_SCHEMA_KIND_UNION: {
            for (const auto & variant : schema.variants) {
                if (matches(root, variant, content)) {
                    return project(root, variant, content);
                }
            }
            // nothing matches yet: keep the first shape that recognizes part of the value
            for (const auto & variant : schema.variants) {
                auto projected = project(root, variant, content);
                if (!projected.is_null()) {
                    return projected;
                }
            }
            return pjson_content();
        }
        case PJSON_SCHEMA_KIND_REFERENCE:
            break;
    }
    return pjson_content();
}

pjson_content pjson_schema_project(const pjson_schema & schema, const pjson_content & content) {
    return project(schema, schema, content);
}

static bool is_complete(const pjson_schema & root, const pjson_schema & schema_ref, const pjson_content & content) {
    const auto & schema = resolve(root, schema_ref);
    switch (schema.kind) {
        case PJSON_SCHEMA_KIND_ARRAY:
            if (!content.is_array()) {
                return false;
            }
            for (const auto & elem : content.elements()) {
                if (!schema.items.empty() && !is_complete(root, schema.items[0], elem)) {
                    return false;
                }
            }
            return true;
        case PJSON_SCHEMA_KIND_OBJECT:
            if (!content.is_object()) {
                return false;
            }
            for (const auto & prop : schema.properties) {
                const auto * value = content.find(prop.name);
                if (!value || value->is_null()) {
                    if (prop.required && !(value && matches(root, prop.schema, *value))) {
                        return false;
                    }
                    continue;
                }
                if (!is_complete(root, prop.schema, *value)) {
                    return false;
                }
            }
            return true;
        case PJSON_SCHEMA_KIND_UNION:
            for (const auto & variant : schema.variants) {
                if (is_complete(root, variant, content)) {
                    return true;
                }
            }
            return false;
        default:
            return matches(root, schema, content);
    }
}

bool pjson_schema_is_complete(const pjson_schema & schema, const pjson_content & content) {
    return is_complete(schema, schema, content);
}

const char * pjson_schema_kind_name(pjson_schema_kind kind) {
    switch (kind) {
        case PJSON_SCHEMA_KIND_ANY:       return "any";
        case PJSON_SCHEMA_KIND_NULL:      return "null";
        case PJSON_SCHEMA_KIND_OBJECT:    return "object";
        case PJSON_SCHEMA_KIND_ARRAY:     return "array";
        case PJSON_SCHEMA_KIND_STRING:    return "string";
        case PJSON_SCHEMA_KIND_NUMBER:    return "number";
        case PJSON_SCHEMA_KIND_BOOLEAN:   return "boolean";
        case PJSON_SCHEMA_KIND_UNION:     return "union";
        case PJSON_SCHEMA_KIND_REFERENCE: return "reference";
    }
    return "unknown";
}
