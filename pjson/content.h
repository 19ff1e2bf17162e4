#pragma once

#include "error.h"
#include "json-partial.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

enum pjson_content_type {
    PJSON_CONTENT_TYPE_NULL,
    PJSON_CONTENT_TYPE_BOOLEAN,
    PJSON_CONTENT_TYPE_NUMBER,
    PJSON_CONTENT_TYPE_STRING,
    PJSON_CONTENT_TYPE_ARRAY,
    PJSON_CONTENT_TYPE_OBJECT,
};

struct pjson_dump_params {
    int  indent           = -1;    // -1: compact
    bool quote_non_finite = false; // write NaN/Infinity/-Infinity as strings instead of null
};

struct pjson_content_object;

// Immutable, order-preserving JSON value. Arrays and objects share their storage
// between copies, so copying a pjson_content is cheap.
class pjson_content {
  public:
    using array_t  = std::vector<pjson_content>;
    using member_t = std::pair<std::string, pjson_content>;

  private:
    std::variant<
        std::nullptr_t,
        bool,
        double,
        std::string,
        std::shared_ptr<const array_t>,
        std::shared_ptr<const pjson_content_object>
    > value_;

  public:
    pjson_content() : value_(nullptr) {}
    pjson_content(std::nullptr_t) : value_(nullptr) {}
    pjson_content(bool value) : value_(value) {}
    pjson_content(double value) : value_(value) {}
    pjson_content(int value) : value_(static_cast<double>(value)) {}
    pjson_content(int64_t value) : value_(static_cast<double>(value)) {}
    pjson_content(const char * value) : value_(std::string(value)) {}
    pjson_content(std::string value) : value_(std::move(value)) {}

    static pjson_content array(array_t elements = {});
    // A repeated key replaces the earlier value and keeps the earlier position.
    static pjson_content object(std::vector<member_t> members = {});

    static pjson_content from_json(const nlohmann::ordered_json & j);
    nlohmann::ordered_json to_json(bool quote_non_finite = false) const;

    pjson_content_type type() const { return static_cast<pjson_content_type>(value_.index()); }

    bool is_null()    const { return type() == PJSON_CONTENT_TYPE_NULL; }
    bool is_boolean() const { return type() == PJSON_CONTENT_TYPE_BOOLEAN; }
    bool is_number()  const { return type() == PJSON_CONTENT_TYPE_NUMBER; }
    bool is_string()  const { return type() == PJSON_CONTENT_TYPE_STRING; }
    bool is_array()   const { return type() == PJSON_CONTENT_TYPE_ARRAY; }
    bool is_object()  const { return type() == PJSON_CONTENT_TYPE_OBJECT; }

    // Typed accessors throw pjson_conversion_error on a type mismatch.
    bool                       as_bool()   const;
    double                     as_number() const;
    const std::string &        as_string() const;
    const array_t &            elements()  const;
    const std::vector<std::string> & keys() const;

    // Object lookup, O(1). Returns nullptr when the key is absent or this is not an object.
    const pjson_content * find(const std::string & key) const;
    bool contains(const std::string & key) const { return find(key) != nullptr; }
    const pjson_content & at(const std::string & key) const;
    const pjson_content & at(size_t index) const;

    // Number of elements or members, 0 for scalars.
    size_t size() const;

    std::string dump(const pjson_dump_params & params = {}) const;

    bool operator==(const pjson_content & other) const;
    bool operator!=(const pjson_content & other) const { return !(*this == other); }
};

struct pjson_content_object {
    std::vector<std::string>                       keys;
    std::unordered_map<std::string, pjson_content> values;
};

const char * pjson_content_type_name(pjson_content_type type);

// Parses strict JSON text into content, preserving object key order.
// params.non_finite controls whether bare NaN, Infinity and -Infinity are accepted.
// Throws pjson_parse_error.
pjson_content pjson_content_parse(const std::string & text, const pjson_completion_params & params = {});

// Completes `text` with pjson_json_complete() then parses it. Empty input throws
// pjson_no_content_error, excessive nesting pjson_depth_exceeded_error, anything
// that cannot be completed pjson_parse_error.
pjson_content pjson_complete_then_parse(const std::string & text, const pjson_completion_params & params = {});
