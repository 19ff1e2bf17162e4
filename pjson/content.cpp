#include "content.h"

#include "common.h"
#include "log.h"

#include <algorithm>
#include <cmath>
#include <cstring>

using json = nlohmann::ordered_json;

// Bare non-finite tokens are swapped for these strings before handing the text to
// nlohmann::json, which only accepts strict JSON. A leading NUL keeps them from
// clashing with anything a model would write.
static const std::string NAN_MARKER     = std::string(1, '\0') + "pjson:NaN";
static const std::string INF_MARKER     = std::string(1, '\0') + "pjson:Infinity";
static const std::string NEG_INF_MARKER = std::string(1, '\0') + "pjson:-Infinity";

static const char * NAN_MARKER_JSON     = "\"\\u0000pjson:NaN\"";
static const char * INF_MARKER_JSON     = "\"\\u0000pjson:Infinity\"";
static const char * NEG_INF_MARKER_JSON = "\"\\u0000pjson:-Infinity\"";

pjson_content pjson_content::array(array_t elements) {
    pjson_content res;
    res.value_ = std::make_shared<const array_t>(std::move(elements));
    return res;
}

pjson_content pjson_content::object(std::vector<member_t> members) {
    auto obj = std::make_shared<pjson_content_object>();
    obj->keys.reserve(members.size());
    for (auto & member : members) {
        auto it = obj->values.find(member.first);
        if (it != obj->values.end()) {
            it->second = std::move(member.second);
            continue;
        }
        obj->keys.push_back(member.first);
        obj->values.emplace(std::move(member.first), std::move(member.second));
    }
    pjson_content res;
    res.value_ = std::shared_ptr<const pjson_content_object>(std::move(obj));
    return res;
}

pjson_content pjson_content::from_json(const json & j) {
    switch (j.type()) {
        case json::value_t::null:
            return pjson_content();
        case json::value_t::boolean:
            return pjson_content(j.get<bool>());
        case json::value_t::number_integer:
            return pjson_content(static_cast<double>(j.get<int64_t>()));
        case json::value_t::number_unsigned:
            return pjson_content(static_cast<double>(j.get<uint64_t>()));
        case json::value_t::number_float:
            return pjson_content(j.get<double>());
        case json::value_t::string:
            return pjson_content(j.get<std::string>());
        case json::value_t::array: {
            array_t elements;
            elements.reserve(j.size());
            for (const auto & elem : j) {
                elements.push_back(from_json(elem));
            }
            return array(std::move(elements));
        }
        case json::value_t::object: {
            std::vector<member_t> members;
            members.reserve(j.size());
            for (const auto & item : j.items()) {
                members.emplace_back(item.key(), from_json(item.value()));
            }
            return object(std::move(members));
        }
        default:
            throw pjson_conversion_error(std::string("Unsupported JSON value type: ") + j.type_name());
    }
}

json pjson_content::to_json(bool quote_non_finite) const {
    switch (type()) {
        case PJSON_CONTENT_TYPE_NULL:
            return nullptr;
        case PJSON_CONTENT_TYPE_BOOLEAN:
            return std::get<bool>(value_);
        case PJSON_CONTENT_TYPE_NUMBER: {
            const double v = std::get<double>(value_);
            if (std::isnan(v)) {
                return quote_non_finite ? json("NaN") : json(nullptr);
            }
            if (std::isinf(v)) {
                if (!quote_non_finite) {
                    return nullptr;
                }
                return v > 0 ? "Infinity" : "-Infinity";
            }
            // 2^53: every integral double below this prints exactly as an integer
            if (std::trunc(v) == v && std::fabs(v) < 9007199254740992.0) {
                return static_cast<int64_t>(v);
            }
            return v;
        }
        case PJSON_CONTENT_TYPE_STRING:
            return std::get<std::string>(value_);
        case PJSON_CONTENT_TYPE_ARRAY: {
            json res = json::array();
            for (const auto & elem : elements()) {
                res.push_back(elem.to_json(quote_non_finite));
            }
            return res;
        }
        case PJSON_CONTENT_TYPE_OBJECT: {
            json res = json::object();
            const auto & obj = *std::get<std::shared_ptr<const pjson_content_object>>(value_);
            for (const auto & key : obj.keys) {
                res[key] = obj.values.at(key).to_json(quote_non_finite);
            }
            return res;
        }
    }
    return nullptr;
}

static pjson_conversion_error type_mismatch(const char * expected, pjson_content_type actual) {
    return pjson_conversion_error(string_format("Expected %s, got %s", expected, pjson_content_type_name(actual)));
}

bool pjson_content::as_bool() const {
    if (!is_boolean()) {
        throw type_mismatch("boolean", type());
    }
    return std::get<bool>(value_);
}

double pjson_content::as_number() const {
    if (!is_number()) {
        throw type_mismatch("number", type());
    }
    return std::get<double>(value_);
}

const std::string & pjson_content::as_string() const {
    if (!is_string()) {
        throw type_mismatch("string", type());
    }
    return std::get<std::string>(value_);
}

const pjson_content::array_t & pjson_content::elements() const {
    if (!is_array()) {
        throw type_mismatch("array", type());
    }
    return *std::get<std::shared_ptr<const array_t>>(value_);
}

const std::vector<std::string> & pjson_content::keys() const {
    if (!is_object()) {
        throw type_mismatch("object", type());
    }
    return std::get<std::shared_ptr<const pjson_content_object>>(value_)->keys;
}

const pjson_content * pjson_content::find(const std::string & key) const {
    if (!is_object()) {
        return nullptr;
    }
    const auto & values = std::get<std::shared_ptr<const pjson_content_object>>(value_)->values;
    auto it = values.find(key);
    return it == values.end() ? nullptr : &it->second;
}

const pjson_content & pjson_content::at(const std::string & key) const {
    if (!is_object()) {
        throw type_mismatch("object", type());
    }
    const auto * value = find(key);
    if (!value) {
        throw pjson_conversion_error("Missing key: " + key);
    }
    return *value;
}

const pjson_content & pjson_content::at(size_t index) const {
    const auto & elems = elements();
    if (index >= elems.size()) {
        throw pjson_conversion_error(string_format("Index %zu out of range (size %zu)", index, elems.size()));
    }
    return elems[index];
}

size_t pjson_content::size() const {
    switch (type()) {
        case PJSON_CONTENT_TYPE_ARRAY:  return elements().size();
        case PJSON_CONTENT_TYPE_OBJECT: return keys().size();
        default:                        return 0;
    }
}

std::string pjson_content::dump(const pjson_dump_params & params) const {
    return to_json(params.quote_non_finite).dump(params.indent, ' ', false, json::error_handler_t::replace);
}

bool pjson_content::operator==(const pjson_content & other) const {
    if (type() != other.type()) {
        return false;
    }
    switch (type()) {
        case PJSON_CONTENT_TYPE_NULL:
            return true;
        case PJSON_CONTENT_TYPE_BOOLEAN:
            return std::get<bool>(value_) == std::get<bool>(other.value_);
        case PJSON_CONTENT_TYPE_NUMBER:
            return std::get<double>(value_) == std::get<double>(other.value_);
        case PJSON_CONTENT_TYPE_STRING:
            return std::get<std::string>(value_) == std::get<std::string>(other.value_);
        case PJSON_CONTENT_TYPE_ARRAY: {
            const auto & a = std::get<std::shared_ptr<const array_t>>(value_);
            const auto & b = std::get<std::shared_ptr<const array_t>>(other.value_);
            return a == b || *a == *b;
        }
        case PJSON_CONTENT_TYPE_OBJECT: {
            const auto & a = std::get<std::shared_ptr<const pjson_content_object>>(value_);
            const auto & b = std::get<std::shared_ptr<const pjson_content_object>>(other.value_);
            if (a == b) {
                return true;
            }
            if (a->keys != b->keys) {
                return false;
            }
            for (const auto & key : a->keys) {
                if (a->values.at(key) != b->values.at(key)) {
                    return false;
                }
            }
            return true;
        }
    }
    return false;
}

const char * pjson_content_type_name(pjson_content_type type) {
    switch (type) {
        case PJSON_CONTENT_TYPE_NULL:    return "null";
        case PJSON_CONTENT_TYPE_BOOLEAN: return "boolean";
        case PJSON_CONTENT_TYPE_NUMBER:  return "number";
        case PJSON_CONTENT_TYPE_STRING:  return "string";
        case PJSON_CONTENT_TYPE_ARRAY:   return "array";
        case PJSON_CONTENT_TYPE_OBJECT:  return "object";
    }
    return "unknown";
}

//
// Parsing
//

// Rewrites bare NaN, Infinity and -Infinity tokens (outside of strings) as marker strings.
static std::string substitute_non_finite(const std::string & text) {
    std::string out;
    out.reserve(text.size());

    bool in_string = false;
    bool escaped   = false;
    size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            out += c;
            i++;
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (text.compare(i, 3, "NaN") == 0) {
            out += NAN_MARKER_JSON;
            i += 3;
            continue;
        } else if (text.compare(i, 8, "Infinity") == 0) {
            out += INF_MARKER_JSON;
            i += 8;
            continue;
        } else if (text.compare(i, 9, "-Infinity") == 0) {
            out += NEG_INF_MARKER_JSON;
            i += 9;
            continue;
        }
        out += c;
        i++;
    }
    return out;
}

namespace {

// Builds pjson_content directly from nlohmann's SAX events.
// https://json.nlohmann.me/features/parsing/sax_interface/
struct content_builder : public nlohmann::json_sax<json> {
    struct frame {
        bool is_object = false;
        pjson_content::array_t elements;
        std::vector<pjson_content::member_t> members;
        std::string key;
    };

    const int max_depth;
    const bool non_finite;

    std::vector<frame> stack;
    pjson_content result;

    bool depth_exceeded = false;
    bool found_error = false;
    size_t error_position = 0;
    std::string error_message;

    content_builder(int max_depth, bool non_finite) : max_depth(max_depth), non_finite(non_finite) {}

    bool add(pjson_content value) {
        if (stack.empty()) {
            result = std::move(value);
        } else if (stack.back().is_object) {
            auto & top = stack.back();
            top.members.emplace_back(std::move(top.key), std::move(value));
        } else {
            stack.back().elements.push_back(std::move(value));
        }
        return true;
    }

    bool open(bool is_object) {
        if ((int) stack.size() >= max_depth) {
            depth_exceeded = true;
            return false;
        }
        stack.emplace_back();
        stack.back().is_object = is_object;
        return true;
    }

    bool null() override { // NOLINT
        return add(pjson_content());
    }
    bool boolean(bool val) override { // NOLINT
        return add(pjson_content(val));
    }
    bool number_integer(number_integer_t val) override { // NOLINT
        return add(pjson_content(static_cast<double>(val)));
    }
    bool number_unsigned(number_unsigned_t val) override { // NOLINT
        return add(pjson_content(static_cast<double>(val)));
    }
    bool number_float(number_float_t val, const string_t &) override { // NOLINT
        return add(pjson_content(static_cast<double>(val)));
    }
    bool string(string_t & val) override { // NOLINT
        if (non_finite && !val.empty() && val[0] == '\0') {
            if (val == NAN_MARKER) {
                return add(pjson_content(std::nan("")));
            }
            if (val == INF_MARKER) {
                return add(pjson_content(HUGE_VAL));
            }
            if (val == NEG_INF_MARKER) {
                return add(pjson_content(-HUGE_VAL));
            }
        }
        return add(pjson_content(std::move(val)));
    }
    bool binary(binary_t &) override { // NOLINT
        found_error = true;
        error_message = "binary values are not supported";
        return false;
    }
    bool start_object(std::size_t) override { // NOLINT
        return open(true);
    }
    bool key(string_t & val) override { // NOLINT
        stack.back().key = std::move(val);
        return true;
    }
    bool end_object() override {
        PJSON_ASSERT(!stack.empty() && stack.back().is_object);
        auto members = std::move(stack.back().members);
        stack.pop_back();
        return add(pjson_content::object(std::move(members)));
    }
    bool start_array(std::size_t) override { // NOLINT
        return open(false);
    }
    bool end_array() override {
        PJSON_ASSERT(!stack.empty() && !stack.back().is_object);
        auto elements = std::move(stack.back().elements);
        stack.pop_back();
        return add(pjson_content::array(std::move(elements)));
    }
    bool parse_error(std::size_t position, const std::string &, const json::exception & ex) override { // NOLINT
        found_error = true;
        error_position = position > 0 ? position - 1 : 0;
        error_message = ex.what();
        return false;
    }
};

} // namespace

pjson_content pjson_content_parse(const std::string & text, const pjson_completion_params & params) {
    const bool non_finite = params.non_finite == PJSON_NON_FINITE_ACCEPT;
    const int max_depth = params.max_depth < 1 ? 64 : params.max_depth;

    content_builder builder(max_depth, non_finite);
    if (non_finite) {
        json::sax_parse(substitute_non_finite(text), &builder);
    } else {
        json::sax_parse(text, &builder);
    }

    if (builder.depth_exceeded) {
        throw pjson_depth_exceeded_error(max_depth);
    }
    if (builder.found_error) {
        LOG_DBG("%s: %s\n", __func__, builder.error_message.c_str());
        // positions are only approximate once non-finite tokens were rewritten
        throw pjson_parse_error(builder.error_message, std::min(builder.error_position, text.size()));
    }
    return builder.result;
}

pjson_content pjson_complete_then_parse(const std::string & text, const pjson_completion_params & params) {
    const auto completion = pjson_json_complete(text, params);
    LOG_DBG("%s: completion: %s (suffix = '%s', truncate_at = %zu)\n", __func__,
        pjson_completion_type_name(completion.type), completion.suffix.c_str(), completion.truncate_at);

    switch (completion.type) {
        case PJSON_COMPLETION_ALREADY_VALID:
            return pjson_content_parse(text, params);
        case PJSON_COMPLETION_APPEND:
            return pjson_content_parse(completion.apply(text), params);
        case PJSON_COMPLETION_DEPTH_EXCEEDED:
            throw pjson_depth_exceeded_error(params.max_depth < 1 ? 64 : params.max_depth);
        case PJSON_COMPLETION_UNAVAILABLE:
            break;
    }
    if (string_strip(text).empty()) {
        throw pjson_no_content_error();
    }
    // let the parser report where the text went wrong
    return pjson_content_parse(text, params);
}
