#pragma once

#include "content.h"
#include "error.h"
#include "schema.h"

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <vector>

// Types decoded from model output specialize this template:
//
//   template <> struct pjson_generable<recipe> {
//       using partial_type = recipe_partial;  // every field std::optional, plus bool is_complete() const
//       static pjson_schema schema();
//       static partial_type partial_from_content(const pjson_content & content); // lenient
//       static recipe       from_content(const pjson_content & content);         // strict, throws pjson_conversion_error
//   };
//
// partial_from_content() receives content already projected through schema(): an object
// carrying every declared property, null where nothing usable has arrived yet.
template <typename T>
struct pjson_generable;

// Untyped decoding: the content itself, with no schema constraints.
template <>
struct pjson_generable<pjson_content> {
    using partial_type = pjson_content;

    static pjson_schema schema() { return pjson_schema(); }
    static pjson_content partial_from_content(const pjson_content & content) { return content; }
    static pjson_content from_content(const pjson_content & content) { return content; }
};

// Conversions for field types: primitives, vectors, optionals and nested generables.
// partial() never throws and yields std::nullopt for anything unusable; strict() throws
// pjson_conversion_error.
template <typename T>
struct pjson_content_traits {
    using partial_type = typename pjson_generable<T>::partial_type;
    static constexpr bool nullable = false;

    static pjson_schema schema() { return pjson_generable<T>::schema(); }
    static std::optional<partial_type> partial(const pjson_content & content) {
        if (content.is_null()) {
            return std::nullopt;
        }
        return pjson_generable<T>::partial_from_content(pjson_schema_project(schema(), content));
    }
    static T strict(const pjson_content & content) { return pjson_generable<T>::from_content(content); }
};

template <>
struct pjson_content_traits<std::string> {
    using partial_type = std::string;
    static constexpr bool nullable = false;

    static pjson_schema schema() { return pjson_schema_string(); }
    static std::optional<std::string> partial(const pjson_content & content) {
        if (!content.is_string()) {
            return std::nullopt;
        }
        return content.as_string();
    }
    static std::string strict(const pjson_content & content) { return content.as_string(); }
};

template <>
struct pjson_content_traits<bool> {
    using partial_type = bool;
    static constexpr bool nullable = false;

    static pjson_schema schema() { return pjson_schema_boolean(); }
    static std::optional<bool> partial(const pjson_content & content) {
        if (!content.is_boolean()) {
            return std::nullopt;
        }
        return content.as_bool();
    }
    static bool strict(const pjson_content & content) { return content.as_bool(); }
};

template <>
struct pjson_content_traits<double> {
    using partial_type = double;
    static constexpr bool nullable = false;

    static pjson_schema schema() { return pjson_schema_number(); }
    static std::optional<double> partial(const pjson_content & content) {
        if (!content.is_number()) {
            return std::nullopt;
        }
        return content.as_number();
    }
    static double strict(const pjson_content & content) { return content.as_number(); }
};

// Integral and within the range of int.
inline bool pjson_is_int(double v) {
    return std::isfinite(v) && std::trunc(v) == v &&
        v >= static_cast<double>(std::numeric_limits<int>::min()) &&
        v <= static_cast<double>(std::numeric_limits<int>::max());
}

template <>
struct pjson_content_traits<int> {
    using partial_type = int;
    static constexpr bool nullable = false;

    static pjson_schema schema() { return pjson_schema_integer(); }
    static std::optional<int> partial(const pjson_content & content) {
        if (!content.is_number() || !pjson_is_int(content.as_number())) {
            return std::nullopt;
        }
        return static_cast<int>(content.as_number());
    }
    static int strict(const pjson_content & content) {
        const double v = content.as_number();
        if (!pjson_is_int(v)) {
            throw pjson_conversion_error("Expected an integer, got " + content.dump());
        }
        return static_cast<int>(v);
    }
};

template <typename T>
struct pjson_content_traits<std::vector<T>> {
    using partial_type = std::vector<typename pjson_content_traits<T>::partial_type>;
    static constexpr bool nullable = false;

    static pjson_schema schema() { return pjson_schema_array(pjson_content_traits<T>::schema()); }
    static std::optional<partial_type> partial(const pjson_content & content) {
        if (!content.is_array()) {
            return std::nullopt;
        }
        partial_type res;
        for (const auto & elem : content.elements()) {
            auto value = pjson_content_traits<T>::partial(elem);
            if (value) {
                res.push_back(std::move(*value));
            }
        }
        return res;
    }
    static std::vector<T> strict(const pjson_content & content) {
        std::vector<T> res;
        const auto & elems = content.elements();
        res.reserve(elems.size());
        for (size_t i = 0; i < elems.size(); i++) {
            try {
                res.push_back(pjson_content_traits<T>::strict(elems[i]));
            } catch (const pjson_conversion_error & e) {
                throw pjson_conversion_error("[" + std::to_string(i) + "]: " + e.what());
            }
        }
        return res;
    }
};

template <typename T>
struct pjson_content_traits<std::optional<T>> {
    using partial_type = typename pjson_content_traits<T>::partial_type;
    static constexpr bool nullable = true;

    static pjson_schema schema() { return pjson_schema_union({pjson_content_traits<T>::schema(), pjson_schema_null()}); }
    static std::optional<partial_type> partial(const pjson_content & content) {
        return pjson_content_traits<T>::partial(content);
    }
    static std::optional<T> strict(const pjson_content & content) {
        if (content.is_null()) {
            return std::nullopt;
        }
        return pjson_content_traits<T>::strict(content);
    }
};

// Schema property for a field of type T. std::optional fields are not required.
template <typename T>
pjson_schema_property pjson_property(const std::string & name, const std::string & description = "") {
    pjson_schema_property prop;
    prop.name               = name;
    prop.schema             = pjson_content_traits<T>::schema();
    prop.required           = !pjson_content_traits<T>::nullable;
    if (!description.empty()) {
        prop.schema.description = description;
    }
    return prop;
}

// Lenient field read for partial_from_content().
template <typename T>
std::optional<typename pjson_content_traits<T>::partial_type> pjson_partial_field(const pjson_content & object, const std::string & key) {
    const auto * value = object.find(key);
    if (!value || value->is_null()) {
        return std::nullopt;
    }
    return pjson_content_traits<T>::partial(*value);
}

// Strict field read for from_content(). A missing required field throws pjson_conversion_error.
template <typename T>
T pjson_field(const pjson_content & object, const std::string & key) {
    if (!object.is_object()) {
        throw pjson_conversion_error("Expected object, got " + std::string(pjson_content_type_name(object.type())));
    }
    const auto * value = object.find(key);
    if (!value) {
        if constexpr (pjson_content_traits<T>::nullable) {
            return T();
        } else {
            throw pjson_conversion_error("Missing required field: " + key);
        }
    }
    try {
        return pjson_content_traits<T>::strict(*value);
    } catch (const pjson_conversion_error & e) {
        throw pjson_conversion_error(key + ": " + e.what());
    }
}
