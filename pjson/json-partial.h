#pragma once

#include <string>
#include <vector>

enum pjson_completion_policy {
    // Closes open structures with placeholders, keeps every complete token received so far.
    PJSON_COMPLETION_POLICY_CONSERVATIVE,
    // Also drops dangling trailing fragments (incomplete keys, key/colon pairs with no value,
    // values that cannot be completed) and trailing commas before closers.
    PJSON_COMPLETION_POLICY_REPAIR,
};

enum pjson_non_finite {
    PJSON_NON_FINITE_REJECT,
    PJSON_NON_FINITE_ACCEPT, // NaN, Infinity, -Infinity
};

struct pjson_completion_params {
    int max_depth = 64;
    pjson_completion_policy policy = PJSON_COMPLETION_POLICY_CONSERVATIVE;
    pjson_non_finite non_finite = PJSON_NON_FINITE_REJECT;
};

enum pjson_completion_type {
    PJSON_COMPLETION_ALREADY_VALID,
    PJSON_COMPLETION_APPEND,
    PJSON_COMPLETION_UNAVAILABLE,    // cannot complete yet (empty input, literal mismatch, rejected non-finite)
    PJSON_COMPLETION_DEPTH_EXCEEDED,
};

struct pjson_completion {
    pjson_completion_type type = PJSON_COMPLETION_ALREADY_VALID;

    // Only meaningful for PJSON_COMPLETION_APPEND:
    // completed = text[0, truncate_at) minus the bytes at erase_at, followed by suffix.
    std::string         suffix;
    size_t              truncate_at = 0;
    std::vector<size_t> erase_at; // trailing commas before closers (repair policy only)

    bool ok() const {
        return type == PJSON_COMPLETION_ALREADY_VALID || type == PJSON_COMPLETION_APPEND;
    }

    // Returns the completed text. Must only be called when ok().
    std::string apply(const std::string & text) const;

    bool operator==(const pjson_completion & other) const {
        return type == other.type
            && suffix == other.suffix
            && truncate_at == other.truncate_at
            && erase_at == other.erase_at;
    }
    bool operator!=(const pjson_completion & other) const {
        return !(*this == other);
    }
};

// Computes the minimal completion turning `text`, a prefix of some JSON document, into valid JSON.
// Pure and reentrant: no shared state, recursion bounded by params.max_depth.
pjson_completion pjson_json_complete(const std::string & text, const pjson_completion_params & params = {});

const char * pjson_completion_type_name(pjson_completion_type type);
const char * pjson_completion_policy_name(pjson_completion_policy policy);
