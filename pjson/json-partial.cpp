#include "json-partial.h"

#include "common.h"
#include "log.h"

#include <cstring>
#include <stdexcept>

namespace {

enum value_status {
    VALUE_COMPLETE,
    VALUE_PARTIAL,
    VALUE_UNAVAILABLE,
    VALUE_DEPTH_EXCEEDED,
};

// Outcome of completing one value starting at a given offset.
struct value_result {
    value_status status = VALUE_UNAVAILABLE;
    size_t end = 0;          // VALUE_COMPLETE: offset just past the value
    size_t truncate_at = 0;  // VALUE_PARTIAL: where the suffix applies
    std::string suffix;      // VALUE_PARTIAL
};

value_result complete_at(size_t end) {
    value_result r;
    r.status = VALUE_COMPLETE;
    r.end = end;
    return r;
}

value_result partial_at(size_t truncate_at, std::string suffix) {
    value_result r;
    r.status = VALUE_PARTIAL;
    r.truncate_at = truncate_at;
    r.suffix = std::move(suffix);
    return r;
}

value_result with_status(value_status status) {
    value_result r;
    r.status = status;
    return r;
}

bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_hex(char c) {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

int hex_value(char c) {
    if (is_digit(c)) return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return c - 'A' + 10;
}

class json_completer {
    const char * data;
    const size_t len;
    const pjson_completion_params & params;
    const bool repair;

  public:
    std::vector<size_t> erase_at;

    json_completer(const std::string & text, const pjson_completion_params & params)
        : data(text.data()),
          len(text.size()),
          params(params),
          repair(params.policy == PJSON_COMPLETION_POLICY_REPAIR) {}

    size_t skip_ws(size_t pos) const {
        while (pos < len && is_ws(data[pos])) {
            pos++;
        }
        return pos;
    }

    // pos must point at a non-whitespace byte. depth counts the containers enclosing the value.
    value_result complete_value(size_t pos, int depth) {
        const char c = data[pos];
        switch (c) {
            case '{':
            case '[':
                if (depth + 1 > params.max_depth) {
                    return with_status(VALUE_DEPTH_EXCEEDED);
                }
                return c == '{' ? complete_object(pos, depth + 1) : complete_array(pos, depth + 1);
            case '"':
                return complete_string(pos);
            case 't':
                return complete_literal(pos, "true");
            case 'f':
                return complete_literal(pos, "false");
            case 'n':
                return complete_literal(pos, "null");
            case 'I':
                return complete_non_finite(pos, "Infinity");
            case 'N':
                return complete_non_finite(pos, "NaN");
            case '-':
                if (pos + 1 < len && data[pos + 1] == 'I') {
                    return complete_non_finite(pos, "-Infinity");
                }
                return complete_number(pos);
            default:
                if (is_digit(c)) {
                    return complete_number(pos);
                }
                return with_status(VALUE_UNAVAILABLE);
        }
    }

    value_result complete_string(size_t pos) const {
        size_t cur = pos + 1;
        bool escaped = false;
        while (cur < len) {
            const char c = data[cur];
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                return complete_at(cur + 1);
            }
            cur++;
        }
        return partial_at(safe_string_cut(pos + 1), "\"");
    }

    // Where an unterminated string whose contents start at `begin` can be closed so that the
    // result is valid: drops a dangling backslash, a partial \uXXXX escape, a high surrogate
    // escape left without its pair and a truncated multi-byte UTF-8 sequence.
    size_t safe_string_cut(size_t begin) const {
        size_t cut = len;
        size_t surrogate_begin = std::string::npos;
        size_t surrogate_end = std::string::npos;

        size_t i = begin;
        while (i < len) {
            if (data[i] != '\\') {
                i++;
                continue;
            }
            if (i + 1 >= len) {
                cut = i;
                break;
            }
            if (data[i + 1] != 'u') {
                i += 2;
                continue;
            }
            size_t hex = 0;
            int code = 0;
            while (hex < 4 && i + 2 + hex < len && is_hex(data[i + 2 + hex])) {
                code = code * 16 + hex_value(data[i + 2 + hex]);
                hex++;
            }
            if (hex < 4) {
                if (i + 2 + hex >= len) {
                    cut = i;
                    break;
                }
                // malformed escape, left for the parser to report
                i += 2 + hex;
                continue;
            }
            if (code >= 0xD800 && code <= 0xDBFF) {
                surrogate_begin = i;
                surrogate_end = i + 6;
            }
            i += 6;
        }

        if (surrogate_end == cut) {
            cut = surrogate_begin;
        }

        return begin + validate_utf8(data + begin, data + cut);
    }

    value_result complete_number(size_t pos) const {
        size_t cur = pos;
        if (data[cur] == '-') {
            cur++;
        }
        if (cur >= len) {
            return partial_at(cur, "0");
        }
        if (!is_digit(data[cur])) {
            return with_status(VALUE_UNAVAILABLE);
        }
        while (cur < len && is_digit(data[cur])) {
            cur++;
        }

        if (cur < len && data[cur] == '.') {
            cur++;
            if (cur >= len) {
                return partial_at(cur, "0");
            }
            if (!is_digit(data[cur])) {
                return with_status(VALUE_UNAVAILABLE);
            }
            while (cur < len && is_digit(data[cur])) {
                cur++;
            }
        }

        if (cur < len && (data[cur] == 'e' || data[cur] == 'E')) {
            cur++;
            if (cur < len && (data[cur] == '+' || data[cur] == '-')) {
                cur++;
            }
            if (cur >= len) {
                return partial_at(cur, "0");
            }
            if (!is_digit(data[cur])) {
                return with_status(VALUE_UNAVAILABLE);
            }
            while (cur < len && is_digit(data[cur])) {
                cur++;
            }
        }

        return complete_at(cur);
    }

    value_result complete_literal(size_t pos, const char * word) const {
        const size_t n = strlen(word);
        size_t cur = pos;
        size_t matched = 0;
        while (cur < len && matched < n) {
            if (data[cur] != word[matched]) {
                return with_status(VALUE_UNAVAILABLE);
            }
            cur++;
            matched++;
        }
        if (matched == n) {
            return complete_at(cur);
        }
        return partial_at(cur, word + matched);
    }

    value_result complete_non_finite(size_t pos, const char * word) const {
        if (params.non_finite == PJSON_NON_FINITE_REJECT) {
            LOG_DBG("%s: rejecting non-finite number at offset %zu\n", __func__, pos);
            return with_status(VALUE_UNAVAILABLE);
        }
        return complete_literal(pos, word);
    }

    value_result complete_array(size_t pos, int depth) {
        size_t cur = skip_ws(pos + 1);
        if (cur >= len) {
            return partial_at(cur, "]");
        }
        if (data[cur] == ']') {
            return complete_at(cur + 1);
        }

        size_t last_valid = pos + 1;
        while (true) {
            value_result elem = complete_value(cur, depth);
            switch (elem.status) {
                case VALUE_PARTIAL:
                    elem.suffix += ']';
                    return elem;
                case VALUE_DEPTH_EXCEEDED:
                    return elem;
                case VALUE_UNAVAILABLE:
                    if (repair) {
                        return partial_at(last_valid, "]");
                    }
                    return elem;
                case VALUE_COMPLETE:
                    break;
            }

            last_valid = elem.end;
            cur = skip_ws(elem.end);
            if (cur >= len) {
                return partial_at(last_valid, "]");
            }
            if (data[cur] == ']') {
                return complete_at(cur + 1);
            }
            if (data[cur] != ',') {
                return partial_at(last_valid, "]");
            }

            const size_t comma = cur;
            cur = skip_ws(cur + 1);
            if (cur >= len) {
                // dangling comma
                return partial_at(last_valid, "]");
            }
            if (data[cur] == ']') {
                if (repair) {
                    erase_at.push_back(comma);
                    return complete_at(cur + 1);
                }
                return partial_at(last_valid, "]");
            }
        }
    }

    value_result complete_object(size_t pos, int depth) {
        size_t cur = skip_ws(pos + 1);
        if (cur >= len) {
            return partial_at(cur, "}");
        }
        if (data[cur] == '}') {
            return complete_at(cur + 1);
        }

        // end of the last complete member, or just past the brace
        size_t last_valid = pos + 1;
        while (true) {
            if (data[cur] != '"') {
                return partial_at(last_valid, "}");
            }

            value_result key = complete_string(cur);
            if (key.status == VALUE_PARTIAL) {
                if (repair) {
                    return partial_at(last_valid, "}");
                }
                key.suffix += ": null}";
                return key;
            }

            const size_t key_end = key.end;
            cur = skip_ws(key_end);
            if (cur >= len) {
                if (repair) {
                    return partial_at(last_valid, "}");
                }
                return partial_at(key_end, ": null}");
            }
            if (data[cur] != ':') {
                return partial_at(last_valid, "}");
            }

            const size_t colon_end = cur + 1;
            cur = skip_ws(colon_end);
            if (cur >= len) {
                if (repair) {
                    return partial_at(last_valid, "}");
                }
                return partial_at(colon_end, "null}");
            }

            value_result value = complete_value(cur, depth);
            switch (value.status) {
                case VALUE_PARTIAL:
                    value.suffix += '}';
                    return value;
                case VALUE_DEPTH_EXCEEDED:
                    return value;
                case VALUE_UNAVAILABLE:
                    if (repair) {
                        return partial_at(last_valid, "}");
                    }
                    return value;
                case VALUE_COMPLETE:
                    break;
            }

            last_valid = value.end;
            cur = skip_ws(value.end);
            if (cur >= len) {
                return partial_at(last_valid, "}");
            }
            if (data[cur] == '}') {
                return complete_at(cur + 1);
            }
            if (data[cur] != ',') {
                return partial_at(last_valid, "}");
            }

            const size_t comma = cur;
            cur = skip_ws(cur + 1);
            if (cur >= len) {
                // dangling comma
                return partial_at(last_valid, "}");
            }
            if (data[cur] == '}') {
                if (repair) {
                    erase_at.push_back(comma);
                    return complete_at(cur + 1);
                }
                return partial_at(last_valid, "}");
            }
        }
    }
};

} // namespace

std::string pjson_completion::apply(const std::string & text) const {
    if (type == PJSON_COMPLETION_ALREADY_VALID) {
        return text;
    }
    if (type != PJSON_COMPLETION_APPEND) {
        throw std::runtime_error(std::string("Cannot apply completion of type ") + pjson_completion_type_name(type));
    }
    PJSON_ASSERT(truncate_at <= text.size());

    std::string out;
    out.reserve(truncate_at + suffix.size());
    size_t from = 0;
    for (const auto pos : erase_at) {
        if (pos >= truncate_at) {
            break;
        }
        out.append(text, from, pos - from);
        from = pos + 1;
    }
    out.append(text, from, truncate_at - from);
    out += suffix;
    return out;
}

pjson_completion pjson_json_complete(const std::string & text, const pjson_completion_params & params) {
    pjson_completion res;

    pjson_completion_params effective = params;
    if (effective.max_depth < 1) {
        effective.max_depth = 64;
    }

    json_completer completer(text, effective);

    const size_t start = completer.skip_ws(0);
    if (start >= text.size()) {
        if (effective.policy == PJSON_COMPLETION_POLICY_REPAIR) {
            res.type = PJSON_COMPLETION_APPEND;
            res.truncate_at = 0;
            res.suffix = "{}";
        } else {
            res.type = PJSON_COMPLETION_UNAVAILABLE;
        }
        return res;
    }

    value_result r = completer.complete_value(start, 0);
    switch (r.status) {
        case VALUE_COMPLETE:
            if (completer.erase_at.empty()) {
                res.type = PJSON_COMPLETION_ALREADY_VALID;
            } else {
                res.type = PJSON_COMPLETION_APPEND;
                res.truncate_at = text.size();
                res.erase_at = std::move(completer.erase_at);
            }
            break;
        case VALUE_PARTIAL:
            res.type = PJSON_COMPLETION_APPEND;
            res.truncate_at = r.truncate_at;
            res.suffix = std::move(r.suffix);
            res.erase_at = std::move(completer.erase_at);
            break;
        case VALUE_UNAVAILABLE:
            res.type = PJSON_COMPLETION_UNAVAILABLE;
            break;
        case VALUE_DEPTH_EXCEEDED:
            LOG_DBG("%s: nesting exceeds max depth %d\n", __func__, effective.max_depth);
            res.type = PJSON_COMPLETION_DEPTH_EXCEEDED;
            break;
    }
    return res;
}

const char * pjson_completion_type_name(pjson_completion_type type) {
    switch (type) {
        case PJSON_COMPLETION_ALREADY_VALID:  return "already-valid";
        case PJSON_COMPLETION_APPEND:         return "append";
        case PJSON_COMPLETION_UNAVAILABLE:    return "unavailable";
        case PJSON_COMPLETION_DEPTH_EXCEEDED: return "depth-exceeded";
    }
    return "unknown";
}

const char * pjson_completion_policy_name(pjson_completion_policy policy) {
    switch (policy) {
        case PJSON_COMPLETION_POLICY_CONSERVATIVE: return "conservative";
        case PJSON_COMPLETION_POLICY_REPAIR:       return "repair";
    }
    return "unknown";
}
