//  Tests pjson_json_complete: completion of truncated JSON in conservative and repair modes.

#include "content.h"
#include "json-partial.h"

#include "testing.h"

#include <cstdio>
#include <string>
#include <vector>

static pjson_completion_params conservative() {
    return pjson_completion_params();
}

static pjson_completion_params repair() {
    pjson_completion_params params;
    params.policy = PJSON_COMPLETION_POLICY_REPAIR;
    return params;
}

static pjson_completion_params non_finite() {
    pjson_completion_params params;
    params.non_finite = PJSON_NON_FINITE_ACCEPT;
    return params;
}

static std::string nested(int depth, const std::string & open, const std::string & inner, const std::string & close) {
    std::string res;
    for (int i = 0; i < depth; i++) {
        res += open;
    }
    res += inner;
    for (int i = 0; i < depth; i++) {
        res += close;
    }
    return res;
}

// Completes `input` and checks the completed text.
static void assert_completes(const std::string & input, const std::string & expected, const pjson_completion_params & params = {}) {
    auto completion = pjson_json_complete(input, params);
    if (!completion.ok()) {
        throw std::runtime_error("No completion for '" + input + "': " + pjson_completion_type_name(completion.type));
    }
    assert_equals(expected, completion.apply(input), "completing '" + input + "'");
}

static void assert_type(const std::string & input, pjson_completion_type expected, const pjson_completion_params & params = {}) {
    auto completion = pjson_json_complete(input, params);
    assert_equals<std::string>(pjson_completion_type_name(expected), pjson_completion_type_name(completion.type), "type for '" + input + "'");
}

static void test_scenarios() {
    printf("[%s]\n", __func__);

    assert_completes(R"({"name": "Ali)", R"({"name": "Ali"})");
    assert_completes("[1, 2,", "[1, 2]");
    assert_completes(R"({"a": tru)", R"({"a": true})");
    assert_type("", PJSON_COMPLETION_UNAVAILABLE);
    assert_completes("", "{}", repair());

    pjson_completion expected;
    expected.type = PJSON_COMPLETION_APPEND;
    expected.suffix = "\"}";
    expected.truncate_at = 13;
    assert_equals(expected, pjson_json_complete(R"({"name": "Ali)"));
}

static void test_already_valid() {
    printf("[%s]\n", __func__);

    for (const auto & input : std::vector<std::string> {
        "{}",
        "[]",
        "0",
        "-1.5e+3",
        "true",
        "null",
        R"("a\"b\\")",
        R"({"a": [1, {"b": null}], "c": "d"})",
        "{\"a\": 1}  \n",
        "[ 1 , 2 ]",
    }) {
        assert_type(input, PJSON_COMPLETION_ALREADY_VALID);
        assert_type(input, PJSON_COMPLETION_ALREADY_VALID, repair());
        assert_equals(input, pjson_json_complete(input).apply(input));
    }

    for (int depth = 1; depth <= 64; depth++) {
        assert_type(nested(depth, "[", "1", "]"), PJSON_COMPLETION_ALREADY_VALID);
        assert_type(nested(depth, "{\"k\":", "1", "}"), PJSON_COMPLETION_ALREADY_VALID);
    }
}

static void test_strings() {
    printf("[%s]\n", __func__);

    assert_completes(R"(")", R"("")");
    assert_completes(R"("abc)", R"("abc")");
    assert_completes(R"("a\"b)", R"("a\"b")");
    // dangling backslash
    assert_completes(R"({"a": "x\)", R"({"a": "x"})");
    assert_completes(R"("x\\)", R"("x\\")");
    // partial unicode escapes
    assert_completes(R"("\u)", R"("")");
    assert_completes(R"("ab\u00)", R"("ab")");
    assert_completes(R"("abé)", R"("abé")");
    // high surrogate waiting for its pair
    assert_completes(R"("ab\uD83D)", R"("ab")");
    assert_completes(R"("ab\uD83D\)", R"("ab")");
    assert_completes(R"("ab\uD83D\uDE)", R"("ab")");
    assert_completes(R"("ab😀)", R"("ab😀")");
    // truncated multi-byte characters
    assert_completes("\"caf\xC3", "\"caf\"");
    assert_completes("\"caf\xC3\xA9", "\"caf\xC3\xA9\"");
    assert_completes("\"\xF0\x9F\x98", "\"\"");
    assert_completes("{\"caf\xC3", "{\"caf\": null}");
}

static void test_numbers() {
    printf("[%s]\n", __func__);

    assert_completes("-", "-0");
    assert_completes("12", "12");
    assert_completes("1.", "1.0");
    assert_completes("1.5e", "1.5e0");
    assert_completes("1e-", "1e-0");
    assert_completes("[1.5E+", "[1.5E+0]");
    assert_completes(R"({"a": -)", R"({"a": -0})");
    assert_completes(R"({"a": 12)", R"({"a": 12})");
    assert_type("-x", PJSON_COMPLETION_UNAVAILABLE);
    assert_type("[1.x", PJSON_COMPLETION_UNAVAILABLE);
}

static void test_literals() {
    printf("[%s]\n", __func__);

    assert_completes("t", "true");
    assert_completes("[fal", "[false]");
    assert_completes(R"({"a": n)", R"({"a": null})");
    assert_type(R"({"a": tx)", PJSON_COMPLETION_UNAVAILABLE);
    assert_type("[nul1", PJSON_COMPLETION_UNAVAILABLE);
    assert_type("x", PJSON_COMPLETION_UNAVAILABLE);
}

static void test_non_finite() {
    printf("[%s]\n", __func__);

    assert_type("[NaN", PJSON_COMPLETION_UNAVAILABLE);
    assert_type(R"({"a": Infinity})", PJSON_COMPLETION_UNAVAILABLE);
    assert_type("-Inf", PJSON_COMPLETION_UNAVAILABLE);

    assert_completes("[NaN", "[NaN]", non_finite());
    assert_completes("[N", "[NaN]", non_finite());
    assert_completes("[-Inf", "[-Infinity]", non_finite());
    assert_completes(R"({"a": Infin)", R"({"a": Infinity})", non_finite());
    assert_type("[Nope]", PJSON_COMPLETION_UNAVAILABLE, non_finite());
}

static void test_containers() {
    printf("[%s]\n", __func__);

    assert_completes("[", "[]");
    assert_completes("[ ", "[ ]");
    assert_completes("{", "{}");
    assert_completes("{\n  ", "{\n  }");
    assert_completes(R"({"a")", R"({"a": null})");
    assert_completes(R"({"a" )", R"({"a": null})");
    assert_completes(R"({"a":)", R"({"a":null})");
    assert_completes(R"({"a": )", R"({"a":null})");
    assert_completes(R"({"a": 1)", R"({"a": 1})");
    assert_completes(R"({"a": 1, )", R"({"a": 1})");
    assert_completes(R"({"a": 1, "b)", R"({"a": 1, "b": null})");
    assert_completes(R"({"a": [1, {"b": "c)", R"({"a": [1, {"b": "c"}]})");
    assert_completes(R"([[1, 2], [3)", R"([[1, 2], [3]])");
    assert_completes(R"([{"a": 1}, {)", R"([{"a": 1}, {}])");
    // trailing commas before a closer
    assert_completes("[1, 2,]", "[1, 2]");
    assert_completes(R"({"a": 1,})", R"({"a": 1})");
}

static void test_repair() {
    printf("[%s]\n", __func__);

    assert_completes("  ", "{}", repair());
    assert_completes(R"({"a": 1, "b)", R"({"a": 1})", repair());
    assert_completes(R"({"a": 1, "b")", R"({"a": 1})", repair());
    assert_completes(R"({"a": 1, "b":)", R"({"a": 1})", repair());
    assert_completes(R"({"a":)", "{}", repair());
    assert_completes(R"({"a": 1, "b": "c)", R"({"a": 1, "b": "c"})", repair());
    assert_completes(R"({"a": tx)", "{}", repair());
    assert_completes("[1, tx", "[1]", repair());
    assert_completes("[1, 2,]", "[1, 2]", repair());
    assert_completes(R"({"a": [1, 2,], "b": 3)", R"({"a": [1, 2], "b": 3})", repair());
    assert_completes(R"({"a": 1,})", R"({"a": 1})", repair());
    assert_completes(R"({"a": "x\u00)", R"({"a": "x"})", repair());

    auto completion = pjson_json_complete("[1, 2,]", repair());
    assert_equals<std::string>(pjson_completion_type_name(PJSON_COMPLETION_APPEND), pjson_completion_type_name(completion.type));
    assert_equals(std::vector<size_t> {5}, completion.erase_at);
}

static void test_depth() {
    printf("[%s]\n", __func__);

    pjson_completion_params params;
    params.max_depth = 3;
    assert_type("[[[1]]]", PJSON_COMPLETION_ALREADY_VALID, params);
    assert_type("[[[[1]]]]", PJSON_COMPLETION_DEPTH_EXCEEDED, params);
    assert_completes("[[[", "[[[]]]", params);
    assert_type("[[[[", PJSON_COMPLETION_DEPTH_EXCEEDED, params);
    assert_type(R"({"a": {"b": {"c": {)", PJSON_COMPLETION_DEPTH_EXCEEDED, params);

    assert_type(nested(64, "[", "", "]"), PJSON_COMPLETION_ALREADY_VALID);
    assert_type(nested(65, "[", "", "]"), PJSON_COMPLETION_DEPTH_EXCEEDED);
    assert_completes(nested(64, "[", "", ""), nested(64, "[", "", "]"));
    assert_type(nested(65, "[", "", ""), PJSON_COMPLETION_DEPTH_EXCEEDED);
}

// Every prefix of a valid document completes to valid JSON.
static void test_prefixes_complete_to_valid_json() {
    printf("[%s]\n", __func__);

    const std::vector<std::string> documents {
        R"({"name": "Alice", "age": 30, "tags": ["a", "b"], "address": {"city": "Paris", "zip": null}})",
        R"([1, -2.5, 3e10, -4.25E-3, true, false, null, "x", [], {}])",
        R"({"escapes": "quote \" backslash \\ slash \/ tab \t unicode é 😀"})",
        "{\"utf8\": \"caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80\", \"caf\xC3\xA9\": 1}",
        R"([[[[{"deep": [[[]]]}]]]])",
        "{\n  \"pretty\" : [\n    1 ,\n    2\n  ]\n}",
        R"("just a string")",
        "-12.5e-7",
    };

    for (const auto & doc : documents) {
        for (size_t len = 1; len <= doc.size(); len++) {
            const auto prefix = doc.substr(0, len);
            for (const auto & params : {conservative(), repair()}) {
                const auto completion = pjson_json_complete(prefix, params);
                if (!completion.ok()) {
                    throw std::runtime_error(std::string("No completion for prefix '") + prefix + "' (" +
                        pjson_completion_policy_name(params.policy) + ")");
                }
                const auto completed = completion.apply(prefix);
                try {
                    pjson_content_parse(completed);
                } catch (const pjson_parse_error & e) {
                    throw std::runtime_error("Invalid completion '" + completed + "' of prefix '" + prefix + "': " + e.what());
                }
            }
        }
        assert_type(doc, PJSON_COMPLETION_ALREADY_VALID);
    }
}

static void test_apply() {
    printf("[%s]\n", __func__);

    pjson_completion unavailable;
    unavailable.type = PJSON_COMPLETION_UNAVAILABLE;
    assert_throws<std::runtime_error>([&]() { unavailable.apply("{\"a\": tx"); }, "applying an unavailable completion");

    pjson_completion append;
    append.type = PJSON_COMPLETION_APPEND;
    append.truncate_at = 4;
    append.erase_at = {2};
    assert_equals("[1]", append.apply("[1,]"));

    append.truncate_at = 3;
    append.suffix = "2]";
    append.erase_at.clear();
    assert_equals("[1,2]", append.apply("[1,]"));
}

int main() {
    test_scenarios();
    test_already_valid();
    test_strings();
    test_numbers();
    test_literals();
    test_non_finite();
    test_containers();
    test_repair();
    test_depth();
    test_prefixes_complete_to_valid_json();
    test_apply();
    std::cout << "All tests passed.\n";
    return 0;
}
