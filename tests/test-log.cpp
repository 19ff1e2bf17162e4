//  Tests the log: verbosity gating, file output and prefixes.

#include "common.h"
#include "log.h"

#include "testing.h"

#include <cstdio>
#include <string>

static const char * LOG_PATH = "test-log.txt";

static int evaluated = 0;

static int count_evaluation() {
    return ++evaluated;
}

static std::string read_log() {
    pjson_log_set_file(pjson_log_main(), nullptr);
    return fs_read_file(LOG_PATH);
}

static void test_verbosity() {
    printf("[%s]\n", __func__);

    pjson_log_set_file(pjson_log_main(), LOG_PATH);
    pjson_log_set_verbosity_thold(0);
    LOG_DBG("debug %d\n", count_evaluation());
    LOG_WRN("warning %d\n", 1);
    assert_equals(0, evaluated, "debug arguments are not evaluated below the threshold");

    pjson_log_set_verbosity_thold(LOG_DEFAULT_DEBUG);
    LOG_DBG("debug %d\n", count_evaluation());
    assert_equals(1, evaluated);
    pjson_log_set_verbosity_thold(0);

    assert_equals("warning 1\ndebug 1\n", read_log());
}

static void test_prefix() {
    printf("[%s]\n", __func__);

    auto * log = pjson_log_main();
    pjson_log_set_file(log, LOG_PATH);
    pjson_log_set_prefix(log, true);
    LOG_ERR("%s: failed\n", __func__);
    LOG_INF("%s\n", std::string(300, 'x').c_str());
    pjson_log_set_prefix(log, false);

    const auto text = read_log();
    assert_true(string_starts_with(text, "E test_prefix: failed\n"), "error prefix: " + text);
    assert_true(text.find("I " + std::string(300, 'x') + "\n") != std::string::npos, "long message kept whole");
}

int main() {
    test_verbosity();
    test_prefix();
    std::remove(LOG_PATH);
    std::cout << "All tests passed.\n";
    return 0;
}
