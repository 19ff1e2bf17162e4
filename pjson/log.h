#pragma once

#include <cstdio>

#define LOG_CLR_TO_EOL  "\033[K\r"
#define LOG_COL_DEFAULT "\033[0m"
#define LOG_COL_BOLD    "\033[1m"
#define LOG_COL_RED     "\033[31m"
#define LOG_COL_GREEN   "\033[32m"
#define LOG_COL_YELLOW  "\033[33m"
#define LOG_COL_BLUE    "\033[34m"
#define LOG_COL_MAGENTA "\033[35m"
#define LOG_COL_CYAN    "\033[36m"
#define LOG_COL_WHITE   "\033[37m"

#ifndef __GNUC__
#    define LOG_ATTRIBUTE_FORMAT(...)
#elif defined(__MINGW32__) && !defined(__clang__)
#    define LOG_ATTRIBUTE_FORMAT(...) __attribute__((format(gnu_printf, __VA_ARGS__)))
#else
#    define LOG_ATTRIBUTE_FORMAT(...) __attribute__((format(printf, __VA_ARGS__)))
#endif

#define LOG_DEFAULT_DEBUG 1

enum pjson_log_level {
    PJSON_LOG_LEVEL_NONE  = 0,
    PJSON_LOG_LEVEL_DEBUG = 1,
    PJSON_LOG_LEVEL_INFO  = 2,
    PJSON_LOG_LEVEL_WARN  = 3,
    PJSON_LOG_LEVEL_ERROR = 4,
};

// needed by the LOG_TMPL macro to avoid computing log arguments if the verbosity lower
// set via pjson_log_set_verbosity_thold()
extern int pjson_log_verbosity_thold;

void pjson_log_set_verbosity_thold(int verbosity); // not thread-safe

// messages are formatted and written synchronously under a mutex
struct pjson_log;

struct pjson_log * pjson_log_main(); // singleton, automatically destroys itself on exit

LOG_ATTRIBUTE_FORMAT(3, 4)
void pjson_log_add(struct pjson_log * log, enum pjson_log_level level, const char * fmt, ...);

// defaults: file = NULL, colors = false, prefix = false, timestamps = false
//
// regular log output:
//
//   pjson_decoder_push: completion: append (suffix = '"}', truncate_at = 12)
//   pjson_decoder_finish: final content has 2 keys
//
// with prefix = true, timestamps = true, the log output will look like this:
//
//   0.00.035.060 D pjson_decoder_push: completion: append (suffix = '"}', truncate_at = 12)
//   0.00.035.064 I pjson_decoder_finish: final content has 2 keys
//
// I - info    (stdout, V = 0)
// W - warning (stderr, V = 0)
// E - error   (stderr, V = 0)
// D - debug   (stderr, V = LOG_DEFAULT_DEBUG)
//

void pjson_log_set_file      (struct pjson_log * log, const char * file);       // not thread-safe
void pjson_log_set_colors    (struct pjson_log * log,       bool   colors);     // not thread-safe
void pjson_log_set_prefix    (struct pjson_log * log,       bool   prefix);     // whether to output prefix to each log
void pjson_log_set_timestamps(struct pjson_log * log,       bool   timestamps); // whether to output timestamps in the prefix

// helper macros for logging
// use these to avoid computing log arguments if the verbosity of the log is higher than the threshold
//
// for example:
//
//   LOG_DBG("this is a debug message: %d\n", expensive_function());
//
// this will avoid calling expensive_function() if LOG_DEFAULT_DEBUG > pjson_log_verbosity_thold
//

#define LOG_TMPL(level, verbosity, ...) \
    do { \
        if ((verbosity) <= pjson_log_verbosity_thold) { \
            pjson_log_add(pjson_log_main(), (level), __VA_ARGS__); \
        } \
    } while (0)

#define LOG(...)     LOG_TMPL(PJSON_LOG_LEVEL_NONE,  0,                 __VA_ARGS__)

#define LOG_INF(...) LOG_TMPL(PJSON_LOG_LEVEL_INFO,  0,                 __VA_ARGS__)
#define LOG_WRN(...) LOG_TMPL(PJSON_LOG_LEVEL_WARN,  0,                 __VA_ARGS__)
#define LOG_ERR(...) LOG_TMPL(PJSON_LOG_LEVEL_ERROR, 0,                 __VA_ARGS__)
#define LOG_DBG(...) LOG_TMPL(PJSON_LOG_LEVEL_DEBUG, LOG_DEFAULT_DEBUG, __VA_ARGS__)
