#pragma once

#include "content.h"
#include "decode.h"

#include <initializer_list>
#include <string>
#include <vector>

struct pjson_params {
    pjson_decode_params decode;
    pjson_dump_params   dump;

    size_t      chunk_size  = 16;  // bytes per simulated delta
    bool        single_shot = false;
    std::string schema_file;
    std::string input_file;        // empty or "-": stdin

    int         verbosity      = 0;
    std::string log_file;
    bool        log_colors     = false;
    bool        log_timestamps = false;

    bool usage = false;
};

//
// CLI argument parsing
//

struct pjson_arg {
    std::vector<const char *> args;
    const char * value_hint = nullptr; // help text or example for arg value
    std::string help;

    void (*handler_void)  (pjson_params & params) = nullptr;
    void (*handler_string)(pjson_params & params, const std::string &) = nullptr;
    void (*handler_int)   (pjson_params & params, int) = nullptr;

    pjson_arg(
        const std::initializer_list<const char *> & args,
        const std::string & help,
        void (*handler)(pjson_params & params)
    ) : args(args), help(help), handler_void(handler) {}

    pjson_arg(
        const std::initializer_list<const char *> & args,
        const char * value_hint,
        const std::string & help,
        void (*handler)(pjson_params & params, const std::string &)
    ) : args(args), value_hint(value_hint), help(help), handler_string(handler) {}

    pjson_arg(
        const std::initializer_list<const char *> & args,
        const char * value_hint,
        const std::string & help,
        void (*handler)(pjson_params & params, int)
    ) : args(args), value_hint(value_hint), help(help), handler_int(handler) {}

    std::string to_string() const;
};

std::vector<pjson_arg> pjson_params_options();

// Parses argv into params. Prints usage and returns false on an unknown or malformed argument.
bool pjson_params_parse(int argc, char ** argv, pjson_params & params);

void pjson_params_print_usage(const char * program, const std::vector<pjson_arg> & options);
