#include "arg.h"

#include "common.h"
#include "log.h"

#include <cstdio>
#include <stdexcept>
#include <unordered_map>

std::string pjson_arg::to_string() const {
    // params for printing to console
    const static int n_leading_spaces = 40;
    const static int n_char_per_line_help = 70;
    std::string leading_spaces(n_leading_spaces, ' ');

    std::string names = string_join(std::vector<std::string>(args.begin(), args.end()), ", ");
    if (value_hint) {
        names += " ";
        names += value_hint;
    }

    std::string res = names;
    if ((int) names.size() > n_leading_spaces - 2) {
        res += "\n" + leading_spaces;
    } else {
        res += std::string(n_leading_spaces - names.size(), ' ');
    }

    // wrap the help text on word boundaries
    const auto words = string_split(help, " ");
    int line_len = 0;
    for (size_t i = 0; i < words.size(); i++) {
        if (line_len > 0 && line_len + (int) words[i].size() + 1 > n_char_per_line_help) {
            res += "\n" + leading_spaces;
            line_len = 0;
        } else if (i > 0) {
            res += " ";
            line_len++;
        }
        res += words[i];
        line_len += words[i].size();
    }
    return res;
}

static int parse_positive_int(const std::string & value, const char * what) {
    size_t pos = 0;
    int res;
    try {
        res = std::stoi(value, &pos);
    } catch (const std::exception &) {
        throw std::invalid_argument(string_format("invalid %s: '%s'", what, value.c_str()));
    }
    if (pos != value.size() || res < 0) {
        throw std::invalid_argument(string_format("invalid %s: '%s'", what, value.c_str()));
    }
    return res;
}

std::vector<pjson_arg> pjson_params_options() {
    std::vector<pjson_arg> options;

    options.push_back(pjson_arg(
        {"-h", "--help", "--usage"},
        "print usage and exit",
        [](pjson_params & params) {
            params.usage = true;
        }
    ));
    options.push_back(pjson_arg(
        {"-f", "--file"}, "FNAME",
        "read the JSON text from a file instead of stdin",
        [](pjson_params & params, const std::string & value) {
            params.input_file = value;
        }
    ));
    options.push_back(pjson_arg(
        {"--schema"}, "FNAME",
        "project every snapshot through the JSON schema in this file",
        [](pjson_params & params, const std::string & value) {
            params.schema_file = value;
        }
    ));
    options.push_back(pjson_arg(
        {"--single-shot"},
        "complete and parse the whole input at once instead of streaming it",
        [](pjson_params & params) {
            params.single_shot = true;
        }
    ));
    options.push_back(pjson_arg(
        {"--chunk-size"}, "N",
        string_format("number of bytes per streamed delta (default: %zu)", pjson_params().chunk_size),
        [](pjson_params & params, int value) {
            if (value < 1) {
                throw std::invalid_argument("chunk size must be at least 1");
            }
            params.chunk_size = value;
        }
    ));
    options.push_back(pjson_arg(
        {"--max-depth"}, "N",
        string_format("maximum nesting depth of completed JSON (default: %d)", pjson_params().decode.completion.max_depth),
        [](pjson_params & params, int value) {
            if (value < 1) {
                throw std::invalid_argument("max depth must be at least 1");
            }
            params.decode.completion.max_depth = value;
        }
    ));
    options.push_back(pjson_arg(
        {"--repair"},
        "drop dangling fragments and trailing commas instead of padding them, complete empty input to {}",
        [](pjson_params & params) {
            params.decode.completion.policy = PJSON_COMPLETION_POLICY_REPAIR;
        }
    ));
    options.push_back(pjson_arg(
        {"--allow-non-finite"},
        "accept NaN, Infinity and -Infinity number literals",
        [](pjson_params & params) {
            params.decode.completion.non_finite = PJSON_NON_FINITE_ACCEPT;
        }
    ));
    options.push_back(pjson_arg(
        {"--quote-non-finite"},
        "print non-finite numbers as strings instead of null",
        [](pjson_params & params) {
            params.dump.quote_non_finite = true;
        }
    ));
    options.push_back(pjson_arg(
        {"--max-buffer"}, "N",
        string_format("maximum accumulated text size in bytes, 0 for no limit (default: %zu)", pjson_params().decode.max_buffer_bytes),
        [](pjson_params & params, int value) {
            params.decode.max_buffer_bytes = value;
        }
    ));
    options.push_back(pjson_arg(
        {"--skip-unchanged"},
        "do not print snapshots identical to the previous one",
        [](pjson_params & params) {
            params.decode.skip_unchanged = true;
        }
    ));
    options.push_back(pjson_arg(
        {"--indent"}, "N",
        "indent printed JSON by N spaces (default: compact)",
        [](pjson_params & params, int value) {
            params.dump.indent = value;
        }
    ));
    options.push_back(pjson_arg(
        {"-v", "--verbose"},
        "print debug logs",
        [](pjson_params & params) {
            params.verbosity = LOG_DEFAULT_DEBUG;
        }
    ));
    options.push_back(pjson_arg(
        {"--log-file"}, "FNAME",
        "also write logs to a file",
        [](pjson_params & params, const std::string & value) {
            params.log_file = value;
        }
    ));
    options.push_back(pjson_arg(
        {"--log-colors"},
        "enable colored logging",
        [](pjson_params & params) {
            params.log_colors = true;
        }
    ));
    options.push_back(pjson_arg(
        {"--log-timestamps"},
        "enable timestamps and level prefixes in log messages",
        [](pjson_params & params) {
            params.log_timestamps = true;
        }
    ));

    return options;
}

void pjson_params_print_usage(const char * program, const std::vector<pjson_arg> & options) {
    printf("usage: %s [options]\n\n", program);
    printf("Reads JSON text, streams it in chunks through the decoder and prints one snapshot per line.\n\n");
    printf("options:\n\n");
    for (const auto & opt : options) {
        printf("%s\n", opt.to_string().c_str());
    }
    printf("\n");
}

static void parse_args(int argc, char ** argv, pjson_params & params, const std::vector<pjson_arg> & options) {
    std::unordered_map<std::string, const pjson_arg *> arg_to_options;
    for (const auto & opt : options) {
        for (const auto & arg : opt.args) {
            arg_to_options[arg] = &opt;
        }
    }

    auto check_arg = [&](int i) {
        if (i + 1 >= argc) {
            throw std::invalid_argument("expected value for argument");
        }
    };

    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        auto it = arg_to_options.find(arg);
        if (it == arg_to_options.end()) {
            throw std::invalid_argument(string_format("error: invalid argument: %s", arg.c_str()));
        }
        const auto & opt = *it->second;
        try {
            if (opt.handler_void) {
                opt.handler_void(params);
                continue;
            }

            check_arg(i);
            const std::string val = argv[++i];
            if (opt.handler_int) {
                opt.handler_int(params, parse_positive_int(val, "number"));
                continue;
            }
            if (opt.handler_string) {
                opt.handler_string(params, val);
                continue;
            }
        } catch (const std::exception & e) {
            throw std::invalid_argument(string_format(
                "error while handling argument \"%s\": %s", arg.c_str(), e.what()));
        }
    }
}

bool pjson_params_parse(int argc, char ** argv, pjson_params & params) {
    const auto options = pjson_params_options();
    const pjson_params params_org = params;

    try {
        parse_args(argc, argv, params, options);
        if (params.usage) {
            pjson_params_print_usage(argv[0], options);
        }
    } catch (const std::invalid_argument & ex) {
        fprintf(stderr, "%s\n\n", ex.what());
        pjson_params_print_usage(argv[0], options);
        params = params_org;
        return false;
    }

    return true;
}
