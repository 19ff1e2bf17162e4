#include "arg.h"
#include "common.h"
#include "content.h"
#include "decode.h"
#include "log.h"
#include "schema.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::ordered_json;

static std::string read_input(const pjson_params & params) {
    if (params.input_file.empty() || params.input_file == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    return fs_read_file(params.input_file);
}

static std::vector<std::string> split_chunks(const std::string & text, size_t chunk_size) {
    std::vector<std::string> chunks;
    for (size_t pos = 0; pos < text.size(); pos += chunk_size) {
        chunks.push_back(text.substr(pos, chunk_size));
    }
    return chunks;
}

static void print_content(const pjson_content & content, bool is_complete, const pjson_params & params) {
    LOG("%s %s\n", is_complete ? "[complete]" : "[partial] ", content.dump(params.dump).c_str());
}

static int run_single_shot(const std::string & text, const std::optional<pjson_schema> & schema, const pjson_params & params) {
    auto content = pjson_complete_then_parse(text, params.decode.completion);
    if (schema) {
        content = pjson_schema_project(*schema, content);
    }
    const bool is_complete = schema ? pjson_schema_is_complete(*schema, content) : true;
    print_content(content, is_complete, params);
    return 0;
}

static int run_stream(const std::string & text, const std::optional<pjson_schema> & schema, const pjson_params & params) {
    auto chunks = split_chunks(text, params.chunk_size);
    LOG_DBG("%s: streaming %zu bytes in %zu chunks\n", __func__, text.size(), chunks.size());

    pjson_structured_stream<pjson_content> stream(
        std::make_unique<pjson_text_source_from_deltas>(std::move(chunks)), params.decode);
    stream.on_termination([](pjson_termination reason) {
        LOG_DBG("stream terminated: %s\n", pjson_termination_name(reason));
    });

    pjson_structured_stream<pjson_content>::snapshot snap;
    std::optional<pjson_content> last;
    while (stream.next(snap)) {
        auto content = schema ? pjson_schema_project(*schema, snap.raw) : snap.raw;
        print_content(content, snap.is_complete, params);
        last = std::move(content);
    }

    if (!last) {
        throw pjson_no_content_error();
    }
    if (schema) {
        if (pjson_schema_matches(*schema, stream.collect())) {
            LOG_INF("%s: final content matches the schema\n", __func__);
        } else {
            LOG_WRN("%s: final content does not match the schema\n", __func__);
        }
    }
    LOG_INF("%s: %zu snapshots\n", __func__, stream.snapshot_count());
    return 0;
}

int main(int argc, char ** argv) {
    pjson_params params;
    if (!pjson_params_parse(argc, argv, params)) {
        return 1;
    }
    if (params.usage) {
        return 0;
    }

    pjson_log_set_verbosity_thold(params.verbosity);
    auto * log = pjson_log_main();
    if (!params.log_file.empty()) {
        pjson_log_set_file(log, params.log_file.c_str());
    }
    pjson_log_set_colors(log, params.log_colors);
    pjson_log_set_prefix(log, params.log_timestamps);
    pjson_log_set_timestamps(log, params.log_timestamps);

    try {
        std::optional<pjson_schema> schema;
        if (!params.schema_file.empty()) {
            schema = pjson_schema_from_json(json::parse(fs_read_file(params.schema_file)));
            LOG_DBG("%s: schema:\n%s\n", __func__, pjson_schema_to_json_string(*schema).c_str());
        }

        const auto text = read_input(params);
        LOG_DBG("%s: completion policy: %s\n", __func__, pjson_completion_policy_name(params.decode.completion.policy));

        if (params.single_shot) {
            return run_single_shot(text, schema, params);
        }
        return run_stream(text, schema, params);
    } catch (const std::exception & e) {
        LOG_ERR("%s: %s\n", __func__, e.what());
        return 1;
    }
}
