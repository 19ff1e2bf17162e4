#include "decode.h"

#include "common.h"

bool pjson_text_source_from_deltas::next(std::string & delta) {
    if (cancelled_ || pos_ >= deltas_.size()) {
        return false;
    }
    delta = deltas_[pos_++];
    return true;
}

pjson_decoder::pjson_decoder(const pjson_decode_params & params)
    : params_(params),
      buffer_(params.max_buffer_bytes) {}

std::optional<pjson_decode_update> pjson_decoder::push(const std::string & delta) {
    if (finished_) {
        throw pjson_error("Cannot push to a finished decoder");
    }
    try {
        buffer_.append(delta);
        return decode(false);
    } catch (const pjson_error &) {
        finished_ = true;
        throw;
    }
}

std::optional<pjson_decode_update> pjson_decoder::finish() {
    if (finished_) {
        throw pjson_error("Decoder already finished");
    }
    finished_ = true;
    return decode(true);
}

std::optional<pjson_decode_update> pjson_decoder::decode(bool final) {
    const auto & text = buffer_.text();
    const auto & completion_params = params_.completion;

    if (buffer_.blank()) {
        return std::nullopt;
    }
    if (buffer_.complete_utf8_size() < buffer_.size()) {
        LOG_DBG("%s: text ends inside a UTF-8 character\n", __func__);
    }

    const auto completion = pjson_json_complete(text, completion_params);
    LOG_DBG("%s: completion: %s (suffix = '%s', truncate_at = %zu) for '%s'\n", __func__,
        pjson_completion_type_name(completion.type), completion.suffix.c_str(), completion.truncate_at,
        string_abbrev(text).c_str());

    pjson_decode_update update;
    switch (completion.type) {
        case PJSON_COMPLETION_UNAVAILABLE:
            if (final && !last_) {
                // nothing was ever decoded, surface the parser's diagnosis
                update.content = pjson_content_parse(text, completion_params);
                update.is_complete = true;
                break;
            }
            if (final) {
                LOG_WRN("%s: final text cannot be completed, keeping the last snapshot\n", __func__);
            }
            return std::nullopt;
        case PJSON_COMPLETION_DEPTH_EXCEEDED:
            if (final) {
                throw pjson_depth_exceeded_error(completion_params.max_depth < 1 ? 64 : completion_params.max_depth);
            }
            LOG_WRN("%s: nesting exceeds max depth %d, skipping snapshot\n", __func__, completion_params.max_depth);
            return std::nullopt;
        case PJSON_COMPLETION_ALREADY_VALID:
            update.content = pjson_content_parse(text, completion_params);
            update.is_complete = true;
            break;
        case PJSON_COMPLETION_APPEND:
            update.content = pjson_content_parse(completion.apply(text), completion_params);
            update.is_complete = false;
            break;
    }

    const bool changed = !last_ || *last_ != update.content || last_complete_ != update.is_complete;
    last_ = update.content;
    last_complete_ = update.is_complete;

    if (!changed && (final || params_.skip_unchanged)) {
        return std::nullopt;
    }
    return update;
}

const char * pjson_termination_name(pjson_termination reason) {
    switch (reason) {
        case PJSON_TERMINATION_FINISHED:  return "finished";
        case PJSON_TERMINATION_CANCELLED: return "cancelled";
        case PJSON_TERMINATION_FAILED:    return "failed";
    }
    return "unknown";
}
