#include "text-buffer.h"

#include "common.h"
#include "error.h"

void pjson_text_buffer::append(const std::string & delta) {
    if (max_bytes_ > 0 && delta.size() > max_bytes_ - text_.size()) {
        throw pjson_buffer_limit_error(max_bytes_);
    }
    text_ += delta;
}

bool pjson_text_buffer::blank() const {
    return text_.find_first_not_of(" \t\n\r") == std::string::npos;
}

size_t pjson_text_buffer::complete_utf8_size() const {
    return validate_utf8(text_);
}
