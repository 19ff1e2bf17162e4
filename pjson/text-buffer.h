#pragma once

#include <string>

// Append-only text accumulator for one streaming generation.
class pjson_text_buffer {
    std::string text_;
    size_t max_bytes_;

  public:
    // max_bytes = 0: no limit
    explicit pjson_text_buffer(size_t max_bytes = 0) : max_bytes_(max_bytes) {}

    // Throws pjson_buffer_limit_error, leaving the buffer unchanged, when the delta would
    // grow the text past max_bytes.
    void append(const std::string & delta);

    const std::string & text() const { return text_; }
    size_t size() const { return text_.size(); }
    bool empty() const { return text_.empty(); }
    size_t max_bytes() const { return max_bytes_; }

    // Whether the text holds nothing but JSON whitespace.
    bool blank() const;

    // Length of the prefix that does not end inside a multi-byte UTF-8 character.
    size_t complete_utf8_size() const;

    void clear() { text_.clear(); }
};
