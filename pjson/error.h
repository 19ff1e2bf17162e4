#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

class pjson_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Nesting went past pjson_completion_params::max_depth.
class pjson_depth_exceeded_error : public pjson_error {
    int max_depth_;

  public:
    explicit pjson_depth_exceeded_error(int max_depth)
        : pjson_error("JSON nesting exceeds the maximum depth of " + std::to_string(max_depth)),
          max_depth_(max_depth) {}

    int max_depth() const { return max_depth_; }
};

// Text that is not valid JSON, even after completion.
class pjson_parse_error : public pjson_error {
    size_t position_;

  public:
    pjson_parse_error(const std::string & message, size_t position)
        : pjson_error("Failed to parse JSON at position " + std::to_string(position) + ": " + message),
          position_(position) {}

    size_t position() const { return position_; }
};

// A stream finished without producing any snapshot.
class pjson_no_content_error : public pjson_error {
  public:
    pjson_no_content_error() : pjson_error("No content was produced") {}
};

class pjson_conversion_error : public pjson_error {
  public:
    using pjson_error::pjson_error;
};

class pjson_buffer_limit_error : public pjson_error {
    size_t limit_;

  public:
    explicit pjson_buffer_limit_error(size_t limit)
        : pjson_error("Accumulated text exceeds the maximum buffer size of " + std::to_string(limit) + " bytes"),
          limit_(limit) {}

    size_t limit() const { return limit_; }
};
