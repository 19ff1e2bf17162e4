// Various helper functions and utilities

#pragma once

#include <string>
#include <vector>

#ifdef __GNUC__
#    if defined(__MINGW32__) && !defined(__clang__)
#        define PJSON_ATTRIBUTE_FORMAT(...) __attribute__((format(gnu_printf, __VA_ARGS__)))
#    else
#        define PJSON_ATTRIBUTE_FORMAT(...) __attribute__((format(printf, __VA_ARGS__)))
#    endif
#else
#    define PJSON_ATTRIBUTE_FORMAT(...)
#endif

#ifdef __GNUC__
#    define PJSON_NORETURN __attribute__((noreturn))
#elif defined(_MSC_VER)
#    define PJSON_NORETURN __declspec(noreturn)
#else
#    define PJSON_NORETURN
#endif

PJSON_NORETURN PJSON_ATTRIBUTE_FORMAT(3, 4)
void pjson_abort(const char * file, int line, const char * fmt, ...);

#define PJSON_ABORT(...) pjson_abort(__FILE__, __LINE__, __VA_ARGS__)
#define PJSON_ASSERT(x) if (!(x)) PJSON_ABORT("PJSON_ASSERT(%s) failed", #x)

//
// String utils
//

PJSON_ATTRIBUTE_FORMAT(1, 2)
std::string string_format(const char * fmt, ...);

std::string string_strip(const std::string & str);
std::string string_join(const std::vector<std::string> & values, const std::string & separator);
std::vector<std::string> string_split(const std::string & str, const std::string & delimiter);

inline bool string_starts_with(const std::string & str, const std::string & prefix) {
    return str.rfind(prefix, 0) == 0;
}

inline bool string_ends_with(const std::string & str, const std::string & suffix) {
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Shortens a string for log output, escaping control characters.
std::string string_abbrev(const std::string & str, size_t max_len = 64);

//
// UTF-8 utils
//

// Length in bytes of the longest prefix of `text` that does not end inside a
// multi-byte UTF-8 sequence. Bytes before that point are not validated.
size_t validate_utf8(const std::string & text);

// Same as above, for the byte range [begin, end) of a larger buffer.
size_t validate_utf8(const char * begin, const char * end);

//
// Filesystem utils
//

std::string fs_read_file(const std::string & path);
