#include "common.h"

#include <cctype>
#include <climits>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

void pjson_abort(const char * file, int line, const char * fmt, ...) {
    fflush(stdout);

    fprintf(stderr, "%s:%d: ", file, line);

    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);

    fprintf(stderr, "\n");

    abort();
}

//
// String utils
//

std::string string_format(const char * fmt, ...) {
    va_list ap;
    va_list ap2;
    va_start(ap, fmt);
    va_copy(ap2, ap);
    int size = vsnprintf(NULL, 0, fmt, ap);
    PJSON_ASSERT(size >= 0 && size < INT_MAX); // NOLINT
    std::vector<char> buf(size + 1);
    int size2 = vsnprintf(buf.data(), size + 1, fmt, ap2);
    PJSON_ASSERT(size2 == size);
    va_end(ap2);
    va_end(ap);
    return std::string(buf.data(), size);
}

std::string string_strip(const std::string & str) {
    size_t start = 0;
    size_t end = str.size();
    while (start < end && std::isspace(static_cast<unsigned char>(str[start]))) {
        start++;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        end--;
    }
    return str.substr(start, end - start);
}

std::string string_join(const std::vector<std::string> & values, const std::string & separator) {
    std::ostringstream result;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            result << separator;
        }
        result << values[i];
    }
    return result.str();
}

std::vector<std::string> string_split(const std::string & str, const std::string & delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end = str.find(delimiter);

    while (end != std::string::npos) {
        parts.push_back(str.substr(start, end - start));
        start = end + delimiter.length();
        end = str.find(delimiter, start);
    }

    parts.push_back(str.substr(start));

    return parts;
}

std::string string_abbrev(const std::string & str, size_t max_len) {
    std::string out;
    for (size_t i = 0; i < str.size() && i < max_len; ++i) {
        const char c = str[i];
        switch (c) {
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:   out += c;     break;
        }
    }
    if (str.size() > max_len) {
        out += "...";
    }
    return out;
}

//
// UTF-8 utils
//

size_t validate_utf8(const char * begin, const char * end) {
    const size_t len = end - begin;
    const unsigned char * bytes = reinterpret_cast<const unsigned char *>(begin);

    // Check the final bytes for an incomplete sequence
    for (size_t i = 1; i <= 4 && i <= len; ++i) {
        unsigned char c = bytes[len - i];
        // Check for start of a multi-byte sequence from the end
        if ((c & 0xE0) == 0xC0) {
            // 2-byte sequence start
            if (i < 2) return len - i;
        } else if ((c & 0xF0) == 0xE0) {
            // 3-byte sequence start
            if (i < 3) return len - i;
        } else if ((c & 0xF8) == 0xF0) {
            // 4-byte sequence start
            if (i < 4) return len - i;
        }
        if ((c & 0xC0) != 0x80) {
            // not a continuation byte: either ASCII or the start we already checked
            break;
        }
    }

    // If no incomplete sequence was found, return the original length
    return len;
}

size_t validate_utf8(const std::string & text) {
    return validate_utf8(text.data(), text.data() + text.size());
}

//
// Filesystem utils
//

std::string fs_read_file(const std::string & path) {
    std::ifstream fs(path, std::ios_base::binary);
    if (!fs) {
        throw std::runtime_error("failed to open file: " + path);
    }
    std::ostringstream ss;
    ss << fs.rdbuf();
    return ss.str();
}
