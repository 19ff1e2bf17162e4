// Minimal assertion helpers shared by the test executables.
#pragma once

#include "content.h"
#include "json-partial.h"

#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

inline std::ostream & operator<<(std::ostream & os, const pjson_content & content) {
    return os << content.dump();
}

inline std::ostream & operator<<(std::ostream & os, const pjson_completion & completion) {
    os << pjson_completion_type_name(completion.type);
    if (completion.type == PJSON_COMPLETION_APPEND) {
        os << " (suffix = '" << completion.suffix << "', truncate_at = " << completion.truncate_at;
        for (const auto pos : completion.erase_at) {
            os << ", erase " << pos;
        }
        os << ")";
    }
    return os;
}

template <class T>
inline std::ostream & operator<<(std::ostream & os, const std::optional<T> & value) {
    if (!value) {
        return os << "nullopt";
    }
    return os << *value;
}

template <class T>
inline std::ostream & operator<<(std::ostream & os, const std::vector<T> & values) {
    os << "[";
    for (size_t i = 0; i < values.size(); i++) {
        os << (i == 0 ? "" : ", ") << values[i];
    }
    return os << "]";
}

template <class T> inline void assert_equals(const T & expected, const T & actual, const std::string & desc = "") {
    if (!(expected == actual)) {
        std::ostringstream ss;
        ss << "Expected: " << expected << std::endl;
        ss << "Actual: " << actual << std::endl;
        ss << std::flush;
        throw std::runtime_error("Test failed" + (desc.empty() ? "" : " (" + desc + ")") + ":\n" + ss.str());
    }
}

inline void assert_equals(const char * expected, const std::string & actual, const std::string & desc = "") {
    assert_equals<std::string>(expected, actual, desc);
}

inline void assert_true(bool cond, const std::string & desc) {
    if (!cond) {
        throw std::runtime_error("Test failed: " + desc);
    }
}

// Fails unless fn throws an exception of type E.
template <class E = std::exception>
inline void assert_throws(const std::function<void()> & fn, const std::string & desc = "") {
    bool thrown = false;
    try {
        fn();
    } catch (const E &) {
        thrown = true;
    }
    if (!thrown) {
        throw std::runtime_error("Failed to throw" + (desc.empty() ? "" : " (" + desc + ")"));
    }
}
