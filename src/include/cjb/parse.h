#pragma once

#include <cjb/value.h>

#include <cstddef>
#include <string>

namespace cjb {

struct ParseOptions {
    // Reject anything but whitespace after the first value.
    bool require_null_terminated = true;
};

// Parse JSON text into an owned tree. Throws ParseError on malformed input.
// The text is handed to cJSON as a C string, so it ends at the first NUL byte.
Value parse(const std::string& text, const ParseOptions& options = ParseOptions{});

// Parse the value at the start of `text` and leave trailing text alone.
// `consumed` receives the number of bytes cJSON read.
Value parse_prefix(const std::string& text, std::size_t& consumed);

// Strip whitespace and comments from JSON text.
std::string minify(std::string text);

namespace literals {
    inline Value operator"" _cjson(const char* s, std::size_t len) {
        return parse(std::string(s, len));
    }
}

}  // namespace cjb
