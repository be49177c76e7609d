#include <cjb/parse.h>

#include <cjson/cJSON.h>

#include <cstring>
#include <sstream>
#include <utility>

namespace cjb {

namespace {
    std::pair<size_t, size_t> line_col_from_offset(const std::string& s, size_t offset) {
        size_t line = 1, col = 1;
        for (size_t pos = 0; pos < offset and pos < s.size(); ++pos) {
            if (s[pos] == '\n') {
                ++line;
                col = 1;
            } else {
                ++col;
            }
        }
        return {line, col};
    }

    // Message with the offending line and a caret under the column cJSON stopped at.
    std::string format_error(const std::string& s, size_t offset, size_t err_line, size_t err_col) {
        size_t line_start = offset < s.size() ? offset : s.size();
        while (line_start > 0 and s[line_start - 1] != '\n') --line_start;
        size_t line_end = line_start;
        while (line_end < s.size() and s[line_end] != '\n') ++line_end;
        std::string line_text = s.substr(line_start, line_end - line_start);

        size_t caret_pos = err_col > 0 ? err_col - 1 : 0;
        if (caret_pos > line_text.size()) caret_pos = line_text.size();
        std::string caret(caret_pos, ' ');
        caret.push_back('^');

        std::ostringstream ss;
        ss << "JSON parse error: ";
        if (offset >= s.size()) {
            ss << "unexpected end of input";
        } else {
            ss << "unexpected character '" << s[offset] << "'";
        }
        ss << " (line " << err_line << ", column " << err_col << ")\n";
        ss << line_text << "\n" << caret;
        return ss.str();
    }

    cJSON* parse_raw(const std::string& text, bool require_null_terminated, size_t& end_offset) {
        const char* end = nullptr;
        // Length includes the terminating NUL, which cJSON checks for when
        // require_null_terminated is set.
        cJSON* root = cJSON_ParseWithLengthOpts(text.c_str(), text.size() + 1, &end,
                                                require_null_terminated ? 1 : 0);
        if (end == nullptr) end = cJSON_GetErrorPtr();
        end_offset = end != nullptr ? static_cast<size_t>(end - text.c_str()) : 0;
        if (root == nullptr) {
            auto [line, col] = line_col_from_offset(text, end_offset);
            throw ParseError(format_error(text, end_offset, line, col), end_offset, line, col);
        }
        return root;
    }
}  // namespace

Value parse(const std::string& text, const ParseOptions& options) {
    size_t end_offset = 0;
    return Value(parse_raw(text, options.require_null_terminated, end_offset));
}

Value parse_prefix(const std::string& text, std::size_t& consumed) {
    size_t end_offset = 0;
    Value v(parse_raw(text, false, end_offset));
    consumed = end_offset;
    return v;
}

std::string minify(std::string text) {
    cJSON_Minify(text.data());
    text.resize(std::strlen(text.c_str()));
    return text;
}

}  // namespace cjb
