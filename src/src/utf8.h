#pragma once

#include <string_view>

namespace cjb {
namespace detail {

// Strict UTF-8 check: no overlong forms, no surrogates, nothing past U+10FFFF.
inline bool is_valid_utf8(std::string_view s) {
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }
        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 and c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 and c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 and c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            return false;
        }
        if (i + len > n) return false;
        unsigned char second = static_cast<unsigned char>(s[i + 1]);
        if (second < lo or second > hi) return false;
        for (size_t k = 2; k < len; ++k) {
            unsigned char cont = static_cast<unsigned char>(s[i + k]);
            if ((cont & 0xC0) != 0x80) return false;
        }
        i += len;
    }
    return true;
}

}  // namespace detail
}  // namespace cjb
