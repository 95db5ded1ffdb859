// cpp/common/text_common.cpp
#include "text_common.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <string>

namespace {

// Byte length of the well-formed UTF-8 sequence starting at s[i], 0 if there
// is none. Second-byte ranges follow Unicode table 3-7 (no overlongs, no
// surrogates, nothing above U+10FFFF).
size_t utf8_seq_len(std::string_view s, size_t i) {
    const size_t n = s.size() - i;
    const auto b = [&](size_t k) { return (unsigned char)s[i + k]; };

    const unsigned char lead = b(0);
    if (lead < 0x80) return 1;

    size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) lo = 0xA0;
        if (lead == 0xED) hi = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }
    if (len > n) return 0;

    if (b(1) < lo || b(1) > hi) return 0;
    for (size_t k = 2; k < len; ++k) {
        if ((b(k) & 0xC0) != 0x80) return 0;
    }
    return len;
}

} // namespace

bool is_valid_utf8(std::string_view s) {
    for (size_t i = 0; i < s.size();) {
        const size_t len = utf8_seq_len(s, i);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

size_t utf8_safe_prefix_len(std::string_view s, size_t max_bytes) {
    const size_t limit = std::min(max_bytes, s.size());
    size_t i = 0;
    while (i < limit) {
        const size_t len = utf8_seq_len(s, i);
        if (len == 0 || i + len > limit) break;
        i += len;
    }
    return i;
}

bool parse_u16_list(std::string_view s, std::vector<uint16_t>& out) {
    out.clear();
    size_t i = 0;
    while (i <= s.size()) {
        size_t j = s.find(',', i);
        if (j == std::string_view::npos) j = s.size();

        std::string item(s.substr(i, j - i));
        if (item.empty()) return false;

        char* end = nullptr;
        errno = 0;
        const unsigned long v = std::strtoul(item.c_str(), &end, 0);
        if (errno != 0 || end == item.c_str() || *end != '\0' || v > 0xFFFFul) return false;
        out.push_back((uint16_t)v);

        i = j + 1;
    }
    return !out.empty();
}
