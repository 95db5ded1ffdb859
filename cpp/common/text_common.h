// cpp/common/text_common.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Strict UTF-8 check: rejects overlong forms, surrogates and code points
// above U+10FFFF.
bool is_valid_utf8(std::string_view s);

// Longest prefix of s (at most max_bytes) that ends on a code point boundary.
size_t utf8_safe_prefix_len(std::string_view s, size_t max_bytes);

// Parse "1,2,0x2a" style lists of unsigned 16-bit values.
// Returns false on the first malformed item.
bool parse_u16_list(std::string_view s, std::vector<uint16_t>& out);
