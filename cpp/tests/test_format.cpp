#undef NDEBUG
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "kvdict/errors.h"
#include "kvdict/format.h"
#include "kvdict/syllable.h"
#include "text_common.h"

using namespace kvdict;

static std::string raw_record(uint32_t freq, uint64_t last_used, uint8_t text_len, const std::string& tail) {
    std::string out;
    for (int i = 0; i < 4; ++i) out.push_back((char)((freq >> (8 * i)) & 0xFF));
    for (int i = 0; i < 8; ++i) out.push_back((char)((last_used >> (8 * i)) & 0xFF));
    out.push_back((char)text_len);
    out += tail;
    return out;
}

static void test_decode() {
    auto ph = decode_phrase_record(raw_record(7, 0x0102030405060708ull, 6, "字典"));
    assert(ph);
    assert(ph->text == "字典");
    assert(ph->freq == 7);
    assert(ph->last_used == 0x0102030405060708ull);

    // 12 bytes: prefix only, no length byte
    assert(!decode_phrase_record(raw_record(1, 2, 0, "").substr(0, 12)));

    // empty text is still a record
    auto empty = decode_phrase_record(raw_record(1, 2, 0, ""));
    assert(empty && empty->text.empty() && empty->freq == 1);

    // declared length runs past the slice
    assert(!decode_phrase_record(raw_record(1, 2, 5, "abcd")));

    // invalid UTF-8 text
    assert(!decode_phrase_record(raw_record(1, 2, 2, "\xC0\x80")));
    assert(!decode_phrase_record(raw_record(1, 2, 3, "\xED\xA0\x80")));

    // bytes after the text are ignored
    auto trailing = decode_phrase_record(raw_record(3, 4, 3, "abcXYZ"));
    assert(trailing && trailing->text == "abc");
}

static void test_encode() {
    const std::string bytes = encode_phrase_record(Phrase{"測試", 42, 99});
    assert(bytes == raw_record(42, 99, 6, "測試"));

    // absent last_used is written as 0
    auto ph = decode_phrase_record(encode_phrase_record(Phrase{"x", 1, std::nullopt}));
    assert(ph && ph->last_used == 0u);

    bool threw = false;
    try {
        encode_phrase_record(Phrase{std::string(256, 'a'), 1, 1});
    } catch (const KvDictException&) {
        threw = true;
    }
    assert(threw);
}

static void test_syllables() {
    auto z4 = make_syllable(19, 0, 0, 4);
    auto dian3 = make_syllable(5, 1, 9, 3);
    assert(z4 && dian3);
    assert(z4->code == 9732);
    assert(dian3->code == 2763);
    assert(dian3->initial() == 5 && dian3->medial() == 1 && dian3->rime() == 9 && dian3->tone() == 3);

    const std::string key = syllables_to_bytes({*z4, *dian3});
    assert(key == std::string("\x04\x26\xCB\x0A", 4));
    auto back = syllables_from_bytes(key);
    assert(back.size() == 2 && back[0] == *z4 && back[1] == *dian3);

    // out of range code decodes to the empty syllable, odd tail byte dropped
    auto odd = syllables_from_bytes(std::string("\xFF\xFF\x09\x02\x01", 5));
    assert(odd.size() == 2 && odd[0].empty() && odd[1].code == 521);

    assert(!make_syllable(22, 0, 0, 0));
    assert(!make_syllable(0, 0, 14, 0));
    assert(!syllable_from_u16(6)); // tone 6
}

static void test_text_common() {
    assert(is_valid_utf8("plain"));
    assert(is_valid_utf8("字典"));
    assert(!is_valid_utf8("\xC0\x80"));
    assert(!is_valid_utf8("\xE5\xAD"));
    assert(utf8_safe_prefix_len("字典", 4) == 3);
    assert(utf8_safe_prefix_len("ab", 10) == 2);

    std::vector<uint16_t> codes;
    assert(parse_u16_list("9732,2763", codes));
    assert(codes.size() == 2 && codes[0] == 9732 && codes[1] == 2763);
    assert(parse_u16_list("0x209", codes) && codes[0] == 521);
    assert(!parse_u16_list("1,,2", codes));
    assert(!parse_u16_list("70000", codes));
    assert(!parse_u16_list("", codes));
}

int main() {
    test_decode();
    test_encode();
    test_syllables();
    test_text_common();
    std::cout << "OK\n";
    return 0;
}
