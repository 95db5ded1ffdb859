// cpp/src/syllable.cpp
#include "kvdict/syllable.h"

namespace kvdict {

std::optional<Syllable> syllable_from_u16(uint16_t code) {
    if (code & 0xC000) return std::nullopt;
    Syllable s{code};
    if (s.initial() > SYLLABLE_MAX_INITIAL) return std::nullopt;
    if (s.rime() > SYLLABLE_MAX_RIME) return std::nullopt;
    if (s.tone() > SYLLABLE_MAX_TONE) return std::nullopt;
    return s;
}

std::optional<Syllable> make_syllable(uint8_t initial, uint8_t medial, uint8_t rime, uint8_t tone) {
    if (initial > SYLLABLE_MAX_INITIAL || medial > SYLLABLE_MAX_MEDIAL ||
        rime > SYLLABLE_MAX_RIME || tone > SYLLABLE_MAX_TONE) {
        return std::nullopt;
    }
    const uint16_t code = (uint16_t)((initial << 9) | (medial << 7) | (rime << 3) | tone);
    return Syllable{code};
}

std::string syllables_to_bytes(const std::vector<Syllable>& syllables) {
    std::string out;
    out.reserve(syllables.size() * 2);
    for (const auto& s : syllables) {
        out.push_back((char)(unsigned char)(s.code & 0xFF));
        out.push_back((char)(unsigned char)(s.code >> 8));
    }
    return out;
}

std::vector<Syllable> syllables_from_bytes(std::string_view bytes) {
    std::vector<Syllable> out;
    out.reserve(bytes.size() / 2);
    for (size_t i = 0; i + 1 < bytes.size(); i += 2) {
        const uint16_t v = (uint16_t)((unsigned char)bytes[i])
                         | (uint16_t)((unsigned char)bytes[i + 1] << 8);
        out.push_back(syllable_from_u16(v).value_or(Syllable{}));
    }
    return out;
}

} // namespace kvdict
