#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kvdict {

// Packed phonetic syllable:
//   bits 9..13 initial (0..21), 7..8 medial (0..3), 3..6 rime (0..13), 0..2 tone (0..5)
// Code 0 is the empty syllable.
struct Syllable {
    uint16_t code{0};

    uint8_t initial() const { return (uint8_t)((code >> 9) & 0x1F); }
    uint8_t medial() const { return (uint8_t)((code >> 7) & 0x03); }
    uint8_t rime() const { return (uint8_t)((code >> 3) & 0x0F); }
    uint8_t tone() const { return (uint8_t)(code & 0x07); }
    bool empty() const { return code == 0; }
};

inline bool operator==(Syllable a, Syllable b) { return a.code == b.code; }
inline bool operator!=(Syllable a, Syllable b) { return a.code != b.code; }

constexpr uint8_t SYLLABLE_MAX_INITIAL = 21;
constexpr uint8_t SYLLABLE_MAX_MEDIAL = 3;
constexpr uint8_t SYLLABLE_MAX_RIME = 13;
constexpr uint8_t SYLLABLE_MAX_TONE = 5;

// Empty when any component is out of range.
std::optional<Syllable> syllable_from_u16(uint16_t code);
std::optional<Syllable> make_syllable(uint8_t initial, uint8_t medial, uint8_t rime, uint8_t tone);

// Syllable key: each code as 2 bytes little-endian.
std::string syllables_to_bytes(const std::vector<Syllable>& syllables);

// Invalid codes decode to the empty syllable; a trailing odd byte is ignored.
std::vector<Syllable> syllables_from_bytes(std::string_view bytes);

} // namespace kvdict
