#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace kvdict {

struct Phrase {
    std::string text;
    uint32_t freq{0};
    std::optional<uint64_t> last_used; // empty only for synthetic values
};

inline bool operator==(const Phrase& a, const Phrase& b) {
    return a.text == b.text && a.freq == b.freq && a.last_used == b.last_used;
}

inline bool operator!=(const Phrase& a, const Phrase& b) { return !(a == b); }

// Rank order between two variants of the same phrase:
// frequency first, then last-used (absent < present).
inline bool rank_less(const Phrase& a, const Phrase& b) {
    if (a.freq != b.freq) return a.freq < b.freq;
    return a.last_used < b.last_used;
}

} // namespace kvdict
