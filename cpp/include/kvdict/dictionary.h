#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "kvdict/phrase.h"
#include "kvdict/syllable.h"

namespace kvdict {

struct DictionaryInfo {
    std::string name;
    std::string copyright;
    std::string license;
    std::string version;
    std::string software;
};

using DictEntry = std::pair<std::vector<Syllable>, Phrase>;

// Query and update surface consumed by the editor and admin tools.
// Mutations throw DictionaryUpdateError.
class Dictionary {
public:
    virtual ~Dictionary() = default;

    // At most `first` phrases for exactly these syllables; empty when nothing matches.
    virtual std::vector<Phrase> lookup_first_n_phrases(const std::vector<Syllable>& syllables,
                                                       size_t first) const = 0;

    // Whole merged dictionary in ascending (syllables, text) order.
    virtual std::vector<DictEntry> entries() const = 0;

    virtual DictionaryInfo about() const = 0;

    virtual void reopen() = 0;
    virtual void flush() = 0;

    virtual void add_phrase(const std::vector<Syllable>& syllables, const Phrase& phrase) = 0;
    virtual void update_phrase(const std::vector<Syllable>& syllables, const Phrase& phrase,
                               uint32_t user_freq, uint64_t time) = 0;
    virtual void remove_phrase(const std::vector<Syllable>& syllables, const std::string& phrase_text) = 0;
};

} // namespace kvdict
