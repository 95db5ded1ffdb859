#pragma once
#include <filesystem>

#include "kvdict/kv_dictionary.h"

namespace kvdict {

// KvDictionary over a SQLite phrase store file.
//
// reopen() swaps in a fresh handle on the same file and keeps user edits.
// flush() writes the merged dictionary into a new store file, replaces the
// old one and starts over with an empty overlay and no tombstones.
// Both throw DictionaryUpdateError with an IoError cause on failure; the
// dictionary is left serving its previous state.
// add_phrase/update_phrase refuse text longer than RECORD_MAX_TEXT_BYTES
// (InvalidArgs cause).
class SqliteDictionary : public Dictionary {
public:
    explicit SqliteDictionary(const std::filesystem::path& db_path,
                              DictionaryOptions opt = options_from_env());

    std::vector<Phrase> lookup_first_n_phrases(const std::vector<Syllable>& syllables,
                                               size_t first) const override;
    std::vector<DictEntry> entries() const override;
    DictionaryInfo about() const override;

    void reopen() override;
    void flush() override;

    void add_phrase(const std::vector<Syllable>& syllables, const Phrase& phrase) override;
    void update_phrase(const std::vector<Syllable>& syllables, const Phrase& phrase,
                       uint32_t user_freq, uint64_t time) override;
    void remove_phrase(const std::vector<Syllable>& syllables, const std::string& phrase_text) override;

    const std::filesystem::path& path() const { return path_; }
    const KvDictionary& kv() const { return kv_; }

private:
    std::unique_ptr<KvStore> open_store() const;

    std::filesystem::path path_;
    DictionaryOptions opt_;
    KvDictionary kv_;
};

} // namespace kvdict
