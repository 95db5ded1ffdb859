#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "kvdict/dictionary.h"
#include "kvdict/kv_store.h"

namespace kvdict {

struct DictionaryOptions {
    // Verify that the store's iteration is strictly ascending before merging;
    // an unsorted store is logged and sorted in memory.
    bool check_store_order{true};
};

// Applies KVDICT_CHECK_STORE_ORDER on top of the defaults.
DictionaryOptions options_from_env();

// (syllable key bytes, phrase text)
using PhraseKey = std::pair<std::string, std::string>;

struct OverlayValue {
    uint32_t freq{0};
    uint64_t last_used{0};
};

using RawEntry = std::pair<std::string, Phrase>; // key bytes, phrase

// Read-only backing store plus an in-memory overlay of user edits and a
// tombstone set of deleted keys. The store itself is never written.
//
// Not thread-safe. Results of queries are copies; nothing returned borrows
// from the dictionary.
class KvDictionary : public Dictionary {
public:
    explicit KvDictionary(std::unique_ptr<KvStore> store, DictionaryOptions opt = DictionaryOptions{});

    static KvDictionary new_in_memory(DictionaryOptions opt = DictionaryOptions{});

    // New dictionary around `store` that keeps the user edits of `other`.
    static KvDictionary from_raw_parts(std::unique_ptr<KvStore> store, KvDictionary&& other);

    KvDictionary(KvDictionary&&) = default;
    KvDictionary& operator=(KvDictionary&&) = default;

    // Detach the store handle; the dictionary then serves the overlay only.
    std::unique_ptr<KvStore> take();
    void set(std::unique_ptr<KvStore> store);
    bool has_store() const { return store_ != nullptr; }

    // Unordered, not deduplicated; tombstoned texts removed.
    std::vector<Phrase> entries_for(std::string_view syllable_key) const;

    // Merged store + overlay in ascending key order, one entry per key.
    std::vector<RawEntry> entries_raw() const;

    std::vector<Phrase> lookup_first_n_phrases(const std::vector<Syllable>& syllables,
                                               size_t first) const override;
    std::vector<DictEntry> entries() const override;
    DictionaryInfo about() const override;
    void reopen() override {}
    void flush() override {}

    void add_phrase(const std::vector<Syllable>& syllables, const Phrase& phrase) override;
    void update_phrase(const std::vector<Syllable>& syllables, const Phrase& phrase,
                       uint32_t user_freq, uint64_t time) override;
    void remove_phrase(const std::vector<Syllable>& syllables, const std::string& phrase_text) override;

    bool is_tombstoned(const std::string& syllable_key, const std::string& text) const;
    size_t overlay_size() const { return overlay_.size(); }
    size_t tombstone_count() const { return tombstones_.size(); }

private:
    std::vector<RawEntry> store_entries() const;

    std::unique_ptr<KvStore> store_;
    std::map<PhraseKey, OverlayValue> overlay_;
    std::set<PhraseKey> tombstones_;
    DictionaryOptions opt_;
};

} // namespace kvdict
