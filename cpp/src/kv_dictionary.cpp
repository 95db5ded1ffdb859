// cpp/src/kv_dictionary.cpp
#include "kvdict/kv_dictionary.h"
#include "kvdict/errors.h"
#include "kvdict/format.h"
#include "kvdict/result.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <unordered_map>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace kvdict {

static bool env_bool(const char* key, bool defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    if (std::strcmp(s, "1") == 0) return true;
    if (std::strcmp(s, "0") == 0) return false;
    if (std::strcmp(s, "true") == 0 || std::strcmp(s, "TRUE") == 0) return true;
    if (std::strcmp(s, "false") == 0 || std::strcmp(s, "FALSE") == 0) return false;
    return defv;
}

DictionaryOptions options_from_env() {
    DictionaryOptions opt;
    opt.check_store_order = env_bool("KVDICT_CHECK_STORE_ORDER", opt.check_store_order);
    return opt;
}

static Phrase overlay_phrase(const PhraseKey& key, const OverlayValue& v) {
    return Phrase{key.second, v.freq, v.last_used};
}

// <0, 0, >0 by (key bytes, text)
static int compare_keys(const std::string& ka, const std::string& ta,
                        const std::string& kb, const std::string& tb) {
    const int c = ka.compare(kb);
    if (c != 0) return c;
    return ta.compare(tb);
}

KvDictionary::KvDictionary(std::unique_ptr<KvStore> store, DictionaryOptions opt)
    : store_(std::move(store)), opt_(opt) {}

KvDictionary KvDictionary::new_in_memory(DictionaryOptions opt) {
    return KvDictionary(nullptr, opt);
}

KvDictionary KvDictionary::from_raw_parts(std::unique_ptr<KvStore> store, KvDictionary&& other) {
    KvDictionary d(std::move(store), other.opt_);
    d.overlay_ = std::move(other.overlay_);
    d.tombstones_ = std::move(other.tombstones_);
    return d;
}

std::unique_ptr<KvStore> KvDictionary::take() {
    return std::move(store_);
}

void KvDictionary::set(std::unique_ptr<KvStore> store) {
    store_ = std::move(store);
}

bool KvDictionary::is_tombstoned(const std::string& syllable_key, const std::string& text) const {
    return tombstones_.count(PhraseKey{syllable_key, text}) != 0;
}

std::vector<Phrase> KvDictionary::entries_for(std::string_view syllable_key) const {
    const std::string key(syllable_key);
    std::vector<Phrase> out;

    if (store_) {
        for (const auto& bytes : store_->find(key)) {
            auto ph = decode_phrase_record(bytes);
            if (!ph) continue;
            if (is_tombstoned(key, ph->text)) continue;
            out.push_back(std::move(*ph));
        }
    }

    for (auto it = overlay_.lower_bound(PhraseKey{key, std::string()});
         it != overlay_.end() && it->first.first == key; ++it) {
        if (is_tombstoned(key, it->first.second)) continue;
        out.push_back(overlay_phrase(it->first, it->second));
    }
    return out;
}

std::vector<RawEntry> KvDictionary::store_entries() const {
    std::vector<RawEntry> out;
    if (!store_) return out;

    auto cur = store_->iter();
    std::string key;
    std::string value;
    bool sorted = true;
    while (cur->next(key, value)) {
        if (key == INFO_KEY) continue;
        auto ph = decode_phrase_record(value);
        if (!ph) continue;

        if (opt_.check_store_order && sorted && !out.empty()) {
            const auto& prev = out.back();
            if (compare_keys(prev.first, prev.second.text, key, ph->text) >= 0) sorted = false;
        }
        out.emplace_back(key, std::move(*ph));
    }

    if (!sorted) {
        std::cerr << "[kvdict] backing store iteration is not strictly ascending; sorting "
                  << out.size() << " entries in memory\n";

        std::stable_sort(out.begin(), out.end(), [](const RawEntry& a, const RawEntry& b) {
            return compare_keys(a.first, a.second.text, b.first, b.second.text) < 0;
        });

        // collapse repeated keys to the higher ranked variant
        std::vector<RawEntry> uniq;
        uniq.reserve(out.size());
        for (auto& e : out) {
            if (!uniq.empty() && uniq.back().first == e.first && uniq.back().second.text == e.second.text) {
                if (rank_less(uniq.back().second, e.second)) uniq.back() = std::move(e);
                continue;
            }
            uniq.push_back(std::move(e));
        }
        out = std::move(uniq);
    }
    return out;
}

std::vector<RawEntry> KvDictionary::entries_raw() const {
    const std::vector<RawEntry> store = store_entries();

    std::vector<RawEntry> merged;
    merged.reserve(store.size() + overlay_.size());

    auto emit = [&](const std::string& key, const Phrase& ph) {
        if (is_tombstoned(key, ph.text)) return;
        merged.emplace_back(key, ph);
    };

    auto a = store.begin();
    auto b = overlay_.begin();
    while (a != store.end() || b != overlay_.end()) {
        if (a == store.end()) {
            emit(b->first.first, overlay_phrase(b->first, b->second));
            ++b;
            continue;
        }
        if (b == overlay_.end()) {
            emit(a->first, a->second);
            ++a;
            continue;
        }

        const int c = compare_keys(a->first, a->second.text, b->first.first, b->first.second);
        if (c < 0) {
            emit(a->first, a->second);
            ++a;
        } else if (c > 0) {
            emit(b->first.first, overlay_phrase(b->first, b->second));
            ++b;
        } else {
            // overlay wins unless the store variant is strictly more frequent
            if (a->second.freq <= b->second.freq) {
                emit(b->first.first, overlay_phrase(b->first, b->second));
            } else {
                emit(a->first, a->second);
            }
            ++a;
            ++b;
        }
    }
    return merged;
}

std::vector<Phrase> KvDictionary::lookup_first_n_phrases(const std::vector<Syllable>& syllables,
                                                         size_t first) const {
    const std::string key = syllables_to_bytes(syllables);

    std::unordered_map<std::string, size_t> seen;
    std::vector<Phrase> phrases;

    for (auto& ph : entries_for(key)) {
        auto it = seen.find(ph.text);
        if (it != seen.end()) {
            Phrase& kept = phrases[it->second];
            if (rank_less(kept, ph)) kept = std::move(ph);
            continue;
        }
        seen.emplace(ph.text, phrases.size());
        phrases.push_back(std::move(ph));
    }

    if (phrases.size() > first) phrases.resize(first);
    return phrases;
}

std::vector<DictEntry> KvDictionary::entries() const {
    std::vector<DictEntry> out;
    for (auto& e : entries_raw()) {
        out.emplace_back(syllables_from_bytes(e.first), std::move(e.second));
    }
    return out;
}

DictionaryInfo KvDictionary::about() const {
    DictionaryInfo info;
    if (!store_) return info;

    const auto values = store_->find(INFO_KEY);
    if (values.empty()) return info;

    try {
        info = info_from_json(json::parse(values.front()));
    } catch (const json::exception& e) {
        std::cerr << "[kvdict] ignoring unreadable INFO metadata: " << e.what() << "\n";
    }
    return info;
}

void KvDictionary::add_phrase(const std::vector<Syllable>& syllables, const Phrase& phrase) {
    std::string key = syllables_to_bytes(syllables);

    for (const auto& ph : entries_for(key)) {
        if (ph.text == phrase.text) {
            throw DictionaryUpdateError("duplicate phrase: " + phrase.text);
        }
    }

    // a re-added phrase must be visible again
    tombstones_.erase(PhraseKey{key, phrase.text});
    overlay_[PhraseKey{std::move(key), phrase.text}] =
        OverlayValue{phrase.freq, phrase.last_used.value_or(0)};
}

void KvDictionary::update_phrase(const std::vector<Syllable>& syllables, const Phrase& phrase,
                                 uint32_t user_freq, uint64_t time) {
    overlay_[PhraseKey{syllables_to_bytes(syllables), phrase.text}] = OverlayValue{user_freq, time};
}

void KvDictionary::remove_phrase(const std::vector<Syllable>& syllables, const std::string& phrase_text) {
    PhraseKey key{syllables_to_bytes(syllables), phrase_text};
    overlay_.erase(key);
    tombstones_.insert(std::move(key));
}

} // namespace kvdict
