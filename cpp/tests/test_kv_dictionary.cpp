#include <iostream>
#include <string>
#include <vector>

#include "kvdict/errors.h"
#include "kvdict/kv_dictionary.h"

using namespace kvdict;

static int g_failures = 0;

static void expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "FAIL: " << msg << "\n";
        ++g_failures;
    }
}

static std::vector<Syllable> zi4_dian3() {
    return {*make_syllable(19, 0, 0, 4), *make_syllable(5, 1, 9, 3)};
}

static std::vector<Syllable> ba1() {
    return {*make_syllable(1, 0, 1, 1)};
}

static std::vector<std::string> texts(const std::vector<Phrase>& phrases) {
    std::vector<std::string> out;
    for (const auto& p : phrases) out.push_back(p.text);
    return out;
}

static std::vector<std::string> entry_texts(const std::vector<DictEntry>& entries) {
    std::vector<std::string> out;
    for (const auto& e : entries) out.push_back(e.second.text);
    return out;
}

static void test_add_then_lookup() {
    auto dict = KvDictionary::new_in_memory();
    dict.add_phrase(zi4_dian3(), Phrase{"dict", 1, 2});

    auto got = dict.lookup_first_n_phrases(zi4_dian3(), 1);
    expect(got.size() == 1, "lookup after add returns one phrase");
    expect(!got.empty() && got[0] == Phrase{"dict", 1, 2}, "phrase round-trips unchanged");

    expect(dict.lookup_first_n_phrases(ba1(), 10).empty(), "other syllables see nothing");
}

static void test_null_store_behaves_like_memory() {
    KvDictionary dict(std::make_unique<NullKvStore>());
    dict.add_phrase(zi4_dian3(), Phrase{"dict", 1, 2});
    auto got = dict.lookup_first_n_phrases(zi4_dian3(), 1);
    expect(got.size() == 1 && got[0] == Phrase{"dict", 1, 2}, "null store lookup");
    expect(dict.about().name.empty(), "null store has no metadata");
}

static void test_add_missing_last_used_defaults_to_zero() {
    auto dict = KvDictionary::new_in_memory();
    dict.add_phrase(ba1(), Phrase{"八", 5, std::nullopt});
    auto got = dict.lookup_first_n_phrases(ba1(), 1);
    expect(got.size() == 1 && got[0].last_used == 0u, "absent last_used stored as 0");
}

static void test_duplicate_rejected() {
    auto dict = KvDictionary::new_in_memory();
    dict.add_phrase(zi4_dian3(), Phrase{"dict", 1, 2});

    bool threw = false;
    try {
        dict.add_phrase(zi4_dian3(), Phrase{"dict", 9, 9});
    } catch (const DictionaryUpdateError& e) {
        threw = true;
        expect(!e.cause().has_value(), "duplicate error carries no cause");
    }
    expect(threw, "second add of the same phrase throws");

    auto got = dict.lookup_first_n_phrases(zi4_dian3(), 10);
    expect(got.size() == 1 && got[0].freq == 1, "duplicate add left the original entry alone");
    expect(dict.entries().size() == 1, "entries still has one phrase");
}

static void test_add_remove_scenario() {
    auto dict = KvDictionary::new_in_memory();
    dict.add_phrase(zi4_dian3(), Phrase{"dict", 1, 2});
    dict.add_phrase(zi4_dian3(), Phrase{"dict2", 1, 2});
    dict.add_phrase(zi4_dian3(), Phrase{"dict3", 1, 2});

    expect(entry_texts(dict.entries()) == std::vector<std::string>{"dict", "dict2", "dict3"},
           "entries lists all three phrases in key order");

    dict.remove_phrase(zi4_dian3(), "dict3");
    auto entries = dict.entries();
    expect(entry_texts(entries) == std::vector<std::string>{"dict", "dict2"}, "dict3 removed from entries");
    expect(!entries.empty() && entries[0].first == zi4_dian3(), "entries decode syllables back");
    expect(!entries.empty() && entries[0].second == Phrase{"dict", 1, 2}, "entries keep freq/last_used");

    auto first = dict.lookup_first_n_phrases(zi4_dian3(), 1);
    expect(texts(first) == std::vector<std::string>{"dict"}, "lookup first 1 returns dict");
    expect(dict.tombstone_count() == 1, "one tombstone recorded");
    expect(dict.overlay_size() == 2, "overlay lost the removed phrase");
}

static void test_remove_unknown_is_noop_but_tombstones() {
    auto dict = KvDictionary::new_in_memory();
    dict.remove_phrase(ba1(), "nothing");
    expect(dict.tombstone_count() == 1, "remove of an unknown phrase still tombstones");
    expect(dict.entries().empty(), "no entries appear");
}

static void test_readd_after_remove() {
    auto dict = KvDictionary::new_in_memory();
    dict.add_phrase(ba1(), Phrase{"八", 3, 1});
    dict.remove_phrase(ba1(), "八");
    expect(dict.lookup_first_n_phrases(ba1(), 10).empty(), "removed phrase is gone");

    dict.add_phrase(ba1(), Phrase{"八", 4, 2});
    auto got = dict.lookup_first_n_phrases(ba1(), 10);
    expect(got.size() == 1 && got[0] == Phrase{"八", 4, 2}, "re-added phrase is visible");
    expect(!dict.is_tombstoned(syllables_to_bytes(ba1()), "八"), "re-add clears the tombstone");
    expect(dict.entries().size() == 1, "re-added phrase listed once");
}

static void test_update_after_remove_stays_hidden() {
    auto dict = KvDictionary::new_in_memory();
    dict.add_phrase(ba1(), Phrase{"八", 3, 1});
    dict.remove_phrase(ba1(), "八");
    dict.update_phrase(ba1(), Phrase{"八", 3, 1}, 10, 100);

    expect(dict.lookup_first_n_phrases(ba1(), 10).empty(), "update does not resurrect a removed phrase");
    expect(dict.entries().empty(), "entries stay empty");
    expect(dict.overlay_size() == 1, "update still stored in the overlay");
}

static void test_update_upserts() {
    auto dict = KvDictionary::new_in_memory();
    dict.update_phrase(ba1(), Phrase{"八", 0, std::nullopt}, 7, 70);
    auto got = dict.lookup_first_n_phrases(ba1(), 10);
    expect(got.size() == 1 && got[0] == Phrase{"八", 7, 70}, "update inserts a missing phrase");

    dict.update_phrase(ba1(), Phrase{"八", 7, 70}, 8, 80);
    got = dict.lookup_first_n_phrases(ba1(), 10);
    expect(got.size() == 1 && got[0] == Phrase{"八", 8, 80}, "update replaces freq and time");
}

static void test_truncation() {
    auto dict = KvDictionary::new_in_memory();
    const char* names[] = {"a", "b", "c", "d"};
    for (const char* n : names) dict.add_phrase(ba1(), Phrase{n, 1, 1});

    expect(dict.lookup_first_n_phrases(ba1(), 2).size() == 2, "truncated to 2");
    expect(dict.lookup_first_n_phrases(ba1(), 0).empty(), "first 0 returns nothing");
    expect(dict.lookup_first_n_phrases(ba1(), 10).size() == 4, "fewer than n when exhausted");
}

static void test_entries_sorted_across_keys() {
    auto dict = KvDictionary::new_in_memory();
    dict.add_phrase(zi4_dian3(), Phrase{"z", 1, 1});
    dict.add_phrase(ba1(), Phrase{"b", 1, 1});
    dict.add_phrase(ba1(), Phrase{"a", 1, 1});

    auto raw = dict.entries_raw();
    bool ascending = true;
    for (size_t i = 1; i < raw.size(); ++i) {
        const auto& p = raw[i - 1];
        const auto& c = raw[i];
        if (!(p.first < c.first || (p.first == c.first && p.second.text < c.second.text))) ascending = false;
    }
    expect(raw.size() == 3, "three entries");
    expect(ascending, "entries strictly ascending by (key, text)");
}

int main() {
    test_add_then_lookup();
    test_null_store_behaves_like_memory();
    test_add_missing_last_used_defaults_to_zero();
    test_duplicate_rejected();
    test_add_remove_scenario();
    test_remove_unknown_is_noop_but_tombstones();
    test_readd_after_remove();
    test_update_after_remove_stays_hidden();
    test_update_upserts();
    test_truncation();
    test_entries_sorted_across_keys();

    if (g_failures) {
        std::cerr << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "OK\n";
    return 0;
}
