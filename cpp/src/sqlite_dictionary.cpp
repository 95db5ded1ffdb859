// cpp/src/sqlite_dictionary.cpp
#include "kvdict/sqlite_dictionary.h"
#include "kvdict/errors.h"
#include "kvdict/format.h"
#include "kvdict/result.h"
#include "kvdict/sqlite_store.h"

namespace kvdict {

SqliteDictionary::SqliteDictionary(const std::filesystem::path& db_path, DictionaryOptions opt)
    : path_(db_path),
      opt_(opt),
      kv_(std::make_unique<SqliteKvStore>(db_path), opt) {}

std::unique_ptr<KvStore> SqliteDictionary::open_store() const {
    try {
        return std::make_unique<SqliteKvStore>(path_);
    } catch (const KvDictException& e) {
        throw DictionaryUpdateError("cannot open phrase store " + path_.string(),
                                    Error{ErrorCode::IoError, e.what()});
    }
}

std::vector<Phrase> SqliteDictionary::lookup_first_n_phrases(const std::vector<Syllable>& syllables,
                                                             size_t first) const {
    return kv_.lookup_first_n_phrases(syllables, first);
}

std::vector<DictEntry> SqliteDictionary::entries() const {
    return kv_.entries();
}

DictionaryInfo SqliteDictionary::about() const {
    return kv_.about();
}

void SqliteDictionary::reopen() {
    auto fresh = open_store();
    kv_ = KvDictionary::from_raw_parts(std::move(fresh), std::move(kv_));
}

void SqliteDictionary::flush() {
    std::vector<StoreRow> rows;
    std::string info_json;
    try {
        const auto merged = kv_.entries_raw();
        rows.reserve(merged.size());
        for (const auto& e : merged) {
            rows.push_back(StoreRow{e.first, e.second.text, encode_phrase_record(e.second)});
        }
        info_json = to_json(kv_.about()).dump();
    } catch (const KvDictException& e) {
        throw DictionaryUpdateError("flush failed: " + path_.string(),
                                    Error{ErrorCode::InvalidFormat, e.what()});
    }

    // The old handle stays detached while the file is replaced.
    auto old = kv_.take();
    try {
        write_sqlite_store(path_, info_json, rows);
    } catch (const KvDictException& e) {
        kv_.set(std::move(old));
        throw DictionaryUpdateError("flush failed: " + path_.string(),
                                    Error{ErrorCode::IoError, e.what()});
    }

    std::unique_ptr<KvStore> fresh;
    try {
        fresh = open_store();
    } catch (const DictionaryUpdateError&) {
        kv_.set(std::move(old));
        throw;
    }

    // user edits now live in the file
    kv_ = KvDictionary(std::move(fresh), opt_);
}

// The store cannot hold a record for such text, so it would block every flush.
static void require_storable(const std::string& text) {
    if (text.size() > RECORD_MAX_TEXT_BYTES) {
        throw DictionaryUpdateError("phrase too long for store",
                                    Error{ErrorCode::InvalidArgs,
                                          std::to_string(text.size()) + " bytes, max " +
                                          std::to_string(RECORD_MAX_TEXT_BYTES)});
    }
}

void SqliteDictionary::add_phrase(const std::vector<Syllable>& syllables, const Phrase& phrase) {
    require_storable(phrase.text);
    kv_.add_phrase(syllables, phrase);
}

void SqliteDictionary::update_phrase(const std::vector<Syllable>& syllables, const Phrase& phrase,
                                     uint32_t user_freq, uint64_t time) {
    require_storable(phrase.text);
    kv_.update_phrase(syllables, phrase, user_freq, time);
}

void SqliteDictionary::remove_phrase(const std::vector<Syllable>& syllables, const std::string& phrase_text) {
    kv_.remove_phrase(syllables, phrase_text);
}

} // namespace kvdict
