#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "kvdict/kv_store.h"

namespace kvdict {

// Phrase store in a SQLite file, opened read-only.
//
//   phrases(syllables BLOB, phrase TEXT, record BLOB,
//           PRIMARY KEY(syllables, phrase)) WITHOUT ROWID
//
// The INFO row (syllables = 'INFO', phrase = '') holds JSON metadata.
class SqliteKvStore final : public KvStore {
public:
    explicit SqliteKvStore(const std::filesystem::path& db_path);
    ~SqliteKvStore() override;

    SqliteKvStore(const SqliteKvStore&) = delete;
    SqliteKvStore& operator=(const SqliteKvStore&) = delete;

    std::vector<std::string> find(std::string_view key) const override;
    std::unique_ptr<KvCursor> iter() const override;

    const std::filesystem::path& path() const { return path_; }

private:
    void* db_{nullptr}; // sqlite3*
    std::filesystem::path path_;
};

struct StoreRow {
    std::string syllables; // key bytes
    std::string phrase;    // decoded text, used for ordering
    std::string record;    // encoded phrase record
};

// Writes a complete store to <db_path>.tmp in one transaction and atomically
// replaces db_path. info_json is stored under the INFO key when non-empty.
// Throws KvDictException on failure.
void write_sqlite_store(const std::filesystem::path& db_path,
                        const std::string& info_json,
                        const std::vector<StoreRow>& rows);

} // namespace kvdict
