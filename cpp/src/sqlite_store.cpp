// cpp/src/sqlite_store.cpp
#include "kvdict/sqlite_store.h"
#include "kvdict/errors.h"
#include "kvdict/format.h"

#include <sqlite3.h>

#include <system_error>

namespace kvdict {

static void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "sqlite error";
        sqlite3_free(err);
        throw KvDictException(msg);
    }
}

static std::string column_blob(sqlite3_stmt* st, int col) {
    const void* p = sqlite3_column_blob(st, col);
    const int n = sqlite3_column_bytes(st, col);
    if (!p || n <= 0) return std::string();
    return std::string(static_cast<const char*>(p), (size_t)n);
}

namespace {

class SqliteCursor final : public KvCursor {
public:
    explicit SqliteCursor(sqlite3* db) {
        const char* sql = "SELECT syllables, record FROM phrases ORDER BY syllables, phrase;";
        if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
            throw KvDictException(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~SqliteCursor() override {
        if (st_) sqlite3_finalize(st_);
    }

    SqliteCursor(const SqliteCursor&) = delete;
    SqliteCursor& operator=(const SqliteCursor&) = delete;

    bool next(std::string& key, std::string& value) override {
        if (!st_ || done_) return false;
        const int rc = sqlite3_step(st_);
        if (rc != SQLITE_ROW) {
            done_ = true;
            if (rc != SQLITE_DONE) {
                throw KvDictException(std::string("sqlite step failed: ") +
                                      sqlite3_errmsg(sqlite3_db_handle(st_)));
            }
            return false;
        }
        key = column_blob(st_, 0);
        value = column_blob(st_, 1);
        return true;
    }

private:
    sqlite3_stmt* st_{nullptr};
    bool done_{false};
};

} // namespace

SqliteKvStore::SqliteKvStore(const std::filesystem::path& db_path) : path_(db_path) {
    sqlite3* db = nullptr;
    const std::string p = path_.string();
    if (sqlite3_open_v2(p.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        const std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        throw KvDictException("cannot open sqlite: " + p + " (" + msg + ")");
    }
    db_ = db;

    // Probe the schema so a foreign file fails here and not in the first lookup.
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT 1 FROM phrases LIMIT 1;", -1, &st, nullptr) != SQLITE_OK) {
        const std::string msg = sqlite3_errmsg(db);
        sqlite3_close(db);
        db_ = nullptr;
        throw KvDictException("not a phrase store: " + p + " (" + msg + ")");
    }
    sqlite3_finalize(st);
}

SqliteKvStore::~SqliteKvStore() {
    if (db_) sqlite3_close((sqlite3*)db_);
}

std::vector<std::string> SqliteKvStore::find(std::string_view key) const {
    auto* db = (sqlite3*)db_;
    const char* sql = "SELECT record FROM phrases WHERE syllables = ?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw KvDictException(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
    }
    sqlite3_bind_blob(st, 1, key.data(), (int)key.size(), SQLITE_TRANSIENT);

    std::vector<std::string> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(column_blob(st, 0));
    }
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
        throw KvDictException(std::string("sqlite step failed: ") + sqlite3_errmsg(db));
    }
    return out;
}

std::unique_ptr<KvCursor> SqliteKvStore::iter() const {
    return std::make_unique<SqliteCursor>((sqlite3*)db_);
}

static void insert_row(sqlite3* db, sqlite3_stmt* st,
                       std::string_view syllables, std::string_view phrase, std::string_view record) {
    sqlite3_reset(st);
    sqlite3_clear_bindings(st);
    sqlite3_bind_blob(st, 1, syllables.data(), (int)syllables.size(), SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 2, phrase.data(), (int)phrase.size(), SQLITE_TRANSIENT);
    sqlite3_bind_blob(st, 3, record.data(), (int)record.size(), SQLITE_TRANSIENT);
    if (sqlite3_step(st) != SQLITE_DONE) {
        throw KvDictException(std::string("sqlite insert failed: ") + sqlite3_errmsg(db));
    }
}

void write_sqlite_store(const std::filesystem::path& db_path,
                        const std::string& info_json,
                        const std::vector<StoreRow>& rows) {
    std::filesystem::path tmp = db_path;
    tmp += ".tmp";

    std::error_code ec;
    if (db_path.has_parent_path()) std::filesystem::create_directories(db_path.parent_path(), ec);
    std::filesystem::remove(tmp, ec);

    sqlite3* db = nullptr;
    const std::string tmp_s = tmp.string();
    if (sqlite3_open_v2(tmp_s.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
        if (db) sqlite3_close(db);
        throw KvDictException("cannot create sqlite: " + tmp_s);
    }

    sqlite3_stmt* st = nullptr;
    try {
        exec(db, R"SQL(
          PRAGMA journal_mode=OFF;
          PRAGMA synchronous=NORMAL;

          CREATE TABLE phrases (
            syllables BLOB NOT NULL,
            phrase TEXT NOT NULL,
            record BLOB NOT NULL,
            PRIMARY KEY(syllables, phrase)
          ) WITHOUT ROWID;
        )SQL");

        exec(db, "BEGIN IMMEDIATE;");

        const char* sql = "INSERT INTO phrases(syllables, phrase, record) VALUES(?,?,?);";
        if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
            throw KvDictException(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }

        if (!info_json.empty()) insert_row(db, st, INFO_KEY, "", info_json);
        for (const auto& r : rows) insert_row(db, st, r.syllables, r.phrase, r.record);

        sqlite3_finalize(st);
        st = nullptr;
        exec(db, "COMMIT;");
    } catch (...) {
        if (st) sqlite3_finalize(st);
        sqlite3_close(db);
        std::filesystem::remove(tmp, ec);
        throw;
    }

    if (sqlite3_close(db) != SQLITE_OK) {
        throw KvDictException("sqlite close failed: " + tmp_s);
    }

    if (!atomic_replace_file_best_effort(tmp, db_path)) {
        throw KvDictException("atomic replace failed: " + db_path.string());
    }
}

} // namespace kvdict
