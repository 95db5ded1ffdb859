#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kvdict {

// Forward-only cursor over (key, value) pairs.
// A cursor must not outlive the store that created it.
class KvCursor {
public:
    virtual ~KvCursor() = default;
    virtual bool next(std::string& key, std::string& value) = 0;
};

// Read-only backing store of phrase records.
//
// find() returns every value stored under exactly `key`, in any order.
// iter() yields all pairs in strictly ascending (key bytes, decoded phrase
// text) order; it may include the reserved INFO key.
class KvStore {
public:
    virtual ~KvStore() = default;
    virtual std::vector<std::string> find(std::string_view key) const = 0;
    virtual std::unique_ptr<KvCursor> iter() const = 0;
};

class NullKvStore final : public KvStore {
public:
    std::vector<std::string> find(std::string_view key) const override;
    std::unique_ptr<KvCursor> iter() const override;
};

using KvRow = std::pair<std::string, std::string>; // key bytes, record bytes

// Whole store held in memory. Rows are sorted on construction by
// (key, decoded text); rows without a valid record sort after valid ones
// of the same key.
class MemoryKvStore final : public KvStore {
public:
    MemoryKvStore() = default;
    explicit MemoryKvStore(std::vector<KvRow> rows);

    std::vector<std::string> find(std::string_view key) const override;
    std::unique_ptr<KvCursor> iter() const override;

    size_t size() const { return rows_.size(); }

private:
    std::vector<KvRow> rows_;
};

} // namespace kvdict
