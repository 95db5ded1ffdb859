// cpp/src/kv_store.cpp
#include "kvdict/kv_store.h"
#include "kvdict/format.h"

#include <algorithm>
#include <optional>

namespace kvdict {

namespace {

class EmptyCursor final : public KvCursor {
public:
    bool next(std::string&, std::string&) override { return false; }
};

class VectorCursor final : public KvCursor {
public:
    explicit VectorCursor(const std::vector<KvRow>& rows) : rows_(rows) {}

    bool next(std::string& key, std::string& value) override {
        if (pos_ >= rows_.size()) return false;
        key = rows_[pos_].first;
        value = rows_[pos_].second;
        ++pos_;
        return true;
    }

private:
    const std::vector<KvRow>& rows_;
    size_t pos_{0};
};

struct SortKey {
    std::string_view key;
    std::optional<std::string> text;
    std::string_view raw;
};

static SortKey sort_key_of(const KvRow& r) {
    SortKey k;
    k.key = r.first;
    auto ph = decode_phrase_record(r.second);
    if (ph) k.text = std::move(ph->text);
    k.raw = r.second;
    return k;
}

static bool sort_key_less(const SortKey& a, const SortKey& b) {
    if (a.key != b.key) return a.key < b.key;
    if (a.text.has_value() != b.text.has_value()) return a.text.has_value();
    if (a.text && *a.text != *b.text) return *a.text < *b.text;
    return a.raw < b.raw;
}

} // namespace

std::vector<std::string> NullKvStore::find(std::string_view) const {
    return {};
}

std::unique_ptr<KvCursor> NullKvStore::iter() const {
    return std::make_unique<EmptyCursor>();
}

MemoryKvStore::MemoryKvStore(std::vector<KvRow> rows) : rows_(std::move(rows)) {
    std::vector<std::pair<SortKey, size_t>> keyed;
    keyed.reserve(rows_.size());
    for (size_t i = 0; i < rows_.size(); ++i) keyed.emplace_back(sort_key_of(rows_[i]), i);

    std::stable_sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
        return sort_key_less(a.first, b.first);
    });

    std::vector<KvRow> sorted;
    sorted.reserve(rows_.size());
    for (const auto& k : keyed) sorted.push_back(std::move(rows_[k.second]));
    rows_ = std::move(sorted);
}

std::vector<std::string> MemoryKvStore::find(std::string_view key) const {
    std::vector<std::string> out;
    auto it = std::lower_bound(rows_.begin(), rows_.end(), key,
                               [](const KvRow& r, std::string_view k) { return std::string_view(r.first) < k; });
    for (; it != rows_.end() && it->first == key; ++it) out.push_back(it->second);
    return out;
}

std::unique_ptr<KvCursor> MemoryKvStore::iter() const {
    return std::make_unique<VectorCursor>(rows_);
}

} // namespace kvdict
