// cpp/src/validator.cpp
#include "kvdict/validator.h"
#include "kvdict/errors.h"
#include "kvdict/format.h"
#include "kvdict/sqlite_store.h"

#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>

namespace kvdict {

static std::string hex_bytes(const std::string& s) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(s.size() * 2);
    for (unsigned char c : s) {
        out.push_back(hex[(c >> 4) & 0xF]);
        out.push_back(hex[c & 0xF]);
    }
    return out;
}

// Stop reporting after this many errors; counters keep going.
static constexpr size_t MAX_REPORTED_ERRORS = 20;

static void report(ValidationResult& vr, const std::string& msg) {
    if (vr.errors.size() < MAX_REPORTED_ERRORS) vr.errors.push_back(msg);
}

ValidationResult validate_store(const KvStore& store, bool check_sorted) {
    ValidationResult vr;

    std::optional<std::pair<std::string, std::string>> prev;
    std::string key;
    std::string value;

    auto cur = store.iter();
    while (cur->next(key, value)) {
        if (key == INFO_KEY) {
            vr.has_info = true;
            auto j = nlohmann::json::parse(value, nullptr, false);
            if (j.is_discarded() || !j.is_object()) report(vr, "INFO is not a JSON object");
            continue;
        }

        auto ph = decode_phrase_record(value);
        if (!ph) {
            ++vr.invalid_records;
            report(vr, "invalid record under key " + hex_bytes(key));
            continue;
        }
        ++vr.entries;

        if (check_sorted && prev) {
            const int c = prev->first != key ? prev->first.compare(key) : prev->second.compare(ph->text);
            if (c == 0) {
                report(vr, "duplicate entry " + hex_bytes(key) + " '" + ph->text + "'");
            } else if (c > 0) {
                std::ostringstream oss;
                oss << "out of order: " << hex_bytes(prev->first) << " '" << prev->second
                    << "' before " << hex_bytes(key) << " '" << ph->text << "'";
                report(vr, oss.str());
            }
        }
        prev = std::make_pair(key, ph->text);
    }

    if (vr.invalid_records > 0 && vr.errors.size() >= MAX_REPORTED_ERRORS) {
        vr.errors.push_back(std::to_string(vr.invalid_records) + " invalid records in total");
    }

    vr.ok = vr.errors.empty();
    return vr;
}

ValidationResult validate_store_file(const std::filesystem::path& db_path) {
    try {
        SqliteKvStore store(db_path);
        return validate_store(store, true);
    } catch (const KvDictException& e) {
        ValidationResult vr;
        vr.errors.push_back(e.what());
        vr.ok = false;
        return vr;
    }
}

} // namespace kvdict
