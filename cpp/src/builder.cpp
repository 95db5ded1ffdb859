// cpp/src/builder.cpp
#include "kvdict/builder.h"
#include "kvdict/errors.h"
#include "kvdict/format.h"
#include "kvdict/phrase.h"
#include "kvdict/sqlite_store.h"
#include "kvdict/syllable.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <limits>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <simdjson.h>

#include "text_common.h"

namespace fs = std::filesystem;

namespace kvdict {

namespace {

struct ParsedLine {
    std::string key;
    Phrase phrase;
};

enum class LineStatus { Ok, Bad, TooLong, Truncated };

static LineStatus parse_line(simdjson::dom::parser& parser,
                             const std::string& line,
                             bool truncate_long,
                             ParsedLine& out) {
    simdjson::dom::element doc;
    if (parser.parse(line).get(doc)) return LineStatus::Bad;

    simdjson::dom::array syl_arr;
    if (doc["syllables"].get(syl_arr)) return LineStatus::Bad;

    std::vector<Syllable> syllables;
    for (simdjson::dom::element v : syl_arr) {
        uint64_t code = 0;
        if (v.get(code) || code > 0xFFFF) return LineStatus::Bad;
        auto s = syllable_from_u16((uint16_t)code);
        if (!s || s->empty()) return LineStatus::Bad;
        syllables.push_back(*s);
    }
    if (syllables.empty()) return LineStatus::Bad;

    std::string_view text;
    if (doc["phrase"].get(text) || text.empty()) return LineStatus::Bad;
    if (!is_valid_utf8(text)) return LineStatus::Bad;

    uint64_t freq = 0;
    if (doc["freq"].get(freq) || freq > std::numeric_limits<uint32_t>::max()) return LineStatus::Bad;

    uint64_t last_used = 0;
    simdjson::dom::element lu;
    if (!doc.at_key("last_used").get(lu)) {
        if (lu.get(last_used)) return LineStatus::Bad;
    }

    LineStatus status = LineStatus::Ok;
    if (text.size() > RECORD_MAX_TEXT_BYTES) {
        if (!truncate_long) return LineStatus::TooLong;
        text = text.substr(0, utf8_safe_prefix_len(text, RECORD_MAX_TEXT_BYTES));
        status = LineStatus::Truncated;
    }

    out.key = syllables_to_bytes(syllables);
    out.phrase = Phrase{std::string(text), (uint32_t)freq, last_used};
    return status;
}

} // namespace

BuildStats build_store_jsonl(const fs::path& corpus_jsonl,
                             const fs::path& out_db,
                             const BuildOptions& opt) {
    BuildStats st;
    st.db_path = out_db;
    st.built_at_utc = utc_now_compact();

    if (opt.fail_if_exists && fs::exists(out_db)) {
        throw KvDictException("store already exists: " + out_db.string());
    }

    std::ifstream in(corpus_jsonl, std::ios::binary);
    if (!in) throw KvDictException("cannot open corpus: " + corpus_jsonl.string());

    simdjson::dom::parser parser;
    std::vector<ParsedLine> parsed;

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        ++st.lines;

        ParsedLine pl;
        switch (parse_line(parser, line, opt.truncate_long_phrases, pl)) {
            case LineStatus::Bad:
                ++st.bad_lines;
                continue;
            case LineStatus::TooLong:
                ++st.too_long;
                continue;
            case LineStatus::Truncated:
                ++st.truncated;
                break;
            case LineStatus::Ok:
                break;
        }
        parsed.push_back(std::move(pl));
    }
    if (in.bad()) throw KvDictException("read failed: " + corpus_jsonl.string());

    std::stable_sort(parsed.begin(), parsed.end(), [](const ParsedLine& a, const ParsedLine& b) {
        if (a.key != b.key) return a.key < b.key;
        return a.phrase.text < b.phrase.text;
    });

    std::vector<StoreRow> rows;
    rows.reserve(parsed.size());
    const ParsedLine* prev = nullptr;
    for (const auto& pl : parsed) {
        if (prev && prev->key == pl.key && prev->phrase.text == pl.phrase.text) {
            ++st.duplicates;
            if (rank_less(prev->phrase, pl.phrase)) {
                rows.back().record = encode_phrase_record(pl.phrase);
                prev = &pl;
            }
            continue;
        }
        rows.push_back(StoreRow{pl.key, pl.phrase.text, encode_phrase_record(pl.phrase)});
        prev = &pl;
    }
    st.phrases = rows.size();

    nlohmann::json info;
    info["name"] = opt.name;
    info["version"] = opt.version;
    info["copyright"] = opt.copyright;
    info["license"] = opt.license;
    info["software"] = "kvdict";
    info["built_at_utc"] = st.built_at_utc;

    write_sqlite_store(out_db, info.dump(), rows);

    if (st.bad_lines || st.too_long || st.duplicates) {
        std::cerr << "[kvdict] build " << out_db.string()
                  << ": bad_lines=" << st.bad_lines
                  << " too_long=" << st.too_long
                  << " duplicates=" << st.duplicates << "\n";
    }
    return st;
}

} // namespace kvdict
