// cpp/include/kvdict/builder.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace kvdict {

struct BuildOptions {
    // INFO metadata
    std::string name;
    std::string version;
    std::string copyright;
    std::string license;

    // phrases longer than a record can hold (255 bytes):
    // false => skip the line, true => cut at a UTF-8 boundary
    bool truncate_long_phrases{false};

    // refuse to overwrite an existing store file
    bool fail_if_exists{false};
};

struct BuildStats {
    std::filesystem::path db_path;
    uint64_t lines{0};
    uint64_t phrases{0};        // rows written
    uint64_t bad_lines{0};      // unparsable / missing fields / out of range
    uint64_t duplicates{0};     // same (syllables, phrase) seen again
    uint64_t truncated{0};
    uint64_t too_long{0};
    std::string built_at_utc;
};

// One JSON object per line:
//   {"syllables":[u16,...],"phrase":"...","freq":N,"last_used":T}
// Repeated (syllables, phrase) pairs keep the higher (freq, last_used).
// Throws KvDictException on I/O failure.
BuildStats build_store_jsonl(const std::filesystem::path& corpus_jsonl,
                             const std::filesystem::path& out_db,
                             const BuildOptions& opt);

} // namespace kvdict
