// cpp/src/format.cpp
#include "kvdict/format.h"
#include "kvdict/errors.h"
#include "text_common.h"

#include <chrono>
#include <ctime>
#include <iostream>

namespace kvdict {

static uint32_t load_u32_le(const unsigned char* p) {
    return (uint32_t)p[0]
         | ((uint32_t)p[1] << 8)
         | ((uint32_t)p[2] << 16)
         | ((uint32_t)p[3] << 24);
}

static uint64_t load_u64_le(const unsigned char* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) v = (v << 8) | (uint64_t)p[i];
    return v;
}

static void store_le(std::string& out, uint64_t v, int n_bytes) {
    for (int i = 0; i < n_bytes; ++i) {
        out.push_back((char)(unsigned char)((v >> (8 * i)) & 0xFF));
    }
}

std::optional<Phrase> decode_phrase_record(std::string_view bytes) {
    if (bytes.size() < RECORD_PREFIX_BYTES) return std::nullopt;

    const auto* p = reinterpret_cast<const unsigned char*>(bytes.data());
    const size_t text_len = p[12];
    if (RECORD_PREFIX_BYTES + text_len > bytes.size()) return std::nullopt;

    std::string_view text = bytes.substr(RECORD_PREFIX_BYTES, text_len);
    if (!is_valid_utf8(text)) return std::nullopt;

    Phrase ph;
    ph.text.assign(text.data(), text.size());
    ph.freq = load_u32_le(p);
    ph.last_used = load_u64_le(p + 4);
    return ph;
}

std::string encode_phrase_record(const Phrase& phrase) {
    if (phrase.text.size() > RECORD_MAX_TEXT_BYTES) {
        throw KvDictException("phrase too long for record: " + std::to_string(phrase.text.size()) + " bytes");
    }
    std::string out;
    out.reserve(RECORD_PREFIX_BYTES + phrase.text.size());
    store_le(out, phrase.freq, 4);
    store_le(out, phrase.last_used.value_or(0), 8);
    out.push_back((char)(unsigned char)phrase.text.size());
    out.append(phrase.text);
    return out;
}

std::string utc_now_compact() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif
    char buf[32];
    const size_t n = std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &utc);
    return std::string(buf, n);
}

// rename() replaces the target in one step on POSIX; the remove-then-rename
// fallback covers platforms that refuse to rename over an existing file.
bool atomic_replace_file_best_effort(const std::filesystem::path& tmp,
                                     const std::filesystem::path& fin) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (fin.has_parent_path()) fs::create_directories(fin.parent_path(), ec);

    ec.clear();
    fs::rename(tmp, fin, ec);
    if (ec && fs::exists(fin)) {
        std::error_code rm_ec;
        fs::remove(fin, rm_ec);
        ec.clear();
        fs::rename(tmp, fin, ec);
    }
    if (ec) {
        std::cerr << "[kvdict] cannot replace " << fin.string()
                  << " with " << tmp.string() << ": " << ec.message() << "\n";
        return false;
    }
    return true;
}

} // namespace kvdict
