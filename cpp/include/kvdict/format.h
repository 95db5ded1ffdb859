#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "kvdict/phrase.h"

namespace kvdict {

// Phrase record layout (store value bytes):
//   freq      u32 LE
//   last_used u64 LE
//   text_len  u8
//   text      UTF-8, text_len bytes
constexpr size_t RECORD_PREFIX_BYTES = 13;
constexpr size_t RECORD_MAX_TEXT_BYTES = 255;

// Reserved store key carrying JSON metadata.
constexpr std::string_view INFO_KEY = "INFO";

// Empty result for anything that is not a valid record; never throws.
std::optional<Phrase> decode_phrase_record(std::string_view bytes);

// Throws KvDictException when text exceeds RECORD_MAX_TEXT_BYTES.
std::string encode_phrase_record(const Phrase& phrase);

std::string utc_now_compact();

bool atomic_replace_file_best_effort(const std::filesystem::path& tmp,
                                     const std::filesystem::path& fin);

} // namespace kvdict
