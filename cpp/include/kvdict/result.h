// cpp/include/kvdict/result.h
#pragma once
#include <vector>
#include <nlohmann/json.hpp>

#include "kvdict/dictionary.h"
#include "kvdict/phrase.h"

namespace kvdict {

nlohmann::json to_json(const Phrase& p);
nlohmann::json to_json(const std::vector<Phrase>& phrases);
nlohmann::json to_json(const std::vector<DictEntry>& entries);
nlohmann::json to_json(const DictionaryInfo& info);

// Missing or non-string fields stay empty.
DictionaryInfo info_from_json(const nlohmann::json& j);

} // namespace kvdict
