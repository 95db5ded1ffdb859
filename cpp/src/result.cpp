// cpp/src/result.cpp
#include "kvdict/result.h"

namespace kvdict {

nlohmann::json to_json(const Phrase& p) {
    nlohmann::json j;
    j["phrase"] = p.text;
    j["freq"] = p.freq;
    if (p.last_used) j["last_used"] = *p.last_used;
    else j["last_used"] = nullptr;
    return j;
}

nlohmann::json to_json(const std::vector<Phrase>& phrases) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& p : phrases) arr.push_back(to_json(p));
    return arr;
}

nlohmann::json to_json(const std::vector<DictEntry>& entries) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : entries) {
        nlohmann::json syl = nlohmann::json::array();
        for (const auto& s : e.first) syl.push_back(s.code);

        nlohmann::json j = to_json(e.second);
        j["syllables"] = std::move(syl);
        arr.push_back(std::move(j));
    }
    return arr;
}

nlohmann::json to_json(const DictionaryInfo& info) {
    return {
        {"name", info.name},
        {"copyright", info.copyright},
        {"license", info.license},
        {"version", info.version},
        {"software", info.software},
    };
}

static std::string string_or_empty(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::string();
    return it->get<std::string>();
}

DictionaryInfo info_from_json(const nlohmann::json& j) {
    DictionaryInfo info;
    if (!j.is_object()) return info;
    info.name      = string_or_empty(j, "name");
    info.copyright = string_or_empty(j, "copyright");
    info.license   = string_or_empty(j, "license");
    info.version   = string_or_empty(j, "version");
    info.software  = string_or_empty(j, "software");
    return info;
}

} // namespace kvdict
