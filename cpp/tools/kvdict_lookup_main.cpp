#include <iostream>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "kvdict/result.h"
#include "kvdict/sqlite_dictionary.h"
#include "kvdict/syllable.h"
#include "text_common.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: kvdict_lookup <db> --syllables C1,C2,... [--first N]\n"
                     "       kvdict_lookup <db> --all\n";
        return 1;
    }

    std::filesystem::path db = argv[1];
    std::string syllables_arg;
    size_t first = 10;
    bool all = false;

    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--syllables") syllables_arg = arg_value(i, argc, argv);
        else if (a == "--first") first = (size_t)std::stoul(arg_value(i, argc, argv));
        else if (a == "--all") all = true;
    }

    if (!all && syllables_arg.empty()) {
        std::cerr << "Missing --syllables or --all\n";
        return 1;
    }

    std::vector<kvdict::Syllable> syllables;
    if (!all) {
        std::vector<uint16_t> codes;
        if (!parse_u16_list(syllables_arg, codes)) {
            std::cerr << "Bad --syllables: " << syllables_arg << "\n";
            return 1;
        }
        for (auto c : codes) {
            auto s = kvdict::syllable_from_u16(c);
            if (!s) {
                std::cerr << "Invalid syllable code: " << c << "\n";
                return 1;
            }
            syllables.push_back(*s);
        }
    }

    try {
        kvdict::SqliteDictionary dict(db);

        nlohmann::json j;
        j["about"] = kvdict::to_json(dict.about());
        if (all) {
            j["entries"] = kvdict::to_json(dict.entries());
        } else {
            j["phrases"] = kvdict::to_json(dict.lookup_first_n_phrases(syllables, first));
        }
        std::cout << j.dump() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "kvdict_lookup failed: " << e.what() << "\n";
        return 2;
    }
}
