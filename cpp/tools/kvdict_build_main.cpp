#include <iostream>
#include <string>
#include <filesystem>

#include <nlohmann/json.hpp>
#include "kvdict/builder.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: kvdict_build <corpus_jsonl> <out_db> [--name S] [--version S]"
                     " [--copyright S] [--license S] [--truncate] [--no-overwrite]\n";
        return 1;
    }

    std::filesystem::path corpus = argv[1];
    std::filesystem::path out_db = argv[2];

    kvdict::BuildOptions opt;
    for (int i = 3; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--name") opt.name = arg_value(i, argc, argv);
        else if (a == "--version") opt.version = arg_value(i, argc, argv);
        else if (a == "--copyright") opt.copyright = arg_value(i, argc, argv);
        else if (a == "--license") opt.license = arg_value(i, argc, argv);
        else if (a == "--truncate") opt.truncate_long_phrases = true;
        else if (a == "--no-overwrite") opt.fail_if_exists = true;
        else {
            std::cerr << "Unknown option: " << a << "\n";
            return 1;
        }
    }

    try {
        auto st = kvdict::build_store_jsonl(corpus, out_db, opt);
        nlohmann::json j;
        j["db_path"] = st.db_path.string();
        j["lines"] = st.lines;
        j["phrases"] = st.phrases;
        j["bad_lines"] = st.bad_lines;
        j["duplicates"] = st.duplicates;
        j["truncated"] = st.truncated;
        j["too_long"] = st.too_long;
        j["built_at_utc"] = st.built_at_utc;
        std::cout << j.dump() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "kvdict_build failed: " << e.what() << "\n";
        return 2;
    }
}
