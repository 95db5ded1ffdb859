#include <iostream>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>
#include "kvdict/validator.h"

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: kvdict_validate <db>\n";
        return 1;
    }

    std::filesystem::path db = argv[1];
    auto vr = kvdict::validate_store_file(db);

    nlohmann::json j;
    j["ok"] = vr.ok;
    j["entries"] = vr.entries;
    j["invalid_records"] = vr.invalid_records;
    j["has_info"] = vr.has_info;
    j["errors"] = vr.errors;

    std::cout << j.dump() << "\n";
    return vr.ok ? 0 : 2;
}
