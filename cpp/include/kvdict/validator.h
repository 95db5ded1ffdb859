// cpp/include/kvdict/validator.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "kvdict/kv_store.h"

namespace kvdict {

struct ValidationResult {
    bool ok{false};
    std::vector<std::string> errors;
    uint64_t entries{0};          // valid records
    uint64_t invalid_records{0};
    bool has_info{false};
};

// Checks every record decodes, the iteration is strictly ascending by
// (key, text), and INFO (when present) is a JSON object.
ValidationResult validate_store(const KvStore& store, bool check_sorted = true);

ValidationResult validate_store_file(const std::filesystem::path& db_path);

} // namespace kvdict
