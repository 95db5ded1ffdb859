#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace kvdict {

enum class ErrorCode {
    Ok = 0,
    IoError,
    InvalidFormat,
    InvalidArgs,
};

struct Error {
    ErrorCode code{ErrorCode::Ok};
    std::string message;
};

class KvDictException : public std::runtime_error {
public:
    explicit KvDictException(const std::string& msg) : std::runtime_error(msg) {}
};

// Raised by dictionary mutations. cause() is only set by a store
// implementation (file rewrite, reopen, text the store cannot hold);
// a duplicate phrase in the overlay logic carries none.
class DictionaryUpdateError : public KvDictException {
public:
    explicit DictionaryUpdateError(const std::string& msg,
                                   std::optional<Error> cause = std::nullopt)
        : KvDictException(msg), cause_(std::move(cause)) {}

    const std::optional<Error>& cause() const noexcept { return cause_; }

private:
    std::optional<Error> cause_;
};

} // namespace kvdict
