#pragma once

#include <optional>
#include <string>
#include <utility>

namespace ledger {

enum class ErrorCode {
    OK = 0,
    INVALID_CONFIG,
    FILE_NOT_FOUND,
    IO_ERROR,
    AUDIT_FAILED
};

const char* errorToString(ErrorCode code);

struct Error {
    ErrorCode code = ErrorCode::OK;
    std::string message;
    // Usually the configuration key or path the error refers to.
    std::string context;

    std::string describe() const;
};

Error makeError(ErrorCode code, const std::string& message, const std::string& context = "");

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return value_.has_value(); }
    bool failed() const { return !ok(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }
    const Error& error() const { return error_; }

private:
    std::optional<T> value_;
    Error error_;
};

template<>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)), failed_(true) {}

    bool ok() const { return !failed_; }
    bool failed() const { return failed_; }
    const Error& error() const { return error_; }

private:
    Error error_;
    bool failed_ = false;
};

#define LEDGER_CHECK(expr, code, msg) if (!(expr)) return ledger::makeError(code, msg)

}
