#include "error_handling.h"

namespace ledger {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_CONFIG: return "Invalid configuration";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::IO_ERROR: return "I/O error";
        case ErrorCode::AUDIT_FAILED: return "Audit failed";
    }
    return "Unknown error";
}

std::string Error::describe() const {
    std::string out = errorToString(code);
    if (!message.empty()) out += ": " + message;
    if (!context.empty()) out += " [" + context + "]";
    return out;
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err;
    err.code = code;
    err.message = message;
    err.context = context;
    return err;
}

}
