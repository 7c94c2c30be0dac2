#include "error_handling.h"
#include <ctime>

namespace snipbox {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::PARSE_ERROR: return "Parse error";
        case ErrorCode::SAFETY_VIOLATION: return "Safety violation";
        case ErrorCode::RUNTIME_ERROR: return "Runtime error";
        case ErrorCode::TIMEOUT: return "Timeout";
        case ErrorCode::ENVIRONMENT_ERROR: return "Environment construction error";
        case ErrorCode::INTERPRETER_ERROR: return "Interpreter error";
        case ErrorCode::SERIALIZATION_ERROR: return "Serialization error";
        case ErrorCode::PROCESS_ERROR: return "Process error";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

const char* severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARNING";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::string Error::toString() const {
    std::string msg = std::string(errorToString(code)) + ": " + message;
    if (!context.empty()) {
        msg += " [" + context + "]";
    }
    return msg;
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err;
    err.code = code;
    err.severity = ErrorSeverity::ERROR;
    err.message = message;
    err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    return err;
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err = makeError(code, message);
    err.context = context;
    return err;
}

}
