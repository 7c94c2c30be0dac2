#pragma once

#include <string>
#include <cstdint>
#include <utility>

namespace snipbox {

enum class ErrorCode {
    OK = 0,
    INVALID_ARGUMENT,
    PARSE_ERROR,
    SAFETY_VIOLATION,
    RUNTIME_ERROR,
    TIMEOUT,
    ENVIRONMENT_ERROR,
    INTERPRETER_ERROR,
    SERIALIZATION_ERROR,
    PROCESS_ERROR,
    FILE_NOT_FOUND,
    INTERNAL_ERROR,
    UNKNOWN
};

enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

struct Error {
    ErrorCode code;
    ErrorSeverity severity;
    std::string message;
    std::string context;
    std::string file;
    int line;
    uint64_t timestamp;

    Error() : code(ErrorCode::OK), severity(ErrorSeverity::INFO), line(0), timestamp(0) {}
    Error(ErrorCode c, const std::string& msg) : code(c), severity(ErrorSeverity::ERROR), message(msg), line(0), timestamp(0) {}
    Error(ErrorCode c, ErrorSeverity s, const std::string& msg, const std::string& ctx,
          const std::string& f, int l, uint64_t ts)
        : code(c), severity(s), message(msg), context(ctx), file(f), line(l), timestamp(ts) {}

    std::string toString() const;
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

    T valueOr(const T& defaultValue) const { return hasValue_ ? value_ : defaultValue; }

private:
    T value_;
    Error error_;
    bool hasValue_;
};

template<>
class Result<void> {
public:
    Result() : error_(), hasValue_(true) {}
    Result(Error error) : error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    const Error& error() const { return error_; }

private:
    Error error_;
    bool hasValue_;
};

const char* errorToString(ErrorCode code);
const char* severityToString(ErrorSeverity severity);

Error makeError(ErrorCode code, const std::string& message);
Error makeError(ErrorCode code, const std::string& message, const std::string& context);

#define SNIPBOX_ERROR(code, msg) snipbox::Error{code, snipbox::ErrorSeverity::ERROR, msg, "", __FILE__, __LINE__, 0}
#define SNIPBOX_CHECK(expr, code, msg) if (!(expr)) return snipbox::Result<void>(SNIPBOX_ERROR(code, msg))

}
