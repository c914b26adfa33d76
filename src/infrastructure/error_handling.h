#pragma once

#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <cstdint>

namespace qkdsim {

enum class ErrorCode {
    OK = 0,
    INVALID_BASIS,
    ALREADY_MEASURED,
    INVALID_NOISE_PROBABILITY,
    INVALID_PROTOCOL_PARAMETERS,
    INSUFFICIENT_SIFTED_BITS,
    AUTHENTICATION_FAILED,
    RUN_CANCELLED,
    INVALID_STATE,
    INTERNAL_ERROR
};

// Process exit status the CLI uses when a run ends with this code.
constexpr int EXIT_RUN_FAILED = 1;
constexpr int EXIT_RUN_CANCELLED = 130;

struct Error {
    ErrorCode code;
    std::string message;
    std::string context;
    uint64_t timestamp;

    Error() : code(ErrorCode::OK), timestamp(0) {}
    Error(ErrorCode c, const std::string& msg) : code(c), message(msg), timestamp(0) {}

    // Parameter problems are the caller's to fix; everything else comes from
    // the simulated channel or the run itself.
    bool isConfigurationError() const {
        return code == ErrorCode::INVALID_BASIS || code == ErrorCode::INVALID_NOISE_PROBABILITY ||
               code == ErrorCode::INVALID_PROTOCOL_PARAMETERS;
    }
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

/**
 * Process-wide sink for failed runs. The simulator reports every run that
 * ends in an error here, tagged with the active context, so a caller can
 * count failures per code after a batch of runs.
 */
class ErrorHandler {
public:
    static ErrorHandler& instance();

    void setHandler(std::function<void(const Error&)> handler);
    void handle(const Error& error);
    void handle(ErrorCode code, const std::string& message);

    void pushContext(const std::string& context);
    void popContext();
    std::string getContext() const;

    void clearErrors();

    uint64_t getErrorCount() const;
    uint64_t getErrorCount(ErrorCode code) const;

    Error getLastError() const;
    bool hasErrors() const;

private:
    ErrorHandler();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

class ScopedContext {
public:
    explicit ScopedContext(const std::string& ctx);
    ~ScopedContext();
    ScopedContext(const ScopedContext&) = delete;
    ScopedContext& operator=(const ScopedContext&) = delete;
};

const char* errorToString(ErrorCode code);
// Upper-case identifier, stable for machine-readable output.
const char* errorCodeName(ErrorCode code);
int exitStatus(ErrorCode code);

Error makeError(ErrorCode code, const std::string& message);
Error makeError(ErrorCode code, const std::string& message, const std::string& context);

}
