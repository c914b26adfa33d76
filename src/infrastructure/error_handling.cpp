#include "error_handling.h"
#include <mutex>
#include <unordered_map>
#include <ctime>

namespace qkdsim {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_BASIS: return "Invalid basis";
        case ErrorCode::ALREADY_MEASURED: return "Already measured";
        case ErrorCode::INVALID_NOISE_PROBABILITY: return "Invalid noise probability";
        case ErrorCode::INVALID_PROTOCOL_PARAMETERS: return "Invalid protocol parameters";
        case ErrorCode::INSUFFICIENT_SIFTED_BITS: return "Insufficient sifted bits";
        case ErrorCode::AUTHENTICATION_FAILED: return "Authentication failed";
        case ErrorCode::RUN_CANCELLED: return "Run cancelled";
        case ErrorCode::INVALID_STATE: return "Invalid state";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_BASIS: return "INVALID_BASIS";
        case ErrorCode::ALREADY_MEASURED: return "ALREADY_MEASURED";
        case ErrorCode::INVALID_NOISE_PROBABILITY: return "INVALID_NOISE_PROBABILITY";
        case ErrorCode::INVALID_PROTOCOL_PARAMETERS: return "INVALID_PROTOCOL_PARAMETERS";
        case ErrorCode::INSUFFICIENT_SIFTED_BITS: return "INSUFFICIENT_SIFTED_BITS";
        case ErrorCode::AUTHENTICATION_FAILED: return "AUTHENTICATION_FAILED";
        case ErrorCode::RUN_CANCELLED: return "RUN_CANCELLED";
        case ErrorCode::INVALID_STATE: return "INVALID_STATE";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

int exitStatus(ErrorCode code) {
    if (code == ErrorCode::OK) return 0;
    return code == ErrorCode::RUN_CANCELLED ? EXIT_RUN_CANCELLED : EXIT_RUN_FAILED;
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err(code, message);
    err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    return err;
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err = makeError(code, message);
    err.context = context;
    return err;
}

// Contexts nest per thread: compare() runs protocols on a worker pool and
// each worker labels its own failures.
static thread_local std::vector<std::string> contextStack;

static std::string joinedContext() {
    std::string ctx;
    for (const auto& c : contextStack) {
        if (!ctx.empty()) ctx += " > ";
        ctx += c;
    }
    return ctx;
}

struct ErrorHandler::Impl {
    std::function<void(const Error&)> handler;
    std::unordered_map<int, uint64_t> errorCounts;
    uint64_t totalErrors = 0;
    Error lastError;
    mutable std::mutex mtx;
};

ErrorHandler::ErrorHandler() : impl_(std::make_unique<Impl>()) {}

ErrorHandler& ErrorHandler::instance() {
    static ErrorHandler inst;
    return inst;
}

void ErrorHandler::setHandler(std::function<void(const Error&)> handler) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->handler = std::move(handler);
}

void ErrorHandler::handle(const Error& error) {
    Error err = error;
    if (err.timestamp == 0) {
        err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    }
    if (err.context.empty()) {
        err.context = joinedContext();
    }

    std::function<void(const Error&)> handler;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->totalErrors++;
        impl_->errorCounts[static_cast<int>(err.code)]++;
        impl_->lastError = err;
        handler = impl_->handler;
    }

    if (handler) {
        handler(err);
    }
}

void ErrorHandler::handle(ErrorCode code, const std::string& message) {
    handle(makeError(code, message));
}

void ErrorHandler::pushContext(const std::string& context) {
    contextStack.push_back(context);
}

void ErrorHandler::popContext() {
    if (!contextStack.empty()) {
        contextStack.pop_back();
    }
}

std::string ErrorHandler::getContext() const {
    return joinedContext();
}

void ErrorHandler::clearErrors() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->errorCounts.clear();
    impl_->totalErrors = 0;
    impl_->lastError = Error{};
}

uint64_t ErrorHandler::getErrorCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->totalErrors;
}

uint64_t ErrorHandler::getErrorCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->errorCounts.find(static_cast<int>(code));
    return it != impl_->errorCounts.end() ? it->second : 0;
}

Error ErrorHandler::getLastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->lastError;
}

bool ErrorHandler::hasErrors() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->totalErrors > 0;
}

ScopedContext::ScopedContext(const std::string& ctx) {
    ErrorHandler::instance().pushContext(ctx);
}

ScopedContext::~ScopedContext() {
    ErrorHandler::instance().popContext();
}

}
