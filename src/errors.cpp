#include "errors.hpp"

namespace curbench {

DimensionMismatch::DimensionMismatch(size_t left, size_t right)
    : std::invalid_argument("dimension mismatch: " + std::to_string(left) +
                            " vs " + std::to_string(right))
    , left_(left)
    , right_(right)
{}

EmbedError::EmbedError(Kind kind, const std::string& message, long status_code)
    : std::runtime_error(message)
    , kind_(kind)
    , status_code_(status_code)
{}

std::string embed_error_kind_name(EmbedError::Kind kind) {
    switch (kind) {
        case EmbedError::Kind::Transport:         return "transport";
        case EmbedError::Kind::Timeout:           return "timeout";
        case EmbedError::Kind::Cancelled:         return "cancelled";
        case EmbedError::Kind::RateLimited:       return "rate_limited";
        case EmbedError::Kind::HttpStatus:        return "http_status";
        case EmbedError::Kind::MalformedResponse: return "malformed_response";
    }
    return "transport";
}

static std::string describe_cause(const std::exception_ptr& cause) {
    if (!cause) return "unknown error";
    try {
        std::rethrow_exception(cause);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

OperationFailed::OperationFailed(const std::string& operation, const std::string& subject,
                                 std::exception_ptr cause)
    : std::runtime_error(operation + " failed for \"" + subject + "\": " + describe_cause(cause))
    , operation_(operation)
    , subject_(subject)
    , cause_(std::move(cause))
{}

bool OperationFailed::rate_limited() const {
    if (!cause_) return false;
    try {
        std::rethrow_exception(cause_);
    } catch (const EmbedError& e) {
        return e.rate_limited();
    } catch (const OperationFailed& e) {
        return e.rate_limited();
    } catch (const std::exception&) {
        return false;
    }
}

void OperationFailed::rethrow_cause() const {
    if (cause_) std::rethrow_exception(cause_);
}

} // namespace curbench
