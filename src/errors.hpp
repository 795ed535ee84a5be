#pragma once
#include <exception>
#include <stdexcept>
#include <string>

namespace curbench {

// Vectors of unequal length passed to a similarity computation.
class DimensionMismatch : public std::invalid_argument {
public:
    DimensionMismatch(size_t left, size_t right);

    size_t left() const { return left_; }
    size_t right() const { return right_; }

private:
    size_t left_;
    size_t right_;
};

// Failure reported by an embedding provider.
class EmbedError : public std::runtime_error {
public:
    enum class Kind {
        Transport,          // connection / DNS / TLS failure
        Timeout,            // deadline on the shared cancel token expired
        Cancelled,          // a sibling request failed and cancelled the fan-out
        RateLimited,        // HTTP 429
        HttpStatus,         // any other non-200 status
        MalformedResponse   // body did not contain an embedding
    };

    EmbedError(Kind kind, const std::string& message, long status_code = 0);

    Kind kind() const { return kind_; }
    long status_code() const { return status_code_; }
    bool rate_limited() const { return kind_ == Kind::RateLimited; }

private:
    Kind kind_;
    long status_code_;
};

std::string embed_error_kind_name(EmbedError::Kind kind);

// Malformed retrieval options; raised before any external call.
class InvalidQuery : public std::invalid_argument {
public:
    explicit InvalidQuery(const std::string& message)
        : std::invalid_argument("invalid query: " + message) {}
};

// Storage backend failure (SQLite open/prepare/step).
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// An engine operation failed; carries the operation name, the subject
// (query text or program id) and the underlying cause.
class OperationFailed : public std::runtime_error {
public:
    OperationFailed(const std::string& operation, const std::string& subject,
                    std::exception_ptr cause);

    const std::string& operation() const { return operation_; }
    const std::string& subject() const { return subject_; }
    std::exception_ptr cause() const { return cause_; }

    // True when the root cause is an EmbedError of kind RateLimited.
    bool rate_limited() const;

    // Rethrow the wrapped cause (no-op if there is none).
    void rethrow_cause() const;

private:
    std::string operation_;
    std::string subject_;
    std::exception_ptr cause_;
};

class RetrievalFailed : public OperationFailed {
public:
    using OperationFailed::OperationFailed;
};

class BenchmarkFailed : public OperationFailed {
public:
    using OperationFailed::OperationFailed;
};

} // namespace curbench
