#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace stockguard {

/**
 * Base exception for all stockguard faults.
 *
 * Business outcomes (insufficient stock, rejected transitions, duplicate
 * webhooks) are returned values and never thrown.
 */
class StockguardError : public std::runtime_error {
public:
    explicit StockguardError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if the referenced entity does not exist.
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if the caller supplied an invalid argument.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * Returns true if retrying the whole operation may succeed.
     */
    virtual bool is_transient() const { return false; }

    /**
     * Returns true if stored data contradicts an invariant.
     */
    virtual bool is_consistency_violation() const { return false; }

    /**
     * Map this error onto a gRPC status for the API layer.
     */
    grpc::Status to_grpc_status() const {
        if (is_not_found()) return grpc::Status(grpc::StatusCode::NOT_FOUND, what());
        if (is_invalid_argument()) return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, what());
        if (is_transient()) return grpc::Status(grpc::StatusCode::UNAVAILABLE, what());
        return grpc::Status(grpc::StatusCode::INTERNAL, what());
    }
};

/**
 * Thrown when a product, variant, reservation, order or webhook event is missing.
 */
class NotFoundError : public StockguardError {
public:
    explicit NotFoundError(const std::string& message)
        : StockguardError(message) {}

    bool is_not_found() const override { return true; }
};

/**
 * Thrown when an invalid argument is provided.
 */
class InvalidArgumentError : public StockguardError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : StockguardError(message) {}

    bool is_invalid_argument() const override { return true; }
};

/**
 * Thrown when the datastore is busy or locked. The enclosing transaction
 * has been rolled back, so the operation can be retried from the start.
 */
class TransientError : public StockguardError {
public:
    explicit TransientError(const std::string& message)
        : StockguardError(message) {}

    bool is_transient() const override { return true; }
};

/**
 * Thrown for any other datastore failure.
 */
class StorageError : public StockguardError {
public:
    StorageError(const std::string& message, int code)
        : StockguardError(message), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

/**
 * Thrown when a write violates a uniqueness or check constraint.
 */
class ConstraintError : public StorageError {
public:
    ConstraintError(const std::string& message, int code)
        : StorageError(message, code) {}
};

/**
 * Thrown when stored state contradicts the locking discipline, e.g. a
 * reservation committed for an order it is not linked to.
 */
class ConsistencyError : public StockguardError {
public:
    explicit ConsistencyError(const std::string& message)
        : StockguardError(message) {}

    bool is_consistency_violation() const override { return true; }
};

} // namespace stockguard
