// File: src/core/errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace careledger {

/// Malformed owner id, query text or query options.
/// Raised before any mutation happens and surfaces to the caller unchanged.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

/// A lookup by record id found nothing.
/// An owner without records is not an error: ranking returns an empty set.
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& message)
        : std::runtime_error(message) {}
};

/// An external collaborator (embedding, summarizer, recommender) did not
/// answer within its deadline.
class CollaboratorTimeoutError : public std::runtime_error {
public:
    CollaboratorTimeoutError(const std::string& collaborator, long long timeout_ms)
        : std::runtime_error(collaborator + " did not respond within " +
                             std::to_string(timeout_ms) + "ms"),
          collaborator_(collaborator) {}

    const std::string& collaborator() const { return collaborator_; }

private:
    std::string collaborator_;
};

/// A per-owner lock could not be acquired after all retries.
/// Callers of the query pipeline never see this; it becomes a degraded stage.
class ConcurrencyConflictError : public std::runtime_error {
public:
    explicit ConcurrencyConflictError(const std::string& message)
        : std::runtime_error(message) {}
};

/// The durable record store could not be opened or initialized.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace careledger
