#pragma once

#include <stdexcept>
#include <string>

namespace otree {

/**
 * Structured error reporting for the index core.
 *
 * Conditions that the index resolves by itself (values outside the revision
 * bounds, cubes overflowing at max depth, overlapping optimization requests)
 * are not errors and never reach these types.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    NOT_IMPLEMENTED = 3,

    // Persisted state
    CORRUPT_DATA = 100,
    UNKNOWN_REVISION = 101,

    // Coordination
    KEEPER_FAILURE = 200,
    SESSION_CLOSED = 201,

    // Commit log / storage collaborators
    COMMIT_CONFLICT = 300,
    WRITE_FAILED = 301,

    // Database errors
    CONNECTION_FAILED = 400,
    QUERY_FAILED = 401,

    // Internal errors
    INTERNAL_ERROR = 500
};

class OTreeException : public std::runtime_error {
public:
    explicit OTreeException(ErrorCode code, const std::string& message,
                            const std::string& context = "",
                            const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "OTree error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public OTreeException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : OTreeException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Malformed persisted CubeId, Weight or metadata. Never reinterpreted.
class CorruptDataError : public OTreeException {
public:
    explicit CorruptDataError(const std::string& message,
                              const std::string& context = "",
                              const std::string& suggestion = "")
        : OTreeException(ErrorCode::CORRUPT_DATA, message, context, suggestion) {}
};

class KeeperError : public OTreeException {
public:
    explicit KeeperError(const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : OTreeException(ErrorCode::KEEPER_FAILURE, message, context, suggestion) {}
};

class CommitConflictError : public OTreeException {
public:
    explicit CommitConflictError(const std::string& message,
                                 const std::string& context = "",
                                 const std::string& suggestion = "")
        : OTreeException(ErrorCode::COMMIT_CONFLICT, message, context, suggestion) {}
};

class DatabaseError : public OTreeException {
public:
    explicit DatabaseError(const std::string& message,
                           const std::string& context = "",
                           const std::string& suggestion = "")
        : OTreeException(ErrorCode::QUERY_FAILED, message, context, suggestion) {}
};

class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw OTreeException(code, message, context, suggestion);
        }
    }
};

#define OTREE_CHECK(condition, code, message) \
    otree::ErrorHandler::check_condition(condition, code, message, __func__)

#define OTREE_CHECK_ARGUMENT(condition, message) \
    do { if (!(condition)) throw otree::InvalidArgumentError(message, __func__); } while (0)

#define OTREE_THROW(code, message) \
    throw otree::OTreeException(code, message, __func__)

#define OTREE_THROW_CORRUPT(message) \
    throw otree::CorruptDataError(message, __func__)

} // namespace otree
