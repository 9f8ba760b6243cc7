#pragma once

#include <invar/util/util.hpp>
#include <string>

namespace invar {

enum class ErrorCode {
    OK,
    TYPE_MISMATCH,
    EVALUATION_ERROR,
    PARAMETER_ERROR,
    NOT_FOUND,
    PRECONDITION_VIOLATION,
    INVARIANT_VIOLATED_AT_RUNTIME,
    INVALID_SEED
};

const char* error_code_name(ErrorCode code);

// Outcome of a public engine call. Errors are values, never retried here.
struct Status {
    ErrorCode code;
    std::string message;

    Status() : code(ErrorCode::OK) {}
    Status(ErrorCode c, const std::string& m) : code(c), message(m) {}

    bool ok() const { return code == ErrorCode::OK; }
};

inline std::ostream& operator<<(std::ostream& os, const Status& status) {
    os << error_code_name(status.code);
    if (not status.message.empty()) {
        os << ": " << status.message;
    }
    return os;
}

// Thrown when a value does not structurally match its declared type, or a
// field is read that the type does not declare. Indicates a front-end bug.
struct TypeMismatch {
    std::string message;
    explicit TypeMismatch(const std::string& m) : message(m) {}
};

// Thrown by the evaluator; callers convert it to a Status.
struct EvaluationError {
    std::string message;
    explicit EvaluationError(const std::string& m) : message(m) {}
};

}  // namespace invar
