#include <invar/model/status.hpp>

namespace invar {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return "OK";
        case ErrorCode::TYPE_MISMATCH:
            return "TYPE_MISMATCH";
        case ErrorCode::EVALUATION_ERROR:
            return "EVALUATION_ERROR";
        case ErrorCode::PARAMETER_ERROR:
            return "PARAMETER_ERROR";
        case ErrorCode::NOT_FOUND:
            return "NOT_FOUND";
        case ErrorCode::PRECONDITION_VIOLATION:
            return "PRECONDITION_VIOLATION";
        case ErrorCode::INVARIANT_VIOLATED_AT_RUNTIME:
            return "INVARIANT_VIOLATED_AT_RUNTIME";
        case ErrorCode::INVALID_SEED:
            return "INVALID_SEED";
    }
    return "???";
}

}  // namespace invar
