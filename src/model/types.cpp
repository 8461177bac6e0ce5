#include "altb/types.hpp"

namespace altb {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::CORRUPT_REGISTRY: return "corrupt_registry";
        case ErrorCode::SOURCE_NOT_FOUND: return "source_not_found";
        case ErrorCode::TARGET_MISSING: return "target_missing";
        case ErrorCode::EMPTY_COMMAND: return "empty_command";
        case ErrorCode::AMBIGUOUS_TAG: return "ambiguous_tag";
        case ErrorCode::MISSING_TAG: return "missing_tag";
        case ErrorCode::NO_ACTIVE_TAG: return "no_active_tag";
        case ErrorCode::UNKNOWN_TAG: return "unknown_tag";
        case ErrorCode::UNKNOWN_APPLICATION: return "unknown_application";
        case ErrorCode::INVALID_NAME: return "invalid_name";
        case ErrorCode::INSTALL_FAILED: return "install_failed";
        case ErrorCode::NOT_RUNNABLE: return "not_runnable";
        case ErrorCode::IO_ERROR: return "io_error";
    }
    return "unknown";
}

} // namespace altb
