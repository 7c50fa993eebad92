#pragma once

#include <codesim/result.hpp>

namespace codesim::cli {

// Standard exit codes for CLI commands
// Named with CODESIM_ prefix to avoid conflict with system macros
constexpr int CODESIM_EXIT_SUCCESS = 0;
constexpr int CODESIM_EXIT_USER_ERROR = 1;     // Invalid arguments, bad configuration
constexpr int CODESIM_EXIT_NOT_FOUND = 2;      // Input directory or file not found
constexpr int CODESIM_EXIT_IO_ERROR = 3;       // Read/write errors
constexpr int CODESIM_EXIT_INTERNAL = 4;       // Internal/unexpected errors

inline int exit_code_for(const Error& error) {
    switch (error.code()) {
        case ErrorCode::OK:
            return CODESIM_EXIT_SUCCESS;
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::INVALID_CONFIG:
        case ErrorCode::LIMIT_EXCEEDED:
            return CODESIM_EXIT_USER_ERROR;
        case ErrorCode::NOT_FOUND:
            return CODESIM_EXIT_NOT_FOUND;
        case ErrorCode::IO_ERROR:
            return CODESIM_EXIT_IO_ERROR;
        default:
            return CODESIM_EXIT_INTERNAL;
    }
}

}  // namespace codesim::cli
