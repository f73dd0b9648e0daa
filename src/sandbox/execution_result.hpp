#pragma once

#include <string>

namespace codecred::sandbox {

struct ExecutionResult {
    bool success = false;
    double elapsed_seconds = 0.0;
    std::string exception_kind;
    std::string exception_message;
    std::string captured_output;
};

}  // namespace codecred::sandbox
