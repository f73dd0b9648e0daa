#pragma once

#include <functional>
#include <string>

namespace codecred::sandbox {

struct FailureInfo {
    std::string kind;
    std::string message;
};

// Maps the combined output of a failed run to an exception kind and message.
using FailureClassifier = std::function<FailureInfo(const std::string& output)>;

// Best-effort parser for the Python traceback convention
// ("Traceback ..." followed by a "Kind: message" trailer).
FailureInfo ClassifyTracebackFailure(const std::string& output);

}  // namespace codecred::sandbox
