#include "sandbox/failure_classifier.hpp"

#include "utils/common.hpp"

namespace codecred::sandbox {
namespace {

constexpr const char* kTracebackMarker = "Traceback";

std::string LastNonEmptyLine(const std::string& output) {
    const auto lines = utils::SplitLines(output);
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        const auto trimmed = utils::Trim(*it);
        if (!trimmed.empty()) {
            return trimmed;
        }
    }
    return {};
}

}  // namespace

FailureInfo ClassifyTracebackFailure(const std::string& output) {
    const auto last_line = LastNonEmptyLine(output);
    const auto colon = last_line.find(':');
    const bool has_traceback = output.find(kTracebackMarker) != std::string::npos;

    if (has_traceback) {
        if (colon != std::string::npos) {
            return {utils::Trim(last_line.substr(0, colon)),
                    utils::Trim(last_line.substr(colon + 1))};
        }
        return {"RuntimeError", output};
    }
    if (colon != std::string::npos) {
        return {"UnknownError", output};
    }
    return {"RuntimeError", output};
}

}  // namespace codecred::sandbox
