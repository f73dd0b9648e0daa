#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "sandbox/execution_result.hpp"
#include "sandbox/failure_classifier.hpp"
#include "sandbox/isolated_executor.hpp"

namespace codecred::sandbox {

inline constexpr std::chrono::milliseconds kDefaultTimeout{5000};

// Runs one code sample per call in a fresh isolated context and reports the
// outcome. Timeouts and failures of the code are results, never exceptions.
class ExecutionSandbox {
public:
    ExecutionSandbox(std::shared_ptr<IsolatedExecutor> executor,
                     ResourceLimits limits = {},
                     FailureClassifier classifier = ClassifyTracebackFailure,
                     std::chrono::milliseconds default_timeout = kDefaultTimeout);

    ExecutionResult Run(const std::string& code) const;
    ExecutionResult Run(const std::string& code, std::chrono::milliseconds timeout) const;

    const IsolatedExecutor& Executor() const { return *executor_; }

private:
    std::shared_ptr<IsolatedExecutor> executor_;
    ResourceLimits limits_;
    FailureClassifier classifier_;
    std::chrono::milliseconds default_timeout_;
};

}  // namespace codecred::sandbox
