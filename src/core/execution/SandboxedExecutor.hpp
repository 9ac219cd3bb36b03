#pragma once

#include <chrono>
#include <memory>

#include "ExecutionTypes.hpp"
#include "ProcessRunner.hpp"
#include "core/security/SandboxTypes.hpp"

namespace Attest {

struct SecurityViolation;

/**
 * @brief Runs one test command inside the sandbox boundary
 *
 * The target path, the artifact name and the executable are checked before
 * anything is created or spawned; a rejection yields a SecurityViolation report and the runner is
 * never called. Accepted requests are started with the platform resource
 * limiter, an allow-listed environment, projectRoot as working directory,
 * bounded output capture and a wall-clock deadline. On expiry partial
 * evidence is collected first and the whole process tree is killed after.
 *
 * execute() always returns exactly one report and never throws. The
 * executor holds no mutable state and may be shared between threads as
 * long as its ProcessRunner can.
 */
class SandboxedExecutor {
public:
    explicit SandboxedExecutor(const SandboxConfig& config,
                               std::shared_ptr<ProcessRunner> runner = nullptr);

    ExecutionReport execute(const ExecutionRequest& request) const;
    ExecutionReport execute(const ExecutionRequest& request, std::chrono::seconds timeout) const;

    const SandboxConfig& config() const { return config_; }

private:
    ExecutionReport rejected(const SecurityViolation& violation, const QString& command,
                             qint64 durationMs) const;
    ExecutionReport launch(const ExecutionRequest& request, const QString& checkedTarget,
                           const QStringList& arguments, std::chrono::seconds timeout) const;

    SandboxConfig config_;
    std::shared_ptr<ProcessRunner> runner_;
};

} // namespace Attest
