#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QProcessEnvironment>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <chrono>
#include <functional>

#include "platform/ResourceLimiter.hpp"

namespace Attest {

struct ProcessSpec {
    QString program;
    QStringList arguments;
    QProcessEnvironment environment;
    QString workingDirectory;
    std::chrono::milliseconds timeout{60000};
    qint64 maxOutputBytes = 1024 * 1024;

    // Applied in the child between fork and exec; may be null
    const ResourceLimiter* limiter = nullptr;
    LimitPlan limitPlan;

    // Invoked once on wall-clock expiry, before the process tree is killed
    std::function<void()> onTimeout;
};

struct ProcessOutcome {
    bool started = false;
    bool finished = false;
    bool timedOut = false;
    bool crashed = false;
    int exitCode = -1;
    qint64 pid = 0;
    QByteArray stdoutData;
    QByteArray stderrData;
    bool stdoutTruncated = false;
    bool stderrTruncated = false;
    QString errorMessage;
};

// Spawn seam for SandboxedExecutor. Implementations must not throw.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    virtual ProcessOutcome run(const ProcessSpec& spec) = 0;
};

/**
 * @brief QProcess-backed runner
 *
 * The child is placed in its own process group and has the limiter's plan
 * applied through QProcess's child process modifier. Output is drained in
 * short waits and capped at maxOutputBytes per stream; the remainder is read
 * and discarded so the child never blocks on a full pipe. On wall-clock
 * expiry the whole process tree is killed and reaped before returning.
 */
class QtProcessRunner : public ProcessRunner {
public:
    ProcessOutcome run(const ProcessSpec& spec) override;

    static constexpr int kStartTimeoutMs = 5000;
    static constexpr int kPollIntervalMs = 50;
    static constexpr int kReapTimeoutMs = 5000;
};

} // namespace Attest
