#include "ProcessRunner.hpp"
#include "core/common/Logger.hpp"
#include "platform/linux/ProcessTree.hpp"

#include <QtCore/QElapsedTimer>
#include <QtCore/QProcess>
#include <algorithm>
#include <exception>

#ifdef Q_OS_UNIX
#include <unistd.h>
#endif

namespace Attest {

namespace {

void appendBounded(QByteArray& target, const QByteArray& chunk, qint64 limit, bool& truncated) {
    if (chunk.isEmpty()) {
        return;
    }
    const qint64 available = std::max<qint64>(0, limit - target.size());
    const qint64 take = std::min<qint64>(available, chunk.size());
    target.append(chunk.constData(), static_cast<int>(take));
    if (take < chunk.size()) {
        truncated = true;
    }
}

void drain(QProcess& process, ProcessOutcome& outcome, qint64 limit) {
    appendBounded(outcome.stdoutData, process.readAllStandardOutput(), limit, outcome.stdoutTruncated);
    appendBounded(outcome.stderrData, process.readAllStandardError(), limit, outcome.stderrTruncated);
}

} // namespace

ProcessOutcome QtProcessRunner::run(const ProcessSpec& spec) {
    ProcessOutcome outcome;

    QProcess process;
    process.setProgram(spec.program);
    process.setArguments(spec.arguments);
    process.setProcessEnvironment(spec.environment);
    process.setWorkingDirectory(spec.workingDirectory);
    process.setProcessChannelMode(QProcess::SeparateChannels);
    process.setInputChannelMode(QProcess::ManagedInputChannel);

#ifdef Q_OS_UNIX
    const ResourceLimiter* limiter = spec.limiter;
    const LimitPlan plan = spec.limitPlan;
    process.setChildProcessModifier([limiter, plan]() {
        // New process group so the whole tree can be signalled at once
        ::setpgid(0, 0);
        if (limiter) {
            limiter->apply(plan);
        }
    });
#endif

    process.start();
    if (!process.waitForStarted(kStartTimeoutMs)) {
        outcome.errorMessage = QString("Failed to start %1: %2").arg(spec.program, process.errorString());
        ATTEST_ERROR("{}", outcome.errorMessage.toStdString());
        return outcome;
    }
    process.closeWriteChannel();

    outcome.started = true;
    outcome.pid = process.processId();

    QElapsedTimer elapsed;
    elapsed.start();
    const qint64 timeoutMs = spec.timeout.count();

    while (true) {
        const qint64 remaining = timeoutMs - elapsed.elapsed();
        if (remaining <= 0) {
            break;
        }
        const bool done = process.waitForFinished(static_cast<int>(std::min<qint64>(remaining, kPollIntervalMs)));
        drain(process, outcome, spec.maxOutputBytes);
        if (done || process.state() == QProcess::NotRunning) {
            outcome.finished = true;
            break;
        }
    }

    if (!outcome.finished) {
        outcome.timedOut = true;
        ATTEST_WARN("Process {} exceeded wall-clock timeout of {}ms", outcome.pid, timeoutMs);

        if (spec.onTimeout) {
            try {
                spec.onTimeout();
            } catch (const std::exception& ex) {
                ATTEST_WARN("Timeout hook failed: {}", ex.what());
            }
        }

#ifdef Q_OS_UNIX
        ProcessTree::killTree(outcome.pid);
#endif
        process.kill();
        if (!process.waitForFinished(kReapTimeoutMs)) {
            ATTEST_ERROR("Process {} did not exit after SIGKILL", outcome.pid);
        }
        drain(process, outcome, spec.maxOutputBytes);
        outcome.exitCode = 124;
        return outcome;
    }

    if (process.exitStatus() == QProcess::CrashExit) {
        outcome.crashed = true;
        outcome.exitCode = -1;
        outcome.errorMessage = QString("Process terminated abnormally: %1").arg(process.errorString());
    } else {
        outcome.exitCode = process.exitCode();
    }
    return outcome;
}

} // namespace Attest
