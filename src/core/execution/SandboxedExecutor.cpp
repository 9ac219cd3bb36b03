#include "SandboxedExecutor.hpp"
#include "core/common/Logger.hpp"
#include "core/evidence/EvidenceCollector.hpp"
#include "core/security/CommandGuard.hpp"
#include "core/security/EnvironmentSanitizer.hpp"
#include "core/security/PathGuard.hpp"
#include "platform/ResourceLimiter.hpp"

#include <QtCore/QDir>
#include <QtCore/QElapsedTimer>
#include <exception>
#include <utility>

namespace Attest {

namespace {

QString commandLine(const QString& executable, const QStringList& arguments) {
    QStringList parts{executable};
    parts << arguments;
    return parts.join(' ');
}

} // namespace

SandboxedExecutor::SandboxedExecutor(const SandboxConfig& config, std::shared_ptr<ProcessRunner> runner)
    : config_(config)
    , runner_(std::move(runner)) {
    if (!runner_) {
        runner_ = std::make_shared<QtProcessRunner>();
    }
}

ExecutionReport SandboxedExecutor::execute(const ExecutionRequest& request, std::chrono::seconds timeout) const {
    ExecutionRequest overridden = request;
    overridden.timeout = timeout;
    return execute(overridden);
}

ExecutionReport SandboxedExecutor::execute(const ExecutionRequest& request) const {
    QElapsedTimer timer;
    timer.start();

    const QString command = commandLine(request.executable, request.arguments);

    if (!PathGuard::validate(request.targetPath, config_)) {
        SecurityViolation violation;
        violation.code = SandboxError::InvalidPath;
        violation.rejected = request.targetPath;
        violation.allowList = config_.allowedDirs;
        violation.message = QString("Path outside allowed directories: %1. Allowed: %2")
                                .arg(request.targetPath, config_.allowedDirs.join(", "));
        return rejected(violation, command, timer.elapsed());
    }

    const QString requestName = request.artifactName();
    if (!isPlainArtifactName(requestName)) {
        SecurityViolation violation;
        violation.code = SandboxError::InvalidPath;
        violation.rejected = requestName;
        violation.message = QString("Invalid artifact name: %1").arg(requestName);
        return rejected(violation, command, timer.elapsed());
    }

    auto sanitized = CommandGuard::sanitize(request.executable, request.arguments, config_);
    if (!sanitized) {
        return rejected(sanitized.error(), command, timer.elapsed());
    }

    // Hand the child the exact path that was checked, not the caller's spelling
    const QString checkedTarget = PathGuard::canonicalize(request.targetPath, config_.projectRoot);
    QStringList arguments = sanitized.value();
    for (QString& argument : arguments) {
        if (argument == request.targetPath) {
            argument = checkedTarget;
        }
    }

    // Non-positive overrides mean "no override"
    std::chrono::seconds timeout(config_.maxWallSeconds);
    if (request.timeout && request.timeout->count() > 0) {
        timeout = *request.timeout;
    }

    ExecutionReport report;
    try {
        report = launch(request, checkedTarget, arguments, timeout);
    } catch (const std::exception& ex) {
        ATTEST_ERROR("Sandbox execution error: {}", ex.what());
        report = ExecutionReport();
        report.outcome = ExecutionOutcome::ExecutionError;
        report.errorMessage = QString("Sandbox execution error: %1").arg(QString::fromUtf8(ex.what()));
        report.command = commandLine(request.executable, arguments);
    }
    report.durationMs = timer.elapsed();
    return report;
}

ExecutionReport SandboxedExecutor::rejected(const SecurityViolation& violation, const QString& command,
                                            qint64 durationMs) const {
    ATTEST_WARN("Security violation ({}): {}", toString(violation.code).toStdString(),
                violation.message.toStdString());

    ExecutionReport report;
    report.outcome = ExecutionOutcome::SecurityViolation;
    report.securityViolation = true;
    report.violationCode = toString(violation.code);
    report.violationMessage = violation.message;
    report.errorMessage = violation.message;
    report.durationMs = durationMs;
    report.command = command;
    return report;
}

ExecutionReport SandboxedExecutor::launch(const ExecutionRequest& request, const QString& checkedTarget,
                                          const QStringList& arguments, std::chrono::seconds timeout) const {
    ExecutionReport report;
    report.command = commandLine(request.executable, arguments);

    const auto limiter = createResourceLimiter();

    ProcessSpec spec;
    spec.program = request.executable;
    spec.arguments = arguments;
    spec.environment = EnvironmentSanitizer::build();
    spec.workingDirectory = config_.projectRoot;
    spec.timeout = timeout;
    spec.maxOutputBytes = config_.maxOutputBytes;
    spec.limiter = limiter.get();
    spec.limitPlan = limiter->plan(ResourceLimits::fromConfig(config_));

    if (!spec.limitPlan.skipped.isEmpty()) {
        ATTEST_WARN("Running with partial resource limits ({}); skipped: {}",
                    limiter->name().toStdString(), spec.limitPlan.skipped.join(", ").toStdString());
    }

    const QString artifactsRoot = config_.resolve(config_.artifactsDir);
    const QString requestName = request.artifactName();
    if (!QDir().mkpath(QDir(artifactsRoot).filePath(requestName))) {
        ATTEST_WARN("Could not create artifacts directory for '{}' under {}",
                    requestName.toStdString(), artifactsRoot.toStdString());
    }
    spec.onTimeout = [this, &report, artifactsRoot, requestName]() {
        report.partialEvidence = EvidenceCollector(config_).collect(artifactsRoot, requestName);
    };

    ATTEST_INFO("Executing in sandbox: {} (timeout: {}s, target: {})",
                report.command.toStdString(), static_cast<long long>(timeout.count()),
                checkedTarget.toStdString());

    const ProcessOutcome outcome = runner_->run(spec);

    report.stdoutText = QString::fromUtf8(outcome.stdoutData);
    report.stderrText = QString::fromUtf8(outcome.stderrData);
    report.stdoutTruncated = outcome.stdoutTruncated;
    report.stderrTruncated = outcome.stderrTruncated;
    report.processStarted = outcome.started;
    report.exitCode = outcome.exitCode;

    if (!outcome.started) {
        report.outcome = ExecutionOutcome::ExecutionError;
        report.errorMessage = QString("Sandbox execution error: %1").arg(outcome.errorMessage);
        return report;
    }

    if (outcome.timedOut) {
        report.outcome = ExecutionOutcome::TimedOut;
        report.timedOut = true;
        report.timeoutSeconds = timeout.count();
        report.errorMessage = QString("Test execution timeout after %1s").arg(timeout.count());
        ATTEST_WARN("Test execution timeout: {} after {}s ({} partial artifact(s))",
                    checkedTarget.toStdString(), static_cast<long long>(timeout.count()),
                    report.partialEvidence.size());
        return report;
    }

    report.outcome = ExecutionOutcome::Completed;
    report.processCompleted = true;
    if (outcome.crashed) {
        report.errorMessage = outcome.errorMessage;
    }
    ATTEST_INFO("Process finished with exit code {}", report.exitCode);
    return report;
}

} // namespace Attest
