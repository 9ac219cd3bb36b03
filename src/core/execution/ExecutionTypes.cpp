#include "ExecutionTypes.hpp"

#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>

namespace Attest {

namespace {
constexpr int kRunnerTestTimeoutMs = 45000;
}

QString toString(ExecutionOutcome outcome) {
    switch (outcome) {
        case ExecutionOutcome::Completed: return QStringLiteral("completed");
        case ExecutionOutcome::TimedOut: return QStringLiteral("timeout");
        case ExecutionOutcome::ExecutionError: return QStringLiteral("error");
        case ExecutionOutcome::SecurityViolation: return QStringLiteral("security_violation");
    }
    return QStringLiteral("unknown");
}

ExecutionRequest ExecutionRequest::forBrowserTest(const QString& targetPath,
                                                  std::optional<std::chrono::seconds> timeout) {
    ExecutionRequest request;
    request.targetPath = targetPath;
    request.executable = QStringLiteral("npx");
    request.arguments = {
        QStringLiteral("playwright"),
        QStringLiteral("test"),
        targetPath,
        QStringLiteral("--reporter=json"),
        QStringLiteral("--timeout"),
        QString::number(kRunnerTestTimeoutMs)
    };
    request.timeout = timeout;
    return request;
}

QString ExecutionRequest::artifactName() const {
    if (!name.isEmpty()) {
        return name;
    }
    // auth.spec.ts -> auth
    return QFileInfo(targetPath).baseName();
}

bool isPlainArtifactName(const QString& name) {
    if (name.isEmpty() || name == QLatin1String(".")) {
        return false;
    }
    return !name.contains(QLatin1Char('/')) && !name.contains(QLatin1Char('\\')) &&
           !name.contains(QLatin1String("..")) && !name.contains(QChar(0));
}

QJsonObject ExecutionReport::toJson() const {
    QJsonObject json;
    json["outcome"] = toString(outcome);
    json["success"] = success();
    json["process_started"] = processStarted;
    json["process_completed"] = processCompleted;
    json["exit_code"] = exitCode;
    json["stdout"] = stdoutText;
    json["stderr"] = stderrText;
    json["stdout_truncated"] = stdoutTruncated;
    json["stderr_truncated"] = stderrTruncated;
    json["duration_ms"] = durationMs;
    json["timeout"] = timedOut;
    if (timedOut) {
        json["timeout_seconds"] = timeoutSeconds;
    }
    json["security_violation"] = securityViolation;
    if (securityViolation) {
        json["violation_code"] = violationCode;
        json["violation_message"] = violationMessage;
    }
    if (!errorMessage.isEmpty()) {
        json["error"] = errorMessage;
    }
    if (!partialEvidence.isEmpty()) {
        json["partial_evidence"] = QJsonArray::fromStringList(partialEvidence);
    }
    json["command"] = command;
    return json;
}

} // namespace Attest
