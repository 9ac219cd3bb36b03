#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <chrono>
#include <optional>

namespace Attest {

using EvidenceSet = QStringList;

enum class ExecutionOutcome {
    Completed,
    TimedOut,
    ExecutionError,
    SecurityViolation
};

QString toString(ExecutionOutcome outcome);

struct ExecutionRequest {
    QString targetPath;
    QString executable;
    QStringList arguments;
    std::optional<std::chrono::seconds> timeout;
    QString name;

    // npx playwright test <target> --reporter=json --timeout 45000
    static ExecutionRequest forBrowserTest(const QString& targetPath,
                                           std::optional<std::chrono::seconds> timeout = std::nullopt);

    // Artifact directory name; defaults to the target's base name without suffixes
    QString artifactName() const;
};

// A single directory component: non-empty, no separators, no "..", no NUL
bool isPlainArtifactName(const QString& name);

struct ExecutionReport {
    ExecutionOutcome outcome = ExecutionOutcome::ExecutionError;
    bool processStarted = false;
    bool processCompleted = false;
    int exitCode = -1;
    QString stdoutText;
    QString stderrText;
    bool stdoutTruncated = false;
    bool stderrTruncated = false;
    qint64 durationMs = 0;
    bool timedOut = false;
    qint64 timeoutSeconds = 0;
    bool securityViolation = false;
    QString violationCode;
    QString violationMessage;
    QString errorMessage;
    EvidenceSet partialEvidence;
    QString command;

    bool success() const { return outcome == ExecutionOutcome::Completed && exitCode == 0; }
    QJsonObject toJson() const;
};

} // namespace Attest
