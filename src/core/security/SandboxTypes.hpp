#pragma once

#include <QtCore/QDir>
#include <QtCore/QJsonObject>
#include <QtCore/QSet>
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace Attest {

enum class SandboxError {
    InvalidPath,
    PermissionDenied
};

QString toString(SandboxError error);

// A rejected path or command. Nothing is executed once one of these exists.
struct SecurityViolation {
    SandboxError code = SandboxError::PermissionDenied;
    QString rejected;
    QStringList allowList;
    QString message;
};

/**
 * @brief Limits and allow-lists shared read-only by every execution
 *
 * Built once (see Config::sandboxConfig) and handed to components by const
 * reference. Relative allowedDirs, relative targets and the child's working
 * directory are all anchored at projectRoot.
 */
struct SandboxConfig {
    qint64 maxCpuSeconds = 300;
    qint64 maxMemoryBytes = 2048LL * 1024 * 1024;
    qint64 maxWallSeconds = 60;
    qint64 maxFileBytes = 100LL * 1024 * 1024;
    qint64 maxProcesses = 100;
    qint64 maxOutputBytes = 1024 * 1024;

    QStringList allowedDirs = {
        QStringLiteral("./tests"),
        QStringLiteral("./artifacts"),
        QStringLiteral("./test-results"),
        QStringLiteral("./playwright-report")
    };
    QSet<QString> allowedCommands = {
        QStringLiteral("npx"),
        QStringLiteral("playwright"),
        QStringLiteral("node")
    };

    QString projectRoot = QDir::currentPath();
    QString artifactsDir = QStringLiteral("artifacts");
    QString resultsDir = QStringLiteral("test-results");
    QString evidenceSuffix = QStringLiteral(".png");

    QStringList sortedCommands() const;
    QString resolve(const QString& relativeOrAbsolute) const;
    QJsonObject toJson() const;
};

} // namespace Attest
