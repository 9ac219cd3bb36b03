#include "EvidenceCollector.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QDir>
#include <QtCore/QDirIterator>
#include <QtCore/QFileInfo>
#include <QtCore/QSet>
#include <algorithm>
#include <utility>
#include <vector>

namespace Attest {

EvidenceCollector::EvidenceCollector(const SandboxConfig& config)
    : config_(config) {
}

EvidenceSet EvidenceCollector::collect(const QString& artifactsRoot, const QString& requestName) const {
    QStringList found;
    if (isPlainArtifactName(requestName)) {
        found << scanArtifacts(QDir(artifactsRoot).filePath(requestName));
        found << scanResults(requestName);
    }

    const EvidenceSet evidence = orderByModificationTime(found);
    ATTEST_DEBUG("Collected {} evidence file(s) for '{}'", evidence.size(), requestName.toStdString());
    return evidence;
}

QStringList EvidenceCollector::scanArtifacts(const QString& directory) const {
    QStringList files;
    const QFileInfo root(directory);
    if (!root.isDir() || root.isSymLink()) {
        return files;
    }

    const QStringList nameFilters{QStringLiteral("*") + config_.evidenceSuffix};
    QDirIterator iterator(directory, nameFilters, QDir::Files | QDir::NoSymLinks, QDirIterator::Subdirectories);
    while (iterator.hasNext()) {
        files.append(QFileInfo(iterator.next()).absoluteFilePath());
    }
    return files;
}

QStringList EvidenceCollector::scanResults(const QString& requestName) const {
    QStringList files;
    const QString resultsRoot = config_.resolve(config_.resultsDir);
    if (!QFileInfo(resultsRoot).isDir()) {
        return files;
    }

    // Runner output dirs look like <spec>-<test-title>-<project>/<shot>.png
    const QStringList nameFilters{QStringLiteral("*") + config_.evidenceSuffix};
    QDirIterator iterator(resultsRoot, nameFilters, QDir::Files | QDir::NoSymLinks, QDirIterator::Subdirectories);
    while (iterator.hasNext()) {
        const QFileInfo info(iterator.next());
        if (info.absolutePath() == QFileInfo(resultsRoot).absoluteFilePath()) {
            continue;
        }
        if (info.dir().dirName().contains(requestName)) {
            files.append(info.absoluteFilePath());
        }
    }
    return files;
}

EvidenceSet EvidenceCollector::orderByModificationTime(const QStringList& paths) {
    std::vector<std::pair<qint64, QString>> stamped;
    QSet<QString> seen;

    for (const QString& path : paths) {
        const QString absolute = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
        if (seen.contains(absolute)) {
            continue;
        }
        seen.insert(absolute);

        // Links written by the test process could point anywhere
        const QFileInfo info(absolute);
        if (info.isSymLink() || !info.isFile()) {
            continue;
        }
        stamped.emplace_back(info.lastModified().toMSecsSinceEpoch(), absolute);
    }

    std::sort(stamped.begin(), stamped.end());

    EvidenceSet ordered;
    ordered.reserve(static_cast<int>(stamped.size()));
    for (const auto& entry : stamped) {
        ordered.append(entry.second);
    }
    return ordered;
}

} // namespace Attest
