#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

#include "core/execution/ExecutionTypes.hpp"
#include "core/security/SandboxTypes.hpp"

namespace Attest {

/**
 * @brief Gathers the artifacts a test run left behind
 *
 * Two places are searched for files ending in SandboxConfig::evidenceSuffix:
 * everything below artifactsRoot/requestName, and files in the runner's
 * results directory whose parent directory name contains requestName. The
 * result is deduplicated and ordered by modification time, oldest first,
 * with the absolute path as tie-break. Missing directories are not an error.
 * Symbolic links are never collected or followed, and a requestName that is
 * not a plain directory name yields nothing.
 *
 * Safe to call while the test process is still writing; files that vanish
 * between listing and stat are dropped.
 */
class EvidenceCollector {
public:
    explicit EvidenceCollector(const SandboxConfig& config);

    EvidenceSet collect(const QString& artifactsRoot, const QString& requestName) const;

    static EvidenceSet orderByModificationTime(const QStringList& paths);

private:
    QStringList scanArtifacts(const QString& directory) const;
    QStringList scanResults(const QString& requestName) const;

    SandboxConfig config_;
};

} // namespace Attest
