#include "PathGuard.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDir>
#include <system_error>
#include <vector>

namespace Attest {

namespace fs = std::filesystem;

namespace {

std::vector<fs::path> components(const fs::path& path) {
    std::vector<fs::path> parts;
    for (const auto& part : path) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

} // namespace

bool PathGuard::validate(const QString& path, const SandboxConfig& config) {
    if (path.isEmpty()) {
        ATTEST_WARN("Path validation failed: empty path");
        return false;
    }
    if (path.contains(QChar(0))) {
        ATTEST_WARN("Path validation failed: NUL byte in path");
        return false;
    }

    const QString resolved = canonicalize(path, config.projectRoot);
    if (resolved.isEmpty()) {
        ATTEST_WARN("Path validation failed: cannot resolve {}", path.toStdString());
        return false;
    }

    const fs::path candidate(resolved.toStdString());
    for (const QString& root : canonicalRoots(config)) {
        if (isStrictDescendant(candidate, fs::path(root.toStdString()))) {
            ATTEST_DEBUG("Path validated: {} -> {}", path.toStdString(), resolved.toStdString());
            return true;
        }
    }

    ATTEST_WARN("Path validation failed: {} ({}) not in allowed dirs: {}",
                path.toStdString(), resolved.toStdString(),
                config.allowedDirs.join(", ").toStdString());
    return false;
}

QString PathGuard::canonicalize(const QString& path, const QString& base) {
    if (path.isEmpty() || path.contains(QChar(0))) {
        return QString();
    }

    fs::path target(path.toStdString());
    if (target.is_relative()) {
        target = fs::path(QDir(base).absolutePath().toStdString()) / target;
    }

    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(target, ec);
    if (ec) {
        ATTEST_DEBUG("Canonicalization failed for {}: {}", path.toStdString(), ec.message());
        return QString();
    }

    resolved = resolved.lexically_normal();
    QString result = QString::fromStdString(resolved.string());
    while (result.size() > 1 && result.endsWith('/')) {
        result.chop(1);
    }
    return result;
}

QStringList PathGuard::canonicalRoots(const SandboxConfig& config) {
    QStringList roots;
    for (const QString& dir : config.allowedDirs) {
        const QString root = canonicalize(dir, config.projectRoot);
        if (root.isEmpty()) {
            ATTEST_WARN("Ignoring allowed dir that cannot be resolved: {}", dir.toStdString());
            continue;
        }
        roots.append(root);
    }
    return roots;
}

bool PathGuard::isStrictDescendant(const fs::path& candidate, const fs::path& root) {
    const auto candidateParts = components(candidate);
    const auto rootParts = components(root);
    if (candidateParts.size() <= rootParts.size()) {
        return false;
    }
    for (std::size_t i = 0; i < rootParts.size(); ++i) {
        if (candidateParts[i] != rootParts[i]) {
            return false;
        }
    }
    return true;
}

} // namespace Attest
