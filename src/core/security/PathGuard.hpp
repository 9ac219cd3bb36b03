#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <filesystem>

#include "SandboxTypes.hpp"

namespace Attest {

/**
 * @brief Containment check for paths handed to the sandbox
 *
 * A path is accepted only if its canonical form (symlinks, "." and ".."
 * resolved) is a strict descendant of the canonical form of one of
 * SandboxConfig::allowedDirs. Resolution always happens before the
 * containment test, so "tests/../../etc" and symlinks pointing outside a
 * root are rejected while "tests/sub/../a.spec.ts" is accepted.
 */
class PathGuard {
public:
    // Never throws. Empty paths and paths with NUL bytes are rejected.
    static bool validate(const QString& path, const SandboxConfig& config);

    // Canonical absolute form of path, anchored at base when relative.
    // Existing components are resolved through symlinks; the missing tail
    // is normalized lexically. Returns an empty string on failure.
    static QString canonicalize(const QString& path, const QString& base);

    static QStringList canonicalRoots(const SandboxConfig& config);

private:
    static bool isStrictDescendant(const std::filesystem::path& candidate,
                                   const std::filesystem::path& root);
};

} // namespace Attest
