#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

#include "core/common/Expected.hpp"
#include "SandboxTypes.hpp"

namespace Attest {

class CommandGuard {
public:
    // Fails with SandboxError::PermissionDenied unless executable is a
    // literal member of config.allowedCommands. Arguments containing shell
    // metacharacters are logged but returned unchanged: the child is started
    // from an argv vector and no shell ever interprets them.
    static Expected<QStringList, SecurityViolation> sanitize(const QString& executable,
                                                             const QStringList& arguments,
                                                             const SandboxConfig& config);

    static QStringList suspiciousArguments(const QStringList& arguments);
    static const QStringList& shellMetacharacters();
};

} // namespace Attest
