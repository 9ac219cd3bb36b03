#include "CommandGuard.hpp"
#include "core/common/Logger.hpp"

namespace Attest {

const QStringList& CommandGuard::shellMetacharacters() {
    static const QStringList patterns = {
        QStringLiteral(";"), QStringLiteral("&&"), QStringLiteral("||"), QStringLiteral("|"),
        QStringLiteral("`"), QStringLiteral("$"), QStringLiteral(">"), QStringLiteral("<"),
        QStringLiteral("\n"), QStringLiteral("\r")
    };
    return patterns;
}

Expected<QStringList, SecurityViolation> CommandGuard::sanitize(const QString& executable,
                                                                const QStringList& arguments,
                                                                const SandboxConfig& config) {
    if (executable.isEmpty() || !config.allowedCommands.contains(executable)) {
        SecurityViolation violation;
        violation.code = SandboxError::PermissionDenied;
        violation.rejected = executable;
        violation.allowList = config.sortedCommands();
        violation.message = QString("Command not allowed: %1. Allowed commands: %2")
                                .arg(executable.isEmpty() ? QStringLiteral("<empty>") : executable,
                                     violation.allowList.join(", "));
        ATTEST_WARN("{}", violation.message.toStdString());
        return makeUnexpected(violation);
    }

    for (const QString& argument : suspiciousArguments(arguments)) {
        ATTEST_WARN("Potentially dangerous pattern in argument: {}", argument.toStdString());
    }

    return arguments;
}

QStringList CommandGuard::suspiciousArguments(const QStringList& arguments) {
    QStringList suspicious;
    for (const QString& argument : arguments) {
        for (const QString& pattern : shellMetacharacters()) {
            if (argument.contains(pattern)) {
                suspicious.append(argument);
                break;
            }
        }
    }
    return suspicious;
}

} // namespace Attest
