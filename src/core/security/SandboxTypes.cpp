#include "SandboxTypes.hpp"
#include "platform/ResourceLimiter.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QSysInfo>
#include <algorithm>

namespace Attest {

QString toString(SandboxError error) {
    switch (error) {
        case SandboxError::InvalidPath: return QStringLiteral("InvalidPath");
        case SandboxError::PermissionDenied: return QStringLiteral("PermissionDenied");
    }
    return QStringLiteral("Unknown");
}

QStringList SandboxConfig::sortedCommands() const {
    QStringList commands(allowedCommands.begin(), allowedCommands.end());
    std::sort(commands.begin(), commands.end());
    return commands;
}

QString SandboxConfig::resolve(const QString& relativeOrAbsolute) const {
    if (QDir::isAbsolutePath(relativeOrAbsolute)) {
        return QDir::cleanPath(relativeOrAbsolute);
    }
    return QDir::cleanPath(QDir(projectRoot).absoluteFilePath(relativeOrAbsolute));
}

QJsonObject SandboxConfig::toJson() const {
    QJsonObject limits;
    limits["max_cpu_seconds"] = maxCpuSeconds;
    limits["max_memory_bytes"] = maxMemoryBytes;
    limits["max_wall_seconds"] = maxWallSeconds;
    limits["max_file_bytes"] = maxFileBytes;
    limits["max_processes"] = maxProcesses;
    limits["max_output_bytes"] = maxOutputBytes;
    limits["allowed_dirs"] = QJsonArray::fromStringList(allowedDirs);
    limits["allowed_commands"] = QJsonArray::fromStringList(sortedCommands());

    auto limiter = createResourceLimiter();
    QJsonObject capabilities;
    capabilities["resource_limits_supported"] = limiter->isSupported();
    capabilities["resource_limiter"] = limiter->name();
    capabilities["platform"] = QSysInfo::kernelType();
    capabilities["project_root"] = projectRoot;

    QJsonObject json;
    json["config"] = limits;
    json["capabilities"] = capabilities;
    return json;
}

} // namespace Attest
