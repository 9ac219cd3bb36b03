#include "EnvironmentSanitizer.hpp"
#include "core/common/Logger.hpp"

namespace Attest {

const QStringList& EnvironmentSanitizer::baseVariables() {
    static const QStringList names = {
        QStringLiteral("PATH"), QStringLiteral("HOME"), QStringLiteral("USER"), QStringLiteral("LANG")
    };
    return names;
}

const QStringList& EnvironmentSanitizer::runnerVariables() {
    static const QStringList names = {
        QStringLiteral("BASE_URL"),
        QStringLiteral("PLAYWRIGHT_BROWSERS_PATH"),
        QStringLiteral("PLAYWRIGHT_TIMEOUT"),
        QStringLiteral("PLAYWRIGHT_HEADLESS"),
        QStringLiteral("PLAYWRIGHT_SCREENSHOT"),
        QStringLiteral("PLAYWRIGHT_VIDEO"),
        QStringLiteral("PLAYWRIGHT_TRACE")
    };
    return names;
}

const QStringList& EnvironmentSanitizer::runtimeVariables() {
    static const QStringList names = {
        QStringLiteral("NODE_PATH"), QStringLiteral("NODE_OPTIONS")
    };
    return names;
}

QStringList EnvironmentSanitizer::allowedVariables() {
    return baseVariables() + runnerVariables() + runtimeVariables();
}

QProcessEnvironment EnvironmentSanitizer::build(const QProcessEnvironment& parent) {
    QProcessEnvironment sanitized;
    for (const QString& name : allowedVariables()) {
        if (parent.contains(name)) {
            sanitized.insert(name, parent.value(name));
        }
    }
    ATTEST_DEBUG("Sandboxed environment created with {} of {} variables",
                 sanitized.keys().size(), parent.keys().size());
    return sanitized;
}

} // namespace Attest
