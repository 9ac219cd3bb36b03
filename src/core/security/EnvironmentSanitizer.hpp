#pragma once

#include <QtCore/QProcessEnvironment>
#include <QtCore/QStringList>

namespace Attest {

// Child environments are built from an allow-list, never by stripping names
// from the parent, so API keys and tokens are absent whatever they are called.
class EnvironmentSanitizer {
public:
    static QProcessEnvironment build(
        const QProcessEnvironment& parent = QProcessEnvironment::systemEnvironment());

    static const QStringList& baseVariables();
    static const QStringList& runnerVariables();
    static const QStringList& runtimeVariables();
    static QStringList allowedVariables();
};

} // namespace Attest
