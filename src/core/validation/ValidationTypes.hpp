#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "core/execution/ExecutionTypes.hpp"

namespace Attest {

enum class VerdictFailure {
    None,
    SecurityViolation,
    StructuralInvalid,
    BusinessRuleFailure
};

QString toString(VerdictFailure failure);

struct ValidationVerdict {
    bool passed = false;
    QStringList errors;
    QStringList warnings;
    QJsonObject record;
    VerdictFailure failure = VerdictFailure::None;

    // All errors joined with "; ", the user-visible failure text
    QString failureSummary() const;
    QJsonObject toJson() const;
};

// Typed form of the record the rubric checks; toJson() is what gets validated
struct EvidenceRecord {
    bool processStarted = false;
    bool processCompleted = false;
    bool outcomePassed = false;
    EvidenceSet evidence;
    QStringList consoleErrors;
    QStringList networkFailures;
    qint64 durationMs = 0;
    QString testId;

    QJsonObject toJson() const;
};

} // namespace Attest
