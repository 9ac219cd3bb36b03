#include "ValidationTypes.hpp"

#include <QtCore/QJsonArray>

namespace Attest {

QString toString(VerdictFailure failure) {
    switch (failure) {
        case VerdictFailure::None: return QStringLiteral("none");
        case VerdictFailure::SecurityViolation: return QStringLiteral("security_violation");
        case VerdictFailure::StructuralInvalid: return QStringLiteral("structural_invalid");
        case VerdictFailure::BusinessRuleFailure: return QStringLiteral("business_rule_failure");
    }
    return QStringLiteral("unknown");
}

QString ValidationVerdict::failureSummary() const {
    return errors.join(QStringLiteral("; "));
}

QJsonObject ValidationVerdict::toJson() const {
    QJsonObject json;
    json["passed"] = passed;
    json["errors"] = QJsonArray::fromStringList(errors);
    json["warnings"] = QJsonArray::fromStringList(warnings);
    json["failure"] = toString(failure);
    json["data"] = record;
    return json;
}

QJsonObject EvidenceRecord::toJson() const {
    QJsonObject json;
    if (!testId.isEmpty()) {
        json["test_id"] = testId;
    }
    json["process_started"] = processStarted;
    json["process_completed"] = processCompleted;
    json["outcome_passed"] = outcomePassed;
    json["evidence"] = QJsonArray::fromStringList(evidence);
    json["console_errors"] = QJsonArray::fromStringList(consoleErrors);
    json["network_failures"] = QJsonArray::fromStringList(networkFailures);
    json["duration_ms"] = durationMs;
    return json;
}

} // namespace Attest
