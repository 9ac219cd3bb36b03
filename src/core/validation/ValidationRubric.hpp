#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QJsonValue>
#include <QtCore/QList>
#include <QtCore/QMap>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "ValidationTypes.hpp"

namespace Attest {

/**
 * @brief Pass/fail judgement over an evidence record
 *
 * Two layers, run in order:
 *  - structural: required keys, JSON types, at least one evidence entry and
 *    duration_ms in [0, kMaxDurationMs]. Every structural problem is
 *    reported and business rules are then skipped.
 *  - business: the process started and completed, the outcome passed,
 *    evidence exists and the run fit in the time limit. Each unmet rule
 *    adds its own error.
 * Console errors and network failures only ever produce warnings.
 *
 * validate() is a pure function of its input.
 */
class ValidationRubric {
public:
    static constexpr qint64 kMaxDurationMs = 45000;

    ValidationVerdict validate(const QJsonObject& record) const;

    // Keyed by test_id, then id, then "unknown"; later duplicates replace earlier ones
    QMap<QString, ValidationVerdict> validateBatch(const QList<QJsonObject>& records) const;

    // {passed, errors, warnings, data} for a single record
    static QJsonObject validateRecord(const QJsonObject& record);

    static QString recordKey(const QJsonObject& record);

private:
    QStringList structuralErrors(const QJsonObject& record) const;
    QStringList businessErrors(const QJsonObject& record) const;
    QStringList warnings(const QJsonObject& record) const;
};

} // namespace Attest
