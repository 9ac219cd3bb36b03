#include "ValidationRubric.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <cmath>

namespace Attest {

namespace {

const char* const kBooleanFields[] = {"process_started", "process_completed", "outcome_passed"};
const char* const kStringArrayFields[] = {"evidence", "console_errors", "network_failures"};
const char* const kRequiredFields[] = {
    "process_started", "process_completed", "outcome_passed",
    "evidence", "console_errors", "network_failures", "duration_ms"
};

QString schemaError(const QString& message, const QString& path = QString()) {
    if (path.isEmpty()) {
        return QString("Schema validation error: %1").arg(message);
    }
    return QString("Schema validation error: %1 at %2").arg(message, path);
}

// Renders a JSON value the way it appears in error messages
QString describe(const QJsonValue& value) {
    switch (value.type()) {
        case QJsonValue::Null: return QStringLiteral("null");
        case QJsonValue::Bool: return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
        case QJsonValue::Double: {
            const double number = value.toDouble();
            if (std::floor(number) == number && std::abs(number) < 1e15) {
                return QString::number(static_cast<qint64>(number));
            }
            return QString::number(number);
        }
        case QJsonValue::String: return QString("'%1'").arg(value.toString());
        case QJsonValue::Array:
            return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
        case QJsonValue::Object:
            return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
        case QJsonValue::Undefined: break;
    }
    return QStringLiteral("undefined");
}

bool isInteger(const QJsonValue& value) {
    if (!value.isDouble()) {
        return false;
    }
    const double number = value.toDouble();
    return std::isfinite(number) && std::floor(number) == number;
}

} // namespace

ValidationVerdict ValidationRubric::validate(const QJsonObject& record) const {
    ValidationVerdict verdict;
    verdict.record = record;

    verdict.errors = structuralErrors(record);
    if (!verdict.errors.isEmpty()) {
        verdict.failure = VerdictFailure::StructuralInvalid;
        ATTEST_DEBUG("Record failed structural validation with {} error(s)", verdict.errors.size());
        return verdict;
    }

    verdict.errors = businessErrors(record);
    verdict.warnings = warnings(record);
    verdict.passed = verdict.errors.isEmpty();
    verdict.failure = verdict.passed ? VerdictFailure::None : VerdictFailure::BusinessRuleFailure;
    return verdict;
}

QMap<QString, ValidationVerdict> ValidationRubric::validateBatch(const QList<QJsonObject>& records) const {
    QMap<QString, ValidationVerdict> verdicts;
    for (const QJsonObject& record : records) {
        verdicts.insert(recordKey(record), validate(record));
    }
    return verdicts;
}

QJsonObject ValidationRubric::validateRecord(const QJsonObject& record) {
    const ValidationVerdict verdict = ValidationRubric().validate(record);
    QJsonObject json;
    json["passed"] = verdict.passed;
    json["errors"] = QJsonArray::fromStringList(verdict.errors);
    json["warnings"] = QJsonArray::fromStringList(verdict.warnings);
    json["data"] = verdict.record;
    return json;
}

QString ValidationRubric::recordKey(const QJsonObject& record) {
    for (const char* key : {"test_id", "id"}) {
        const QJsonValue value = record.value(QLatin1String(key));
        if (value.isString()) {
            return value.toString();
        }
        if (value.isDouble()) {
            return describe(value);
        }
    }
    return QStringLiteral("unknown");
}

QStringList ValidationRubric::structuralErrors(const QJsonObject& record) const {
    QStringList errors;

    for (const char* field : kRequiredFields) {
        if (!record.contains(QLatin1String(field))) {
            errors.append(schemaError(QString("'%1' is a required property").arg(QLatin1String(field))));
        }
    }

    for (const char* field : kBooleanFields) {
        const QJsonValue value = record.value(QLatin1String(field));
        if (!value.isUndefined() && !value.isBool()) {
            errors.append(schemaError(QString("%1 is not of type 'boolean'").arg(describe(value)),
                                      QLatin1String(field)));
        }
    }

    for (const char* field : kStringArrayFields) {
        const QJsonValue value = record.value(QLatin1String(field));
        if (value.isUndefined()) {
            continue;
        }
        if (!value.isArray()) {
            errors.append(schemaError(QString("%1 is not of type 'array'").arg(describe(value)),
                                      QLatin1String(field)));
            continue;
        }
        const QJsonArray items = value.toArray();
        if (items.isEmpty() && qstrcmp(field, "evidence") == 0) {
            errors.append(schemaError(QStringLiteral("[] should be non-empty"), QLatin1String(field)));
        }
        for (int i = 0; i < items.size(); ++i) {
            if (!items.at(i).isString()) {
                errors.append(schemaError(QString("%1 is not of type 'string'").arg(describe(items.at(i))),
                                          QString("%1.%2").arg(QLatin1String(field)).arg(i)));
            }
        }
    }

    const QJsonValue duration = record.value(QLatin1String("duration_ms"));
    if (!duration.isUndefined()) {
        if (!isInteger(duration)) {
            errors.append(schemaError(QString("%1 is not of type 'integer'").arg(describe(duration)),
                                      QStringLiteral("duration_ms")));
        } else if (duration.toDouble() < 0) {
            errors.append(schemaError(QString("%1 is less than the minimum of 0").arg(describe(duration)),
                                      QStringLiteral("duration_ms")));
        } else if (duration.toDouble() > kMaxDurationMs) {
            errors.append(schemaError(QString("%1 is greater than the maximum of %2")
                                          .arg(describe(duration)).arg(kMaxDurationMs),
                                      QStringLiteral("duration_ms")));
        }
    }

    return errors;
}

QStringList ValidationRubric::businessErrors(const QJsonObject& record) const {
    QStringList errors;

    if (!record.value("process_started").toBool()) {
        errors.append(QStringLiteral("Process failed to start"));
    }
    if (!record.value("process_completed").toBool()) {
        errors.append(QStringLiteral("Process did not complete"));
    }
    if (!record.value("outcome_passed").toBool()) {
        errors.append(QStringLiteral("Test failed (outcome_passed=false)"));
    }
    if (record.value("evidence").toArray().isEmpty()) {
        errors.append(QStringLiteral("No evidence captured (minimum 1 required)"));
    }

    const qint64 durationMs = static_cast<qint64>(record.value("duration_ms").toDouble());
    if (durationMs > kMaxDurationMs) {
        errors.append(QString("Execution time %1ms exceeds %2ms limit").arg(durationMs).arg(kMaxDurationMs));
    }

    return errors;
}

QStringList ValidationRubric::warnings(const QJsonObject& record) const {
    QStringList result;

    const int consoleErrors = record.value("console_errors").toArray().size();
    if (consoleErrors > 0) {
        result.append(QString("Console errors detected: %1 errors").arg(consoleErrors));
    }

    const int networkFailures = record.value("network_failures").toArray().size();
    if (networkFailures > 0) {
        result.append(QString("Network failures detected: %1 failures").arg(networkFailures));
    }

    return result;
}

} // namespace Attest
