#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>
#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "core/common/Expected.hpp"

namespace Attest {

struct EnrichmentResult {
    QStringList findings;
    double confidence = 0.0;
    double costUsd = 0.0;
    QJsonObject details;

    QJsonObject toJson() const {
        QJsonObject json;
        json["findings"] = QJsonArray::fromStringList(findings);
        json["confidence"] = confidence;
        json["cost_usd"] = costUsd;
        if (!details.isEmpty()) {
            json["details"] = details;
        }
        return json;
    }
};

// Optional second opinion on captured artifacts, e.g. a vision model.
// Results are advisory; the pipeline never lets them change a verdict.
class EnrichmentProvider {
public:
    virtual ~EnrichmentProvider() = default;

    virtual QString name() const = 0;
    virtual Expected<EnrichmentResult, QString> analyze(const QList<QByteArray>& artifacts,
                                                        const QString& context) = 0;
};

} // namespace Attest
