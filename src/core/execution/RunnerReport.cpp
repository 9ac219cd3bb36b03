#include "RunnerReport.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonParseError>

namespace Attest {

namespace {

QStringList decodeLog(const QJsonValue& value) {
    QStringList lines;
    const QJsonArray entries = value.toArray();
    for (const QJsonValue& entry : entries) {
        if (entry.isString()) {
            lines.append(entry.toString());
        } else if (entry.isObject()) {
            lines.append(entry.toObject().value("text").toString());
        }
    }
    return lines;
}

RunnerResult decodeResult(const QJsonObject& json) {
    RunnerResult result;
    result.status = json.value("status").toString();
    result.stdoutLines = decodeLog(json.value("stdout"));
    result.stderrLines = decodeLog(json.value("stderr"));

    const QJsonValue error = json.value("error");
    if (error.isObject()) {
        result.errorMessage = error.toObject().value("message").toString();
    }
    return result;
}

RunnerSuite decodeSuite(const QJsonObject& json) {
    RunnerSuite suite;
    suite.title = json.value("title").toString();

    for (const QJsonValue& specValue : json.value("specs").toArray()) {
        const QJsonObject specJson = specValue.toObject();
        RunnerSpec spec;
        spec.title = specJson.value("title").toString();
        for (const QJsonValue& testValue : specJson.value("tests").toArray()) {
            RunnerTest test;
            for (const QJsonValue& resultValue : testValue.toObject().value("results").toArray()) {
                test.results.push_back(decodeResult(resultValue.toObject()));
            }
            spec.tests.push_back(std::move(test));
        }
        suite.specs.push_back(std::move(spec));
    }

    for (const QJsonValue& child : json.value("suites").toArray()) {
        suite.suites.push_back(decodeSuite(child.toObject()));
    }
    return suite;
}

template<typename Visitor>
void visitSuite(const RunnerSuite& suite, Visitor& visit) {
    for (const RunnerSpec& spec : suite.specs) {
        for (const RunnerTest& test : spec.tests) {
            for (const RunnerResult& result : test.results) {
                visit(result);
            }
        }
    }
    for (const RunnerSuite& child : suite.suites) {
        visitSuite(child, visit);
    }
}

} // namespace

QString toString(ReportError error) {
    switch (error) {
        case ReportError::Empty: return QStringLiteral("Runner produced no output");
        case ReportError::MalformedJson: return QStringLiteral("Runner output is not valid JSON");
        case ReportError::NotAnObject: return QStringLiteral("Runner report is not a JSON object");
    }
    return QStringLiteral("Unknown report error");
}

bool RunnerResult::passed() const {
    return status == QLatin1String("passed") || status == QLatin1String("skipped");
}

template<typename Visitor>
void RunnerReport::forEachResult(Visitor&& visit) const {
    for (const RunnerSuite& suite : suites) {
        visitSuite(suite, visit);
    }
}

bool RunnerReport::allPassed() const {
    bool passed = true;
    forEachResult([&passed](const RunnerResult& result) {
        passed = passed && result.passed();
    });
    return passed;
}

QStringList RunnerReport::consoleErrors() const {
    QStringList errors;
    forEachResult([&errors](const RunnerResult& result) {
        for (const QString& line : result.stderrLines) {
            if (!line.isEmpty() && line.contains(QLatin1String("error"), Qt::CaseInsensitive)) {
                errors.append(line.left(kMaxMessageChars));
            }
        }
    });
    return errors;
}

QStringList RunnerReport::networkFailures() const {
    QStringList failures;
    forEachResult([&failures](const RunnerResult& result) {
        if (!result.errorMessage || result.errorMessage->isEmpty()) {
            return;
        }
        const QString& message = *result.errorMessage;
        if (message.contains(QLatin1String("net::")) ||
            message.contains(QLatin1String("ERR_")) ||
            message.contains(QLatin1String("timeout"), Qt::CaseInsensitive)) {
            failures.append(message.left(kMaxMessageChars));
        }
    });
    return failures;
}

int RunnerReport::resultCount() const {
    int count = 0;
    forEachResult([&count](const RunnerResult&) { ++count; });
    return count;
}

Expected<RunnerReport, ReportError> RunnerReport::decode(const QByteArray& output) {
    const QByteArray trimmed = output.trimmed();
    if (trimmed.isEmpty()) {
        return makeUnexpected(ReportError::Empty);
    }

    QJsonParseError parseError;
    QJsonDocument document = QJsonDocument::fromJson(trimmed, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        // Reporters and npm sometimes print banners around the JSON body
        const int first = trimmed.indexOf('{');
        const int last = trimmed.lastIndexOf('}');
        if (first < 0 || last <= first) {
            ATTEST_DEBUG("Runner output has no JSON object: {}", parseError.errorString().toStdString());
            return makeUnexpected(ReportError::MalformedJson);
        }
        document = QJsonDocument::fromJson(trimmed.mid(first, last - first + 1), &parseError);
        if (parseError.error != QJsonParseError::NoError) {
            ATTEST_DEBUG("Runner report failed to parse: {}", parseError.errorString().toStdString());
            return makeUnexpected(ReportError::MalformedJson);
        }
    }

    if (!document.isObject()) {
        return makeUnexpected(ReportError::NotAnObject);
    }

    RunnerReport report;
    for (const QJsonValue& suite : document.object().value("suites").toArray()) {
        report.suites.push_back(decodeSuite(suite.toObject()));
    }
    return report;
}

} // namespace Attest
