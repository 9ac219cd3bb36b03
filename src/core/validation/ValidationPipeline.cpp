#include "ValidationPipeline.hpp"
#include "core/common/Logger.hpp"
#include "core/execution/RunnerReport.hpp"
#include "core/security/PathGuard.hpp"

#include <QtConcurrent/QtConcurrent>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QTextStream>
#include <exception>
#include <utility>

namespace Attest {

QJsonObject PipelineResult::toJson() const {
    QJsonObject json;
    json["passed"] = passed();
    json["verdict"] = verdict.toJson();
    json["execution"] = execution.toJson();
    json["evidence"] = QJsonArray::fromStringList(evidence);
    if (enrichment) {
        json["enrichment"] = enrichment->toJson();
    }
    if (!enrichmentAdvisory.isEmpty()) {
        json["enrichment_advisory"] = enrichmentAdvisory;
    }
    json["duration_ms"] = durationMs;
    json["cost_usd"] = costUsd;
    json["security_violation"] = securityViolation;
    return json;
}

ValidationPipeline::ValidationPipeline(const SandboxConfig& config,
                                       PipelineOptions options,
                                       std::shared_ptr<EnrichmentProvider> enrichment,
                                       std::shared_ptr<ProcessRunner> runner)
    : config_(config)
    , options_(options)
    , executor_(config, std::move(runner))
    , collector_(config)
    , enrichment_(std::move(enrichment)) {
}

PipelineResult ValidationPipeline::run(const ExecutionRequest& request) const {
    QElapsedTimer timer;
    timer.start();

    PipelineResult result;
    const QString requestName = request.artifactName();
    const QString artifactsRoot = config_.resolve(config_.artifactsDir);

    // The executor creates artifacts/<name> once its guards have passed
    result.execution = executor_.execute(request);

    if (result.execution.securityViolation) {
        result.securityViolation = true;
        result.verdict.passed = false;
        result.verdict.failure = VerdictFailure::SecurityViolation;
        result.verdict.errors = QStringList{result.execution.violationMessage};
        result.durationMs = timer.elapsed();
        ATTEST_WARN("Validation of {} refused: {}", request.targetPath.toStdString(),
                    result.execution.violationMessage.toStdString());
        return result;
    }

    switch (result.execution.outcome) {
        case ExecutionOutcome::Completed:
            result.evidence = collector_.collect(artifactsRoot, requestName);
            break;
        case ExecutionOutcome::TimedOut:
            result.evidence = result.execution.partialEvidence;
            break;
        case ExecutionOutcome::ExecutionError:
        case ExecutionOutcome::SecurityViolation:
            break;
    }

    EvidenceRecord record = assembleRecord(result.execution, result.evidence);
    record.testId = requestName;
    result.verdict = rubric_.validate(record.toJson());

    if (result.verdict.passed) {
        ATTEST_INFO("Validation passed for {} ({} evidence file(s))",
                    request.targetPath.toStdString(), result.evidence.size());
    } else {
        ATTEST_INFO("Validation failed for {}: {}", request.targetPath.toStdString(),
                    result.verdict.failureSummary().toStdString());
    }

    if (options_.enrichmentEnabled && enrichment_ && !result.evidence.isEmpty() && result.verdict.passed) {
        enrich(request, result);
    }

    result.durationMs = timer.elapsed();
    return result;
}

QFuture<PipelineResult> ValidationPipeline::runAsync(const ExecutionRequest& request) const {
    return QtConcurrent::run([this, request]() {
        return run(request);
    });
}

EvidenceRecord ValidationPipeline::assembleRecord(const ExecutionReport& report, const EvidenceSet& evidence) {
    EvidenceRecord record;
    record.processStarted = report.processStarted;
    record.durationMs = report.durationMs;

    switch (report.outcome) {
        case ExecutionOutcome::Completed: {
            record.processCompleted = true;
            record.evidence = evidence;
            auto decoded = RunnerReport::decode(report.stdoutText.toUtf8());
            if (decoded) {
                const RunnerReport& runnerReport = decoded.value();
                record.outcomePassed = runnerReport.allPassed();
                record.consoleErrors = runnerReport.consoleErrors();
                record.networkFailures = runnerReport.networkFailures();
            } else {
                ATTEST_DEBUG("{}; using exit code {}", toString(decoded.error()).toStdString(), report.exitCode);
                record.outcomePassed = report.exitCode == 0;
            }
            break;
        }
        case ExecutionOutcome::TimedOut:
            record.processCompleted = false;
            record.outcomePassed = false;
            record.evidence = evidence;
            record.consoleErrors = QStringList{QStringLiteral("Test execution timed out")};
            break;
        case ExecutionOutcome::ExecutionError:
            record.consoleErrors = QStringList{QString("Browser error: %1").arg(report.errorMessage)};
            break;
        case ExecutionOutcome::SecurityViolation:
            record.consoleErrors = QStringList{report.violationMessage};
            break;
    }

    return record;
}

void ValidationPipeline::enrich(const ExecutionRequest& request, PipelineResult& result) const {
    QList<QByteArray> artifacts;
    for (const QString& path : result.evidence) {
        if (artifacts.size() >= options_.maxEnrichmentArtifacts) {
            break;
        }
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            ATTEST_WARN("Skipping unreadable artifact {}: {}", path.toStdString(), file.errorString().toStdString());
            continue;
        }
        artifacts.append(file.readAll());
    }

    if (artifacts.isEmpty()) {
        result.enrichmentAdvisory = QStringLiteral("Enrichment skipped: no readable artifacts");
        return;
    }

    try {
        auto analysis = enrichment_->analyze(artifacts, readContext(request.targetPath));
        if (analysis) {
            result.costUsd += analysis.value().costUsd;
            result.enrichment = analysis.value();
            ATTEST_INFO("Enrichment by {} finished (confidence {:.2f}, cost ${:.4f})",
                        enrichment_->name().toStdString(), analysis.value().confidence,
                        analysis.value().costUsd);
        } else {
            result.enrichmentAdvisory = QString("Enrichment unavailable: %1").arg(analysis.error());
            ATTEST_WARN("{}", result.enrichmentAdvisory.toStdString());
        }
    } catch (const std::exception& ex) {
        result.enrichmentAdvisory = QString("Enrichment failed: %1").arg(QString::fromUtf8(ex.what()));
        ATTEST_WARN("{}", result.enrichmentAdvisory.toStdString());
    } catch (...) {
        result.enrichmentAdvisory = QStringLiteral("Enrichment failed: unknown exception");
        ATTEST_WARN("{} from provider {}", result.enrichmentAdvisory.toStdString(),
                    enrichment_->name().toStdString());
    }
}

QString ValidationPipeline::readContext(const QString& targetPath) const {
    QFile file(PathGuard::canonicalize(targetPath, config_.projectRoot));
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return QString();
    }
    QTextStream stream(&file);
    return stream.read(options_.maxContextChars);
}

} // namespace Attest
