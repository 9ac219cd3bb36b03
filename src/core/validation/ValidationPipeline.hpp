#pragma once

#include <QtCore/QFuture>
#include <QtCore/QJsonObject>
#include <memory>
#include <optional>

#include "EnrichmentProvider.hpp"
#include "ValidationRubric.hpp"
#include "ValidationTypes.hpp"
#include "core/evidence/EvidenceCollector.hpp"
#include "core/execution/ExecutionTypes.hpp"
#include "core/execution/SandboxedExecutor.hpp"
#include "core/security/SandboxTypes.hpp"

namespace Attest {

struct PipelineOptions {
    bool enrichmentEnabled = false;
    int maxEnrichmentArtifacts = 3;
    int maxContextChars = 2000;
};

struct PipelineResult {
    ValidationVerdict verdict;
    ExecutionReport execution;
    EvidenceSet evidence;
    std::optional<EnrichmentResult> enrichment;
    QString enrichmentAdvisory;
    qint64 durationMs = 0;
    double costUsd = 0.0;
    bool securityViolation = false;

    bool passed() const { return verdict.passed; }
    QJsonObject toJson() const;
};

/**
 * @brief Execute, collect, judge and optionally enrich one test target
 *
 * The verdict comes from the rubric alone. Enrichment is consulted only when
 * it is enabled, a provider is set, evidence exists and the rubric passed;
 * whatever it returns or throws ends up in the result as advice and never
 * flips the verdict. run() does not throw.
 */
class ValidationPipeline {
public:
    explicit ValidationPipeline(const SandboxConfig& config,
                                PipelineOptions options = PipelineOptions(),
                                std::shared_ptr<EnrichmentProvider> enrichment = nullptr,
                                std::shared_ptr<ProcessRunner> runner = nullptr);

    PipelineResult run(const ExecutionRequest& request) const;

    // Runs on the global thread pool; the pipeline must outlive the future
    QFuture<PipelineResult> runAsync(const ExecutionRequest& request) const;

    // Maps an execution report and its evidence onto the rubric's record
    static EvidenceRecord assembleRecord(const ExecutionReport& report, const EvidenceSet& evidence);

    const SandboxConfig& config() const { return config_; }

private:
    void enrich(const ExecutionRequest& request, PipelineResult& result) const;
    QString readContext(const QString& targetPath) const;

    SandboxConfig config_;
    PipelineOptions options_;
    SandboxedExecutor executor_;
    EvidenceCollector collector_;
    ValidationRubric rubric_;
    std::shared_ptr<EnrichmentProvider> enrichment_;
};

} // namespace Attest
