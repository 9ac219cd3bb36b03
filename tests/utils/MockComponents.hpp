#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QList>
#include <QtCore/QMutex>
#include <QtCore/QString>
#include <atomic>
#include <functional>
#include <utility>

#include "../../src/core/common/Expected.hpp"
#include "../../src/core/execution/ProcessRunner.hpp"
#include "../../src/core/validation/EnrichmentProvider.hpp"

namespace Attest {
namespace Test {

/**
 * @brief Runner that never spawns; returns a scripted outcome
 *
 * Counts calls and remembers the last ProcessSpec so tests can check what
 * the executor would have launched. An optional hook runs before returning,
 * which lets a test write artifacts "during" the fake run.
 */
class ScriptedProcessRunner : public ProcessRunner {
public:
    ProcessOutcome run(const ProcessSpec& spec) override;

    void setOutcome(const ProcessOutcome& outcome) { outcome_ = outcome; }
    void setDuringRun(std::function<void()> hook) { duringRun_ = std::move(hook); }

    // Convenience outcomes
    static ProcessOutcome completed(int exitCode, const QByteArray& stdoutData = QByteArray(),
                                    const QByteArray& stderrData = QByteArray());
    static ProcessOutcome timedOut();
    static ProcessOutcome failedToStart(const QString& message);

    int spawnCount() const { return spawnCount_.load(); }
    ProcessSpec lastSpec() const;

private:
    ProcessOutcome outcome_ = completed(0);
    std::function<void()> duringRun_;
    std::atomic<int> spawnCount_{0};
    mutable QMutex mutex_;
    ProcessSpec lastSpec_;
};

/**
 * @brief Wraps the real runner and counts spawns
 */
class CountingProcessRunner : public ProcessRunner {
public:
    ProcessOutcome run(const ProcessSpec& spec) override;
    int spawnCount() const { return spawnCount_.load(); }

private:
    QtProcessRunner delegate_;
    std::atomic<int> spawnCount_{0};
};

/**
 * @brief Enrichment provider with canned results
 */
class FakeEnrichmentProvider : public EnrichmentProvider {
public:
    QString name() const override { return QStringLiteral("fake"); }
    Expected<EnrichmentResult, QString> analyze(const QList<QByteArray>& artifacts,
                                                const QString& context) override;

    void setFailure(const QString& message) { failure_ = message; }
    void setResult(const EnrichmentResult& result) { result_ = result; }

    int callCount() const { return callCount_.load(); }
    int lastArtifactCount() const { return lastArtifactCount_.load(); }
    QString lastContext() const;

private:
    EnrichmentResult result_;
    QString failure_;
    std::atomic<int> callCount_{0};
    std::atomic<int> lastArtifactCount_{0};
    mutable QMutex mutex_;
    QString lastContext_;
};

// Throws std::runtime_error, or a plain int when standardException is false
class ThrowingEnrichmentProvider : public EnrichmentProvider {
public:
    explicit ThrowingEnrichmentProvider(bool standardException = true)
        : standardException_(standardException) {}

    QString name() const override { return QStringLiteral("throwing"); }
    Expected<EnrichmentResult, QString> analyze(const QList<QByteArray>& artifacts,
                                                const QString& context) override;

private:
    bool standardException_;
};

} // namespace Test
} // namespace Attest
